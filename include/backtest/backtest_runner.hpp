#pragma once

#include "execution/replay_simulator.hpp"
#include "market/market_data_loader.hpp"
#include "model/price_adjustment_solver.hpp"
#include "model/transition_model.hpp"
#include "strategy/market_maker_controller.hpp"
#include "strategy/strategy_params.hpp"

#include <optional>
#include <string>
#include <vector>

namespace mpmm {

struct BacktestConfig {
    StrategyParams           strategy;
    DiscretizerConfig        discretizer;
    SolverOptions            solver;
    SimulatorConfig          simulator;
    std::string              data_dir;                              // empty = synthetic data
    Timestamp                training_window = 1'200'000'000'000;   // 20 minutes of history (ns)
    std::optional<Timestamp> run_time;                              // cap on loaded data (ns)
    SyntheticDataParams      synthetic;
    std::string              csv_prefix = "mpmm";
};

struct TrainingResult {
    TransitionModel model;
    PriceAdjustment adjustment;
    size_t          observations = 0;
    double          in_sample_mae = 0.0;   // |predicted adjustment - realized mid move at lookahead|
};

class BacktestRunner {
public:
    explicit BacktestRunner(const BacktestConfig& config);

    // Loads the configured data (files or synthetic), trains on the leading
    // `training_window` and quotes over the rest.
    void run();

    // Trains on `history`, then quotes over `live` against a replay simulator.
    void run(const std::vector<MarketUpdate>& history, const std::vector<MarketUpdate>& live);

    // Throws ModelEstimationError or NumericalInstabilityError; nothing is quoted then.
    TrainingResult train(const std::vector<MarketUpdate>& history) const;

    const RunResult&      result() const { return result_; }
    const TrainingResult& training() const;

    void write_report(const std::string& report_path) const;
    void write_csv(const std::string& prefix) const;

private:
    std::vector<MarketUpdate> load_data() const;

    BacktestConfig                config_;
    std::optional<TrainingResult> training_;
    RunResult                     result_;
    uint64_t                      sim_orders_  = 0;
    uint64_t                      sim_cancels_ = 0;
    uint64_t                      sim_fills_   = 0;
};

} // namespace mpmm
