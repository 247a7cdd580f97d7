#include "backtest/backtest_runner.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "model/historical_replay.hpp"

#include <cmath>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace mpmm {

BacktestRunner::BacktestRunner(const BacktestConfig& config)
    : config_(config) {
    validate(config_.strategy);
}

std::vector<MarketUpdate> BacktestRunner::load_data() const {
    if (config_.data_dir.empty()) {
        logger()->info("generating {} synthetic market updates (seed {})",
                       config_.synthetic.num_updates, config_.synthetic.seed);
        return generate_synthetic_market_data(config_.synthetic);
    }
    return load_market_data(config_.data_dir, config_.run_time);
}

void BacktestRunner::run() {
    auto data = load_data();
    auto [history, live] = split_by_time(data, config_.training_window);
    if (live.empty()) {
        throw DataError("no market data left after the training window");
    }
    run(history, live);
}

TrainingResult BacktestRunner::train(const std::vector<MarketUpdate>& history) const {
    HistoricalReplay replay(history);
    const auto& observations = replay.observations();
    if (observations.size() < 2) {
        throw ModelEstimationError("historical replay produced " +
                                   std::to_string(observations.size()) + " observations");
    }

    StateDiscretizer discretizer(config_.discretizer);
    TransitionModelEstimator estimator(discretizer);
    estimator.add_all(observations);

    TrainingResult training{
        .model        = estimator.build(),
        .observations = observations.size(),
    };

    PriceAdjustmentSolver solver(config_.solver);
    training.adjustment = solver.solve(training.model);

    // In-sample check of the adjustment against the realized mid move
    FutureMidOracle oracle = replay.future_mid_oracle(config_.strategy.future_lookahead);
    double abs_err = 0.0;
    for (const auto& obs : observations) {
        size_t state = discretizer.joint_index(obs.imbalance, obs.half_spread);
        double realized = oracle.future_mid(obs.ts) - obs.mid_price;
        abs_err += std::abs(training.adjustment.by_state[state] - realized);
    }
    training.in_sample_mae = abs_err / static_cast<double>(observations.size());

    logger()->info("price adjustment solved with {} terms, in-sample MAE {:.6f} at {} ns lookahead",
                   training.adjustment.terms_used, training.in_sample_mae, oracle.lookahead());
    return training;
}

void BacktestRunner::run(const std::vector<MarketUpdate>& history,
                         const std::vector<MarketUpdate>& live) {
    training_ = train(history);

    ReplaySimulator sim(live, config_.simulator);
    QuoteEngine qe(config_.strategy.risk_coefficient, training_->model.discretizer,
                   training_->adjustment);
    MarketMakerController controller(config_.strategy, std::move(qe), sim);

    logger()->info("quoting over {} market updates", live.size());
    result_ = controller.run();

    sim_orders_  = sim.orders_placed();
    sim_cancels_ = sim.cancels_applied();
    sim_fills_   = sim.fills();

    auto summary = result_.log.summarize();
    logger()->info("run finished: {} quotes, {} own trades, pnl {:.6f}",
                   summary.quotes, summary.own_trades, summary.final_pnl);
}

const TrainingResult& BacktestRunner::training() const {
    if (!training_) {
        throw std::logic_error("backtest has not been run");
    }
    return *training_;
}

void BacktestRunner::write_report(const std::string& report_path) const {
    std::ofstream f(report_path);
    if (!f.is_open()) {
        throw DataError("cannot write " + report_path);
    }
    f << result_.log.generate_report();
    f << "\n## Simulator\n\n";
    f << "| Metric | Value |\n";
    f << "|--------|-------|\n";
    f << "| Orders placed | " << sim_orders_ << " |\n";
    f << "| Cancels applied | " << sim_cancels_ << " |\n";
    f << "| Fills | " << sim_fills_ << " |\n";
    if (training_) {
        f << "\n## Model\n\n";
        f << "| Metric | Value |\n";
        f << "|--------|-------|\n";
        f << "| Training observations | " << training_->observations << " |\n";
        f << "| Gap-filled states | " << training_->model.filled_states << " |\n";
        f << "| Neumann terms | " << training_->adjustment.terms_used << " |\n";
        f << "| In-sample MAE | " << training_->in_sample_mae << " |\n";
    }
}

void BacktestRunner::write_csv(const std::string& prefix) const {
    result_.log.write_csv(prefix);
}

} // namespace mpmm
