#pragma once

#include "backtest/event_log.hpp"
#include "execution/simulator.hpp"
#include "strategy/quote_engine.hpp"
#include "strategy/rolling_estimators.hpp"
#include "strategy/strategy_params.hpp"

#include <map>
#include <optional>
#include <vector>

namespace mpmm {

struct StrategyState {
    double                asset_position  = 0.0;
    double                usd_position    = 0.0;
    double                pnl             = 0.0;
    double                total_liq       = 0.0;
    double                mid_price       = 0.0;
    std::optional<double> volatility;
    std::optional<double> order_intensity;
};

// Everything a run received and sent, for offline analysis.
struct RunResult {
    std::vector<OwnTrade>     own_trades;
    std::vector<MarketUpdate> market_data;
    std::vector<Update>       updates;
    std::vector<Order>        orders;
    EventLog                  log;
};

// Online quoting loop. Each simulator tick is handled in three steps:
//   1. apply every update in order (book, positions, rolling estimators)
//   2. once `delay` has passed since the last quote, refresh the estimators and,
//      when both are available, place a bid and an ask around the indifference price
//   3. cancel every resting order that is at least `delay` old
class MarketMakerController {
public:
    MarketMakerController(const StrategyParams& params, QuoteEngine quote_engine, ISimulator& sim);

    // Pulls ticks until the simulator runs out of data.
    RunResult run();

    void process_tick(const Tick& tick);

    void on_market_data(const MarketUpdate& md);
    void on_own_trade(const OwnTrade& trade);

    const StrategyState&           state() const { return state_; }
    const BestPositions&           best() const { return best_; }
    const std::map<OrderId, Order>& ongoing_orders() const { return ongoing_orders_; }
    const std::vector<Order>&      placed_orders() const { return placed_orders_; }
    const EventLog&                event_log() const { return log_; }

private:
    void try_quote(Timestamp ts);
    void cancel_stale_orders(Timestamp ts);

    StrategyParams           params_;
    QuoteEngine              qe_;
    ISimulator&              sim_;
    VolatilityEstimator      volatility_;
    OrderIntensityEstimator  intensity_;
    BestPositions            best_;
    StrategyState            state_;
    std::optional<Timestamp> last_quote_ts_;
    std::map<OrderId, Order> ongoing_orders_;
    std::vector<Order>       placed_orders_;
    EventLog                 log_;
};

} // namespace mpmm
