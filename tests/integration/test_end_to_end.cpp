#include <gtest/gtest.h>
#include "backtest/backtest_runner.hpp"
#include "common/errors.hpp"
#include "config/config_loader.hpp"
#include "strategy/market_maker_controller.hpp"

#include <deque>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace mpmm;

namespace {

// Hands out pre-built ticks and records order entry calls.
class ScriptedSimulator : public ISimulator {
public:
    struct CancelCall {
        Timestamp ts = 0;
        OrderId   order_id = 0;
    };

    void push(Tick tick) { ticks_.push_back(std::move(tick)); }

    std::optional<Tick> tick() override {
        if (ticks_.empty()) return std::nullopt;
        Tick t = std::move(ticks_.front());
        ticks_.pop_front();
        return t;
    }

    Order place_order(Timestamp ts, double size, Side side, double price) override {
        Order order{.order_id = next_id_++, .side = side, .price = price, .size = size, .place_ts = ts};
        placed.push_back(order);
        return order;
    }

    void cancel_order(Timestamp ts, OrderId order_id) override {
        cancels.push_back(CancelCall{.ts = ts, .order_id = order_id});
    }

    std::vector<Order>      placed;
    std::vector<CancelCall> cancels;

private:
    std::deque<Tick> ticks_;
    OrderId          next_id_ = 1;
};

MarketUpdate book(Timestamp ts, double bid, double ask, std::optional<double> trade_size = std::nullopt) {
    MarketUpdate md;
    md.receive_ts = ts;
    md.exchange_ts = ts;
    md.book = BookTop{.bid_price = bid, .bid_size = 1.0, .ask_price = ask, .ask_size = 1.0};
    if (trade_size) {
        md.trade = AnonTrade{.receive_ts = ts, .side = Side::Bid, .price = ask, .size = *trade_size};
    }
    return md;
}

Tick tick_of(MarketUpdate md) {
    Tick t{.receive_ts = md.receive_ts};
    t.updates.emplace_back(std::move(md));
    return t;
}

} // namespace

class ControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        params.delay = 1000;
        params.volatility_record_cooldown = 0;
        params.order_intensity_min_samples = 1;
        params.avg_time_oi = 1000.0;
        params.time_oi = 1'000'000;
        params.order_size = 1.0;

        adjustment.by_state.assign(discretizer.state_count(), 0.0);
    }

    QuoteEngine engine() const { return QuoteEngine(params.risk_coefficient, discretizer, adjustment); }

    StrategyParams    params;
    StateDiscretizer  discretizer;
    PriceAdjustment   adjustment;
    ScriptedSimulator sim;
};

TEST_F(ControllerTest, FirstTickIsColdStart) {
    MarketMakerController controller(params, engine(), sim);
    controller.process_tick(tick_of(book(0, 100.0, 102.0)));

    EXPECT_TRUE(sim.placed.empty());
    EXPECT_DOUBLE_EQ(controller.state().mid_price, 101.0);
    EXPECT_FALSE(controller.state().volatility.has_value());
    EXPECT_FALSE(controller.state().order_intensity.has_value());
}

TEST_F(ControllerTest, ConstantBookWithoutTradesStaysIdle) {
    for (Timestamp ts = 0; ts < 5000 * 100; ts += 100) {
        sim.push(tick_of(book(ts, 100.0, 102.0)));
    }

    MarketMakerController controller(params, engine(), sim);
    RunResult result = controller.run();

    EXPECT_EQ(result.market_data.size(), 5000u);
    EXPECT_TRUE(result.orders.empty());
    EXPECT_TRUE(sim.placed.empty());
    EXPECT_TRUE(result.log.quotes().empty());

    // volatility warmed up on the flat book; intensity never sees a trade
    const auto& s = controller.state();
    ASSERT_TRUE(s.volatility.has_value());
    EXPECT_EQ(*s.volatility, 0.0);
    EXPECT_FALSE(s.order_intensity.has_value());
    EXPECT_DOUBLE_EQ(s.mid_price, 101.0);
    EXPECT_DOUBLE_EQ(s.pnl, 0.0);
}

TEST_F(ControllerTest, OwnTradeUpdatesPositionsAndPnl) {
    MarketMakerController controller(params, engine(), sim);
    controller.process_tick(tick_of(book(0, 100.0, 102.0)));

    Tick fill{.receive_ts = 10};
    fill.updates.emplace_back(OwnTrade{.exchange_ts = 10, .receive_ts = 10, .order_id = 7,
                                       .side = Side::Ask, .price = 102.0, .size = 1.0});
    controller.process_tick(fill);

    const auto& s = controller.state();
    EXPECT_DOUBLE_EQ(s.asset_position, -1.0);
    EXPECT_DOUBLE_EQ(s.usd_position, 102.0);
    EXPECT_DOUBLE_EQ(s.total_liq, 102.0);
    EXPECT_DOUBLE_EQ(s.pnl, 1.0);

    const auto& trades = controller.event_log().own_trades();
    ASSERT_EQ(trades.size(), 1u);
    EXPECT_NEAR(trades[0].pnl_with_liq, 1.0 + 102.0 * 0.00004, 1e-12);
}

TEST_F(ControllerTest, QuotesOnceEstimatorsWarmUpAndCancelsAfterDelay) {
    MarketMakerController controller(params, engine(), sim);

    controller.process_tick(tick_of(book(0, 100.0, 102.0, 1.0)));
    controller.process_tick(tick_of(book(500, 100.0, 102.0, 1.0)));
    EXPECT_TRUE(sim.placed.empty());

    controller.process_tick(tick_of(book(1000, 100.0, 104.0, 1.0)));
    ASSERT_EQ(sim.placed.size(), 2u);
    EXPECT_EQ(sim.placed[0].side, Side::Bid);
    EXPECT_EQ(sim.placed[1].side, Side::Ask);
    EXPECT_EQ(sim.placed[0].place_ts, 1000);
    EXPECT_LT(sim.placed[0].price, sim.placed[1].price);
    EXPECT_DOUBLE_EQ(sim.placed[0].size, 1.0);
    EXPECT_EQ(controller.ongoing_orders().size(), 2u);
    EXPECT_EQ(controller.placed_orders().size(), 2u);

    // {102, 102, 104} best asks, 3 traded over a 1000 ns window
    ASSERT_TRUE(controller.state().volatility.has_value());
    EXPECT_NEAR(*controller.state().volatility, 8.0 / 9.0, 1e-12);
    EXPECT_NEAR(*controller.state().order_intensity, 3.0, 1e-12);

    const auto& quotes = controller.event_log().quotes();
    ASSERT_EQ(quotes.size(), 1u);
    EXPECT_DOUBLE_EQ(quotes[0].mid_price, 102.0);
    EXPECT_DOUBLE_EQ(quotes[0].book_spread, 4.0);
    EXPECT_DOUBLE_EQ(quotes[0].indifference_price, 102.0);
    EXPECT_DOUBLE_EQ(quotes[0].bid_diff, sim.placed[0].price - 100.0);

    controller.process_tick(tick_of(book(1999, 100.0, 104.0)));
    EXPECT_TRUE(sim.cancels.empty());
    EXPECT_EQ(sim.placed.size(), 2u);

    controller.process_tick(tick_of(book(2000, 100.0, 104.0)));
    ASSERT_EQ(sim.cancels.size(), 2u);
    EXPECT_EQ(sim.cancels[0].ts, 2000);
    EXPECT_EQ(sim.cancels[0].order_id, 1u);
    EXPECT_EQ(sim.cancels[1].order_id, 2u);
    // the refreshed quote at 2000 stays live
    EXPECT_EQ(sim.placed.size(), 4u);
    EXPECT_EQ(controller.ongoing_orders().size(), 2u);
    EXPECT_EQ(controller.ongoing_orders().count(3), 1u);
}

TEST_F(ControllerTest, FilledOrderLeavesOngoingSet) {
    MarketMakerController controller(params, engine(), sim);
    controller.process_tick(tick_of(book(0, 100.0, 102.0, 1.0)));
    controller.process_tick(tick_of(book(1000, 100.0, 104.0, 1.0)));
    ASSERT_EQ(controller.ongoing_orders().size(), 2u);

    Tick fill{.receive_ts = 1100};
    fill.updates.emplace_back(book(1100, 100.0, 104.0));
    fill.updates.emplace_back(OwnTrade{.exchange_ts = 1100, .receive_ts = 1100, .order_id = 1,
                                       .side = Side::Bid, .price = sim.placed[0].price, .size = 1.0});
    controller.process_tick(fill);

    EXPECT_EQ(controller.ongoing_orders().size(), 1u);
    EXPECT_EQ(controller.ongoing_orders().count(2), 1u);
    EXPECT_DOUBLE_EQ(controller.state().asset_position, 1.0);
}

TEST_F(ControllerTest, RunCollectsEverything) {
    sim.push(tick_of(book(0, 100.0, 102.0, 1.0)));
    sim.push(tick_of(book(1000, 100.0, 104.0, 1.0)));
    Tick fill{.receive_ts = 1100};
    fill.updates.emplace_back(book(1100, 100.0, 104.0));
    fill.updates.emplace_back(OwnTrade{.exchange_ts = 1100, .receive_ts = 1100, .order_id = 2,
                                       .side = Side::Ask, .price = 104.5, .size = 1.0});
    sim.push(fill);

    MarketMakerController controller(params, engine(), sim);
    RunResult result = controller.run();

    EXPECT_EQ(result.market_data.size(), 3u);
    EXPECT_EQ(result.own_trades.size(), 1u);
    EXPECT_EQ(result.updates.size(), 4u);
    EXPECT_EQ(result.orders.size(), 2u);
    EXPECT_EQ(result.log.quotes().size(), 1u);
    EXPECT_EQ(result.log.own_trades().size(), 1u);
}

TEST_F(ControllerTest, InvalidParamsRejected) {
    params.order_intensity_capacity = params.order_intensity_min_samples;
    EXPECT_THROW((MarketMakerController{params, engine(), sim}), ConfigError);
}

// --- Full backtest over synthetic data ---

class BacktestTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.synthetic.num_updates = 6000;
        config.synthetic.step = 100'000'000;
        config.training_window = 300'000'000'000;
    }

    BacktestConfig config;
};

TEST_F(BacktestTest, SyntheticRunQuotesAndReports) {
    BacktestRunner runner(config);
    runner.run();

    const auto& training = runner.training();
    EXPECT_GT(training.observations, 2000u);
    EXPECT_EQ(training.adjustment.by_state.size(), training.model.discretizer.state_count());
    EXPECT_GE(training.in_sample_mae, 0.0);

    const auto& result = runner.result();
    EXPECT_GT(result.market_data.size(), 2000u);
    EXPECT_GT(result.log.quotes().size(), 0u);
    EXPECT_EQ(result.orders.size(), 2 * result.log.quotes().size());
    for (const auto& q : result.log.quotes()) {
        EXPECT_LT(q.bid_place, q.ask_place);
        EXPECT_GT(q.my_spread, 0.0);
    }

    auto path = std::filesystem::temp_directory_path() / "mpmm_e2e_report.md";
    runner.write_report(path.string());
    std::ifstream f(path);
    std::stringstream ss;
    ss << f.rdbuf();
    EXPECT_NE(ss.str().find("# Micro-price Market Making Report"), std::string::npos);
    EXPECT_NE(ss.str().find("## Simulator"), std::string::npos);
    EXPECT_NE(ss.str().find("## Model"), std::string::npos);
    std::filesystem::remove(path);
}

TEST(SampleConfigTest, DemoRunTrades) {
    BacktestConfig config = load_config(MPMM_SAMPLE_CONFIG);
    BacktestRunner runner(config);
    runner.run();

    auto summary = runner.result().log.summarize();
    EXPECT_GT(summary.quotes, 0u);
    EXPECT_GT(summary.own_trades, 0u);
    EXPECT_GT(summary.total_liq, 0.0);
    for (const auto& q : runner.result().log.quotes()) {
        // quotes stay near the book
        EXPECT_LT(q.my_spread, 2.0);
    }
}

TEST_F(BacktestTest, TrainingWindowCoveringAllDataIsFatal) {
    config.synthetic.num_updates = 100;
    BacktestRunner runner(config);
    EXPECT_THROW(runner.run(), DataError);
    EXPECT_THROW(runner.training(), std::logic_error);
}

TEST_F(BacktestTest, TooShortHistoryIsFatal) {
    BacktestRunner runner(config);
    std::vector<MarketUpdate> history{book(0, 100.0, 101.0)};
    std::vector<MarketUpdate> live{book(10, 100.0, 101.0), book(20, 100.0, 101.0)};
    EXPECT_THROW(runner.run(history, live), ModelEstimationError);
}
