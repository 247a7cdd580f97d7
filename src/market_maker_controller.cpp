#include "strategy/market_maker_controller.hpp"
#include "common/logging.hpp"

#include <type_traits>
#include <utility>

namespace mpmm {

namespace {

const StrategyParams& validated(const StrategyParams& params) {
    validate(params);
    return params;
}

} // anonymous namespace

MarketMakerController::MarketMakerController(const StrategyParams& params,
                                             QuoteEngine quote_engine,
                                             ISimulator& sim)
    : params_(validated(params)),
      qe_(std::move(quote_engine)),
      sim_(sim),
      volatility_(params.volatility_record_cooldown, params.volatility_horizon,
                  params.avg_volatility),
      intensity_(params.time_oi, params.order_intensity_min_samples, params.avg_sum_oi,
                 params.avg_time_oi, params.order_intensity_capacity) {}

RunResult MarketMakerController::run() {
    RunResult result;

    while (auto tick = sim_.tick()) {
        for (const auto& update : tick->updates) {
            if (const auto* md = std::get_if<MarketUpdate>(&update)) {
                result.market_data.push_back(*md);
            } else {
                result.own_trades.push_back(std::get<OwnTrade>(update));
            }
            result.updates.push_back(update);
        }
        process_tick(*tick);
    }

    if (log_.quotes().empty()) {
        logger()->warn("no quotes were placed: rolling estimators never warmed up");
    }

    result.orders = placed_orders_;
    result.log = log_;
    return result;
}

void MarketMakerController::process_tick(const Tick& tick) {
    for (const auto& update : tick.updates) {
        std::visit([this](const auto& u) {
            using T = std::decay_t<decltype(u)>;
            if constexpr (std::is_same_v<T, MarketUpdate>) {
                on_market_data(u);
            } else {
                static_assert(std::is_same_v<T, OwnTrade>, "unhandled update kind");
                on_own_trade(u);
            }
        }, update);
    }

    try_quote(tick.receive_ts);
    cancel_stale_orders(tick.receive_ts);
}

void MarketMakerController::on_market_data(const MarketUpdate& md) {
    best_.apply(md);
    if (best_.valid()) {
        state_.mid_price = best_.mid_price();
        volatility_.record(md.receive_ts, best_.best_ask);
    }

    if (md.trade) {
        intensity_.record(md.trade->receive_ts, md.trade->size);
    }
}

void MarketMakerController::on_own_trade(const OwnTrade& trade) {
    intensity_.record(trade.receive_ts, trade.size);
    ongoing_orders_.erase(trade.order_id);

    if (trade.side == Side::Ask) {
        state_.asset_position -= trade.size;
        state_.usd_position   += trade.size * trade.price;
    } else {
        state_.asset_position += trade.size;
        state_.usd_position   -= trade.size * trade.price;
    }

    state_.total_liq += trade.size * trade.price;
    state_.pnl = state_.asset_position * state_.mid_price + state_.usd_position;

    log_.record_own_trade(OwnTradeRecord{
        .ts             = trade.receive_ts,
        .asset_position = state_.asset_position,
        .usd_position   = state_.usd_position,
        .total_liq      = state_.total_liq,
        .pnl            = state_.pnl,
        .pnl_with_liq   = state_.pnl - state_.total_liq * params_.order_fees,
    });
    logger()->debug("fill id={} {} {}@{:.6f} asset={:.6f} pnl={:.6f}",
                    trade.order_id, to_string(trade.side), trade.size, trade.price,
                    state_.asset_position, state_.pnl);
}

void MarketMakerController::try_quote(Timestamp ts) {
    if (last_quote_ts_ && ts - *last_quote_ts_ < params_.delay) return;
    last_quote_ts_ = ts;

    state_.volatility = volatility_.update();
    state_.order_intensity = intensity_.update();
    if (auto span = intensity_.last_window_span()) {
        log_.record_intensity_window(IntensityWindowRecord{.ts = ts, .window_span = *span});
    }

    // cold start: wait for both estimators
    if (!state_.volatility || !state_.order_intensity || !best_.valid()) return;

    Quote quote = qe_.compute_quote(best_, *state_.volatility, *state_.order_intensity);

    Order bid = sim_.place_order(ts, params_.order_size, Side::Bid, quote.bid_price);
    Order ask = sim_.place_order(ts, params_.order_size, Side::Ask, quote.ask_price);
    ongoing_orders_[bid.order_id] = bid;
    ongoing_orders_[ask.order_id] = ask;
    placed_orders_.push_back(bid);
    placed_orders_.push_back(ask);

    log_.record_quote(QuoteRecord{
        .ts                 = ts,
        .best_bid           = best_.best_bid,
        .best_ask           = best_.best_ask,
        .mid_price          = best_.mid_price(),
        .book_spread        = best_.best_ask - best_.best_bid,
        .bid_place          = quote.bid_price,
        .ask_place          = quote.ask_price,
        .indifference_price = quote.indifference_price,
        .adjustment         = quote.adjustment,
        .my_spread          = quote.spread,
        .ask_diff           = quote.ask_price - best_.best_ask,
        .bid_diff           = quote.bid_price - best_.best_bid,
        .order_intensity    = *state_.order_intensity,
        .volatility         = *state_.volatility,
    });

    logger()->debug("quote ts={} state={} indiff={:.6f} spread={:.6f} bid={:.6f} ask={:.6f}",
                    ts, quote.state, quote.indifference_price, quote.spread,
                    quote.bid_price, quote.ask_price);
}

void MarketMakerController::cancel_stale_orders(Timestamp ts) {
    for (auto it = ongoing_orders_.begin(); it != ongoing_orders_.end();) {
        if (ts >= it->second.place_ts + params_.delay) {
            sim_.cancel_order(ts, it->first);
            it = ongoing_orders_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace mpmm
