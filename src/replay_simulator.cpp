#include "execution/replay_simulator.hpp"

#include <algorithm>
#include <utility>

namespace mpmm {

ReplaySimulator::ReplaySimulator(std::vector<MarketUpdate> market_data, SimulatorConfig config)
    : market_data_(std::move(market_data)), config_(config) {
    std::stable_sort(market_data_.begin(), market_data_.end(),
                     [](const MarketUpdate& a, const MarketUpdate& b) {
                         return a.receive_ts < b.receive_ts;
                     });
}

std::optional<Tick> ReplaySimulator::tick() {
    if (cursor_ >= market_data_.size()) {
        return std::nullopt;
    }

    const MarketUpdate& md = market_data_[cursor_++];
    Timestamp now = md.receive_ts;

    apply_pending(now);

    Tick batch{.receive_ts = now};
    batch.updates.emplace_back(md);
    check_fills(md, now, batch.updates);
    return batch;
}

Order ReplaySimulator::place_order(Timestamp ts, double size, Side side, double price) {
    Order order{
        .order_id = next_order_id_++,
        .side     = side,
        .price    = price,
        .size     = size,
        .place_ts = ts,
    };
    pending_.push_back(PendingAction{
        .activate_ts = ts + config_.execution_latency,
        .is_cancel   = false,
        .order       = order,
    });
    ++orders_placed_;
    return order;
}

void ReplaySimulator::cancel_order(Timestamp ts, OrderId order_id) {
    pending_.push_back(PendingAction{
        .activate_ts = ts + config_.execution_latency,
        .is_cancel   = true,
        .order       = Order{.order_id = order_id},
    });
}

void ReplaySimulator::apply_pending(Timestamp now) {
    // Actions are queued in request order with a constant latency, so activation times are sorted.
    while (!pending_.empty() && pending_.front().activate_ts <= now) {
        const auto& action = pending_.front();
        if (action.is_cancel) {
            if (active_.erase(action.order.order_id) > 0) {
                ++cancels_applied_;
            }
        } else {
            active_[action.order.order_id] = action.order;
        }
        pending_.pop_front();
    }
}

void ReplaySimulator::check_fills(const MarketUpdate& md, Timestamp now, std::vector<Update>& out) {
    std::vector<OrderId> filled_ids;

    for (const auto& [id, order] : active_) {
        bool fill = false;

        if (order.side == Side::Bid) {
            // Bid fills if the ask comes down to it or a seller prints through it
            if (md.book && md.book->ask_price <= order.price) fill = true;
            if (md.trade && md.trade->side == Side::Ask && md.trade->price <= order.price) fill = true;
        } else {
            if (md.book && md.book->bid_price >= order.price) fill = true;
            if (md.trade && md.trade->side == Side::Bid && md.trade->price >= order.price) fill = true;
        }

        if (fill) {
            out.emplace_back(OwnTrade{
                .exchange_ts = now,
                .receive_ts  = now,
                .order_id    = id,
                .side        = order.side,
                .price       = order.price,
                .size        = order.size,
            });
            filled_ids.push_back(id);
        }
    }

    for (OrderId id : filled_ids) {
        active_.erase(id);
        ++fills_;
    }
}

} // namespace mpmm
