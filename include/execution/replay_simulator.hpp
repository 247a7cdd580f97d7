#pragma once

#include "execution/simulator.hpp"

#include <cstdint>
#include <deque>
#include <map>
#include <vector>

namespace mpmm {

struct SimulatorConfig {
    Timestamp execution_latency = 10'000'000;   // order/cancel reaches the book after this (ns)
};

// Replays recorded market data one update per tick and matches resting orders
// against the book and the public trade prints. Orders fill in full at their limit.
class ReplaySimulator : public ISimulator {
public:
    ReplaySimulator(std::vector<MarketUpdate> market_data, SimulatorConfig config = {});

    std::optional<Tick> tick() override;
    Order place_order(Timestamp ts, double size, Side side, double price) override;
    void  cancel_order(Timestamp ts, OrderId order_id) override;

    size_t   active_order_count() const { return active_.size(); }
    uint64_t orders_placed()      const { return orders_placed_; }
    uint64_t cancels_applied()    const { return cancels_applied_; }
    uint64_t fills()              const { return fills_; }

private:
    struct PendingAction {
        Timestamp activate_ts = 0;
        bool      is_cancel   = false;
        Order     order;             // order id only for cancels
    };

    void apply_pending(Timestamp now);
    void check_fills(const MarketUpdate& md, Timestamp now, std::vector<Update>& out);

    std::vector<MarketUpdate>  market_data_;
    size_t                     cursor_ = 0;
    SimulatorConfig            config_;
    std::deque<PendingAction>  pending_;
    std::map<OrderId, Order>   active_;
    OrderId                    next_order_id_ = 1;
    uint64_t                   orders_placed_   = 0;
    uint64_t                   cancels_applied_ = 0;
    uint64_t                   fills_           = 0;
};

} // namespace mpmm
