#pragma once

#include "market/market_update.hpp"

#include <optional>
#include <vector>

namespace mpmm {

struct Tick {
    Timestamp           receive_ts = 0;
    std::vector<Update> updates;
};

// The exchange as seen by the strategy: a pull-based update stream plus order entry.
class ISimulator {
public:
    virtual ~ISimulator() = default;

    // Next batch of updates, std::nullopt once the data is exhausted.
    virtual std::optional<Tick> tick() = 0;

    virtual Order place_order(Timestamp ts, double size, Side side, double price) = 0;
    virtual void  cancel_order(Timestamp ts, OrderId order_id) = 0;
};

} // namespace mpmm
