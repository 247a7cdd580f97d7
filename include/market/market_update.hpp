#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <variant>

namespace mpmm {

using Timestamp = int64_t; // nanoseconds
using OrderId   = uint64_t;

enum class Side { Bid, Ask };

const char* to_string(Side side);

struct BookTop {
    double bid_price = 0.0;
    double bid_size  = 0.0;
    double ask_price = 0.0;
    double ask_size  = 0.0;
};

// Public trade print. side is the aggressor side: Bid = buyer lifted the ask.
struct AnonTrade {
    Timestamp receive_ts = 0;
    Side      side       = Side::Bid;
    double    price      = 0.0;
    double    size       = 0.0;
};

struct MarketUpdate {
    Timestamp                exchange_ts = 0;
    Timestamp                receive_ts  = 0;
    std::optional<BookTop>   book;
    std::optional<AnonTrade> trade;
};

struct OwnTrade {
    Timestamp exchange_ts = 0;
    Timestamp receive_ts  = 0;
    OrderId   order_id    = 0;
    Side      side        = Side::Bid;
    double    price       = 0.0;
    double    size        = 0.0;
};

struct Order {
    OrderId   order_id = 0;
    Side      side     = Side::Bid;
    double    price    = 0.0;
    double    size     = 0.0;
    Timestamp place_ts = 0;
};

using Update = std::variant<MarketUpdate, OwnTrade>;

// Best bid/ask as seen by a consumer of the update stream.
struct BestPositions {
    double best_bid = -std::numeric_limits<double>::infinity();
    double best_ask =  std::numeric_limits<double>::infinity();
    double bid_size = 1.0;
    double ask_size = 1.0;

    // Book-bearing updates overwrite the top of book; trade-only updates do not move it.
    void apply(const MarketUpdate& update);

    bool   valid() const;
    double mid_price() const { return (best_ask + best_bid) / 2.0; }
    double half_spread() const { return (best_ask - best_bid) / 2.0; }
    double imbalance() const { return bid_size / (bid_size + ask_size); }
};

} // namespace mpmm
