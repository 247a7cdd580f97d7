#include "market/market_update.hpp"

#include <cmath>

namespace mpmm {

const char* to_string(Side side) {
    return side == Side::Bid ? "BID" : "ASK";
}

void BestPositions::apply(const MarketUpdate& update) {
    if (!update.book) return;
    best_bid = update.book->bid_price;
    best_ask = update.book->ask_price;
    bid_size = update.book->bid_size;
    ask_size = update.book->ask_size;
}

bool BestPositions::valid() const {
    return std::isfinite(best_bid) && std::isfinite(best_ask) && (bid_size + ask_size) > 0.0;
}

} // namespace mpmm
