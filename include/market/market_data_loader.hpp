#pragma once

#include "market/market_update.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mpmm {

// Reads <dir>/lobs.csv and <dir>/trades.csv and merges them by receive time
// (book rows first on ties). Only updates within `run_time` ns of the first one are kept.
//   lobs.csv:   receive_ts,exchange_ts,bid_price,bid_size,ask_price,ask_size
//   trades.csv: receive_ts,exchange_ts,aggro_side,price,size   (aggro_side: BID or ASK)
// Throws DataError on a missing file or a malformed row.
std::vector<MarketUpdate> load_market_data(const std::string& dir,
                                           std::optional<Timestamp> run_time = std::nullopt);

// Splits chronologically sorted data into [first, first + head_span) and the rest.
std::pair<std::vector<MarketUpdate>, std::vector<MarketUpdate>>
split_by_time(const std::vector<MarketUpdate>& updates, Timestamp head_span);

struct SyntheticDataParams {
    size_t    num_updates       = 20'000;
    double    start_price       = 100.0;
    double    tick_size         = 0.1;
    Timestamp step              = 100'000'000;  // ns between updates
    double    price_move_prob   = 0.1;          // chance the mid moves by a tick
    double    trade_prob        = 0.3;          // chance an update carries a trade print
    double    mean_size         = 1.0;
    int       max_spread_ticks  = 3;
    uint32_t  seed              = 42;
};

// Deterministic random-walk top of book with trade prints.
std::vector<MarketUpdate> generate_synthetic_market_data(const SyntheticDataParams& params);

} // namespace mpmm
