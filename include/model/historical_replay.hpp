#pragma once

#include "market/market_update.hpp"
#include "model/transition_model.hpp"

#include <vector>

namespace mpmm {

// Mid-price at a fixed horizon ahead of a timestamp. Built from recorded history only,
// so it exists for model training and offline diagnostics, never for live quoting.
class FutureMidOracle {
public:
    FutureMidOracle(std::vector<Timestamp> times, std::vector<double> mids, Timestamp lookahead);

    // Mid at the first recorded time >= ts + lookahead, the last mid if the history ends first.
    double future_mid(Timestamp ts) const;

    Timestamp lookahead() const { return lookahead_; }

private:
    std::vector<Timestamp> times_;
    std::vector<double>    mids_;
    Timestamp              lookahead_;
};

// Replay of a bounded historical window of market data for model estimation.
class HistoricalReplay {
public:
    explicit HistoricalReplay(const std::vector<MarketUpdate>& history);

    // One observation per market update once both sides of the book are known.
    const std::vector<StateObservation>& observations() const { return observations_; }

    FutureMidOracle future_mid_oracle(Timestamp lookahead) const;

private:
    std::vector<StateObservation> observations_;
};

} // namespace mpmm
