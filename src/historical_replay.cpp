#include "model/historical_replay.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <utility>

namespace mpmm {

FutureMidOracle::FutureMidOracle(std::vector<Timestamp> times, std::vector<double> mids,
                                 Timestamp lookahead)
    : times_(std::move(times)), mids_(std::move(mids)), lookahead_(lookahead) {
    if (times_.empty() || times_.size() != mids_.size()) {
        throw ModelEstimationError("future mid oracle needs a non-empty, aligned history");
    }
}

double FutureMidOracle::future_mid(Timestamp ts) const {
    auto it = std::lower_bound(times_.begin(), times_.end(), ts + lookahead_);
    if (it == times_.end()) return mids_.back();
    return mids_[static_cast<size_t>(it - times_.begin())];
}

HistoricalReplay::HistoricalReplay(const std::vector<MarketUpdate>& history) {
    BestPositions best;
    observations_.reserve(history.size());

    for (const auto& update : history) {
        best.apply(update);
        if (!best.valid()) continue;
        observations_.push_back(StateObservation{
            .ts          = update.receive_ts,
            .imbalance   = best.imbalance(),
            .half_spread = best.half_spread(),
            .mid_price   = best.mid_price(),
        });
    }
}

FutureMidOracle HistoricalReplay::future_mid_oracle(Timestamp lookahead) const {
    std::vector<Timestamp> times;
    std::vector<double> mids;
    times.reserve(observations_.size());
    mids.reserve(observations_.size());
    for (const auto& obs : observations_) {
        times.push_back(obs.ts);
        mids.push_back(obs.mid_price);
    }
    return FutureMidOracle(std::move(times), std::move(mids), lookahead);
}

} // namespace mpmm
