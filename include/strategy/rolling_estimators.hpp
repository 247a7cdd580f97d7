#pragma once

#include "common/ring_buffer.hpp"
#include "market/market_update.hpp"

#include <optional>

namespace mpmm {

// Variance of periodically sampled best-ask prices over the last `horizon` samples,
// scaled by a reference volatility.
class VolatilityEstimator {
public:
    VolatilityEstimator(Timestamp record_cooldown, size_t horizon, double avg_volatility);

    // Keeps the sample only if more than `record_cooldown` has passed since the last one.
    bool record(Timestamp ts, double price);

    // Recomputes from the window. Empty until two samples are held.
    std::optional<double> update();

    std::optional<double> estimate() const { return estimate_; }
    size_t sample_count() const { return samples_.size(); }

private:
    struct Sample {
        Timestamp ts    = 0;
        double    price = 0.0;
    };

    Timestamp            record_cooldown_;
    double               avg_volatility_;
    RingBuffer<Sample>   samples_;
    std::optional<double> estimate_;
};

// Traded size per unit time over a sliding time window, normalized by reference
// size and reference window span.
class OrderIntensityEstimator {
public:
    OrderIntensityEstimator(Timestamp window, size_t min_samples,
                            double avg_sum, double avg_time, size_t capacity);

    void record(Timestamp ts, double size);

    // Computes only once more than `min_samples` records are held; until then stays empty.
    std::optional<double> update();

    std::optional<double>    estimate() const { return estimate_; }
    // Window span used by the latest update(), empty if that call did not compute.
    std::optional<Timestamp> last_window_span() const { return last_window_span_; }
    size_t sample_count() const { return records_.size(); }

private:
    struct Record {
        Timestamp ts   = 0;
        double    size = 0.0;
    };

    Timestamp                window_;
    size_t                   min_samples_;
    double                   avg_sum_;
    double                   avg_time_;
    RingBuffer<Record>       records_;
    std::optional<double>    estimate_;
    std::optional<Timestamp> last_window_span_;
};

} // namespace mpmm
