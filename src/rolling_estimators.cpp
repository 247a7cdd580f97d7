#include "strategy/rolling_estimators.hpp"

namespace mpmm {

// --- VolatilityEstimator ---

VolatilityEstimator::VolatilityEstimator(Timestamp record_cooldown, size_t horizon,
                                         double avg_volatility)
    : record_cooldown_(record_cooldown),
      avg_volatility_(avg_volatility),
      samples_(horizon) {}

bool VolatilityEstimator::record(Timestamp ts, double price) {
    if (!samples_.empty() && ts - samples_.back().ts <= record_cooldown_) {
        return false;
    }
    samples_.push_back(Sample{.ts = ts, .price = price});
    return true;
}

std::optional<double> VolatilityEstimator::update() {
    const size_t n = samples_.size();
    if (n < 2) return estimate_;

    double mean = 0.0;
    for (size_t i = 0; i < n; ++i) mean += samples_[i].price;
    mean /= static_cast<double>(n);

    double sq_sum = 0.0;
    for (size_t i = 0; i < n; ++i) {
        double d = samples_[i].price - mean;
        sq_sum += d * d;
    }
    // population variance = pstdev^2
    double variance = sq_sum / static_cast<double>(n);
    estimate_ = variance / avg_volatility_;
    return estimate_;
}

// --- OrderIntensityEstimator ---

OrderIntensityEstimator::OrderIntensityEstimator(Timestamp window, size_t min_samples,
                                                 double avg_sum, double avg_time, size_t capacity)
    : window_(window),
      min_samples_(min_samples),
      avg_sum_(avg_sum),
      avg_time_(avg_time),
      records_(capacity) {}

void OrderIntensityEstimator::record(Timestamp ts, double size) {
    records_.push_back(Record{.ts = ts, .size = size});
}

std::optional<double> OrderIntensityEstimator::update() {
    last_window_span_.reset();
    if (records_.size() <= min_samples_) return estimate_;

    while (records_.back().ts - records_.front().ts > window_) {
        records_.pop_front();
    }

    Timestamp span = records_.back().ts - records_.front().ts;
    last_window_span_ = span;
    if (span <= 0) return estimate_;

    double total = 0.0;
    for (size_t i = 0; i < records_.size(); ++i) total += records_[i].size;

    double scaled_sum  = total / avg_sum_;
    double scaled_time = static_cast<double>(span) / avg_time_;
    estimate_ = scaled_sum / scaled_time;
    return estimate_;
}

} // namespace mpmm
