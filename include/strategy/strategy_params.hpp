#pragma once

#include "market/market_update.hpp"

#include <cstddef>

namespace mpmm {

struct StrategyParams {
    Timestamp delay                       = 100'000'000;     // quote cadence and order hold time (ns)
    double    risk_coefficient            = 0.5;             // exponential-utility risk aversion
    Timestamp time_oi                     = 10'000'000'000;  // order intensity window (ns)
    double    avg_sum_oi                  = 1.0;             // reference traded size per window
    double    avg_time_oi                 = 10'000'000'000;  // reference window span (ns)
    double    avg_volatility              = 1.0;             // reference volatility
    double    min_asset_value             = 0.001;           // kept for configuration compatibility, unused
    Timestamp volatility_record_cooldown  = 1'000'000'000;   // min gap between volatility samples (ns)
    size_t    volatility_horizon          = 100;             // samples kept for volatility
    size_t    order_intensity_min_samples = 10;
    size_t    order_intensity_capacity    = 100'000;         // hard cap on intensity records
    Timestamp future_lookahead            = 1'000'000'000;   // training diagnostics horizon (ns)
    double    order_fees                  = -0.00004;        // maker fee rate, negative = rebate
    double    order_size                  = 0.001;           // size of each quoted order
};

// Throws ConfigError naming the first offending field.
void validate(const StrategyParams& params);

} // namespace mpmm
