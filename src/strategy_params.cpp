#include "strategy/strategy_params.hpp"
#include "common/errors.hpp"

#include <string>

namespace mpmm {

namespace {

void require_positive(double value, const char* name) {
    if (!(value > 0.0)) {
        throw ConfigError(std::string("strategy parameter '") + name + "' must be positive");
    }
}

} // anonymous namespace

void validate(const StrategyParams& p) {
    require_positive(static_cast<double>(p.delay), "delay");
    require_positive(p.risk_coefficient, "risk_coefficient");
    require_positive(static_cast<double>(p.time_oi), "time_oi");
    require_positive(p.avg_sum_oi, "avg_sum_oi");
    require_positive(p.avg_time_oi, "avg_time_oi");
    require_positive(p.avg_volatility, "avg_volatility");
    require_positive(static_cast<double>(p.volatility_horizon), "volatility_horizon");
    require_positive(static_cast<double>(p.order_intensity_capacity), "order_intensity_capacity");
    require_positive(p.order_size, "order_size");
    if (p.volatility_record_cooldown < 0) {
        throw ConfigError("strategy parameter 'volatility_record_cooldown' must not be negative");
    }
    if (p.future_lookahead < 0) {
        throw ConfigError("strategy parameter 'future_lookahead' must not be negative");
    }
    if (p.order_intensity_capacity <= p.order_intensity_min_samples) {
        throw ConfigError("order_intensity_capacity must exceed order_intensity_min_samples");
    }
}

} // namespace mpmm
