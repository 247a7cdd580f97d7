#include "strategy/quote_engine.hpp"
#include "common/errors.hpp"

#include <cmath>
#include <utility>

namespace mpmm {

QuoteEngine::QuoteEngine(double risk_coefficient, StateDiscretizer discretizer,
                         PriceAdjustment adjustment)
    : risk_coefficient_(risk_coefficient),
      discretizer_(std::move(discretizer)),
      adjustment_(std::move(adjustment)) {
    if (!(risk_coefficient_ > 0.0)) {
        throw ConfigError("risk coefficient must be positive");
    }
    if (adjustment_.by_state.size() != discretizer_.state_count()) {
        throw ConfigError("price adjustment does not match the discretized state space");
    }
}

Quote QuoteEngine::compute_quote(const BestPositions& best, double volatility,
                                 double order_intensity) const {
    double mid = best.mid_price();
    size_t state = discretizer_.joint_index(best.imbalance(), best.half_spread());
    double adjustment = adjustment_.by_state[state];
    double indifference = mid + adjustment;
    double spread = compute_spread(volatility, order_intensity);

    return Quote{
        .bid_price          = indifference - spread / 2.0,
        .ask_price          = indifference + spread / 2.0,
        .indifference_price = indifference,
        .adjustment         = adjustment,
        .spread             = spread,
        .state              = state,
    };
}

double QuoteEngine::compute_spread(double volatility, double order_intensity) const {
    const double gamma = risk_coefficient_;
    return gamma * volatility + (2.0 / gamma) * std::log(1.0 + gamma / order_intensity);
}

} // namespace mpmm
