#pragma once

#include "market/market_update.hpp"
#include "model/price_adjustment_solver.hpp"
#include "model/state_discretizer.hpp"

namespace mpmm {

struct Quote {
    double bid_price          = 0.0;
    double ask_price          = 0.0;
    double indifference_price = 0.0;
    double adjustment         = 0.0;   // micro-price adjustment of the current state
    double spread             = 0.0;   // ask_price - bid_price
    size_t state              = 0;
};

class QuoteEngine {
public:
    // Throws ConfigError for a non-positive risk coefficient or an adjustment
    // vector that does not cover every discretized state.
    QuoteEngine(double risk_coefficient, StateDiscretizer discretizer, PriceAdjustment adjustment);

    Quote compute_quote(const BestPositions& best, double volatility, double order_intensity) const;

    // spread = gamma * sigma + (2 / gamma) * ln(1 + gamma / kappa)
    double compute_spread(double volatility, double order_intensity) const;

    double adjustment_at(size_t state) const { return adjustment_.by_state.at(state); }

private:
    double           risk_coefficient_;
    StateDiscretizer discretizer_;
    PriceAdjustment  adjustment_;
};

} // namespace mpmm
