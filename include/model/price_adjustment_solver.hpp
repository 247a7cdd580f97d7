#pragma once

#include "model/dense_matrix.hpp"
#include "model/transition_model.hpp"

#include <vector>

namespace mpmm {

struct SolverOptions {
    size_t iterations            = 20;     // Neumann series terms
    double convergence_tolerance = 0.0;    // > 0 stops once a term's max-norm drops below it
    double pivot_eps             = 1e-12;  // singularity threshold for (I - Q)
};

struct PriceAdjustment {
    std::vector<double> by_state;   // expected mid-price adjustment per joint state
    size_t              terms_used = 0;
};

// Solves adjustment = G + B * adjustment by truncated Neumann series, where
//   Qi = (I - Q)^-1,  G = Qi * R * K,  B = Qi * T
class PriceAdjustmentSolver {
public:
    explicit PriceAdjustmentSolver(SolverOptions options = {});

    // Throws NumericalInstabilityError if (I - Q) is singular or the result is not finite.
    PriceAdjustment solve(const Matrix& Q, const Matrix& R, const Matrix& T,
                          const std::vector<double>& K) const;

    PriceAdjustment solve(const TransitionModel& model) const;

private:
    SolverOptions options_;
};

} // namespace mpmm
