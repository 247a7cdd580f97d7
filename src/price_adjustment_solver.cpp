#include "model/price_adjustment_solver.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace mpmm {

PriceAdjustmentSolver::PriceAdjustmentSolver(SolverOptions options)
    : options_(options) {}

PriceAdjustment PriceAdjustmentSolver::solve(const Matrix& Q, const Matrix& R, const Matrix& T,
                                             const std::vector<double>& K) const {
    const size_t nm = Q.rows();
    if (Q.cols() != nm || T.rows() != nm || T.cols() != nm ||
        R.rows() != nm || R.cols() != K.size()) {
        throw std::invalid_argument("transition matrices have inconsistent shapes");
    }

    Matrix qi = inverse(Matrix::identity(nm) - Q, options_.pivot_eps);
    std::vector<double> g = qi * (R * K);
    Matrix b = qi * T;

    PriceAdjustment result{.by_state = std::vector<double>(nm, 0.0)};
    Matrix product = Matrix::identity(nm);

    for (size_t i = 0; i < options_.iterations; ++i) {
        std::vector<double> term = product * g;
        double norm = 0.0;
        for (size_t s = 0; s < nm; ++s) {
            result.by_state[s] += term[s];
            norm = std::max(norm, std::abs(term[s]));
        }
        result.terms_used = i + 1;
        if (options_.convergence_tolerance > 0.0 && norm < options_.convergence_tolerance) {
            break;
        }
        product = product * b;
    }

    for (size_t s = 0; s < nm; ++s) {
        if (!std::isfinite(result.by_state[s])) {
            throw NumericalInstabilityError("price adjustment diverged at state " + std::to_string(s));
        }
    }
    return result;
}

PriceAdjustment PriceAdjustmentSolver::solve(const TransitionModel& model) const {
    return solve(model.Q, model.R, model.T, model.discretizer.delta_edges());
}

} // namespace mpmm
