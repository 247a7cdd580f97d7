#pragma once

#include "market/market_update.hpp"
#include "model/dense_matrix.hpp"
#include "model/state_discretizer.hpp"

#include <optional>
#include <vector>

namespace mpmm {

// One sample of top-of-book state taken from the historical replay.
struct StateObservation {
    Timestamp ts          = 0;
    double    imbalance   = 0.0;
    double    half_spread = 0.0;
    double    mid_price   = 0.0;
};

// Empirical transition/reward model. Built once, read-only afterwards.
//   Q(x, x')  probability of moving x -> x' with the mid unchanged
//   T(x, x')  probability of moving x -> x' with the mid changed
//   R(x, k)   probability that the next mid move falls in delta bucket k
// For every row: sum(Q) + sum(T) = 1 and sum(R) = 1.
struct TransitionModel {
    StateDiscretizer    discretizer;
    Matrix              Q;
    Matrix              R;
    Matrix              T;
    std::vector<size_t> observations_per_state;
    size_t              filled_states = 0;   // rows copied from a neighbouring state
    size_t              transitions   = 0;
};

class TransitionModelEstimator {
public:
    explicit TransitionModelEstimator(const StateDiscretizer& discretizer);

    // Observations must arrive in chronological order.
    void add(const StateObservation& obs);
    void add_all(const std::vector<StateObservation>& observations);

    size_t transitions() const { return transitions_; }

    // Throws ModelEstimationError if no state was ever observed.
    TransitionModel build() const;

private:
    StateDiscretizer discretizer_;
    Matrix q_success_;
    Matrix t_success_;
    Matrix r_success_;
    std::vector<size_t> totals_;   // shared by Q, T and R: one count per source state
    std::optional<StateObservation> last_;
    size_t transitions_ = 0;
};

} // namespace mpmm
