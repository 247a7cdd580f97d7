#include "model/transition_model.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"

#include <string>

namespace mpmm {

namespace {

// Divide each row by its observation count; rows without observations come back empty.
std::vector<std::optional<std::vector<double>>> normalize_rows(const Matrix& success,
                                                                const std::vector<size_t>& totals) {
    std::vector<std::optional<std::vector<double>>> rows(success.rows());
    for (size_t r = 0; r < success.rows(); ++r) {
        if (totals[r] == 0) continue;
        std::vector<double> row(success.cols());
        double denom = static_cast<double>(totals[r]);
        for (size_t c = 0; c < success.cols(); ++c) {
            row[c] = success(r, c) / denom;
        }
        rows[r] = std::move(row);
    }
    return rows;
}

// Empty rows take the next observed row below them, then the last observed row above.
Matrix fill_gaps(const std::vector<std::optional<std::vector<double>>>& rows, size_t cols) {
    const size_t n = rows.size();
    std::vector<std::optional<size_t>> source(n);

    std::optional<size_t> next;
    for (size_t r = n; r-- > 0;) {
        if (rows[r]) next = r;
        source[r] = next;
    }
    std::optional<size_t> prev;
    for (size_t r = 0; r < n; ++r) {
        if (rows[r]) prev = r;
        if (!source[r]) source[r] = prev;
    }

    Matrix out(n, cols);
    for (size_t r = 0; r < n; ++r) {
        const auto& src = *rows[*source[r]];
        for (size_t c = 0; c < cols; ++c) out(r, c) = src[c];
    }
    return out;
}

} // anonymous namespace

TransitionModelEstimator::TransitionModelEstimator(const StateDiscretizer& discretizer)
    : discretizer_(discretizer),
      q_success_(discretizer.state_count(), discretizer.state_count()),
      t_success_(discretizer.state_count(), discretizer.state_count()),
      r_success_(discretizer.state_count(), discretizer.delta_bucket_count()),
      totals_(discretizer.state_count(), 0) {}

void TransitionModelEstimator::add(const StateObservation& obs) {
    if (last_) {
        size_t x      = discretizer_.joint_index(last_->imbalance, last_->half_spread);
        size_t x_next = discretizer_.joint_index(obs.imbalance, obs.half_spread);
        double d_mid  = obs.mid_price - last_->mid_price;
        size_t k      = discretizer_.delta_index(d_mid);

        totals_[x] += 1;
        r_success_(x, k) += 1.0;
        if (obs.mid_price == last_->mid_price) {
            q_success_(x, x_next) += 1.0;
        } else {
            t_success_(x, x_next) += 1.0;
        }
        ++transitions_;
    }
    last_ = obs;
}

void TransitionModelEstimator::add_all(const std::vector<StateObservation>& observations) {
    for (const auto& obs : observations) add(obs);
}

TransitionModel TransitionModelEstimator::build() const {
    if (transitions_ == 0) {
        throw ModelEstimationError("historical replay produced no state transitions");
    }

    auto q_rows = normalize_rows(q_success_, totals_);
    auto t_rows = normalize_rows(t_success_, totals_);
    auto r_rows = normalize_rows(r_success_, totals_);

    size_t observed = 0;
    for (size_t total : totals_) {
        if (total > 0) ++observed;
    }
    if (observed == 0) {
        throw ModelEstimationError("no discretized state was observed");
    }

    TransitionModel model{
        .discretizer            = discretizer_,
        .Q                      = fill_gaps(q_rows, q_success_.cols()),
        .R                      = fill_gaps(r_rows, r_success_.cols()),
        .T                      = fill_gaps(t_rows, t_success_.cols()),
        .observations_per_state = totals_,
        .filled_states          = totals_.size() - observed,
        .transitions            = transitions_,
    };

    logger()->info("transition model: {} transitions, {}/{} states observed",
                   transitions_, observed, totals_.size());
    if (model.filled_states > 0) {
        logger()->warn("{} unobserved states copied from neighbouring rows", model.filled_states);
    }
    return model;
}

} // namespace mpmm
