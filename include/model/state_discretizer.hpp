#pragma once

#include <cstddef>
#include <vector>

namespace mpmm {

struct DiscretizerConfig {
    size_t imbalance_buckets  = 10;   // equal cells over [0, 1)
    size_t spread_buckets     = 20;   // equal cells over [0, spread_max)
    double spread_max         = 2.0;
    size_t price_delta_points = 13;   // grid over [-delta_range, +delta_range], endpoints included
    double price_delta_range  = 0.3;
};

// Largest i with edges[i] <= value, 0 when value is below every edge.
size_t bucket_index(const std::vector<double>& edges, double value);

class StateDiscretizer {
public:
    explicit StateDiscretizer(const DiscretizerConfig& config = {});

    size_t joint_index(double imbalance, double half_spread) const;
    size_t delta_index(double mid_delta) const;

    size_t imbalance_bucket_count() const { return imbalance_edges_.size(); }
    size_t spread_bucket_count()    const { return spread_edges_.size(); }
    size_t state_count()            const { return imbalance_edges_.size() * spread_edges_.size(); }
    size_t delta_bucket_count()     const { return delta_edges_.size(); }

    const std::vector<double>& imbalance_edges() const { return imbalance_edges_; }
    const std::vector<double>& spread_edges()    const { return spread_edges_; }
    // Also the representative price move of each delta bucket.
    const std::vector<double>& delta_edges()     const { return delta_edges_; }

private:
    std::vector<double> imbalance_edges_;
    std::vector<double> spread_edges_;
    std::vector<double> delta_edges_;
};

} // namespace mpmm
