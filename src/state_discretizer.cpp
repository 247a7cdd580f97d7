#include "model/state_discretizer.hpp"
#include "common/errors.hpp"

#include <algorithm>

namespace mpmm {

namespace {

std::vector<double> open_grid(double lo, double hi, size_t count) {
    std::vector<double> edges(count);
    double step = (hi - lo) / static_cast<double>(count);
    for (size_t i = 0; i < count; ++i) {
        edges[i] = lo + step * static_cast<double>(i);
    }
    return edges;
}

// Endpoints included; for an odd count the middle point is exactly zero.
std::vector<double> symmetric_grid(double range, size_t count) {
    if (count == 1) return {0.0};
    std::vector<double> edges(count);
    double last = static_cast<double>(count - 1);
    for (size_t i = 0; i < count; ++i) {
        edges[i] = range * (2.0 * static_cast<double>(i) - last) / last;
    }
    return edges;
}

} // anonymous namespace

size_t bucket_index(const std::vector<double>& edges, double value) {
    auto it = std::upper_bound(edges.begin(), edges.end(), value);
    if (it == edges.begin()) return 0;
    return static_cast<size_t>(it - edges.begin()) - 1;
}

StateDiscretizer::StateDiscretizer(const DiscretizerConfig& config) {
    if (config.imbalance_buckets == 0 || config.spread_buckets == 0 ||
        config.price_delta_points == 0) {
        throw ConfigError("discretizer bucket counts must be positive");
    }
    if (config.spread_max <= 0.0 || config.price_delta_range <= 0.0) {
        throw ConfigError("discretizer ranges must be positive");
    }

    imbalance_edges_ = open_grid(0.0, 1.0, config.imbalance_buckets);
    spread_edges_    = open_grid(0.0, config.spread_max, config.spread_buckets);
    delta_edges_     = symmetric_grid(config.price_delta_range, config.price_delta_points);
}

size_t StateDiscretizer::joint_index(double imbalance, double half_spread) const {
    size_t i = bucket_index(imbalance_edges_, imbalance);
    size_t s = bucket_index(spread_edges_, half_spread);
    return i * spread_edges_.size() + s;
}

size_t StateDiscretizer::delta_index(double mid_delta) const {
    return bucket_index(delta_edges_, mid_delta);
}

} // namespace mpmm
