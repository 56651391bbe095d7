#include "metric/distance.hpp"
#include "errors/errors.hpp"

#include <algorithm>
#include <cmath>

namespace ember {

DistanceMetric::DistanceMetric(AxisWeights weights)
    : weights_(weights) {}

void DistanceMetric::setComponent(std::unique_ptr<AxisComponent> component) {
    if (!component) return;
    size_t slot = static_cast<size_t>(component->axis());
    components_[slot] = std::move(component);
}

Distance DistanceMetric::measure(const FeatureVector& features,
                                 const FeatureVector& target,
                                 const std::vector<double>& weights) const {
    if (features.size() != target.size()) {
        throw MetricError::dimensionMismatch(target.size(), features.size());
    }
    if (!weights.empty() && weights.size() != target.size()) {
        throw MetricError::dimensionMismatch(target.size(), weights.size());
    }
    for (size_t i = 0; i < features.size(); i++) {
        if (!std::isfinite(features[i])) throw MetricError::nonFinite(i);
    }

    double axes[3] = {0.0, 0.0, 0.0};
    for (size_t slot = 0; slot < components_.size(); slot++) {
        const auto& comp = components_[slot];
        if (!comp) continue;
        double raw = comp->compute(features, target, weights);
        axes[slot] = axisWeight(comp->axis()) * std::max(0.0, raw);
    }
    return Distance(axes[0], axes[1], axes[2]);
}

size_t DistanceMetric::componentCount() const {
    size_t n = 0;
    for (const auto& c : components_) {
        if (c) n++;
    }
    return n;
}

double DistanceMetric::axisWeight(Axis axis) const {
    switch (axis) {
        case Axis::Knowledge: return weights_.knowledge;
        case Axis::Time:      return weights_.time;
        case Axis::Entropy:   return weights_.entropy;
    }
    return 1.0;
}

} // namespace ember
