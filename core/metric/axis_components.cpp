#include "metric/axis_components.hpp"

#include <cmath>

namespace ember {

double PartitionedAxis::compute(const FeatureVector& features,
                                const FeatureVector& target,
                                const std::vector<double>& weights) const {
    const size_t offset = static_cast<size_t>(axis());
    double sum = 0.0;
    for (size_t i = offset; i < features.size(); i += 3) {
        double w = weights.empty() ? 1.0 : weights[i];
        double r = w * (features[i] - target[i]);
        sum += r * r;
    }
    return std::sqrt(sum);
}

std::string KnowledgeAxis::name() const { return "knowledge"; }
std::string TimeAxis::name() const { return "time"; }
std::string EntropyAxis::name() const { return "entropy"; }

std::shared_ptr<const DistanceMetric> makeDefaultDistanceMetric(const AxisWeights& weights) {
    auto metric = std::make_shared<DistanceMetric>(weights);
    metric->setComponent(std::make_unique<KnowledgeAxis>());
    metric->setComponent(std::make_unique<TimeAxis>());
    metric->setComponent(std::make_unique<EntropyAxis>());
    return metric;
}

} // namespace ember
