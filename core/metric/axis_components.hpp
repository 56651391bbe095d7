#pragma once

#include "metric/distance.hpp"

namespace ember {

// ─── Partitioned Axes ──────────────────────────────────────────
// Default axes. The weighted displacement w ⊙ (x − target) is split
// across the three axes by dimension index modulo 3; each axis is the
// L2 norm of its share. With unit weights the three axes recombine
// into the plain Euclidean distance to the target.

class PartitionedAxis : public AxisComponent {
public:
    double compute(const FeatureVector& features,
                   const FeatureVector& target,
                   const std::vector<double>& weights) const override;
};

class KnowledgeAxis : public PartitionedAxis {
public:
    Axis axis() const override { return Axis::Knowledge; }
    std::string name() const override;
};

class TimeAxis : public PartitionedAxis {
public:
    Axis axis() const override { return Axis::Time; }
    std::string name() const override;
};

class EntropyAxis : public PartitionedAxis {
public:
    Axis axis() const override { return Axis::Entropy; }
    std::string name() const override;
};

/// Metric with the three partitioned axes installed.
std::shared_ptr<const DistanceMetric> makeDefaultDistanceMetric(const AxisWeights& weights = {});

} // namespace ember
