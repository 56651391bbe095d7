#pragma once

#include "space/feature_vector.hpp"

#include <array>
#include <cmath>
#include <memory>
#include <string>
#include <vector>

namespace ember {

// ─── Distance ──────────────────────────────────────────────────
// Three-axis distance of a candidate from an acceptable solution.
// total is the Euclidean norm of the axes, so one extreme axis
// dominates rather than being averaged away.

struct Distance {
    double knowledge = 0.0;
    double time      = 0.0;
    double entropy   = 0.0;
    double total     = 0.0;

    Distance() = default;
    Distance(double k, double t, double e)
        : knowledge(k), time(t), entropy(e),
          total(std::sqrt(k * k + t * t + e * e)) {}

    /// Per-axis improvement of `other` over this one (positive = better).
    bool improvedOnAnyAxis(const Distance& other) const {
        return other.knowledge < knowledge ||
               other.time < time ||
               other.entropy < entropy;
    }
};

enum class Axis {
    Knowledge = 0,
    Time = 1,
    Entropy = 2
};

// ─── Axis Component ────────────────────────────────────────────
// Abstract base for one distance axis. Must be a pure function of
// the features, the target, and the per-dimension weights.

class AxisComponent {
public:
    virtual ~AxisComponent() = default;

    /// Non-negative distance along this axis.
    virtual double compute(const FeatureVector& features,
                           const FeatureVector& target,
                           const std::vector<double>& weights) const = 0;

    virtual Axis axis() const = 0;

    virtual std::string name() const = 0;
};

// ─── Axis Weights ──────────────────────────────────────────────

struct AxisWeights {
    double knowledge = 1.0;
    double time      = 1.0;
    double entropy   = 1.0;
};

// ─── Distance Metric ───────────────────────────────────────────
// Combines one component per axis into a Distance. Stateless after
// construction; safe to call from many threads at once.

class DistanceMetric {
public:
    explicit DistanceMetric(AxisWeights weights = {});

    /// Install the component for its axis, replacing any previous one.
    void setComponent(std::unique_ptr<AxisComponent> component);

    /// Measure a feature vector against a target. Throws MetricError on
    /// dimensionality mismatch or non-finite input. `weights` may be empty
    /// (treated as all ones) or must match the dimensionality.
    Distance measure(const FeatureVector& features,
                     const FeatureVector& target,
                     const std::vector<double>& weights = {}) const;

    const AxisWeights& weights() const { return weights_; }
    void setWeights(const AxisWeights& w) { weights_ = w; }

    size_t componentCount() const;

private:
    AxisWeights weights_;
    std::array<std::unique_ptr<AxisComponent>, 3> components_;

    double axisWeight(Axis axis) const;
};

} // namespace ember
