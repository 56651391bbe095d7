#pragma once

#include "space/feature_vector.hpp"

namespace ember {

/// Bounded sub-region of the solution space sampled by one generation batch.
/// `bias` is a unit (or zero) direction that skews sampling toward one side
/// of the ball; `bias_strength` in [0, 1) controls how far.
struct Window {
    FeatureVector center;
    double radius = 1.0;
    FeatureDelta bias;
    double bias_strength = 0.0;

    size_t dimensions() const { return center.size(); }
};

} // namespace ember
