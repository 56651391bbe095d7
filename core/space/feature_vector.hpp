#pragma once

#include <cmath>
#include <cstddef>
#include <vector>

namespace ember {

/// A point in the solution space. Dimensionality is fixed per problem.
using FeatureVector = std::vector<double>;

/// A displacement between two points of the same space.
using FeatureDelta = std::vector<double>;

// ─── Vector Helpers ────────────────────────────────────────────
// Small dense-vector operations used throughout the engine.
// Callers are responsible for matching dimensionality.

inline double dot(const FeatureVector& a, const FeatureVector& b) {
    double sum = 0.0;
    for (size_t i = 0; i < a.size() && i < b.size(); i++) {
        sum += a[i] * b[i];
    }
    return sum;
}

inline double norm(const FeatureVector& v) {
    return std::sqrt(dot(v, v));
}

/// a - b
inline FeatureDelta difference(const FeatureVector& a, const FeatureVector& b) {
    FeatureDelta d(a.size(), 0.0);
    for (size_t i = 0; i < a.size() && i < b.size(); i++) {
        d[i] = a[i] - b[i];
    }
    return d;
}

/// v += scale * d
inline void addScaled(FeatureVector& v, const FeatureDelta& d, double scale) {
    for (size_t i = 0; i < v.size() && i < d.size(); i++) {
        v[i] += scale * d[i];
    }
}

/// Unit vector in the direction of v. Returns false (and leaves v
/// untouched) when v has zero or non-finite length.
inline bool normalize(FeatureDelta& v) {
    double n = norm(v);
    if (!(n > 0.0) || !std::isfinite(n)) return false;
    for (double& x : v) x /= n;
    return true;
}

inline bool allFinite(const FeatureVector& v) {
    for (double x : v) {
        if (!std::isfinite(x)) return false;
    }
    return true;
}

} // namespace ember
