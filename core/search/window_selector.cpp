#include "search/window_selector.hpp"
#include "errors/errors.hpp"

#include <algorithm>
#include <cmath>

namespace ember {

void validate(const WindowPolicy& p) {
    if (!(p.contraction > 0.0 && p.contraction < 1.0)) {
        throw ConfigError("window contraction must be in (0, 1)");
    }
    if (!(p.probe_contraction > 0.0 && p.probe_contraction < 1.0)) {
        throw ConfigError("window probe_contraction must be in (0, 1)");
    }
    if (!(p.expansion > 1.0) || !std::isfinite(p.expansion)) {
        throw ConfigError("window expansion must be > 1");
    }
    if (p.expand_after < 0 || p.stagnation_limit < 1 || p.expand_after > p.stagnation_limit) {
        throw ConfigError("window requires 0 <= expand_after <= stagnation_limit, stagnation_limit >= 1");
    }
    if (!(p.step_fraction >= 0.0 && p.step_fraction <= 1.0)) {
        throw ConfigError("window step_fraction must be in [0, 1]");
    }
    if (!(p.max_bias_strength >= 0.0 && p.max_bias_strength < 1.0)) {
        throw ConfigError("window max_bias_strength must be in [0, 1)");
    }
}

const char* toString(WindowState state) {
    switch (state) {
        case WindowState::Contracting: return "contracting";
        case WindowState::Expanding:   return "expanding";
        case WindowState::Converged:   return "converged";
    }
    return "unknown";
}

WindowSelector::WindowSelector(Window initial, WindowPolicy policy)
    : initial_(std::move(initial)), policy_(policy) {}

FeatureDelta WindowSelector::aggregate(const std::vector<WeightedInsight>& insights,
                                       size_t dimensions, double& coherence) {
    FeatureDelta sum(dimensions, 0.0);
    double weight_sum = 0.0;
    for (const auto& wi : insights) {
        if (wi.insight.direction.size() != dimensions) continue;
        double w = wi.insight.confidence * wi.efficiency;
        if (!(w > 0.0)) continue;
        addScaled(sum, wi.insight.direction, w);
        weight_sum += w;
    }

    coherence = 0.0;
    if (weight_sum <= 0.0) return FeatureDelta(dimensions, 0.0);

    double magnitude = norm(sum);
    if (!normalize(sum)) return FeatureDelta(dimensions, 0.0);
    coherence = std::min(1.0, magnitude / weight_sum);
    return sum;
}

Window WindowSelector::nextWindow(const Window& current,
                                  const std::vector<WeightedInsight>& recent,
                                  bool improved,
                                  const FeatureVector& best) {
    Window next = current;
    next.center = best;

    double coherence = 0.0;
    FeatureDelta direction = aggregate(recent, current.dimensions(), coherence);

    if (improved) {
        stagnation_ = 0;
        state_ = WindowState::Contracting;
        if (coherence > 0.0) {
            addScaled(next.center, direction, policy_.step_fraction * current.radius * coherence);
        }
        next.radius = current.radius * policy_.contraction;
    } else {
        stagnation_++;
        if (stagnation_ < policy_.expand_after) {
            state_ = WindowState::Contracting;
            next.radius = current.radius * policy_.probe_contraction;
        } else {
            state_ = WindowState::Expanding;
            next.radius = std::min(current.radius * policy_.expansion, maxRadius());
        }
        if (stagnation_ >= policy_.stagnation_limit && next.radius >= maxRadius()) {
            state_ = WindowState::Converged;
        }
    }

    if (coherence > 0.0) {
        next.bias = std::move(direction);
        next.bias_strength = policy_.max_bias_strength * coherence;
    } else {
        next.bias.clear();
        next.bias_strength = 0.0;
    }
    return next;
}

Window WindowSelector::steer(const Window& current, const WeightedInsight& transferred,
                             const FeatureVector& best) const {
    Window next = current;
    next.center = best;

    FeatureDelta direction = transferred.insight.direction;
    const double weight = transferred.insight.confidence * transferred.efficiency;
    if (direction.size() == current.dimensions() && weight > 0.0 && normalize(direction)) {
        next.bias = std::move(direction);
        next.bias_strength = policy_.max_bias_strength * std::min(1.0, weight);
    }
    return next;
}

Window WindowSelector::reset() {
    state_ = WindowState::Contracting;
    stagnation_ = 0;
    return initial_;
}

} // namespace ember
