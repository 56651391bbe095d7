#pragma once

#include "insight/insight.hpp"
#include "space/window.hpp"

#include <vector>

namespace ember {

// ─── Window Policy ─────────────────────────────────────────────

struct WindowPolicy {
    double contraction = 0.9;        // radius factor after an improving iteration
    double expansion = 1.5;          // radius factor once stagnating (capped at the initial radius)
    double probe_contraction = 0.5;  // radius factor for the first non-improving iterations
    int expand_after = 5;            // non-improving iterations before expansion starts
    int stagnation_limit = 20;       // non-improving iterations before Converged is possible
    double step_fraction = 0.5;      // center step, in radii, for a fully coherent aggregate
    double max_bias_strength = 0.5;  // sampling skew for a fully coherent aggregate
};

/// Throws ConfigError on out-of-range factors or limits.
void validate(const WindowPolicy& policy);

enum class WindowState {
    Contracting,
    Expanding,
    Converged
};

const char* toString(WindowState state);

/// An insight together with how far its source can be trusted.
struct WeightedInsight {
    Insight insight;
    double efficiency = 0.5;
    bool transferred = false;
};

// ─── Window Selector ───────────────────────────────────────────
// Narrows the next batch's region from the last iteration's insights.
//
// Improving iteration: re-anchor on the running best, step along the
// aggregate direction, contract. Non-improving: the first expand_after
// such iterations contract by probe_contraction instead of expanding,
// which departs from a plain expand-on-stagnation rule; only after that
// does the radius grow by expansion (the escape from local optima).
// Converged once stagnation has lasted stagnation_limit iterations and
// the radius is already back at its maximum.

class WindowSelector {
public:
    WindowSelector(Window initial, WindowPolicy policy = {});

    Window nextWindow(const Window& current,
                      const std::vector<WeightedInsight>& recent,
                      bool improved,
                      const FeatureVector& best);

    /// Re-anchor on a best point reached by following a transferred
    /// insight, skewing sampling along it by confidence × efficiency.
    /// Radius and stagnation are left alone.
    Window steer(const Window& current, const WeightedInsight& transferred,
                 const FeatureVector& best) const;

    /// Back to the initial window and state.
    Window reset();

    WindowState state() const { return state_; }
    int stagnation() const { return stagnation_; }
    double maxRadius() const { return initial_.radius; }
    const Window& initial() const { return initial_; }
    const WindowPolicy& policy() const { return policy_; }

    /// Unit aggregate of the insights weighted by confidence × efficiency.
    /// coherence = |Σ w·d| / Σ w, in [0, 1]; 0 when nothing usable.
    static FeatureDelta aggregate(const std::vector<WeightedInsight>& insights,
                                  size_t dimensions, double& coherence);

private:
    Window initial_;
    WindowPolicy policy_;
    WindowState state_ = WindowState::Contracting;
    int stagnation_ = 0;
};

} // namespace ember
