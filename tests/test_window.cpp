#include <gtest/gtest.h>
#include "search/window_selector.hpp"
#include "insight/domain_signature.hpp"
#include "errors/errors.hpp"

#include <cmath>

using namespace ember;

namespace {

Window unitWindow() {
    Window w;
    w.center = {0.0, 0.0};
    w.radius = 1.0;
    return w;
}

WeightedInsight weighted(FeatureDelta direction, double confidence, double efficiency = 1.0) {
    normalize(direction);
    WeightedInsight wi;
    wi.insight.direction = direction;
    wi.insight.signature = SignatureEncoder::compute(direction);
    wi.insight.confidence = confidence;
    wi.efficiency = efficiency;
    return wi;
}

} // namespace

// ─── Aggregate ─────────────────────────────────────────────────

TEST(WindowTest, AggregateOfAgreeingInsights) {
    double coherence = 0.0;
    auto dir = WindowSelector::aggregate(
        {weighted({1.0, 0.0}, 0.8), weighted({1.0, 0.0}, 0.3)}, 2, coherence);
    EXPECT_NEAR(dir[0], 1.0, 1e-12);
    EXPECT_NEAR(dir[1], 0.0, 1e-12);
    EXPECT_NEAR(coherence, 1.0, 1e-12);
}

TEST(WindowTest, AggregateOfOpposingInsightsCancels) {
    double coherence = 1.0;
    auto dir = WindowSelector::aggregate(
        {weighted({1.0, 0.0}, 0.5), weighted({-1.0, 0.0}, 0.5)}, 2, coherence);
    EXPECT_DOUBLE_EQ(coherence, 0.0);
    EXPECT_DOUBLE_EQ(norm(dir), 0.0);
}

TEST(WindowTest, AggregateOfOrthogonalInsights) {
    double coherence = 0.0;
    auto dir = WindowSelector::aggregate(
        {weighted({1.0, 0.0}, 1.0), weighted({0.0, 1.0}, 1.0)}, 2, coherence);
    EXPECT_NEAR(coherence, 1.0 / std::sqrt(2.0), 1e-12);
    EXPECT_NEAR(dir[0], dir[1], 1e-12);
}

TEST(WindowTest, AggregateWeighsByEfficiency) {
    double coherence = 0.0;
    auto dir = WindowSelector::aggregate(
        {weighted({1.0, 0.0}, 1.0, 0.9), weighted({0.0, 1.0}, 1.0, 0.1)}, 2, coherence);
    EXPECT_GT(dir[0], 5.0 * dir[1]);
}

TEST(WindowTest, AggregateSkipsMismatchedAndEmpty) {
    double coherence = 1.0;
    auto dir = WindowSelector::aggregate({weighted({1.0, 0.0, 0.0}, 1.0)}, 2, coherence);
    EXPECT_EQ(dir.size(), 2u);
    EXPECT_DOUBLE_EQ(coherence, 0.0);

    dir = WindowSelector::aggregate({}, 3, coherence);
    EXPECT_EQ(dir.size(), 3u);
    EXPECT_DOUBLE_EQ(coherence, 0.0);
}

// ─── Improving Iterations ──────────────────────────────────────

TEST(WindowTest, ImprovementContractsAroundBest) {
    WindowSelector sel(unitWindow());
    Window next = sel.nextWindow(unitWindow(), {}, true, {0.3, -0.2});

    EXPECT_DOUBLE_EQ(next.radius, 0.9);
    EXPECT_EQ(next.center, (FeatureVector{0.3, -0.2}));
    EXPECT_TRUE(next.bias.empty());
    EXPECT_DOUBLE_EQ(next.bias_strength, 0.0);
    EXPECT_EQ(sel.state(), WindowState::Contracting);
}

TEST(WindowTest, ImprovementStepsAlongAggregate) {
    WindowSelector sel(unitWindow());
    Window next = sel.nextWindow(unitWindow(), {weighted({1.0, 0.0}, 1.0)}, true, {0.0, 0.0});

    // step_fraction 0.5 × radius 1 × coherence 1
    EXPECT_NEAR(next.center[0], 0.5, 1e-12);
    EXPECT_NEAR(next.center[1], 0.0, 1e-12);
    ASSERT_EQ(next.bias.size(), 2u);
    EXPECT_NEAR(next.bias[0], 1.0, 1e-12);
    EXPECT_NEAR(next.bias_strength, 0.5, 1e-12);
}

// ─── Stagnation ────────────────────────────────────────────────

TEST(WindowTest, EarlyFailuresProbeCloser) {
    WindowSelector sel(unitWindow());
    Window w = unitWindow();
    w = sel.nextWindow(w, {}, false, w.center);
    EXPECT_DOUBLE_EQ(w.radius, 0.5);
    EXPECT_EQ(sel.stagnation(), 1);
    EXPECT_EQ(sel.state(), WindowState::Contracting);
}

TEST(WindowTest, SustainedFailureExpandsCappedAtInitial) {
    WindowSelector sel(unitWindow());
    Window w = unitWindow();
    for (int i = 0; i < 4; i++) w = sel.nextWindow(w, {}, false, w.center);
    EXPECT_DOUBLE_EQ(w.radius, 0.0625);

    w = sel.nextWindow(w, {}, false, w.center);
    EXPECT_EQ(sel.state(), WindowState::Expanding);
    EXPECT_DOUBLE_EQ(w.radius, 0.0625 * 1.5);

    for (int i = 0; i < 10; i++) {
        w = sel.nextWindow(w, {}, false, w.center);
        EXPECT_LE(w.radius, sel.maxRadius());
    }
    EXPECT_DOUBLE_EQ(w.radius, 1.0);
}

TEST(WindowTest, ConvergesAfterStagnationAtMaxRadius) {
    WindowSelector sel(unitWindow());
    Window w = unitWindow();
    for (int i = 0; i < 19; i++) {
        w = sel.nextWindow(w, {}, false, w.center);
        EXPECT_NE(sel.state(), WindowState::Converged);
    }
    w = sel.nextWindow(w, {}, false, w.center);
    EXPECT_EQ(sel.stagnation(), 20);
    EXPECT_EQ(sel.state(), WindowState::Converged);
}

TEST(WindowTest, NoConvergenceWhileRadiusStillGrowing) {
    WindowPolicy policy;
    policy.expansion = 1.01;
    WindowSelector sel(unitWindow(), policy);
    Window w = unitWindow();
    for (int i = 0; i < 25; i++) w = sel.nextWindow(w, {}, false, w.center);
    EXPECT_LT(w.radius, 1.0);
    EXPECT_EQ(sel.state(), WindowState::Expanding);
}

TEST(WindowTest, ImprovementClearsStagnation) {
    WindowSelector sel(unitWindow());
    Window w = unitWindow();
    for (int i = 0; i < 7; i++) w = sel.nextWindow(w, {}, false, w.center);
    EXPECT_EQ(sel.state(), WindowState::Expanding);

    w = sel.nextWindow(w, {}, true, w.center);
    EXPECT_EQ(sel.stagnation(), 0);
    EXPECT_EQ(sel.state(), WindowState::Contracting);
}

TEST(WindowTest, ResetRestoresInitial) {
    Window initial = unitWindow();
    initial.center = {4.0, 4.0};
    WindowSelector sel(initial);
    Window w = initial;
    for (int i = 0; i < 6; i++) w = sel.nextWindow(w, {}, false, {1.0, 1.0});

    Window r = sel.reset();
    EXPECT_EQ(r.center, initial.center);
    EXPECT_DOUBLE_EQ(r.radius, initial.radius);
    EXPECT_EQ(sel.stagnation(), 0);
    EXPECT_EQ(sel.state(), WindowState::Contracting);
}

// ─── Steering ──────────────────────────────────────────────────

TEST(WindowTest, SteerFollowsTransferredInsight) {
    WindowSelector sel(unitWindow());
    Window w = unitWindow();
    w.radius = 0.4;

    Window next = sel.steer(w, weighted({0.0, -3.0}, 0.8, 0.5), {2.0, -1.0});
    EXPECT_EQ(next.center, (FeatureVector{2.0, -1.0}));
    EXPECT_DOUBLE_EQ(next.radius, 0.4);
    ASSERT_EQ(next.bias.size(), 2u);
    EXPECT_NEAR(next.bias[1], -1.0, 1e-12);
    // max_bias_strength 0.5 × confidence 0.8 × efficiency 0.5
    EXPECT_NEAR(next.bias_strength, 0.2, 1e-12);
    EXPECT_EQ(sel.stagnation(), 0);
    EXPECT_EQ(sel.state(), WindowState::Contracting);
}

TEST(WindowTest, SteerIgnoresUnusableDirection) {
    WindowSelector sel(unitWindow());
    Window w = unitWindow();
    w.bias = {1.0, 0.0};
    w.bias_strength = 0.3;

    Window next = sel.steer(w, weighted({1.0, 0.0, 0.0}, 1.0), {0.5, 0.5});
    EXPECT_EQ(next.center, (FeatureVector{0.5, 0.5}));
    EXPECT_EQ(next.bias, w.bias);
    EXPECT_DOUBLE_EQ(next.bias_strength, 0.3);
}

// ─── Policy ────────────────────────────────────────────────────

TEST(WindowTest, PolicyValidation) {
    EXPECT_NO_THROW(validate(WindowPolicy{}));

    WindowPolicy p;
    p.contraction = 1.0;
    EXPECT_THROW(validate(p), ConfigError);

    p = WindowPolicy{};
    p.expansion = 1.0;
    EXPECT_THROW(validate(p), ConfigError);

    p = WindowPolicy{};
    p.expand_after = 30;
    EXPECT_THROW(validate(p), ConfigError);

    p = WindowPolicy{};
    p.max_bias_strength = 1.0;
    EXPECT_THROW(validate(p), ConfigError);
}

TEST(WindowTest, StateNames) {
    EXPECT_STREQ(toString(WindowState::Contracting), "contracting");
    EXPECT_STREQ(toString(WindowState::Expanding), "expanding");
    EXPECT_STREQ(toString(WindowState::Converged), "converged");
}
