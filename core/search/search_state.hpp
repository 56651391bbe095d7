#pragma once

#include "generator/candidate_generator.hpp"
#include "insight/insight.hpp"
#include "metric/distance.hpp"
#include "search/window_selector.hpp"
#include "space/window.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace ember {

// ─── Problem Descriptor ────────────────────────────────────────
// One problem instance ("domain"). Everything the engine needs to
// score candidates; the meaning of a candidate stays with the caller.

struct ProblemDescriptor {
    DomainId domain_id = "default";
    size_t dimensions = 0;
    Window initial_window;
    FeatureVector target;
    std::vector<double> weights;                    // per dimension; empty = all ones
    PayloadEncoder payload_encoder;                 // called from worker threads; empty = defaultPayload
    std::shared_ptr<const DistanceMetric> metric;   // empty = partitioned three-axis metric
};

// ─── Budget ────────────────────────────────────────────────────

/// Named epsilon presets.
enum class PrecisionLevel {
    Coarse,     // 1e-2
    Standard,   // 1e-6
    High        // 1e-9
};

double epsilonFor(PrecisionLevel level);

struct SearchBudget {
    size_t max_iterations = 1000;
    double max_wall_clock_seconds = 30.0;
    double epsilon = 1e-6;          // success once best d_total <= epsilon
};

// ─── Search Config ─────────────────────────────────────────────

struct SearchConfig {
    size_t batch_size = 64;
    double bias_factor = 1.0;        // >= 1; higher over-samples the window boundary
    size_t worker_count = 0;         // 0 = hardware concurrency
    double insight_threshold = 0.05; // τ
    uint64_t seed = 42;
    size_t trajectory_limit = 1000;  // most recent best distances kept in the result
    size_t transfer_lookups = 4;     // cache lookups per iteration
    WindowPolicy window;
};

enum class TerminationReason {
    Success,
    IterationBudgetExhausted,
    WallClockExhausted,
    LocalOptimum,
    Cancelled
};

const char* toString(TerminationReason reason);

/// Budget exhaustion is reported, not raised.
inline bool isResourceExhausted(TerminationReason reason) {
    return reason == TerminationReason::IterationBudgetExhausted ||
           reason == TerminationReason::WallClockExhausted;
}

// ─── Search Result ─────────────────────────────────────────────

struct SearchResult {
    std::string best_candidate_payload;
    FeatureVector best_features;
    Distance final_distance;
    size_t iterations_used = 0;
    TerminationReason termination_reason = TerminationReason::IterationBudgetExhausted;
    double elapsed_seconds = 0.0;
    int window_resets = 0;
    uint64_t insights_extracted = 0;
    uint64_t insights_transferred = 0;
    size_t peak_live_candidates = 0;
    std::vector<double> distance_trajectory;  // running best d_total per iteration (most recent)
};

/// Emitted once per iteration, after that iteration's batch is disposed.
struct IterationReport {
    DomainId domain_id;
    size_t iteration = 0;            // 1-based
    Distance best;
    double radius = 0.0;
    WindowState window_state = WindowState::Contracting;
    bool improved = false;
    size_t candidates_scored = 0;
    size_t insights_accepted = 0;
    size_t insights_transferred = 0;
};

// Validation (throws ConfigError)
void validate(const ProblemDescriptor& problem);
void validate(const SearchBudget& budget);
void validate(const SearchConfig& config);

} // namespace ember
