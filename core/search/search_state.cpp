#include "search/search_state.hpp"
#include "errors/errors.hpp"

#include <cmath>

namespace ember {

double epsilonFor(PrecisionLevel level) {
    switch (level) {
        case PrecisionLevel::Coarse:   return 1e-2;
        case PrecisionLevel::Standard: return 1e-6;
        case PrecisionLevel::High:     return 1e-9;
    }
    return 1e-6;
}

const char* toString(TerminationReason reason) {
    switch (reason) {
        case TerminationReason::Success:                  return "success";
        case TerminationReason::IterationBudgetExhausted: return "iteration_budget_exhausted";
        case TerminationReason::WallClockExhausted:       return "wall_clock_exhausted";
        case TerminationReason::LocalOptimum:             return "local_optimum";
        case TerminationReason::Cancelled:                return "cancelled";
    }
    return "unknown";
}

void validate(const ProblemDescriptor& problem) {
    const size_t n = problem.dimensions;
    if (n == 0) {
        throw ConfigError("problem dimensionality must be positive");
    }
    if (problem.initial_window.center.size() != n) {
        throw ConfigError("initial window center has " +
                          std::to_string(problem.initial_window.center.size()) +
                          " dimensions, expected " + std::to_string(n));
    }
    if (problem.target.size() != n) {
        throw ConfigError("target has " + std::to_string(problem.target.size()) +
                          " dimensions, expected " + std::to_string(n));
    }
    if (!problem.weights.empty() && problem.weights.size() != n) {
        throw ConfigError("weights must be empty or match dimensionality");
    }
    if (!problem.initial_window.bias.empty() && problem.initial_window.bias.size() != n) {
        throw ConfigError("initial window bias must be empty or match dimensionality");
    }
    if (!allFinite(problem.initial_window.center) || !allFinite(problem.target) ||
        !allFinite(problem.weights)) {
        throw ConfigError("problem vectors must be finite");
    }
    // A zero radius is accepted here; the generator reports it as a degenerate window.
    if (!std::isfinite(problem.initial_window.radius) || problem.initial_window.radius < 0.0) {
        throw ConfigError("initial window radius must be finite and non-negative");
    }
    if (problem.initial_window.bias_strength < 0.0 || problem.initial_window.bias_strength >= 1.0) {
        throw ConfigError("initial window bias_strength must be in [0, 1)");
    }
}

void validate(const SearchBudget& budget) {
    if (budget.max_iterations == 0) {
        throw ConfigError("max_iterations must be positive");
    }
    if (!(budget.max_wall_clock_seconds > 0.0)) {
        throw ConfigError("max_wall_clock_seconds must be positive");
    }
    if (!(budget.epsilon >= 0.0) || !std::isfinite(budget.epsilon)) {
        throw ConfigError("epsilon must be finite and non-negative");
    }
}

void validate(const SearchConfig& config) {
    if (config.batch_size == 0) {
        throw ConfigError("batch_size must be positive");
    }
    if (!(config.bias_factor >= 1.0) || !std::isfinite(config.bias_factor)) {
        throw ConfigError("bias_factor must be >= 1");
    }
    if (!(config.insight_threshold >= 0.0 && config.insight_threshold <= 1.0)) {
        throw ConfigError("insight_threshold must be in [0, 1]");
    }
    if (config.trajectory_limit == 0) {
        throw ConfigError("trajectory_limit must be positive");
    }
    validate(config.window);
}

} // namespace ember
