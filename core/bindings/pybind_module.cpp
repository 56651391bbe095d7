// PyBind11 bindings for the ember C++ core.
// Exposes problems, budgets, the search engine, and the shared insight cache to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DEMBER_BUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>
#include <pybind11/chrono.h>

#include "errors/errors.hpp"
#include "metric/distance.hpp"
#include "space/window.hpp"
#include "insight/insight.hpp"
#include "insight/insight_cache.hpp"
#include "memory/run_history.hpp"
#include "search/search_state.hpp"
#include "search/search_engine.hpp"
#include "util/logging.hpp"

namespace py = pybind11;

PYBIND11_MODULE(ember_bindings, m) {
    m.doc() = "Ember C++ Core Bindings";

    // ── Errors ──
    auto engine_error = py::register_exception<ember::EngineError>(m, "EngineError");
    py::register_exception<ember::ConfigError>(m, "ConfigError", engine_error.ptr());
    py::register_exception<ember::MetricError>(m, "MetricError", engine_error.ptr());
    py::register_exception<ember::GeneratorError>(m, "GeneratorError", engine_error.ptr());
    py::register_exception<ember::CacheError>(m, "CacheError", engine_error.ptr());

    // ── Enums ──
    py::enum_<ember::TerminationReason>(m, "TerminationReason")
        .value("SUCCESS", ember::TerminationReason::Success)
        .value("ITERATION_BUDGET_EXHAUSTED", ember::TerminationReason::IterationBudgetExhausted)
        .value("WALL_CLOCK_EXHAUSTED", ember::TerminationReason::WallClockExhausted)
        .value("LOCAL_OPTIMUM", ember::TerminationReason::LocalOptimum)
        .value("CANCELLED", ember::TerminationReason::Cancelled);

    py::enum_<ember::WindowState>(m, "WindowState")
        .value("CONTRACTING", ember::WindowState::Contracting)
        .value("EXPANDING", ember::WindowState::Expanding)
        .value("CONVERGED", ember::WindowState::Converged);

    py::enum_<ember::PrecisionLevel>(m, "PrecisionLevel")
        .value("COARSE", ember::PrecisionLevel::Coarse)
        .value("STANDARD", ember::PrecisionLevel::Standard)
        .value("HIGH", ember::PrecisionLevel::High);

    // ── Distance ──
    py::class_<ember::Distance>(m, "Distance")
        .def(py::init<>())
        .def(py::init<double, double, double>())
        .def_readonly("knowledge", &ember::Distance::knowledge)
        .def_readonly("time", &ember::Distance::time)
        .def_readonly("entropy", &ember::Distance::entropy)
        .def_readonly("total", &ember::Distance::total);

    // ── Window ──
    py::class_<ember::Window>(m, "Window")
        .def(py::init<>())
        .def_readwrite("center", &ember::Window::center)
        .def_readwrite("radius", &ember::Window::radius)
        .def_readwrite("bias", &ember::Window::bias)
        .def_readwrite("bias_strength", &ember::Window::bias_strength);

    // ── ProblemDescriptor ──
    py::class_<ember::ProblemDescriptor>(m, "ProblemDescriptor")
        .def(py::init<>())
        .def_readwrite("domain_id", &ember::ProblemDescriptor::domain_id)
        .def_readwrite("dimensions", &ember::ProblemDescriptor::dimensions)
        .def_readwrite("initial_window", &ember::ProblemDescriptor::initial_window)
        .def_readwrite("target", &ember::ProblemDescriptor::target)
        .def_readwrite("weights", &ember::ProblemDescriptor::weights)
        .def_readwrite("payload_encoder", &ember::ProblemDescriptor::payload_encoder);

    // ── SearchBudget ──
    py::class_<ember::SearchBudget>(m, "SearchBudget")
        .def(py::init<>())
        .def_readwrite("max_iterations", &ember::SearchBudget::max_iterations)
        .def_readwrite("max_wall_clock_seconds", &ember::SearchBudget::max_wall_clock_seconds)
        .def_readwrite("epsilon", &ember::SearchBudget::epsilon);

    // ── WindowPolicy ──
    py::class_<ember::WindowPolicy>(m, "WindowPolicy")
        .def(py::init<>())
        .def_readwrite("contraction", &ember::WindowPolicy::contraction)
        .def_readwrite("expansion", &ember::WindowPolicy::expansion)
        .def_readwrite("probe_contraction", &ember::WindowPolicy::probe_contraction)
        .def_readwrite("expand_after", &ember::WindowPolicy::expand_after)
        .def_readwrite("stagnation_limit", &ember::WindowPolicy::stagnation_limit)
        .def_readwrite("step_fraction", &ember::WindowPolicy::step_fraction)
        .def_readwrite("max_bias_strength", &ember::WindowPolicy::max_bias_strength);

    // ── SearchConfig ──
    py::class_<ember::SearchConfig>(m, "SearchConfig")
        .def(py::init<>())
        .def_readwrite("batch_size", &ember::SearchConfig::batch_size)
        .def_readwrite("bias_factor", &ember::SearchConfig::bias_factor)
        .def_readwrite("worker_count", &ember::SearchConfig::worker_count)
        .def_readwrite("insight_threshold", &ember::SearchConfig::insight_threshold)
        .def_readwrite("seed", &ember::SearchConfig::seed)
        .def_readwrite("trajectory_limit", &ember::SearchConfig::trajectory_limit)
        .def_readwrite("transfer_lookups", &ember::SearchConfig::transfer_lookups)
        .def_readwrite("window", &ember::SearchConfig::window);

    // ── SearchResult ──
    py::class_<ember::SearchResult>(m, "SearchResult")
        .def(py::init<>())
        .def_readonly("best_candidate_payload", &ember::SearchResult::best_candidate_payload)
        .def_readonly("best_features", &ember::SearchResult::best_features)
        .def_readonly("final_distance", &ember::SearchResult::final_distance)
        .def_readonly("iterations_used", &ember::SearchResult::iterations_used)
        .def_readonly("termination_reason", &ember::SearchResult::termination_reason)
        .def_readonly("elapsed_seconds", &ember::SearchResult::elapsed_seconds)
        .def_readonly("window_resets", &ember::SearchResult::window_resets)
        .def_readonly("insights_extracted", &ember::SearchResult::insights_extracted)
        .def_readonly("insights_transferred", &ember::SearchResult::insights_transferred)
        .def_readonly("peak_live_candidates", &ember::SearchResult::peak_live_candidates)
        .def_readonly("distance_trajectory", &ember::SearchResult::distance_trajectory);

    // ── IterationReport ──
    py::class_<ember::IterationReport>(m, "IterationReport")
        .def_readonly("domain_id", &ember::IterationReport::domain_id)
        .def_readonly("iteration", &ember::IterationReport::iteration)
        .def_readonly("best", &ember::IterationReport::best)
        .def_readonly("radius", &ember::IterationReport::radius)
        .def_readonly("window_state", &ember::IterationReport::window_state)
        .def_readonly("improved", &ember::IterationReport::improved)
        .def_readonly("candidates_scored", &ember::IterationReport::candidates_scored)
        .def_readonly("insights_accepted", &ember::IterationReport::insights_accepted)
        .def_readonly("insights_transferred", &ember::IterationReport::insights_transferred);

    // ─── Insight Cache ──
    py::class_<ember::CacheConfig>(m, "CacheConfig")
        .def(py::init<>())
        .def_readwrite("capacity", &ember::CacheConfig::capacity)
        .def_readwrite("shard_count", &ember::CacheConfig::shard_count)
        .def_readwrite("approx_scan_limit", &ember::CacheConfig::approx_scan_limit)
        .def_readwrite("approx_min_similarity", &ember::CacheConfig::approx_min_similarity)
        .def_readwrite("contention_retries", &ember::CacheConfig::contention_retries)
        .def_readwrite("lock_timeout", &ember::CacheConfig::lock_timeout);

    py::class_<ember::CacheStats>(m, "CacheStats")
        .def_readonly("entry_count", &ember::CacheStats::entry_count)
        .def_readonly("mean_transfer_efficiency", &ember::CacheStats::mean_transfer_efficiency)
        .def_readonly("evictions", &ember::CacheStats::evictions)
        .def_readonly("inserts", &ember::CacheStats::inserts)
        .def_readonly("merges", &ember::CacheStats::merges)
        .def_readonly("hits", &ember::CacheStats::hits)
        .def_readonly("approximate_hits", &ember::CacheStats::approximate_hits)
        .def_readonly("cross_domain_hits", &ember::CacheStats::cross_domain_hits)
        .def_readonly("misses", &ember::CacheStats::misses)
        .def_readonly("contention_retries", &ember::CacheStats::contention_retries);

    py::class_<ember::InsightCache, std::shared_ptr<ember::InsightCache>>(m, "InsightCache")
        .def(py::init<ember::CacheConfig>(), py::arg("config") = ember::CacheConfig{})
        .def("size", &ember::InsightCache::size)
        .def("capacity", &ember::InsightCache::capacity)
        .def("stats", &ember::InsightCache::stats)
        .def("decay", &ember::InsightCache::decay, py::arg("factor") = 0.9)
        .def("prune", &ember::InsightCache::prune,
             py::arg("min_efficiency") = 0.1, py::arg("min_attempts") = 5)
        .def("clear", &ember::InsightCache::clear);

    // ─── Run History ──
    py::class_<ember::RunRecord>(m, "RunRecord")
        .def_readonly("domain_id", &ember::RunRecord::domain_id)
        .def_readonly("termination_reason", &ember::RunRecord::termination_reason)
        .def_readonly("final_distance", &ember::RunRecord::final_distance)
        .def_readonly("iterations_used", &ember::RunRecord::iterations_used)
        .def_readonly("elapsed_seconds", &ember::RunRecord::elapsed_seconds)
        .def_readonly("insights_transferred", &ember::RunRecord::insights_transferred)
        .def_readonly("success", &ember::RunRecord::success);

    // ─── SearchEngine ──
    py::class_<ember::SearchEngine>(m, "SearchEngine")
        .def(py::init<ember::SearchConfig, ember::CacheHandle>(),
             py::arg("config") = ember::SearchConfig{}, py::arg("cache") = nullptr)
        .def("run_search", [](ember::SearchEngine& self,
                              const ember::ProblemDescriptor& problem,
                              const ember::SearchBudget& budget) {
            py::gil_scoped_release release;
            return self.runSearch(problem, budget);
        }, py::arg("problem"), py::arg("budget"))
        .def("share_cache", &ember::SearchEngine::shareCache)
        .def("set_iteration_observer", &ember::SearchEngine::setIterationObserver)
        .def("config", &ember::SearchEngine::config)
        .def("run_history", [](const ember::SearchEngine& self, size_t limit, bool successes_only) {
            return self.runHistory().retrieve(limit, successes_only);
        }, py::arg("limit") = 0, py::arg("successes_only") = false)
        .def("success_rate", [](const ember::SearchEngine& self) {
            return self.runHistory().successRate();
        })
        .def_static("cache_stats", &ember::SearchEngine::cacheStats);

    m.def("make_shared_cache", &ember::makeSharedCache,
          py::arg("config") = ember::CacheConfig{});

    m.def("epsilon_for", &ember::epsilonFor);

    m.def("set_log_level", [](const std::string& level) {
        ember::log::setLevel(spdlog::level::from_str(level));
    }, py::arg("level"));
}
