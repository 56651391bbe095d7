#pragma once

#include "search/search_state.hpp"
#include "search/convergence_loop.hpp"
#include "search/cancellation.hpp"
#include "generator/candidate_generator.hpp"
#include "insight/insight_cache.hpp"
#include "memory/run_history.hpp"

#include <functional>
#include <memory>

namespace ember {

/// Builds the generator for one run. Lets callers substitute sampling.
using GeneratorFactory =
    std::function<std::unique_ptr<CandidateGenerator>(const ProblemDescriptor&)>;

/// A fresh cache to hand to several engines.
CacheHandle makeSharedCache(const CacheConfig& config = {});

// ─── Search Engine ─────────────────────────────────────────────
// Caller-facing entry point. Owns a handle to the insight cache (its
// own, or one shared with other engines) and a log of finished runs.
// runSearch may be called concurrently from several threads.

class SearchEngine {
public:
    explicit SearchEngine(SearchConfig config = {}, CacheHandle cache = nullptr);

    /// Returns a result for every normal termination (including budget
    /// exhaustion and local optima); throws ConfigError, MetricError,
    /// GeneratorError or CacheError when the run cannot complete.
    SearchResult runSearch(const ProblemDescriptor& problem,
                           const SearchBudget& budget,
                           const CancellationToken* cancel = nullptr);

    /// The cache this engine reads and writes; pass it to another
    /// SearchEngine to share insights between their runs.
    CacheHandle shareCache() const { return cache_; }

    /// Read-only snapshot. Throws ConfigError on a null handle.
    static CacheStats cacheStats(const CacheHandle& handle);

    void setIterationObserver(IterationObserver observer) { observer_ = std::move(observer); }
    void setGeneratorFactory(GeneratorFactory factory) { generator_factory_ = std::move(factory); }

    const SearchConfig& config() const { return config_; }
    const RunHistory& runHistory() const { return history_; }

private:
    SearchConfig config_;
    CacheHandle cache_;
    IterationObserver observer_;
    GeneratorFactory generator_factory_;
    RunHistory history_;
};

} // namespace ember
