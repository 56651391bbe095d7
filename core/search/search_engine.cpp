#include "search/search_engine.hpp"
#include "errors/errors.hpp"
#include "util/logging.hpp"

namespace ember {

CacheHandle makeSharedCache(const CacheConfig& config) {
    return std::make_shared<InsightCache>(config);
}

SearchEngine::SearchEngine(SearchConfig config, CacheHandle cache)
    : config_(std::move(config)),
      cache_(cache ? std::move(cache) : makeSharedCache()) {}

SearchResult SearchEngine::runSearch(const ProblemDescriptor& problem,
                                     const SearchBudget& budget,
                                     const CancellationToken* cancel) {
    std::unique_ptr<CandidateGenerator> generator =
        generator_factory_ ? generator_factory_(problem)
                           : std::make_unique<CandidateGenerator>(problem.payload_encoder);
    if (!generator) {
        throw ConfigError("generator factory returned no generator");
    }

    ConvergenceLoop loop(problem, budget, config_, cache_, *generator);
    loop.setObserver(observer_);
    loop.setCancellation(cancel);

    SearchResult result;
    try {
        result = loop.run();
    } catch (const EngineError& e) {
        EMBER_LOG_ERROR(Search, "Run {} aborted ({}): {}",
                        problem.domain_id, toString(e.kind()), e.what());
        throw;
    }

    RunRecord record;
    record.domain_id = problem.domain_id;
    record.termination_reason = result.termination_reason;
    record.final_distance = result.final_distance.total;
    record.iterations_used = result.iterations_used;
    record.elapsed_seconds = result.elapsed_seconds;
    record.insights_transferred = result.insights_transferred;
    record.success = result.termination_reason == TerminationReason::Success;
    history_.store(record);

    return result;
}

CacheStats SearchEngine::cacheStats(const CacheHandle& handle) {
    if (!handle) {
        throw ConfigError("cache handle is null");
    }
    return handle->stats();
}

} // namespace ember
