#pragma once

#include "search/search_state.hpp"
#include "search/budget_manager.hpp"
#include "search/cancellation.hpp"
#include "search/window_selector.hpp"
#include "generator/candidate_generator.hpp"
#include "insight/insight_cache.hpp"
#include "insight/insight_extractor.hpp"
#include "metric/distance.hpp"

#include <functional>
#include <memory>
#include <vector>

namespace ember {

using IterationObserver = std::function<void(const IterationReport&)>;

// ─── Convergence Loop ──────────────────────────────────────────
// Drives one search run:
//   [recall] → window → generate → score (fan-out) → extract → dispose
//          → transfer lookups → commit insights → next window
//
// Recall happens before the first iteration and once per stagnation
// episode: the strongest insights other domains left in the cache are
// followed from the running best with a doubling line search, and the
// window is steered along any that improved it.
//
// Iterations are strictly sequential, and a batch is always disposed
// before the next window is requested, so live memory stays at one
// batch plus the shared cache. An iteration's insights are committed
// as one batch, only after the whole batch scored without error. A run
// that terminates normally also commits its overall displacement.

class ConvergenceLoop {
public:
    ConvergenceLoop(const ProblemDescriptor& problem,
                    const SearchBudget& budget,
                    const SearchConfig& config,
                    CacheHandle cache,
                    const CandidateGenerator& generator);

    void setObserver(IterationObserver observer) { observer_ = std::move(observer); }
    void setCancellation(const CancellationToken* token) { cancel_ = token; }

    /// Run to termination. Throws ConfigError before the first iteration,
    /// MetricError / GeneratorError / CacheError if the run is aborted.
    SearchResult run();

private:
    const ProblemDescriptor& problem_;
    const SearchBudget& budget_;
    const SearchConfig& config_;
    CacheHandle cache_;
    const CandidateGenerator& generator_;
    std::shared_ptr<const DistanceMetric> metric_;
    IterationObserver observer_;
    const CancellationToken* cancel_ = nullptr;

    /// Drain the batch across the worker pool and score every candidate.
    /// Returned in batch order regardless of which worker scored what.
    std::vector<ScoredCandidate> scoreBatch(CandidateBatch& batch) const;

    Distance measure(const FeatureVector& features) const;

    size_t workerCount(size_t batch_size) const;

    /// Pull up to transfer_lookups cached insights matching this
    /// iteration's strongest signatures. Entries this domain wrote
    /// itself are not transfers, and entries already followed by a
    /// recall are not reused; both are skipped.
    std::vector<WeightedInsight> transferFromCache(const std::vector<Insight>& accepted,
                                                   const std::vector<DomainSignature>& followed,
                                                   std::vector<DomainSignature>& applied) const;

    /// Strongest cross-domain insights not yet tried by this run.
    std::vector<WeightedInsight> recallFromCache(const std::vector<DomainSignature>& tried) const;

    /// Step from the running best along `direction` at base_step, 2·base_step, ...
    /// until a step fails to improve. Every point goes through the extractor;
    /// insights it yields are appended to `learned`. True if the best moved.
    bool followTransferred(const FeatureDelta& direction, double base_step,
                           size_t first_index, InsightExtractor& extractor,
                           std::vector<Insight>& learned) const;

    /// Whole-run displacement as a single insight; empty signature if the
    /// run never moved off its start.
    Insight runInsight(const FeatureVector& start, const Distance& start_distance,
                       const InsightExtractor& extractor) const;

    static constexpr size_t kTransferSteps = 6;
};

} // namespace ember
