#include "search/convergence_loop.hpp"
#include "insight/domain_signature.hpp"
#include "metric/axis_components.hpp"
#include "errors/errors.hpp"
#include "util/logging.hpp"
#include "util/random.hpp"

#include <algorithm>
#include <deque>
#include <exception>
#include <future>
#include <optional>
#include <thread>

namespace ember {

ConvergenceLoop::ConvergenceLoop(const ProblemDescriptor& problem,
                                 const SearchBudget& budget,
                                 const SearchConfig& config,
                                 CacheHandle cache,
                                 const CandidateGenerator& generator)
    : problem_(problem),
      budget_(budget),
      config_(config),
      cache_(std::move(cache)),
      generator_(generator),
      metric_(problem.metric ? problem.metric : makeDefaultDistanceMetric()) {}

Distance ConvergenceLoop::measure(const FeatureVector& features) const {
    return metric_->measure(features, problem_.target, problem_.weights);
}

size_t ConvergenceLoop::workerCount(size_t batch_size) const {
    size_t workers = config_.worker_count;
    if (workers == 0) {
        workers = std::max<size_t>(1, std::thread::hardware_concurrency());
    }
    return std::max<size_t>(1, std::min(workers, batch_size));
}

std::vector<ScoredCandidate> ConvergenceLoop::scoreBatch(CandidateBatch& batch) const {
    auto drain = [this, &batch]() {
        std::vector<ScoredCandidate> local;
        while (auto candidate = batch.next()) {
            Distance d = measure(candidate->features);
            local.push_back({std::move(*candidate), d});
        }
        return local;
    };

    std::vector<ScoredCandidate> scored;
    scored.reserve(batch.size());

    const size_t workers = workerCount(batch.size());
    if (workers == 1) {
        scored = drain();
    } else {
        std::vector<std::future<std::vector<ScoredCandidate>>> futures;
        futures.reserve(workers);
        for (size_t w = 0; w < workers; w++) {
            futures.push_back(std::async(std::launch::async, drain));
        }

        // Join every worker before surfacing the first failure
        std::exception_ptr failure;
        for (auto& f : futures) {
            try {
                auto part = f.get();
                for (auto& sc : part) scored.push_back(std::move(sc));
            } catch (...) {
                if (!failure) failure = std::current_exception();
            }
        }
        if (failure) std::rethrow_exception(failure);
    }

    std::sort(scored.begin(), scored.end(),
        [](const ScoredCandidate& a, const ScoredCandidate& b) {
            return a.candidate.index < b.candidate.index;
        });
    return scored;
}

std::vector<WeightedInsight> ConvergenceLoop::transferFromCache(
    const std::vector<Insight>& accepted,
    const std::vector<DomainSignature>& followed,
    std::vector<DomainSignature>& applied) const {
    std::vector<WeightedInsight> transferred;
    if (!cache_ || config_.transfer_lookups == 0 || accepted.empty()) {
        return transferred;
    }

    // Strongest first, one lookup per distinct signature
    std::vector<const Insight*> order;
    order.reserve(accepted.size());
    for (const auto& ins : accepted) order.push_back(&ins);
    std::stable_sort(order.begin(), order.end(),
        [](const Insight* a, const Insight* b) { return a->confidence > b->confidence; });

    std::vector<DomainSignature> queried;
    for (const Insight* ins : order) {
        if (queried.size() >= config_.transfer_lookups) break;
        if (std::find(queried.begin(), queried.end(), ins->signature) != queried.end()) continue;
        queried.push_back(ins->signature);

        auto found = cache_->lookup(ins->signature, problem_.domain_id);
        if (!found || found->direction.size() != problem_.dimensions) continue;
        if (found->source_domain == problem_.domain_id) continue;
        if (std::find(followed.begin(), followed.end(), found->signature) != followed.end()) continue;
        if (std::find(applied.begin(), applied.end(), found->signature) != applied.end()) continue;

        WeightedInsight wi;
        wi.efficiency = cache_->transferEfficiency(found->signature);
        wi.transferred = true;
        applied.push_back(found->signature);
        wi.insight = std::move(*found);
        transferred.push_back(std::move(wi));
    }
    return transferred;
}

std::vector<WeightedInsight> ConvergenceLoop::recallFromCache(
    const std::vector<DomainSignature>& tried) const {
    std::vector<WeightedInsight> recalled;
    if (!cache_ || config_.transfer_lookups == 0) return recalled;

    auto found = cache_->strongest(static_cast<uint32_t>(problem_.dimensions),
                                   config_.transfer_lookups, problem_.domain_id, tried);
    recalled.reserve(found.size());
    for (auto& ins : found) {
        WeightedInsight wi;
        wi.efficiency = cache_->transferEfficiency(ins.signature);
        wi.transferred = true;
        wi.insight = std::move(ins);
        recalled.push_back(std::move(wi));
    }
    return recalled;
}

bool ConvergenceLoop::followTransferred(const FeatureDelta& direction, double base_step,
                                        size_t first_index, InsightExtractor& extractor,
                                        std::vector<Insight>& learned) const {
    if (direction.size() != problem_.dimensions) return false;

    const FeatureVector origin = extractor.bestFeatures();
    const double before = extractor.bestDistance().total;
    double step = base_step;
    for (size_t k = 0; k < kTransferSteps; k++, step *= 2.0) {
        Candidate point(first_index + k, origin);
        addScaled(point.features, direction, step);
        if (!allFinite(point.features)) break;
        point.payload = problem_.payload_encoder ? problem_.payload_encoder(point.features)
                                                 : CandidateGenerator::defaultPayload(point.features);

        const double reached = extractor.bestDistance().total;
        auto insight = extractor.extract(point, measure(point.features));
        if (insight) learned.push_back(std::move(*insight));
        if (!(extractor.bestDistance().total < reached)) break;
    }
    return extractor.bestDistance().total < before;
}

Insight ConvergenceLoop::runInsight(const FeatureVector& start, const Distance& start_distance,
                                    const InsightExtractor& extractor) const {
    Insight overall;
    const double gained = start_distance.total - extractor.bestDistance().total;
    if (!(gained > 0.0) || !(start_distance.total > 0.0)) return overall;

    FeatureDelta direction = difference(extractor.bestFeatures(), start);
    if (!normalize(direction)) return overall;

    overall.signature = SignatureEncoder::compute(direction);
    overall.direction = std::move(direction);
    overall.confidence = std::min(1.0, gained / start_distance.total);
    overall.source_domain = problem_.domain_id;
    overall.spans_run = true;
    return overall;
}

SearchResult ConvergenceLoop::run() {
    validate(problem_);
    validate(budget_);
    validate(config_);

    BudgetManager budget(budget_.max_wall_clock_seconds, budget_.max_iterations);
    budget.start();

    const uint64_t run_seed = mixSeed(config_.seed, stableHash(problem_.domain_id));

    InsightExtractor extractor(problem_.domain_id,
                               ExtractorConfig{config_.insight_threshold, 0.5});
    WindowSelector selector(problem_.initial_window, config_.window);
    Window window = problem_.initial_window;

    // The initial center is a legitimate point; it anchors the running best
    extractor.seed(window.center, measure(window.center),
                   problem_.payload_encoder ? problem_.payload_encoder(window.center)
                                            : CandidateGenerator::defaultPayload(window.center));

    const Distance start_distance = extractor.bestDistance();

    EMBER_LOG_INFO(Search, "Run {}: start dims={} radius={} d_total={} batch={} eps={}",
                   problem_.domain_id, problem_.dimensions, window.radius,
                   start_distance.total, config_.batch_size, budget_.epsilon);

    SearchResult result;
    std::deque<double> trajectory;
    std::vector<DomainSignature> pending_reuse;
    std::vector<DomainSignature> recalled;  // each cross-domain insight is followed once per run
    std::optional<size_t> recall_iteration;
    const int recall_after = std::max(1, config_.window.expand_after);
    bool reset_used = false;
    size_t iteration = 0;

    TerminationReason reason = TerminationReason::IterationBudgetExhausted;
    while (true) {
        if (extractor.bestDistance().total <= budget_.epsilon) {
            reason = TerminationReason::Success;
            break;
        }
        if (cancel_ && cancel_->cancelled()) {
            reason = TerminationReason::Cancelled;
            break;
        }
        if (budget.isIterationExhausted()) {
            reason = TerminationReason::IterationBudgetExhausted;
            break;
        }
        if (budget.isTimeExhausted()) {
            reason = TerminationReason::WallClockExhausted;
            break;
        }
        if (selector.state() == WindowState::Converged) {
            reason = TerminationReason::LocalOptimum;
            break;
        }

        const double best_before = extractor.bestDistance().total;
        std::vector<Insight> accepted;
        std::vector<WeightedInsight> steering;
        size_t recalled_count = 0;
        size_t scored_count = 0;

        if (cache_ && recall_iteration != iteration &&
            (iteration == 0 || selector.stagnation() == recall_after)) {
            recall_iteration = iteration;
            for (auto& wi : recallFromCache(recalled)) {
                recalled.push_back(wi.insight.signature);
                const bool moved = followTransferred(
                    wi.insight.direction, window.radius,
                    config_.batch_size + recalled_count * kTransferSteps, extractor, accepted);
                recalled_count++;
                cache_->recordReuse(wi.insight.signature, moved);
                if (moved) {
                    window = selector.steer(window, wi, extractor.bestFeatures());
                    steering.push_back(std::move(wi));
                }
            }
            if (recalled_count > 0) {
                EMBER_LOG_DEBUG(Search, "Run {}: recalled {} insights at iteration {}, {} moved the best to {:.6g}",
                                problem_.domain_id, recalled_count, iteration,
                                steering.size(), extractor.bestDistance().total);
            }
        }

        {
            std::vector<ScoredCandidate> scored;
            try {
                CandidateBatch batch = generator_.generateBatch(
                    window, config_.batch_size, config_.bias_factor, run_seed, iteration);
                scored = scoreBatch(batch);
            } catch (const GeneratorError& e) {
                if (!e.allowsContinuation() || reset_used) throw;
                reset_used = true;
                result.window_resets++;
                EMBER_LOG_WARN(Search, "Run {}: {} at iteration {}, resetting window",
                               problem_.domain_id, e.what(), iteration);
                window = selector.reset();
                continue;
            }

            scored_count = scored.size();
            result.peak_live_candidates = std::max(result.peak_live_candidates, scored_count);

            for (const auto& sc : scored) {
                auto insight = extractor.extract(sc.candidate, sc.distance);
                if (insight) accepted.push_back(std::move(*insight));
            }
        } // batch and every candidate released here

        const bool improved = extractor.bestDistance().total < best_before;

        // Outcome of last iteration's transferred insights
        if (cache_) {
            for (const auto& sig : pending_reuse) {
                cache_->recordReuse(sig, improved);
            }
        }
        pending_reuse.clear();

        std::vector<WeightedInsight> weighted;
        weighted.reserve(accepted.size() + steering.size() + config_.transfer_lookups);
        for (const auto& ins : accepted) {
            weighted.push_back({ins, InsightCache::kNeutralEfficiency, false});
        }
        for (auto& wi : steering) weighted.push_back(std::move(wi));
        auto transferred = transferFromCache(accepted, recalled, pending_reuse);
        const size_t transferred_count = transferred.size() + recalled_count;
        for (auto& wi : transferred) weighted.push_back(std::move(wi));

        if (cache_) {
            cache_->insertBatch(accepted);
        }

        window = selector.nextWindow(window, weighted, improved, extractor.bestFeatures());

        iteration++;
        budget.recordIteration();
        result.insights_extracted += accepted.size();
        result.insights_transferred += transferred_count;

        trajectory.push_back(extractor.bestDistance().total);
        if (trajectory.size() > config_.trajectory_limit) trajectory.pop_front();

        EMBER_LOG_DEBUG(Search, "Run {}: iter {} best={:.6g} radius={:.4g} state={} insights={} transferred={}",
                        problem_.domain_id, iteration, extractor.bestDistance().total,
                        window.radius, toString(selector.state()),
                        accepted.size(), transferred_count);

        if (observer_) {
            IterationReport report;
            report.domain_id = problem_.domain_id;
            report.iteration = iteration;
            report.best = extractor.bestDistance();
            report.radius = window.radius;
            report.window_state = selector.state();
            report.improved = improved;
            report.candidates_scored = scored_count;
            report.insights_accepted = accepted.size();
            report.insights_transferred = transferred_count;
            observer_(report);
        }
    }

    if (cache_) {
        Insight overall = runInsight(problem_.initial_window.center, start_distance, extractor);
        if (!overall.signature.empty()) cache_->insert(overall);
    }

    result.termination_reason = reason;
    result.iterations_used = iteration;
    result.best_features = extractor.bestFeatures();
    result.best_candidate_payload = extractor.bestPayload();
    result.final_distance = extractor.bestDistance();
    result.elapsed_seconds = budget.elapsedSeconds();
    result.distance_trajectory.assign(trajectory.begin(), trajectory.end());

    EMBER_LOG_INFO(Search, "Run {}: {} after {} iterations, d_total={} ({:.3f}s)",
                   problem_.domain_id, toString(reason), iteration,
                   result.final_distance.total, result.elapsed_seconds);
    return result;
}

} // namespace ember
