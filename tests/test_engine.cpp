#include <gtest/gtest.h>
#include "search/search_engine.hpp"
#include "insight/domain_signature.hpp"
#include "errors/errors.hpp"

#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace ember;

namespace {

ProblemDescriptor planar(const DomainId& domain, FeatureVector center, double radius,
                         FeatureVector target = {0.0, 0.0}) {
    ProblemDescriptor p;
    p.domain_id = domain;
    p.dimensions = center.size();
    p.initial_window.center = std::move(center);
    p.initial_window.radius = radius;
    p.target = std::move(target);
    return p;
}

SearchBudget budgetOf(size_t iterations, double epsilon) {
    SearchBudget b;
    b.max_iterations = iterations;
    b.epsilon = epsilon;
    return b;
}

/// Throws a degenerate-window error from the first `throws` samples.
class FlakyGenerator : public CandidateGenerator {
public:
    explicit FlakyGenerator(int throws) : throws_left_(throws) {}

    Candidate sample(const Window& window, double bias_factor,
                     uint64_t index, std::mt19937_64& rng) const override {
        if (throws_left_.fetch_sub(1) > 0) {
            throw GeneratorError::degenerateWindow(window.radius);
        }
        return CandidateGenerator::sample(window, bias_factor, index, rng);
    }

private:
    mutable std::atomic<int> throws_left_;
};

struct LiveCounter {
    std::atomic<int> live{0};
    std::atomic<int> peak{0};

    std::mutex mutex;
    std::vector<std::weak_ptr<const void>> handed_out;
};

/// Attaches a tracked resource to every candidate.
class TrackingGenerator : public CandidateGenerator {
public:
    explicit TrackingGenerator(std::shared_ptr<LiveCounter> counter)
        : counter_(std::move(counter)) {}

    Candidate sample(const Window& window, double bias_factor,
                     uint64_t index, std::mt19937_64& rng) const override {
        Candidate c = CandidateGenerator::sample(window, bias_factor, index, rng);

        auto counter = counter_;
        int now = ++counter->live;
        int seen = counter->peak.load();
        while (now > seen && !counter->peak.compare_exchange_weak(seen, now)) {}

        c.resource = std::shared_ptr<const void>(new int(0), [counter](const int* p) {
            --counter->live;
            delete p;
        });
        std::lock_guard<std::mutex> lock(counter->mutex);
        counter->handed_out.push_back(c.resource);
        return c;
    }

private:
    std::shared_ptr<LiveCounter> counter_;
};

} // namespace

// ─── End-to-End ────────────────────────────────────────────────

TEST(EngineTest, PlanarProblemConverges) {
    SearchEngine engine;
    auto problem = planar("planar", {10.0, 10.0}, 5.0);

    SearchResult result = engine.runSearch(problem, budgetOf(500, 0.01));
    EXPECT_EQ(result.termination_reason, TerminationReason::Success);
    EXPECT_LE(result.final_distance.total, 0.01);
    EXPECT_LE(result.iterations_used, 500u);
    EXPECT_FALSE(result.best_candidate_payload.empty());
    EXPECT_LE(result.peak_live_candidates, engine.config().batch_size);
}

TEST(EngineTest, ZeroBatchSizeRejectedBeforeFirstIteration) {
    SearchConfig config;
    config.batch_size = 0;
    SearchEngine engine(config);

    int reports = 0;
    engine.setIterationObserver([&](const IterationReport&) { reports++; });

    auto problem = planar("bad-config", {1.0, 1.0}, 1.0);
    EXPECT_THROW(engine.runSearch(problem, budgetOf(10, 0.01)), ConfigError);
    EXPECT_EQ(reports, 0);
    EXPECT_EQ(engine.runHistory().count(), 0u);
}

TEST(EngineTest, CollapsedWindowFailsAfterOneReset) {
    SearchEngine engine;
    int reports = 0;
    engine.setIterationObserver([&](const IterationReport&) { reports++; });

    auto problem = planar("collapsed", {1.0, 1.0}, 0.0);
    try {
        engine.runSearch(problem, budgetOf(10, 0.01));
        FAIL() << "expected GeneratorError";
    } catch (const GeneratorError& e) {
        EXPECT_EQ(e.code(), GeneratorError::Code::DegenerateWindow);
        EXPECT_EQ(e.kind(), ErrorKind::Generator);
    }
    EXPECT_EQ(reports, 0);
}

TEST(EngineTest, RecoversFromOneDegenerateWindow) {
    SearchConfig config;
    config.worker_count = 1;
    SearchEngine engine(config);
    engine.setGeneratorFactory([](const ProblemDescriptor&) {
        return std::make_unique<FlakyGenerator>(1);
    });

    auto problem = planar("flaky", {3.0, -3.0}, 2.0);
    SearchResult result = engine.runSearch(problem, budgetOf(500, 0.01));
    EXPECT_EQ(result.window_resets, 1);
    EXPECT_EQ(result.termination_reason, TerminationReason::Success);
}

TEST(EngineTest, SecondDegenerateWindowAborts) {
    SearchConfig config;
    config.worker_count = 1;
    SearchEngine engine(config);
    engine.setGeneratorFactory([](const ProblemDescriptor&) {
        return std::make_unique<FlakyGenerator>(2);
    });

    auto problem = planar("flaky", {3.0, -3.0}, 2.0);
    EXPECT_THROW(engine.runSearch(problem, budgetOf(500, 0.01)), GeneratorError);
}

TEST(EngineTest, NullGeneratorFromFactoryRejected) {
    SearchEngine engine;
    engine.setGeneratorFactory([](const ProblemDescriptor&) {
        return std::unique_ptr<CandidateGenerator>();
    });
    auto problem = planar("none", {1.0, 1.0}, 1.0);
    EXPECT_THROW(engine.runSearch(problem, budgetOf(10, 0.01)), ConfigError);
}

TEST(EngineTest, CustomPayloadEncoder) {
    SearchEngine engine;
    auto problem = planar("encoded", {2.0, 2.0}, 1.0);
    problem.payload_encoder = [](const FeatureVector& f) {
        return "plan:" + CandidateGenerator::defaultPayload(f);
    };

    SearchResult result = engine.runSearch(problem, budgetOf(300, 0.01));
    EXPECT_EQ(result.best_candidate_payload.rfind("plan:", 0), 0u);
    EXPECT_EQ(result.best_candidate_payload,
              "plan:" + CandidateGenerator::defaultPayload(result.best_features));
}

// ─── Ephemerality ──────────────────────────────────────────────

TEST(EngineTest, CandidatesReleasedBeforeNextIteration) {
    auto counter = std::make_shared<LiveCounter>();
    SearchConfig config;
    config.batch_size = 32;
    SearchEngine engine(config);
    engine.setGeneratorFactory([counter](const ProblemDescriptor&) {
        return std::make_unique<TrackingGenerator>(counter);
    });

    int checked = 0;
    engine.setIterationObserver([&](const IterationReport&) {
        std::lock_guard<std::mutex> lock(counter->mutex);
        for (const auto& w : counter->handed_out) EXPECT_TRUE(w.expired());
        EXPECT_EQ(counter->live.load(), 0);
        checked++;
    });

    auto problem = planar("ephemeral", {4.0, 4.0}, 2.0);
    SearchResult result = engine.runSearch(problem, budgetOf(40, 0.0));
    EXPECT_EQ(checked, static_cast<int>(result.iterations_used));
    EXPECT_EQ(counter->live.load(), 0);
    EXPECT_GE(counter->handed_out.size(), 32u);
}

TEST(EngineTest, LiveCandidatesBoundedByBatch) {
    for (size_t dims : {1u, 8u, 40u}) {
        auto counter = std::make_shared<LiveCounter>();
        SearchConfig config;
        config.batch_size = 24;
        config.worker_count = 4;
        SearchEngine engine(config);
        engine.setGeneratorFactory([counter](const ProblemDescriptor&) {
            return std::make_unique<TrackingGenerator>(counter);
        });

        ProblemDescriptor problem = planar("bounded", FeatureVector(dims, 3.0), 1.0,
                                           FeatureVector(dims, 0.0));
        SearchResult result = engine.runSearch(problem, budgetOf(30, 0.0));

        EXPECT_LE(counter->peak.load(), 24) << "dims=" << dims;
        EXPECT_LE(result.peak_live_candidates, 24u);
        EXPECT_EQ(counter->live.load(), 0);
    }
}

TEST(EngineTest, CacheStaysWithinCapacity) {
    CacheConfig cache_config;
    cache_config.capacity = 16;
    cache_config.shard_count = 4;
    auto cache = makeSharedCache(cache_config);
    SearchEngine engine(SearchConfig{}, cache);

    for (int run = 0; run < 5; run++) {
        auto problem = planar("cap" + std::to_string(run), FeatureVector(6, 2.0 + run), 1.5,
                              FeatureVector(6, 0.0));
        engine.runSearch(problem, budgetOf(40, 0.0));
        EXPECT_LE(cache->size(), cache->capacity());
    }
    EXPECT_LE(SearchEngine::cacheStats(cache).entry_count, 16u);
}

// ─── Cross-Domain Transfer ─────────────────────────────────────

TEST(EngineTest, InsightsTransferAcrossDomains) {
    SearchEngine first;
    SearchEngine second(SearchConfig{}, first.shareCache());
    ASSERT_EQ(first.shareCache(), second.shareCache());
    auto cache = first.shareCache();
    const DomainSignature diagonal = SignatureEncoder::compute({-1.0, -1.0});

    auto source = planar("source", {8.0, 8.0}, 4.0);
    SearchResult a = first.runSearch(source, budgetOf(500, 0.01));
    EXPECT_EQ(a.termination_reason, TerminationReason::Success);
    EXPECT_EQ(a.insights_transferred, 0u);
    ASSERT_GT(cache->size(), 0u);
    EXPECT_EQ(SearchEngine::cacheStats(cache).cross_domain_hits, 0u);
    EXPECT_DOUBLE_EQ(cache->transferEfficiency(diagonal), InsightCache::kNeutralEfficiency);

    // Same shape of problem, shifted
    auto shifted = planar("shifted", {18.0, 8.0}, 1.5, {10.0, 0.0});
    SearchResult b = second.runSearch(shifted, budgetOf(500, 0.01));
    EXPECT_EQ(b.termination_reason, TerminationReason::Success);
    EXPECT_GT(b.insights_transferred, 0u);

    CacheStats stats = SearchEngine::cacheStats(cache);
    EXPECT_GT(stats.cross_domain_hits, 0u);
    // The source run's overall direction moved the shifted run's best
    EXPECT_GT(cache->transferEfficiency(diagonal), InsightCache::kNeutralEfficiency);
}

TEST(EngineTest, WarmCacheNeedsFewerIterations) {
    size_t warm_total = 0;
    size_t cold_total = 0;
    for (uint64_t seed = 1; seed <= 10; seed++) {
        SearchConfig config;
        config.seed = seed;

        SearchEngine source(config);
        SearchResult a = source.runSearch(planar("source", {8.0, 8.0}, 4.0), budgetOf(500, 0.01));
        ASSERT_EQ(a.termination_reason, TerminationReason::Success) << "seed " << seed;

        SearchEngine warm(config, source.shareCache());
        SearchEngine cold(config);
        auto shifted = planar("shifted", {18.0, 8.0}, 1.5, {10.0, 0.0});
        SearchResult w = warm.runSearch(shifted, budgetOf(500, 0.01));
        SearchResult c = cold.runSearch(shifted, budgetOf(500, 0.01));

        ASSERT_EQ(w.termination_reason, TerminationReason::Success) << "seed " << seed;
        ASSERT_EQ(c.termination_reason, TerminationReason::Success) << "seed " << seed;
        EXPECT_GT(w.insights_transferred, 0u);
        EXPECT_EQ(c.insights_transferred, 0u);
        warm_total += w.iterations_used;
        cold_total += c.iterations_used;
    }
    EXPECT_LT(warm_total, cold_total);
}

TEST(EngineTest, OwnInsightsAreNotTransfers) {
    SearchEngine engine;
    auto solo = planar("solo", {8.0, 8.0}, 4.0);
    SearchResult first = engine.runSearch(solo, budgetOf(500, 0.01));
    EXPECT_GT(first.insights_extracted, 0u);
    EXPECT_EQ(first.insights_transferred, 0u);

    CacheStats stats = SearchEngine::cacheStats(engine.shareCache());
    EXPECT_EQ(stats.cross_domain_hits, 0u);
    EXPECT_DOUBLE_EQ(stats.mean_transfer_efficiency, InsightCache::kNeutralEfficiency);

    // A rerun only finds what the same domain wrote, so nothing changes
    SearchResult again = engine.runSearch(solo, budgetOf(500, 0.01));
    EXPECT_EQ(again.insights_transferred, 0u);
    EXPECT_EQ(again.iterations_used, first.iterations_used);
    EXPECT_EQ(again.best_features, first.best_features);
}

TEST(EngineTest, SeparateEnginesOwnSeparateCaches) {
    SearchEngine a;
    SearchEngine b;
    ASSERT_TRUE(a.shareCache() != nullptr);
    EXPECT_NE(a.shareCache(), b.shareCache());
}

TEST(EngineTest, ConcurrentRunsShareOneCache) {
    auto cache = makeSharedCache();
    std::vector<SearchResult> results(4);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([&results, cache, t]() {
            SearchConfig config;
            config.worker_count = 2;
            config.seed = 100 + t;
            SearchEngine engine(config, cache);
            auto problem = planar("worker" + std::to_string(t),
                                  {5.0 + t, -5.0}, 3.0, {static_cast<double>(t), 0.0});
            results[t] = engine.runSearch(problem, budgetOf(500, 0.01));
        });
    }
    for (auto& th : threads) th.join();

    for (const auto& r : results) {
        EXPECT_EQ(r.termination_reason, TerminationReason::Success);
        EXPECT_LE(r.final_distance.total, 0.01);
    }
    CacheStats stats = SearchEngine::cacheStats(cache);
    EXPECT_GT(stats.inserts, 0u);
    EXPECT_LE(stats.entry_count, cache->capacity());
}

TEST(EngineTest, SameSeedSameResult) {
    auto problem = planar("repeat", {6.0, -2.0}, 2.0);
    SearchEngine a;
    SearchEngine b;
    SearchResult ra = a.runSearch(problem, budgetOf(50, 0.0));
    SearchResult rb = b.runSearch(problem, budgetOf(50, 0.0));
    EXPECT_EQ(ra.best_features, rb.best_features);
    EXPECT_EQ(ra.iterations_used, rb.iterations_used);
}

// ─── Cache Stats / History ─────────────────────────────────────

TEST(EngineTest, CacheStatsRequiresHandle) {
    EXPECT_THROW(SearchEngine::cacheStats(nullptr), ConfigError);

    SearchEngine engine;
    CacheStats empty = SearchEngine::cacheStats(engine.shareCache());
    EXPECT_EQ(empty.entry_count, 0u);
    EXPECT_DOUBLE_EQ(empty.mean_transfer_efficiency, 0.5);

    engine.runSearch(planar("stats", {3.0, 3.0}, 1.0), budgetOf(100, 0.01));
    CacheStats after = SearchEngine::cacheStats(engine.shareCache());
    EXPECT_GT(after.entry_count, 0u);
    EXPECT_GE(after.mean_transfer_efficiency, 0.0);
    EXPECT_LE(after.mean_transfer_efficiency, 1.0);
}

TEST(EngineTest, RunHistoryRecordsCompletedRuns) {
    SearchEngine engine;
    engine.runSearch(planar("h1", {2.0, 2.0}, 1.0), budgetOf(500, 0.01));
    engine.runSearch(planar("h2", {50.0, 50.0}, 0.5), budgetOf(3, 0.0));

    const RunHistory& history = engine.runHistory();
    ASSERT_EQ(history.count(), 2u);
    auto records = history.retrieve();
    EXPECT_EQ(records[0].domain_id, "h1");
    EXPECT_TRUE(records[0].success);
    EXPECT_EQ(records[1].termination_reason, TerminationReason::IterationBudgetExhausted);
    EXPECT_EQ(records[1].iterations_used, 3u);
    EXPECT_DOUBLE_EQ(history.successRate(), 0.5);
}
