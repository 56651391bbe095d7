#pragma once

#include "insight/insight.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace ember {

struct CacheConfig {
    size_t capacity = 100000;          // rounded down to a multiple of shard_count
    size_t shard_count = 16;
    size_t approx_scan_limit = 4096;   // entries examined by a nearest-signature lookup
    double approx_min_similarity = 0.6;
    int contention_retries = 3;
    std::chrono::milliseconds lock_timeout{50};
};

/// Throws ConfigError on a zero capacity, zero shards, or bad thresholds.
void validate(const CacheConfig& config);

struct CacheStats {
    size_t entry_count = 0;
    double mean_transfer_efficiency = 0.5;
    uint64_t evictions = 0;
    uint64_t inserts = 0;
    uint64_t merges = 0;
    uint64_t hits = 0;
    uint64_t approximate_hits = 0;
    uint64_t cross_domain_hits = 0;
    uint64_t misses = 0;
    uint64_t contention_retries = 0;
};

// ─── Insight Cache ─────────────────────────────────────────────
// Cross-domain store of insights keyed by signature. Shared by
// concurrent search runs; each shard has its own reader/writer lock,
// so a writer only ever waits out one merge on that shard.
//
// Capacity-bounded with LRU eviction by last-used logical timestamp.
// Lookups refresh the timestamp without taking the exclusive lock.

class InsightCache {
public:
    explicit InsightCache(CacheConfig config = {});

    InsightCache(const InsightCache&) = delete;
    InsightCache& operator=(const InsightCache&) = delete;

    /// Insert, or merge into the entry with the same signature.
    /// Returns false (and stores nothing) for a malformed insight.
    bool insert(const Insight& insight);

    /// Commit a whole batch or nothing: every shard the batch touches is
    /// locked (in index order) before the first merge. Malformed insights
    /// are skipped. Returns the number stored or merged; throws CacheError
    /// with nothing committed if a shard lock cannot be taken.
    size_t insertBatch(const std::vector<Insight>& insights);

    /// Exact signature first, then the nearest signature of equal
    /// dimensionality within the scan limit.
    std::optional<Insight> lookup(const DomainSignature& signature,
                                  const DomainId& domain) const;

    /// Up to `limit` entries of the given dimensionality learned by other
    /// domains, strongest first: whole-run displacements, then by
    /// confidence × efficiency. Signatures in `skip` are passed over.
    std::vector<Insight> strongest(uint32_t dimensions, size_t limit,
                                   const DomainId& requesting_domain,
                                   const std::vector<DomainSignature>& skip = {}) const;

    /// successes / attempts for the entry; 0.5 before any reuse is recorded.
    double transferEfficiency(const DomainSignature& signature) const;

    /// Record whether applying the insight was followed by an improvement.
    void recordReuse(const DomainSignature& signature, bool improved);

    CacheStats stats() const;

    size_t size() const;
    size_t capacity() const { return per_shard_capacity_ * shards_.size(); }
    const CacheConfig& config() const { return config_; }

    /// Scale every confidence by factor; drop entries that become negligible.
    size_t decay(double factor = 0.9);

    /// Drop entries that failed to transfer: at least min_attempts reuses
    /// and efficiency below min_efficiency.
    size_t prune(double min_efficiency = 0.1, uint64_t min_attempts = 5);

    void clear();

    static constexpr double kNeutralEfficiency = 0.5;

private:
    using Mutex = std::shared_timed_mutex;

    struct Entry {
        Insight insight;
        uint64_t reuse_attempts = 0;
        uint64_t reuse_successes = 0;
        mutable std::atomic<uint64_t> last_used{0};

        double efficiency() const {
            if (reuse_attempts == 0) return kNeutralEfficiency;
            return static_cast<double>(reuse_successes) / reuse_attempts;
        }
    };

    struct Shard {
        mutable Mutex mutex;
        std::unordered_map<DomainSignature, Entry, DomainSignatureHash> entries;
    };

    CacheConfig config_;
    size_t per_shard_capacity_ = 1;
    std::vector<std::unique_ptr<Shard>> shards_;

    mutable std::atomic<uint64_t> clock_{0};
    std::atomic<uint64_t> evictions_{0};
    std::atomic<uint64_t> inserts_{0};
    std::atomic<uint64_t> merges_{0};
    mutable std::atomic<uint64_t> hits_{0};
    mutable std::atomic<uint64_t> approximate_hits_{0};
    mutable std::atomic<uint64_t> cross_domain_hits_{0};
    mutable std::atomic<uint64_t> misses_{0};
    mutable std::atomic<uint64_t> contention_retries_{0};

    Shard& shardFor(const DomainSignature& signature) const;
    size_t shardIndex(const DomainSignature& signature) const;

    std::unique_lock<Mutex> lockExclusive(Shard& shard) const;
    std::shared_lock<Mutex> lockShared(const Shard& shard) const;

    uint64_t tick() const { return ++clock_; }

    static bool wellFormed(const Insight& insight);

    /// Caller holds the shard's exclusive lock.
    void commitLocked(Shard& shard, const Insight& insight);

    /// Caller holds the shard's exclusive lock.
    void evictLeastRecentlyUsed(Shard& shard);

    static void merge(Insight& into, const Insight& incoming);
};

/// Shared ownership of one cache across engines and runs.
using CacheHandle = std::shared_ptr<InsightCache>;

} // namespace ember
