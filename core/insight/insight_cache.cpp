#include "insight/insight_cache.hpp"
#include "insight/domain_signature.hpp"
#include "errors/errors.hpp"
#include "util/logging.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace ember {

void validate(const CacheConfig& config) {
    if (config.capacity == 0) {
        throw ConfigError("cache capacity must be positive");
    }
    if (config.shard_count == 0) {
        throw ConfigError("cache shard_count must be positive");
    }
    if (config.approx_min_similarity < 0.0 || config.approx_min_similarity > 1.0) {
        throw ConfigError("approx_min_similarity must be in [0, 1]");
    }
    if (config.contention_retries < 1) {
        throw ConfigError("contention_retries must be at least 1");
    }
}

InsightCache::InsightCache(CacheConfig config)
    : config_(config) {
    validate(config_);
    size_t shard_count = std::min(config_.shard_count, config_.capacity);
    per_shard_capacity_ = config_.capacity / shard_count;
    shards_.reserve(shard_count);
    for (size_t i = 0; i < shard_count; i++) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

// ─── Locking ───────────────────────────────────────────────────

std::unique_lock<InsightCache::Mutex> InsightCache::lockExclusive(Shard& shard) const {
    std::unique_lock<Mutex> lock(shard.mutex, std::defer_lock);
    for (int attempt = 0; attempt < config_.contention_retries; attempt++) {
        if (lock.try_lock_for(config_.lock_timeout)) return lock;
        contention_retries_++;
    }
    EMBER_LOG_WARN(Cache, "Exclusive lock contention after {} attempts", config_.contention_retries);
    throw CacheError("write contention exceeded retry bound");
}

std::shared_lock<InsightCache::Mutex> InsightCache::lockShared(const Shard& shard) const {
    std::shared_lock<Mutex> lock(shard.mutex, std::defer_lock);
    for (int attempt = 0; attempt < config_.contention_retries; attempt++) {
        if (lock.try_lock_for(config_.lock_timeout)) return lock;
        contention_retries_++;
    }
    EMBER_LOG_WARN(Cache, "Shared lock contention after {} attempts", config_.contention_retries);
    throw CacheError("read contention exceeded retry bound");
}

size_t InsightCache::shardIndex(const DomainSignature& signature) const {
    return DomainSignatureHash{}(signature) % shards_.size();
}

InsightCache::Shard& InsightCache::shardFor(const DomainSignature& signature) const {
    return *shards_[shardIndex(signature)];
}

// ─── Insert / Merge ────────────────────────────────────────────

bool InsightCache::wellFormed(const Insight& insight) {
    return !insight.signature.empty() &&
           insight.direction.size() == insight.signature.dimensions &&
           allFinite(insight.direction) &&
           std::isfinite(insight.confidence) &&
           insight.confidence >= 0.0 && insight.confidence <= 1.0;
}

bool InsightCache::insert(const Insight& insight) {
    if (!wellFormed(insight)) {
        EMBER_LOG_WARN(Cache, "Rejected malformed insight {}", insight.signature.toString());
        return false;
    }

    Shard& shard = shardFor(insight.signature);
    auto lock = lockExclusive(shard);
    commitLocked(shard, insight);
    return true;
}

size_t InsightCache::insertBatch(const std::vector<Insight>& insights) {
    std::vector<const Insight*> valid;
    std::vector<size_t> touched;
    valid.reserve(insights.size());
    for (const auto& ins : insights) {
        if (!wellFormed(ins)) {
            EMBER_LOG_WARN(Cache, "Rejected malformed insight {}", ins.signature.toString());
            continue;
        }
        valid.push_back(&ins);
        touched.push_back(shardIndex(ins.signature));
    }
    if (valid.empty()) return 0;

    std::sort(touched.begin(), touched.end());
    touched.erase(std::unique(touched.begin(), touched.end()), touched.end());

    // Index order keeps two concurrent batches from waiting on each other
    std::vector<std::unique_lock<Mutex>> locks;
    locks.reserve(touched.size());
    for (size_t idx : touched) {
        locks.push_back(lockExclusive(*shards_[idx]));
    }

    for (const Insight* ins : valid) {
        commitLocked(shardFor(ins->signature), *ins);
    }
    return valid.size();
}

void InsightCache::commitLocked(Shard& shard, const Insight& insight) {
    auto it = shard.entries.find(insight.signature);
    if (it != shard.entries.end()) {
        merge(it->second.insight, insight);
        it->second.last_used.store(tick());
        merges_++;
        return;
    }

    if (shard.entries.size() >= per_shard_capacity_) {
        evictLeastRecentlyUsed(shard);
    }

    auto [slot, inserted] = shard.entries.try_emplace(insight.signature);
    (void)inserted;
    slot->second.insight = insight;
    slot->second.last_used.store(tick());
    inserts_++;
}

void InsightCache::merge(Insight& into, const Insight& incoming) {
    const double w1 = into.confidence;
    const double w2 = incoming.confidence;
    if (w1 + w2 > 0.0) {
        FeatureDelta blended(into.direction.size(), 0.0);
        for (size_t i = 0; i < blended.size(); i++) {
            blended[i] = (w1 * into.direction[i] + w2 * incoming.direction[i]) / (w1 + w2);
        }
        // Opposing directions cancel; keep the established one.
        if (normalize(blended)) {
            into.direction = std::move(blended);
        }
    }
    into.confidence = std::min(1.0, 1.0 - (1.0 - w1) * (1.0 - w2));
    into.transfer_count += incoming.transfer_count;
    into.attractive = into.attractive || incoming.attractive;
    into.spans_run = into.spans_run || incoming.spans_run;
}

void InsightCache::evictLeastRecentlyUsed(Shard& shard) {
    auto victim = shard.entries.end();
    uint64_t oldest = std::numeric_limits<uint64_t>::max();
    for (auto it = shard.entries.begin(); it != shard.entries.end(); ++it) {
        uint64_t used = it->second.last_used.load();
        if (used < oldest) {
            oldest = used;
            victim = it;
        }
    }
    if (victim != shard.entries.end()) {
        shard.entries.erase(victim);
        evictions_++;
    }
}

// ─── Lookup ────────────────────────────────────────────────────

std::optional<Insight> InsightCache::lookup(const DomainSignature& signature,
                                            const DomainId& domain) const {
    {
        const Shard& shard = shardFor(signature);
        auto lock = lockShared(shard);
        auto it = shard.entries.find(signature);
        if (it != shard.entries.end()) {
            it->second.last_used.store(tick());
            hits_++;
            if (it->second.insight.source_domain != domain) cross_domain_hits_++;
            return it->second.insight;
        }
    }

    // Bounded nearest-signature scan, starting at the key's own shard
    std::optional<DomainSignature> best_sig;
    size_t best_shard = 0;
    uint32_t best_dist = std::numeric_limits<uint32_t>::max();
    double best_conf = -1.0;
    size_t scanned = 0;

    const size_t start = shardIndex(signature);
    for (size_t k = 0; k < shards_.size() && scanned < config_.approx_scan_limit; k++) {
        size_t idx = (start + k) % shards_.size();
        const Shard& shard = *shards_[idx];
        auto lock = lockShared(shard);
        for (const auto& [sig, entry] : shard.entries) {
            if (scanned++ >= config_.approx_scan_limit) break;
            if (sig.dimensions != signature.dimensions) continue;
            if (SignatureEncoder::similarity(sig, signature) < config_.approx_min_similarity) continue;

            uint32_t d = SignatureEncoder::distance(sig, signature);
            double conf = entry.insight.confidence;
            if (d < best_dist || (d == best_dist && conf > best_conf)) {
                best_dist = d;
                best_conf = conf;
                best_sig = sig;
                best_shard = idx;
            }
        }
    }

    if (best_sig) {
        const Shard& shard = *shards_[best_shard];
        auto lock = lockShared(shard);
        auto it = shard.entries.find(*best_sig);
        // May have been evicted between the scan and now
        if (it != shard.entries.end()) {
            it->second.last_used.store(tick());
            approximate_hits_++;
            if (it->second.insight.source_domain != domain) cross_domain_hits_++;
            return it->second.insight;
        }
    }

    misses_++;
    return std::nullopt;
}

std::vector<Insight> InsightCache::strongest(uint32_t dimensions, size_t limit,
                                             const DomainId& requesting_domain,
                                             const std::vector<DomainSignature>& skip) const {
    if (limit == 0) return {};

    struct Ranked {
        Insight insight;
        double score;
    };
    std::vector<Ranked> ranked;

    size_t scanned = 0;
    for (size_t idx = 0; idx < shards_.size() && scanned < config_.approx_scan_limit; idx++) {
        const Shard& shard = *shards_[idx];
        auto lock = lockShared(shard);
        for (const auto& [sig, entry] : shard.entries) {
            if (scanned++ >= config_.approx_scan_limit) break;
            if (sig.dimensions != dimensions) continue;
            if (entry.insight.source_domain == requesting_domain) continue;
            if (!entry.insight.attractive) continue;
            if (std::find(skip.begin(), skip.end(), sig) != skip.end()) continue;
            ranked.push_back({entry.insight, entry.insight.confidence * entry.efficiency()});
        }
    }

    std::sort(ranked.begin(), ranked.end(), [](const Ranked& a, const Ranked& b) {
        if (a.insight.spans_run != b.insight.spans_run) return a.insight.spans_run;
        if (a.score != b.score) return a.score > b.score;
        if (a.insight.transfer_count != b.insight.transfer_count) {
            return a.insight.transfer_count > b.insight.transfer_count;
        }
        return a.insight.signature.bins < b.insight.signature.bins;
    });
    if (ranked.size() > limit) ranked.resize(limit);

    std::vector<Insight> out;
    out.reserve(ranked.size());
    for (auto& r : ranked) {
        // Refresh recency for what is handed out
        const Shard& shard = shardFor(r.insight.signature);
        auto lock = lockShared(shard);
        auto it = shard.entries.find(r.insight.signature);
        if (it == shard.entries.end()) continue;
        it->second.last_used.store(tick());
        hits_++;
        cross_domain_hits_++;
        out.push_back(std::move(r.insight));
    }
    return out;
}

// ─── Transfer Bookkeeping ──────────────────────────────────────

double InsightCache::transferEfficiency(const DomainSignature& signature) const {
    const Shard& shard = shardFor(signature);
    auto lock = lockShared(shard);
    auto it = shard.entries.find(signature);
    if (it == shard.entries.end()) return kNeutralEfficiency;
    return it->second.efficiency();
}

void InsightCache::recordReuse(const DomainSignature& signature, bool improved) {
    Shard& shard = shardFor(signature);
    auto lock = lockExclusive(shard);
    auto it = shard.entries.find(signature);
    if (it == shard.entries.end()) return;
    it->second.reuse_attempts++;
    if (improved) it->second.reuse_successes++;
}

// ─── Stats / Maintenance ───────────────────────────────────────

CacheStats InsightCache::stats() const {
    CacheStats s;
    double efficiency_sum = 0.0;
    for (const auto& shard : shards_) {
        auto lock = lockShared(*shard);
        s.entry_count += shard->entries.size();
        for (const auto& [sig, entry] : shard->entries) {
            efficiency_sum += entry.efficiency();
        }
    }
    s.mean_transfer_efficiency = s.entry_count > 0
        ? efficiency_sum / s.entry_count : kNeutralEfficiency;
    s.evictions = evictions_.load();
    s.inserts = inserts_.load();
    s.merges = merges_.load();
    s.hits = hits_.load();
    s.approximate_hits = approximate_hits_.load();
    s.cross_domain_hits = cross_domain_hits_.load();
    s.misses = misses_.load();
    s.contention_retries = contention_retries_.load();
    return s;
}

size_t InsightCache::size() const {
    size_t n = 0;
    for (const auto& shard : shards_) {
        auto lock = lockShared(*shard);
        n += shard->entries.size();
    }
    return n;
}

size_t InsightCache::decay(double factor) {
    size_t removed = 0;
    for (auto& shard : shards_) {
        auto lock = lockExclusive(*shard);
        for (auto it = shard->entries.begin(); it != shard->entries.end();) {
            it->second.insight.confidence *= factor;
            if (it->second.insight.confidence < 1e-3) {
                it = shard->entries.erase(it);
                removed++;
            } else {
                ++it;
            }
        }
    }
    return removed;
}

size_t InsightCache::prune(double min_efficiency, uint64_t min_attempts) {
    size_t removed = 0;
    for (auto& shard : shards_) {
        auto lock = lockExclusive(*shard);
        for (auto it = shard->entries.begin(); it != shard->entries.end();) {
            const Entry& e = it->second;
            if (e.reuse_attempts >= min_attempts && e.efficiency() < min_efficiency) {
                it = shard->entries.erase(it);
                removed++;
            } else {
                ++it;
            }
        }
    }
    if (removed > 0) {
        EMBER_LOG_INFO(Cache, "Pruned {} insights below efficiency {}", removed, min_efficiency);
    }
    return removed;
}

void InsightCache::clear() {
    for (auto& shard : shards_) {
        auto lock = lockExclusive(*shard);
        shard->entries.clear();
    }
}

} // namespace ember
