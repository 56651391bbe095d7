#pragma once

#include "insight/insight.hpp"
#include "search/search_state.hpp"

#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

namespace ember {

// ─── Run Record ────────────────────────────────────────────────
// Summary of one completed search run. Candidates are never kept.

struct RunRecord {
    DomainId domain_id;
    TerminationReason termination_reason = TerminationReason::IterationBudgetExhausted;
    double final_distance = 0.0;
    size_t iterations_used = 0;
    double elapsed_seconds = 0.0;
    uint64_t insights_transferred = 0;
    bool success = false;
};

// ─── Run History ───────────────────────────────────────────────
// Bounded log of completed runs (oldest dropped first). Runs may finish
// concurrently, so every member is internally synchronized.

class RunHistory {
public:
    explicit RunHistory(size_t capacity = 1000);

    void store(const RunRecord& record);

    /// Oldest first. limit = 0 means no limit.
    std::vector<RunRecord> retrieve(size_t limit = 0, bool successes_only = false) const;

    std::vector<RunRecord> retrieveRecent(size_t n) const;

    size_t count() const;
    size_t capacity() const { return capacity_; }

    double successRate() const;

    /// Mean iterations over successful runs; 0 when there are none.
    double meanIterationsToSuccess() const;

    void clear();

private:
    size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<RunRecord> records_;
};

} // namespace ember
