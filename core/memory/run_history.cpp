#include "memory/run_history.hpp"

#include <algorithm>

namespace ember {

RunHistory::RunHistory(size_t capacity)
    : capacity_(std::max<size_t>(1, capacity)) {}

void RunHistory::store(const RunRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(record);
    while (records_.size() > capacity_) {
        records_.pop_front();
    }
}

std::vector<RunRecord> RunHistory::retrieve(size_t limit, bool successes_only) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RunRecord> result;
    for (const auto& r : records_) {
        if (successes_only && !r.success) continue;
        result.push_back(r);
        if (limit > 0 && result.size() >= limit) break;
    }
    return result;
}

std::vector<RunRecord> RunHistory::retrieveRecent(size_t n) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (n >= records_.size()) {
        return std::vector<RunRecord>(records_.begin(), records_.end());
    }
    return std::vector<RunRecord>(records_.end() - static_cast<std::ptrdiff_t>(n), records_.end());
}

size_t RunHistory::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

double RunHistory::successRate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (records_.empty()) return 0.0;
    size_t successes = 0;
    for (const auto& r : records_) {
        if (r.success) successes++;
    }
    return static_cast<double>(successes) / records_.size();
}

double RunHistory::meanIterationsToSuccess() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    double total = 0.0;
    for (const auto& r : records_) {
        if (r.success) {
            total += static_cast<double>(r.iterations_used);
            count++;
        }
    }
    return count > 0 ? total / count : 0.0;
}

void RunHistory::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
}

} // namespace ember
