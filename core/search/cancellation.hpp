#pragma once

#include <atomic>

namespace ember {

/// Cooperative cancellation for a search run. The loop polls it once per
/// iteration boundary; an in-flight batch always finishes and is disposed.
class CancellationToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_release); }
    bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }
    void reset() { cancelled_.store(false, std::memory_order_release); }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace ember
