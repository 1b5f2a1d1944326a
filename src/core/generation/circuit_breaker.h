#pragma once

#include <atomic>
#include <cstdint>

namespace rc {

// Opens after kOpenThreshold consecutive failures; after kHalfOpenDelayMs one
// attempt is let through again (half-open).
struct GenerationCircuitBreaker {
    std::atomic<int> consecutiveFailures{0};
    std::atomic<int64_t> lastFailureTime{0};
    static constexpr int kOpenThreshold = 5;          // Open after 5 consecutive failures
    static constexpr int kHalfOpenDelayMs = 30000;    // Try again after 30s

    bool isOpen() const;
    void recordSuccess();
    void recordFailure();
};

} // namespace rc
