#include "core/generation/circuit_breaker.h"

#include <chrono>

namespace rc {

namespace {

int64_t nowMs()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

} // namespace

bool GenerationCircuitBreaker::isOpen() const
{
    if (consecutiveFailures.load() < kOpenThreshold) {
        return false;
    }
    // Open: let one attempt through once the delay has elapsed
    return nowMs() - lastFailureTime.load() < kHalfOpenDelayMs;
}

void GenerationCircuitBreaker::recordSuccess()
{
    consecutiveFailures.store(0);
}

void GenerationCircuitBreaker::recordFailure()
{
    consecutiveFailures.fetch_add(1);
    lastFailureTime.store(nowMs());
}

} // namespace rc
