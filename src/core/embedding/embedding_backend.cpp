#include "core/embedding/embedding_backend.h"

#include <chrono>

namespace ss {

namespace {

int64_t steadyNowMs()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

} // namespace

bool BackendCircuitBreaker::isOpen() const
{
    if (consecutiveFailures.load() < kOpenThreshold) {
        return false;
    }
    // In open state, check if enough time has elapsed for half-open
    if (steadyNowMs() - lastFailureTime.load() >= kHalfOpenDelayMs) {
        return false;  // half-open: allow one attempt
    }
    return true;
}

void BackendCircuitBreaker::recordSuccess()
{
    consecutiveFailures.store(0);
}

void BackendCircuitBreaker::recordFailure()
{
    consecutiveFailures.fetch_add(1);
    lastFailureTime.store(steadyNowMs());
}

} // namespace ss
