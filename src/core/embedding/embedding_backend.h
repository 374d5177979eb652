#pragma once

#include <QString>

#include <atomic>
#include <cstdint>
#include <vector>

namespace ss {

struct EmbeddingResponse {
    std::vector<float> vector;
    QString error;               // non-empty on failure

    bool ok() const { return error.isEmpty(); }
};

struct GenerationResponse {
    QString text;
    QString error;

    bool ok() const { return error.isEmpty(); }
};

// Local model runtime computing embeddings: (text, model) -> vector | error.
// Implementations may be called concurrently from stage queue workers.
class EmbeddingBackend {
public:
    virtual ~EmbeddingBackend() = default;
    virtual EmbeddingResponse embed(const QString& text, const QString& model) = 0;
};

// Local model runtime producing completions: (prompt, model) -> text | error.
class TextGenerationBackend {
public:
    virtual ~TextGenerationBackend() = default;
    virtual GenerationResponse generate(const QString& prompt, const QString& model) = 0;
};

// Stops hammering a failing backend: opens after kOpenThreshold consecutive
// failures and lets one attempt through again after kHalfOpenDelayMs.
struct BackendCircuitBreaker {
    std::atomic<int> consecutiveFailures{0};
    std::atomic<int64_t> lastFailureTime{0};
    static constexpr int kOpenThreshold = 5;          // Open after 5 consecutive failures
    static constexpr int kHalfOpenDelayMs = 30000;    // Try again after 30s

    bool isOpen() const;
    void recordSuccess();
    void recordFailure();
};

} // namespace ss
