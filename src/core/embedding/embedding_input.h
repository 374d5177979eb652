#pragma once

#include <QString>
#include <QVariant>

#include <optional>

namespace ss {

// Token-budget helpers for embedding requests.
//
// Token counts are estimated from character length; the embedding model's
// nominal context is reduced by a headroom ratio so that estimation error
// does not push an input past the hard context limit.
namespace embedding_input {

constexpr double kDefaultCharsPerToken = 3.5;
constexpr double kHeadroomRatio = 0.85;
constexpr int kMinTokens = 32;
constexpr int kDefaultContextTokens = 1000;

struct TruncationResult {
    QString text;
    bool wasTruncated = false;
    int maxChars = 0;
};

struct CapOptions {
    std::optional<int> maxTokens;
    double charsPerToken = kDefaultCharsPerToken;
};

struct CappedInput {
    QString text;
    bool wasTruncated = false;
    int estimatedTokens = 0;   // estimate for the input before truncation
    int maxTokens = 0;         // headroom-adjusted limit that was applied
};

int estimateTokens(const QString& text, double charsPerToken = kDefaultCharsPerToken);
// Non-string values are coerced with QVariant::toString() first.
int estimateTokens(const QVariant& value, double charsPerToken = kDefaultCharsPerToken);

// Headroom-adjusted token limit, never below kMinTokens. Without an explicit
// limit kDefaultContextTokens is used.
int embeddingTokenLimit(std::optional<int> explicitLimit = std::nullopt);

TruncationResult truncateToTokenLimit(const QString& text, int maxTokens,
                                      double charsPerToken = kDefaultCharsPerToken);

CappedInput capEmbeddingInput(const QString& text, const CapOptions& options = {});

} // namespace embedding_input

} // namespace ss
