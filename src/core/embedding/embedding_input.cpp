#include "core/embedding/embedding_input.h"

#include <algorithm>
#include <cmath>

namespace ss::embedding_input {

namespace {

double sanitizeCharsPerToken(double charsPerToken)
{
    if (!std::isfinite(charsPerToken) || charsPerToken <= 0.0) {
        return kDefaultCharsPerToken;
    }
    return charsPerToken;
}

} // namespace

int estimateTokens(const QString& text, double charsPerToken)
{
    if (text.isEmpty()) {
        return 0;
    }
    const double perToken = sanitizeCharsPerToken(charsPerToken);
    return static_cast<int>(std::ceil(static_cast<double>(text.size()) / perToken));
}

int estimateTokens(const QVariant& value, double charsPerToken)
{
    if (!value.isValid() || value.isNull()) {
        return 0;
    }
    return estimateTokens(value.toString(), charsPerToken);
}

int embeddingTokenLimit(std::optional<int> explicitLimit)
{
    const int base = (explicitLimit && *explicitLimit > 0) ? *explicitLimit
                                                           : kDefaultContextTokens;
    const int scaled = static_cast<int>(std::floor(static_cast<double>(base) * kHeadroomRatio));
    return std::max(kMinTokens, scaled);
}

TruncationResult truncateToTokenLimit(const QString& text, int maxTokens, double charsPerToken)
{
    TruncationResult result;
    const double perToken = sanitizeCharsPerToken(charsPerToken);
    result.maxChars = static_cast<int>(std::floor(static_cast<double>(std::max(maxTokens, 0)) * perToken));

    if (text.size() <= result.maxChars) {
        result.text = text;
        return result;
    }

    int cut = result.maxChars;
    // Do not leave a dangling high surrogate at the cut point.
    if (cut > 0 && text.at(cut - 1).isHighSurrogate()) {
        --cut;
    }
    result.text = text.left(cut);
    result.wasTruncated = true;
    return result;
}

CappedInput capEmbeddingInput(const QString& text, const CapOptions& options)
{
    CappedInput capped;
    const double perToken = sanitizeCharsPerToken(options.charsPerToken);
    capped.maxTokens = embeddingTokenLimit(options.maxTokens);
    capped.estimatedTokens = estimateTokens(text, perToken);

    const TruncationResult truncated = truncateToTokenLimit(text, capped.maxTokens, perToken);
    capped.text = truncated.text;
    capped.wasTruncated = truncated.wasTruncated;
    return capped;
}

} // namespace ss::embedding_input
