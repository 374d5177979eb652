#include "core/embedding/vector_math.h"

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace ss {

namespace {

struct ModelDimension {
    const char* name;
    int dimensions;
};

constexpr ModelDimension kModelCatalog[] = {
    {"nomic-embed-text-v1.5-Q8_0.gguf", 768},
    {"nomic-embed-text-v1.5-Q4_K_M.gguf", 768},
    {"nomic-embed-text-v1.5-f16.gguf", 768},
    {"mxbai-embed-large-v1-f16.gguf", 1024},
    {"mxbai-embed-large-v1-q8_0.gguf", 1024},
    {"all-MiniLM-L6-v2-Q8_0.gguf", 384},
};

// Checked in order against the lower-cased model name.
constexpr ModelDimension kFallbackPatterns[] = {
    {"nomic-embed", 768},
    {"mxbai-embed", 1024},
    {"all-minilm", 384},
    {"bge-large", 1024},
    {"bge-base", 768},
    {"bge-small", 384},
    {"snowflake-arctic-embed", 1024},
};

std::optional<int> lookupDimension(const QString& modelName)
{
    if (modelName.isEmpty()) {
        return std::nullopt;
    }

    for (const ModelDimension& entry : kModelCatalog) {
        if (modelName.compare(QLatin1String(entry.name), Qt::CaseInsensitive) == 0) {
            return entry.dimensions;
        }
    }

    const QString lowered = modelName.toLower();
    for (const ModelDimension& entry : kFallbackPatterns) {
        if (lowered.contains(QLatin1String(entry.name))) {
            return entry.dimensions;
        }
    }
    return std::nullopt;
}

} // namespace

double cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b)
{
    if (a.empty() || a.size() != b.size()) {
        return 0.0;
    }

    double dot = 0.0;
    double normA = 0.0;
    double normB = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        const double x = a[i];
        const double y = b[i];
        dot += x * y;
        normA += x * x;
        normB += y * y;
    }

    if (normA <= 0.0 || normB <= 0.0) {
        return 0.0;
    }
    const double similarity = dot / (std::sqrt(normA) * std::sqrt(normB));
    return std::isfinite(similarity) ? similarity : 0.0;
}

std::optional<double> squaredEuclideanDistance(const std::vector<float>& a,
                                               const std::vector<float>& b)
{
    if (a.size() != b.size()) {
        return std::nullopt;
    }

    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        const double diff = static_cast<double>(a[i]) - static_cast<double>(b[i]);
        sum += diff * diff;
    }
    return sum;
}

bool validateEmbeddingDimensions(const std::vector<float>& vector, std::optional<int> expectedDim)
{
    if (!expectedDim) {
        return true;
    }
    return *expectedDim >= 0 && vector.size() == static_cast<size_t>(*expectedDim);
}

VectorValidation validateEmbeddingVector(const std::vector<float>& vector)
{
    VectorValidation result;
    if (vector.empty()) {
        result.valid = false;
        result.reason = QStringLiteral("empty_vector");
        return result;
    }

    for (size_t i = 0; i < vector.size(); ++i) {
        if (!std::isfinite(vector[i])) {
            result.valid = false;
            result.reason = QStringLiteral("non_finite_value");
            result.badIndex = static_cast<int>(i);
            return result;
        }
    }
    return result;
}

std::vector<float> padOrTruncateVector(const std::vector<float>& vector, int dim)
{
    const size_t target = dim > 0 ? static_cast<size_t>(dim) : 0;
    if (vector.size() == target) {
        return vector;
    }

    std::vector<float> out(vector.begin(),
                           vector.begin() + static_cast<std::ptrdiff_t>(std::min(vector.size(), target)));
    out.resize(target, 0.0f);
    return out;
}

int resolveEmbeddingDimension(const QString& modelName, int defaultDimension)
{
    return lookupDimension(modelName).value_or(defaultDimension);
}

bool isKnownEmbeddingModel(const QString& modelName)
{
    return lookupDimension(modelName).has_value();
}

} // namespace ss
