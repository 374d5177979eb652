#pragma once

#include <QString>

#include <optional>
#include <vector>

namespace ss {

struct VectorValidation {
    bool valid = true;
    QString reason;          // empty when valid
    int badIndex = -1;       // first offending component, -1 if none
};

// Cosine similarity of two vectors. Mismatched dimensions, empty input or a
// zero-norm vector yield 0 (maximally dissimilar) rather than an error.
double cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b);

// Sum of squared component differences. Returns nullopt on dimension
// mismatch; unlike cosineSimilarity, callers must handle the failure.
std::optional<double> squaredEuclideanDistance(const std::vector<float>& a,
                                               const std::vector<float>& b);

// True when no dimension is expected or the vector has exactly that length.
bool validateEmbeddingDimensions(const std::vector<float>& vector,
                                 std::optional<int> expectedDim);

// Rejects empty vectors and vectors with any NaN or infinite component.
VectorValidation validateEmbeddingVector(const std::vector<float>& vector);

// Zero-pads or truncates trailing components to exactly `dim` entries.
std::vector<float> padOrTruncateVector(const std::vector<float>& vector, int dim);

// Embedding width for a model file name. Exact catalog entries win over
// substring fallbacks; unknown models map to defaultDimension.
int resolveEmbeddingDimension(const QString& modelName, int defaultDimension = 768);
bool isKnownEmbeddingModel(const QString& modelName);

} // namespace ss
