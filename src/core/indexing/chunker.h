#pragma once

#include "core/shared/chunk.h"

#include <QString>
#include <vector>

namespace ss {

// Configuration for the Chunker.
// Defined outside the class to avoid the "default member initializer needed
// within enclosing class" issue in C++.
struct ChunkerConfig {
    int chunkSize = 1000;
    int overlap = 200;
    int maxChunks = 50;
};

// Chunker: splits extracted text into overlapping windows for embedding.
//
// Windows advance by step = chunkSize - overlap (at least 1) and are cut on
// the raw text, so output is deterministic for a given input and config.
// Each emitted chunk is whitespace-trimmed; charStart/charEnd bound the
// trimmed content within the original text. Whitespace-only windows are
// skipped and at most maxChunks chunks are produced. A window edge that
// would split a UTF-16 surrogate pair moves forward by one code unit.
class Chunker {
public:
    using Config = ChunkerConfig;

    explicit Chunker(const Config& config = {});

    // Returns an empty vector for null or empty text.
    std::vector<TextChunk> chunkText(const QString& text) const;

    const Config& config() const { return m_config; }

private:
    Config m_config;
};

} // namespace ss
