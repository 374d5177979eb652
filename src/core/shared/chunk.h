#pragma once

#include <QString>

namespace ss {

// One window of extracted text handed to the embedding stage.
// charStart/charEnd are offsets into the original, untrimmed source text
// and bound the trimmed content (charEnd is exclusive).
struct TextChunk {
    int index = 0;
    int charStart = 0;
    int charEnd = 0;
    QString text;
};

// Compute stable chunk ID: SHA-256 of "filePath#chunkIndex".
// Used as the vector id handed to the VectorStore.
QString computeChunkId(const QString& filePath, int chunkIndex);

} // namespace ss
