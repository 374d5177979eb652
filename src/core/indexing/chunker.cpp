#include "core/indexing/chunker.h"

#include <algorithm>
#include <utility>

namespace ss {

Chunker::Chunker(const Config& config)
    : m_config(config)
{
    m_config.chunkSize = std::max(m_config.chunkSize, 1);
    m_config.overlap = std::clamp(m_config.overlap, 0, m_config.chunkSize - 1);
    m_config.maxChunks = std::max(m_config.maxChunks, 0);
}

std::vector<TextChunk> Chunker::chunkText(const QString& text) const
{
    std::vector<TextChunk> chunks;
    if (text.isEmpty() || m_config.maxChunks == 0) {
        return chunks;
    }

    const int length = static_cast<int>(text.size());
    const int step = std::max(1, m_config.chunkSize - m_config.overlap);

    for (int windowStart = 0; windowStart < length; windowStart += step) {
        // Keep surrogate pairs intact at both window edges. A pair cut at the
        // start was already covered by the previous window's extended end.
        int start = windowStart;
        if (start > 0 && text.at(start).isLowSurrogate() && text.at(start - 1).isHighSurrogate()) {
            ++start;
        }
        int end = std::min(start + m_config.chunkSize, length);
        if (end < length && text.at(end - 1).isHighSurrogate() && text.at(end).isLowSurrogate()) {
            ++end;
        }
        if (start >= length) {
            break;
        }

        int trimmedStart = start;
        int trimmedEnd = end;
        while (trimmedStart < trimmedEnd && text.at(trimmedStart).isSpace()) {
            ++trimmedStart;
        }
        while (trimmedEnd > trimmedStart && text.at(trimmedEnd - 1).isSpace()) {
            --trimmedEnd;
        }

        if (trimmedEnd > trimmedStart) {
            TextChunk chunk;
            chunk.index = static_cast<int>(chunks.size());
            chunk.charStart = trimmedStart;
            chunk.charEnd = trimmedEnd;
            chunk.text = text.mid(trimmedStart, trimmedEnd - trimmedStart);
            chunks.push_back(std::move(chunk));

            if (static_cast<int>(chunks.size()) >= m_config.maxChunks) {
                break;
            }
        }

        if (end >= length) {
            break;
        }
    }

    return chunks;
}

} // namespace ss
