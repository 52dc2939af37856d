/**
 * @file TextChunker.hpp
 * @brief Splits document text into paragraph-aligned, size-bounded chunks.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/Document.hpp"

namespace ragforge::application {

/**
 * @class TextChunker
 * @brief Paragraph accumulator.
 *
 * Paragraphs are appended to a buffer until the next one would exceed the chunk
 * size, then the buffer is flushed. A paragraph longer than the limit becomes an
 * oversized chunk of its own; paragraphs are never split.
 */
class TextChunker {
public:
    static constexpr std::size_t kChunkSize = 1500;
    /** @brief Reserved for an overlapping chunker; the paragraph path does not use it. */
    static constexpr std::size_t kChunkOverlap = 100;

    explicit TextChunker(std::size_t chunkSize = kChunkSize);

    std::vector<domain::Chunk> chunk(const std::string& text) const;

    /** @brief Splits on every newline flavour and drops blank or whitespace-only lines. */
    static std::vector<std::string> splitParagraphs(const std::string& text);

private:
    std::size_t m_chunkSize;
};

/** @brief Strips leading and trailing whitespace. */
std::string Trim(const std::string& s);

} // namespace ragforge::application
