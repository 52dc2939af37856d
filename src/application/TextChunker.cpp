/**
 * @file TextChunker.cpp
 * @brief Implementation of TextChunker.
 */

#include "application/TextChunker.hpp"
#include <cctype>

namespace ragforge::application {

std::string Trim(const std::string& s) {
    std::size_t begin = 0;
    while (begin < s.size() && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    std::size_t end = s.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

TextChunker::TextChunker(std::size_t chunkSize) : m_chunkSize(chunkSize) {}

std::vector<std::string> TextChunker::splitParagraphs(const std::string& text) {
    std::vector<std::string> paragraphs;
    std::string current;
    for (char c : text) {
        if (c == '\n' || c == '\r') {
            std::string trimmed = Trim(current);
            if (!trimmed.empty()) paragraphs.push_back(std::move(trimmed));
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    std::string trimmed = Trim(current);
    if (!trimmed.empty()) paragraphs.push_back(std::move(trimmed));
    return paragraphs;
}

std::vector<domain::Chunk> TextChunker::chunk(const std::string& text) const {
    std::vector<domain::Chunk> chunks;
    if (text.empty()) return chunks;

    std::string buffer;
    int index = 0;
    std::size_t startPos = 0;

    auto flush = [&]() {
        domain::Chunk c;
        c.index = index++;
        c.content = Trim(buffer);
        c.startPosition = startPos;
        c.endPosition = startPos + buffer.size();
        chunks.push_back(std::move(c));
        // Cumulative buffer length, not a cursor into the source text.
        startPos += buffer.size();
        buffer.clear();
    };

    for (const auto& para : splitParagraphs(text)) {
        if (!buffer.empty() && buffer.size() + para.size() > m_chunkSize) {
            flush();
        }
        buffer += para;
        buffer += '\n';
    }

    if (!buffer.empty()) flush();
    return chunks;
}

} // namespace ragforge::application
