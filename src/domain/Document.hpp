/**
 * @file Document.hpp
 * @brief Domain entities for ingested documents and their chunks.
 */

#pragma once
#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace ragforge::domain {

/**
 * @enum DocumentType
 * @brief Categorization of ingested documents.
 */
enum class DocumentType {
    Text,
    Word,
    Pdf,
    Web,
    Unknown
};

inline std::string DocumentTypeToString(DocumentType t) {
    switch (t) {
        case DocumentType::Text: return "text";
        case DocumentType::Word: return "word";
        case DocumentType::Pdf: return "pdf";
        case DocumentType::Web: return "web";
        case DocumentType::Unknown: return "unknown";
    }
    return "unknown";
}

/** @brief Classifies a file by its extension (with leading dot, any case). */
inline DocumentType DocumentTypeFromExtension(std::string ext) {
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c){ return std::tolower(c); });
    if (ext == ".txt" || ext == ".md" || ext == ".csv" || ext == ".json" || ext == ".xml") return DocumentType::Text;
    if (ext == ".docx" || ext == ".doc") return DocumentType::Word;
    if (ext == ".pdf") return DocumentType::Pdf;
    return DocumentType::Unknown;
}

/**
 * @struct Chunk
 * @brief A contiguous slice of a document's text, the unit of retrieval.
 *
 * Offsets count characters consumed by previous chunks' buffers, not
 * positions in the source text.
 */
struct Chunk {
    int index = 0;
    std::string content;
    std::size_t startPosition = 0;
    std::size_t endPosition = 0;
};

/**
 * @class Document
 * @brief One ingested unit, owned by the RagEngine that produced it.
 */
class Document {
public:
    std::string id;
    std::string fileName;          ///< Display name.
    std::string filePath;          ///< Origin path or URL.
    std::string content;           ///< Raw extracted text.
    std::vector<Chunk> chunks;
    DocumentType type = DocumentType::Unknown;

    Document() = default;
};

} // namespace ragforge::domain
