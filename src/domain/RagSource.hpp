/**
 * @file RagSource.hpp
 * @brief Declarative descriptor of where a document's content comes from.
 */

#pragma once
#include <map>
#include <optional>
#include <string>

namespace ragforge::domain {

/**
 * @enum SourceKind
 * @brief Kind of a source; selects the provider used to read it.
 */
enum class SourceKind {
    File,
    Web,
    Text,
    Other
};

inline std::string SourceKindToString(SourceKind k) {
    switch (k) {
        case SourceKind::File: return "file";
        case SourceKind::Web: return "web";
        case SourceKind::Text: return "text";
        case SourceKind::Other: return "other";
    }
    return "other";
}

inline std::optional<SourceKind> SourceKindFromString(const std::string& s) {
    if (s == "file") return SourceKind::File;
    if (s == "web") return SourceKind::Web;
    if (s == "text") return SourceKind::Text;
    if (s == "other") return SourceKind::Other;
    return std::nullopt;
}

/**
 * @struct RagSource
 * @brief Configuration record; resolving it materializes a Document.
 */
struct RagSource {
    std::string id;
    SourceKind kind = SourceKind::File;
    std::string name;    ///< Display name.
    std::string value;   ///< Path, URL, or literal text depending on kind.
    bool enabled = true;
    std::map<std::string, std::string> metadata;
};

} // namespace ragforge::domain
