/**
 * @file ContextAssembler.cpp
 * @brief Implementation of the ContextAssembler service.
 */

#include "application/ContextAssembler.hpp"
#include <sstream>

namespace ragforge::application {

std::string TruncateUtf8(const std::string& s, std::size_t maxBytes) {
    if (s.size() <= maxBytes) return s;
    std::size_t cut = maxBytes;
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) --cut;
    return s.substr(0, cut);
}

std::string ContextBundle::render(std::size_t maxChars) const {
    std::stringstream ss;

    if (!attachedContent.empty()) {
        ss << "=== ATTACHED DOCUMENT (" << attachedName << ") ===\n"
           << attachedContent << "\n"
           << "========================================\n\n";
    }

    if (!knowledgeContext.empty()) {
        ss << "=== KNOWLEDGE BASE";
        if (!knowledgeName.empty()) ss << " (" << knowledgeName << ")";
        ss << " ===\n"
           << knowledgeContext << "\n"
           << "========================================\n\n";
    }

    if (!webResults.empty()) {
        ss << "=== WEB SEARCH RESULTS ===\n";
        int n = 1;
        for (const auto& r : webResults) {
            ss << "[" << n++ << "] " << r.title << " (" << r.link << ")\n"
               << r.snippet << "\n";
        }
        ss << "========================================\n\n";
    }

    std::string text = ss.str();
    if (maxChars > 0 && text.size() > maxChars) {
        static const std::string kMarker = "\n[Context truncated]\n";
        std::size_t keep = maxChars > kMarker.size() ? maxChars - kMarker.size() : 0;
        text = TruncateUtf8(text, keep) + kMarker;
    }
    return text;
}

ContextAssembler::ContextAssembler(std::size_t maxContextChars)
    : m_maxContextChars(maxContextChars) {}

std::size_t ContextAssembler::BudgetFor(int contextWindowTokens, int reservedGenerationTokens) {
    int usable = contextWindowTokens - reservedGenerationTokens;
    if (usable <= 0) return 0;
    return static_cast<std::size_t>(usable) * kCharsPerToken;
}

ContextBundle ContextAssembler::assemble(const std::string& query,
                                         const std::optional<AttachedDocument>& attached,
                                         const std::optional<KnowledgeSelection>& knowledge,
                                         const std::vector<domain::SearchResult>& webResults,
                                         std::size_t maxChunks) const {
    ContextBundle bundle;

    if (attached && !attached->content.empty()) {
        bundle.attachedName = attached->name;
        bundle.attachedContent = TruncateUtf8(attached->content, kMaxAttachedDocumentChars);
    }

    if (knowledge) {
        bundle.knowledgeName = knowledge->name;
        if (knowledge->engine) {
            bundle.knowledgeContext = knowledge->engine->getContext(query, maxChunks);
        } else {
            bundle.knowledgeContext = kKnowledgeBaseNotRunning;
        }
    }

    bundle.webResults = webResults;
    return bundle;
}

std::string ContextAssembler::assembleText(const std::string& query,
                                           const std::optional<AttachedDocument>& attached,
                                           const std::optional<KnowledgeSelection>& knowledge,
                                           const std::vector<domain::SearchResult>& webResults,
                                           std::size_t maxChunks) const {
    return assemble(query, attached, knowledge, webResults, maxChunks).render(m_maxContextChars);
}

} // namespace ragforge::application
