/**
 * @file ContextAssembler.hpp
 * @brief Application service to assemble the context block injected into the prompt.
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "application/RagEngine.hpp"
#include "domain/WebSearchService.hpp"

namespace ragforge::application {

/** @brief A document the user attached to the current chat session (not chunked). */
struct AttachedDocument {
    std::string name;
    std::string content;
};

/** @brief The knowledge base chosen for a chat; a null engine means it is not running. */
struct KnowledgeSelection {
    std::string name;
    std::shared_ptr<const RagEngine> engine;
};

/**
 * @struct ContextBundle
 * @brief A Value Object containing labeled context segments for the LLM.
 */
struct ContextBundle {
    std::string attachedName;
    std::string attachedContent;
    std::string knowledgeName;
    std::string knowledgeContext;
    std::vector<domain::SearchResult> webResults;

    /**
     * @brief Renders the segments in priority order: attached document, knowledge base, web.
     * @param maxChars Outer cap on the rendered text; 0 disables it.
     */
    std::string render(std::size_t maxChars = 0) const;

    bool isEmpty() const {
        return attachedContent.empty() && knowledgeContext.empty() && webResults.empty();
    }
};

/**
 * @class ContextAssembler
 * @brief Gathers session, knowledge-base and web context for one query. No side effects.
 */
class ContextAssembler {
public:
    static constexpr std::size_t kMaxAttachedDocumentChars = 50000;
    static constexpr std::size_t kCharsPerToken = 4;

    static constexpr const char* kKnowledgeBaseNotRunning =
        "[System: The selected RAG service is not running. Answer based on general knowledge only.]";

    /** @param maxContextChars Outer cap applied by assembleText; 0 disables it. */
    explicit ContextAssembler(std::size_t maxContextChars = 0);

    /** @brief Cap derived from the model window minus the tokens reserved for generation. */
    static std::size_t BudgetFor(int contextWindowTokens, int reservedGenerationTokens);

    ContextBundle assemble(const std::string& query,
                           const std::optional<AttachedDocument>& attached,
                           const std::optional<KnowledgeSelection>& knowledge,
                           const std::vector<domain::SearchResult>& webResults,
                           std::size_t maxChunks) const;

    /** @brief assemble() followed by render() with the configured outer cap. */
    std::string assembleText(const std::string& query,
                             const std::optional<AttachedDocument>& attached,
                             const std::optional<KnowledgeSelection>& knowledge,
                             const std::vector<domain::SearchResult>& webResults,
                             std::size_t maxChunks) const;

    std::size_t maxContextChars() const { return m_maxContextChars; }

private:
    std::size_t m_maxContextChars;
};

/** @brief Cuts s to at most maxBytes without splitting a UTF-8 sequence. */
std::string TruncateUtf8(const std::string& s, std::size_t maxBytes);

} // namespace ragforge::application
