/**
 * @file ConversationService.hpp
 * @brief Service to manage the in-app chat session.
 */

#pragma once
#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "application/ApiServerManager.hpp"
#include "application/ChatService.hpp"
#include "application/ContextAssembler.hpp"
#include "domain/ChatMessage.hpp"
#include "domain/SourceProvider.hpp"
#include "domain/WebSearchService.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace ragforge::application {

struct ConversationOptions {
    std::string systemPrompt = ChatService::kDefaultSystemPrompt;
    std::size_t maxChunks = 3;
    int webResults = 3;
    std::filesystem::path dialoguesDir;   ///< Transcripts are not saved when empty.
};

/**
 * @class ConversationService
 * @brief Holds one chat session: history, attached document, selected knowledge
 *        base and the web-search toggle, and persists a Markdown transcript.
 */
class ConversationService {
public:
    ConversationService(std::shared_ptr<ChatService> chat,
                        std::shared_ptr<ApiServerManager> manager,
                        std::shared_ptr<domain::SourceProvider> fileReader,
                        std::shared_ptr<domain::WebSearchService> webSearch,
                        std::shared_ptr<infrastructure::PersistenceService> persistence,
                        ContextAssembler assembler,
                        ConversationOptions options = ConversationOptions());

    /**
     * @brief Extracts a file and keeps it as session context.
     * @return false when nothing could be extracted; the previous attachment is cleared.
     * @throws domain::SourceUnavailable if the file cannot be read.
     */
    bool attachDocument(const std::string& path);
    void detachDocument();
    std::optional<std::string> attachedDocumentName() const;

    /** @brief Selects the knowledge base used for retrieval; nullopt for none. */
    void selectKnowledgeBase(const std::optional<std::string>& id);
    std::optional<std::string> selectedKnowledgeBase() const;

    void setWebSearchEnabled(bool enabled);
    bool isWebSearchEnabled() const;

    /**
     * @brief Runs one turn on the calling thread, streaming tokens to onToken.
     *
     * The reply (with the stop marker when cancelled) is appended to the history
     * and the transcript is saved. An engine failure does not throw: the reply is
     * marked failed and carries the error text, which is recorded like any answer.
     */
    ChatService::Reply sendMessage(const std::string& userMessage,
                                   const ChatService::TokenCallback& onToken = nullptr,
                                   const std::atomic<bool>* externalCancel = nullptr);

    /** @brief Requests the running turn to stop. */
    void cancel();
    bool isThinking() const;

    /** @brief Builds the context for a query without sending anything. */
    std::string buildContext(const std::string& query) const;

    std::vector<domain::ChatMessage> getHistory() const;

    /** @brief Clears history and starts a new transcript file. */
    void reset();

    std::filesystem::path transcriptPath() const;

    static std::string RenderTranscript(const std::vector<domain::ChatMessage>& history,
                                        const std::string& sessionStart);

private:
    void saveSession(const std::vector<domain::ChatMessage>& historySnapshot);

    std::shared_ptr<ChatService> m_chat;
    std::shared_ptr<ApiServerManager> m_manager;
    std::shared_ptr<domain::SourceProvider> m_fileReader;
    std::shared_ptr<domain::WebSearchService> m_webSearch;
    std::shared_ptr<infrastructure::PersistenceService> m_persistence;
    ContextAssembler m_assembler;
    ConversationOptions m_options;

    std::optional<AttachedDocument> m_attached;
    std::optional<std::string> m_knowledgeBaseId;
    bool m_webSearchEnabled = false;

    std::vector<domain::ChatMessage> m_history;
    std::string m_sessionStartTime;

    mutable std::mutex m_mutex;
    std::atomic<bool> m_isThinking{false};
    std::atomic<bool> m_cancel{false};
};

} // namespace ragforge::application
