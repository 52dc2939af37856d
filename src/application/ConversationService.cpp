/**
 * @file ConversationService.cpp
 * @brief Implementation of ConversationService.
 */

#include "application/ConversationService.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace ragforge::application {

namespace fs = std::filesystem;
using domain::ChatMessage;

namespace {

std::string formatTime(std::chrono::system_clock::time_point tp, const char* fmt) {
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm = {};
    localtime_r(&tt, &tm);
    std::stringstream ss;
    ss << std::put_time(&tm, fmt);
    return ss.str();
}

// Releases the thinking flag however the turn ends.
struct ThinkingGuard {
    std::atomic<bool>& flag;
    ~ThinkingGuard() { flag = false; }
};

} // namespace

ConversationService::ConversationService(std::shared_ptr<ChatService> chat,
                                         std::shared_ptr<ApiServerManager> manager,
                                         std::shared_ptr<domain::SourceProvider> fileReader,
                                         std::shared_ptr<domain::WebSearchService> webSearch,
                                         std::shared_ptr<infrastructure::PersistenceService> persistence,
                                         ContextAssembler assembler,
                                         ConversationOptions options)
    : m_chat(std::move(chat)),
      m_manager(std::move(manager)),
      m_fileReader(std::move(fileReader)),
      m_webSearch(std::move(webSearch)),
      m_persistence(std::move(persistence)),
      m_assembler(assembler),
      m_options(std::move(options)),
      m_sessionStartTime(formatTime(std::chrono::system_clock::now(), "%Y-%m-%d_%H-%M-%S")) {}

bool ConversationService::attachDocument(const std::string& path) {
    domain::RagSource source;
    source.kind = domain::SourceKind::File;
    source.name = fs::path(path).filename().string();
    source.value = path;

    std::string content;
    try {
        content = m_fileReader->getContent(source);
    } catch (const std::exception& e) {
        std::cerr << "[ConversationService] Cannot attach " << path << ": " << e.what() << std::endl;
        std::lock_guard<std::mutex> lock(m_mutex);
        m_attached.reset();
        throw;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (content.find_first_not_of(" \t\r\n") == std::string::npos) {
        m_attached.reset();
        return false;
    }
    if (content.size() > ContextAssembler::kMaxAttachedDocumentChars) {
        content = TruncateUtf8(content, ContextAssembler::kMaxAttachedDocumentChars);
    }
    m_attached = AttachedDocument{source.name, std::move(content)};
    return true;
}

void ConversationService::detachDocument() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_attached.reset();
}

std::optional<std::string> ConversationService::attachedDocumentName() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_attached) return std::nullopt;
    return m_attached->name;
}

void ConversationService::selectKnowledgeBase(const std::optional<std::string>& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_knowledgeBaseId = id;
}

std::optional<std::string> ConversationService::selectedKnowledgeBase() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_knowledgeBaseId;
}

void ConversationService::setWebSearchEnabled(bool enabled) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_webSearchEnabled = enabled;
}

bool ConversationService::isWebSearchEnabled() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_webSearchEnabled;
}

std::string ConversationService::buildContext(const std::string& query) const {
    std::optional<AttachedDocument> attached;
    std::optional<std::string> kbId;
    bool web = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        attached = m_attached;
        kbId = m_knowledgeBaseId;
        web = m_webSearchEnabled;
    }

    std::optional<KnowledgeSelection> knowledge;
    if (kbId && m_manager) {
        auto kb = m_manager->findKnowledgeBase(*kbId);
        knowledge = KnowledgeSelection{kb ? kb->name : *kbId, m_manager->engine(*kbId)};
    }

    std::vector<domain::SearchResult> webResults;
    if (web && m_webSearch) {
        webResults = m_webSearch->search(query, m_options.webResults);
    }

    return m_assembler.assembleText(query, attached, knowledge, webResults, m_options.maxChunks);
}

ChatService::Reply ConversationService::sendMessage(const std::string& userMessage,
                                                    const ChatService::TokenCallback& onToken,
                                                    const std::atomic<bool>* externalCancel) {
    std::vector<ChatMessage> historySnapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_history.emplace_back(ChatMessage::Role::User, userMessage);
        historySnapshot = m_history;
    }

    m_cancel = false;
    m_isThinking = true;
    ThinkingGuard guard{m_isThinking};

    std::string context = buildContext(userMessage);

    std::vector<ChatMessage> prompt;
    prompt.emplace_back(ChatMessage::Role::System, m_options.systemPrompt);
    prompt.insert(prompt.end(), historySnapshot.begin(), historySnapshot.end());

    auto forward = [&](const std::string& token) {
        if (externalCancel && externalCancel->load()) {
            m_cancel = true;
        }
        if (m_cancel) return false;
        return onToken ? onToken(token) : true;
    };

    ChatService::Reply reply;
    try {
        reply = m_chat->generate(prompt, context, forward, &m_cancel);
    } catch (const std::exception& e) {
        std::cerr << "[ConversationService] Turn failed: " << e.what() << std::endl;
        reply = ChatService::Reply();
        reply.failed = true;
        reply.content = std::string(ChatService::kFailurePrefix) + e.what();
        if (onToken) onToken(reply.content);
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_history.emplace_back(ChatMessage::Role::Assistant, reply.content);
        historySnapshot = m_history;
    }
    saveSession(historySnapshot);
    return reply;
}

void ConversationService::cancel() {
    m_cancel = true;
}

bool ConversationService::isThinking() const {
    return m_isThinking.load();
}

std::vector<ChatMessage> ConversationService::getHistory() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_history;
}

void ConversationService::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_history.clear();
    m_sessionStartTime = formatTime(std::chrono::system_clock::now(), "%Y-%m-%d_%H-%M-%S");
}

fs::path ConversationService::transcriptPath() const {
    if (m_options.dialoguesDir.empty()) return {};
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_options.dialoguesDir / ("chat_" + m_sessionStartTime + ".md");
}

std::string ConversationService::RenderTranscript(const std::vector<ChatMessage>& history,
                                                  const std::string& sessionStart) {
    std::stringstream ss;
    ss << "# Chat Session\n\n";
    ss << "Started: " << sessionStart << "\n\n";
    ss << "---\n\n";
    for (const auto& msg : history) {
        if (msg.role == ChatMessage::Role::System) continue;
        std::string roleName = (msg.role == ChatMessage::Role::User) ? "**User**" : "**Assistant**";
        ss << roleName << " (" << formatTime(msg.timestamp, "%H:%M:%S") << "): " << msg.content << "\n\n";
    }
    return ss.str();
}

void ConversationService::saveSession(const std::vector<ChatMessage>& historySnapshot) {
    fs::path path = transcriptPath();
    if (path.empty()) return;

    std::string start;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        start = m_sessionStartTime;
    }
    std::string content = RenderTranscript(historySnapshot, start);
    if (m_persistence) {
        m_persistence->saveTextAsync(path.string(), content);
    } else if (!infrastructure::PersistenceService::WriteAtomically(path.string(), content)) {
        std::cerr << "[ConversationService] Failed to save transcript " << path << std::endl;
    }
}

} // namespace ragforge::application
