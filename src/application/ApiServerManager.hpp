/**
 * @file ApiServerManager.hpp
 * @brief Owns the knowledge bases and their independently running HTTP listeners.
 */

#pragma once
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "application/ChatService.hpp"
#include "application/ContextAssembler.hpp"
#include "application/RagEngine.hpp"
#include "application/RelevanceScorer.hpp"
#include "application/SourceProviderRegistry.hpp"
#include "domain/KnowledgeBase.hpp"
#include "infrastructure/ApiServer.hpp"
#include "infrastructure/KnowledgeBaseRepository.hpp"

namespace ragforge::application {

/** @brief Lifecycle of one knowledge base's listener. */
enum class ServiceState {
    Stopped,
    Starting,
    Running,
    Stopping
};

std::string ServiceStateToString(ServiceState state);

struct ManagerOptions {
    std::filesystem::path storageRoot;      ///< Managed file copies live under <storageRoot>/kb/<id>/.
    std::string bindAddress = "127.0.0.1";
    std::size_t apiMaxChunks = RagEngine::kDefaultMaxChunks;
    std::size_t maxContextChars = 0;        ///< Outer context cap for the HTTP surface.
    RelevanceScorer scorer;
};

/** @brief Outcome of a start: documents ingested and the sources that were skipped. */
struct StartReport {
    std::size_t documentsLoaded = 0;
    std::vector<std::string> failedSources;
};

/**
 * @class ApiServerManager
 * @brief Starts, stops and edits knowledge bases; at most one listener per id.
 *
 * Sources may only change while a knowledge base is stopped; starting rebuilds its
 * RagEngine from the enabled sources.
 */
class ApiServerManager {
public:
    ApiServerManager(std::shared_ptr<infrastructure::KnowledgeBaseRepository> repository,
                     std::shared_ptr<const SourceProviderRegistry> providers,
                     std::shared_ptr<ChatService> chat,
                     ManagerOptions options);
    ~ApiServerManager();

    ApiServerManager(const ApiServerManager&) = delete;
    ApiServerManager& operator=(const ApiServerManager&) = delete;

    // --- Knowledge bases ---
    std::vector<domain::KnowledgeBaseConfig> knowledgeBases() const;
    std::optional<domain::KnowledgeBaseConfig> findKnowledgeBase(const std::string& id) const;

    /** @brief Stores a new record; an empty id is replaced with a generated one. */
    domain::KnowledgeBaseConfig createKnowledgeBase(domain::KnowledgeBaseConfig config);

    /**
     * @brief Updates name, description, port and system prompt; sources are untouched.
     * @throws domain::KnowledgeBaseNotFound
     */
    void updateKnowledgeBase(const domain::KnowledgeBaseConfig& config);

    /**
     * @brief Stops the listener, drops the record and its sources, and deletes managed files.
     * @throws std::logic_error while the knowledge base is starting or stopping.
     */
    bool deleteKnowledgeBase(const std::string& id);

    // --- Sources (only while stopped) ---
    /**
     * @brief Copies a file into managed storage and registers it.
     * @throws domain::SourceUnavailable if the file does not exist.
     * @throws std::logic_error while the knowledge base is running.
     */
    domain::RagSource addFileSource(const std::string& id, const std::string& path);
    domain::RagSource addWebSource(const std::string& id, const std::string& url);
    domain::RagSource addTextSource(const std::string& id, const std::string& name, const std::string& text);
    bool removeSource(const std::string& id, const std::string& sourceId);

    // --- Lifecycle ---
    /**
     * @brief Ingests every enabled source into a fresh engine and binds the listener.
     *
     * No-op when already running or starting. Unreadable sources are skipped and
     * reported; a bind failure leaves the knowledge base stopped and is rethrown.
     * If the record disappears while sources load, the new listener is closed again.
     * @throws domain::KnowledgeBaseNotFound
     * @throws domain::ListenerBindFailure
     */
    StartReport start(const std::string& id);

    void stop(const std::string& id);
    void stopAll();

    bool isRunning(const std::string& id) const;
    ServiceState state(const std::string& id) const;
    long requestCount(const std::string& id) const;

    /** @brief The running engine, or null when stopped. */
    std::shared_ptr<const RagEngine> engine(const std::string& id) const;

    /** @brief Retrieval context from a running knowledge base; nullopt when not running. */
    std::optional<std::string> getContext(const std::string& id, const std::string& query, std::size_t maxChunks) const;

    /** @brief Random alphanumeric identifier. */
    static std::string GenerateId(std::size_t length = 16);

private:
    domain::KnowledgeBaseConfig requireKnowledgeBase(const std::string& id) const;
    void requireStopped(const std::string& id) const;
    domain::RagSource addSource(const std::string& id, domain::RagSource source);
    std::filesystem::path managedDirectory(const std::string& id) const;

    std::shared_ptr<infrastructure::KnowledgeBaseRepository> m_repository;
    std::shared_ptr<const SourceProviderRegistry> m_providers;
    std::shared_ptr<ChatService> m_chat;
    ManagerOptions m_options;

    mutable std::mutex m_mutex;
    std::map<std::string, ServiceState> m_states;
    std::map<std::string, std::unique_ptr<infrastructure::ApiServer>> m_servers;
};

} // namespace ragforge::application
