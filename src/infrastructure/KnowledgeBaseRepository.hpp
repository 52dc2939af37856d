/**
 * @file KnowledgeBaseRepository.hpp
 * @brief JSON-file store of knowledge-base configurations and their sources.
 */

#pragma once
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "domain/KnowledgeBase.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace ragforge::infrastructure {

/**
 * @class KnowledgeBaseRepository
 * @brief Keeps every record in memory and rewrites the whole file on each change.
 *
 * Sources are stored inside their knowledge base, so deleting a knowledge base
 * removes its sources with it.
 */
class KnowledgeBaseRepository {
public:
    /**
     * @param filePath Location of knowledge_bases.json.
     * @param persistence Writer used for atomic saves; when null, saves run synchronously.
     */
    explicit KnowledgeBaseRepository(std::filesystem::path filePath,
                                     std::shared_ptr<PersistenceService> persistence = nullptr);

    /**
     * @brief Loads the file; a missing file means an empty store.
     * @throws domain::ConfigurationError when the file cannot be parsed.
     */
    void load();

    std::vector<domain::KnowledgeBaseConfig> findAll() const;
    std::optional<domain::KnowledgeBaseConfig> findById(const std::string& id) const;

    /** @brief Inserts or replaces the record with the same id. */
    void save(const domain::KnowledgeBaseConfig& config);

    /** @return false when no such record existed. */
    bool remove(const std::string& id);

    /** @throws domain::KnowledgeBaseNotFound */
    void addSource(const std::string& knowledgeBaseId, const domain::RagSource& source);

    /** @throws domain::KnowledgeBaseNotFound */
    bool removeSource(const std::string& knowledgeBaseId, const std::string& sourceId);

    /** @brief Waits until pending writes reach the disk. */
    void flush();

    const std::filesystem::path& filePath() const { return m_filePath; }

    static std::string Serialize(const std::vector<domain::KnowledgeBaseConfig>& records);
    static std::vector<domain::KnowledgeBaseConfig> Deserialize(const std::string& jsonText);

private:
    void persistLocked();

    std::filesystem::path m_filePath;
    std::shared_ptr<PersistenceService> m_persistence;

    mutable std::mutex m_mutex;
    std::vector<domain::KnowledgeBaseConfig> m_records;
};

} // namespace ragforge::infrastructure
