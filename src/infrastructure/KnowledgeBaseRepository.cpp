/**
 * @file KnowledgeBaseRepository.cpp
 * @brief Implementation of KnowledgeBaseRepository.
 */

#include "infrastructure/KnowledgeBaseRepository.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>
#include "domain/Errors.hpp"

namespace ragforge::infrastructure {

using json = nlohmann::json;

namespace {

json sourceToJson(const domain::RagSource& s) {
    return {
        {"id", s.id},
        {"type", domain::SourceKindToString(s.kind)},
        {"name", s.name},
        {"value", s.value},
        {"enabled", s.enabled},
        {"metadata", s.metadata}
    };
}

domain::RagSource sourceFromJson(const json& j) {
    domain::RagSource s;
    s.id = j.at("id").get<std::string>();
    auto kind = domain::SourceKindFromString(j.value("type", "other"));
    s.kind = kind.value_or(domain::SourceKind::Other);
    s.name = j.value("name", "");
    s.value = j.value("value", "");
    s.enabled = j.value("enabled", true);
    if (j.contains("metadata") && j["metadata"].is_object()) {
        s.metadata = j["metadata"].get<std::map<std::string, std::string>>();
    }
    return s;
}

json knowledgeBaseToJson(const domain::KnowledgeBaseConfig& kb) {
    json sources = json::array();
    for (const auto& s : kb.sources) {
        sources.push_back(sourceToJson(s));
    }
    return {
        {"id", kb.id},
        {"name", kb.name},
        {"description", kb.description},
        {"port", kb.port},
        {"system_prompt", kb.systemPrompt},
        {"sources", sources}
    };
}

domain::KnowledgeBaseConfig knowledgeBaseFromJson(const json& j) {
    domain::KnowledgeBaseConfig kb;
    kb.id = j.at("id").get<std::string>();
    kb.name = j.value("name", kb.name);
    kb.description = j.value("description", "");
    kb.port = j.value("port", domain::kDefaultServicePort);
    kb.systemPrompt = j.value("system_prompt", kb.systemPrompt);
    if (j.contains("sources") && j["sources"].is_array()) {
        for (const auto& s : j["sources"]) {
            kb.sources.push_back(sourceFromJson(s));
        }
    }
    return kb;
}

} // namespace

KnowledgeBaseRepository::KnowledgeBaseRepository(std::filesystem::path filePath,
                                                 std::shared_ptr<PersistenceService> persistence)
    : m_filePath(std::move(filePath)), m_persistence(std::move(persistence)) {}

std::string KnowledgeBaseRepository::Serialize(const std::vector<domain::KnowledgeBaseConfig>& records) {
    json root = {{"version", 1}, {"knowledge_bases", json::array()}};
    for (const auto& kb : records) {
        root["knowledge_bases"].push_back(knowledgeBaseToJson(kb));
    }
    return root.dump(2, ' ', false, json::error_handler_t::replace);
}

std::vector<domain::KnowledgeBaseConfig> KnowledgeBaseRepository::Deserialize(const std::string& jsonText) {
    std::vector<domain::KnowledgeBaseConfig> records;
    try {
        json root = json::parse(jsonText);
        if (root.contains("knowledge_bases") && root["knowledge_bases"].is_array()) {
            for (const auto& item : root["knowledge_bases"]) {
                records.push_back(knowledgeBaseFromJson(item));
            }
        }
    } catch (const json::exception& e) {
        throw domain::ConfigurationError(std::string("Invalid knowledge base store: ") + e.what());
    }
    return records;
}

void KnowledgeBaseRepository::load() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_records.clear();
    if (!std::filesystem::exists(m_filePath)) {
        return;
    }

    std::ifstream f(m_filePath);
    if (!f.is_open()) {
        throw domain::ConfigurationError("Cannot open " + m_filePath.string());
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    m_records = Deserialize(buffer.str());
    std::cout << "[KnowledgeBaseRepository] Loaded " << m_records.size() << " knowledge base(s)." << std::endl;
}

std::vector<domain::KnowledgeBaseConfig> KnowledgeBaseRepository::findAll() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records;
}

std::optional<domain::KnowledgeBaseConfig> KnowledgeBaseRepository::findById(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& kb : m_records) {
        if (kb.id == id) return kb;
    }
    return std::nullopt;
}

void KnowledgeBaseRepository::save(const domain::KnowledgeBaseConfig& config) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = std::find_if(m_records.begin(), m_records.end(),
                           [&](const domain::KnowledgeBaseConfig& kb) { return kb.id == config.id; });
    if (it != m_records.end()) {
        *it = config;
    } else {
        m_records.push_back(config);
    }
    persistLocked();
}

bool KnowledgeBaseRepository::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = std::remove_if(m_records.begin(), m_records.end(),
                             [&](const domain::KnowledgeBaseConfig& kb) { return kb.id == id; });
    if (it == m_records.end()) return false;
    m_records.erase(it, m_records.end());
    persistLocked();
    return true;
}

void KnowledgeBaseRepository::addSource(const std::string& knowledgeBaseId, const domain::RagSource& source) {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& kb : m_records) {
        if (kb.id == knowledgeBaseId) {
            kb.sources.push_back(source);
            persistLocked();
            return;
        }
    }
    throw domain::KnowledgeBaseNotFound(knowledgeBaseId);
}

bool KnowledgeBaseRepository::removeSource(const std::string& knowledgeBaseId, const std::string& sourceId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& kb : m_records) {
        if (kb.id != knowledgeBaseId) continue;
        auto it = std::remove_if(kb.sources.begin(), kb.sources.end(),
                                 [&](const domain::RagSource& s) { return s.id == sourceId; });
        if (it == kb.sources.end()) return false;
        kb.sources.erase(it, kb.sources.end());
        persistLocked();
        return true;
    }
    throw domain::KnowledgeBaseNotFound(knowledgeBaseId);
}

void KnowledgeBaseRepository::flush() {
    if (m_persistence) {
        m_persistence->flush();
    }
}

void KnowledgeBaseRepository::persistLocked() {
    std::string content = Serialize(m_records);
    if (m_persistence) {
        m_persistence->saveTextAsync(m_filePath.string(), content);
    } else if (!PersistenceService::WriteAtomically(m_filePath.string(), content)) {
        std::cerr << "[KnowledgeBaseRepository] Failed to write " << m_filePath << std::endl;
    }
}

} // namespace ragforge::infrastructure
