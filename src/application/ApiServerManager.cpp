/**
 * @file ApiServerManager.cpp
 * @brief Implementation of ApiServerManager.
 */

#include "application/ApiServerManager.hpp"
#include <iostream>
#include <random>
#include <stdexcept>
#include "domain/Errors.hpp"

namespace ragforge::application {

namespace fs = std::filesystem;

std::string ServiceStateToString(ServiceState state) {
    switch (state) {
        case ServiceState::Stopped: return "stopped";
        case ServiceState::Starting: return "starting";
        case ServiceState::Running: return "running";
        case ServiceState::Stopping: return "stopping";
    }
    return "stopped";
}

ApiServerManager::ApiServerManager(std::shared_ptr<infrastructure::KnowledgeBaseRepository> repository,
                                   std::shared_ptr<const SourceProviderRegistry> providers,
                                   std::shared_ptr<ChatService> chat,
                                   ManagerOptions options)
    : m_repository(std::move(repository)),
      m_providers(std::move(providers)),
      m_chat(std::move(chat)),
      m_options(std::move(options)) {}

ApiServerManager::~ApiServerManager() {
    stopAll();
}

std::string ApiServerManager::GenerateId(std::size_t length) {
    static const char alphanum[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<std::size_t> pick(0, sizeof(alphanum) - 2);

    std::string s;
    s.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        s += alphanum[pick(rng)];
    }
    return s;
}

std::vector<domain::KnowledgeBaseConfig> ApiServerManager::knowledgeBases() const {
    return m_repository->findAll();
}

std::optional<domain::KnowledgeBaseConfig> ApiServerManager::findKnowledgeBase(const std::string& id) const {
    return m_repository->findById(id);
}

domain::KnowledgeBaseConfig ApiServerManager::requireKnowledgeBase(const std::string& id) const {
    auto kb = m_repository->findById(id);
    if (!kb) {
        throw domain::KnowledgeBaseNotFound(id);
    }
    return *kb;
}

void ApiServerManager::requireStopped(const std::string& id) const {
    if (state(id) != ServiceState::Stopped) {
        throw std::logic_error("Knowledge base " + id + " must be stopped before its sources change");
    }
}

fs::path ApiServerManager::managedDirectory(const std::string& id) const {
    return m_options.storageRoot / "kb" / id;
}

domain::KnowledgeBaseConfig ApiServerManager::createKnowledgeBase(domain::KnowledgeBaseConfig config) {
    if (config.id.empty()) {
        config.id = GenerateId();
    }
    if (m_repository->findById(config.id)) {
        throw std::invalid_argument("Knowledge base already exists: " + config.id);
    }
    m_repository->save(config);
    std::cout << "[ApiServerManager] Created knowledge base '" << config.name << "' (" << config.id << ")" << std::endl;
    return config;
}

void ApiServerManager::updateKnowledgeBase(const domain::KnowledgeBaseConfig& config) {
    auto stored = requireKnowledgeBase(config.id);
    stored.name = config.name;
    stored.description = config.description;
    stored.port = config.port;
    stored.systemPrompt = config.systemPrompt;
    m_repository->save(stored);
}

bool ApiServerManager::deleteKnowledgeBase(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_states.find(id);
        if (it != m_states.end() &&
            (it->second == ServiceState::Starting || it->second == ServiceState::Stopping)) {
            throw std::logic_error("Knowledge base " + id + " is " + ServiceStateToString(it->second) +
                                   "; wait before deleting it");
        }
    }
    // Record first: a start() finishing after this point sees it gone and backs out.
    bool removed = m_repository->remove(id);
    stop(id);

    std::error_code ec;
    fs::remove_all(managedDirectory(id), ec);
    if (ec) {
        std::cerr << "[ApiServerManager] Could not delete files of " << id << ": " << ec.message() << std::endl;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_states.erase(id);
    return removed;
}

domain::RagSource ApiServerManager::addSource(const std::string& id, domain::RagSource source) {
    requireKnowledgeBase(id);
    requireStopped(id);
    if (source.id.empty()) {
        source.id = GenerateId();
    }
    m_repository->addSource(id, source);
    return source;
}

domain::RagSource ApiServerManager::addFileSource(const std::string& id, const std::string& path) {
    requireKnowledgeBase(id);
    requireStopped(id);

    fs::path original(path);
    std::error_code ec;
    if (!fs::is_regular_file(original, ec)) {
        throw domain::SourceUnavailable("File not found: " + path);
    }

    domain::RagSource source;
    source.id = GenerateId();
    source.kind = domain::SourceKind::File;
    source.name = original.filename().string();

    fs::path dir = managedDirectory(id);
    fs::create_directories(dir);
    fs::path target = dir / (source.id + original.extension().string());
    fs::copy_file(original, target, fs::copy_options::overwrite_existing);

    source.value = target.string();
    source.metadata["original_path"] = fs::absolute(original).string();
    return addSource(id, std::move(source));
}

domain::RagSource ApiServerManager::addWebSource(const std::string& id, const std::string& url) {
    domain::RagSource source;
    source.kind = domain::SourceKind::Web;
    source.name = url;
    source.value = url;
    return addSource(id, std::move(source));
}

domain::RagSource ApiServerManager::addTextSource(const std::string& id, const std::string& name, const std::string& text) {
    domain::RagSource source;
    source.kind = domain::SourceKind::Text;
    source.name = name.empty() ? "Text" : name;
    source.value = text;
    return addSource(id, std::move(source));
}

bool ApiServerManager::removeSource(const std::string& id, const std::string& sourceId) {
    auto kb = requireKnowledgeBase(id);
    requireStopped(id);

    for (const auto& s : kb.sources) {
        if (s.id != sourceId || s.kind != domain::SourceKind::File) continue;
        // Only delete copies we own.
        fs::path value(s.value);
        if (value.parent_path() == managedDirectory(id)) {
            std::error_code ec;
            fs::remove(value, ec);
        }
    }
    return m_repository->removeSource(id, sourceId);
}

StartReport ApiServerManager::start(const std::string& id) {
    auto kb = requireKnowledgeBase(id);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto& current = m_states[id];
        if (current != ServiceState::Stopped) {
            return {};
        }
        current = ServiceState::Starting;
    }

    StartReport report;
    std::unique_ptr<infrastructure::ApiServer> server;
    try {
        auto engine = std::make_shared<RagEngine>(m_providers, m_options.scorer);
        for (const auto& source : kb.sources) {
            if (!source.enabled) continue;
            try {
                engine->addSource(source);
            } catch (const domain::SourceUnavailable&) {
                report.failedSources.push_back(source.name);
            } catch (const domain::SourceTypeUnsupported&) {
                report.failedSources.push_back(source.name);
            }
        }
        report.documentsLoaded = engine->documentCount();

        infrastructure::ApiServerOptions serverOptions;
        serverOptions.bindAddress = m_options.bindAddress;
        serverOptions.maxChunks = m_options.apiMaxChunks;
        server = std::make_unique<infrastructure::ApiServer>(kb, engine, m_chat,
                                                             ContextAssembler(m_options.maxContextChars),
                                                             serverOptions);
        server->start();
    } catch (const std::exception& e) {
        std::cerr << "[ApiServerManager] Failed to start '" << kb.name << "': " << e.what() << std::endl;
        std::lock_guard<std::mutex> lock(m_mutex);
        m_states[id] = ServiceState::Stopped;
        throw;
    }

    bool deleted = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_repository->findById(id)) {
            m_servers[id] = std::move(server);
            m_states[id] = ServiceState::Running;
        } else {
            m_states.erase(id);
            deleted = true;
        }
    }
    if (deleted) {
        std::cerr << "[ApiServerManager] '" << kb.name << "' was deleted while starting; closing its listener" << std::endl;
        server->stop();
        throw domain::KnowledgeBaseNotFound(id);
    }

    std::cout << "[ApiServerManager] '" << kb.name << "' running with " << report.documentsLoaded
              << " document(s)";
    if (!report.failedSources.empty()) {
        std::cout << ", " << report.failedSources.size() << " source(s) skipped";
    }
    std::cout << std::endl;
    return report;
}

void ApiServerManager::stop(const std::string& id) {
    std::unique_ptr<infrastructure::ApiServer> server;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_states.find(id);
        if (it == m_states.end() || it->second != ServiceState::Running) {
            return;
        }
        it->second = ServiceState::Stopping;
        auto serverIt = m_servers.find(id);
        if (serverIt != m_servers.end()) {
            server = std::move(serverIt->second);
            m_servers.erase(serverIt);
        }
    }

    if (server) {
        server->stop();
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_states[id] = ServiceState::Stopped;
}

void ApiServerManager::stopAll() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& entry : m_servers) {
            ids.push_back(entry.first);
        }
    }
    for (const auto& id : ids) {
        stop(id);
    }
}

bool ApiServerManager::isRunning(const std::string& id) const {
    return state(id) == ServiceState::Running;
}

ServiceState ApiServerManager::state(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_states.find(id);
    return it == m_states.end() ? ServiceState::Stopped : it->second;
}

long ApiServerManager::requestCount(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_servers.find(id);
    return it == m_servers.end() ? 0 : it->second->requestCount();
}

std::shared_ptr<const RagEngine> ApiServerManager::engine(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_servers.find(id);
    return it == m_servers.end() ? nullptr : it->second->engine();
}

std::optional<std::string> ApiServerManager::getContext(const std::string& id, const std::string& query,
                                                        std::size_t maxChunks) const {
    auto running = engine(id);
    if (!running) {
        return std::nullopt;
    }
    return running->getContext(query, maxChunks);
}

} // namespace ragforge::application
