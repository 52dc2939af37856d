/**
 * @file RagForgeApp.cpp
 * @brief Implementation of the RagForgeApp class.
 */
#include "app/RagForgeApp.hpp"

#include <atomic>
#include <csignal>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "domain/Errors.hpp"
#include "infrastructure/DuckDuckGoSearchAdapter.hpp"
#include "infrastructure/OllamaInferenceEngine.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/SourceProviders.hpp"

namespace ragforge::app {

namespace {

std::atomic<bool> g_generating{false};
std::atomic<bool> g_cancelGeneration{false};
std::atomic<bool> g_quit{false};

void OnInterrupt(int) {
    if (g_generating.load()) {
        g_cancelGeneration = true;
    } else {
        g_quit = true;
    }
}

void InstallInterruptHandler() {
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = OnInterrupt;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0; // no SA_RESTART: a blocked read returns so the loop can exit
    sigaction(SIGINT, &action, nullptr);
}

std::string Rest(std::istringstream& in) {
    std::string rest;
    std::getline(in, rest);
    auto start = rest.find_first_not_of(" \t");
    return start == std::string::npos ? std::string() : rest.substr(start);
}

} // namespace

CommandLine RagForgeApp::ParseCommandLine(const std::vector<std::string>& args) {
    CommandLine cmd;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument(arg + " requires a value");
            }
            return args[++i];
        };

        if (arg == "--config" || arg == "-c") {
            cmd.configPath = value();
        } else if (arg == "--start") {
            cmd.startIds.push_back(value());
        } else if (arg == "--start-all") {
            cmd.startAll = true;
        } else if (arg == "--list") {
            cmd.listOnly = true;
        } else if (arg == "--help" || arg == "-h") {
            cmd.showHelp = true;
        } else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }
    return cmd;
}

std::string RagForgeApp::Usage() {
    return "Usage: ragforge [--config <settings.json>] [--start <id>]... [--start-all] [--list]\n"
           "\n"
           "Console commands:\n"
           "  /list                         knowledge bases and their state\n"
           "  /new <port> <name>            create a knowledge base\n"
           "  /delete <id>                  delete a knowledge base and its files\n"
           "  /sources <id>                 list sources\n"
           "  /add-file <id> <path>         copy a file in as a source\n"
           "  /add-web <id> <url>           add a web page source\n"
           "  /add-text <id> <name> <text>  add literal text\n"
           "  /rm-source <id> <sourceId>    remove a source\n"
           "  /start <id> | /stop <id>      control a listener\n"
           "  /kb <id|none>                 knowledge base used by this chat\n"
           "  /attach <path> | /detach      session document\n"
           "  /web on|off                   web search context\n"
           "  /reset                        new chat session\n"
           "  /quit\n"
           "Anything else is sent to the model. Ctrl+C stops a running answer.\n";
}

int RagForgeApp::Run(int argc, char** argv) {
    CommandLine cmd;
    try {
        cmd = ParseCommandLine(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n\n" << Usage();
        return 2;
    }
    if (cmd.showHelp) {
        std::cout << Usage();
        return 0;
    }

    if (!Init(cmd)) {
        Shutdown();
        return 1;
    }

    if (cmd.listOnly) {
        ListKnowledgeBases();
        Shutdown();
        return 0;
    }

    InstallInterruptHandler();
    StartRequested(cmd);
    ConsoleLoop();
    Shutdown();
    return 0;
}

bool RagForgeApp::Init(const CommandLine& cmd) {
    std::filesystem::path settings = cmd.configPath.empty()
        ? infrastructure::PathUtils::GetDefaultSettingsPath()
        : std::filesystem::path(cmd.configPath);

    try {
        m_config = infrastructure::ConfigLoader::Load(settings);
    } catch (const domain::ConfigurationError& e) {
        std::cerr << "[RagForgeApp] " << e.what() << std::endl;
        return false;
    }

    auto& services = m_services;
    services.persistenceService = std::make_shared<infrastructure::PersistenceService>();

    auto engine = std::make_shared<infrastructure::OllamaInferenceEngine>(
        m_config.ollamaHost, m_config.ollamaPort, m_config.model, m_config.maxGenerationTokens);
    engine->initialize();
    services.inferenceEngine = engine;
    services.chatService = std::make_shared<application::ChatService>(services.inferenceEngine);

    auto fileProvider = std::make_shared<infrastructure::FileSourceProvider>();
    services.providers = std::make_shared<application::SourceProviderRegistry>();
    services.providers->registerProvider(domain::SourceKind::File, fileProvider);
    services.providers->registerProvider(domain::SourceKind::Web, std::make_shared<infrastructure::WebSourceProvider>());
    services.providers->registerProvider(domain::SourceKind::Text, std::make_shared<infrastructure::TextSourceProvider>());
    services.webSearch = std::make_shared<infrastructure::DuckDuckGoSearchAdapter>();

    services.repository = std::make_shared<infrastructure::KnowledgeBaseRepository>(
        m_config.storageRoot / "knowledge_bases.json", services.persistenceService);
    try {
        services.repository->load();
    } catch (const domain::ConfigurationError& e) {
        std::cerr << "[RagForgeApp] " << e.what() << std::endl;
        return false;
    }

    const std::size_t contextBudget = application::ContextAssembler::BudgetFor(
        m_config.contextWindowTokens, m_config.reservedGenerationTokens);

    application::ManagerOptions managerOptions;
    managerOptions.storageRoot = m_config.storageRoot;
    managerOptions.bindAddress = m_config.bindAddress;
    managerOptions.apiMaxChunks = static_cast<std::size_t>(m_config.apiMaxChunks);
    managerOptions.maxContextChars = contextBudget;
    managerOptions.scorer = application::RelevanceScorer(m_config.keywordExpansions);
    services.serverManager = std::make_shared<application::ApiServerManager>(
        services.repository, services.providers, services.chatService, managerOptions);

    application::ConversationOptions conversationOptions;
    conversationOptions.maxChunks = static_cast<std::size_t>(m_config.chatMaxChunks);
    conversationOptions.webResults = m_config.webSearchResults;
    conversationOptions.dialoguesDir = m_config.storageRoot / "dialogues";
    services.conversationService = std::make_unique<application::ConversationService>(
        services.chatService, services.serverManager, fileProvider, services.webSearch,
        services.persistenceService, application::ContextAssembler(contextBudget), conversationOptions);

    std::cout << "[RagForgeApp] Storage: " << m_config.storageRoot << std::endl;
    if (!services.chatService->isModelLoaded()) {
        std::cerr << "[RagForgeApp] WARNING: no model available; chat requests will report an error." << std::endl;
    }
    return true;
}

void RagForgeApp::ListKnowledgeBases() const {
    auto kbs = m_services.serverManager->knowledgeBases();
    if (kbs.empty()) {
        std::cout << "No knowledge bases. Create one with /new <port> <name>." << std::endl;
        return;
    }
    for (const auto& kb : kbs) {
        std::cout << kb.id << "  " << kb.name << "  port " << kb.port << "  "
                  << kb.sources.size() << " source(s)  "
                  << application::ServiceStateToString(m_services.serverManager->state(kb.id));
        if (m_services.serverManager->isRunning(kb.id)) {
            std::cout << "  requests " << m_services.serverManager->requestCount(kb.id);
        }
        std::cout << std::endl;
    }
}

void RagForgeApp::StartRequested(const CommandLine& cmd) {
    std::vector<std::string> ids = cmd.startIds;
    if (cmd.startAll) {
        for (const auto& kb : m_services.serverManager->knowledgeBases()) {
            ids.push_back(kb.id);
        }
    }
    for (const auto& id : ids) {
        try {
            m_services.serverManager->start(id);
        } catch (const std::exception& e) {
            std::cerr << "[RagForgeApp] Could not start " << id << ": " << e.what() << std::endl;
        }
    }
}

void RagForgeApp::ConsoleLoop() {
    std::cout << "RagForge ready. Type /help for commands." << std::endl;
    std::string line;
    while (!g_quit.load()) {
        std::cout << "> " << std::flush;
        if (!std::getline(std::cin, line)) {
            break;
        }
        if (line.empty()) continue;

        try {
            if (line[0] == '/') {
                if (!HandleCommand(line)) break;
            } else {
                Chat(line);
            }
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << std::endl;
        }
    }
    std::cout << std::endl;
}

bool RagForgeApp::HandleCommand(const std::string& line) {
    std::istringstream in(line);
    std::string command;
    in >> command;

    auto& manager = *m_services.serverManager;
    auto& conversation = *m_services.conversationService;

    if (command == "/quit" || command == "/exit") {
        return false;
    } else if (command == "/help") {
        std::cout << Usage();
    } else if (command == "/list") {
        ListKnowledgeBases();
    } else if (command == "/new") {
        int port = 0;
        in >> port;
        domain::KnowledgeBaseConfig config;
        config.port = port > 0 ? port : domain::kDefaultServicePort;
        std::string name = Rest(in);
        if (!name.empty()) config.name = name;
        auto created = manager.createKnowledgeBase(config);
        std::cout << "Created " << created.id << std::endl;
    } else if (command == "/delete") {
        std::string id;
        in >> id;
        std::cout << (manager.deleteKnowledgeBase(id) ? "Deleted." : "No such knowledge base.") << std::endl;
    } else if (command == "/sources") {
        std::string id;
        in >> id;
        auto kb = manager.findKnowledgeBase(id);
        if (!kb) throw domain::KnowledgeBaseNotFound(id);
        for (const auto& s : kb->sources) {
            std::cout << s.id << "  [" << domain::SourceKindToString(s.kind) << "] " << s.name
                      << (s.enabled ? "" : "  (disabled)") << std::endl;
        }
    } else if (command == "/add-file") {
        std::string id;
        in >> id;
        auto source = manager.addFileSource(id, Rest(in));
        std::cout << "Added " << source.name << " (" << source.id << ")" << std::endl;
    } else if (command == "/add-web") {
        std::string id;
        std::string url;
        in >> id >> url;
        auto source = manager.addWebSource(id, url);
        std::cout << "Added " << source.name << " (" << source.id << ")" << std::endl;
    } else if (command == "/add-text") {
        std::string id;
        std::string name;
        in >> id >> name;
        auto source = manager.addTextSource(id, name, Rest(in));
        std::cout << "Added " << source.name << " (" << source.id << ")" << std::endl;
    } else if (command == "/rm-source") {
        std::string id;
        std::string sourceId;
        in >> id >> sourceId;
        std::cout << (manager.removeSource(id, sourceId) ? "Removed." : "No such source.") << std::endl;
    } else if (command == "/start") {
        std::string id;
        in >> id;
        auto report = manager.start(id);
        for (const auto& failed : report.failedSources) {
            std::cout << "  skipped: " << failed << std::endl;
        }
    } else if (command == "/stop") {
        std::string id;
        in >> id;
        manager.stop(id);
    } else if (command == "/kb") {
        std::string id;
        in >> id;
        if (id.empty() || id == "none") {
            conversation.selectKnowledgeBase(std::nullopt);
            std::cout << "Knowledge base cleared." << std::endl;
        } else {
            if (!manager.findKnowledgeBase(id)) throw domain::KnowledgeBaseNotFound(id);
            conversation.selectKnowledgeBase(id);
            if (!manager.isRunning(id)) {
                std::cout << "Note: " << id << " is not running; start it with /start " << id << std::endl;
            }
        }
    } else if (command == "/attach") {
        std::string path = Rest(in);
        if (conversation.attachDocument(path)) {
            std::cout << "Attached " << *conversation.attachedDocumentName() << std::endl;
        } else {
            std::cout << "No text could be extracted from " << path << std::endl;
        }
    } else if (command == "/detach") {
        conversation.detachDocument();
    } else if (command == "/web") {
        std::string mode;
        in >> mode;
        conversation.setWebSearchEnabled(mode == "on");
        std::cout << "Web search " << (conversation.isWebSearchEnabled() ? "enabled" : "disabled") << std::endl;
    } else if (command == "/reset") {
        conversation.reset();
    } else {
        std::cout << "Unknown command. Type /help." << std::endl;
    }
    return true;
}

void RagForgeApp::Chat(const std::string& text) {
    g_cancelGeneration = false;
    g_generating = true;
    try {
        auto reply = m_services.conversationService->sendMessage(text, [](const std::string& token) {
            std::cout << token << std::flush;
            return true;
        }, &g_cancelGeneration);
        if (reply.cancelled) {
            std::cout << application::ChatService::kCancelledMarker;
        }
        std::cout << std::endl;

        auto stats = m_services.chatService->lastStats();
        if (!reply.modelMissing && !reply.failed && stats.generatedTokens > 0) {
            std::cout << "[" << stats.generatedTokens << " tokens, "
                      << static_cast<int>(stats.tokensPerSecond * 10) / 10.0 << " tok/s]" << std::endl;
        }
    } catch (...) {
        g_generating = false;
        throw;
    }
    g_generating = false;
    g_cancelGeneration = false;
}

void RagForgeApp::Shutdown() {
    if (m_services.serverManager) {
        m_services.serverManager->stopAll();
    }
    if (m_services.repository) {
        m_services.repository->flush();
    }
    if (m_services.persistenceService) {
        m_services.persistenceService->stop();
    }
}

} // namespace ragforge::app
