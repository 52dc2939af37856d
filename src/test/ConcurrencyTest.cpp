#include <atomic>
#include <cassert>
#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <iterator>
#include <thread>
#include <vector>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "TestSupport.hpp"
#include "application/ApiServerManager.hpp"
#include "infrastructure/KnowledgeBaseRepository.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/SourceProviders.hpp"

using namespace ragforge;
using json = nlohmann::json;

namespace {
constexpr int kFirstPort = 28701;
constexpr int kSecondPort = 28702;
const char* kQuestion = R"({"messages":[{"role":"user","content":"What do otters do?"}]})";
}

void testSerializedGenerationAcrossListeners() {
    std::cout << "[Test] Concurrent requests on two listeners share one engine..." << std::endl;
    test::TempDir dir("ragforge_concurrency");
    auto engine = std::make_shared<test::ScriptedEngine>(std::vector<std::string>{"Otters", " float", "."});
    engine->setDelay(std::chrono::milliseconds(5));
    auto chat = std::make_shared<application::ChatService>(engine);

    auto registry = std::make_shared<application::SourceProviderRegistry>();
    registry->registerProvider(domain::SourceKind::Text, std::make_shared<infrastructure::TextSourceProvider>());
    application::ManagerOptions options;
    options.storageRoot = dir.path();
    application::ApiServerManager manager(
        std::make_shared<infrastructure::KnowledgeBaseRepository>(dir.path() / "kb.json"), registry, chat, options);

    std::vector<std::string> ids;
    for (int port : {kFirstPort, kSecondPort}) {
        domain::KnowledgeBaseConfig kb;
        kb.name = "KB " + std::to_string(port);
        kb.port = port;
        kb = manager.createKnowledgeBase(kb);
        manager.addTextSource(kb.id, "Otters", "Sea otters float on their backs and hold hands.");
        manager.start(kb.id);
        ids.push_back(kb.id);
    }

    const int kClients = 8;
    std::atomic<int> okReplies{0};
    std::atomic<int> okStreams{0};
    std::vector<std::thread> clients;
    for (int i = 0; i < kClients; ++i) {
        clients.emplace_back([&, i] {
            httplib::Client cli("127.0.0.1", i % 2 == 0 ? kFirstPort : kSecondPort);
            cli.set_read_timeout(30);
            if (i % 4 < 2) {
                auto res = cli.Post("/chat", kQuestion, "application/json");
                if (res && res->status == 200 && json::parse(res->body)["content"] == "Otters float.") {
                    ++okReplies;
                }
            } else {
                auto res = cli.Post("/chat/stream", kQuestion, "application/json");
                if (res && res->status == 200 && test::Contains(res->body, "data: [DONE]") &&
                    test::Contains(res->body, "\" float\"")) {
                    ++okStreams;
                }
            }
        });
    }

    // Retrieval runs alongside generation.
    std::atomic<int> contexts{0};
    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&] {
            for (int n = 0; n < 50; ++n) {
                auto ctx = manager.getContext(ids[n % 2], "otters float", 3);
                if (ctx && test::Contains(*ctx, "hold hands")) ++contexts;
            }
        });
    }

    for (auto& t : clients) t.join();
    for (auto& t : readers) t.join();

    assert(okReplies == kClients / 2);
    assert(okStreams == kClients / 2);
    assert(contexts == 200);
    assert(engine->calls() == kClients);
    assert(engine->maxConcurrent() == 1);
    assert(manager.requestCount(ids[0]) + manager.requestCount(ids[1]) == kClients);

    manager.stopAll();
    std::cout << "[PASS] " << kClients << " requests served, at most one generation at a time." << std::endl;
}

void testPersistenceUnderLoad() {
    std::cout << "[Test] Concurrent saves through the persistence worker..." << std::endl;
    test::TempDir dir("ragforge_concurrency");
    infrastructure::PersistenceService persistence;

    const int kWriters = 6;
    const int kWrites = 40;
    std::vector<std::thread> writers;
    for (int w = 0; w < kWriters; ++w) {
        writers.emplace_back([&, w] {
            auto file = (dir.path() / ("file_" + std::to_string(w) + ".txt")).string();
            for (int n = 0; n < kWrites; ++n) {
                persistence.saveTextAsync(file, "version " + std::to_string(n));
            }
        });
    }
    for (auto& t : writers) t.join();
    persistence.flush();

    for (int w = 0; w < kWriters; ++w) {
        std::ifstream in(dir.path() / ("file_" + std::to_string(w) + ".txt"));
        std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        assert(content == "version " + std::to_string(kWrites - 1));
    }
    persistence.stop();
    std::cout << "[PASS] Last submitted content won for every file." << std::endl;
}

int main() {
    testSerializedGenerationAcrossListeners();
    testPersistenceUnderLoad();
    std::cout << "[Test] Concurrency tests completed." << std::endl;
    return 0;
}
