#include <cassert>
#include <condition_variable>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <httplib.h>
#include "TestSupport.hpp"
#include "application/ApiServerManager.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/KnowledgeBaseRepository.hpp"
#include "infrastructure/SourceProviders.hpp"

using namespace ragforge;
using application::ApiServerManager;
using application::ServiceState;

namespace {

constexpr int kBasePort = 28501;

struct Fixture {
    test::TempDir dir{"ragforge_manager"};
    std::shared_ptr<test::ScriptedEngine> engine = std::make_shared<test::ScriptedEngine>();
    std::shared_ptr<infrastructure::KnowledgeBaseRepository> repository;
    std::shared_ptr<ApiServerManager> manager;

    Fixture() {
        repository = std::make_shared<infrastructure::KnowledgeBaseRepository>(dir.path() / "knowledge_bases.json");
        auto registry = std::make_shared<application::SourceProviderRegistry>();
        registry->registerProvider(domain::SourceKind::File, std::make_shared<infrastructure::FileSourceProvider>());
        registry->registerProvider(domain::SourceKind::Web, std::make_shared<infrastructure::WebSourceProvider>(2));
        registry->registerProvider(domain::SourceKind::Text, std::make_shared<infrastructure::TextSourceProvider>());

        application::ManagerOptions options;
        options.storageRoot = dir.path();
        manager = std::make_shared<ApiServerManager>(repository, registry,
                                                     std::make_shared<application::ChatService>(engine), options);
    }

    domain::KnowledgeBaseConfig create(const std::string& name, int port) {
        domain::KnowledgeBaseConfig kb;
        kb.name = name;
        kb.port = port;
        return manager->createKnowledgeBase(kb);
    }
};

/** @brief Web provider that holds start() inside source loading until released. */
class GatedProvider : public domain::SourceProvider {
public:
    std::string getContent(const domain::RagSource&) override {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_entered = true;
        m_cv.notify_all();
        m_cv.wait(lock, [this] { return m_released; });
        return "Gated page text about lighthouses.";
    }

    void waitEntered() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait(lock, [this] { return m_entered; });
    }

    void release() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_released = true;
        m_cv.notify_all();
    }

private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_entered = false;
    bool m_released = false;
};

struct GatedFixture {
    test::TempDir dir{"ragforge_manager_gated"};
    std::shared_ptr<GatedProvider> gate = std::make_shared<GatedProvider>();
    std::shared_ptr<infrastructure::KnowledgeBaseRepository> repository;
    std::shared_ptr<ApiServerManager> manager;
    domain::KnowledgeBaseConfig kb;

    explicit GatedFixture(int port) {
        repository = std::make_shared<infrastructure::KnowledgeBaseRepository>(dir.path() / "knowledge_bases.json");
        auto registry = std::make_shared<application::SourceProviderRegistry>();
        registry->registerProvider(domain::SourceKind::Web, gate);
        application::ManagerOptions options;
        options.storageRoot = dir.path();
        manager = std::make_shared<ApiServerManager>(
            repository, registry,
            std::make_shared<application::ChatService>(std::make_shared<test::ScriptedEngine>()), options);
        domain::KnowledgeBaseConfig config;
        config.name = "Lighthouses";
        config.port = port;
        kb = manager->createKnowledgeBase(config);
        manager->addWebSource(kb.id, "http://lighthouses.invalid/");
    }
};

template <typename E, typename F>
bool throwsA(F&& f) {
    try {
        f();
    } catch (const E&) {
        return true;
    }
    return false;
}

} // namespace

void testCrudAndManagedFiles() {
    std::cout << "[Test] Knowledge base CRUD and managed file copies..." << std::endl;
    Fixture fx;
    auto kb = fx.create("Handbook", kBasePort);
    assert(kb.id.size() == 16);
    assert(fx.manager->knowledgeBases().size() == 1);

    domain::KnowledgeBaseConfig duplicate;
    duplicate.id = kb.id;
    assert(throwsA<std::invalid_argument>([&] { fx.manager->createKnowledgeBase(duplicate); }));

    auto original = fx.dir.path() / "policy.md";
    {
        std::ofstream out(original);
        out << "Remote work is allowed on Fridays.";
    }
    auto fileSource = fx.manager->addFileSource(kb.id, original.string());
    auto copy = fx.dir.path() / "kb" / kb.id / (fileSource.id + ".md");
    assert(fileSource.value == copy.string());
    assert(std::filesystem::exists(copy));
    assert(fileSource.name == "policy.md");
    assert(fileSource.metadata.at("original_path") == std::filesystem::absolute(original).string());

    assert(throwsA<domain::SourceUnavailable>([&] {
        fx.manager->addFileSource(kb.id, (fx.dir.path() / "missing.pdf").string());
    }));
    assert(throwsA<domain::KnowledgeBaseNotFound>([&] { fx.manager->addTextSource("nope", "n", "t"); }));

    fx.manager->addTextSource(kb.id, "", "Lunch is at noon.");
    auto stored = fx.manager->findKnowledgeBase(kb.id);
    assert(stored->sources.size() == 2);
    assert(stored->sources[1].name == "Text");

    auto renamed = *stored;
    renamed.name = "Staff Handbook";
    renamed.sources.clear();
    fx.manager->updateKnowledgeBase(renamed);
    assert(fx.manager->findKnowledgeBase(kb.id)->name == "Staff Handbook");
    assert(fx.manager->findKnowledgeBase(kb.id)->sources.size() == 2);

    assert(fx.manager->removeSource(kb.id, fileSource.id));
    assert(!std::filesystem::exists(copy));
    assert(std::filesystem::exists(original));

    fx.manager->addFileSource(kb.id, original.string());
    assert(fx.manager->deleteKnowledgeBase(kb.id));
    assert(!std::filesystem::exists(fx.dir.path() / "kb" / kb.id));
    assert(!fx.manager->findKnowledgeBase(kb.id));
    std::cout << "[PASS] Copies created and cleaned up with their records." << std::endl;
}

void testLifecycle() {
    std::cout << "[Test] Start, stop and source edits while running..." << std::endl;
    Fixture fx;
    const int port = kBasePort + 1;
    auto kb = fx.create("Trivia", port);
    fx.manager->addTextSource(kb.id, "Otters", "Sea otters hold hands while they sleep.");
    fx.manager->addWebSource(kb.id, "http://127.0.0.1:28599/unreachable");

    assert(fx.manager->state(kb.id) == ServiceState::Stopped);
    assert(!fx.manager->getContext(kb.id, "otters", 3));
    assert(!fx.manager->engine(kb.id));

    auto report = fx.manager->start(kb.id);
    assert(report.documentsLoaded == 1);
    assert(report.failedSources.size() == 1);
    assert(report.failedSources[0] == "http://127.0.0.1:28599/unreachable");
    assert(fx.manager->isRunning(kb.id));
    assert(application::ServiceStateToString(fx.manager->state(kb.id)) == "running");

    auto again = fx.manager->start(kb.id);
    assert(again.documentsLoaded == 0 && again.failedSources.empty());
    assert(fx.manager->isRunning(kb.id));

    auto context = fx.manager->getContext(kb.id, "otters", 3);
    assert(context && test::Contains(*context, "hold hands"));

    httplib::Client cli("127.0.0.1", port);
    auto health = cli.Get("/health");
    assert(health && health->status == 200);
    assert(fx.manager->requestCount(kb.id) == 1);

    assert(throwsA<std::logic_error>([&] { fx.manager->addTextSource(kb.id, "x", "y"); }));
    assert(throwsA<std::logic_error>([&] { fx.manager->removeSource(kb.id, "whatever"); }));

    fx.manager->stop(kb.id);
    assert(fx.manager->state(kb.id) == ServiceState::Stopped);
    assert(!cli.Get("/health"));
    assert(fx.manager->requestCount(kb.id) == 0);
    fx.manager->addTextSource(kb.id, "Later", "Added after stopping.");

    report = fx.manager->start(kb.id);
    assert(report.documentsLoaded == 2);
    fx.manager->stopAll();
    assert(!fx.manager->isRunning(kb.id));
    std::cout << "[PASS] One listener per knowledge base, edits only while stopped." << std::endl;
}

void testIndependentListeners() {
    std::cout << "[Test] Two knowledge bases serve independently..." << std::endl;
    Fixture fx;
    auto first = fx.create("First", kBasePort + 2);
    auto second = fx.create("Second", kBasePort + 3);
    fx.manager->start(first.id);
    fx.manager->start(second.id);

    httplib::Client a("127.0.0.1", kBasePort + 2);
    httplib::Client b("127.0.0.1", kBasePort + 3);
    assert(a.Get("/health")->body.find("First") != std::string::npos);
    assert(b.Get("/health")->body.find("Second") != std::string::npos);

    fx.manager->stop(first.id);
    assert(!a.Get("/health"));
    assert(b.Get("/health"));
    assert(fx.manager->isRunning(second.id));
    fx.manager->stopAll();
    std::cout << "[PASS] Stopping one leaves the other serving." << std::endl;
}

void testBindFailureLeavesStopped() {
    std::cout << "[Test] Bind failure..." << std::endl;
    Fixture fx;
    const int port = kBasePort + 4;
    test::PortBlocker blocker(port);
    assert(blocker.bound());

    auto kb = fx.create("Blocked", port);
    fx.manager->addTextSource(kb.id, "t", "text");
    assert(throwsA<domain::ListenerBindFailure>([&] { fx.manager->start(kb.id); }));
    assert(fx.manager->state(kb.id) == ServiceState::Stopped);
    assert(!fx.manager->engine(kb.id));
    fx.manager->addTextSource(kb.id, "t2", "still editable");
    assert(throwsA<domain::KnowledgeBaseNotFound>([&] { fx.manager->start("unknown"); }));
    std::cout << "[PASS] Knowledge base stays stopped and editable." << std::endl;
}

void testDeleteWhileStarting() {
    std::cout << "[Test] Delete during a slow start..." << std::endl;
    const int port = kBasePort + 5;
    GatedFixture fx(port);

    std::thread starter([&] { fx.manager->start(fx.kb.id); });
    fx.gate->waitEntered();
    assert(fx.manager->state(fx.kb.id) == ServiceState::Starting);
    assert(throwsA<std::logic_error>([&] { fx.manager->deleteKnowledgeBase(fx.kb.id); }));
    assert(fx.manager->findKnowledgeBase(fx.kb.id));

    fx.gate->release();
    starter.join();
    assert(fx.manager->isRunning(fx.kb.id));

    assert(fx.manager->deleteKnowledgeBase(fx.kb.id));
    assert(!fx.manager->findKnowledgeBase(fx.kb.id));
    assert(!fx.manager->engine(fx.kb.id));
    httplib::Client cli("127.0.0.1", port);
    assert(!cli.Get("/health"));
    std::cout << "[PASS] Deletion refused until the listener is up, then closes it." << std::endl;
}

void testRecordRemovedWhileStarting() {
    std::cout << "[Test] Record removed behind a starting listener..." << std::endl;
    const int port = kBasePort + 6;
    GatedFixture fx(port);

    bool notFound = false;
    std::thread starter([&] {
        try {
            fx.manager->start(fx.kb.id);
        } catch (const domain::KnowledgeBaseNotFound&) {
            notFound = true;
        }
    });
    fx.gate->waitEntered();
    assert(fx.repository->remove(fx.kb.id));
    fx.gate->release();
    starter.join();

    assert(notFound);
    assert(fx.manager->state(fx.kb.id) == ServiceState::Stopped);
    assert(!fx.manager->isRunning(fx.kb.id));
    assert(!fx.manager->engine(fx.kb.id));
    httplib::Client cli("127.0.0.1", port);
    assert(!cli.Get("/health"));
    std::cout << "[PASS] No listener left behind for a deleted knowledge base." << std::endl;
}

int main() {
    testCrudAndManagedFiles();
    testLifecycle();
    testIndependentListeners();
    testBindFailureLeavesStopped();
    testDeleteWhileStarting();
    testRecordRemovedWhileStarting();
    std::cout << "[Test] ApiServerManager tests completed." << std::endl;
    return 0;
}
