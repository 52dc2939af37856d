#include <cassert>
#include <fstream>
#include <iostream>
#include <memory>
#include "TestSupport.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/KnowledgeBaseRepository.hpp"

using namespace ragforge;
using infrastructure::KnowledgeBaseRepository;
using infrastructure::PersistenceService;

namespace {

domain::KnowledgeBaseConfig makeConfig(const std::string& id, int port) {
    domain::KnowledgeBaseConfig kb;
    kb.id = id;
    kb.name = "KB " + id;
    kb.description = "About " + id;
    kb.port = port;
    kb.systemPrompt = "Answer from the documents.";
    return kb;
}

domain::RagSource makeSource(const std::string& id, domain::SourceKind kind, const std::string& value) {
    domain::RagSource s;
    s.id = id;
    s.kind = kind;
    s.name = id + " name";
    s.value = value;
    return s;
}

} // namespace

void testPersistAndReload() {
    std::cout << "[Test] Records survive a reload..." << std::endl;
    test::TempDir dir("ragforge_repo");
    auto file = dir.path() / "knowledge_bases.json";
    auto persistence = std::make_shared<PersistenceService>();

    {
        KnowledgeBaseRepository repo(file, persistence);
        repo.load();
        assert(repo.findAll().empty());

        repo.save(makeConfig("alpha", 5001));
        repo.save(makeConfig("beta", 5002));
        auto web = makeSource("s1", domain::SourceKind::Web, "https://example.com");
        web.enabled = false;
        repo.addSource("alpha", web);
        auto doc = makeSource("s2", domain::SourceKind::File, "/data/kb/alpha/s2.pdf");
        doc.metadata["original_path"] = "/home/u/report.pdf";
        repo.addSource("alpha", doc);
        repo.flush();
    }
    assert(std::filesystem::exists(file));

    KnowledgeBaseRepository reloaded(file);
    reloaded.load();
    auto all = reloaded.findAll();
    assert(all.size() == 2);
    auto alpha = reloaded.findById("alpha");
    assert(alpha);
    assert(alpha->port == 5001);
    assert(alpha->description == "About alpha");
    assert(alpha->systemPrompt == "Answer from the documents.");
    assert(alpha->sources.size() == 2);
    assert(alpha->sources[0].kind == domain::SourceKind::Web);
    assert(!alpha->sources[0].enabled);
    assert(alpha->sources[1].metadata.at("original_path") == "/home/u/report.pdf");
    assert(!reloaded.findById("gamma"));
    persistence->stop();
    std::cout << "[PASS] Reloaded with sources and metadata." << std::endl;
}

void testUpsertAndCascade() {
    std::cout << "[Test] Upsert and cascading delete..." << std::endl;
    test::TempDir dir("ragforge_repo");
    KnowledgeBaseRepository repo(dir.path() / "kb.json");

    repo.save(makeConfig("alpha", 5001));
    repo.addSource("alpha", makeSource("s1", domain::SourceKind::Text, "hello"));

    auto changed = makeConfig("alpha", 6001);
    changed.sources = repo.findById("alpha")->sources;
    repo.save(changed);
    assert(repo.findAll().size() == 1);
    assert(repo.findById("alpha")->port == 6001);
    assert(repo.findById("alpha")->sources.size() == 1);

    assert(repo.removeSource("alpha", "s1"));
    assert(!repo.removeSource("alpha", "s1"));

    assert(repo.remove("alpha"));
    assert(!repo.remove("alpha"));
    assert(repo.findAll().empty());

    KnowledgeBaseRepository reloaded(dir.path() / "kb.json");
    reloaded.load();
    assert(reloaded.findAll().empty());
    std::cout << "[PASS] Upsert kept one record, delete removed it from disk." << std::endl;
}

void testUnknownKnowledgeBase() {
    std::cout << "[Test] Source operations on an unknown knowledge base..." << std::endl;
    test::TempDir dir("ragforge_repo");
    KnowledgeBaseRepository repo(dir.path() / "kb.json");
    bool threw = false;
    try {
        repo.addSource("nope", makeSource("s1", domain::SourceKind::Text, "x"));
    } catch (const domain::KnowledgeBaseNotFound&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        repo.removeSource("nope", "s1");
    } catch (const domain::KnowledgeBaseNotFound&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] KnowledgeBaseNotFound raised." << std::endl;
}

void testCorruptStore() {
    std::cout << "[Test] Corrupt store..." << std::endl;
    test::TempDir dir("ragforge_repo");
    auto file = dir.path() / "kb.json";
    {
        std::ofstream out(file);
        out << "{\"knowledge_bases\": [ {\"name\": ";
    }
    KnowledgeBaseRepository repo(file);
    bool threw = false;
    try {
        repo.load();
    } catch (const domain::ConfigurationError&) {
        threw = true;
    }
    assert(threw);

    auto records = KnowledgeBaseRepository::Deserialize(R"({"knowledge_bases":[{"id":"x","sources":[{"id":"s","type":"ftp"}]}]})");
    assert(records.size() == 1);
    assert(records[0].name == "New RAG Service");
    assert(records[0].port == domain::kDefaultServicePort);
    assert(records[0].sources[0].kind == domain::SourceKind::Other);
    std::cout << "[PASS] Parse errors surface, missing fields take defaults." << std::endl;
}

int main() {
    testPersistAndReload();
    testUpsertAndCascade();
    testUnknownKnowledgeBase();
    testCorruptStore();
    std::cout << "[Test] KnowledgeBaseRepository tests completed." << std::endl;
    return 0;
}
