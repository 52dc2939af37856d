#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include "application/RagEngine.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/SourceProviders.hpp"
#include "test/TestSupport.hpp"

using namespace ragforge;
using application::RagEngine;
using test::Contains;

namespace {

class FailingProvider : public domain::SourceProvider {
public:
    std::string getContent(const domain::RagSource& source) override {
        throw domain::SourceUnavailable("unreachable: " + source.value);
    }
};

std::shared_ptr<application::SourceProviderRegistry> textOnlyRegistry() {
    auto registry = std::make_shared<application::SourceProviderRegistry>();
    registry->registerProvider(domain::SourceKind::Text, std::make_shared<infrastructure::TextSourceProvider>());
    registry->registerProvider(domain::SourceKind::Web, std::make_shared<FailingProvider>());
    return registry;
}

domain::RagSource textSource(const std::string& id, const std::string& name, const std::string& text) {
    domain::RagSource s;
    s.id = id;
    s.kind = domain::SourceKind::Text;
    s.name = name;
    s.value = text;
    return s;
}

} // namespace

void testSmallCorpusReturnsFullDocument() {
    std::cout << "[Test] Small knowledge base returns the whole document..." << std::endl;
    RagEngine engine(textOnlyRegistry());
    engine.addSource(textSource("s1", "sky.txt", "The sky is blue. The ocean is also blue."));

    std::string context = engine.getContext("what color is the ocean");
    assert(Contains(context, "--- FULL DOCUMENT CONTEXT ---"));
    assert(Contains(context, "[Document: sky.txt]:"));
    assert(Contains(context, "The sky is blue. The ocean is also blue."));
    assert(Contains(context, "--- END CONTEXT ---"));

    assert(engine.getContext("zebra") == context);
    std::cout << "[PASS] Full-context markers regardless of query." << std::endl;
}

void testBoundary() {
    std::cout << "[Test] 8000-character boundary..." << std::endl;
    RagEngine atLimit(textOnlyRegistry());
    atLimit.addSource(textSource("a", "a.txt", test::FillerText("alpha beta gamma", 7990).substr(0, 8000 - 9) + "\nfinal ok"));
    assert(atLimit.documents()[0].content.size() == 8000);
    assert(Contains(atLimit.getContext("alpha"), "--- FULL DOCUMENT CONTEXT ---"));

    RagEngine overLimit(textOnlyRegistry());
    overLimit.addSource(textSource("a", "a.txt", atLimit.documents()[0].content + "!"));
    std::string context = overLimit.getContext("alpha");
    assert(!Contains(context, "FULL DOCUMENT CONTEXT"));
    assert(Contains(context, "--- DOCUMENT CONTEXT ---"));
    std::cout << "[PASS] At the limit is full context, one over is retrieval." << std::endl;
}

void testRankedRetrievalPrefersTaxChunk() {
    std::cout << "[Test] Two large documents, query 'Q1 tax'..." << std::endl;
    RagEngine engine(textOnlyRegistry());

    std::string docA = test::FillerText("General remarks about the filing process and office hours.", 8500);
    docA += "\nQ1 tax deducted was 5000\n";
    docA += test::FillerText("More general remarks about the filing process.", 2000);
    std::string docB = test::FillerText("Gardening notes: water the roses every morning in spring.", 9000);

    engine.addSource(textSource("a", "A.txt", docA));
    engine.addSource(textSource("b", "B.txt", docB));

    std::string context = engine.getContext("Q1 tax", 5);
    assert(Contains(context, "--- DOCUMENT CONTEXT ---"));
    auto first = context.find("[From ");
    assert(first != std::string::npos);
    assert(context.compare(first, 13, "[From A.txt]:") == 0);
    assert(Contains(context, "Q1 tax deducted was 5000"));
    std::cout << "[PASS] Top-ranked chunk comes from document A." << std::endl;
}

void testFallbackNeverEmpty() {
    std::cout << "[Test] Zero-overlap query falls back to leading chunks..." << std::endl;
    RagEngine engine(textOnlyRegistry());
    engine.addSource(textSource("a", "first.txt", test::FillerText("lorem ipsum dolor sit amet", 6000)));
    engine.addSource(textSource("b", "second.txt", test::FillerText("consectetur adipiscing elit", 6000)));
    engine.addSource(textSource("c", "third.txt", test::FillerText("sed do eiusmod tempor", 6000)));

    std::string context = engine.getContext("zzzz qqqq");
    assert(!context.empty());
    assert(Contains(context, "[From first.txt - Part 1]:"));
    assert(Contains(context, "[From second.txt - Part 1]:"));
    assert(!Contains(context, "third.txt"));
    assert(Contains(context, "--- END CONTEXT ---"));
    std::cout << "[PASS] Fallback context is never empty." << std::endl;
}

void testUnsupportedKindAndFailures() {
    std::cout << "[Test] Unsupported kinds and unreadable sources..." << std::endl;
    RagEngine engine(textOnlyRegistry());

    domain::RagSource file;
    file.id = "f";
    file.kind = domain::SourceKind::File;
    file.value = "/tmp/whatever.txt";
    bool threw = false;
    try {
        engine.addSource(file);
    } catch (const domain::SourceTypeUnsupported&) {
        threw = true;
    }
    assert(threw);

    domain::RagSource web;
    web.id = "w";
    web.kind = domain::SourceKind::Web;
    web.value = "http://unreachable.invalid";
    threw = false;
    try {
        engine.addSource(web);
    } catch (const domain::SourceUnavailable&) {
        threw = true;
    }
    assert(threw);
    assert(engine.documentCount() == 0);
    assert(engine.getContext("anything").empty());
    std::cout << "[PASS] Failures propagate and leave the store untouched." << std::endl;
}

void testNoDeduplicationAndRemoval() {
    std::cout << "[Test] Same source twice, then removal..." << std::endl;
    RagEngine engine(textOnlyRegistry());
    auto src = textSource("dup", "dup.txt", "same content");
    auto doc = engine.addSource(src);
    engine.addSource(src);
    assert(engine.documentCount() == 2);
    assert(doc.type == domain::DocumentType::Text);
    assert(doc.chunks.size() == 1);

    assert(engine.removeSource("dup"));
    assert(engine.documentCount() == 0);
    assert(!engine.removeSource("dup"));

    engine.addSource(textSource("x", "x.txt", "x"));
    engine.clear();
    assert(engine.documentCount() == 0);
    std::cout << "[PASS] No dedup; removal drops every copy." << std::endl;
}

int main() {
    testSmallCorpusReturnsFullDocument();
    testBoundary();
    testRankedRetrievalPrefersTaxChunk();
    testFallbackNeverEmpty();
    testUnsupportedKindAndFailures();
    testNoDeduplicationAndRemoval();
    std::cout << "[Test] RagEngine tests completed." << std::endl;
    return 0;
}
