#include <cassert>
#include <iostream>
#include <string>
#include <vector>
#include "application/RelevanceScorer.hpp"
#include "application/TextChunker.hpp"

using namespace ragforge;
using application::RelevanceScorer;

namespace {

domain::Document makeDocument(const std::string& name, const std::vector<std::string>& chunkTexts) {
    domain::Document doc;
    doc.id = name;
    doc.fileName = name;
    int i = 0;
    for (const auto& text : chunkTexts) {
        domain::Chunk c;
        c.index = i++;
        c.content = text;
        doc.content += text + "\n";
        doc.chunks.push_back(c);
    }
    return doc;
}

} // namespace

void testTokenize() {
    std::cout << "[Test] Tokenization..." << std::endl;
    auto tokens = RelevanceScorer::Tokenize("What, is THE total? Yes. Really!  ok");
    std::vector<std::string> expected = {"what", "is", "the", "total", "yes", "really", "ok"};
    assert(tokens == expected);
    std::cout << "[PASS] Lower-cased, split on whitespace and . , ? !" << std::endl;
}

void testShortTokensDroppedUnlessNumericOrDate() {
    std::cout << "[Test] Short-token filter..." << std::endl;
    RelevanceScorer scorer(std::vector<application::KeywordExpansionRule>{});
    auto tokens = scorer.queryTokens("is it Q1 or 42 in jan of 2025 at 7");
    assert(tokens.count("is") == 0);
    assert(tokens.count("it") == 0);
    assert(tokens.count("or") == 0);
    assert(tokens.count("q1") == 1);
    assert(tokens.count("42") == 1);
    assert(tokens.count("jan") == 1);
    assert(tokens.count("2025") == 1);
    assert(tokens.count("7") == 1);

    assert(RelevanceScorer::IsNumberOrDate("5,000"));
    assert(RelevanceScorer::IsNumberOrDate("12.5"));
    assert(RelevanceScorer::IsNumberOrDate("dec"));
    assert(!RelevanceScorer::IsNumberOrDate("ab"));
    assert(!RelevanceScorer::IsNumberOrDate("2023x"));
    std::cout << "[PASS] Numeric and date tokens survive." << std::endl;
}

void testKeywordExpansion() {
    std::cout << "[Test] Keyword expansion..." << std::endl;
    RelevanceScorer scorer;
    auto tokens = scorer.queryTokens("How much TDS this quarter?");
    assert(tokens.count("deducted") == 1);
    assert(tokens.count("challan") == 1);
    assert(tokens.count("q3") == 1);
    assert(tokens.count("salary") == 0);

    RelevanceScorer custom({{{"refund"}, {"returned", "credited"}}});
    auto customTokens = custom.queryTokens("where is my refund");
    assert(customTokens.count("credited") == 1);
    assert(customTokens.count("deducted") == 0);
    std::cout << "[PASS] Triggers add their expansion sets; rules are replaceable." << std::endl;
}

void testScoreIsUniqueIntersection() {
    std::cout << "[Test] Score counts distinct shared tokens..." << std::endl;
    RelevanceScorer scorer(std::vector<application::KeywordExpansionRule>{});
    auto q = scorer.queryTokens("ocean blue water");
    assert(RelevanceScorer::Score(q, "The ocean, the OCEAN. The ocean!") == 1);
    assert(RelevanceScorer::Score(q, "blue ocean water") == 3);
    assert(RelevanceScorer::Score(q, "nothing relevant") == 0);
    std::cout << "[PASS] Set intersection, not term frequency." << std::endl;
}

void testMonotonicity() {
    std::cout << "[Test] Superset never scores lower than subset..." << std::endl;
    RelevanceScorer scorer;
    const std::vector<std::string> queries = {"tax deducted q1", "ocean blue water", "salary section 80c"};
    for (const auto& query : queries) {
        auto q = scorer.queryTokens(query);
        std::vector<std::string> words(q.begin(), q.end());
        std::string subset;
        std::string superset;
        for (std::size_t i = 0; i < words.size(); ++i) {
            superset += words[i] + " ";
            if (i % 2 == 0) subset += words[i] + " ";
        }
        assert(RelevanceScorer::Score(q, superset + "filler") >= RelevanceScorer::Score(q, subset + "filler"));
    }
    std::cout << "[PASS] Monotonic in shared tokens." << std::endl;
}

void testSmallCorpusBoundary() {
    std::cout << "[Test] Small-corpus threshold..." << std::endl;
    domain::Document doc;
    doc.content = std::string(RelevanceScorer::kSmallCorpusThreshold, 'a');
    assert(RelevanceScorer::IsSmallCorpus({doc}));
    doc.content.pop_back();
    assert(RelevanceScorer::IsSmallCorpus({doc}));
    doc.content += "bb";
    assert(!RelevanceScorer::IsSmallCorpus({doc}));

    domain::Document half;
    half.content = std::string(4001, 'x');
    assert(!RelevanceScorer::IsSmallCorpus({half, half}));
    std::cout << "[PASS] Total length compared with 8000." << std::endl;
}

void testRankStableAndCapped() {
    std::cout << "[Test] Ranking order and cap..." << std::endl;
    RelevanceScorer scorer(std::vector<application::KeywordExpansionRule>{});
    std::vector<domain::Document> docs = {
        makeDocument("a.txt", {"apple banana", "cherry only", "apple banana cherry"}),
        makeDocument("b.txt", {"banana split", "nothing", "apple cherry"})
    };
    auto top = scorer.rank(docs, "apple banana cherry", 3);
    assert(top.size() == 3);
    assert(top[0].chunk->content == "apple banana cherry");
    assert(top[0].score == 3);
    // Equal scores keep insertion order.
    assert(top[1].chunk->content == "apple banana");
    assert(top[2].chunk->content == "apple cherry");

    auto all = scorer.rank(docs, "apple banana cherry", 100);
    assert(all.size() == 5); // "nothing" scores zero
    std::cout << "[PASS] Stable descending order, zero scores excluded." << std::endl;
}

void testFallback() {
    std::cout << "[Test] Fallback selection..." << std::endl;
    std::vector<domain::Document> docs = {
        makeDocument("empty.txt", {}),
        makeDocument("one.txt", {"1a", "1b", "1c", "1d"}),
        makeDocument("two.txt", {"2a"}),
        makeDocument("three.txt", {"3a"})
    };
    auto picked = RelevanceScorer::Fallback(docs);
    assert(picked.size() == 4);
    assert(picked[0].chunk->content == "1a");
    assert(picked[2].chunk->content == "1c");
    assert(picked[3].chunk->content == "2a");
    std::cout << "[PASS] First three chunks of the first two documents with chunks." << std::endl;
}

int main() {
    testTokenize();
    testShortTokensDroppedUnlessNumericOrDate();
    testKeywordExpansion();
    testScoreIsUniqueIntersection();
    testMonotonicity();
    testSmallCorpusBoundary();
    testRankStableAndCapped();
    testFallback();
    std::cout << "[Test] RelevanceScorer tests completed." << std::endl;
    return 0;
}
