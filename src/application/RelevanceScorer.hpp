/**
 * @file RelevanceScorer.hpp
 * @brief Keyword-overlap ranking of chunks against a query.
 */

#pragma once
#include <string>
#include <unordered_set>
#include <vector>
#include "domain/Document.hpp"

namespace ragforge::application {

/**
 * @struct KeywordExpansionRule
 * @brief If the lower-cased query contains any trigger, the expansions join the query tokens.
 */
struct KeywordExpansionRule {
    std::vector<std::string> triggers;
    std::vector<std::string> expansions;
};

/** @brief Tax and financial document rules (tax/tds, quarters, salary/income, deductions). */
std::vector<KeywordExpansionRule> DefaultKeywordExpansions();

/**
 * @struct ScoredChunk
 * @brief A chunk with its overlap score; pointers refer into the scored document set.
 */
struct ScoredChunk {
    const domain::Document* document = nullptr;
    const domain::Chunk* chunk = nullptr;
    int score = 0;
};

/**
 * @class RelevanceScorer
 * @brief Set-intersection scorer with numeric/date awareness and domain keyword expansion.
 */
class RelevanceScorer {
public:
    /** @brief Corpora whose total text length does not exceed this are returned whole. */
    static constexpr std::size_t kSmallCorpusThreshold = 8000;
    static constexpr std::size_t kFallbackDocuments = 2;
    static constexpr std::size_t kFallbackChunksPerDocument = 3;

    explicit RelevanceScorer(std::vector<KeywordExpansionRule> rules = DefaultKeywordExpansions());

    /** @brief Lower-cases and splits on whitespace and ". , ? !". */
    static std::vector<std::string> Tokenize(const std::string& text);

    /** @brief True for numbers (commas ignored), quarters, month abbreviations and 2024-2026. */
    static bool IsNumberOrDate(const std::string& token);

    static std::size_t TotalContentLength(const std::vector<domain::Document>& documents);

    static bool IsSmallCorpus(const std::vector<domain::Document>& documents);

    /** @brief Query tokens longer than two characters (or numeric/date), plus expansions. */
    std::unordered_set<std::string> queryTokens(const std::string& query) const;

    static int Score(const std::unordered_set<std::string>& queryTokens, const std::string& chunkText);

    /**
     * @brief Returns the best maxChunks chunks with a positive score.
     *
     * Sorted by descending score; equal scores keep document then chunk order.
     */
    std::vector<ScoredChunk> rank(const std::vector<domain::Document>& documents,
                                  const std::string& query,
                                  std::size_t maxChunks) const;

    /** @brief First chunks of the first documents that have any, used when nothing scored. */
    static std::vector<ScoredChunk> Fallback(const std::vector<domain::Document>& documents);

    const std::vector<KeywordExpansionRule>& rules() const { return m_rules; }

private:
    std::vector<KeywordExpansionRule> m_rules;
};

} // namespace ragforge::application
