/**
 * @file RelevanceScorer.cpp
 * @brief Implementation of RelevanceScorer.
 */

#include "application/RelevanceScorer.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace ragforge::application {

namespace {

bool IsSeparator(char c) {
    return std::isspace(static_cast<unsigned char>(c)) || c == '.' || c == ',' || c == '?' || c == '!';
}

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

bool IsNumber(const std::string& token) {
    std::string digits;
    bool hasDigit = false;
    for (char c : token) {
        if (c == ',') continue;
        if (std::isdigit(static_cast<unsigned char>(c))) {
            hasDigit = true;
        } else if (c != '.' && c != '-' && c != '+') {
            return false;
        }
        digits.push_back(c);
    }
    if (!hasDigit) return false;
    char* end = nullptr;
    std::strtod(digits.c_str(), &end);
    return end != nullptr && *end == '\0';
}

} // namespace

std::vector<KeywordExpansionRule> DefaultKeywordExpansions() {
    return {
        {{"tax", "tds"},
         {"tax", "tds", "deducted", "deduction", "amount", "challan", "deposited"}},
        {{"quarter", "quarterly"},
         {"q1", "q2", "q3", "q4", "quarter", "quarterly", "april", "june", "july",
          "september", "october", "december", "january", "march"}},
        {{"salary", "income"},
         {"salary", "income", "gross", "net", "allowance", "exemption", "section"}},
        {{"deduction", "section"},
         {"deduction", "section", "16", "10", "chapter", "vi-a", "80c", "80d"}},
    };
}

RelevanceScorer::RelevanceScorer(std::vector<KeywordExpansionRule> rules)
    : m_rules(std::move(rules)) {}

std::vector<std::string> RelevanceScorer::Tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    for (char c : text) {
        if (IsSeparator(c)) {
            if (!current.empty()) {
                tokens.push_back(ToLower(current));
                current.clear();
            }
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) tokens.push_back(ToLower(current));
    return tokens;
}

bool RelevanceScorer::IsNumberOrDate(const std::string& token) {
    if (IsNumber(token)) return true;

    static const std::unordered_set<std::string> kDatePatterns = {
        "q1", "q2", "q3", "q4", "jan", "feb", "mar", "apr", "may", "jun",
        "jul", "aug", "sep", "oct", "nov", "dec", "2024", "2025", "2026"
    };
    return kDatePatterns.count(ToLower(token)) > 0;
}

std::size_t RelevanceScorer::TotalContentLength(const std::vector<domain::Document>& documents) {
    std::size_t total = 0;
    for (const auto& doc : documents) total += doc.content.size();
    return total;
}

bool RelevanceScorer::IsSmallCorpus(const std::vector<domain::Document>& documents) {
    return TotalContentLength(documents) <= kSmallCorpusThreshold;
}

std::unordered_set<std::string> RelevanceScorer::queryTokens(const std::string& query) const {
    std::unordered_set<std::string> tokens;
    for (auto& token : Tokenize(query)) {
        if (token.size() > 2 || IsNumberOrDate(token)) {
            tokens.insert(std::move(token));
        }
    }

    std::string lowerQuery = ToLower(query);
    for (const auto& rule : m_rules) {
        bool triggered = std::any_of(rule.triggers.begin(), rule.triggers.end(),
            [&lowerQuery](const std::string& t) { return lowerQuery.find(t) != std::string::npos; });
        if (triggered) {
            tokens.insert(rule.expansions.begin(), rule.expansions.end());
        }
    }
    return tokens;
}

int RelevanceScorer::Score(const std::unordered_set<std::string>& queryTokens, const std::string& chunkText) {
    auto chunkTokens = Tokenize(chunkText);
    std::unordered_set<std::string> unique(chunkTokens.begin(), chunkTokens.end());
    int score = 0;
    for (const auto& token : unique) {
        if (queryTokens.count(token)) ++score;
    }
    return score;
}

std::vector<ScoredChunk> RelevanceScorer::rank(const std::vector<domain::Document>& documents,
                                               const std::string& query,
                                               std::size_t maxChunks) const {
    auto tokens = queryTokens(query);

    std::vector<ScoredChunk> scored;
    for (const auto& doc : documents) {
        for (const auto& chunk : doc.chunks) {
            int score = Score(tokens, chunk.content);
            if (score > 0) {
                scored.push_back({&doc, &chunk, score});
            }
        }
    }

    std::stable_sort(scored.begin(), scored.end(),
        [](const ScoredChunk& a, const ScoredChunk& b) { return a.score > b.score; });

    if (scored.size() > maxChunks) scored.resize(maxChunks);
    return scored;
}

std::vector<ScoredChunk> RelevanceScorer::Fallback(const std::vector<domain::Document>& documents) {
    std::vector<ScoredChunk> picked;
    std::size_t usedDocuments = 0;
    for (const auto& doc : documents) {
        if (usedDocuments == kFallbackDocuments) break;
        if (doc.chunks.empty()) continue;
        std::size_t take = std::min(kFallbackChunksPerDocument, doc.chunks.size());
        for (std::size_t i = 0; i < take; ++i) {
            picked.push_back({&doc, &doc.chunks[i], 0});
        }
        ++usedDocuments;
    }
    return picked;
}

} // namespace ragforge::application
