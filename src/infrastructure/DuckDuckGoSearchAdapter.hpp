/**
 * @file DuckDuckGoSearchAdapter.hpp
 * @brief WebSearchService backed by the DuckDuckGo HTML endpoint.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/WebSearchService.hpp"

namespace ragforge::infrastructure {

class DuckDuckGoSearchAdapter : public domain::WebSearchService {
public:
    explicit DuckDuckGoSearchAdapter(std::string endpoint = "https://html.duckduckgo.com");

    std::vector<domain::SearchResult> search(const std::string& query, int maxResults) override;

    /** @brief Extracts result__a / result__snippet pairs from a results page. */
    static std::vector<domain::SearchResult> ParseResults(const std::string& html, int maxResults);

    /**
     * @brief Resolves "//duckduckgo.com/l/?uddg=<encoded>&..." redirects to the target URL.
     * @param href Attribute value as parsed, entities already decoded.
     */
    static std::string UnwrapRedirect(const std::string& href);

private:
    std::string m_endpoint;
};

} // namespace ragforge::infrastructure
