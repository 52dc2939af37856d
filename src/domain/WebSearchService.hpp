/**
 * @file WebSearchService.hpp
 * @brief Interface for live web search used as optional chat context.
 */

#pragma once
#include <string>
#include <vector>

namespace ragforge::domain {

struct SearchResult {
    std::string title;
    std::string link;
    std::string snippet;
};

class WebSearchService {
public:
    virtual ~WebSearchService() = default;

    /** @brief Returns at most maxResults hits; an empty list on any failure. */
    virtual std::vector<SearchResult> search(const std::string& query, int maxResults) = 0;
};

} // namespace ragforge::domain
