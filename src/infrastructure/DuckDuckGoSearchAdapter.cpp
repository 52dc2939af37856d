/**
 * @file DuckDuckGoSearchAdapter.cpp
 * @brief Implementation of DuckDuckGoSearchAdapter.
 */

#include "infrastructure/DuckDuckGoSearchAdapter.hpp"
#include <iostream>
#include <httplib.h>
#include "infrastructure/SourceProviders.hpp"
#include "infrastructure/WebText.hpp"

namespace ragforge::infrastructure {

DuckDuckGoSearchAdapter::DuckDuckGoSearchAdapter(std::string endpoint) : m_endpoint(std::move(endpoint)) {}

std::string DuckDuckGoSearchAdapter::UnwrapRedirect(const std::string& href) {
    std::string link = href;
    std::size_t pos = link.find("uddg=");
    if (pos != std::string::npos) {
        std::size_t start = pos + 5;
        std::size_t end = link.find('&', start);
        link = UrlDecode(link.substr(start, end == std::string::npos ? std::string::npos : end - start));
    }
    if (link.rfind("//", 0) == 0) {
        link = "https:" + link;
    }
    return link;
}

std::vector<domain::SearchResult> DuckDuckGoSearchAdapter::ParseResults(const std::string& html, int maxResults) {
    std::vector<domain::SearchResult> results;
    if (maxResults <= 0) return results;

    // Titles and snippets come back in document order; a snippet belongs to the
    // title before it, and a title without one keeps an empty snippet.
    auto elements = FindElementsByClass(html, {"result__a", "result__snippet"});
    bool open = false;
    domain::SearchResult current;
    auto flush = [&] {
        if (open && !current.title.empty() && !current.link.empty()) {
            results.push_back(current);
        }
        open = false;
        current = domain::SearchResult();
    };

    for (const auto& element : elements) {
        if (element.matchedClass == "result__a") {
            flush();
            if (static_cast<int>(results.size()) >= maxResults) break;
            auto href = element.attributes.find("href");
            current.title = element.text;
            current.link = href == element.attributes.end() ? "" : UnwrapRedirect(href->second);
            open = true;
        } else if (open && current.snippet.empty()) {
            current.snippet = element.text;
        }
    }
    flush();
    if (static_cast<int>(results.size()) > maxResults) {
        results.resize(static_cast<std::size_t>(maxResults));
    }
    return results;
}

std::vector<domain::SearchResult> DuckDuckGoSearchAdapter::search(const std::string& query, int maxResults) {
    if (query.empty() || maxResults <= 0) return {};

    httplib::Client cli(m_endpoint);
    if (!cli.is_valid()) {
        std::cerr << "[WebSearch] Endpoint not usable (HTTPS support missing?): " << m_endpoint << std::endl;
        return {};
    }
    cli.set_follow_location(true);
    cli.set_connection_timeout(10);
    cli.set_read_timeout(15);

    httplib::Headers headers = {{"User-Agent", WebSourceProvider::kUserAgent}};
    auto res = cli.Get("/html/?q=" + UrlEncode(query), headers);
    if (!res) {
        std::cerr << "[WebSearch] Request failed: " << httplib::to_string(res.error()) << std::endl;
        return {};
    }
    if (res->status != 200) {
        std::cerr << "[WebSearch] HTTP " << res->status << std::endl;
        return {};
    }

    try {
        return ParseResults(res->body, maxResults);
    } catch (const std::exception& e) {
        std::cerr << "[WebSearch] Failed to parse results: " << e.what() << std::endl;
        return {};
    }
}

} // namespace ragforge::infrastructure
