/**
 * @file WebText.hpp
 * @brief Helpers shared by the HTTP-based adapters: URL handling and HTML-to-text.
 */

#pragma once
#include <map>
#include <string>
#include <vector>

namespace ragforge::infrastructure {

/** @brief "scheme://host[:port]" plus the path-and-query part of an absolute URL. */
struct UrlParts {
    std::string origin;
    std::string path = "/";
};

/** @brief Splits an absolute http(s) URL. A URL without a scheme is treated as http. */
UrlParts SplitUrl(const std::string& url);

/** @brief Percent-encodes everything except unreserved characters. */
std::string UrlEncode(const std::string& value);

/** @brief Reverses percent-encoding; '+' becomes a space. */
std::string UrlDecode(const std::string& value);

/**
 * @brief Replaces named and numeric character references with their UTF-8 text.
 *
 * NUL, surrogates and code points past U+10FFFF decode to U+FFFD.
 */
std::string DecodeHtmlEntities(const std::string& html);

/** @brief Collapses runs of whitespace to one space and trims the ends. */
std::string CollapseWhitespace(const std::string& text);

/**
 * @brief Parses an HTML page and returns its visible text: script and style
 *        subtrees are skipped, text nodes are joined by spaces and whitespace is collapsed.
 */
std::string HtmlToText(const std::string& html);

/** @brief An element matched by FindElementsByClass. */
struct HtmlElement {
    std::string matchedClass;
    std::map<std::string, std::string> attributes;
    std::string text;   ///< Visible text of the subtree, as HtmlToText renders it.
};

/**
 * @brief Elements whose class list contains any of the given classes, in document order.
 *
 * Matches are not searched inside an element that already matched.
 */
std::vector<HtmlElement> FindElementsByClass(const std::string& html, const std::vector<std::string>& classes);

} // namespace ragforge::infrastructure
