/**
 * @file WebText.cpp
 * @brief URL helpers and gumbo-based HTML text extraction.
 */

#include "infrastructure/WebText.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <gumbo.h>

namespace ragforge::infrastructure {

namespace {

constexpr unsigned long kReplacementChar = 0xFFFD;

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

void appendUtf8(std::string& out, unsigned long cp) {
    if (cp == 0 || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
        cp = kReplacementChar;
    }
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

struct GumboOutputDeleter {
    void operator()(GumboOutput* output) const {
        gumbo_destroy_output(&kGumboDefaultOptions, output);
    }
};
using GumboOutputPtr = std::unique_ptr<GumboOutput, GumboOutputDeleter>;

GumboOutputPtr parseHtml(const std::string& html) {
    return GumboOutputPtr(gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size()));
}

const GumboVector* childrenOf(const GumboNode* node) {
    if (node->type == GUMBO_NODE_DOCUMENT) return &node->v.document.children;
    if (node->type == GUMBO_NODE_ELEMENT || node->type == GUMBO_NODE_TEMPLATE) return &node->v.element.children;
    return nullptr;
}

bool isHiddenElement(const GumboNode* node) {
    if (node->type != GUMBO_NODE_ELEMENT) return false;
    GumboTag tag = node->v.element.tag;
    return tag == GUMBO_TAG_SCRIPT || tag == GUMBO_TAG_STYLE || tag == GUMBO_TAG_NOSCRIPT;
}

void collectText(const GumboNode* node, std::string& out) {
    switch (node->type) {
        case GUMBO_NODE_TEXT:
        case GUMBO_NODE_CDATA:
        case GUMBO_NODE_WHITESPACE:
            out += node->v.text.text;
            out += ' ';
            return;
        default:
            break;
    }
    if (isHiddenElement(node)) return;

    const GumboVector* children = childrenOf(node);
    if (!children) return;
    for (unsigned int i = 0; i < children->length; ++i) {
        collectText(static_cast<const GumboNode*>(children->data[i]), out);
    }
}

// U+00A0 is what &nbsp; parses to; it separates words like a plain space.
std::string normalizeText(std::string text) {
    std::size_t pos = 0;
    while ((pos = text.find("\xC2\xA0", pos)) != std::string::npos) {
        text.replace(pos, 2, " ");
    }
    return CollapseWhitespace(text);
}

std::string nodeText(const GumboNode* node) {
    std::string raw;
    collectText(node, raw);
    return normalizeText(raw);
}

std::string classMatch(const GumboElement& element, const std::vector<std::string>& classes) {
    const GumboAttribute* attr = gumbo_get_attribute(&element.attributes, "class");
    if (!attr) return "";
    std::istringstream tokens(attr->value);
    std::string token;
    while (tokens >> token) {
        if (std::find(classes.begin(), classes.end(), token) != classes.end()) return token;
    }
    return "";
}

void findByClass(const GumboNode* node, const std::vector<std::string>& classes, std::vector<HtmlElement>& out) {
    if (isHiddenElement(node)) return;
    if (node->type == GUMBO_NODE_ELEMENT) {
        std::string matched = classMatch(node->v.element, classes);
        if (!matched.empty()) {
            HtmlElement element;
            element.matchedClass = matched;
            const GumboVector& attrs = node->v.element.attributes;
            for (unsigned int i = 0; i < attrs.length; ++i) {
                const auto* attr = static_cast<const GumboAttribute*>(attrs.data[i]);
                element.attributes[attr->name] = attr->value;
            }
            element.text = nodeText(node);
            out.push_back(std::move(element));
            return;
        }
    }

    const GumboVector* children = childrenOf(node);
    if (!children) return;
    for (unsigned int i = 0; i < children->length; ++i) {
        findByClass(static_cast<const GumboNode*>(children->data[i]), classes, out);
    }
}

} // namespace

UrlParts SplitUrl(const std::string& url) {
    UrlParts parts;
    std::string rest = url;
    std::string scheme = "http";

    auto sep = url.find("://");
    if (sep != std::string::npos) {
        scheme = toLower(url.substr(0, sep));
        rest = url.substr(sep + 3);
    }

    auto slash = rest.find_first_of("/?#");
    std::string host = rest.substr(0, slash);
    if (slash != std::string::npos) {
        parts.path = rest.substr(slash);
        if (parts.path[0] != '/') parts.path = "/" + parts.path;
        auto hash = parts.path.find('#');
        if (hash != std::string::npos) parts.path.erase(hash);
        if (parts.path.empty()) parts.path = "/";
    }
    parts.origin = scheme + "://" + host;
    return parts;
}

std::string UrlEncode(const std::string& value) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

std::string UrlDecode(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%' && i + 2 < value.size() &&
                   std::isxdigit(static_cast<unsigned char>(value[i + 1])) &&
                   std::isxdigit(static_cast<unsigned char>(value[i + 2]))) {
            out += static_cast<char>(std::strtol(value.substr(i + 1, 2).c_str(), nullptr, 16));
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

std::string DecodeHtmlEntities(const std::string& html) {
    static const std::map<std::string, std::string> named = {
        {"amp", "&"}, {"lt", "<"}, {"gt", ">"}, {"quot", "\""}, {"apos", "'"},
        {"nbsp", " "}, {"ndash", "\xE2\x80\x93"}, {"mdash", "\xE2\x80\x94"},
        {"hellip", "\xE2\x80\xA6"}, {"copy", "\xC2\xA9"}, {"reg", "\xC2\xAE"},
        {"lsquo", "\xE2\x80\x98"}, {"rsquo", "\xE2\x80\x99"},
        {"ldquo", "\xE2\x80\x9C"}, {"rdquo", "\xE2\x80\x9D"}
    };

    std::string out;
    out.reserve(html.size());
    std::size_t i = 0;
    while (i < html.size()) {
        if (html[i] != '&') {
            out += html[i++];
            continue;
        }
        std::size_t semi = html.find(';', i + 1);
        if (semi == std::string::npos || semi - i > 10) {
            out += html[i++];
            continue;
        }
        std::string entity = html.substr(i + 1, semi - i - 1);
        if (!entity.empty() && entity[0] == '#') {
            bool isHex = entity.size() > 1 && (entity[1] == 'x' || entity[1] == 'X');
            std::string digits = entity.substr(isHex ? 2 : 1);
            char* end = nullptr;
            unsigned long cp = std::strtoul(digits.c_str(), &end, isHex ? 16 : 10);
            if (!digits.empty() && end && *end == '\0') {
                appendUtf8(out, cp);
                i = semi + 1;
                continue;
            }
        } else {
            auto it = named.find(entity);
            if (it != named.end()) {
                out += it->second;
                i = semi + 1;
                continue;
            }
        }
        out += html[i++];
    }
    return out;
}

std::string CollapseWhitespace(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool pendingSpace = false;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pendingSpace = !out.empty();
        } else {
            if (pendingSpace) out += ' ';
            pendingSpace = false;
            out += c;
        }
    }
    return out;
}

std::string HtmlToText(const std::string& html) {
    auto output = parseHtml(html);
    if (!output) return "";
    return nodeText(output->document);
}

std::vector<HtmlElement> FindElementsByClass(const std::string& html, const std::vector<std::string>& classes) {
    std::vector<HtmlElement> found;
    auto output = parseHtml(html);
    if (!output) return found;
    findByClass(output->document, classes, found);
    return found;
}

} // namespace ragforge::infrastructure
