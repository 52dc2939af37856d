/**
 * @file SourceProviders.cpp
 * @brief Implementation of the built-in source providers.
 */

#include "infrastructure/SourceProviders.hpp"
#include <filesystem>
#include <iostream>
#include <httplib.h>
#include "domain/Document.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/ContentExtractor.hpp"
#include "infrastructure/WebText.hpp"

namespace ragforge::infrastructure {

namespace fs = std::filesystem;

namespace {

std::string describeFailure(const ContentExtractor::ExtractionResult& result) {
    std::string reason;
    for (const auto& w : result.warnings) {
        if (!reason.empty()) reason += " ";
        reason += w;
    }
    return reason.empty() ? "unknown error" : reason;
}

} // namespace

std::string FileSourceProvider::getContent(const domain::RagSource& source) {
    const std::string& path = source.value;
    std::error_code ec;
    if (path.empty() || !fs::is_regular_file(path, ec)) {
        throw domain::SourceUnavailable("File not found: " + path);
    }

    const auto type = domain::DocumentTypeFromExtension(fs::path(path).extension().string());
    switch (type) {
        case domain::DocumentType::Pdf: {
            auto result = ContentExtractor::ExtractPdf(path, [](const std::string& status) {
                std::cout << "[FileSourceProvider] " << status << std::endl;
            });
            if (!result.success) {
                return "Error reading PDF: " + describeFailure(result);
            }
            return result.content;
        }
        case domain::DocumentType::Word: {
            auto result = ContentExtractor::ExtractWord(path);
            if (!result.success) {
                return "Error reading Word document: " + describeFailure(result);
            }
            return result.content;
        }
        default: {
            auto result = ContentExtractor::ExtractText(path);
            if (!result.success) {
                throw domain::SourceUnavailable("Cannot read " + path + ": " + describeFailure(result));
            }
            return result.content;
        }
    }
}

WebSourceProvider::WebSourceProvider(int timeoutSeconds) : m_timeoutSeconds(timeoutSeconds) {}

std::string WebSourceProvider::getContent(const domain::RagSource& source) {
    if (source.value.empty()) {
        return "";
    }

    UrlParts url = SplitUrl(source.value);
    httplib::Client cli(url.origin);
    if (!cli.is_valid()) {
        throw domain::SourceUnavailable("Unsupported URL (is HTTPS support compiled in?): " + source.value);
    }
    cli.set_follow_location(true);
    cli.set_connection_timeout(m_timeoutSeconds);
    cli.set_read_timeout(m_timeoutSeconds);

    httplib::Headers headers = {{"User-Agent", kUserAgent}, {"Accept", "text/html,*/*"}};
    auto res = cli.Get(url.path, headers);
    if (!res) {
        throw domain::SourceUnavailable("Failed to fetch " + source.value + ": " + httplib::to_string(res.error()));
    }
    if (res->status < 200 || res->status >= 300) {
        throw domain::SourceUnavailable("Failed to fetch " + source.value + ": HTTP " + std::to_string(res->status));
    }
    return HtmlToText(res->body);
}

} // namespace ragforge::infrastructure
