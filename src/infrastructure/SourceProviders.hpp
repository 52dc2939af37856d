/**
 * @file SourceProviders.hpp
 * @brief The built-in file, web and literal-text source providers.
 */

#pragma once
#include <string>
#include "domain/SourceProvider.hpp"

namespace ragforge::infrastructure {

/**
 * @class FileSourceProvider
 * @brief Reads a local file by extension.
 *
 * A missing or unreadable file throws SourceUnavailable. PDF and Word extraction
 * failures are returned as an inline "Error reading ..." string so one bad file
 * still yields a document.
 */
class FileSourceProvider : public domain::SourceProvider {
public:
    std::string getContent(const domain::RagSource& source) override;
};

/**
 * @class WebSourceProvider
 * @brief Fetches a static HTML page and reduces it to text. No JavaScript is executed.
 */
class WebSourceProvider : public domain::SourceProvider {
public:
    explicit WebSourceProvider(int timeoutSeconds = 30);

    /** @throws domain::SourceUnavailable on connection failure or a non-2xx status. */
    std::string getContent(const domain::RagSource& source) override;

    static constexpr const char* kUserAgent =
        "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) RagForge/1.0";

private:
    int m_timeoutSeconds;
};

/** @brief Literal text held in the source value. */
class TextSourceProvider : public domain::SourceProvider {
public:
    std::string getContent(const domain::RagSource& source) override { return source.value; }
};

} // namespace ragforge::infrastructure
