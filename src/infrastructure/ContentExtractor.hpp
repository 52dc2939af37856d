/**
 * @file ContentExtractor.hpp
 * @brief Utility for extracting text from different file formats (PDF, Word, plain text).
 */

#pragma once
#include <functional>
#include <string>
#include <vector>

namespace ragforge::infrastructure {

/**
 * @class ContentExtractor
 * @brief Shells out to poppler, OCR and unzip tools; plain formats are read directly.
 */
class ContentExtractor {
public:
    struct ExtractionResult {
        std::string content;
        bool success = false;
        std::string method; // "pdftotext", "ocr-cache", "ocrmypdf", "tesseract", "docx-xml", "text-read"
        std::vector<std::string> warnings;
    };

    using StatusCallback = std::function<void(const std::string&)>;

    /** @brief Dispatches on the lower-cased extension. */
    static ExtractionResult Extract(const std::string& path, StatusCallback statusCallback = nullptr);

    static ExtractionResult ExtractPdf(const std::string& path, StatusCallback statusCallback = nullptr);

    /** @brief Reads word/document.xml out of a .docx archive. Legacy .doc is not supported. */
    static ExtractionResult ExtractWord(const std::string& path);

    static ExtractionResult ExtractText(const std::string& path);

    /** @brief Converts WordprocessingML to text, one line per paragraph. */
    static std::string WordXmlToText(const std::string& xml);

    /** @brief True when content holds enough non-whitespace to be a real text layer. */
    static bool IsValidContent(const std::string& content);

    static bool HasTool(const std::string& tool);

    /** @brief Wraps a value in single quotes for /bin/sh. */
    static std::string ShellQuote(const std::string& value);

private:
    /** @brief Runs cmd and captures stdout. Returns false on spawn failure or non-zero exit. */
    static bool RunCommand(const std::string& cmd, std::string& output);

    /** @brief Runs cmd and streams stdout to the callback line by line. */
    static bool RunCommandWithCallback(const std::string& cmd, const StatusCallback& lineCallback);
};

} // namespace ragforge::infrastructure
