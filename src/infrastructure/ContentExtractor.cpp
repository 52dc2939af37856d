/**
 * @file ContentExtractor.cpp
 * @brief Implementation of ContentExtractor.
 */

#include "infrastructure/ContentExtractor.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include "infrastructure/WebText.hpp"

namespace ragforge::infrastructure {

namespace fs = std::filesystem;

namespace {
// Scanned PDFs often carry a few stray characters in their text layer.
constexpr std::size_t kMinPlausibleChars = 50;
}

ContentExtractor::ExtractionResult ContentExtractor::Extract(const std::string& path, StatusCallback statusCallback) {
    fs::path p(path);
    std::string ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });

    if (ext == ".pdf") {
        return ExtractPdf(path, statusCallback);
    } else if (ext == ".docx" || ext == ".doc") {
        return ExtractWord(path);
    }
    return ExtractText(path);
}

bool ContentExtractor::RunCommand(const std::string& cmd, std::string& output) {
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) return false;
    char buffer[4096];
    std::size_t n = 0;
    while ((n = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        output.append(buffer, n);
    }
    return pclose(pipe) == 0;
}

bool ContentExtractor::RunCommandWithCallback(const std::string& cmd, const StatusCallback& lineCallback) {
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        if (lineCallback) lineCallback("[Error] popen failed to start command.");
        return false;
    }
    char buffer[256];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        std::string line(buffer);
        if (!line.empty() && line.back() == '\n') line.pop_back();
        if (lineCallback) lineCallback(line);
    }
    int returnCode = pclose(pipe);
    if (returnCode != 0 && lineCallback) {
        lineCallback("[Error] Command exited with code: " + std::to_string(returnCode));
    }
    return returnCode == 0;
}

bool ContentExtractor::HasTool(const std::string& tool) {
    std::string cmd = "command -v " + tool + " >/dev/null 2>&1";
    return std::system(cmd.c_str()) == 0;
}

std::string ContentExtractor::ShellQuote(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

bool ContentExtractor::IsValidContent(const std::string& content) {
    std::size_t nonWhitespace = 0;
    for (char c : content) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            if (++nonWhitespace >= kMinPlausibleChars) return true;
        }
    }
    return false;
}

ContentExtractor::ExtractionResult ContentExtractor::ExtractPdf(const std::string& path, StatusCallback statusCallback) {
    ExtractionResult result;

    // Tier 1: embedded text layer
    std::string content;
    if (RunCommand("pdftotext -layout " + ShellQuote(path) + " - 2>/dev/null", content) && IsValidContent(content)) {
        result.content = content;
        result.success = true;
        result.method = "pdftotext";
        return result;
    }
    if (!HasTool("pdftotext")) {
        result.warnings.push_back("pdftotext (poppler-utils) is not installed.");
    }

    // Tier 2: ocrmypdf adds a text layer, cached beside the source
    if (HasTool("ocrmypdf")) {
        if (statusCallback) statusCallback("[OCR] Scanned PDF detected, running ocrmypdf...");

        fs::path inputPath(path);
        fs::path ocrDir = inputPath.parent_path() / ".ocr";
        std::error_code ec;
        fs::create_directories(ocrDir, ec);
        fs::path ocrPath = ocrDir / (inputPath.stem().string() + "_ocr.pdf");

        if (fs::exists(ocrPath)) {
            std::string cached;
            if (RunCommand("pdftotext " + ShellQuote(ocrPath.string()) + " - 2>/dev/null", cached) && IsValidContent(cached)) {
                result.content = cached;
                result.success = true;
                result.method = "ocr-cache";
                return result;
            }
        }

        std::string cmd = "ocrmypdf --jobs 4 --output-type pdf " + ShellQuote(path) + " " + ShellQuote(ocrPath.string()) + " 2>&1";
        bool ocrSuccess = RunCommandWithCallback(cmd, [&statusCallback](const std::string& line) {
            if (statusCallback && (line.find("Page") != std::string::npos || line.find("Scanning") != std::string::npos)) {
                statusCallback("[OCR] " + line);
            }
        });

        if (ocrSuccess) {
            std::string ocrContent;
            if (RunCommand("pdftotext " + ShellQuote(ocrPath.string()) + " - 2>/dev/null", ocrContent) && IsValidContent(ocrContent)) {
                result.content = ocrContent;
                result.success = true;
                result.method = "ocrmypdf";
                result.warnings.push_back("Content extracted via OCR; recognition errors are possible.");
                return result;
            }
        } else {
            fs::remove(ocrPath, ec);
            result.warnings.push_back("ocrmypdf failed to process the file.");
        }
    }

    // Tier 3: raw tesseract
    if (HasTool("tesseract")) {
        if (statusCallback) statusCallback("[OCR] Falling back to tesseract...");
        std::string raw;
        if (RunCommand("tesseract " + ShellQuote(path) + " stdout 2>/dev/null", raw) && IsValidContent(raw)) {
            result.content = raw;
            result.success = true;
            result.method = "tesseract";
            result.warnings.push_back("Content extracted via raw OCR; layout is lost.");
            return result;
        }
    }

    // Keep whatever short text layer there was rather than nothing.
    if (!content.empty()) {
        result.content = content;
        result.success = true;
        result.method = "pdftotext";
        result.warnings.push_back("Text layer is implausibly short and OCR was unavailable.");
        return result;
    }

    result.success = false;
    result.method = "failed";
    result.warnings.push_back("No text layer found and OCR was unavailable or failed.");
    return result;
}

std::string ContentExtractor::WordXmlToText(const std::string& xml) {
    std::string out;
    out.reserve(xml.size() / 4);
    std::size_t pos = 0;
    while (pos < xml.size()) {
        std::size_t lt = xml.find('<', pos);
        if (lt == std::string::npos) {
            out.append(xml, pos, std::string::npos);
            break;
        }
        out.append(xml, pos, lt - pos);
        std::size_t gt = xml.find('>', lt);
        if (gt == std::string::npos) break;

        std::string tag = xml.substr(lt + 1, gt - lt - 1);
        if (tag == "/w:p") {
            out += '\n';
        } else if (tag.rfind("w:tab", 0) == 0 && (tag.size() == 5 || tag[5] == '/' || tag[5] == ' ')) {
            out += '\t';
        } else if (tag.rfind("w:br", 0) == 0 && (tag.size() == 4 || tag[4] == '/' || tag[4] == ' ')) {
            out += '\n';
        }
        pos = gt + 1;
    }
    return DecodeHtmlEntities(out);
}

ContentExtractor::ExtractionResult ContentExtractor::ExtractWord(const std::string& path) {
    ExtractionResult result;
    std::string xml;
    if (!RunCommand("unzip -p " + ShellQuote(path) + " word/document.xml 2>/dev/null", xml) || xml.empty()) {
        result.success = false;
        result.method = "failed";
        result.warnings.push_back(HasTool("unzip") ? "Not a .docx archive (legacy .doc is not supported)."
                                                   : "unzip is not installed.");
        return result;
    }
    result.content = WordXmlToText(xml);
    result.success = true;
    result.method = "docx-xml";
    return result;
}

ContentExtractor::ExtractionResult ContentExtractor::ExtractText(const std::string& path) {
    ExtractionResult result;
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        result.success = false;
        result.warnings.push_back("Could not open file.");
        return result;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    result.content = buffer.str();
    result.success = true;
    result.method = "text-read";
    return result;
}

} // namespace ragforge::infrastructure
