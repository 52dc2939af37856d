/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading application configuration (settings.json).
 *
 * Provides a unified way to access configuration without scattering JSON parsing
 * logic throughout the codebase.
 */

#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "application/RelevanceScorer.hpp"

namespace ragforge::infrastructure {

/**
 * @struct AppConfig
 * @brief Effective settings after defaults are applied.
 */
struct AppConfig {
    std::string ollamaHost = "localhost";
    int ollamaPort = 11434;
    std::string model = "qwen2.5:7b";   ///< Empty means auto-detect.

    std::filesystem::path storageRoot;  ///< Filled with PathUtils::GetStorageRoot() when absent.
    std::string bindAddress = "127.0.0.1";

    int contextWindowTokens = 8192;
    int reservedGenerationTokens = 256;
    int maxGenerationTokens = 256;

    int chatMaxChunks = 3;
    int apiMaxChunks = 5;
    int webSearchResults = 3;

    std::vector<application::KeywordExpansionRule> keywordExpansions = application::DefaultKeywordExpansions();
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json; every key is optional.
     * @param configPath Absolute path to the file. A missing file yields the defaults.
     * @throws domain::ConfigurationError if the file exists but cannot be parsed or holds
     *         values of the wrong type.
     */
    static AppConfig Load(const std::filesystem::path& configPath);

    /** @brief Parses settings from an in-memory JSON document. */
    static AppConfig Parse(const std::string& jsonText);
};

} // namespace ragforge::infrastructure
