/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>
#include "domain/Errors.hpp"
#include "infrastructure/PathUtils.hpp"

namespace ragforge::infrastructure {

using json = nlohmann::json;

namespace {

template <typename T>
void readKey(const json& j, const char* key, T& target) {
    if (j.contains(key) && !j[key].is_null()) {
        target = j[key].get<T>();
    }
}

std::vector<application::KeywordExpansionRule> readExpansions(const json& arr) {
    if (!arr.is_array()) {
        throw domain::ConfigurationError("'keyword_expansions' must be an array");
    }
    std::vector<application::KeywordExpansionRule> rules;
    for (const auto& item : arr) {
        application::KeywordExpansionRule rule;
        rule.triggers = item.at("triggers").get<std::vector<std::string>>();
        rule.expansions = item.at("expansions").get<std::vector<std::string>>();
        rules.push_back(std::move(rule));
    }
    return rules;
}

} // namespace

AppConfig ConfigLoader::Parse(const std::string& jsonText) {
    AppConfig config;
    try {
        json j = json::parse(jsonText);
        if (!j.is_object()) {
            throw domain::ConfigurationError("settings must be a JSON object");
        }

        readKey(j, "ollama_host", config.ollamaHost);
        readKey(j, "ollama_port", config.ollamaPort);
        readKey(j, "model", config.model);
        readKey(j, "bind_address", config.bindAddress);
        readKey(j, "context_window_tokens", config.contextWindowTokens);
        readKey(j, "reserved_generation_tokens", config.reservedGenerationTokens);
        readKey(j, "max_generation_tokens", config.maxGenerationTokens);
        readKey(j, "chat_max_chunks", config.chatMaxChunks);
        readKey(j, "api_max_chunks", config.apiMaxChunks);
        readKey(j, "web_search_results", config.webSearchResults);

        if (j.contains("storage_root") && j["storage_root"].is_string()) {
            config.storageRoot = j["storage_root"].get<std::string>();
        }
        if (j.contains("keyword_expansions")) {
            config.keywordExpansions = readExpansions(j["keyword_expansions"]);
        }
    } catch (const json::exception& e) {
        throw domain::ConfigurationError(std::string("Invalid settings: ") + e.what());
    }

    if (config.chatMaxChunks < 1 || config.apiMaxChunks < 1) {
        throw domain::ConfigurationError("chunk limits must be at least 1");
    }
    if (config.reservedGenerationTokens >= config.contextWindowTokens) {
        throw domain::ConfigurationError("reserved_generation_tokens must be below context_window_tokens");
    }
    return config;
}

AppConfig ConfigLoader::Load(const std::filesystem::path& configPath) {
    AppConfig config;
    if (!std::filesystem::exists(configPath)) {
        std::cout << "[ConfigLoader] No settings at " << configPath << ", using defaults." << std::endl;
    } else {
        std::ifstream f(configPath);
        if (!f.is_open()) {
            throw domain::ConfigurationError("Cannot open " + configPath.string());
        }
        std::stringstream buffer;
        buffer << f.rdbuf();
        config = Parse(buffer.str());
    }

    if (config.storageRoot.empty()) {
        config.storageRoot = PathUtils::GetStorageRoot();
    }
    return config;
}

} // namespace ragforge::infrastructure
