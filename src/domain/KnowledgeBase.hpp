/**
 * @file KnowledgeBase.hpp
 * @brief Persisted configuration of one independently servable knowledge base.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/RagSource.hpp"

namespace ragforge::domain {

constexpr int kDefaultServicePort = 5001;

/**
 * @struct KnowledgeBaseConfig
 * @brief A named collection of sources plus the port and system prompt it is served with.
 */
struct KnowledgeBaseConfig {
    std::string id;
    std::string name = "New RAG Service";
    std::string description;
    int port = kDefaultServicePort;
    std::string systemPrompt = "You are a helpful AI assistant.";
    std::vector<RagSource> sources;
};

} // namespace ragforge::domain
