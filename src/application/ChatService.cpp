/**
 * @file ChatService.cpp
 * @brief Implementation of ChatService.
 */

#include "application/ChatService.hpp"
#include "domain/Errors.hpp"
#include <chrono>
#include <iostream>

namespace ragforge::application {

using domain::ChatMessage;

ChatService::ChatService(std::shared_ptr<domain::InferenceEngine> engine)
    : m_engine(std::move(engine)) {}

bool ChatService::isModelLoaded() const {
    return m_engine && m_engine->isReady();
}

std::string ChatService::modelName() const {
    return m_engine ? m_engine->getCurrentModel() : std::string();
}

void ChatService::requireReady() const {
    if (!isModelLoaded()) {
        throw domain::InferenceUnavailable("No model loaded");
    }
}

std::vector<ChatMessage> ChatService::BuildPrompt(const std::vector<ChatMessage>& messages,
                                                  const std::string& context) {
    std::vector<ChatMessage> prompt;
    std::string contextSuffix = context.empty() ? std::string() : "\n\nContext:\n" + context;

    bool systemPlaced = false;
    for (const auto& msg : messages) {
        if (msg.role != ChatMessage::Role::System) continue;
        if (systemPlaced) continue;
        prompt.emplace_back(ChatMessage::Role::System, msg.content + contextSuffix);
        systemPlaced = true;
    }
    if (!systemPlaced) {
        prompt.emplace_back(ChatMessage::Role::System, std::string(kDefaultSystemPrompt) + contextSuffix);
    }

    for (const auto& msg : messages) {
        if (msg.role == ChatMessage::Role::System) continue;
        prompt.push_back(msg);
    }
    return prompt;
}

std::string ChatService::CleanToken(const std::string& token) {
    // Longer patterns first so "## OUTPUT:" is not half-eaten by "###".
    static const std::vector<std::string> kUnwanted = {
        "**OUTPUT:**", "**OUTPUT**", "## Response:", "##Response:",
        "## OUTPUT:", "##OUTPUT:", "## OUTPUT", "##OUTPUT", "OUTPUT:",
        "<|assistant|>", "<|end|>",
        "\n### ", "### ", "###",
        "Assistant:", "User:", "Human:"
    };

    std::string clean = token;
    for (const auto& unwanted : kUnwanted) {
        std::size_t pos = 0;
        while ((pos = clean.find(unwanted, pos)) != std::string::npos) {
            clean.erase(pos, unwanted.size());
        }
    }
    return clean;
}

ChatService::Reply ChatService::generate(const std::vector<ChatMessage>& messages,
                                         const std::string& context,
                                         const TokenCallback& onToken,
                                         const std::atomic<bool>* cancel) {
    Reply reply;
    if (!isModelLoaded()) {
        reply.content = kNoModelMessage;
        reply.modelMissing = true;
        if (onToken) onToken(reply.content);
        return reply;
    }

    auto prompt = BuildPrompt(messages, context);

    std::lock_guard<std::mutex> turn(m_generationMutex);
    auto started = std::chrono::steady_clock::now();

    bool consumerStopped = false;
    auto forward = [&](const std::string& token) {
        std::string clean = CleanToken(token);
        if (clean.empty()) return true;
        reply.content += clean;
        if (onToken && !onToken(clean)) {
            consumerStopped = true;
            return false;
        }
        return true;
    };

    domain::InferenceEngine::GenerationResult result;
    try {
        result = m_engine->generate(prompt, forward, cancel);
    } catch (const std::exception& e) {
        std::cerr << "[ChatService] Generation failed: " << e.what() << std::endl;
        throw;
    }

    reply.tokenCount = result.tokenCount;
    reply.cancelled = result.cancelled || consumerStopped || (cancel && cancel->load());
    if (reply.cancelled) {
        reply.content += kCancelledMarker;
    }

    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    {
        std::lock_guard<std::mutex> lock(m_statsMutex);
        m_lastStats.generatedTokens = result.tokenCount;
        m_lastStats.elapsedSeconds = elapsed;
        m_lastStats.tokensPerSecond = elapsed > 0.0 ? result.tokenCount / elapsed : 0.0;
    }
    return reply;
}

InferenceStats ChatService::lastStats() const {
    std::lock_guard<std::mutex> lock(m_statsMutex);
    return m_lastStats;
}

} // namespace ragforge::application
