/**
 * @file ChatService.hpp
 * @brief Serialized access to the shared inference engine.
 */

#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "domain/ChatMessage.hpp"
#include "domain/InferenceEngine.hpp"

namespace ragforge::application {

/**
 * @struct InferenceStats
 * @brief Throughput figures of the last completed turn.
 */
struct InferenceStats {
    int generatedTokens = 0;
    double elapsedSeconds = 0.0;
    double tokensPerSecond = 0.0;
};

/**
 * @class ChatService
 * @brief Builds prompts, filters engine output, and runs one turn at a time.
 *
 * All listeners and the in-app chat share one engine; generate() holds a mutex for
 * the whole turn so concurrent callers are served in arrival order.
 */
class ChatService {
public:
    static constexpr const char* kDefaultSystemPrompt = "You are a helpful assistant. Be concise and direct.";
    static constexpr const char* kNoModelMessage = "Error: No model loaded. Please select and load a model first.";
    static constexpr const char* kCancelledMarker = "\n[Generation stopped]";

    using TokenCallback = std::function<bool(const std::string&)>;

    struct Reply {
        std::string content;   ///< Filtered text, with the cancel marker when cancelled.
        int tokenCount = 0;
        bool cancelled = false;
        bool modelMissing = false;
        bool failed = false;   ///< The engine raised; content holds the error text.
    };

    static constexpr const char* kFailurePrefix = "Error: Generation failed: ";

    explicit ChatService(std::shared_ptr<domain::InferenceEngine> engine);

    bool isModelLoaded() const;
    std::string modelName() const;

    /** @throws domain::InferenceUnavailable when no model is loaded. */
    void requireReady() const;

    /**
     * @brief Streams one assistant turn.
     * @param messages Conversation; a default system message is added when none is present.
     * @param context Appended to the system message under "Context:" when non-empty.
     * @param onToken Receives each filtered token; returning false cancels the turn.
     * @param cancel Optional external cancel signal.
     */
    Reply generate(const std::vector<domain::ChatMessage>& messages,
                   const std::string& context,
                   const TokenCallback& onToken,
                   const std::atomic<bool>* cancel = nullptr);

    /** @brief System message (with context) first, then the non-system messages in order. */
    static std::vector<domain::ChatMessage> BuildPrompt(const std::vector<domain::ChatMessage>& messages,
                                                        const std::string& context);

    /** @brief Removes prompt-format artifacts (role headers, template tags) from a token. */
    static std::string CleanToken(const std::string& token);

    InferenceStats lastStats() const;

private:
    std::shared_ptr<domain::InferenceEngine> m_engine;
    std::mutex m_generationMutex;

    mutable std::mutex m_statsMutex;
    InferenceStats m_lastStats;
};

} // namespace ragforge::application
