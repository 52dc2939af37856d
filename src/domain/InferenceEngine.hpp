/**
 * @file InferenceEngine.hpp
 * @brief Interface to the external text-completion engine.
 */

#pragma once
#include <atomic>
#include <functional>
#include <string>
#include <vector>
#include "domain/ChatMessage.hpp"

namespace ragforge::domain {

/**
 * @class InferenceEngine
 * @brief Abstract streaming text generator.
 *
 * Implementations deliver tokens to the callback in generation order. Production
 * stops as soon as the callback returns false or the cancel flag becomes true.
 */
class InferenceEngine {
public:
    virtual ~InferenceEngine() = default;

    /** @brief Called for every generated fragment; return false to stop production. */
    using TokenCallback = std::function<bool(const std::string&)>;

    struct GenerationResult {
        std::string text;
        int tokenCount = 0;
        bool cancelled = false;
    };

    /** @brief Optional initialization (e.g., connection check, model detection). */
    virtual void initialize() {}

    /** @brief True when a model is available for generation. */
    virtual bool isReady() const = 0;

    virtual std::string getCurrentModel() const = 0;

    /**
     * @brief Generates the assistant turn for a fully built message list.
     * @param messages System message followed by the conversation.
     * @param onToken Receives each fragment as soon as it is produced.
     * @param cancel Observed between fragments; may be nullptr.
     * @return Accumulated text; partial when cancelled.
     */
    virtual GenerationResult generate(const std::vector<ChatMessage>& messages,
                                      const TokenCallback& onToken,
                                      const std::atomic<bool>* cancel) = 0;
};

} // namespace ragforge::domain
