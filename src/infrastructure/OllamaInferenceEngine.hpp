/**
 * @file OllamaInferenceEngine.hpp
 * @brief Streaming InferenceEngine backed by a local Ollama server.
 */

#pragma once
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "domain/InferenceEngine.hpp"

namespace ragforge::infrastructure {

/**
 * @class OllamaInferenceEngine
 * @brief Implements InferenceEngine over POST /api/chat with stream=true.
 *
 * Ollama answers with one JSON object per line; each "message.content" fragment is
 * forwarded as soon as its line is complete.
 */
class OllamaInferenceEngine : public domain::InferenceEngine {
public:
    /**
     * @param model Preferred model; empty selects the best installed one.
     * @param maxGenerationTokens Sent as options.num_predict.
     */
    OllamaInferenceEngine(std::string host = "localhost", int port = 11434,
                          std::string model = "", int maxGenerationTokens = 256);

    /** @brief Lists installed models and picks the one to use. */
    void initialize() override;

    bool isReady() const override;
    std::string getCurrentModel() const override;

    GenerationResult generate(const std::vector<domain::ChatMessage>& messages,
                              const TokenCallback& onToken,
                              const std::atomic<bool>* cancel) override;

    /** @brief Fetches installed model names from /api/tags; nullopt when unreachable. */
    std::optional<std::vector<std::string>> listModels() const;

    /**
     * @brief The preferred model when installed (exact or tag-less match), otherwise the
     *        first match of the priority list, otherwise the first installed model.
     */
    static std::string SelectModel(const std::string& preferred, const std::vector<std::string>& available);

    /**
     * @brief Splits complete lines off buffer and returns the content fragments they carry.
     * @param done Set when a line reports "done": true.
     * @throws std::runtime_error if a line carries an "error" field.
     */
    static std::vector<std::string> ConsumeStreamLines(std::string& buffer, bool& done);

private:
    std::string m_host;
    int m_port;
    std::string m_preferredModel;
    int m_maxGenerationTokens;

    mutable std::mutex m_mutex;
    std::string m_model;
    bool m_ready = false;
};

} // namespace ragforge::infrastructure
