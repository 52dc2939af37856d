/**
 * @file OllamaInferenceEngine.cpp
 * @brief Implementation of the OllamaInferenceEngine class.
 */

#include "infrastructure/OllamaInferenceEngine.hpp"
#include <iostream>
#include <stdexcept>
#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace ragforge::infrastructure {

namespace {

const std::vector<std::string> kModelPriorities = {
    "qwen2.5:7b",
    "qwen2.5",
    "llama3",
    "mistral",
    "gemma",
    "deepseek-coder"
};

std::string baseName(const std::string& model) {
    auto colon = model.find(':');
    return colon == std::string::npos ? model : model.substr(0, colon);
}

} // namespace

OllamaInferenceEngine::OllamaInferenceEngine(std::string host, int port, std::string model, int maxGenerationTokens)
    : m_host(std::move(host)), m_port(port), m_preferredModel(std::move(model)),
      m_maxGenerationTokens(maxGenerationTokens) {}

std::optional<std::vector<std::string>> OllamaInferenceEngine::listModels() const {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(3);
    cli.set_read_timeout(5); // Short timeout for detection

    auto res = cli.Get("/api/tags");
    if (!res || res->status != 200) {
        return std::nullopt;
    }

    std::vector<std::string> models;
    try {
        auto body = json::parse(res->body);
        if (body.contains("models") && body["models"].is_array()) {
            for (const auto& item : body["models"]) {
                if (item.contains("name")) {
                    models.push_back(item["name"].get<std::string>());
                }
            }
        }
    } catch (const json::exception& e) {
        std::cerr << "[OllamaInferenceEngine] Error parsing model list: " << e.what() << std::endl;
        return std::nullopt;
    }
    return models;
}

std::string OllamaInferenceEngine::SelectModel(const std::string& preferred, const std::vector<std::string>& available) {
    if (available.empty()) return "";

    if (!preferred.empty()) {
        for (const auto& model : available) {
            if (model == preferred || model == preferred + ":latest" || baseName(model) == preferred) {
                return model;
            }
        }
    }
    for (const auto& priority : kModelPriorities) {
        for (const auto& model : available) {
            if (model.find(priority) != std::string::npos) {
                return model;
            }
        }
    }
    return available.front();
}

void OllamaInferenceEngine::initialize() {
    auto models = listModels();

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!models) {
        std::cerr << "[OllamaInferenceEngine] Failed to list models. Is Ollama running on "
                  << m_host << ":" << m_port << "?" << std::endl;
        m_ready = false;
        return;
    }

    m_model = SelectModel(m_preferredModel, *models);
    m_ready = !m_model.empty();
    if (!m_ready) {
        std::cerr << "[OllamaInferenceEngine] No models installed." << std::endl;
    } else if (m_model != m_preferredModel) {
        std::cout << "[OllamaInferenceEngine] Auto-selected model: " << m_model << std::endl;
    } else {
        std::cout << "[OllamaInferenceEngine] Using model: " << m_model << std::endl;
    }
}

bool OllamaInferenceEngine::isReady() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_ready;
}

std::string OllamaInferenceEngine::getCurrentModel() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_model;
}

std::vector<std::string> OllamaInferenceEngine::ConsumeStreamLines(std::string& buffer, bool& done) {
    std::vector<std::string> fragments;
    std::size_t newline;
    while ((newline = buffer.find('\n')) != std::string::npos) {
        std::string line = buffer.substr(0, newline);
        buffer.erase(0, newline + 1);
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;

        json chunk;
        try {
            chunk = json::parse(line);
        } catch (const json::exception& e) {
            std::cerr << "[OllamaInferenceEngine] Skipping malformed stream line: " << e.what() << std::endl;
            continue;
        }

        if (chunk.contains("error")) {
            throw std::runtime_error("Ollama error: " + chunk["error"].dump());
        }
        if (chunk.contains("message") && chunk["message"].contains("content") &&
            chunk["message"]["content"].is_string()) {
            std::string content = chunk["message"]["content"].get<std::string>();
            if (!content.empty()) {
                fragments.push_back(std::move(content));
            }
        }
        if (chunk.value("done", false)) {
            done = true;
        }
    }
    return fragments;
}

domain::InferenceEngine::GenerationResult OllamaInferenceEngine::generate(const std::vector<domain::ChatMessage>& messages,
                                                                        const TokenCallback& onToken,
                                                                        const std::atomic<bool>* cancel) {
    GenerationResult result;
    const std::string model = getCurrentModel();

    json jsonMessages = json::array();
    for (const auto& msg : messages) {
        jsonMessages.push_back({{"role", domain::ChatMessage::RoleToString(msg.role)}, {"content", msg.content}});
    }
    json requestData = {
        {"model", model},
        {"messages", jsonMessages},
        {"stream", true},
        {"options", {{"num_predict", m_maxGenerationTokens}}}
    };

    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(600); // 10 min

    std::string buffer;
    bool done = false;
    bool stoppedByConsumer = false;
    std::string errorBody;

    httplib::Request req;
    req.method = "POST";
    req.path = "/api/chat";
    req.headers = {{"Content-Type", "application/json"}};
    req.body = requestData.dump(-1, ' ', false, json::error_handler_t::replace);
    req.content_receiver = [&](const char* data, size_t len, uint64_t, uint64_t) {
        if (cancel && cancel->load()) {
            stoppedByConsumer = true;
            return false;
        }
        buffer.append(data, len);
        std::vector<std::string> fragments;
        try {
            fragments = ConsumeStreamLines(buffer, done);
        } catch (const std::runtime_error& e) {
            errorBody = e.what();
            return false;
        }
        for (const auto& fragment : fragments) {
            result.text += fragment;
            ++result.tokenCount;
            if (onToken && !onToken(fragment)) {
                stoppedByConsumer = true;
                return false;
            }
            if (cancel && cancel->load()) {
                stoppedByConsumer = true;
                return false;
            }
        }
        return !done;
    };

    httplib::Response res;
    httplib::Error err = httplib::Error::Success;
    bool ok = cli.send(req, res, err);

    if (!errorBody.empty()) {
        throw std::runtime_error(errorBody);
    }
    if (stoppedByConsumer) {
        result.cancelled = true;
        return result;
    }
    if (done) {
        return result;
    }
    if (!ok) {
        throw std::runtime_error("Ollama request failed: " + httplib::to_string(err));
    }
    if (res.status != 200) {
        throw std::runtime_error("Ollama HTTP error " + std::to_string(res.status));
    }

    // Stream ended without a trailing newline.
    buffer += '\n';
    for (const auto& fragment : ConsumeStreamLines(buffer, done)) {
        result.text += fragment;
        ++result.tokenCount;
        if (onToken && !onToken(fragment)) {
            result.cancelled = true;
            break;
        }
    }
    return result;
}

} // namespace ragforge::infrastructure
