/**
 * @file ApiServer.hpp
 * @brief HTTP/SSE listener serving chat completions for one knowledge base.
 */

#pragma once
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "application/ChatService.hpp"
#include "application/ContextAssembler.hpp"
#include "application/RagEngine.hpp"
#include "domain/ChatMessage.hpp"
#include "domain/KnowledgeBase.hpp"

namespace httplib {
class Server;
struct Request;
struct Response;
}

namespace ragforge::infrastructure {

struct ApiServerOptions {
    std::string bindAddress = "127.0.0.1";
    std::size_t maxChunks = application::RagEngine::kDefaultMaxChunks;
};

/**
 * @class ApiServer
 * @brief Routes GET /, GET /health, POST /chat and POST /chat/stream.
 *
 * Connections are dispatched to the listener's worker pool; generation itself is
 * serialized by the shared ChatService. Every response carries permissive CORS headers.
 */
class ApiServer {
public:
    static constexpr const char* kServedModelName = "ragforge-raas";

    ApiServer(domain::KnowledgeBaseConfig config,
              std::shared_ptr<const application::RagEngine> engine,
              std::shared_ptr<application::ChatService> chat,
              application::ContextAssembler assembler,
              ApiServerOptions options = ApiServerOptions());
    ~ApiServer();

    ApiServer(const ApiServer&) = delete;
    ApiServer& operator=(const ApiServer&) = delete;

    /**
     * @brief Binds the configured port and starts accepting on a background thread.
     * @throws domain::ListenerBindFailure when the port cannot be bound.
     */
    void start();

    /** @brief Stops accepting, cancels running generations and joins the listener. */
    void stop();

    bool isRunning() const { return m_running.load(); }
    long requestCount() const { return m_requestCount.load(); }
    int port() const { return m_config.port; }
    const domain::KnowledgeBaseConfig& config() const { return m_config; }
    std::shared_ptr<const application::RagEngine> engine() const { return m_engine; }

    std::string renderStatusPage() const;

    /**
     * @brief The "messages" array of a request body; nullopt when malformed or empty.
     *
     * Role "user" maps to User and every other role, "system" included, to Assistant.
     */
    static std::optional<std::vector<domain::ChatMessage>> ParseMessages(const std::string& body);

    /** @brief Content of the most recent user message, or empty. */
    static std::string LastUserMessage(const std::vector<domain::ChatMessage>& messages);

    /** @brief "data: {"content":token}\n\n" */
    static std::string SseFrame(const std::string& token);

    static std::string EscapeHtml(const std::string& text);

private:
    void registerRoutes();
    void handleHome(const httplib::Request& req, httplib::Response& res);
    void handleHealth(const httplib::Request& req, httplib::Response& res);
    void handleChat(const httplib::Request& req, httplib::Response& res);
    void handleChatStream(const httplib::Request& req, httplib::Response& res);

    /** @brief Validates the body and prepares the prompt; writes the error response on failure. */
    bool prepareTurn(const httplib::Request& req, httplib::Response& res,
                     std::vector<domain::ChatMessage>& messages, std::string& context);

    /** @brief Prepends the knowledge base's system prompt. */
    std::vector<domain::ChatMessage> withSystemPrompt(std::vector<domain::ChatMessage> messages) const;

    domain::KnowledgeBaseConfig m_config;
    std::shared_ptr<const application::RagEngine> m_engine;
    std::shared_ptr<application::ChatService> m_chat;
    application::ContextAssembler m_assembler;
    ApiServerOptions m_options;

    std::unique_ptr<httplib::Server> m_server;
    std::thread m_thread;
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_stopping{false};
    std::atomic<long> m_requestCount{0};
};

} // namespace ragforge::infrastructure
