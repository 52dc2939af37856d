/**
 * @file ApiServer.cpp
 * @brief Implementation of ApiServer.
 */

#include "infrastructure/ApiServer.hpp"
#include <chrono>
#include <iostream>
#include <sstream>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "domain/Errors.hpp"

namespace ragforge::infrastructure {

using json = nlohmann::json;
using domain::ChatMessage;

namespace {

std::string dumpJson(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

void writeError(httplib::Response& res, int status, const std::string& message) {
    res.status = status;
    res.set_content(dumpJson({{"error", message}}), "application/json");
}

} // namespace

ApiServer::ApiServer(domain::KnowledgeBaseConfig config,
                     std::shared_ptr<const application::RagEngine> engine,
                     std::shared_ptr<application::ChatService> chat,
                     application::ContextAssembler assembler,
                     ApiServerOptions options)
    : m_config(std::move(config)),
      m_engine(std::move(engine)),
      m_chat(std::move(chat)),
      m_assembler(assembler),
      m_options(std::move(options)),
      m_server(std::make_unique<httplib::Server>()) {
    registerRoutes();
}

ApiServer::~ApiServer() {
    stop();
}

void ApiServer::registerRoutes() {
    m_server->set_default_headers({
        {"Access-Control-Allow-Origin", "*"},
        {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
        {"Access-Control-Allow-Headers", "Content-Type, Authorization"}
    });

    m_server->set_pre_routing_handler([this](const httplib::Request&, httplib::Response&) {
        ++m_requestCount;
        return httplib::Server::HandlerResponse::Unhandled;
    });

    m_server->Options(R"(.*)", [](const httplib::Request&, httplib::Response& res) {
        res.status = 200;
    });
    m_server->Get("/", [this](const httplib::Request& req, httplib::Response& res) { handleHome(req, res); });
    m_server->Get("/health", [this](const httplib::Request& req, httplib::Response& res) { handleHealth(req, res); });
    m_server->Post("/chat", [this](const httplib::Request& req, httplib::Response& res) { handleChat(req, res); });
    m_server->Post("/chat/stream", [this](const httplib::Request& req, httplib::Response& res) { handleChatStream(req, res); });
}

void ApiServer::start() {
    if (m_running) return;

    if (!m_server->bind_to_port(m_options.bindAddress, m_config.port)) {
        throw domain::ListenerBindFailure("Cannot bind " + m_options.bindAddress + ":" +
                                          std::to_string(m_config.port) + " for '" + m_config.name + "'");
    }

    m_stopping = false;
    m_running = true;
    m_thread = std::thread([this] {
        if (!m_server->listen_after_bind() && !m_stopping) {
            std::cerr << "[ApiServer] Listener for '" << m_config.name << "' exited unexpectedly" << std::endl;
        }
        m_running = false;
    });

    // stop() is only effective once the accept loop is running.
    for (int i = 0; i < 500 && !m_server->is_running(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    std::cout << "[ApiServer] '" << m_config.name << "' started on http://" << m_options.bindAddress
              << ":" << m_config.port << std::endl;
}

void ApiServer::stop() {
    if (!m_thread.joinable()) return;

    m_stopping = true;
    m_server->stop();
    m_thread.join();
    m_running = false;
    std::cout << "[ApiServer] '" << m_config.name << "' stopped" << std::endl;
}

std::optional<std::vector<ChatMessage>> ApiServer::ParseMessages(const std::string& body) {
    json request;
    try {
        request = json::parse(body);
    } catch (const json::exception&) {
        return std::nullopt;
    }
    if (!request.is_object() || !request.contains("messages") || !request["messages"].is_array()) {
        return std::nullopt;
    }

    std::vector<ChatMessage> messages;
    for (const auto& item : request["messages"]) {
        if (!item.is_object()) return std::nullopt;
        std::string role = item.contains("role") && item["role"].is_string() ? item["role"].get<std::string>() : "";
        std::string content = item.contains("content") && item["content"].is_string() ? item["content"].get<std::string>() : "";
        // Callers cannot inject system turns; the knowledge base owns the system prompt.
        messages.emplace_back(role == "user" ? ChatMessage::Role::User : ChatMessage::Role::Assistant, content);
    }
    if (messages.empty()) return std::nullopt;
    return messages;
}

std::string ApiServer::LastUserMessage(const std::vector<ChatMessage>& messages) {
    for (auto it = messages.rbegin(); it != messages.rend(); ++it) {
        if (it->role == ChatMessage::Role::User) return it->content;
    }
    return "";
}

std::string ApiServer::SseFrame(const std::string& token) {
    return "data: " + dumpJson({{"content", token}}) + "\n\n";
}

std::string ApiServer::EscapeHtml(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out += c;
        }
    }
    return out;
}

std::vector<ChatMessage> ApiServer::withSystemPrompt(std::vector<ChatMessage> messages) const {
    messages.insert(messages.begin(), ChatMessage(ChatMessage::Role::System, m_config.systemPrompt));
    return messages;
}

bool ApiServer::prepareTurn(const httplib::Request& req, httplib::Response& res,
                            std::vector<ChatMessage>& messages, std::string& context) {
    auto parsed = ParseMessages(req.body);
    if (!parsed) {
        writeError(res, 400, "Request must contain a non-empty 'messages' array");
        return false;
    }

    try {
        m_chat->requireReady();
    } catch (const domain::InferenceUnavailable&) {
        writeError(res, 503, application::ChatService::kNoModelMessage);
        return false;
    }

    messages = withSystemPrompt(std::move(*parsed));
    application::KnowledgeSelection selection{m_config.name, m_engine};
    context = m_assembler.assembleText(LastUserMessage(messages), std::nullopt, selection, {}, m_options.maxChunks);
    return true;
}

void ApiServer::handleHome(const httplib::Request&, httplib::Response& res) {
    res.set_content(renderStatusPage(), "text/html; charset=utf-8");
}

void ApiServer::handleHealth(const httplib::Request&, httplib::Response& res) {
    res.set_content(dumpJson({{"status", "ok"}, {"service", m_config.name}}), "application/json");
}

void ApiServer::handleChat(const httplib::Request& req, httplib::Response& res) {
    try {
        std::vector<ChatMessage> messages;
        std::string context;
        if (!prepareTurn(req, res, messages, context)) return;

        auto reply = m_chat->generate(messages, context, nullptr, &m_stopping);
        json body = {
            {"model", kServedModelName},
            {"content", reply.content},
            {"token_count", reply.content.size() / 4}
        };
        res.set_content(dumpJson(body), "application/json");
    } catch (const std::exception& e) {
        std::cerr << "[ApiServer] /chat failed for '" << m_config.name << "': " << e.what() << std::endl;
        writeError(res, 500, e.what());
    }
}

void ApiServer::handleChatStream(const httplib::Request& req, httplib::Response& res) {
    std::vector<ChatMessage> messages;
    std::string context;
    try {
        if (!prepareTurn(req, res, messages, context)) return;
    } catch (const std::exception& e) {
        std::cerr << "[ApiServer] /chat/stream failed for '" << m_config.name << "': " << e.what() << std::endl;
        writeError(res, 500, e.what());
        return;
    }

    res.set_header("Cache-Control", "no-cache");
    res.set_chunked_content_provider(
        "text/event-stream",
        [this, messages, context](size_t, httplib::DataSink& sink) {
            try {
                m_chat->generate(messages, context, [&sink](const std::string& token) {
                    std::string frame = SseFrame(token);
                    // A failed write means the client went away.
                    return sink.write(frame.data(), frame.size());
                }, &m_stopping);
            } catch (const std::exception& e) {
                std::cerr << "[ApiServer] Streaming generation failed for '" << m_config.name << "': " << e.what() << std::endl;
            }
            static const std::string kDone = "data: [DONE]\n\n";
            sink.write(kDone.data(), kDone.size());
            sink.done();
            return true;
        });
}

std::string ApiServer::renderStatusPage() const {
    std::stringstream html;
    html << "<!DOCTYPE html>\n<html><head><meta charset=\"utf-8\"><title>"
         << EscapeHtml(m_config.name) << "</title>\n"
         << "<style>body{font-family:sans-serif;max-width:760px;margin:2em auto;color:#222}"
         << "code,pre{background:#f3f3f3;padding:2px 4px}li{margin:4px 0}</style></head><body>\n"
         << "<h1>" << EscapeHtml(m_config.name) << "</h1>\n";
    if (!m_config.description.empty()) {
        html << "<p>" << EscapeHtml(m_config.description) << "</p>\n";
    }
    html << "<p>Status: <b>running</b> on port " << m_config.port
         << " &middot; Requests served: " << m_requestCount.load()
         << " &middot; Documents: " << (m_engine ? m_engine->documentCount() : 0) << "</p>\n"
         << "<h2>System prompt</h2>\n<pre>" << EscapeHtml(m_config.systemPrompt) << "</pre>\n"
         << "<h2>Sources</h2>\n<ul>\n";
    int listed = 0;
    for (const auto& s : m_config.sources) {
        if (!s.enabled) continue;
        html << "<li>[" << domain::SourceKindToString(s.kind) << "] " << EscapeHtml(s.name) << "</li>\n";
        ++listed;
    }
    if (listed == 0) {
        html << "<li><i>No sources</i></li>\n";
    }
    html << "</ul>\n<h2>Endpoints</h2>\n<ul>\n"
         << "<li><code>GET /health</code></li>\n"
         << "<li><code>POST /chat</code> <code>{\"messages\":[{\"role\":\"user\",\"content\":\"...\"}]}</code></li>\n"
         << "<li><code>POST /chat/stream</code> (Server-Sent Events)</li>\n"
         << "</ul>\n</body></html>\n";
    return html.str();
}

} // namespace ragforge::infrastructure
