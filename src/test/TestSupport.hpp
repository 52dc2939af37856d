/**
 * @file TestSupport.hpp
 * @brief Shared fixtures for the test executables.
 */

#pragma once
#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include "domain/InferenceEngine.hpp"

namespace ragforge::test {

/**
 * @brief InferenceEngine replaying a fixed token list, recording the prompts it gets
 *        and the highest number of generations that ran at once.
 */
class ScriptedEngine : public domain::InferenceEngine {
public:
    explicit ScriptedEngine(std::vector<std::string> tokens = {"Hello", " world"}, bool ready = true)
        : m_tokens(std::move(tokens)), m_ready(ready) {}

    bool isReady() const override { return m_ready; }
    std::string getCurrentModel() const override { return m_ready ? "scripted" : ""; }

    GenerationResult generate(const std::vector<domain::ChatMessage>& messages,
                              const TokenCallback& onToken,
                              const std::atomic<bool>* cancel) override {
        int now = ++m_active;
        int seen = m_maxActive.load();
        while (now > seen && !m_maxActive.compare_exchange_weak(seen, now)) {}
        ++m_calls;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_lastPrompt = messages;
        }

        GenerationResult result;
        std::string failure;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            failure = m_failure;
        }
        if (!failure.empty()) {
            --m_active;
            throw std::runtime_error(failure);
        }
        for (const auto& token : m_tokens) {
            if (m_delay.count() > 0) std::this_thread::sleep_for(m_delay);
            if (cancel && cancel->load()) {
                result.cancelled = true;
                break;
            }
            result.text += token;
            ++result.tokenCount;
            ++m_produced;
            if (onToken && !onToken(token)) {
                result.cancelled = true;
                break;
            }
        }
        --m_active;
        ++m_finished;
        return result;
    }

    void setDelay(std::chrono::milliseconds delay) { m_delay = delay; }
    void setReady(bool ready) { m_ready = ready; }

    /** @brief Makes every following generate() throw std::runtime_error; empty restores it. */
    void setFailure(const std::string& message) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_failure = message;
    }
    int calls() const { return m_calls.load(); }
    int maxConcurrent() const { return m_maxActive.load(); }
    /** @brief Tokens handed out across all calls. */
    int produced() const { return m_produced.load(); }
    /** @brief Calls that returned normally, cancelled or not. */
    int finished() const { return m_finished.load(); }

    std::vector<domain::ChatMessage> lastPrompt() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_lastPrompt;
    }

private:
    std::vector<std::string> m_tokens;
    std::atomic<bool> m_ready;
    std::chrono::milliseconds m_delay{0};
    std::atomic<int> m_active{0};
    std::atomic<int> m_maxActive{0};
    std::atomic<int> m_calls{0};
    std::atomic<int> m_produced{0};
    std::atomic<int> m_finished{0};
    mutable std::mutex m_mutex;
    std::vector<domain::ChatMessage> m_lastPrompt;
    std::string m_failure;
};

/** @brief Unique directory under the system temp dir, removed on destruction. */
class TempDir {
public:
    explicit TempDir(const std::string& prefix) {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        m_path = std::filesystem::temp_directory_path() / (prefix + "_" + std::to_string(stamp));
        std::filesystem::create_directories(m_path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

/** @brief Repeats a sentence until the text is at least minLength characters, one per line. */
inline std::string FillerText(const std::string& sentence, std::size_t minLength) {
    std::string text;
    while (text.size() < minLength) {
        text += sentence;
        text += "\n";
    }
    return text;
}

/** @brief Holds a plain listening socket on a loopback port so that other binds fail. */
class PortBlocker {
public:
    explicit PortBlocker(int port) {
        m_fd = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(static_cast<uint16_t>(port));
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        m_bound = m_fd >= 0 &&
                  ::bind(m_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 &&
                  ::listen(m_fd, 1) == 0;
    }
    ~PortBlocker() {
        if (m_fd >= 0) ::close(m_fd);
    }
    PortBlocker(const PortBlocker&) = delete;
    PortBlocker& operator=(const PortBlocker&) = delete;

    bool bound() const { return m_bound; }

private:
    int m_fd = -1;
    bool m_bound = false;
};

inline bool Contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace ragforge::test
