/**
 * @file ChatMessage.hpp
 * @brief A single message of a conversation.
 */

#pragma once
#include <chrono>
#include <string>

namespace ragforge::domain {

struct ChatMessage {
    enum class Role { System, User, Assistant };
    Role role = Role::User;
    std::string content;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();

    ChatMessage() = default;
    ChatMessage(Role r, std::string text) : role(r), content(std::move(text)) {}

    static std::string RoleToString(Role r) {
        switch (r) {
            case Role::System: return "system";
            case Role::User: return "user";
            case Role::Assistant: return "assistant";
        }
        return "user";
    }
};

} // namespace ragforge::domain
