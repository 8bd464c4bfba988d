#pragma once
#include <string>

namespace DryDock {

enum class MessageRole {
    User,
    Assistant
};

struct ChatMessage {
    MessageRole role = MessageRole::User;
    std::string content;

    static ChatMessage user(const std::string& text) { return {MessageRole::User, text}; }
    static ChatMessage assistant(const std::string& text) { return {MessageRole::Assistant, text}; }
};

inline const char* roleName(MessageRole role) {
    return role == MessageRole::Assistant ? "assistant" : "user";
}

}
