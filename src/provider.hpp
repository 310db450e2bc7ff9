#pragma once
#include "stream.hpp"
#include <cstdint>
#include <functional>
#include <string>

namespace forge {

enum class Role { System, User, Assistant };

inline const char* role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
    }
    return "user";
}

struct ChatMessage {
    Role role;
    std::string content;
};

struct TokenUsage {
    uint32_t prompt_tokens = 0;
    uint32_t completion_tokens = 0;
    uint32_t total_tokens = 0;
};

struct GenerateResult {
    std::string text;
    std::string model;
    TokenUsage usage;
    bool done = false; // server sent its completion marker
    StreamStatus status = StreamStatus::Active;
};

// Callback for streaming text deltas. Return false to abort.
using TextDeltaCallback = std::function<bool(const std::string& delta)>;

} // namespace forge
