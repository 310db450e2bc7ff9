#include "chat.hpp"

namespace forge {

Conversation::Conversation(HistoryLimits limits) : limits_(limits) {}

const char* Conversation::preamble() {
    return "You are Forge, a helpful coding assistant. "
           "Please provide clear, concise, and accurate responses.";
}

std::string Conversation::build_prompt(const std::string& input) const {
    if (transcript_.empty()) {
        return std::string(preamble()) + "\n\nUser: " + input;
    }
    return transcript_ + "\n\nUser: " + input;
}

void Conversation::record(const std::string& input, const std::string& response) {
    transcript_ += "User: " + input + "\nAssistant: " + response + "\n";
    trim_to_limits();
}

void Conversation::trim_to_limits() {
    if (transcript_.size() <= limits_.limit) return;
    if (limits_.keep >= transcript_.size()) return;

    // Cut at the first line break inside the kept tail so no line is split.
    size_t keep_from = transcript_.size() - limits_.keep;
    size_t nl = transcript_.find('\n', keep_from);
    if (nl == std::string::npos) return;
    transcript_.erase(0, nl + 1);
}

std::string pick_model(const std::vector<std::string>& installed,
                       const std::string& preferred) {
    if (installed.empty()) return preferred;
    for (const auto& name : installed) {
        if (name == preferred || name == preferred + ":latest") return name;
    }
    return installed.front();
}

} // namespace forge
