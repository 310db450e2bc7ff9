#include "edit.hpp"
#include "util.hpp"
#include <fstream>
#include <sstream>

namespace forge {

std::optional<std::string> read_text_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return std::nullopt;

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::string build_edit_prompt(const std::string& content, const std::string& instruction) {
    return "You are a code editor assistant. The user wants to modify a file.\n\n"
           "Current file content:\n"
           "```\n" + content + "\n```\n\n"
           "User instruction: " + instruction + "\n\n"
           "Please provide the complete updated file content. "
           "Only respond with the new file content, no explanations or markdown formatting.";
}

std::string strip_code_fence(std::string_view response) {
    std::string text = trim(std::string(response));
    if (text.size() < 6 || text.compare(0, 3, "```") != 0 ||
        text.compare(text.size() - 3, 3, "```") != 0) {
        return text;
    }

    // Opening fence runs to the end of its line (``` or ```cpp).
    size_t body = text.find('\n');
    if (body == std::string::npos) return text;
    std::string inner = text.substr(body + 1, text.size() - 3 - (body + 1));
    return trim(inner);
}

EditResult apply_edit(const std::string& path, const std::string& original,
                      const std::string& updated) {
    std::string backup_path = path + ".backup";
    if (!atomic_write_file(backup_path, original)) {
        return EditResult{false, "Failed to write backup: " + backup_path};
    }

    std::string content = updated;
    if (!content.empty() && content.back() != '\n') content += '\n';
    if (!atomic_write_file(path, content)) {
        return EditResult{false, "Failed to write file: " + path};
    }
    return EditResult{true, "Created backup: " + backup_path + "\nChanges applied to: " + path};
}

} // namespace forge
