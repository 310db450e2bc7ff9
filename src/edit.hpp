#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace forge {

struct EditResult {
    bool success;
    std::string output;
};

// Whole file as text, or nullopt when it cannot be opened.
std::optional<std::string> read_text_file(const std::string& path);

// Prompt asking the model for the complete rewritten file.
std::string build_edit_prompt(const std::string& content, const std::string& instruction);

// Model output with surrounding whitespace and one enclosing ``` fence
// (including a language tag on the opening line) removed.
std::string strip_code_fence(std::string_view response);

// Save original to <path>.backup, then replace path with updated (newline
// terminated).
// Both writes are atomic; path is left alone if the backup fails.
EditResult apply_edit(const std::string& path, const std::string& original,
                      const std::string& updated);

} // namespace forge
