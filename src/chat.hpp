#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace forge {

struct HistoryLimits {
    size_t limit = 2000; // trim once the transcript grows past this
    size_t keep = 1500;  // approximate size after a trim
};

// Plain-text transcript of a chat session. Each prompt sent to the model
// carries the whole transcript, so it is kept short by dropping the oldest
// lines.
class Conversation {
public:
    explicit Conversation(HistoryLimits limits = {});

    // Prompt for the next turn: the preamble on the first turn, otherwise
    // the transcript so far, followed by the user's input.
    std::string build_prompt(const std::string& input) const;

    // Append one exchange and trim if needed.
    void record(const std::string& input, const std::string& response);

    void clear() { transcript_.clear(); }
    bool empty() const { return transcript_.empty(); }
    const std::string& transcript() const { return transcript_; }

    static const char* preamble();

private:
    void trim_to_limits();

    HistoryLimits limits_;
    std::string transcript_;
};

// Model to use given what the server has installed. Returns preferred when
// it is installed (with or without the ":latest" tag) or when the list is
// empty, otherwise the first installed model.
std::string pick_model(const std::vector<std::string>& installed,
                       const std::string& preferred);

} // namespace forge
