#include <catch2/catch_test_macros.hpp>
#include "edit.hpp"
#include "providers/ollama.hpp"
#include "mock_transport.hpp"
#include <filesystem>
#include <string>

using namespace forge;

namespace {

struct TempDir {
    std::filesystem::path path;

    TempDir() {
        path = std::filesystem::temp_directory_path() / "forge_edit_test";
        std::filesystem::remove_all(path);
        std::filesystem::create_directories(path);
    }
    ~TempDir() { std::filesystem::remove_all(path); }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string file(const std::string& name) const { return (path / name).string(); }
};

} // namespace

// ── strip_code_fence ─────────────────────────────────────────────

TEST_CASE("strip_code_fence: plain reply is only trimmed", "[edit]") {
    REQUIRE(strip_code_fence("  int main() {}\n\n") == "int main() {}");
}

TEST_CASE("strip_code_fence: fence with language tag", "[edit]") {
    REQUIRE(strip_code_fence("```cpp\nint x = 1;\nint y = 2;\n```\n") == "int x = 1;\nint y = 2;");
}

TEST_CASE("strip_code_fence: bare fence", "[edit]") {
    REQUIRE(strip_code_fence("\n```\nhello\n```") == "hello");
    REQUIRE(strip_code_fence("```\n```").empty());
}

TEST_CASE("strip_code_fence: inline backticks are kept", "[edit]") {
    REQUIRE(strip_code_fence("use `x` here") == "use `x` here");
    REQUIRE(strip_code_fence("```one line```") == "```one line```");
}

// ── build_edit_prompt ────────────────────────────────────────────

TEST_CASE("build_edit_prompt: carries content and instruction", "[edit]") {
    std::string prompt = build_edit_prompt("a = 1\n", "rename a to b");
    REQUIRE(prompt.find("```\na = 1\n\n```") != std::string::npos);
    REQUIRE(prompt.find("User instruction: rename a to b") != std::string::npos);
}

// ── Files ────────────────────────────────────────────────────────

TEST_CASE("read_text_file: missing file", "[edit]") {
    TempDir dir;
    REQUIRE_FALSE(read_text_file(dir.file("nope.txt")));
}

TEST_CASE("apply_edit: writes backup then new content", "[edit]") {
    TempDir dir;
    std::string path = dir.file("main.py");

    auto result = apply_edit(path, "print('a')\n", "print('b')");
    REQUIRE(result.success);
    REQUIRE(result.output.find("main.py.backup") != std::string::npos);
    REQUIRE(read_text_file(path + ".backup").value() == "print('a')\n");
    REQUIRE(read_text_file(path).value() == "print('b')\n");
}

TEST_CASE("apply_edit: failed backup leaves the file alone", "[edit]") {
    TempDir dir;
    std::string path = dir.file("data.txt");
    std::filesystem::create_directories(path + ".backup"); // a directory cannot be replaced
    REQUIRE(apply_edit(path, "", "x").success == false);
    REQUIRE_FALSE(read_text_file(path));
}

TEST_CASE("edit: model reply in a fence becomes the file content", "[edit]") {
    TempDir dir;
    std::string path = dir.file("hello.c");
    std::string original = "int main() { return 1; }\n";

    MockConnector connector;
    auto wire = connector.add(fixed_response(
        "{\"response\":\"```c\\nint main() { return 0; }\\n```\",\"done\":true}"));
    OllamaClient client(connector, parse_base_url("http://localhost:11434"));

    std::string reply = client.generate_text("llama3", build_edit_prompt(original, "return 0"));
    REQUIRE(apply_edit(path, original, strip_code_fence(reply)).success);
    REQUIRE(read_text_file(path).value() == "int main() { return 0; }\n");
    REQUIRE(read_text_file(path + ".backup").value() == original);
    REQUIRE(wire->written.find("User instruction: return 0") != std::string::npos);
}
