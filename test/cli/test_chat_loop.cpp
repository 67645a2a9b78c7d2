#include <catch2/catch_test_macros.hpp>

#include <edge_agent/cli/chat_loop.hpp>
#include <edge_agent/prompt/file_detector.hpp>

#include "mocks/mock_agent.hpp"

#include <sstream>

using namespace edge_agent;
using namespace edge_agent::testing;

// ===========================================================================
// StreamConfirmer
// ===========================================================================

TEST_CASE("StreamConfirmer: accepts y and yes only", "[cli][chat]") {
    std::istringstream in("y\nYES\nno\n\nsure\n");
    std::ostringstream out;
    StreamConfirmer confirmer(in, out);

    CHECK(confirmer.ConfirmOverwrite("a.txt"));
    CHECK(confirmer.ConfirmWrite("b.txt"));
    CHECK_FALSE(confirmer.ConfirmWrite("c.txt"));
    CHECK_FALSE(confirmer.ConfirmWrite("d.txt"));
    CHECK_FALSE(confirmer.ConfirmWrite("e.txt"));
    CHECK(out.str().find("File 'a.txt' already exists. Overwrite? (y/N): ") != std::string::npos);
    CHECK(out.str().find("Write file 'b.txt'? (y/N): ") != std::string::npos);
}

TEST_CASE("StreamConfirmer: EOF declines", "[cli][chat]") {
    std::istringstream in("");
    std::ostringstream out;
    StreamConfirmer confirmer(in, out);
    CHECK_FALSE(confirmer.ConfirmOverwrite("a.txt"));
}

// ===========================================================================
// ChatLoop
// ===========================================================================

namespace {

struct ChatFixture {
    MockModelRuntime model;
    MockToolRegistry tools;
    MockFileSystem files;
    MockConfirmer confirmer{true};
    std::ostringstream model_out;
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter formatter{false, false, out, err};
    Orchestrator orchestrator;

    ChatFixture()
        : orchestrator(model, tools, files, confirmer, Options(), model_out) {}

    static OrchestratorOptions Options() {
        OrchestratorOptions options;
        options.budget = BudgetConfig{100000, 256};
        return options;
    }

    ChatOptions Chat(bool tool_only = false) const {
        ChatOptions options;
        options.detect_extensions = DefaultDetectExtensions();
        options.tool_only = tool_only;
        return options;
    }
};

} // anonymous namespace

TEST_CASE("ChatLoop: runs one turn per line until exit", "[cli][chat]") {
    ChatFixture f;
    std::istringstream in("hello\n\n   \nwhat next\nexit\nnever read\n");
    ChatLoop loop(f.orchestrator, f.files, f.formatter, f.Chat(), in, f.out);

    CHECK(loop.Run() == 2);
    CHECK(f.model.Prompts().size() == 2);
    CHECK(f.out.str().find("See you!\n") != std::string::npos);
}

TEST_CASE("ChatLoop: EOF ends the session", "[cli][chat]") {
    ChatFixture f;
    std::istringstream in("hello");
    ChatLoop loop(f.orchestrator, f.files, f.formatter, f.Chat(), in, f.out);

    CHECK(loop.Run() == 1);
    CHECK(f.out.str().find("See you!") == std::string::npos);
}

TEST_CASE("ChatLoop: quit is case-insensitive", "[cli][chat]") {
    ChatFixture f;
    std::istringstream in;
    ChatLoop loop(f.orchestrator, f.files, f.formatter, f.Chat(), in, f.out);
    CHECK_FALSE(loop.HandleLine("  QUIT "));
    CHECK(f.model.Prompts().empty());
}

TEST_CASE("ChatLoop: mentioned files are attached", "[cli][chat]") {
    ChatFixture f;
    f.files.AddFile("src/main.rs", "fn main() {}");
    std::istringstream in;
    ChatLoop loop(f.orchestrator, f.files, f.formatter, f.Chat(), in, f.out);

    CHECK(loop.HandleLine("src/main.rsを読んで"));
    CHECK(f.out.str().find("[Detected files: src/main.rs]") != std::string::npos);
    CHECK(f.out.str().find("[Loaded 1 file(s)]") != std::string::npos);
    REQUIRE(f.model.Prompts().size() == 1);
    CHECK(f.model.Prompts()[0].find("<file path=\"src/main.rs\">\nfn main() {}\n</file>") !=
          std::string::npos);
}

TEST_CASE("ChatLoop: missing file becomes a file error in the prompt", "[cli][chat]") {
    ChatFixture f;
    std::istringstream in;
    ChatLoop loop(f.orchestrator, f.files, f.formatter, f.Chat(), in, f.out);

    CHECK(loop.HandleLine("explain Cargo.toml"));
    CHECK(f.files.Reads().empty());
    CHECK(f.model.Prompts().at(0).find(
              "<file_error path=\"Cargo.toml\">\nFile not found\n</file_error>") !=
          std::string::npos);
}

TEST_CASE("ChatLoop: write request splits source and targets", "[cli][chat]") {
    ChatFixture f;
    f.files.AddFile("ja.md", "こんにちは");
    std::istringstream in;
    ChatLoop loop(f.orchestrator, f.files, f.formatter, f.Chat(), in, f.out);

    CHECK(loop.HandleLine("ja.mdを翻訳してen.mdに保存して"));
    CHECK(f.out.str().find("[Output targets (not loaded): en.md]") != std::string::npos);
    CHECK(f.files.Reads() == std::vector<std::string>{"ja.md"});
    const auto& prompt = f.model.Prompts().at(0);
    CHECK(prompt.find("<target>en.md</target>") != std::string::npos);
    CHECK(prompt.find("<file path=\"en.md\">") == std::string::npos);
}

TEST_CASE("ChatLoop: file block in the reply is written to the output target", "[cli][chat]") {
    ChatFixture f;
    f.files.AddFile("ja.md", "こんにちは");
    f.model.EnqueueText("<file path=\"ja.md\">\nHello\n</file>");
    std::istringstream in;
    ChatLoop loop(f.orchestrator, f.files, f.formatter, f.Chat(), in, f.out);

    CHECK(loop.HandleLine("ja.mdを翻訳してen.mdに保存して"));
    CHECK(f.files.Writes() == std::vector<std::string>{"en.md"});
    CHECK(f.files.Files().at("en.md") == "Hello");
    CHECK(f.files.Files().at("ja.md") == "こんにちは");
}

TEST_CASE("ChatLoop: file blocks are ignored without write intent", "[cli][chat]") {
    ChatFixture f;
    f.files.AddFile("notes.md", "n");
    f.model.EnqueueText("<file path=\"notes.md\">\nrewritten\n</file>");
    std::istringstream in;
    ChatLoop loop(f.orchestrator, f.files, f.formatter, f.Chat(), in, f.out);

    CHECK(loop.HandleLine("explain notes.md"));
    CHECK(f.files.Writes().empty());
    CHECK(f.files.Files().at("notes.md") == "n");
}

TEST_CASE("ChatLoop: detection can be disabled", "[cli][chat]") {
    ChatFixture f;
    f.files.AddFile("notes.md", "n");
    std::istringstream in;
    auto options = f.Chat();
    options.detect_extensions.clear();
    ChatLoop loop(f.orchestrator, f.files, f.formatter, options, in, f.out);

    CHECK(loop.HandleLine("summarize notes.md"));
    CHECK(f.files.Reads().empty());
    CHECK(f.out.str().find("Detected files") == std::string::npos);
}

TEST_CASE("ChatLoop: tool-only write request prints a notice", "[cli][chat]") {
    ChatFixture f;
    std::istringstream in;
    ChatLoop loop(f.orchestrator, f.files, f.formatter, f.Chat(true), in, f.out);

    CHECK(loop.HandleLine("create a summary"));
    CHECK(f.out.str().find("[tool-only: local file writes are disabled") != std::string::npos);
}

TEST_CASE("ChatLoop: turn error is printed and the loop goes on", "[cli][chat]") {
    ChatFixture f;
    f.model.EnqueueError(Error{"Run", "llama-cli", "Model command exited with status 1",
                               std::nullopt, ErrorCategory::Model});
    std::istringstream in("first\nsecond\n");
    ChatLoop loop(f.orchestrator, f.files, f.formatter, f.Chat(), in, f.out);

    CHECK(loop.Run() == 2);
    CHECK(f.err.str().find("Error: Run [llama-cli]") != std::string::npos);
    CHECK(f.model.Prompts().size() == 2);
}
