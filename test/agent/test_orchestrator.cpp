#include <catch2/catch_test_macros.hpp>

#include <edge_agent/agent/orchestrator.hpp>

#include "mocks/mock_agent.hpp"

#include <sstream>

using namespace edge_agent;
using namespace edge_agent::testing;

namespace {

std::string Call(const std::string& name, const nlohmann::json& args = nlohmann::json::object()) {
    return "[TOOL_CALL]\n" +
           nlohmann::json{{"name", name}, {"arguments", args}}.dump() +
           "\n[END_TOOL_CALL]\n";
}

RoundAllowance AllowEverything(int) { return RoundAllowance::All; }

// Bundles the collaborators so each test only scripts what it needs.
struct Fixture {
    MockModelRuntime model;
    MockToolRegistry tools;
    MockFileSystem files;
    MockConfirmer confirmer;
    std::ostringstream out;
    OrchestratorOptions options;

    explicit Fixture(bool confirm = true) : confirmer(confirm) {
        options.budget = BudgetConfig{100000, 256};
        tools.AddTool("docs", "search_docs", "Search the documentation");
    }

    Orchestrator Make() {
        return Orchestrator(model, tools, files, confirmer, options, out);
    }
};

} // anonymous namespace

// ===========================================================================
// Turn endings
// ===========================================================================

TEST_CASE("Orchestrator: plain answer ends the turn after one round", "[agent][orchestrator]") {
    Fixture f;
    f.model.EnqueueText("Hello there.");
    auto orchestrator = f.Make();

    auto r = orchestrator.RunTurn("hi");
    REQUIRE(r.IsOk());
    CHECK(r.Value().end == TurnEnd::FinalAnswer);
    CHECK(r.Value().rounds == 1);
    CHECK(r.Value().final_response == "Hello there.");
    CHECK(r.Value().results.empty());
    CHECK(f.out.str().find("Hello there.") != std::string::npos);
}

TEST_CASE("Orchestrator: tool result is fed into the next round", "[agent][orchestrator]") {
    Fixture f;
    f.tools.SetResult("search_docs", true, "Budget docs: 3 pages");
    f.model.EnqueueText(Call("search_docs", {{"query", "budget"}}));
    f.model.EnqueueText("The budget is described in 3 pages.");
    auto orchestrator = f.Make();

    auto r = orchestrator.RunTurn("find budget docs");
    REQUIRE(r.IsOk());
    CHECK(r.Value().end == TurnEnd::FinalAnswer);
    CHECK(r.Value().rounds == 2);
    REQUIRE(f.tools.Calls().size() == 1);
    CHECK(f.tools.Calls()[0].arguments["query"] == "budget");

    REQUIRE(f.model.Prompts().size() == 2);
    CHECK(f.model.Prompts()[0].find("<tool_results>") == std::string::npos);
    CHECK(f.model.Prompts()[1].find(
              "<tool_result name=\"search_docs\" status=\"success\">\nBudget docs: 3 pages\n") !=
          std::string::npos);
    CHECK(f.out.str().find("[Tool: search_docs done]") != std::string::npos);
}

TEST_CASE("Orchestrator: later rounds may only write", "[agent][orchestrator]") {
    Fixture f;
    f.model.EnqueueText(Call("search_docs", {{"query", "x"}}));
    f.model.EnqueueText(Call("write_file", {{"path", "notes.md"}, {"content", "# Notes"}}) +
                        Call("search_docs", {{"query", "again"}}));
    auto orchestrator = f.Make();

    auto r = orchestrator.RunTurn("search and save to notes.md");
    REQUIRE(r.IsOk());
    CHECK(r.Value().end == TurnEnd::Blocked);
    CHECK(r.Value().rounds == 2);
    REQUIRE(r.Value().results.size() == 2);
    CHECK(r.Value().results[1].name == "write_file");
    CHECK(r.Value().results[1].success);
    CHECK(r.Value().blocked == std::vector<std::string>{"search_docs"});
    CHECK(f.files.Files().at("notes.md") == "# Notes");
    CHECK(f.tools.Calls().size() == 1);
    CHECK(f.out.str().find("[Tool 'search_docs' blocked in this round]") != std::string::npos);
}

TEST_CASE("Orchestrator: a tool runs at most once per turn", "[agent][orchestrator]") {
    Fixture f;
    f.model.EnqueueText(Call("search_docs", {{"query", "a"}}));
    f.model.EnqueueText(Call("search_docs", {{"query", "b"}}));
    auto orchestrator = f.Make();
    orchestrator.SetRoundPolicy(AllowEverything);

    auto r = orchestrator.RunTurn("search twice");
    REQUIRE(r.IsOk());
    CHECK(r.Value().end == TurnEnd::Blocked);
    CHECK(f.tools.Calls().size() == 1);
    CHECK(f.out.str().find("already called this turn") != std::string::npos);
}

TEST_CASE("Orchestrator: duplicate call in one response runs once", "[agent][orchestrator]") {
    Fixture f;
    f.model.EnqueueText(Call("search_docs", {{"query", "a"}}) +
                        Call("search_docs", {{"query", "a"}}));
    auto orchestrator = f.Make();

    auto r = orchestrator.RunTurn("search");
    REQUIRE(r.IsOk());
    CHECK(r.Value().results.size() == 1);
    CHECK(r.Value().blocked.size() == 1);
    CHECK(f.tools.Calls().size() == 1);
}

TEST_CASE("Orchestrator: round limit stops the turn", "[agent][orchestrator]") {
    Fixture f;
    f.tools.AddTool("misc", "tool_a");
    f.tools.AddTool("misc", "tool_b");
    f.tools.AddTool("misc", "tool_c");
    f.model.EnqueueText(Call("tool_a"));
    f.model.EnqueueText(Call("tool_b"));
    f.model.EnqueueText(Call("tool_c"));
    f.model.EnqueueText("never reached");
    auto orchestrator = f.Make();
    orchestrator.SetRoundPolicy(AllowEverything);

    auto r = orchestrator.RunTurn("chain");
    REQUIRE(r.IsOk());
    CHECK(r.Value().end == TurnEnd::RoundLimit);
    CHECK(r.Value().rounds == 3);
    CHECK(r.Value().results.size() == 3);
    CHECK(f.model.Prompts().size() == 3);
    CHECK(f.out.str().find("[Tool round limit reached]") != std::string::npos);
}

// ===========================================================================
// Local file tools
// ===========================================================================

TEST_CASE("Orchestrator: read_file returns the file content", "[agent][orchestrator]") {
    Fixture f;
    f.files.AddFile("src/main.rs", "fn main() {}");
    f.model.EnqueueText(Call("read_file", {{"path", "src/main.rs"}}));
    auto orchestrator = f.Make();

    auto r = orchestrator.RunTurn("explain main");
    REQUIRE(r.IsOk());
    REQUIRE(r.Value().results.size() == 1);
    CHECK(r.Value().results[0].success);
    CHECK(r.Value().results[0].output == "fn main() {}");
    CHECK(f.tools.Calls().empty());
}

TEST_CASE("Orchestrator: read_file of a missing file is a failed result", "[agent][orchestrator]") {
    Fixture f;
    f.model.EnqueueText(Call("read_file", {{"path", "nope.txt"}}));
    auto orchestrator = f.Make();

    auto r = orchestrator.RunTurn("read nope.txt");
    REQUIRE(r.IsOk());
    REQUIRE(r.Value().results.size() == 1);
    CHECK_FALSE(r.Value().results[0].success);
    CHECK(r.Value().results[0].output.rfind("Error: ", 0) == 0);
}

TEST_CASE("Orchestrator: write_file needs string path and content", "[agent][orchestrator]") {
    Fixture f;
    f.model.EnqueueText(Call("write_file", {{"path", "a.txt"}, {"content", 42}}));
    auto orchestrator = f.Make();

    auto r = orchestrator.RunTurn("write a.txt");
    REQUIRE(r.IsOk());
    CHECK_FALSE(r.Value().results[0].success);
    CHECK(f.files.Writes().empty());
}

TEST_CASE("Orchestrator: declined overwrite leaves the file alone", "[agent][orchestrator]") {
    Fixture f(false);
    f.files.AddFile("out.txt", "original");
    f.model.EnqueueText(Call("write_file", {{"path", "out.txt"}, {"content", "new"}}));
    auto orchestrator = f.Make();

    auto r = orchestrator.RunTurn("write out.txt");
    REQUIRE(r.IsOk());
    CHECK(f.confirmer.OverwriteAsked() == std::vector<std::string>{"out.txt"});
    CHECK_FALSE(r.Value().results[0].success);
    CHECK(r.Value().results[0].output ==
          "Error: overwrite of 'out.txt' declined by user");
    CHECK(f.files.Files().at("out.txt") == "original");
}

TEST_CASE("Orchestrator: new file is written without asking by default", "[agent][orchestrator]") {
    Fixture f;
    f.model.EnqueueText(Call("write_file", {{"path", "new.txt"}, {"content", "hello"}}));
    auto orchestrator = f.Make();

    auto r = orchestrator.RunTurn("create new.txt");
    REQUIRE(r.IsOk());
    CHECK(f.confirmer.OverwriteAsked().empty());
    CHECK(f.confirmer.WriteAsked().empty());
    CHECK(r.Value().results[0].output == "Wrote 5 bytes to new.txt");
}

TEST_CASE("Orchestrator: confirm_writes asks before every write", "[agent][orchestrator]") {
    Fixture f;
    f.options.confirm_writes = true;
    f.model.EnqueueText(Call("write_file", {{"path", "new.txt"}, {"content", "hello"}}));
    auto orchestrator = f.Make();

    auto r = orchestrator.RunTurn("create new.txt");
    REQUIRE(r.IsOk());
    CHECK(f.confirmer.WriteAsked() == std::vector<std::string>{"new.txt"});
    CHECK(f.files.Writes() == std::vector<std::string>{"new.txt"});
}

TEST_CASE("Orchestrator: local file tools win over same-named server tools", "[agent][orchestrator]") {
    Fixture f;
    f.tools.AddTool("fs", "write_file");
    f.tools.AddTool("fs", "read_file");
    f.files.AddFile("in.txt", "source");
    f.model.EnqueueText(Call("read_file", {{"path", "in.txt"}}));
    f.model.EnqueueText(Call("write_file", {{"path", "out.txt"}, {"content", "copy"}}));
    auto orchestrator = f.Make();

    auto r = orchestrator.RunTurn("copy in.txt to out.txt");
    REQUIRE(r.IsOk());
    CHECK(f.tools.Calls().empty());
    CHECK(f.files.Reads() == std::vector<std::string>{"in.txt"});
    CHECK(f.files.Writes() == std::vector<std::string>{"out.txt"});
    CHECK(f.files.Files().at("out.txt") == "copy");
}

TEST_CASE("Orchestrator: tagged call with non-UTF-8 argument is never dispatched", "[agent][orchestrator]") {
    Fixture f;
    f.model.EnqueueText(
        "Saving now.\n"
        "<tool_call name=\"write_file\">"
        "<argument name=\"path\">caf\xc3</argument>"
        "<argument name=\"content\">menu</argument>"
        "</tool_call>");
    auto orchestrator = f.Make();

    auto r = orchestrator.RunTurn("save the menu");
    REQUIRE(r.IsOk());
    CHECK(r.Value().end == TurnEnd::FinalAnswer);
    CHECK(r.Value().results.empty());
    CHECK(f.files.Writes().empty());
    CHECK(f.tools.Calls().empty());
}

// ===========================================================================
// File blocks in the reply
// ===========================================================================

TEST_CASE("Orchestrator: file blocks are written through write_file", "[agent][orchestrator]") {
    Fixture f;
    auto orchestrator = f.Make();

    auto results = orchestrator.ApplyFileOutputs(
        "<file path=\"notes.md\"># Notes</file>\n"
        "[CREATE_FILE: run.sh]\n```sh\necho hi\n```\n[END_FILE]",
        {}, {});

    REQUIRE(results.size() == 2);
    CHECK(results[0].success);
    CHECK(results[1].success);
    CHECK(f.files.Files().at("notes.md") == "# Notes");
    CHECK(f.files.Files().at("run.sh") == "echo hi");
    CHECK(f.out.str().find("[Detected 2 file output(s)]") != std::string::npos);
    CHECK(f.out.str().find("[Wrote: run.sh]") != std::string::npos);
}

TEST_CASE("Orchestrator: unchanged file blocks are not written", "[agent][orchestrator]") {
    Fixture f;
    auto orchestrator = f.Make();

    auto results = orchestrator.ApplyFileOutputs(
        "<file path=\"ja.md\">\nこんにちは\n</file>", {{"ja.md", "こんにちは"}}, {"en.md"});

    CHECK(results.empty());
    CHECK(f.files.Writes().empty());
    CHECK(f.out.str().find("[Skipped unchanged (matches input ja.md): ja.md]") !=
          std::string::npos);
}

TEST_CASE("Orchestrator: file block for an input is redirected to the target", "[agent][orchestrator]") {
    Fixture f;
    auto orchestrator = f.Make();

    auto results = orchestrator.ApplyFileOutputs(
        "<file path=\"ja.md\">Hello</file>", {{"ja.md", "こんにちは"}}, {"en.md"});

    REQUIRE(results.size() == 1);
    CHECK(f.files.Writes() == std::vector<std::string>{"en.md"});
    CHECK(f.files.Files().at("en.md") == "Hello");
    CHECK(f.out.str().find("[Remapped file output(s) to en.md]") != std::string::npos);
}

TEST_CASE("Orchestrator: file blocks respect the overwrite policy", "[agent][orchestrator]") {
    Fixture f(false);
    f.files.AddFile("out.txt", "original");
    auto orchestrator = f.Make();

    auto results = orchestrator.ApplyFileOutputs("<file path=\"out.txt\">new</file>", {}, {});

    REQUIRE(results.size() == 1);
    CHECK_FALSE(results[0].success);
    CHECK(f.confirmer.OverwriteAsked() == std::vector<std::string>{"out.txt"});
    CHECK(f.files.Files().at("out.txt") == "original");
    CHECK(f.out.str().find("[Not written: out.txt]") != std::string::npos);
}

TEST_CASE("Orchestrator: tool-only file blocks go to the MCP write tool", "[agent][orchestrator]") {
    Fixture f;
    f.options.tool_only = true;
    f.tools.AddTool("fs", "write_file");
    auto orchestrator = f.Make();

    auto results = orchestrator.ApplyFileOutputs("<file path=\"a.txt\">x</file>", {}, {});

    REQUIRE(results.size() == 1);
    CHECK(f.files.Writes().empty());
    REQUIRE(f.tools.Calls().size() == 1);
    CHECK(f.tools.Calls()[0].name == "write_file");
    CHECK(f.tools.Calls()[0].arguments == nlohmann::json{{"path", "a.txt"}, {"content", "x"}});
}

TEST_CASE("Orchestrator: file blocks without a write tool are skipped", "[agent][orchestrator]") {
    Fixture f;
    f.options.tool_only = true;
    auto orchestrator = f.Make();

    auto results = orchestrator.ApplyFileOutputs("<file path=\"a.txt\">x</file>", {}, {});

    CHECK(results.empty());
    CHECK(f.tools.Calls().empty());
    CHECK(f.out.str().find("[No write tool available; file outputs skipped]") !=
          std::string::npos);
}

// ===========================================================================
// Tool-only mode
// ===========================================================================

TEST_CASE("Orchestrator: tool-only mode advertises MCP tools only", "[agent][orchestrator]") {
    Fixture f;
    f.options.tool_only = true;
    f.tools.AddTool("fs", "fs_write_text_file");
    auto orchestrator = f.Make();

    auto advertised = orchestrator.AdvertisedTools();
    REQUIRE(advertised.size() == 2);
    CHECK(advertised[0].name == "search_docs");
    CHECK(advertised[1].name == "fs_write_text_file");
    CHECK(orchestrator.DesignatedWriteTool() == "fs_write_text_file");
}

TEST_CASE("Orchestrator: default mode puts built-in file tools first", "[agent][orchestrator]") {
    Fixture f;
    f.tools.AddTool("fs", "write_file");
    auto orchestrator = f.Make();

    auto advertised = orchestrator.AdvertisedTools();
    REQUIRE(advertised.size() == 3);
    CHECK(advertised[0].name == "read_file");
    CHECK(advertised[1].name == "write_file");
    CHECK(advertised[2].name == "search_docs");
    CHECK(orchestrator.DesignatedWriteTool() == "write_file");
}

TEST_CASE("Orchestrator: tool-only writes go through the MCP write tool", "[agent][orchestrator]") {
    Fixture f;
    f.options.tool_only = true;
    f.options.confirm_writes = true;
    f.tools.AddTool("fs", "write_file");
    f.model.EnqueueText(Call("search_docs", {{"query", "x"}}));
    f.model.EnqueueText(Call("write_file", {{"path", "report.md"}, {"content", "r"}}));
    auto orchestrator = f.Make();

    auto r = orchestrator.RunTurn("search and write report.md");
    REQUIRE(r.IsOk());
    REQUIRE(f.tools.Calls().size() == 2);
    CHECK(f.tools.Calls()[1].name == "write_file");
    CHECK(f.confirmer.WriteAsked() == std::vector<std::string>{"report.md"});
    CHECK(f.files.Writes().empty());
}

TEST_CASE("Orchestrator: tool-only without a write tool blocks later rounds", "[agent][orchestrator]") {
    Fixture f;
    f.options.tool_only = true;
    f.tools.AddTool("docs", "get_page");
    f.model.EnqueueText(Call("search_docs"));
    f.model.EnqueueText(Call("get_page"));
    auto orchestrator = f.Make();

    CHECK(orchestrator.DesignatedWriteTool().empty());
    auto r = orchestrator.RunTurn("look around");
    REQUIRE(r.IsOk());
    CHECK(r.Value().end == TurnEnd::Blocked);
    CHECK(r.Value().blocked == std::vector<std::string>{"get_page"});
}

// ===========================================================================
// Prompt assembly and errors
// ===========================================================================

TEST_CASE("Orchestrator: chat template wraps every prompt", "[agent][orchestrator]") {
    Fixture f;
    f.options.chat_template = kDefaultChatTemplate;
    auto orchestrator = f.Make();

    REQUIRE(orchestrator.RunTurn("hi").IsOk());
    const auto& prompt = f.model.Prompts().at(0);
    CHECK(prompt.rfind("<|im_start|>user\n<system>", 0) == 0);
    CHECK(prompt.find("<|im_start|>assistant\n") != std::string::npos);
}

TEST_CASE("Orchestrator: attached files and targets reach the prompt", "[agent][orchestrator]") {
    Fixture f;
    auto orchestrator = f.Make();

    REQUIRE(orchestrator.RunTurn("translate a.md to b.md", {{"a.md", "# Title"}},
                                 {"b.md"}, {{"c.md", "File not found"}})
                .IsOk());
    const auto& prompt = f.model.Prompts().at(0);
    CHECK(prompt.find("<file path=\"a.md\">\n# Title\n</file>") != std::string::npos);
    CHECK(prompt.find("<file_error path=\"c.md\">") != std::string::npos);
    CHECK(prompt.find("<target>b.md</target>") != std::string::npos);
}

TEST_CASE("Orchestrator: custom prompt builder is used", "[agent][orchestrator]") {
    Fixture f;
    auto orchestrator = f.Make();
    orchestrator.SetPromptBuilder([](const PromptInputs& in) { return "Q=" + in.user_text; });

    REQUIRE(orchestrator.RunTurn("ping").IsOk());
    CHECK(f.model.Prompts().at(0) == "Q=ping");
}

TEST_CASE("Orchestrator: preview prints the prompt", "[agent][orchestrator]") {
    Fixture f;
    f.options.preview_prompt = true;
    auto orchestrator = f.Make();
    orchestrator.SetPromptBuilder([](const PromptInputs&) { return std::string("PROMPT"); });

    REQUIRE(orchestrator.RunTurn("x").IsOk());
    CHECK(f.out.str().find("----- prompt (round 0) -----\nPROMPT\n") != std::string::npos);
}

TEST_CASE("Orchestrator: non-streaming output hides tool blocks", "[agent][orchestrator]") {
    Fixture f;
    f.options.stream_output = false;
    f.model.EnqueueText("Searching.\n" + Call("search_docs"));
    f.model.EnqueueText("Found it.");
    auto orchestrator = f.Make();

    REQUIRE(orchestrator.RunTurn("search").IsOk());
    CHECK(f.out.str().find("Searching.\n") != std::string::npos);
    CHECK(f.out.str().find("[TOOL_CALL]") == std::string::npos);
    CHECK(f.out.str().find("Found it.\n") != std::string::npos);
}

TEST_CASE("Orchestrator: model failure aborts the turn", "[agent][orchestrator]") {
    Fixture f;
    f.model.EnqueueError(Error{"Run", "llama-cli", "Model process exited with status 1",
                               std::nullopt, ErrorCategory::Model});
    auto orchestrator = f.Make();

    auto r = orchestrator.RunTurn("hi");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Model);
}

TEST_CASE("Orchestrator: prompt over budget is BudgetOverflow", "[agent][orchestrator]") {
    Fixture f;
    f.options.budget = BudgetConfig{20, 5};
    auto orchestrator = f.Make();

    auto r = orchestrator.RunTurn("hi");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::BudgetOverflow);
    CHECK(f.model.Prompts().empty());
}
