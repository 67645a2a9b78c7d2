#include <catch2/catch_test_macros.hpp>

#include <edge_agent/prompt/prompt_builder.hpp>

using namespace edge_agent;

namespace {

bool Has(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // anonymous namespace

// ===========================================================================
// BuildChatPrompt
// ===========================================================================

TEST_CASE("BuildChatPrompt: minimal prompt has system and user sections", "[prompt][builder]") {
    PromptInputs inputs;
    inputs.user_text = "What is MCP?";
    auto prompt = BuildChatPrompt(inputs);

    CHECK(prompt.rfind("<system>\n", 0) == 0);
    CHECK(Has(prompt, "</system>\n\n"));
    const std::string tail = "<user_input>\nWhat is MCP?\n</user_input>";
    REQUIRE(prompt.size() >= tail.size());
    CHECK(prompt.compare(prompt.size() - tail.size(), tail.size(), tail) == 0);
    CHECK_FALSE(Has(prompt, "<tools>"));
    CHECK_FALSE(Has(prompt, "<files>"));
    CHECK_FALSE(Has(prompt, "<output_targets>"));
    CHECK_FALSE(Has(prompt, "<tool_results>"));
    CHECK_FALSE(Has(prompt, "File Operation Instructions"));
}

TEST_CASE("BuildChatPrompt: write intent adds file operation instructions", "[prompt][builder]") {
    PromptInputs inputs;
    inputs.user_text = "notes.mdを作成して";
    CHECK(Has(BuildChatPrompt(inputs), "## File Operation Instructions"));
}

TEST_CASE("BuildChatPrompt: sections appear in fixed order", "[prompt][builder]") {
    PromptInputs inputs;
    inputs.user_text = "translate";
    inputs.tool_info = "## Available Tools\n\n### search_docs\n";
    inputs.files = {{"ja.md", "こんにちは"}};
    inputs.file_errors = {{"missing.md", "File not found"}};
    inputs.output_targets = {"en.md"};
    inputs.tool_results = {{"search_docs", false, "Error: index missing\n\n"}};
    auto prompt = BuildChatPrompt(inputs);

    const auto tools = prompt.find("<tools>\n## Available Tools");
    const auto files = prompt.find("<files>\n<file path=\"ja.md\">\nこんにちは\n</file>");
    const auto error = prompt.find("<file_error path=\"missing.md\">\nFile not found\n</file_error>");
    const auto targets = prompt.find("<output_targets>\n<target>en.md</target>\n</output_targets>");
    const auto results = prompt.find(
        "<tool_result name=\"search_docs\" status=\"error\">\nError: index missing\n</tool_result>");
    const auto user = prompt.find("<user_input>");

    REQUIRE(tools != std::string::npos);
    REQUIRE(files != std::string::npos);
    REQUIRE(error != std::string::npos);
    REQUIRE(targets != std::string::npos);
    REQUIRE(results != std::string::npos);
    CHECK(tools < files);
    CHECK(files < error);
    CHECK(error < targets);
    CHECK(targets < results);
    CHECK(results < user);
}

TEST_CASE("BuildChatPrompt: blank tool info is omitted", "[prompt][builder]") {
    PromptInputs inputs;
    inputs.user_text = "hi";
    inputs.tool_info = "  \n";
    CHECK_FALSE(Has(BuildChatPrompt(inputs), "<tools>"));
}

// ===========================================================================
// ApplyChatTemplate
// ===========================================================================

TEST_CASE("ApplyChatTemplate: substitutes the placeholder", "[prompt][builder]") {
    CHECK(ApplyChatTemplate(kDefaultChatTemplate, "hello") ==
          "<|im_start|>user\nhello<|im_end|>\n<|im_start|>assistant\n");
}

TEST_CASE("ApplyChatTemplate: empty template passes the prompt through", "[prompt][builder]") {
    CHECK(ApplyChatTemplate("", "hello") == "hello");
}

TEST_CASE("ApplyChatTemplate: template without placeholder is a prefix", "[prompt][builder]") {
    CHECK(ApplyChatTemplate("### Instruction:\n", "hello") == "### Instruction:\nhello");
}

TEST_CASE("ApplyChatTemplate: only the first placeholder is replaced", "[prompt][builder]") {
    CHECK(ApplyChatTemplate("[{prompt}] {prompt}", "x") == "[x] {prompt}");
}
