#include <catch2/catch_test_macros.hpp>

#include <edge_agent/agent/context_budget.hpp>
#include <edge_agent/core/text.hpp>

#include <numeric>

using namespace edge_agent;

namespace {

size_t Sum(const std::vector<size_t>& v) {
    return std::accumulate(v.begin(), v.end(), size_t{0});
}

// Minimal builder so the expected numbers stay readable.
std::string SimpleBuilder(const PromptInputs& in) {
    std::string out = "Q: " + in.user_text + "\n";
    for (const auto& f : in.files) {
        out += "[" + f.path + "]\n" + f.content + "\n";
    }
    return out;
}

size_t BaseTokens(const PromptInputs& inputs) {
    PromptInputs base = inputs;
    for (auto& f : base.files) {
        f.content.clear();
    }
    return EstimateTokens(SimpleBuilder(base));
}

} // anonymous namespace

// ===========================================================================
// EstimateTokens
// ===========================================================================

TEST_CASE("EstimateTokens: rounds bytes / 3 up", "[agent][budget]") {
    CHECK(EstimateTokens("") == 0);
    CHECK(EstimateTokens("a") == 1);
    CHECK(EstimateTokens("abc") == 1);
    CHECK(EstimateTokens("abcd") == 2);
    CHECK(EstimateTokens(std::string(3000, 'x')) == 1000);
}

// ===========================================================================
// AllocateTokenBudget
// ===========================================================================

TEST_CASE("AllocateTokenBudget: everything fits", "[agent][budget]") {
    CHECK(AllocateTokenBudget({10, 20}, 100) == std::vector<size_t>{10, 20});
}

TEST_CASE("AllocateTokenBudget: proportional with leftover to the largest", "[agent][budget]") {
    // Floors are 5, 3, 1; the one leftover token goes to the largest file.
    auto alloc = AllocateTokenBudget({10, 7, 3}, 10);
    CHECK(alloc == std::vector<size_t>{6, 3, 1});
    CHECK(Sum(alloc) == 10);
}

TEST_CASE("AllocateTokenBudget: ties keep original order", "[agent][budget]") {
    CHECK(AllocateTokenBudget({5, 5}, 5) == std::vector<size_t>{3, 2});
}

TEST_CASE("AllocateTokenBudget: sums exactly to the available budget", "[agent][budget]") {
    const std::vector<size_t> sizes{997, 13, 251, 1, 64, 64};
    for (size_t available : {0u, 1u, 7u, 100u, 999u, 1389u}) {
        auto alloc = AllocateTokenBudget(sizes, available);
        REQUIRE(alloc.size() == sizes.size());
        CHECK(Sum(alloc) == available);
        for (size_t i = 0; i < sizes.size(); ++i) {
            CHECK(alloc[i] <= sizes[i]);
        }
    }
}

TEST_CASE("AllocateTokenBudget: no files", "[agent][budget]") {
    CHECK(AllocateTokenBudget({}, 50).empty());
}

// ===========================================================================
// TruncateMiddle
// ===========================================================================

TEST_CASE("TruncateMiddle: short text unchanged", "[agent][budget]") {
    CHECK(TruncateMiddle("hello", 10) == "hello");
}

TEST_CASE("TruncateMiddle: keeps head and tail within the limit", "[agent][budget]") {
    std::string text = std::string(500, 'a') + std::string(500, 'z');
    auto out = TruncateMiddle(text, 200);
    CHECK(out.size() <= 200);
    CHECK(out.front() == 'a');
    CHECK(out.back() == 'z');
    CHECK(out.find("[truncated ") != std::string::npos);
}

TEST_CASE("TruncateMiddle: never splits a UTF-8 sequence", "[agent][budget]") {
    std::string text;
    for (int i = 0; i < 200; ++i) {
        text += "\xE3\x81\x82";  // HIRAGANA LETTER A
    }
    for (size_t limit : {60u, 61u, 62u, 100u, 101u}) {
        auto out = TruncateMiddle(text, limit);
        CHECK(out.size() <= limit);
        CHECK(IsValidUtf8(out));
    }
}

TEST_CASE("TruncateMiddle: tiny limit leaves only the marker", "[agent][budget]") {
    auto out = TruncateMiddle(std::string(1000, 'x'), 4);
    CHECK(out.find("[truncated 1000 bytes]") != std::string::npos);
    CHECK(out.find('x') == std::string::npos);
}

// ===========================================================================
// BuildPromptWithinBudget
// ===========================================================================

TEST_CASE("BuildPromptWithinBudget: small files are attached whole", "[agent][budget]") {
    PromptInputs inputs;
    inputs.user_text = "summarize";
    inputs.files = {{"a.md", "alpha"}, {"b.md", "beta"}};

    auto r = BuildPromptWithinBudget(SimpleBuilder, inputs, BudgetConfig{1000, 100});
    REQUIRE(r.IsOk());
    CHECK(r.Value().prompt == SimpleBuilder(inputs));
    CHECK(r.Value().truncated_files.empty());
    CHECK(r.Value().dropped_files.empty());
}

TEST_CASE("BuildPromptWithinBudget: large file is truncated to fit", "[agent][budget]") {
    PromptInputs inputs;
    inputs.user_text = "summarize";
    inputs.files = {{"big.log", std::string(3000, 'x')}};

    BudgetConfig budget{500, 100};
    auto r = BuildPromptWithinBudget(SimpleBuilder, inputs, budget);
    REQUIRE(r.IsOk());
    REQUIRE(r.Value().truncated_files == std::vector<std::string>{"big.log"});
    CHECK(r.Value().estimated_tokens <= budget.max_prompt_tokens);
    CHECK(r.Value().prompt.find("[truncated ") != std::string::npos);
}

TEST_CASE("BuildPromptWithinBudget: file without allocation is dropped", "[agent][budget]") {
    PromptInputs inputs;
    inputs.user_text = "compare";
    inputs.files = {{"big.txt", std::string(3000, 'b')}, {"tiny.txt", "t"}};

    // Exactly one token is left for file content.
    BudgetConfig budget{BaseTokens(inputs) + 100 + 1, 100};
    auto r = BuildPromptWithinBudget(SimpleBuilder, inputs, budget);
    REQUIRE(r.IsOk());
    CHECK(r.Value().truncated_files == std::vector<std::string>{"big.txt"});
    CHECK(r.Value().dropped_files == std::vector<std::string>{"tiny.txt"});
    CHECK(r.Value().prompt.find("[tiny.txt]") == std::string::npos);
}

TEST_CASE("BuildPromptWithinBudget: base prompt alone over budget", "[agent][budget]") {
    PromptInputs inputs;
    inputs.user_text = std::string(300, 'q');

    auto r = BuildPromptWithinBudget(SimpleBuilder, inputs, BudgetConfig{50, 10});
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::BudgetOverflow);
    CHECK(r.Error().ExitCode() == 6);
}
