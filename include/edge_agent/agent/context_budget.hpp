#pragma once

#include <edge_agent/core/result.hpp>
#include <edge_agent/prompt/prompt_builder.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace edge_agent {

// ---------------------------------------------------------------------------
// Token budgeting for prompts assembled on small-context models.
// ---------------------------------------------------------------------------

struct BudgetConfig {
    size_t max_prompt_tokens = 3072;
    size_t reserved_tokens = 256;  // held back for the model's answer
};

/// Conservative estimate: ceil(bytes / 3).
[[nodiscard]] size_t EstimateTokens(std::string_view text);

/// Split `available` tokens across files proportionally to their estimated
/// sizes. Floors first, then the leftover tokens go one each to the largest
/// files (ties by original order). No file receives more than its own size,
/// and the result sums to min(available, sum(sizes)).
[[nodiscard]] std::vector<size_t> AllocateTokenBudget(
    const std::vector<size_t>& sizes, size_t available);

/// Keep the first 2/3 and last 1/3 of `max_bytes`, joined by a visible marker.
/// Never cuts a UTF-8 sequence. Returns `text` unchanged if it fits.
[[nodiscard]] std::string TruncateMiddle(std::string_view text, size_t max_bytes);

struct BudgetedPrompt {
    std::string prompt;
    size_t estimated_tokens = 0;
    std::vector<std::string> truncated_files;
    std::vector<std::string> dropped_files;
};

/// Build the prompt with as much of the attached files as fits:
///   1. Build without files; if that alone reaches max_prompt_tokens, fail
///      with BudgetOverflow.
///   2. available = max - base - reserved (floored at 0).
///   3. Files that do not fit whole are truncated to their allocation; files
///      allocated nothing are dropped and reported.
///   4. Re-measure; still over budget is BudgetOverflow.
[[nodiscard]] Result<BudgetedPrompt, Error> BuildPromptWithinBudget(
    const PromptBuilder& builder,
    const PromptInputs& inputs,
    const BudgetConfig& budget);

} // namespace edge_agent
