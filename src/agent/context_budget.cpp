#include <edge_agent/agent/context_budget.hpp>

#include <edge_agent/core/log.hpp>
#include <edge_agent/core/text.hpp>

#include <algorithm>
#include <numeric>

namespace edge_agent {

namespace {

constexpr const char* kComponent = "budget";

std::string TruncationMarker(size_t removed_bytes) {
    return "\n...[truncated " + std::to_string(removed_bytes) + " bytes]...\n";
}

Error MakeOverflowError(const std::string& message, size_t estimated,
                        size_t limit) {
    return Error{"BuildPrompt", "",
                 message,
                 "estimated " + std::to_string(estimated) + " tokens, limit " +
                     std::to_string(limit),
                 ErrorCategory::BudgetOverflow};
}

} // anonymous namespace

size_t EstimateTokens(std::string_view text) {
    return (text.size() + 2) / 3;
}

std::vector<size_t> AllocateTokenBudget(const std::vector<size_t>& sizes,
                                        size_t available) {
    const size_t total = std::accumulate(sizes.begin(), sizes.end(), size_t{0});
    if (total <= available) {
        return sizes;
    }

    std::vector<size_t> alloc(sizes.size(), 0);
    size_t assigned = 0;
    for (size_t i = 0; i < sizes.size(); ++i) {
        alloc[i] = static_cast<size_t>(
            static_cast<unsigned long long>(available) * sizes[i] / total);
        assigned += alloc[i];
    }

    // Largest files first; stable so equal sizes keep their original order.
    std::vector<size_t> order(sizes.size());
    std::iota(order.begin(), order.end(), size_t{0});
    std::stable_sort(order.begin(), order.end(),
                     [&](size_t a, size_t b) { return sizes[a] > sizes[b]; });

    size_t leftover = available - assigned;
    for (size_t idx = 0; leftover > 0 && idx < order.size(); ++idx) {
        const size_t i = order[idx];
        if (alloc[i] < sizes[i]) {
            ++alloc[i];
            --leftover;
        }
    }
    return alloc;
}

std::string TruncateMiddle(std::string_view text, size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return std::string(text);
    }
    // Size the marker for the worst case so the result stays within max_bytes.
    const size_t marker_budget = TruncationMarker(text.size()).size();
    if (max_bytes <= marker_budget) {
        return TruncationMarker(text.size());
    }
    const size_t content = max_bytes - marker_budget;
    const size_t head_len = Utf8FloorBoundary(text, content * 2 / 3);
    const size_t tail_len = content - content * 2 / 3;
    size_t tail_start = Utf8CeilBoundary(text, text.size() - tail_len);
    tail_start = std::max(tail_start, head_len);

    std::string out(text.substr(0, head_len));
    out += TruncationMarker(tail_start - head_len);
    out.append(text.substr(tail_start));
    return out;
}

Result<BudgetedPrompt, Error> BuildPromptWithinBudget(const PromptBuilder& builder,
                                                      const PromptInputs& inputs,
                                                      const BudgetConfig& budget) {
    using R = Result<BudgetedPrompt, Error>;

    // Base: every section except file contents. The per-file wrappers stay in
    // so their overhead is part of the measurement.
    PromptInputs base_inputs = inputs;
    for (auto& file : base_inputs.files) {
        file.content.clear();
    }
    const size_t base_tokens = EstimateTokens(builder(base_inputs));
    if (base_tokens >= budget.max_prompt_tokens) {
        return R::Err(MakeOverflowError(
            "Prompt exceeds the token budget before attaching files",
            base_tokens, budget.max_prompt_tokens));
    }

    const size_t headroom = budget.max_prompt_tokens - base_tokens;
    const size_t available =
        headroom > budget.reserved_tokens ? headroom - budget.reserved_tokens : 0;

    std::vector<size_t> sizes;
    sizes.reserve(inputs.files.size());
    for (const auto& file : inputs.files) {
        sizes.push_back(EstimateTokens(file.content));
    }
    const auto alloc = AllocateTokenBudget(sizes, available);

    BudgetedPrompt result;
    PromptInputs final_inputs = inputs;
    final_inputs.files.clear();
    for (size_t i = 0; i < inputs.files.size(); ++i) {
        const auto& file = inputs.files[i];
        if (alloc[i] == 0 && sizes[i] > 0) {
            result.dropped_files.push_back(file.path);
            LogWarn(kComponent, "Dropped '" + file.path + "' from the prompt (no token budget left)");
            continue;
        }
        if (alloc[i] < sizes[i]) {
            result.truncated_files.push_back(file.path);
            LogInfo(kComponent, "Truncated '" + file.path + "' to ~" +
                                    std::to_string(alloc[i]) + " tokens");
            final_inputs.files.push_back({file.path, TruncateMiddle(file.content, alloc[i] * 3)});
        } else {
            final_inputs.files.push_back(file);
        }
    }

    result.prompt = builder(final_inputs);
    result.estimated_tokens = EstimateTokens(result.prompt);
    if (result.estimated_tokens > budget.max_prompt_tokens) {
        return R::Err(MakeOverflowError("Prompt exceeds the token budget",
                                        result.estimated_tokens,
                                        budget.max_prompt_tokens));
    }
    LogDebug(kComponent, "Prompt uses ~" + std::to_string(result.estimated_tokens) +
                             " of " + std::to_string(budget.max_prompt_tokens) + " tokens");
    return R::Ok(std::move(result));
}

} // namespace edge_agent
