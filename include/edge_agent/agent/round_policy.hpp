#pragma once

#include <functional>

namespace edge_agent {

// Which tool calls a round may execute.
enum class RoundAllowance {
    All,        // any tool
    WriteOnly,  // only the designated write tool
};

// Maps a 0-based round index to its allowance.
using RoundPolicy = std::function<RoundAllowance(int round)>;

/// Round 0 may call anything; later rounds may only write.
inline RoundAllowance DefaultRoundPolicy(int round) {
    return round == 0 ? RoundAllowance::All : RoundAllowance::WriteOnly;
}

} // namespace edge_agent
