#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace edge_agent {

/// True when the user text asks to create, write or save something.
/// Matches English and Japanese keywords and file-operation phrases.
[[nodiscard]] bool HasFileOperationIntent(std::string_view text);

} // namespace edge_agent
