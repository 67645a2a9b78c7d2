#pragma once

namespace edge_agent {

enum class ColorMode {
    Auto,    // color when the stream is a terminal and NO_COLOR is unset
    Always,  // --color
    Never,   // --no-color
};

/// True if the file descriptor is connected to a terminal.
bool IsTerminal(int fd);

/// True if NO_COLOR is present in the environment (https://no-color.org/).
bool NoColorEnvSet();

/// Whether output written to `fd` should carry ANSI escapes. --no-color and
/// NO_COLOR beat --color.
bool ShouldColor(ColorMode mode, int fd);

} // namespace edge_agent
