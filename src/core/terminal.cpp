#include <edge_agent/core/terminal.hpp>

#include <cstdlib>

#include <unistd.h>

namespace edge_agent {

bool IsTerminal(int fd) {
    return fd >= 0 && isatty(fd) != 0;
}

bool NoColorEnvSet() {
    return std::getenv("NO_COLOR") != nullptr;
}

bool ShouldColor(ColorMode mode, int fd) {
    if (mode == ColorMode::Never || NoColorEnvSet()) {
        return false;
    }
    return mode == ColorMode::Always || IsTerminal(fd);
}

} // namespace edge_agent
