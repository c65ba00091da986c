// ============================================================================
// command.cpp - Run a shell command and capture its result
// ============================================================================

#include "bunit/command.hpp"
#include "bunit/utils.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <stdexcept>

#include <sys/wait.h>

namespace bunit {

// ── decode_status ───────────────────────────────────────────────────────────
// pclose() returns a wait status, not an exit code.

static int decode_status(int wait_status) {
    if (WIFEXITED(wait_status)) {
        return WEXITSTATUS(wait_status);
    }
    if (WIFSIGNALED(wait_status)) {
        return 128 + WTERMSIG(wait_status);
    }
    return wait_status;
}

// ── run_command ─────────────────────────────────────────────────────────────

CommandResult run_command(const std::string& command) {
    // Anything the test already printed must reach the terminal before the
    // child shares it (stderr is inherited).
    std::cout.flush();
    std::fflush(stdout);

    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) {
        throw std::runtime_error("cannot run command '" + command +
                                 "': " + std::strerror(errno));
    }

    CommandResult result;
    char buf[4096];
    std::size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), pipe)) > 0) {
        result.output.append(buf, n);
    }

    int wait_status = pclose(pipe);
    if (wait_status == -1) {
        throw std::runtime_error("cannot collect status of '" + command +
                                 "': " + std::strerror(errno));
    }

    result.output = strip_trailing_newlines(result.output);
    result.status = decode_status(wait_status);
    return result;
}

}  // namespace bunit
