#pragma once
#include <chrono>
#include <string>
#include <utility>
#include <vector>

// Minimal POSIX process helpers used to reach the token tools (ykinfo,
// ykchalresp) and to hand a recovered secret to bw / an interactive shell.

struct ProcessResult {
    int exitCode = -1;      // exit status, or 128 + signal
    bool timedOut = false;  // child was killed at the deadline
    std::string out;
    std::string err;
};

using EnvOverrides = std::vector<std::pair<std::string, std::string>>;

// Runs argv[0] (looked up in PATH) with stdin on /dev/null and captures
// stdout/stderr. The child is killed (SIGKILL) once `timeout` elapses.
// Throws std::system_error when the process cannot be started.
ProcessResult runProcess(const std::vector<std::string>& argv,
                         std::chrono::milliseconds timeout,
                         const EnvOverrides& env = {});

// Replaces the current process image. Only returns by throwing std::system_error.
[[noreturn]] void execReplacing(const std::vector<std::string>& argv,
                                const EnvOverrides& env = {});
