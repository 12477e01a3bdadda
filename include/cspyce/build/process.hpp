// cspyce-build - External Process Runner
// Copyright (c) 2026 cspyce-build Authors
// SPDX-License-Identifier: MIT

#pragma once

#include <string>
#include <vector>

namespace cspyce::build {

/// One external tool invocation.
struct Command {
    std::vector<std::string> argv;
    std::string working_dir;  // empty = inherit
    std::string log_path;     // empty = tool output goes to the terminal
};

struct CaptureResult {
    int exit_code = 0;
    std::string output;  // stdout only
};

// Exit code reported when the child could not be launched or was killed.
inline constexpr int kLaunchFailure = 127;

/// Runs external tools. The pipeline only talks to this interface so tests
/// can substitute a runner that simulates swig/cc/ld in-process.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /// Run to completion and return the exit status (0 = success).
    virtual int run(const Command& cmd) = 0;

    /// Run and collect stdout. Used for read-only queries (python-config).
    virtual CaptureResult capture(const Command& cmd) = 0;
};

/// Executes commands through /bin/sh via std::system / popen.
class ShellCommandRunner : public CommandRunner {
public:
    int run(const Command& cmd) override;
    CaptureResult capture(const Command& cmd) override;
};

/// POSIX single-quote escaping; safe for any byte except NUL.
std::string shell_quote(const std::string& s);

/// Human-readable command line (arguments quoted only when needed).
std::string render_command(const std::vector<std::string>& argv);

/// Full sh command line including `cd` and log redirection.
std::string shell_command_line(const Command& cmd, bool capture_stdout);

/// True if `exe` is an existing path, or a bare name found on PATH.
bool executable_in_path(const std::string& exe);

/// Split a flag string (e.g. python-config output) on whitespace.
std::vector<std::string> split_flags(const std::string& text);

/// Decode a std::system / pclose wait status into an exit code.
int decode_wait_status(int status);

}  // namespace cspyce::build
