// cspyce-build - External Process Runner
// Copyright (c) 2026 cspyce-build Authors
// SPDX-License-Identifier: MIT

#include "cspyce/build/process.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <string_view>
#include <sys/wait.h>

namespace fs = std::filesystem;

namespace cspyce::build {
namespace {

bool needs_quoting(const std::string& s) {
    if (s.empty()) return true;
    for (unsigned char c : s) {
        if (std::isalnum(c)) continue;
        switch (c) {
            case '-': case '_': case '.': case '/': case '=': case ':':
            case ',': case '+': case '@': case '%':
                continue;
            default:
                return true;
        }
    }
    return false;
}

}  // namespace

std::string shell_quote(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('\'');
    for (char c : s) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out.push_back(c);
        }
    }
    out.push_back('\'');
    return out;
}

std::string render_command(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& a : argv) {
        if (!out.empty()) out.push_back(' ');
        out += needs_quoting(a) ? shell_quote(a) : a;
    }
    return out;
}

std::string shell_command_line(const Command& cmd, bool capture_stdout) {
    std::string line;
    if (!cmd.working_dir.empty()) {
        line += "cd " + shell_quote(cmd.working_dir) + " && ";
    }
    for (size_t i = 0; i < cmd.argv.size(); ++i) {
        if (i) line.push_back(' ');
        line += shell_quote(cmd.argv[i]);
    }
    if (!cmd.log_path.empty()) {
        if (capture_stdout) {
            line += " 2> " + shell_quote(cmd.log_path);
        } else {
            line += " > " + shell_quote(cmd.log_path) + " 2>&1";
        }
    }
    return line;
}

int decode_wait_status(int status) {
    if (status == -1) return kLaunchFailure;
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    // Killed by a signal: report the conventional 128+N.
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return kLaunchFailure;
}

int ShellCommandRunner::run(const Command& cmd) {
    if (cmd.argv.empty()) return kLaunchFailure;
    std::fflush(nullptr);
    return decode_wait_status(std::system(shell_command_line(cmd, false).c_str()));
}

CaptureResult ShellCommandRunner::capture(const Command& cmd) {
    CaptureResult result;
    if (cmd.argv.empty()) {
        result.exit_code = kLaunchFailure;
        return result;
    }
    std::fflush(nullptr);
    FILE* pipe = popen(shell_command_line(cmd, true).c_str(), "r");
    if (!pipe) {
        result.exit_code = kLaunchFailure;
        return result;
    }
    char buf[256];
    while (true) {
        size_t n = fread(buf, 1, sizeof(buf), pipe);
        if (n == 0) break;
        result.output.append(buf, buf + n);
    }
    result.exit_code = decode_wait_status(pclose(pipe));
    return result;
}

bool executable_in_path(const std::string& exe) {
    if (exe.empty()) return false;
    std::error_code ec;
    if (exe.find('/') != std::string::npos) {
        return fs::exists(exe, ec) && !fs::is_directory(exe, ec);
    }
    const char* path = std::getenv("PATH");
    if (!path || !*path) return false;
    std::string_view paths(path);
    while (!paths.empty()) {
        const auto pos = paths.find(':');
        std::string_view dir = (pos == std::string_view::npos) ? paths : paths.substr(0, pos);
        if (!dir.empty()) {
            fs::path p = fs::path(std::string(dir)) / exe;
            if (fs::exists(p, ec) && !fs::is_directory(p, ec)) return true;
        }
        if (pos == std::string_view::npos) break;
        paths.remove_prefix(pos + 1);
    }
    return false;
}

std::vector<std::string> split_flags(const std::string& text) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!cur.empty()) {
                out.push_back(cur);
                cur.clear();
            }
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

}  // namespace cspyce::build
