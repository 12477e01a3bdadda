// cspyce-build - Command Line
// Copyright (c) 2026 cspyce-build Authors
// SPDX-License-Identifier: MIT

#pragma once

#include "cspyce/build/config.hpp"
#include "cspyce/build/process.hpp"

#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>

namespace cspyce::build {

inline constexpr int kExitOk = 0;
inline constexpr int kExitBuildFailed = 1;
inline constexpr int kExitUsage = 2;  // bad flags, bad config file, failed validation

inline constexpr const char* kDefaultConfigFile = "cspyce-build.conf";

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct CliOptions {
    std::string config_file;  // --config; empty = look for cspyce-build.conf
    ConfigOverlay overlay;    // every other option flag
    bool dry_run = false;
    bool verbose = false;
    bool quiet = false;
    bool help = false;
};

/// Parse arguments (without argv[0]). Throws UsageError.
CliOptions parse_command_line(const std::vector<std::string>& args);

std::string usage_text();

/// Combine defaults, the config file, CSPYCE_BUILD_* and the flags, in
/// increasing precedence. Throws ParseError / std::invalid_argument.
BuildConfig load_config(const CliOptions& opts);

/// Whole program: parse, load, validate, build, report. Returns an exit code.
int run_cli(const std::vector<std::string>& args, CommandRunner& runner,
            std::FILE* out = stdout);

}  // namespace cspyce::build
