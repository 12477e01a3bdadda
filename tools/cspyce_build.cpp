// cspyce-build - command-line entry point
// Copyright (c) 2026 cspyce-build Authors
// SPDX-License-Identifier: MIT

#include "cspyce/build/cli.hpp"
#include "cspyce/build/log.hpp"

#include <exception>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    cspyce::build::ShellCommandRunner runner;
    try {
        return cspyce::build::run_cli(args, runner);
    } catch (const std::exception& e) {
        cspyce::build::log::error(std::string("internal error: ") + e.what());
        return cspyce::build::kExitBuildFailed;
    }
}
