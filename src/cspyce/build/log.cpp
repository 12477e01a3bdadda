// cspyce-build - Diagnostics
// Copyright (c) 2026 cspyce-build Authors
// SPDX-License-Identifier: MIT

#include "cspyce/build/log.hpp"

namespace cspyce::build::log {
namespace {

Level g_level = Level::Info;
std::FILE* g_sink = nullptr;

}  // namespace

void set_level(Level level) { g_level = level; }

Level level() { return g_level; }

void set_sink(std::FILE* sink) { g_sink = sink; }

const char* levelToString(Level level) {
    switch (level) {
        case Level::Debug: return "debug";
        case Level::Info: return "info";
        case Level::Warn: return "warning";
        case Level::Error: return "error";
    }
    return "unknown";
}

void write(Level level, const std::string& msg) {
    if (static_cast<int>(level) < static_cast<int>(g_level)) return;
    std::FILE* out = g_sink ? g_sink : stderr;
    if (level == Level::Info) {
        std::fprintf(out, "[cspyce-build] %s\n", msg.c_str());
    } else {
        std::fprintf(out, "[cspyce-build] %s: %s\n", levelToString(level), msg.c_str());
    }
    std::fflush(out);
}

}  // namespace cspyce::build::log
