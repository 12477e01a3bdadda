// cspyce-build - Diagnostics
// Copyright (c) 2026 cspyce-build Authors
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdio>
#include <string>

namespace cspyce::build::log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3 };

/// Messages below the threshold are dropped. Defaults to Info.
void set_level(Level level);
Level level();

/// Redirect diagnostics (tests capture them into a temporary file).
/// Passing nullptr restores stderr.
void set_sink(std::FILE* sink);

void write(Level level, const std::string& msg);

inline void debug(const std::string& msg) { write(Level::Debug, msg); }
inline void info(const std::string& msg) { write(Level::Info, msg); }
inline void warn(const std::string& msg) { write(Level::Warn, msg); }
inline void error(const std::string& msg) { write(Level::Error, msg); }

const char* levelToString(Level level);

}  // namespace cspyce::build::log
