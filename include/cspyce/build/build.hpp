// cspyce-build - Main Header
// Copyright (c) 2026 cspyce-build Authors
// SPDX-License-Identifier: MIT

#pragma once

// Infrastructure
#include "log.hpp"
#include "process.hpp"

// Configuration
#include "config.hpp"
#include "config_parser.hpp"
#include "platform.hpp"

// Build procedure
#include "artifacts.hpp"
#include "pipeline.hpp"

// Front end
#include "cli.hpp"
