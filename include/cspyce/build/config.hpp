// cspyce-build - Build Configuration
// Copyright (c) 2026 cspyce-build Authors
// SPDX-License-Identifier: MIT

#pragma once

#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace cspyce::build {

// ============================================================
// Build Configuration
// ============================================================

/// Every recognised option. Empty strings mean "not set"; paths may be
/// relative until resolve_paths() anchors them at work_dir.
struct BuildConfig {
    std::string module = "cspice";
    std::string interface_file;  // default: <module>.i
    std::string work_dir;        // default: current directory

    // Environment-specific; never defaulted.
    std::string python_include;
    std::string site_packages;
    std::string numpy_include;  // default: derived from site_packages

    std::string toolkit_dir = "cspice";
    std::string toolkit_include;  // default: <toolkit_dir>/src/cspice
    std::string toolkit_library;  // default: <toolkit_dir>/lib/cspice.a

    std::string platform;  // default: host platform

    std::string swig = "swig";
    std::vector<std::string> swig_flags;
    std::string cc = "gcc";
    std::vector<std::string> cflags;
    std::vector<std::string> defines;
    std::string ld = "ld";
    std::vector<std::string> ldflags;
    std::vector<std::string> libs = {"m"};

    std::optional<bool> use_python_config;  // default: platform decides
    std::string python_config = "python3-config";
    std::vector<std::string> strip_cflags;
    std::string macosx_version_min;

    bool init_module = false;
    std::string install_dir;
    std::string verify_python;
    bool keep_intermediates = false;
    std::string log_dir;
};

/// Partial configuration: only the keys a source (file, env, CLI) set.
/// Applied over a BuildConfig in precedence order.
struct ConfigOverlay {
    struct ListValue {
        std::string key;
        std::vector<std::string> values;
        bool append = false;  // extend the current list instead of replacing it
    };

    std::vector<std::pair<std::string, std::string>> scalars;
    std::vector<ListValue> lists;

    void set(const std::string& key, const std::string& value);
    void set_list(const std::string& key, std::vector<std::string> values);
    void append(const std::string& key, const std::string& value);
    [[nodiscard]] bool empty() const { return scalars.empty() && lists.empty(); }
};

enum class OptionType { String, Path, Program, Bool, List };

struct OptionInfo {
    const char* key;
    OptionType type;
    const char* help;
};

/// Table of recognised option keys, in documentation order.
const std::vector<OptionInfo>& recognised_options();
const OptionInfo* find_option(const std::string& key);

/// Parse "true"/"false"/"yes"/"no"/"on"/"off"/"1"/"0".
std::optional<bool> parse_bool(const std::string& text);

/// Apply an overlay. Throws std::invalid_argument for unknown keys or
/// malformed booleans.
void apply_overlay(BuildConfig& cfg, const ConfigOverlay& overlay);

/// Read CSPYCE_BUILD_* variables from the environment.
ConfigOverlay environment_overlay();

/// Fill derived defaults (interface file, toolkit paths, NumPy include,
/// platform) and make every path absolute relative to work_dir.
BuildConfig resolve_paths(const BuildConfig& cfg);

// ============================================================
// Validation
// ============================================================

enum class ConfigErrorKind {
    MissingOption,  // Required environment-specific option unset
    InvalidValue,   // Value has the wrong form
    PathNotFound,   // Input file or directory does not exist
    ToolNotFound,   // External program not found
};

struct ConfigError {
    ConfigErrorKind kind;
    std::string option;
    std::string message;
    std::string hint;

    [[nodiscard]] std::string to_string() const {
        std::ostringstream oss;
        oss << "ConfigError[";
        switch (kind) {
            case ConfigErrorKind::MissingOption: oss << "MissingOption"; break;
            case ConfigErrorKind::InvalidValue: oss << "InvalidValue"; break;
            case ConfigErrorKind::PathNotFound: oss << "PathNotFound"; break;
            case ConfigErrorKind::ToolNotFound: oss << "ToolNotFound"; break;
        }
        oss << "]";
        if (!option.empty()) {
            oss << " " << option;
        }
        oss << ": " << message;
        if (!hint.empty()) {
            oss << " (hint: " << hint << ")";
        }
        return oss.str();
    }
};

struct ConfigCheckResult {
    bool valid = true;
    std::vector<ConfigError> errors;

    void add_error(ConfigErrorKind kind, const std::string& option,
                   const std::string& message, const std::string& hint = "") {
        valid = false;
        errors.push_back({kind, option, message, hint});
    }

    [[nodiscard]] bool has(ConfigErrorKind kind, const std::string& option) const {
        for (const auto& e : errors) {
            if (e.kind == kind && e.option == option) return true;
        }
        return false;
    }

    [[nodiscard]] std::string to_string() const {
        if (valid) return "Config: OK";
        std::ostringstream oss;
        oss << "Config: " << errors.size() << " error(s)\n";
        for (const auto& e : errors) {
            oss << "  " << e.to_string() << "\n";
        }
        return oss.str();
    }
};

/// Check a resolved configuration. Collects every problem; runs nothing.
ConfigCheckResult validate_config(const BuildConfig& cfg);

/// True if `name` is a C identifier (SWIG module names must be).
bool is_identifier(const std::string& name);

}  // namespace cspyce::build
