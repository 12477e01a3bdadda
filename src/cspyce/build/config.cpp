// cspyce-build - Build Configuration
// Copyright (c) 2026 cspyce-build Authors
// SPDX-License-Identifier: MIT

#include "cspyce/build/config.hpp"
#include "cspyce/build/platform.hpp"
#include "cspyce/build/process.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace cspyce::build {

// ============================================================
// Option Table
// ============================================================

const std::vector<OptionInfo>& recognised_options() {
    static const std::vector<OptionInfo> options = {
        {"module", OptionType::String, "SWIG module name"},
        {"interface", OptionType::Path, "interface-definition file (default <module>.i)"},
        {"work_dir", OptionType::Path, "directory holding inputs and outputs"},
        {"python_include", OptionType::Path, "directory containing Python.h"},
        {"site_packages", OptionType::Path, "site-packages directory containing numpy"},
        {"numpy_include", OptionType::Path, "NumPy C headers (overrides site_packages)"},
        {"toolkit_dir", OptionType::Path, "CSPICE installation or symlink"},
        {"toolkit_include", OptionType::Path, "CSPICE headers (default <toolkit_dir>/src/cspice)"},
        {"toolkit_library", OptionType::Path, "static library (default <toolkit_dir>/lib/cspice.a)"},
        {"platform", OptionType::String, "platform profile (linux, macos)"},
        {"swig", OptionType::Program, "interface generator"},
        {"swig_flags", OptionType::List, "extra interface generator flags"},
        {"cc", OptionType::Program, "C compiler"},
        {"cflags", OptionType::List, "extra compiler flags"},
        {"defines", OptionType::List, "preprocessor defines"},
        {"ld", OptionType::Program, "linker"},
        {"ldflags", OptionType::List, "extra linker flags"},
        {"libs", OptionType::List, "libraries linked after the toolkit"},
        {"use_python_config", OptionType::Bool, "add python-config --cflags/--ldflags"},
        {"python_config", OptionType::Program, "python-config command"},
        {"strip_cflags", OptionType::List, "flags removed from python-config --cflags"},
        {"macosx_version_min", OptionType::String, "minimum macOS version passed to ld"},
        {"init_module", OptionType::Bool, "rename the shadow module to __init__.py"},
        {"install_dir", OptionType::Path, "copy the extension here after a successful build"},
        {"verify_python", OptionType::Program, "interpreter used to import the new extension"},
        {"keep_intermediates", OptionType::Bool, "leave glue source and object files"},
        {"log_dir", OptionType::Path, "write tool output to per-stage log files"},
    };
    return options;
}

const OptionInfo* find_option(const std::string& key) {
    for (const auto& opt : recognised_options()) {
        if (key == opt.key) return &opt;
    }
    return nullptr;
}

std::optional<bool> parse_bool(const std::string& text) {
    std::string v;
    for (char c : text) v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "true" || v == "yes" || v == "on" || v == "1") return true;
    if (v == "false" || v == "no" || v == "off" || v == "0") return false;
    return std::nullopt;
}

// ============================================================
// Overlays
// ============================================================

void ConfigOverlay::set(const std::string& key, const std::string& value) {
    scalars.emplace_back(key, value);
}

void ConfigOverlay::set_list(const std::string& key, std::vector<std::string> values) {
    lists.push_back({key, std::move(values), false});
}

void ConfigOverlay::append(const std::string& key, const std::string& value) {
    lists.push_back({key, {value}, true});
}

namespace {

std::string* string_field(BuildConfig& cfg, const std::string& key) {
    if (key == "module") return &cfg.module;
    if (key == "interface") return &cfg.interface_file;
    if (key == "work_dir") return &cfg.work_dir;
    if (key == "python_include") return &cfg.python_include;
    if (key == "site_packages") return &cfg.site_packages;
    if (key == "numpy_include") return &cfg.numpy_include;
    if (key == "toolkit_dir") return &cfg.toolkit_dir;
    if (key == "toolkit_include") return &cfg.toolkit_include;
    if (key == "toolkit_library") return &cfg.toolkit_library;
    if (key == "platform") return &cfg.platform;
    if (key == "swig") return &cfg.swig;
    if (key == "cc") return &cfg.cc;
    if (key == "ld") return &cfg.ld;
    if (key == "python_config") return &cfg.python_config;
    if (key == "macosx_version_min") return &cfg.macosx_version_min;
    if (key == "install_dir") return &cfg.install_dir;
    if (key == "verify_python") return &cfg.verify_python;
    if (key == "log_dir") return &cfg.log_dir;
    return nullptr;
}

std::vector<std::string>* list_field(BuildConfig& cfg, const std::string& key) {
    if (key == "swig_flags") return &cfg.swig_flags;
    if (key == "cflags") return &cfg.cflags;
    if (key == "defines") return &cfg.defines;
    if (key == "ldflags") return &cfg.ldflags;
    if (key == "libs") return &cfg.libs;
    if (key == "strip_cflags") return &cfg.strip_cflags;
    return nullptr;
}

bool require_bool(const std::string& key, const std::string& value) {
    auto b = parse_bool(value);
    if (!b) {
        throw std::invalid_argument("option '" + key + "' expects a boolean, got '" + value + "'");
    }
    return *b;
}

}  // namespace

void apply_overlay(BuildConfig& cfg, const ConfigOverlay& overlay) {
    for (const auto& [key, value] : overlay.scalars) {
        if (auto* s = string_field(cfg, key)) {
            *s = value;
        } else if (auto* l = list_field(cfg, key)) {
            *l = {value};
        } else if (key == "use_python_config") {
            cfg.use_python_config = require_bool(key, value);
        } else if (key == "init_module") {
            cfg.init_module = require_bool(key, value);
        } else if (key == "keep_intermediates") {
            cfg.keep_intermediates = require_bool(key, value);
        } else {
            throw std::invalid_argument("unknown option '" + key + "'");
        }
    }
    for (const auto& entry : overlay.lists) {
        auto* l = list_field(cfg, entry.key);
        if (!l) {
            throw std::invalid_argument("option '" + entry.key + "' does not take a list");
        }
        if (!entry.append) l->clear();
        l->insert(l->end(), entry.values.begin(), entry.values.end());
    }
}

ConfigOverlay environment_overlay() {
    static const std::pair<const char*, const char*> kVars[] = {
        {"CSPYCE_BUILD_PYTHON_INCLUDE", "python_include"},
        {"CSPYCE_BUILD_SITE_PACKAGES", "site_packages"},
        {"CSPYCE_BUILD_NUMPY_INCLUDE", "numpy_include"},
        {"CSPYCE_BUILD_TOOLKIT_DIR", "toolkit_dir"},
        {"CSPYCE_BUILD_SWIG", "swig"},
        {"CSPYCE_BUILD_CC", "cc"},
        {"CSPYCE_BUILD_LD", "ld"},
    };
    ConfigOverlay overlay;
    for (const auto& [var, key] : kVars) {
        if (const char* p = std::getenv(var); p && *p) {
            overlay.set(key, p);
        }
    }
    return overlay;
}

// ============================================================
// Path Resolution
// ============================================================

namespace {

std::string anchor(const fs::path& base, const std::string& p) {
    if (p.empty()) return p;
    fs::path path(p);
    if (path.is_relative()) path = base / path;
    return path.lexically_normal().string();
}

// Bare program names are looked up on PATH; only paths get anchored.
std::string anchor_program(const fs::path& base, const std::string& p) {
    if (p.find('/') == std::string::npos) return p;
    return anchor(base, p);
}

}  // namespace

BuildConfig resolve_paths(const BuildConfig& in) {
    BuildConfig cfg = in;

    fs::path base = cfg.work_dir.empty() ? fs::current_path() : fs::path(cfg.work_dir);
    base = fs::absolute(base).lexically_normal();
    cfg.work_dir = base.string();

    if (cfg.interface_file.empty()) cfg.interface_file = cfg.module + ".i";
    cfg.interface_file = anchor(base, cfg.interface_file);

    cfg.python_include = anchor(base, cfg.python_include);
    cfg.site_packages = anchor(base, cfg.site_packages);
    cfg.numpy_include = anchor(base, cfg.numpy_include);
    if (cfg.numpy_include.empty() && !cfg.site_packages.empty()) {
        const fs::path site(cfg.site_packages);
        const fs::path legacy = site / "numpy" / "core" / "include";
        const fs::path current = site / "numpy" / "_core" / "include";
        std::error_code ec;
        if (!fs::is_directory(legacy, ec) && fs::is_directory(current, ec)) {
            cfg.numpy_include = current.string();
        } else {
            cfg.numpy_include = legacy.string();
        }
    }

    cfg.toolkit_dir = anchor(base, cfg.toolkit_dir);
    const fs::path toolkit(cfg.toolkit_dir);
    cfg.toolkit_include = cfg.toolkit_include.empty()
        ? (toolkit / "src" / "cspice").string()
        : anchor(base, cfg.toolkit_include);
    cfg.toolkit_library = cfg.toolkit_library.empty()
        ? (toolkit / "lib" / "cspice.a").string()
        : anchor(base, cfg.toolkit_library);

    if (cfg.platform.empty()) cfg.platform = host_platform_name();
    if (const auto* p = PlatformRegistry::instance().get(cfg.platform)) {
        cfg.platform = p->name();
        if (!cfg.use_python_config.has_value()) {
            cfg.use_python_config = p->default_use_python_config();
        }
    }

    cfg.swig = anchor_program(base, cfg.swig);
    cfg.cc = anchor_program(base, cfg.cc);
    cfg.ld = anchor_program(base, cfg.ld);
    cfg.python_config = anchor_program(base, cfg.python_config);
    cfg.verify_python = anchor_program(base, cfg.verify_python);

    cfg.install_dir = anchor(base, cfg.install_dir);
    cfg.log_dir = anchor(base, cfg.log_dir);
    return cfg;
}

// ============================================================
// Validation
// ============================================================

bool is_identifier(const std::string& name) {
    if (name.empty()) return false;
    if (!(std::isalpha(static_cast<unsigned char>(name[0])) || name[0] == '_')) return false;
    for (char c : name) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_')) return false;
    }
    return true;
}

namespace {

void check_dir(ConfigCheckResult& result, const char* option, const std::string& path) {
    std::error_code ec;
    if (!fs::is_directory(path, ec)) {
        result.add_error(ConfigErrorKind::PathNotFound, option,
                         "directory not found: " + path);
    }
}

void check_file(ConfigCheckResult& result, const char* option, const std::string& path,
                const std::string& hint = "") {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        result.add_error(ConfigErrorKind::PathNotFound, option,
                         "file not found: " + path, hint);
    }
}

void check_tool(ConfigCheckResult& result, const char* option, const std::string& exe) {
    if (exe.empty()) {
        result.add_error(ConfigErrorKind::MissingOption, option, "no program configured");
    } else if (!executable_in_path(exe)) {
        result.add_error(ConfigErrorKind::ToolNotFound, option,
                         "program not found: " + exe,
                         "install it or set '" + std::string(option) + "' to its path");
    }
}

}  // namespace

ConfigCheckResult validate_config(const BuildConfig& cfg) {
    ConfigCheckResult result;
    std::error_code ec;

    if (!is_identifier(cfg.module)) {
        result.add_error(ConfigErrorKind::InvalidValue, "module",
                         "module name is not an identifier: '" + cfg.module + "'");
    }

    const Platform* platform = PlatformRegistry::instance().get(cfg.platform);
    if (!platform) {
        std::string names;
        for (const auto& n : PlatformRegistry::instance().available()) {
            names += names.empty() ? n : ", " + n;
        }
        result.add_error(ConfigErrorKind::InvalidValue, "platform",
                         "unknown platform '" + cfg.platform + "'", "one of: " + names);
    } else if (!cfg.macosx_version_min.empty() && platform->name() != "macos") {
        result.add_error(ConfigErrorKind::InvalidValue, "macosx_version_min",
                         "only meaningful for the macos platform");
    }

    check_dir(result, "work_dir", cfg.work_dir);
    check_file(result, "interface", cfg.interface_file);

    if (cfg.python_include.empty()) {
        result.add_error(ConfigErrorKind::MissingOption, "python_include",
                         "Python include directory is not set",
                         "pass --python-include or set CSPYCE_BUILD_PYTHON_INCLUDE");
    } else if (!fs::is_directory(cfg.python_include, ec)) {
        check_dir(result, "python_include", cfg.python_include);
    } else {
        check_file(result, "python_include",
                   (fs::path(cfg.python_include) / "Python.h").string(),
                   "install the Python development headers");
    }

    if (cfg.numpy_include.empty()) {
        result.add_error(ConfigErrorKind::MissingOption, "site_packages",
                         "neither site_packages nor numpy_include is set",
                         "pass --site-packages or --numpy-include");
    } else if (!fs::is_directory(cfg.numpy_include, ec)) {
        check_dir(result, "numpy_include", cfg.numpy_include);
    } else {
        check_file(result, "numpy_include",
                   (fs::path(cfg.numpy_include) / "numpy" / "arrayobject.h").string());
    }

    check_dir(result, "toolkit_include", cfg.toolkit_include);
    check_file(result, "toolkit_library", cfg.toolkit_library,
               "unpack the CSPICE toolkit into '" + cfg.toolkit_dir + "' or symlink it there");

    check_tool(result, "swig", cfg.swig);
    check_tool(result, "cc", cfg.cc);
    check_tool(result, "ld", cfg.ld);
    if (cfg.use_python_config.value_or(false)) {
        check_tool(result, "python_config", cfg.python_config);
    }
    if (!cfg.verify_python.empty()) {
        check_tool(result, "verify_python", cfg.verify_python);
    }

    if (!cfg.install_dir.empty()) {
        check_dir(result, "install_dir", cfg.install_dir);
    }

    return result;
}

}  // namespace cspyce::build
