// cspyce-build - Platform Profiles
// Copyright (c) 2026 cspyce-build Authors
// SPDX-License-Identifier: MIT

#pragma once

#include "cspyce/build/config.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace cspyce::build {

// ============================================================
// Link Inputs
// ============================================================

/// Everything the link step consumes, as absolute paths.
struct LinkInputs {
    std::string output;
    std::string object;
    std::string library;
    std::vector<std::string> python_ldflags;  // empty unless python-config is used
};

// ============================================================
// Platform Interface
// ============================================================

/// Per-OS compile and link conventions for a loadable Python extension.
class Platform {
public:
    virtual ~Platform() = default;

    /// Canonical name ("linux", "macos")
    virtual std::string name() const = 0;

    /// Other accepted spellings
    virtual std::vector<std::string> aliases() const { return {}; }

    /// Whether `python-config --cflags/--ldflags` is used unless configured
    virtual bool default_use_python_config() const = 0;

    /// Flags every compile of the glue code needs on this platform
    virtual std::vector<std::string> compile_flags(const BuildConfig& cfg) const = 0;

    /// Complete linker argv (argv[0] is cfg.ld)
    virtual std::vector<std::string> link_command(const BuildConfig& cfg,
                                                  const LinkInputs& in) const = 0;

    virtual std::string extension_suffix() const { return ".so"; }
};

/// ELF shared object: `ld -o OUT OBJ -shared LIB -lm`
class LinuxPlatform : public Platform {
public:
    std::string name() const override { return "linux"; }
    std::vector<std::string> aliases() const override { return {"ubuntu", "gnu"}; }
    bool default_use_python_config() const override { return false; }
    std::vector<std::string> compile_flags(const BuildConfig& cfg) const override;
    std::vector<std::string> link_command(const BuildConfig& cfg,
                                          const LinkInputs& in) const override;
};

/// Mach-O bundle with symbols resolved by the interpreter at load time.
class MacOSPlatform : public Platform {
public:
    std::string name() const override { return "macos"; }
    std::vector<std::string> aliases() const override { return {"osx", "darwin"}; }
    bool default_use_python_config() const override { return true; }
    std::vector<std::string> compile_flags(const BuildConfig& cfg) const override;
    std::vector<std::string> link_command(const BuildConfig& cfg,
                                          const LinkInputs& in) const override;
};

// ============================================================
// Platform Registry
// ============================================================

class PlatformRegistry {
public:
    static PlatformRegistry& instance();

    void register_platform(std::unique_ptr<Platform> platform);

    /// Lookup by name or alias, case-insensitive. nullptr if unknown.
    const Platform* get(const std::string& name) const;

    std::vector<std::string> available() const;

private:
    PlatformRegistry();
    std::unordered_map<std::string, std::unique_ptr<Platform>> platforms_;
    std::unordered_map<std::string, std::string> aliases_;
};

/// Name of the profile matching the machine this was built on.
std::string host_platform_name();

}  // namespace cspyce::build
