// cspyce-build - Platform Profiles
// Copyright (c) 2026 cspyce-build Authors
// SPDX-License-Identifier: MIT

#include "cspyce/build/platform.hpp"

#include <algorithm>
#include <cctype>

namespace cspyce::build {
namespace {

std::string lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

void append_libs(std::vector<std::string>& argv, const BuildConfig& cfg) {
    for (const auto& lib : cfg.libs) {
        argv.push_back("-l" + lib);
    }
}

}  // namespace

// ============================================================
// Linux
// ============================================================

std::vector<std::string> LinuxPlatform::compile_flags(const BuildConfig&) const {
    return {"-fPIC"};
}

std::vector<std::string> LinuxPlatform::link_command(const BuildConfig& cfg,
                                                     const LinkInputs& in) const {
    std::vector<std::string> argv{cfg.ld, "-o", in.output, in.object, "-shared"};
    argv.insert(argv.end(), in.python_ldflags.begin(), in.python_ldflags.end());
    argv.insert(argv.end(), cfg.ldflags.begin(), cfg.ldflags.end());
    argv.push_back(in.library);
    append_libs(argv, cfg);
    return argv;
}

// ============================================================
// macOS
// ============================================================

std::vector<std::string> MacOSPlatform::compile_flags(const BuildConfig&) const {
    return {};
}

std::vector<std::string> MacOSPlatform::link_command(const BuildConfig& cfg,
                                                     const LinkInputs& in) const {
    std::vector<std::string> argv{cfg.ld, "-bundle"};
    argv.insert(argv.end(), in.python_ldflags.begin(), in.python_ldflags.end());
    argv.insert(argv.end(), {"-flat_namespace", "-undefined", "suppress"});
    if (!cfg.macosx_version_min.empty()) {
        argv.push_back("-macosx_version_min");
        argv.push_back(cfg.macosx_version_min);
    }
    argv.insert(argv.end(), cfg.ldflags.begin(), cfg.ldflags.end());
    argv.insert(argv.end(), {"-o", in.output, in.object, in.library});
    append_libs(argv, cfg);
    return argv;
}

// ============================================================
// Registry
// ============================================================

PlatformRegistry& PlatformRegistry::instance() {
    static PlatformRegistry registry;
    return registry;
}

PlatformRegistry::PlatformRegistry() {
    register_platform(std::make_unique<LinuxPlatform>());
    register_platform(std::make_unique<MacOSPlatform>());
}

void PlatformRegistry::register_platform(std::unique_ptr<Platform> platform) {
    std::string name = lower(platform->name());
    for (const auto& alias : platform->aliases()) {
        aliases_[lower(alias)] = name;
    }
    platforms_[name] = std::move(platform);
}

const Platform* PlatformRegistry::get(const std::string& name) const {
    std::string key = lower(name);
    if (auto a = aliases_.find(key); a != aliases_.end()) {
        key = a->second;
    }
    auto it = platforms_.find(key);
    return (it != platforms_.end()) ? it->second.get() : nullptr;
}

std::vector<std::string> PlatformRegistry::available() const {
    std::vector<std::string> names;
    names.reserve(platforms_.size());
    for (const auto& [name, _] : platforms_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::string host_platform_name() {
#if defined(__APPLE__)
    return "macos";
#else
    return "linux";
#endif
}

}  // namespace cspyce::build
