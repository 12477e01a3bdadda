// cspyce-build - Build Artifacts
// Copyright (c) 2026 cspyce-build Authors
// SPDX-License-Identifier: MIT

#include "cspyce/build/artifacts.hpp"
#include "cspyce/build/log.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace cspyce::build {

ArtifactLayout ArtifactLayout::from_config(const BuildConfig& cfg, const std::string& suffix) {
    const fs::path dir(cfg.work_dir);
    const std::string ext_name = "_" + cfg.module + suffix;

    ArtifactLayout a;
    a.interface_file = cfg.interface_file;
    a.library = cfg.toolkit_library;
    a.glue_source = (dir / (cfg.module + "_wrap.c")).string();
    a.object = (dir / (cfg.module + "_wrap.o")).string();
    a.staging_dir = (dir / ".cspyce-build-staging").string();
    a.staged_extension = (fs::path(a.staging_dir) / ext_name).string();
    a.shadow_module = (dir / (cfg.module + ".py")).string();
    a.init_module = (dir / "__init__.py").string();
    a.extension = (dir / ext_name).string();
    return a;
}

bool remove_artifact(const std::string& path, std::string* error) {
    if (path.empty()) return true;
    std::error_code ec;
    const auto st = fs::symlink_status(path, ec);
    if (ec || !fs::exists(st)) return true;
    if (fs::is_directory(st)) {
        fs::remove_all(path, ec);
    } else {
        fs::remove(path, ec);
    }
    if (ec) {
        if (error) *error = path + ": " + ec.message();
        return false;
    }
    return true;
}

ScopedArtifactCleanup::ScopedArtifactCleanup(std::vector<std::string> paths)
    : paths_(std::move(paths)) {}

ScopedArtifactCleanup::~ScopedArtifactCleanup() {
    release();
}

std::vector<std::string> ScopedArtifactCleanup::release() {
    std::vector<std::string> failed;
    if (!active_) return failed;
    active_ = false;
    for (const auto& p : paths_) {
        std::string err;
        if (!remove_artifact(p, &err)) {
            log::warn("could not remove intermediate " + err);
            failed.push_back(p);
        }
    }
    return failed;
}

}  // namespace cspyce::build
