// cspyce-build - Build Artifacts
// Copyright (c) 2026 cspyce-build Authors
// SPDX-License-Identifier: MIT

#pragma once

#include "cspyce/build/config.hpp"

#include <string>
#include <vector>

namespace cspyce::build {

/// Absolute paths of everything the pipeline reads, writes or removes.
struct ArtifactLayout {
    // Inputs
    std::string interface_file;
    std::string library;

    // Transient
    std::string glue_source;   // <module>_wrap.c
    std::string object;        // <module>_wrap.o
    std::string staging_dir;   // .cspyce-build-staging
    std::string staged_extension;

    // Outputs
    std::string shadow_module;  // <module>.py as written by SWIG
    std::string init_module;    // __init__.py (package layout)
    std::string extension;      // _<module>.so

    /// Expects a config that went through resolve_paths().
    static ArtifactLayout from_config(const BuildConfig& cfg, const std::string& suffix = ".so");

    /// Files removed before regeneration and after consumption.
    [[nodiscard]] std::vector<std::string> transient() const {
        return {glue_source, object, staging_dir};
    }
};

/// Remove a file or directory tree. Absent paths are not an error.
/// Returns false (with `error` filled) if the path exists and could not be removed.
bool remove_artifact(const std::string& path, std::string* error = nullptr);

/// Removes its registered paths when it goes out of scope, on every exit
/// path of the scope that owns it. Failures are logged, never thrown.
class ScopedArtifactCleanup {
public:
    explicit ScopedArtifactCleanup(std::vector<std::string> paths);
    ~ScopedArtifactCleanup();

    ScopedArtifactCleanup(const ScopedArtifactCleanup&) = delete;
    ScopedArtifactCleanup& operator=(const ScopedArtifactCleanup&) = delete;

    /// Leave the files in place (keep_intermediates / dry-run).
    void dismiss() { active_ = false; }

    /// Remove now; returns the paths that could not be removed.
    std::vector<std::string> release();

private:
    std::vector<std::string> paths_;
    bool active_ = true;
};

}  // namespace cspyce::build
