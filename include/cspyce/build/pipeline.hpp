// cspyce-build - Build Pipeline
// Copyright (c) 2026 cspyce-build Authors
// SPDX-License-Identifier: MIT

#pragma once

#include "cspyce/build/artifacts.hpp"
#include "cspyce/build/config.hpp"
#include "cspyce/build/platform.hpp"
#include "cspyce/build/process.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace cspyce::build {

// ============================================================
// Stages
// ============================================================

/// Stage order is fixed; each stage consumes the previous one's output.
enum class Stage {
    CleanBefore,  // remove stale glue/object/staging
    Generate,     // swig -python
    Compile,      // cc -c
    Link,         // ld into the staging directory
    Verify,       // optional: import the staged module
    Promote,      // replace the previous extension (atomic rename)
    Install,      // optional: copy the extension to install_dir
    CleanAfter,   // remove glue/object/staging, on every path
};

enum class StageStatus { Ok, Skipped, Failed };

const char* stageToString(Stage stage);
const char* stageStatusToString(StageStatus status);

struct StageResult {
    Stage stage = Stage::CleanBefore;
    StageStatus status = StageStatus::Ok;
    std::string command;  // rendered command line, if a tool ran
    int exit_code = 0;
    std::string message;
    std::string log_path;
    double elapsed_ms = 0;

    [[nodiscard]] bool ok() const { return status != StageStatus::Failed; }
    [[nodiscard]] std::string to_string() const;
};

struct PipelineResult {
    bool ok = false;
    std::vector<StageResult> stages;
    std::optional<Stage> failed_stage;
    std::string extension_path;  // set on success

    /// nullptr if the stage is not in the result.
    [[nodiscard]] const StageResult* find(Stage stage) const;
    [[nodiscard]] const StageResult* failure() const;
    [[nodiscard]] std::string to_string() const;
};

struct PipelineOptions {
    bool dry_run = false;  // log commands, touch nothing
};

// ============================================================
// Build Pipeline
// ============================================================

/// Turns the interface file, headers and static library into one loadable
/// extension. The previous extension is only replaced once the new one is
/// built, and intermediates are removed on every exit path.
class BuildPipeline {
public:
    /// `cfg` must already be resolved (resolve_paths) and validated.
    BuildPipeline(BuildConfig cfg, CommandRunner& runner, PipelineOptions options = {});

    PipelineResult run();

    [[nodiscard]] const BuildConfig& config() const { return cfg_; }
    [[nodiscard]] const ArtifactLayout& layout() const { return layout_; }
    [[nodiscard]] const Platform& platform() const { return *platform_; }

    // Command construction, exposed for dry-run listings and tests.
    [[nodiscard]] std::vector<std::string> generate_command() const;
    [[nodiscard]] std::vector<std::string> compile_command(
        const std::vector<std::string>& python_cflags) const;
    [[nodiscard]] std::vector<std::string> link_command(
        const std::vector<std::string>& python_ldflags) const;
    [[nodiscard]] std::vector<std::string> verify_command() const;

    /// Drop every flag listed in strip_cflags.
    [[nodiscard]] std::vector<std::string> filter_cflags(std::vector<std::string> flags) const;

private:
    StageResult cleanBefore();
    StageResult generate();
    StageResult compile();
    StageResult link();
    StageResult verify();
    StageResult promote();
    StageResult install();

    StageResult execute(Stage stage, Command cmd);
    std::optional<std::vector<std::string>> queryPythonConfig(const char* what,
                                                              StageResult& failure);
    std::string logPath(Stage stage) const;
    [[nodiscard]] bool enabled(Stage stage) const;
    [[nodiscard]] std::string stagedShadowModule() const;

    BuildConfig cfg_;
    CommandRunner& runner_;
    PipelineOptions options_;
    const Platform* platform_;
    ArtifactLayout layout_;
};

// ============================================================
// Convenience
// ============================================================

/// Thrown by build_extension when the configuration does not validate.
class ConfigValidationError : public std::runtime_error {
public:
    ConfigCheckResult result;

    explicit ConfigValidationError(ConfigCheckResult r)
        : std::runtime_error(r.to_string()), result(std::move(r)) {}
};

/// Resolve, validate and run. Throws ConfigValidationError before anything
/// runs if the configuration is invalid.
PipelineResult build_extension(const BuildConfig& cfg, CommandRunner& runner,
                               const PipelineOptions& options = {});

}  // namespace cspyce::build
