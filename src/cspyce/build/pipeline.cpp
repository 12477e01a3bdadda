// cspyce-build - Build Pipeline Implementation
// Copyright (c) 2026 cspyce-build Authors
// SPDX-License-Identifier: MIT

#include "cspyce/build/pipeline.hpp"
#include "cspyce/build/log.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

namespace cspyce::build {

// ============================================================
// Result Types
// ============================================================

const char* stageToString(Stage stage) {
    switch (stage) {
        case Stage::CleanBefore: return "clean-before";
        case Stage::Generate: return "generate";
        case Stage::Compile: return "compile";
        case Stage::Link: return "link";
        case Stage::Verify: return "verify";
        case Stage::Promote: return "promote";
        case Stage::Install: return "install";
        case Stage::CleanAfter: return "clean-after";
    }
    return "unknown";
}

const char* stageStatusToString(StageStatus status) {
    switch (status) {
        case StageStatus::Ok: return "ok";
        case StageStatus::Skipped: return "skipped";
        case StageStatus::Failed: return "FAILED";
    }
    return "unknown";
}

std::string StageResult::to_string() const {
    std::ostringstream oss;
    oss << stageToString(stage) << ": " << stageStatusToString(status);
    if (status == StageStatus::Failed && exit_code != 0) {
        oss << " (exit " << exit_code << ")";
    }
    if (!message.empty()) {
        oss << " - " << message;
    }
    if (status == StageStatus::Failed && !command.empty()) {
        oss << "\n    command: " << command;
    }
    if (status == StageStatus::Failed && !log_path.empty()) {
        oss << "\n    log: " << log_path;
    }
    return oss.str();
}

const StageResult* PipelineResult::find(Stage stage) const {
    for (const auto& s : stages) {
        if (s.stage == stage) return &s;
    }
    return nullptr;
}

const StageResult* PipelineResult::failure() const {
    return failed_stage ? find(*failed_stage) : nullptr;
}

std::string PipelineResult::to_string() const {
    std::ostringstream oss;
    oss << (ok ? "Build succeeded" : "Build failed");
    if (failed_stage) {
        oss << " at stage '" << stageToString(*failed_stage) << "'";
    }
    oss << "\n";
    for (const auto& s : stages) {
        oss << "  " << s.to_string() << "\n";
    }
    return oss.str();
}

namespace {

StageResult make_result(Stage stage, StageStatus status, std::string message = "") {
    StageResult r;
    r.stage = stage;
    r.status = status;
    r.message = std::move(message);
    return r;
}

StageResult fail(Stage stage, std::string message) {
    return make_result(stage, StageStatus::Failed, std::move(message));
}

std::string tool_name(const std::string& exe) {
    return fs::path(exe).filename().string();
}

bool file_exists(const std::string& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec);
}

}  // namespace

// ============================================================
// Command Construction
// ============================================================

BuildPipeline::BuildPipeline(BuildConfig cfg, CommandRunner& runner, PipelineOptions options)
    : cfg_(std::move(cfg)), runner_(runner), options_(options),
      platform_(PlatformRegistry::instance().get(cfg_.platform)) {
    if (!platform_) {
        throw std::invalid_argument("unknown platform '" + cfg_.platform + "'");
    }
    layout_ = ArtifactLayout::from_config(cfg_, platform_->extension_suffix());
}

std::string BuildPipeline::stagedShadowModule() const {
    return (fs::path(layout_.staging_dir) / (cfg_.module + ".py")).string();
}

std::vector<std::string> BuildPipeline::generate_command() const {
    std::vector<std::string> argv{cfg_.swig, "-python"};
    argv.insert(argv.end(), cfg_.swig_flags.begin(), cfg_.swig_flags.end());
    argv.insert(argv.end(), {"-o", layout_.glue_source,
                             "-outdir", layout_.staging_dir,
                             layout_.interface_file});
    return argv;
}

std::vector<std::string> BuildPipeline::filter_cflags(std::vector<std::string> flags) const {
    if (cfg_.strip_cflags.empty()) return flags;
    flags.erase(std::remove_if(flags.begin(), flags.end(),
                               [this](const std::string& f) {
                                   return std::find(cfg_.strip_cflags.begin(),
                                                    cfg_.strip_cflags.end(),
                                                    f) != cfg_.strip_cflags.end();
                               }),
                flags.end());
    return flags;
}

std::vector<std::string> BuildPipeline::compile_command(
    const std::vector<std::string>& python_cflags) const {
    std::vector<std::string> argv{cfg_.cc, "-c"};
    argv.insert(argv.end(), python_cflags.begin(), python_cflags.end());
    const auto platform_flags = platform_->compile_flags(cfg_);
    argv.insert(argv.end(), platform_flags.begin(), platform_flags.end());
    argv.push_back("-I" + cfg_.python_include);
    argv.push_back("-I" + cfg_.numpy_include);
    argv.push_back("-I" + cfg_.toolkit_include);
    for (const auto& d : cfg_.defines) {
        argv.push_back("-D" + d);
    }
    argv.insert(argv.end(), cfg_.cflags.begin(), cfg_.cflags.end());
    argv.insert(argv.end(), {layout_.glue_source, "-o", layout_.object});
    return argv;
}

std::vector<std::string> BuildPipeline::link_command(
    const std::vector<std::string>& python_ldflags) const {
    LinkInputs in;
    in.output = layout_.staged_extension;
    in.object = layout_.object;
    in.library = layout_.library;
    in.python_ldflags = python_ldflags;
    return platform_->link_command(cfg_, in);
}

std::vector<std::string> BuildPipeline::verify_command() const {
    return {cfg_.verify_python, "-c", "import " + cfg_.module};
}

// ============================================================
// Execution Helpers
// ============================================================

std::string BuildPipeline::logPath(Stage stage) const {
    if (cfg_.log_dir.empty()) return "";
    return (fs::path(cfg_.log_dir) / (std::string(stageToString(stage)) + ".log")).string();
}

bool BuildPipeline::enabled(Stage stage) const {
    switch (stage) {
        case Stage::Verify: return !cfg_.verify_python.empty();
        case Stage::Install: return !cfg_.install_dir.empty();
        default: return true;
    }
}

StageResult BuildPipeline::execute(Stage stage, Command cmd) {
    StageResult r = make_result(stage, StageStatus::Ok);
    r.command = render_command(cmd.argv);
    r.log_path = cmd.log_path;

    if (options_.dry_run) {
        log::info("[dry-run] " + r.command);
        return r;
    }

    log::debug("$ " + r.command);
    r.exit_code = runner_.run(cmd);
    if (r.exit_code != 0) {
        r.status = StageStatus::Failed;
        r.message = tool_name(cmd.argv.front()) + " exited with status " +
                    std::to_string(r.exit_code);
    }
    return r;
}

std::optional<std::vector<std::string>> BuildPipeline::queryPythonConfig(
    const char* what, StageResult& failure) {
    Command cmd{{cfg_.python_config, what}, cfg_.work_dir, ""};
    log::debug("$ " + render_command(cmd.argv));
    CaptureResult res = runner_.capture(cmd);
    if (res.exit_code != 0) {
        failure.status = StageStatus::Failed;
        failure.command = render_command(cmd.argv);
        failure.exit_code = res.exit_code;
        failure.message = tool_name(cfg_.python_config) + " " + what +
                          " exited with status " + std::to_string(res.exit_code);
        return std::nullopt;
    }
    return split_flags(res.output);
}

// ============================================================
// Stages
// ============================================================

StageResult BuildPipeline::cleanBefore() {
    const std::vector<std::string> stale = layout_.transient();
    if (options_.dry_run) {
        for (const auto& p : stale) log::info("[dry-run] remove " + p);
        return make_result(Stage::CleanBefore, StageStatus::Ok);
    }
    for (const auto& p : stale) {
        std::string err;
        if (!remove_artifact(p, &err)) {
            return fail(Stage::CleanBefore, "cannot remove stale artifact " + err);
        }
    }
    fs::create_directories(layout_.staging_dir);
    if (!cfg_.log_dir.empty()) {
        fs::create_directories(cfg_.log_dir);
    }
    return make_result(Stage::CleanBefore, StageStatus::Ok);
}

StageResult BuildPipeline::generate() {
    log::info("Generating " + fs::path(layout_.glue_source).filename().string() +
              " from " + fs::path(layout_.interface_file).filename().string());
    StageResult r = execute(Stage::Generate,
                            Command{generate_command(), cfg_.work_dir, logPath(Stage::Generate)});
    if (!r.ok() || options_.dry_run) return r;

    if (!file_exists(layout_.glue_source)) {
        r.status = StageStatus::Failed;
        r.message = "interface generator succeeded but did not write " + layout_.glue_source;
    }
    return r;
}

StageResult BuildPipeline::compile() {
    log::info("Compiling " + fs::path(layout_.glue_source).filename().string());
    StageResult failure = make_result(Stage::Compile, StageStatus::Ok);
    std::vector<std::string> python_cflags;
    if (cfg_.use_python_config.value_or(false)) {
        auto flags = queryPythonConfig("--cflags", failure);
        if (!flags) return failure;
        python_cflags = filter_cflags(std::move(*flags));
    }

    StageResult r = execute(Stage::Compile,
                            Command{compile_command(python_cflags), cfg_.work_dir,
                                    logPath(Stage::Compile)});
    if (!r.ok() || options_.dry_run) return r;

    if (!file_exists(layout_.object)) {
        r.status = StageStatus::Failed;
        r.message = "compiler succeeded but did not write " + layout_.object;
    }
    return r;
}

StageResult BuildPipeline::link() {
    log::info("Linking " + fs::path(layout_.extension).filename().string() + " against " +
              fs::path(layout_.library).filename().string());
    StageResult failure = make_result(Stage::Link, StageStatus::Ok);
    std::vector<std::string> python_ldflags;
    if (cfg_.use_python_config.value_or(false)) {
        auto flags = queryPythonConfig("--ldflags", failure);
        if (!flags) return failure;
        python_ldflags = std::move(*flags);
    }

    StageResult r = execute(Stage::Link,
                            Command{link_command(python_ldflags), cfg_.work_dir,
                                    logPath(Stage::Link)});
    if (!r.ok() || options_.dry_run) return r;

    if (!file_exists(layout_.staged_extension)) {
        r.status = StageStatus::Failed;
        r.message = "linker succeeded but did not write " + layout_.staged_extension;
    }
    return r;
}

StageResult BuildPipeline::verify() {
    log::info("Importing " + cfg_.module + " with " + tool_name(cfg_.verify_python));
    return execute(Stage::Verify,
                   Command{verify_command(), layout_.staging_dir, logPath(Stage::Verify)});
}

StageResult BuildPipeline::promote() {
    const std::string shadow_dest = cfg_.init_module ? layout_.init_module : layout_.shadow_module;
    if (options_.dry_run) {
        log::info("[dry-run] replace " + layout_.extension);
        log::info("[dry-run] replace " + shadow_dest);
        return make_result(Stage::Promote, StageStatus::Ok);
    }

    const std::string staged_shadow = stagedShadowModule();
    const bool has_shadow = file_exists(staged_shadow);
    if (!file_exists(layout_.staged_extension)) {
        return fail(Stage::Promote, "staged extension is missing: " + layout_.staged_extension);
    }
    std::error_code ec;
    for (const auto& dest : {layout_.extension, shadow_dest}) {
        if (fs::is_directory(dest, ec)) {
            return fail(Stage::Promote, "cannot replace directory " + dest);
        }
    }

    // rename(2) replaces each destination atomically. The shadow module goes
    // first: an old extension beside a new shadow module fails loudly on import.
    if (has_shadow) {
        fs::rename(staged_shadow, shadow_dest);
    } else {
        log::warn("interface generator wrote no shadow module; only " +
                  fs::path(layout_.extension).filename().string() + " was updated");
    }
    fs::rename(layout_.staged_extension, layout_.extension);
    log::info("Built " + layout_.extension);
    return make_result(Stage::Promote, StageStatus::Ok);
}

StageResult BuildPipeline::install() {
    const fs::path dest = fs::path(cfg_.install_dir) / fs::path(layout_.extension).filename();
    if (options_.dry_run) {
        log::info("[dry-run] copy " + layout_.extension + " -> " + dest.string());
        return make_result(Stage::Install, StageStatus::Ok);
    }
    fs::copy_file(layout_.extension, dest, fs::copy_options::overwrite_existing);
    log::info("Installed " + dest.string());
    return make_result(Stage::Install, StageStatus::Ok);
}

// ============================================================
// Driver
// ============================================================

PipelineResult BuildPipeline::run() {
    PipelineResult result;

    // Declared before any stage runs so removal happens however run() exits.
    ScopedArtifactCleanup intermediates({layout_.glue_source, layout_.object});
    ScopedArtifactCleanup staging({layout_.staging_dir});
    if (options_.dry_run) {
        intermediates.dismiss();
        staging.dismiss();
    } else if (cfg_.keep_intermediates) {
        intermediates.dismiss();
    }

    using StageFn = StageResult (BuildPipeline::*)();
    struct Step {
        Stage stage;
        StageFn fn;
    };
    const Step steps[] = {
        {Stage::CleanBefore, &BuildPipeline::cleanBefore},
        {Stage::Generate, &BuildPipeline::generate},
        {Stage::Compile, &BuildPipeline::compile},
        {Stage::Link, &BuildPipeline::link},
        {Stage::Verify, &BuildPipeline::verify},
        {Stage::Promote, &BuildPipeline::promote},
        {Stage::Install, &BuildPipeline::install},
    };

    for (const auto& step : steps) {
        if (result.failed_stage) {
            result.stages.push_back(make_result(step.stage, StageStatus::Skipped,
                                                "earlier stage failed"));
            continue;
        }
        if (!enabled(step.stage)) {
            result.stages.push_back(make_result(step.stage, StageStatus::Skipped,
                                                "not configured"));
            continue;
        }

        const auto t0 = std::chrono::steady_clock::now();
        StageResult r;
        try {
            r = (this->*step.fn)();
        } catch (const std::exception& e) {
            r = fail(step.stage, e.what());
        }
        r.stage = step.stage;
        r.elapsed_ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - t0).count();

        if (!r.ok()) {
            log::error(std::string(stageToString(step.stage)) + " failed: " + r.message);
            result.failed_stage = step.stage;
        }
        result.stages.push_back(std::move(r));
    }

    StageResult clean = make_result(Stage::CleanAfter, StageStatus::Ok);
    if (options_.dry_run) {
        clean.status = StageStatus::Skipped;
        clean.message = "dry run";
    } else {
        std::vector<std::string> leftovers = intermediates.release();
        for (auto& p : staging.release()) leftovers.push_back(std::move(p));
        if (!leftovers.empty()) {
            clean.status = StageStatus::Failed;
            clean.message = "could not remove " + std::to_string(leftovers.size()) +
                            " intermediate artifact(s)";
            if (!result.failed_stage) result.failed_stage = Stage::CleanAfter;
        } else if (cfg_.keep_intermediates) {
            clean.message = "kept " + fs::path(layout_.glue_source).filename().string() +
                            " and " + fs::path(layout_.object).filename().string();
        }
    }
    result.stages.push_back(std::move(clean));

    result.ok = !result.failed_stage.has_value();
    if (result.ok) {
        result.extension_path = layout_.extension;
    }
    return result;
}

PipelineResult build_extension(const BuildConfig& cfg, CommandRunner& runner,
                               const PipelineOptions& options) {
    BuildConfig resolved = resolve_paths(cfg);
    ConfigCheckResult check = validate_config(resolved);
    if (!check.valid) {
        throw ConfigValidationError(std::move(check));
    }
    BuildPipeline pipeline(std::move(resolved), runner, options);
    return pipeline.run();
}

}  // namespace cspyce::build
