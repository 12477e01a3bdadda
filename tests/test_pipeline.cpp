// cspyce-build - Pipeline Unit Tests
// Copyright (c) 2026 cspyce-build Authors
// SPDX-License-Identifier: MIT

#include "cspyce/build/build.hpp"
#include "test_support.hpp"

#include <cassert>
#include <iostream>

using namespace cspyce::build;
using namespace cspyce::build::testing;

// Test helper
#define TEST(name) void test_##name(); \
    static bool registered_##name = (tests.push_back({#name, test_##name}), true); \
    void test_##name()

std::vector<std::pair<const char*, void(*)()>> tests;

namespace {

BuildPipeline make_pipeline(const Workspace& ws, FakeToolRunner& runner,
                            PipelineOptions opts = {}) {
    return BuildPipeline(resolve_paths(ws.config()), runner, opts);
}

// The workspace before any build: inputs only.
const std::vector<std::string> kInputs = {"cspice", "cspice.i"};

}  // namespace

// ============================================================
// Happy Path
// ============================================================

TEST(successful_build_leaves_only_outputs) {
    Workspace ws;
    FakeToolRunner runner;
    auto pipeline = make_pipeline(ws, runner);

    PipelineResult result = pipeline.run();
    assert(result.ok);
    assert(!result.failed_stage);
    assert(result.extension_path == (ws.work() / "_cspice.so").string());

    // swig, cc, ld in that order; nothing else runs without verify_python
    assert((runner.tools_run() == std::vector<std::string>{"swig", "cc", "ld"}));

    auto entries = list_dir(ws.work());
    assert((entries == std::vector<std::string>{"_cspice.so", "cspice", "cspice.i", "cspice.py"}));
    assert(read_file(ws.work() / "_cspice.so").find("extension") == 0);

    std::cout << "  " << result.to_string();
}

TEST(stage_results_cover_every_stage_in_order) {
    Workspace ws;
    FakeToolRunner runner;
    PipelineResult result = make_pipeline(ws, runner).run();

    const Stage expected[] = {Stage::CleanBefore, Stage::Generate, Stage::Compile, Stage::Link,
                              Stage::Verify, Stage::Promote, Stage::Install, Stage::CleanAfter};
    assert(result.stages.size() == 8);
    for (size_t i = 0; i < 8; ++i) {
        assert(result.stages[i].stage == expected[i]);
    }
    assert(result.find(Stage::Verify)->status == StageStatus::Skipped);
    assert(result.find(Stage::Install)->status == StageStatus::Skipped);
    assert(result.find(Stage::Generate)->command.find("-python") != std::string::npos);
}

TEST(rerun_is_idempotent) {
    Workspace ws;
    FakeToolRunner runner;

    assert(make_pipeline(ws, runner).run().ok);
    const std::string first = read_file(ws.work() / "_cspice.so");
    const auto entries_first = list_dir(ws.work());

    assert(make_pipeline(ws, runner).run().ok);
    assert(read_file(ws.work() / "_cspice.so") == first);
    assert(list_dir(ws.work()) == entries_first);
}

TEST(stale_intermediates_are_removed_before_generation) {
    Workspace ws;
    write_file(ws.work() / "cspice_wrap.c", "stale");
    write_file(ws.work() / "cspice_wrap.o", "stale");
    write_file(ws.work() / ".cspyce-build-staging" / "junk", "stale");

    FakeToolRunner runner;
    runner.no_output.insert("swig");  // would keep the stale glue if it survived
    PipelineResult result = make_pipeline(ws, runner).run();

    assert(!result.ok);
    assert(*result.failed_stage == Stage::Generate);
    assert(result.failure()->message.find("did not write") != std::string::npos);
    assert((runner.tools_run() == std::vector<std::string>{"swig"}));
    assert(list_dir(ws.work()) == kInputs);
}

// ============================================================
// Command Lines
// ============================================================

TEST(compile_command_includes_configured_headers) {
    Workspace ws;
    BuildConfig cfg = ws.config();
    cfg.defines = {"RUNTIME_ERRORS_ONLY"};
    cfg.cflags = {"-O2"};
    FakeToolRunner runner;
    BuildPipeline pipeline(resolve_paths(cfg), runner);

    auto argv = pipeline.compile_command({});
    assert(argv[0] == ws.bin("gcc").string());
    assert(argv[1] == "-c");
    assert(contains(argv, "-fPIC"));
    assert(contains(argv, "-I" + (ws.root() / "python" / "include").string()));
    assert(contains(argv, "-I" + (ws.root() / "site" / "numpy" / "core" / "include").string()));
    assert(contains(argv, "-I" + (ws.work() / "cspice" / "src" / "cspice").string()));
    assert(contains(argv, "-DRUNTIME_ERRORS_ONLY"));
    assert(contains(argv, "-O2"));
    assert(argv[argv.size() - 2] == "-o");
    assert(argv.back() == (ws.work() / "cspice_wrap.o").string());
}

TEST(link_command_targets_staging_directory) {
    Workspace ws;
    FakeToolRunner runner;
    auto pipeline = make_pipeline(ws, runner);

    auto argv = pipeline.link_command({});
    const std::string staged = (ws.work() / ".cspyce-build-staging" / "_cspice.so").string();
    assert(argv[0] == ws.bin("ld").string());
    assert(argv[1] == "-o" && argv[2] == staged);
    assert(contains(argv, "-shared"));
    assert(contains(argv, (ws.work() / "cspice" / "lib" / "cspice.a").string()));
    assert(argv.back() == "-lm");
}

TEST(python_config_flags_are_filtered_and_used) {
    Workspace ws;
    BuildConfig cfg = ws.config();
    cfg.platform = "macos";
    cfg.strip_cflags = {"-Wshorten-64-to-32"};
    cfg.macosx_version_min = "10.12";
    FakeToolRunner runner;
    runner.queries["--cflags"] = "-I/opt/py -Wshorten-64-to-32 -O3\n";
    runner.queries["--ldflags"] = "-L/opt/py/lib -lpython3.11\n";

    PipelineResult result = BuildPipeline(resolve_paths(cfg), runner).run();
    assert(result.ok);
    assert(runner.captures.size() == 2);

    const Command* cc = runner.find("cc");
    assert(cc && contains(cc->argv, "-I/opt/py") && contains(cc->argv, "-O3"));
    assert(!contains(cc->argv, "-Wshorten-64-to-32"));
    assert(!contains(cc->argv, "-fPIC"));

    const Command* ld = runner.find("ld");
    assert(ld && ld->argv[1] == "-bundle");
    assert(contains(ld->argv, "-lpython3.11"));
    assert(contains(ld->argv, "-flat_namespace"));
    assert(contains(ld->argv, "suppress"));
    assert(contains(ld->argv, "-macosx_version_min"));
}

// ============================================================
// Failure Handling
// ============================================================

TEST(generator_failure_aborts_before_compile) {
    Workspace ws;
    FakeToolRunner runner;
    runner.exit_codes["swig"] = 1;

    PipelineResult result = make_pipeline(ws, runner).run();
    assert(!result.ok);
    assert(*result.failed_stage == Stage::Generate);
    assert(result.failure()->exit_code == 1);
    assert(result.find(Stage::Compile)->status == StageStatus::Skipped);
    assert(result.find(Stage::Link)->status == StageStatus::Skipped);
    assert(result.find(Stage::CleanAfter)->status == StageStatus::Ok);
    assert((runner.tools_run() == std::vector<std::string>{"swig"}));
    assert(list_dir(ws.work()) == kInputs);
}

TEST(compile_failure_keeps_previous_extension) {
    Workspace ws;
    FakeToolRunner runner;
    runner.link_payload = "good build";
    assert(make_pipeline(ws, runner).run().ok);
    const std::string good = read_file(ws.work() / "_cspice.so");
    const std::string good_shadow = read_file(ws.work() / "cspice.py");

    runner.exit_codes["cc"] = 1;
    runner.link_payload = "never linked";
    PipelineResult result = make_pipeline(ws, runner).run();
    assert(!result.ok);
    assert(*result.failed_stage == Stage::Compile);
    assert(read_file(ws.work() / "_cspice.so") == good);
    assert(read_file(ws.work() / "cspice.py") == good_shadow);
    assert(!fs::exists(ws.work() / "cspice_wrap.c"));
    assert(!fs::exists(ws.work() / ".cspyce-build-staging"));
}

TEST(link_failure_produces_no_extension) {
    Workspace ws;
    FakeToolRunner runner;
    runner.exit_codes["ld"] = 1;

    PipelineResult result = make_pipeline(ws, runner).run();
    assert(!result.ok);
    assert(*result.failed_stage == Stage::Link);
    assert(result.find(Stage::Promote)->status == StageStatus::Skipped);
    assert(!fs::exists(ws.work() / "_cspice.so"));
    assert(list_dir(ws.work()) == kInputs);
    std::cout << "  " << result.failure()->to_string() << "\n";
}

TEST(linker_without_output_is_a_failure) {
    Workspace ws;
    FakeToolRunner runner;
    runner.no_output.insert("ld");

    PipelineResult result = make_pipeline(ws, runner).run();
    assert(!result.ok);
    assert(*result.failed_stage == Stage::Link);
    assert(result.failure()->message.find("did not write") != std::string::npos);
}

TEST(python_config_failure_fails_compile) {
    Workspace ws;
    BuildConfig cfg = ws.config();
    cfg.use_python_config = true;
    FakeToolRunner runner;
    runner.exit_codes["python-config"] = 2;

    PipelineResult result = BuildPipeline(resolve_paths(cfg), runner).run();
    assert(!result.ok);
    assert(*result.failed_stage == Stage::Compile);
    assert(result.failure()->exit_code == 2);
    assert(runner.find("cc") == nullptr);
}

TEST(verify_failure_keeps_previous_extension) {
    Workspace ws;
    FakeToolRunner runner;
    runner.link_payload = "good build";
    assert(make_pipeline(ws, runner).run().ok);
    const std::string good = read_file(ws.work() / "_cspice.so");

    BuildConfig cfg = ws.config();
    cfg.verify_python = ws.bin("python3").string();
    runner.exit_codes["python"] = 1;
    runner.link_payload = "broken build";
    PipelineResult result = BuildPipeline(resolve_paths(cfg), runner).run();

    assert(!result.ok);
    assert(*result.failed_stage == Stage::Verify);
    assert(read_file(ws.work() / "_cspice.so") == good);

    const Command* py = runner.find("python");
    assert(py && py->argv[1] == "-c" && py->argv[2] == "import cspice");
    assert(py->working_dir == (ws.work() / ".cspyce-build-staging").string());
}

TEST(promote_failure_publishes_neither_output) {
    Workspace ws;
    write_file(ws.work() / "cspice.py", "previous shadow\n");
    fs::create_directories(ws.work() / "_cspice.so" / "stray");
    FakeToolRunner runner;

    PipelineResult result = make_pipeline(ws, runner).run();
    assert(!result.ok);
    assert(*result.failed_stage == Stage::Promote);
    assert(result.failure()->message.find("cannot replace directory") != std::string::npos);

    assert(read_file(ws.work() / "cspice.py") == "previous shadow\n");
    assert(fs::is_directory(ws.work() / "_cspice.so" / "stray"));
    assert(!fs::exists(ws.work() / ".cspyce-build-staging"));
}

// ============================================================
// Options
// ============================================================

TEST(init_module_renames_shadow_module) {
    Workspace ws;
    BuildConfig cfg = ws.config();
    cfg.init_module = true;
    FakeToolRunner runner;

    assert(BuildPipeline(resolve_paths(cfg), runner).run().ok);
    assert(fs::exists(ws.work() / "__init__.py"));
    assert(!fs::exists(ws.work() / "cspice.py"));
    assert(read_file(ws.work() / "__init__.py") == "import _cspice\n");
}

TEST(install_copies_extension) {
    Workspace ws;
    fs::create_directories(ws.root() / "site-install");
    BuildConfig cfg = ws.config();
    cfg.install_dir = (ws.root() / "site-install").string();
    FakeToolRunner runner;

    PipelineResult result = BuildPipeline(resolve_paths(cfg), runner).run();
    assert(result.ok);
    assert(result.find(Stage::Install)->status == StageStatus::Ok);
    assert(read_file(ws.root() / "site-install" / "_cspice.so") ==
           read_file(ws.work() / "_cspice.so"));

    // The destination is logged; the stage line carries no diagnostic
    const StageResult* install = result.find(Stage::Install);
    assert(install->message.empty());
    assert(install->to_string() == "install: ok");
}

TEST(keep_intermediates_skips_glue_removal) {
    Workspace ws;
    BuildConfig cfg = ws.config();
    cfg.keep_intermediates = true;
    FakeToolRunner runner;

    assert(BuildPipeline(resolve_paths(cfg), runner).run().ok);
    assert(fs::exists(ws.work() / "cspice_wrap.c"));
    assert(fs::exists(ws.work() / "cspice_wrap.o"));
    assert(!fs::exists(ws.work() / ".cspyce-build-staging"));
}

TEST(dry_run_touches_nothing) {
    Workspace ws;
    write_file(ws.work() / "cspice_wrap.o", "stale");
    FakeToolRunner runner;
    PipelineOptions opts;
    opts.dry_run = true;

    PipelineResult result = make_pipeline(ws, runner, opts).run();
    assert(result.ok);
    assert(runner.runs.empty());
    assert(result.find(Stage::Link)->command.find("-shared") != std::string::npos);
    assert(result.find(Stage::CleanAfter)->status == StageStatus::Skipped);
    assert(fs::exists(ws.work() / "cspice_wrap.o"));
    assert(!fs::exists(ws.work() / "_cspice.so"));
}

TEST(log_dir_receives_per_stage_logs) {
    Workspace ws;
    BuildConfig cfg = ws.config();
    cfg.log_dir = "logs";
    FakeToolRunner runner;

    assert(BuildPipeline(resolve_paths(cfg), runner).run().ok);
    assert(fs::is_directory(ws.work() / "logs"));
    assert(runner.find("swig")->log_path == (ws.work() / "logs" / "generate.log").string());
    assert(runner.find("ld")->log_path == (ws.work() / "logs" / "link.log").string());
}

TEST(build_extension_rejects_invalid_config_before_running) {
    Workspace ws;
    BuildConfig cfg = ws.config();
    cfg.python_include.clear();
    FakeToolRunner runner;

    bool threw = false;
    try {
        build_extension(cfg, runner);
    } catch (const ConfigValidationError& e) {
        threw = true;
        assert(e.result.has(ConfigErrorKind::MissingOption, "python_include"));
    }
    assert(threw);
    assert(runner.runs.empty());
}

int main() {
    std::cout << "Running pipeline tests...\n\n";
    log::set_level(log::Level::Warn);

    int passed = 0;
    int failed = 0;

    for (const auto& [name, fn] : tests) {
        std::cout << "Test: " << name << "\n";
        try {
            fn();
            std::cout << "  PASSED\n\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "  FAILED: " << e.what() << "\n\n";
            failed++;
        }
    }

    std::cout << "Results: " << passed << " passed, " << failed << " failed\n";
    return failed > 0 ? 1 : 0;
}
