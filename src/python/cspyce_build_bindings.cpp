// cspyce-build - Python Bindings
// Copyright (c) 2026 cspyce-build Authors
// SPDX-License-Identifier: MIT

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "cspyce/build/build.hpp"

namespace py = pybind11;
using namespace cspyce::build;

// ============================================================
// Configuration Bindings
// ============================================================

void bind_config(py::module_& m) {
    py::class_<BuildConfig>(m, "BuildConfig")
        .def(py::init<>())
        .def_readwrite("module", &BuildConfig::module)
        .def_readwrite("interface_file", &BuildConfig::interface_file)
        .def_readwrite("work_dir", &BuildConfig::work_dir)
        .def_readwrite("python_include", &BuildConfig::python_include)
        .def_readwrite("site_packages", &BuildConfig::site_packages)
        .def_readwrite("numpy_include", &BuildConfig::numpy_include)
        .def_readwrite("toolkit_dir", &BuildConfig::toolkit_dir)
        .def_readwrite("toolkit_include", &BuildConfig::toolkit_include)
        .def_readwrite("toolkit_library", &BuildConfig::toolkit_library)
        .def_readwrite("platform", &BuildConfig::platform)
        .def_readwrite("swig", &BuildConfig::swig)
        .def_readwrite("swig_flags", &BuildConfig::swig_flags)
        .def_readwrite("cc", &BuildConfig::cc)
        .def_readwrite("cflags", &BuildConfig::cflags)
        .def_readwrite("defines", &BuildConfig::defines)
        .def_readwrite("ld", &BuildConfig::ld)
        .def_readwrite("ldflags", &BuildConfig::ldflags)
        .def_readwrite("libs", &BuildConfig::libs)
        .def_readwrite("use_python_config", &BuildConfig::use_python_config)
        .def_readwrite("python_config", &BuildConfig::python_config)
        .def_readwrite("strip_cflags", &BuildConfig::strip_cflags)
        .def_readwrite("macosx_version_min", &BuildConfig::macosx_version_min)
        .def_readwrite("init_module", &BuildConfig::init_module)
        .def_readwrite("install_dir", &BuildConfig::install_dir)
        .def_readwrite("verify_python", &BuildConfig::verify_python)
        .def_readwrite("keep_intermediates", &BuildConfig::keep_intermediates)
        .def_readwrite("log_dir", &BuildConfig::log_dir);

    py::enum_<ConfigErrorKind>(m, "ConfigErrorKind")
        .value("MissingOption", ConfigErrorKind::MissingOption)
        .value("InvalidValue", ConfigErrorKind::InvalidValue)
        .value("PathNotFound", ConfigErrorKind::PathNotFound)
        .value("ToolNotFound", ConfigErrorKind::ToolNotFound);

    py::class_<ConfigError>(m, "ConfigError")
        .def_readonly("kind", &ConfigError::kind)
        .def_readonly("option", &ConfigError::option)
        .def_readonly("message", &ConfigError::message)
        .def_readonly("hint", &ConfigError::hint)
        .def("__str__", &ConfigError::to_string);

    py::class_<ConfigCheckResult>(m, "ConfigCheckResult")
        .def_readonly("valid", &ConfigCheckResult::valid)
        .def_readonly("errors", &ConfigCheckResult::errors)
        .def("__str__", &ConfigCheckResult::to_string);

    // Config file + CSPYCE_BUILD_* environment, the same layering as the CLI
    m.def("load_config", [](const std::string& path) {
        CliOptions opts;
        opts.config_file = path;
        return load_config(opts);
    }, py::arg("path") = "");

    m.def("resolve", &resolve_paths, py::arg("config"));
    m.def("validate", [](const BuildConfig& cfg) {
        return validate_config(resolve_paths(cfg));
    }, py::arg("config"));
}

// ============================================================
// Pipeline Bindings
// ============================================================

void bind_pipeline(py::module_& m) {
    py::enum_<Stage>(m, "Stage")
        .value("CleanBefore", Stage::CleanBefore)
        .value("Generate", Stage::Generate)
        .value("Compile", Stage::Compile)
        .value("Link", Stage::Link)
        .value("Verify", Stage::Verify)
        .value("Promote", Stage::Promote)
        .value("Install", Stage::Install)
        .value("CleanAfter", Stage::CleanAfter);

    py::enum_<StageStatus>(m, "StageStatus")
        .value("Ok", StageStatus::Ok)
        .value("Skipped", StageStatus::Skipped)
        .value("Failed", StageStatus::Failed);

    py::class_<StageResult>(m, "StageResult")
        .def_readonly("stage", &StageResult::stage)
        .def_readonly("status", &StageResult::status)
        .def_readonly("command", &StageResult::command)
        .def_readonly("exit_code", &StageResult::exit_code)
        .def_readonly("message", &StageResult::message)
        .def_readonly("log_path", &StageResult::log_path)
        .def_readonly("elapsed_ms", &StageResult::elapsed_ms)
        .def("__str__", &StageResult::to_string);

    py::class_<PipelineResult>(m, "PipelineResult")
        .def_readonly("ok", &PipelineResult::ok)
        .def_readonly("stages", &PipelineResult::stages)
        .def_readonly("failed_stage", &PipelineResult::failed_stage)
        .def_readonly("extension_path", &PipelineResult::extension_path)
        .def("__str__", &PipelineResult::to_string);

    py::register_exception<ConfigValidationError>(m, "ConfigValidationError", PyExc_ValueError);
    py::register_exception<ParseError>(m, "ParseError", PyExc_ValueError);

    m.def("build", [](const BuildConfig& cfg, bool dry_run) {
        ShellCommandRunner runner;
        PipelineOptions opts;
        opts.dry_run = dry_run;
        // Tool output goes straight to the terminal; let Python threads run.
        py::gil_scoped_release release;
        return build_extension(cfg, runner, opts);
    }, py::arg("config"), py::arg("dry_run") = false,
       "Generate, compile and link the extension. Raises ConfigValidationError "
       "before running anything if the configuration is invalid.");
}

PYBIND11_MODULE(_cspyce_build, m) {
    m.doc() = "cspyce-build: build the CSPICE SWIG extension from Python";

    bind_config(m);
    bind_pipeline(m);

    m.attr("__version__") = "1.0.0";
}
