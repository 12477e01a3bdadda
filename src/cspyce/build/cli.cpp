// cspyce-build - Command Line
// Copyright (c) 2026 cspyce-build Authors
// SPDX-License-Identifier: MIT

#include "cspyce/build/cli.hpp"
#include "cspyce/build/config_parser.hpp"
#include "cspyce/build/log.hpp"
#include "cspyce/build/pipeline.hpp"

#include <filesystem>
#include <optional>
#include <sstream>

namespace fs = std::filesystem;

namespace cspyce::build {
namespace {

enum class FlagKind { Set, Append, True, False };

struct FlagSpec {
    const char* flag;
    const char* key;
    FlagKind kind;
    const char* metavar;
};

const std::vector<FlagSpec>& flag_table() {
    static const std::vector<FlagSpec> flags = {
        {"--work-dir", "work_dir", FlagKind::Set, "DIR"},
        {"--module", "module", FlagKind::Set, "NAME"},
        {"--interface", "interface", FlagKind::Set, "FILE"},
        {"--python-include", "python_include", FlagKind::Set, "DIR"},
        {"--site-packages", "site_packages", FlagKind::Set, "DIR"},
        {"--numpy-include", "numpy_include", FlagKind::Set, "DIR"},
        {"--toolkit-dir", "toolkit_dir", FlagKind::Set, "DIR"},
        {"--toolkit-include", "toolkit_include", FlagKind::Set, "DIR"},
        {"--toolkit-library", "toolkit_library", FlagKind::Set, "FILE"},
        {"--platform", "platform", FlagKind::Set, "NAME"},
        {"--swig", "swig", FlagKind::Set, "PROG"},
        {"--swig-flag", "swig_flags", FlagKind::Append, "FLAG"},
        {"--cc", "cc", FlagKind::Set, "PROG"},
        {"--cflag", "cflags", FlagKind::Append, "FLAG"},
        {"--define", "defines", FlagKind::Append, "NAME"},
        {"--ld", "ld", FlagKind::Set, "PROG"},
        {"--ldflag", "ldflags", FlagKind::Append, "FLAG"},
        {"--lib", "libs", FlagKind::Append, "NAME"},
        {"--python-config", "python_config", FlagKind::Set, "PROG"},
        {"--use-python-config", "use_python_config", FlagKind::True, nullptr},
        {"--no-python-config", "use_python_config", FlagKind::False, nullptr},
        {"--strip-cflag", "strip_cflags", FlagKind::Append, "FLAG"},
        {"--macosx-version-min", "macosx_version_min", FlagKind::Set, "VERSION"},
        {"--init-module", "init_module", FlagKind::True, nullptr},
        {"--install-dir", "install_dir", FlagKind::Set, "DIR"},
        {"--verify", "verify_python", FlagKind::Set, "PYTHON"},
        {"--keep-intermediates", "keep_intermediates", FlagKind::True, nullptr},
        {"--log-dir", "log_dir", FlagKind::Set, "DIR"},
    };
    return flags;
}

const FlagSpec* find_flag(const std::string& flag) {
    for (const auto& f : flag_table()) {
        if (flag == f.flag) return &f;
    }
    return nullptr;
}

bool takes_value(FlagKind kind) {
    return kind == FlagKind::Set || kind == FlagKind::Append;
}

}  // namespace

CliOptions parse_command_line(const std::vector<std::string>& args) {
    CliOptions opts;
    for (size_t i = 0; i < args.size(); ++i) {
        std::string arg = args[i];
        std::optional<std::string> inline_value;

        if (arg.rfind("-D", 0) == 0 && arg.size() > 2) {
            opts.overlay.append("defines", arg.substr(2));
            continue;
        }
        if (arg.rfind("--", 0) == 0) {
            if (auto eq = arg.find('='); eq != std::string::npos) {
                inline_value = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
            }
        }

        auto next_value = [&](const std::string& flag) -> std::string {
            if (inline_value) return *inline_value;
            if (i + 1 >= args.size()) {
                throw UsageError("option " + flag + " requires a value");
            }
            return args[++i];
        };

        if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            opts.quiet = true;
        } else if (arg == "-n" || arg == "--dry-run") {
            opts.dry_run = true;
        } else if (arg == "--config") {
            opts.config_file = next_value(arg);
        } else if (arg == "-D") {
            opts.overlay.append("defines", next_value(arg));
        } else if (const FlagSpec* entry = find_flag(arg)) {
            if (!takes_value(entry->kind) && inline_value) {
                throw UsageError("option " + arg + " does not take a value");
            }
            switch (entry->kind) {
                case FlagKind::Set: opts.overlay.set(entry->key, next_value(arg)); break;
                case FlagKind::Append: opts.overlay.append(entry->key, next_value(arg)); break;
                case FlagKind::True: opts.overlay.set(entry->key, "true"); break;
                case FlagKind::False: opts.overlay.set(entry->key, "false"); break;
            }
        } else if (!arg.empty() && arg[0] == '-') {
            throw UsageError("unknown option " + arg);
        } else {
            throw UsageError("unexpected argument '" + arg + "'");
        }
    }
    if (opts.verbose && opts.quiet) {
        throw UsageError("--verbose and --quiet are mutually exclusive");
    }
    return opts;
}

std::string usage_text() {
    std::ostringstream oss;
    oss << "usage: cspyce-build [options]\n"
        << "\n"
        << "Generate, compile and link the SWIG wrapper for CSPICE into a Python\n"
        << "extension module. Options are read from " << kDefaultConfigFile << " in the\n"
        << "working directory (or --config FILE), then CSPYCE_BUILD_* environment\n"
        << "variables, then the flags below.\n"
        << "\n"
        << "  --config FILE          configuration file\n"
        << "  -D NAME, --define NAME preprocessor define for the glue code\n";
    for (const auto& f : flag_table()) {
        if (std::string(f.key) == "defines") continue;
        std::string left = std::string(f.flag) + (f.metavar ? std::string(" ") + f.metavar : "");
        oss << "  " << left;
        for (size_t pad = left.size(); pad < 23; ++pad) oss << ' ';
        const OptionInfo* info = find_option(f.key);
        if (f.kind == FlagKind::False) {
            oss << "do not use python-config";
        } else if (info) {
            oss << info->help;
        }
        oss << "\n";
    }
    oss << "  -n, --dry-run          print the commands without running them\n"
        << "  -v, --verbose          show every command line\n"
        << "  -q, --quiet            only report warnings and errors\n"
        << "  -h, --help             show this help\n"
        << "\n"
        << "Exit status: 0 built, 1 a build step failed, 2 usage or configuration error.\n";
    return oss.str();
}

BuildConfig load_config(const CliOptions& opts) {
    BuildConfig cfg;

    std::string config_file = opts.config_file;
    if (config_file.empty()) {
        // work_dir may itself come from the flags.
        BuildConfig probe;
        apply_overlay(probe, opts.overlay);
        const fs::path dir = probe.work_dir.empty() ? fs::current_path() : fs::path(probe.work_dir);
        const fs::path candidate = dir / kDefaultConfigFile;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec)) {
            config_file = candidate.string();
        }
    }
    if (!config_file.empty()) {
        log::debug("reading " + config_file);
        apply_overlay(cfg, ConfigParser::parseFile(config_file));
    }

    apply_overlay(cfg, environment_overlay());
    apply_overlay(cfg, opts.overlay);
    return cfg;
}

int run_cli(const std::vector<std::string>& args, CommandRunner& runner, std::FILE* out) {
    CliOptions opts;
    try {
        opts = parse_command_line(args);
    } catch (const UsageError& e) {
        log::error(e.what());
        log::error("run 'cspyce-build --help' for usage");
        return kExitUsage;
    }

    if (opts.help) {
        std::fputs(usage_text().c_str(), out);
        return kExitOk;
    }
    if (opts.verbose) log::set_level(log::Level::Debug);
    if (opts.quiet) log::set_level(log::Level::Warn);

    BuildConfig cfg;
    try {
        cfg = resolve_paths(load_config(opts));
    } catch (const std::runtime_error& e) {
        // ParseError, unreadable config file, filesystem errors
        log::error(e.what());
        return kExitUsage;
    } catch (const std::invalid_argument& e) {
        log::error(e.what());
        return kExitUsage;
    }

    ConfigCheckResult check = validate_config(cfg);
    if (!check.valid) {
        for (const auto& err : check.errors) {
            log::error(err.to_string());
        }
        log::error("nothing was run; fix the configuration and retry");
        return kExitUsage;
    }

    PipelineOptions popts;
    popts.dry_run = opts.dry_run;
    BuildPipeline pipeline(cfg, runner, popts);
    PipelineResult result = pipeline.run();

    if (!result.ok) {
        log::error(result.to_string());
        return kExitBuildFailed;
    }
    log::debug(result.to_string());
    return kExitOk;
}

}  // namespace cspyce::build
