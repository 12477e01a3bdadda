// cspyce-build - shared test fixtures
// Copyright (c) 2026 cspyce-build Authors
// SPDX-License-Identifier: MIT

#pragma once

#include "cspyce/build/config.hpp"
#include "cspyce/build/process.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace cspyce::build::testing {

namespace fs = std::filesystem;

inline void write_file(const fs::path& p, const std::string& content) {
    if (p.has_parent_path()) fs::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::binary);
    if (!out) throw std::runtime_error("cannot write " + p.string());
    out << content;
}

inline std::string read_file(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in) throw std::runtime_error("cannot read " + p.string());
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

inline void make_executable(const fs::path& p, const std::string& script) {
    write_file(p, script);
    fs::permissions(p, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                           fs::perms::others_read | fs::perms::others_exec);
}

/// Names of the entries directly under `dir`, sorted.
inline std::vector<std::string> list_dir(const fs::path& dir) {
    std::vector<std::string> names;
    for (const auto& e : fs::directory_iterator(dir)) {
        names.push_back(e.path().filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

inline bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

/// mkdtemp-backed directory, removed with its contents on destruction.
class TempDir {
public:
    TempDir() {
        std::string tmpl = (fs::temp_directory_path() / "cspyce-build-test-XXXXXX").string();
        if (!mkdtemp(tmpl.data())) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = tmpl;
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

/// A directory laid out like a checkout with the CSPICE toolkit unpacked:
/// interface file, Python and NumPy headers, toolkit headers and library,
/// and a bin/ with placeholder tools so validation passes.
class Workspace {
public:
    explicit Workspace(const std::string& module = "cspice") : module_(module) {
        const fs::path root = dir_.path();
        write_file(root / "work" / (module + ".i"), "%module " + module + "\n");
        write_file(root / "python" / "include" / "Python.h", "/* Python.h */\n");
        write_file(root / "site" / "numpy" / "core" / "include" / "numpy" / "arrayobject.h",
                   "/* arrayobject.h */\n");
        write_file(root / "work" / "cspice" / "src" / "cspice" / "SpiceUsr.h", "/* SpiceUsr.h */\n");
        write_file(root / "work" / "cspice" / "lib" / "cspice.a", "!<arch>\n");
        for (const char* tool : {"swig", "gcc", "ld", "python3-config", "python3"}) {
            make_executable(root / "bin" / tool, "#!/bin/sh\nexit 0\n");
        }
    }

    fs::path root() const { return dir_.path(); }
    fs::path work() const { return dir_.path() / "work"; }
    fs::path bin(const std::string& tool) const { return dir_.path() / "bin" / tool; }

    /// Unresolved config pointing at this workspace.
    BuildConfig config() const {
        BuildConfig cfg;
        cfg.module = module_;
        cfg.work_dir = work().string();
        cfg.python_include = (root() / "python" / "include").string();
        cfg.site_packages = (root() / "site").string();
        cfg.platform = "linux";
        cfg.swig = bin("swig").string();
        cfg.cc = bin("gcc").string();
        cfg.ld = bin("ld").string();
        cfg.python_config = bin("python3-config").string();
        return cfg;
    }

private:
    TempDir dir_;
    std::string module_;
};

/// Simulates swig, cc, ld and python in-process: each writes the file named
/// after `-o` (swig also writes <module>.py into -outdir). Records every call.
class FakeToolRunner : public CommandRunner {
public:
    std::vector<Command> runs;
    std::vector<Command> captures;

    std::map<std::string, int> exit_codes;        // tool -> non-zero exit
    std::set<std::string> no_output;              // tool exits 0 but writes nothing
    std::map<std::string, std::string> queries;   // python-config arg -> stdout
    std::string link_payload = "extension";

    static std::string tool_of(const std::string& exe) {
        const std::string name = fs::path(exe).filename().string();
        if (name.find("swig") != std::string::npos) return "swig";
        if (name.find("config") != std::string::npos) return "python-config";
        if (name.find("python") != std::string::npos) return "python";
        if (name == "ld" || name.find("ld") == 0) return "ld";
        return "cc";
    }

    int run(const Command& cmd) override {
        runs.push_back(cmd);
        const std::string tool = tool_of(cmd.argv.front());
        if (auto it = exit_codes.find(tool); it != exit_codes.end()) return it->second;
        if (no_output.count(tool)) return 0;

        const std::string out = value_after(cmd.argv, "-o");
        if (tool == "swig") {
            const std::string iface = cmd.argv.back();
            write_file(out, "/* glue generated from " + fs::path(iface).filename().string() + " */\n");
            const std::string outdir = value_after(cmd.argv, "-outdir");
            write_file(fs::path(outdir) / (fs::path(iface).stem().string() + ".py"),
                       "import _" + fs::path(iface).stem().string() + "\n");
        } else if (tool == "cc") {
            write_file(out, "object of " + read_file(input_with_suffix(cmd.argv, ".c")));
        } else if (tool == "ld") {
            write_file(out, link_payload + "\n" + read_file(input_with_suffix(cmd.argv, ".o")));
        }
        return 0;
    }

    CaptureResult capture(const Command& cmd) override {
        captures.push_back(cmd);
        if (auto it = exit_codes.find("python-config"); it != exit_codes.end()) {
            return CaptureResult{it->second, ""};
        }
        const std::string what = cmd.argv.size() > 1 ? cmd.argv[1] : "";
        auto it = queries.find(what);
        return CaptureResult{0, it != queries.end() ? it->second : ""};
    }

    std::vector<std::string> tools_run() const {
        std::vector<std::string> out;
        for (const auto& c : runs) out.push_back(tool_of(c.argv.front()));
        return out;
    }

    const Command* find(const std::string& tool) const {
        for (const auto& c : runs) {
            if (tool_of(c.argv.front()) == tool) return &c;
        }
        return nullptr;
    }

private:
    static std::string value_after(const std::vector<std::string>& argv, const std::string& flag) {
        for (size_t i = 0; i + 1 < argv.size(); ++i) {
            if (argv[i] == flag) return argv[i + 1];
        }
        throw std::runtime_error("fake tool: no " + flag + " argument");
    }

    static std::string input_with_suffix(const std::vector<std::string>& argv,
                                         const std::string& suffix) {
        for (const auto& a : argv) {
            if (a.size() > suffix.size() &&
                a.compare(a.size() - suffix.size(), suffix.size(), suffix) == 0 &&
                fs::exists(a)) {
                return a;
            }
        }
        throw std::runtime_error("fake tool: no existing " + suffix + " input");
    }
};

}  // namespace cspyce::build::testing
