// Copyright (c) Created by MWAC-dev on 2026.
// src/main.cpp
#include <algorithm>
#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <SDL3/SDL.h>

#include <nlohmann/json.hpp>
#include "nls/batch.hpp"
#include "nls/errors.hpp"
#include "nls/log.hpp"
#include "nls/report.hpp"
#include "nls/rule_adapters.hpp"
#include "nls/templates.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

constexpr const char* kTutorialFile = "How to Use nl2scale.txt";
constexpr const char* kTutorialText =
    "nl2scale\n"
    "\n"
    "Drop .nl2mat files, or folders with .nl2mat files and optionally one .nl2sco\n"
    "file, onto the executable. Dropping several files and folders at once works too.\n"
    "\n"
    "For every scale in the templates a copy of the dropped files is written to the\n"
    "'Scaleable Build Shapes' directory next to the executable, one directory per scale\n"
    "(x1, x2, ...). Texture tiling and shape dimensions are scaled, everything else is\n"
    "left as it was. The .nl2sco files reference the scaled materials of their own\n"
    "scale and can be used in NL2 right away.\n"
    "\n"
    "Run nl2scale --help from a command line to change the output directory, pick\n"
    "scales or write a report.\n"
    "\n"
    "Keep the templates directory next to the executable. Advanced users may edit the\n"
    "templates to change which fields are scaled.\n";

std::atomic<bool> g_cancel{false};

void on_interrupt(int) {
    g_cancel.store(true);
}

struct RunConfig {
    std::vector<fs::path> inputs;
    fs::path destination;
    fs::path templates;
    std::vector<std::string> scales;
    unsigned jobs{0};
    std::optional<fs::path> report;
    std::optional<fs::path> log_file;
    bool no_log_file{false};
    bool verbose{false};
    bool print_rules{false};
    bool help{false};
};

void print_usage(const char* argv0) {
    std::printf(
        "usage: %s [options] <files or folders...>\n"
        "\n"
        "  --out DIR          destination root (default: <exe dir>/Scaleable Build Shapes)\n"
        "  --templates DIR    templates directory (default: <exe dir>/templates)\n"
        "  --scale TAG        only write this scale, by tag (x2) or factor (2, 3/2); repeatable\n"
        "  --jobs N           worker threads (default: hardware threads)\n"
        "  --report FILE      write a JSON report of every file\n"
        "  --log-file FILE    log file (default: <exe dir>/nl2scale_<date>.log)\n"
        "  --no-log-file      do not write a log file\n"
        "  --print-rules      print the loaded templates as JSON and exit\n"
        "  --verbose          debug logging\n"
        "  --help             this text\n",
        argv0);
}

bool ParseArgs(int argc, char** argv, RunConfig& config, std::string& errorOut) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&](std::string& out) -> bool {
            if (i + 1 >= argc) { errorOut = arg + " needs a value"; return false; }
            out = argv[++i];
            return true;
        };

        std::string v;
        if (arg == "--help" || arg == "-h") {
            config.help = true;
        } else if (arg == "--verbose" || arg == "-v") {
            config.verbose = true;
        } else if (arg == "--no-log-file") {
            config.no_log_file = true;
        } else if (arg == "--print-rules") {
            config.print_rules = true;
        } else if (arg == "--out") {
            if (!value(v)) return false;
            config.destination = v;
        } else if (arg == "--templates") {
            if (!value(v)) return false;
            config.templates = v;
        } else if (arg == "--scale") {
            if (!value(v)) return false;
            config.scales.push_back(v);
        } else if (arg == "--report") {
            if (!value(v)) return false;
            config.report = fs::path(v);
        } else if (arg == "--log-file") {
            if (!value(v)) return false;
            config.log_file = fs::path(v);
        } else if (arg == "--jobs" || arg == "-j") {
            if (!value(v)) return false;
            char* end = nullptr;
            const unsigned long n = std::strtoul(v.c_str(), &end, 10);
            if (v.empty() || *end != '\0' || n == 0 || n > 256) { errorOut = "invalid --jobs value '" + v + "'"; return false; }
            config.jobs = static_cast<unsigned>(n);
        } else if (arg.size() > 1 && arg[0] == '-' && arg.rfind("--", 0) == 0) {
            errorOut = "unknown option " + arg;
            return false;
        } else {
            config.inputs.emplace_back(arg);
        }
    }
    return true;
}

fs::path ExecutableDir() {
    const char* base = SDL_GetBasePath();
    if (!base) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "SDL_GetBasePath failed: %s", SDL_GetError());
        return fs::current_path();
    }
    return fs::path(base);
}

std::string FileTimestamp() {
    SDL_Time now = 0;
    SDL_DateTime dt{};
    if (!SDL_GetCurrentTime(&now) || !SDL_TimeToDateTime(now, &dt, true)) return "unknown-time";
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d_%02d-%02d-%02d", dt.year, dt.month, dt.day, dt.hour, dt.minute,
                  dt.second);
    return buf;
}

// Mirrors every SDL log line into a file, console output stays with SDL's default.
class LogFileSink {
public:
    bool open(const fs::path& path) {
        file_.open(path, std::ios::out | std::ios::trunc);
        if (!file_) return false;
        fallback_ = SDL_GetDefaultLogOutputFunction();
        SDL_SetLogOutputFunction(&LogFileSink::output, this);
        return true;
    }

    void close() {
        if (!file_.is_open()) return;
        SDL_SetLogOutputFunction(fallback_, nullptr);
        std::lock_guard<std::mutex> lock(mutex_);
        file_.close();
    }

    ~LogFileSink() { close(); }

private:
    static void SDLCALL output(void* userdata, int category, SDL_LogPriority priority, const char* message) {
        auto* self = static_cast<LogFileSink*>(userdata);
        if (self->fallback_) self->fallback_(nullptr, category, priority, message);

        std::lock_guard<std::mutex> lock(self->mutex_);
        self->file_ << priority_name(priority) << ": " << message << '\n';
        self->file_.flush();
    }

    static const char* priority_name(SDL_LogPriority priority) {
        switch (priority) {
            case SDL_LOG_PRIORITY_TRACE: return "TRACE";
            case SDL_LOG_PRIORITY_VERBOSE: return "VERBOSE";
            case SDL_LOG_PRIORITY_DEBUG: return "DEBUG";
            case SDL_LOG_PRIORITY_INFO: return "INFO";
            case SDL_LOG_PRIORITY_WARN: return "WARNING";
            case SDL_LOG_PRIORITY_ERROR: return "ERROR";
            case SDL_LOG_PRIORITY_CRITICAL: return "CRITICAL";
            default: return "LOG";
        }
    }

    std::mutex mutex_;
    std::ofstream file_;
    SDL_LogOutputFunction fallback_{nullptr};
};

bool WriteTutorial(const fs::path& path, std::string& errorOut) {
    std::ofstream f(path, std::ios::out | std::ios::trunc);
    if (!f) { errorOut = "failed to open: " + path.string(); return false; }
    f << kTutorialText;
    if (!f) { errorOut = "failed to write: " + path.string(); return false; }
    return true;
}

bool WriteReport(const fs::path& path, const nls::BatchReport& report, std::string& errorOut) {
    try {
        std::ofstream f(path, std::ios::out | std::ios::trunc);
        if (!f) { errorOut = "failed to open: " + path.string(); return false; }
        json j = report;
        f << j.dump(2) << '\n';
        if (!f) { errorOut = "failed to write: " + path.string(); return false; }
        return true;
    } catch (const std::exception& e) {
        errorOut = std::string("JSON error: ") + e.what();
        return false;
    }
}

// Resolves --scale values; unknown ones are reported and dropped.
std::vector<nls::ScaleFactor> SelectScales(const nls::RuleTable& table, const std::vector<std::string>& wanted) {
    std::vector<nls::ScaleFactor> out;
    for (const auto& w : wanted) {
        const nls::ScaleFactor* s = table.find_scale(w);
        if (!s) {
            const nls::UnsupportedScaleFactorError err("scale '" + w + "' is not defined by the templates, skipped");
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "%s: %s", nls::to_string(err.kind()), err.what());
            continue;
        }
        out.push_back(*s);
    }
    return out;
}

void LogSummary(const nls::BatchReport& report) {
    for (const auto& g : report.groups) {
        for (const auto& f : g.files) {
            if (f.status != nls::FileStatus::Failed) continue;
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "failed: %s (%s at %s): %s", f.source.string().c_str(),
                         f.error ? nls::to_string(*f.error) : "error", nls::to_string(f.stage), f.message.c_str());
        }
    }
    const nls::BatchSummary s = report.summary();
    SDL_Log("groups: %zu succeeded, %zu partial, %zu failed, %zu cancelled", s.groups_succeeded, s.groups_partial,
            s.groups_failed, s.groups_cancelled);
    SDL_Log("files: %zu written, %zu skipped, %zu failed", s.files_written, s.files_skipped, s.files_failed);
}

int Run(const RunConfig& config, const fs::path& exeDir) {
    // the tutorial does not need the templates
    if (config.inputs.empty() && !config.print_rules) {
        const fs::path tutorial = exeDir / kTutorialFile;
        SDL_Log("showing the tutorial since no files have been dropped");
        std::string err;
        if (!WriteTutorial(tutorial, err)) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "%s", err.c_str());
        } else {
            SDL_Log("wrote %s", tutorial.string().c_str());
        }
        SDL_Log("\n%s", kTutorialText);
        return 0;
    }

    const fs::path templatesDir = config.templates.empty() ? exeDir / "templates" : config.templates;

    nls::RuleTable table;
    try {
        table = nls::LoadRuleTable(templatesDir);
    } catch (const nls::Error& e) {
        SDL_LogCritical(SDL_LOG_CATEGORY_APPLICATION, "%s: %s", nls::to_string(e.kind()), e.what());
        return 2;
    }

    if (config.print_rules) {
        json j = table;
        std::printf("%s\n", j.dump(2).c_str());
        return 0;
    }

    nls::BatchOptions options;
    options.destination = config.destination.empty() ? exeDir / "Scaleable Build Shapes" : config.destination;
    options.jobs = config.jobs ? config.jobs : std::max(1u, std::thread::hardware_concurrency());
    options.cancel = &g_cancel;
    if (!config.scales.empty()) {
        options.scales = SelectScales(table, config.scales);
        if (options.scales.empty()) {
            SDL_LogCritical(SDL_LOG_CATEGORY_APPLICATION, "none of the requested scales is available");
            return 2;
        }
    }

    std::optional<nls::Orchestrator> orchestrator;
    try {
        orchestrator.emplace(table, options);
    } catch (const nls::Error& e) {
        SDL_LogCritical(SDL_LOG_CATEGORY_APPLICATION, "%s: %s", nls::to_string(e.kind()), e.what());
        return 2;
    }

    std::string scaleList;
    for (const auto& s : orchestrator->scales()) {
        if (!scaleList.empty()) scaleList += ", ";
        scaleList += s.tag;
    }
    SDL_Log("writing scales %s to %s", scaleList.c_str(), options.destination.string().c_str());

    std::signal(SIGINT, on_interrupt);
    const nls::BatchReport report = orchestrator->Run(config.inputs);
    std::signal(SIGINT, SIG_DFL);

    LogSummary(report);
    int code = report.ok() ? 0 : 1;

    if (config.report) {
        std::string err;
        if (!WriteReport(*config.report, report, err)) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "report: %s", err.c_str());
            code = 1;
        } else {
            SDL_Log("report written to %s", config.report->string().c_str());
        }
    }
    return code;
}

} // namespace

int main(int argc, char** argv) {
    RunConfig config;
    std::string argErr;
    if (!ParseArgs(argc, argv, config, argErr)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "%s", argErr.c_str());
        print_usage(argv[0]);
        return 2;
    }
    if (config.help) {
        print_usage(argv[0]);
        return 0;
    }

    if (!SDL_Init(0)) {
        SDL_LogCritical(SDL_LOG_CATEGORY_APPLICATION, "SDL_Init failed: %s", SDL_GetError());
        return 2;
    }
    nls::SetLogVerbose(config.verbose);

    const fs::path exeDir = ExecutableDir();

    LogFileSink sink;
    if (!config.no_log_file) {
        const fs::path logPath = config.log_file ? *config.log_file
                                                 : exeDir / ("nl2scale_" + FileTimestamp() + ".log");
        if (!sink.open(logPath)) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "cannot open log file %s, logging to console only",
                        logPath.string().c_str());
        }
    }

    const int code = Run(config, exeDir);

    sink.close();
    SDL_Quit();
    return code;
}
