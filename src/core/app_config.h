#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "http_engine.h"
#include "planner.h"

/// Everything the command-line entry point needs for one run.
/// Precedence: built-in defaults < JSON config file < command-line options.
struct AppConfig {
    std::string url;
    std::string output;           // base path without suffix; empty = derive from url
    int parallelism = 8;
    bool legacy = false;          // PlanOptions::legacy()
    bool plan_only = false;       // print the plan, download nothing
    std::string report_path;      // write a JSON report here when set
    std::string log_file;
    std::string log_level = "info";
    bool verbose = false;         // echo log lines to stderr
    HttpConfig http;

    PlanOptions planOptions() const;

    /// output, or the last path segment of url without its extension.
    std::string outputBase() const;
};

/// Overlay the keys present in j onto config. Unknown keys are ignored.
/// @throws DownloadError(InvalidConfig) on a type or range error.
void applyConfigJson(const nlohmann::json& j, AppConfig& config);

/// Read a JSON config file and overlay it onto config.
/// @throws DownloadError(InvalidConfig) if the file is missing or malformed.
void loadConfigFile(const std::string& path, AppConfig& config);

enum class CliAction { Run, Help, UsageError };

struct CliResult {
    CliAction action = CliAction::Run;
    std::string message;   // usage error description
};

/// Parse argv with getopt_long. A --config file is applied before the other
/// options regardless of its position.
CliResult parseCommandLine(int argc, char* argv[], AppConfig& config);

std::string usageText(const std::string& program);

/// Last path segment of a URL (query stripped, percent-decoded), without its
/// extension. "download" when the URL has no usable segment, including one
/// that decodes to control bytes ("%00", "%0A").
std::string baseNameFromUrl(const std::string& url);
