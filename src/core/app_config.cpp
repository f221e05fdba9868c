#include "app_config.h"
#include "errors.h"
#include "logger.h"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <utility>
#include <vector>

#include <getopt.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

// ── helpers ────────────────────────────────────────────────────

namespace {

template<typename T>
void readKey(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return;
    }
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        throw DownloadError(ErrorKind::InvalidConfig,
                            std::string("config key \"") + key + "\": " + e.what());
    }
}

void requireAtLeast(const char* key, int value, int minimum) {
    if (value < minimum) {
        throw DownloadError(ErrorKind::InvalidConfig,
                            std::string("config key \"") + key + "\" must be >= "
                            + std::to_string(minimum) + ", got " + std::to_string(value));
    }
}

bool parseInt(const char* text, int& out) {
    if (text == nullptr || *text == '\0') return false;
    errno = 0;
    char* end = nullptr;
    long value = std::strtol(text, &end, 10);
    if (errno != 0 || *end != '\0' || value < INT_MIN || value > INT_MAX) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

std::string urlDecode(const std::string& encoded) {
    std::string result;
    result.reserve(encoded.size());
    auto hexVal = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    for (size_t i = 0; i < encoded.size(); ++i) {
        if (encoded[i] == '%' && i + 2 < encoded.size()) {
            int h = hexVal(encoded[i + 1]), l = hexVal(encoded[i + 2]);
            if (h >= 0 && l >= 0) {
                result += static_cast<char>((h << 4) | l);
                i += 2;
                continue;
            }
        }
        result += encoded[i];
    }
    return result;
}

enum LongOnly {
    OPT_LEGACY = 1000,
    OPT_PLAN_ONLY,
    OPT_REPORT,
    OPT_LOG_FILE,
    OPT_LOG_LEVEL,
    OPT_CONNECT_TIMEOUT,
    OPT_INSECURE
};

const struct option kLongOptions[] = {
    {"output",          required_argument, nullptr, 'o'},
    {"parallelism",     required_argument, nullptr, 'n'},
    {"config",          required_argument, nullptr, 'c'},
    {"verbose",         no_argument,       nullptr, 'v'},
    {"help",            no_argument,       nullptr, 'h'},
    {"legacy",          no_argument,       nullptr, OPT_LEGACY},
    {"plan-only",       no_argument,       nullptr, OPT_PLAN_ONLY},
    {"report",          required_argument, nullptr, OPT_REPORT},
    {"log-file",        required_argument, nullptr, OPT_LOG_FILE},
    {"log-level",       required_argument, nullptr, OPT_LOG_LEVEL},
    {"connect-timeout", required_argument, nullptr, OPT_CONNECT_TIMEOUT},
    {"insecure",        no_argument,       nullptr, OPT_INSECURE},
    {nullptr, 0, nullptr, 0}
};

const char* kShortOptions = ":o:n:c:vh";

} // namespace

// ── AppConfig ──────────────────────────────────────────────────

PlanOptions AppConfig::planOptions() const {
    return legacy ? PlanOptions::legacy() : PlanOptions();
}

std::string AppConfig::outputBase() const {
    return output.empty() ? baseNameFromUrl(url) : output;
}

void applyConfigJson(const json& j, AppConfig& config) {
    if (!j.is_object()) {
        throw DownloadError(ErrorKind::InvalidConfig, "config root must be a JSON object");
    }

    readKey(j, "url",                 config.url);
    readKey(j, "output",              config.output);
    readKey(j, "parallelism",         config.parallelism);
    readKey(j, "legacy",              config.legacy);
    readKey(j, "report",              config.report_path);
    readKey(j, "log_file",            config.log_file);
    readKey(j, "log_level",           config.log_level);
    readKey(j, "connect_timeout_sec", config.http.connect_timeout_sec);
    readKey(j, "low_speed_limit",     config.http.low_speed_limit);
    readKey(j, "low_speed_time",      config.http.low_speed_time);
    readKey(j, "max_redirects",       config.http.max_redirects);
    readKey(j, "verify_ssl",          config.http.verify_ssl);
    readKey(j, "user_agent",          config.http.user_agent);
    readKey(j, "referer",             config.http.referer);
    readKey(j, "cookie",              config.http.cookie);

    requireAtLeast("connect_timeout_sec", config.http.connect_timeout_sec, 0);
    requireAtLeast("low_speed_limit", config.http.low_speed_limit, 0);
    requireAtLeast("low_speed_time", config.http.low_speed_time, 0);
    requireAtLeast("max_redirects", config.http.max_redirects, 0);

    if (!Logger::parseLevel(config.log_level)) {
        throw DownloadError(ErrorKind::InvalidConfig,
                            "unknown log_level \"" + config.log_level + "\"");
    }
}

void loadConfigFile(const std::string& path, AppConfig& config) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw DownloadError(ErrorKind::InvalidConfig, "cannot open config file " + path);
    }

    json j;
    try {
        j = json::parse(ifs);
    } catch (const json::parse_error& e) {
        throw DownloadError(ErrorKind::InvalidConfig,
                            "malformed config file " + path + ": " + e.what());
    }
    applyConfigJson(j, config);
}

// ── Command line ───────────────────────────────────────────────

CliResult parseCommandLine(int argc, char* argv[], AppConfig& config) {
    std::vector<std::pair<int, std::string>> parsed;

    optind = 0;   // full re-initialisation (glibc), so the parser can run more than once
    opterr = 0;
    int opt;
    while ((opt = getopt_long(argc, argv, kShortOptions, kLongOptions, nullptr)) != -1) {
        if (opt == '?') {
            std::string arg = (optind > 0 && optind <= argc) ? argv[optind - 1] : "?";
            return {CliAction::UsageError, "unknown option " + arg};
        }
        if (opt == ':') {
            std::string arg = (optind > 0 && optind <= argc) ? argv[optind - 1] : "?";
            return {CliAction::UsageError, "option " + arg + " needs a value"};
        }
        parsed.emplace_back(opt, optarg ? optarg : "");
    }

    for (const auto& p : parsed) {
        if (p.first == 'h') {
            return {CliAction::Help, ""};
        }
    }

    // The config file goes first so the remaining options override it.
    for (const auto& p : parsed) {
        if (p.first == 'c') {
            try {
                loadConfigFile(p.second, config);
            } catch (const DownloadError& e) {
                return {CliAction::UsageError, e.what()};
            }
        }
    }

    for (const auto& p : parsed) {
        const std::string& value = p.second;
        switch (p.first) {
            case 'o': config.output = value; break;
            case 'n':
                if (!parseInt(value.c_str(), config.parallelism)) {
                    return {CliAction::UsageError, "invalid parallelism \"" + value + "\""};
                }
                break;
            case 'v': config.verbose = true; break;
            case OPT_LEGACY: config.legacy = true; break;
            case OPT_PLAN_ONLY: config.plan_only = true; break;
            case OPT_REPORT: config.report_path = value; break;
            case OPT_LOG_FILE: config.log_file = value; break;
            case OPT_LOG_LEVEL:
                if (!Logger::parseLevel(value)) {
                    return {CliAction::UsageError, "unknown log level \"" + value + "\""};
                }
                config.log_level = value;
                break;
            case OPT_CONNECT_TIMEOUT:
                if (!parseInt(value.c_str(), config.http.connect_timeout_sec)
                    || config.http.connect_timeout_sec < 0) {
                    return {CliAction::UsageError, "invalid connect timeout \"" + value + "\""};
                }
                break;
            case OPT_INSECURE: config.http.verify_ssl = false; break;
            default: break;   // 'c' handled above
        }
    }

    int positional = argc - optind;
    if (positional == 1) {
        config.url = argv[optind];
    } else if (positional > 1) {
        return {CliAction::UsageError, "expected a single URL"};
    }
    if (config.url.empty()) {
        return {CliAction::UsageError, "missing URL"};
    }
    if (config.url.rfind("http://", 0) != 0 && config.url.rfind("https://", 0) != 0) {
        return {CliAction::UsageError, "URL must start with http:// or https://"};
    }

    return {CliAction::Run, ""};
}

std::string usageText(const std::string& program) {
    return "Usage: " + program + " [options] URL\n"
        "\n"
        "Download URL in parallel byte ranges into one file.\n"
        "\n"
        "Options:\n"
        "  -o, --output BASE        output path without suffix (default: from URL)\n"
        "  -n, --parallelism N      number of blocks, 1-255 (default: 8)\n"
        "  -c, --config FILE        JSON configuration file\n"
        "      --legacy             legacy partition, naming and unconditional ranges\n"
        "      --plan-only          print the plan as JSON and exit\n"
        "      --report FILE        write a JSON report of the job\n"
        "      --connect-timeout S  connect timeout in seconds (default: 30)\n"
        "      --insecure           do not verify TLS certificates\n"
        "      --log-file FILE      append log lines to FILE\n"
        "      --log-level LEVEL    debug, info, warn, error or off (default: info)\n"
        "  -v, --verbose            echo log lines to stderr\n"
        "  -h, --help               show this help\n";
}

std::string baseNameFromUrl(const std::string& url) {
    std::string path = url.substr(0, url.find_first_of("?#"));

    auto scheme = path.find("://");
    std::string rest = scheme == std::string::npos ? path : path.substr(scheme + 3);
    auto slash_pos = rest.rfind('/');
    if (slash_pos == std::string::npos || slash_pos + 1 >= rest.size()) {
        return "download";   // bare host or trailing slash
    }

    std::string stem = fs::path(urlDecode(rest.substr(slash_pos + 1))).stem().string();
    bool has_control = std::any_of(stem.begin(), stem.end(), [](unsigned char c) {
        return c < 0x20 || c == 0x7f;
    });
    if (stem.empty() || stem == "." || stem == ".." || has_control
        || stem.find('/') != std::string::npos) {
        return "download";
    }
    return stem;
}
