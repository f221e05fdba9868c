#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include "core/app_config.h"
#include "core/download_job.h"
#include "core/errors.h"
#include "core/http_engine.h"
#include "core/logger.h"
#include "core/planner.h"
#include "core/range_fetcher.h"
#include "core/report_file.h"

/// RANGEFETCH_LOG=<level> turns on stderr logging without touching the command line.
static void applyLogEnvironment(AppConfig& config) {
    const char* env = std::getenv("RANGEFETCH_LOG");
    if (env == nullptr || Logger::parseLevel(env) == std::nullopt) {
        return;
    }
    config.log_level = env;
    config.verbose = true;
}

static void setupLogging(const AppConfig& config) {
    Logger& log = Logger::instance();
    log.setLevel(Logger::parseLevel(config.log_level).value_or(LogLevel::LVL_INFO));
    log.setEcho(config.verbose);
    if (!config.log_file.empty()) {
        log.setLogFile(config.log_file);
    }
}

static int run(const AppConfig& config) {
    CurlGlobal curl;

    HttpEngine probe;
    ResourceMetadata metadata = probe.fetchFileInfo(config.url, config.http);
    Logger::instance().info("Probe: HTTP " + std::to_string(metadata.status)
        + " length=" + metadata.header("content-length").value_or("<none>")
        + " type=" + metadata.header("content-type").value_or("<none>")
        + " ranges=" + (metadata.acceptsByteRanges() ? "bytes" : "no")
        + " final_url=" + metadata.final_url);

    ResourcePlan plan = buildPlan(metadata, config.url, config.outputBase(),
                                  config.parallelism, config.planOptions());

    if (config.plan_only) {
        std::cout << planToJson(plan).dump(2) << std::endl;
        return 0;
    }

    HttpRangeFetcher fetcher(config.http);
    DownloadJob job(std::move(plan), &fetcher);
    JobReport report = job.run();

    if (!config.report_path.empty() && !ReportFile::save(config.report_path, job.plan(), report)) {
        std::cerr << "warning: could not write report " << config.report_path << std::endl;
    }

    if (!report.ok()) {
        std::cerr << report.summary() << std::endl;
        return 1;
    }
    std::cout << report.summary() << std::endl;
    return 0;
}

int main(int argc, char* argv[]) {
    AppConfig config;
    applyLogEnvironment(config);

    std::string program = argc > 0 ? argv[0] : "rangefetch";
    CliResult cli = parseCommandLine(argc, argv, config);
    if (cli.action == CliAction::Help) {
        std::cout << usageText(program);
        return 0;
    }
    if (cli.action == CliAction::UsageError) {
        std::cerr << program << ": " << cli.message << "\n\n" << usageText(program);
        return 2;
    }

    setupLogging(config);

    return runReportingErrors([&config] { return run(config); }, std::cerr);
}
