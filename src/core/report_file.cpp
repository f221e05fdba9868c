#include "report_file.h"
#include "content_kind.h"
#include "errors.h"
#include "logger.h"

#include <fstream>

using json = nlohmann::json;

// ── JSON serialization helpers ─────────────────────────────────

static json blockInfoToJson(const BlockInfo& b) {
    return json{
        {"block_id",    b.block_id},
        {"range_start", b.range_start},
        {"range_end",   b.range_end},
        {"completed",   b.completed}
    };
}

static json blockFailureToJson(const BlockFailure& f) {
    return json{
        {"block_id", f.block_id},
        {"kind",     errorKindName(f.kind)},
        {"message",  f.message}
    };
}

static const char* schemeName(PartitionScheme scheme) {
    return scheme == PartitionScheme::Legacy ? "legacy" : "balanced";
}

json planToJson(const ResourcePlan& plan) {
    json blocks_arr = json::array();
    for (const auto& b : plan.blocks) {
        blocks_arr.push_back(blockInfoToJson(b));
    }
    return json{
        {"source_url",             plan.source_url},
        {"total_length",           plan.total_length},
        {"content_kind",           contentKindName(plan.content_kind)},
        {"suffix",                 plan.suffix},
        {"destination_path",       plan.destination_path},
        {"supports_partial_fetch", plan.supports_partial_fetch},
        {"ranged_fetch",           plan.ranged_fetch},
        {"requested_parallelism",  plan.requested_parallelism},
        {"scheme",                 schemeName(plan.scheme)},
        {"bytes_written",          plan.bytes_written},
        {"blocks",                 blocks_arr}
    };
}

json reportToJson(const JobReport& report) {
    json failures_arr = json::array();
    for (const auto& f : report.failures) {
        failures_arr.push_back(blockFailureToJson(f));
    }
    return json{
        {"ok",               report.ok()},
        {"destination_path", report.destination_path},
        {"total_length",     report.total_length},
        {"bytes_written",    report.bytes_written},
        {"block_count",      report.block_count},
        {"completed_blocks", report.completed_blocks},
        {"failures",         failures_arr},
        {"elapsed_seconds",  report.elapsed_seconds}
    };
}

// ── ReportFile implementation ──────────────────────────────────

bool ReportFile::save(const std::string& path, const ResourcePlan& plan, const JobReport& report) {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        Logger::instance().error("Cannot open report file " + path);
        return false;
    }
    ofs << json{{"plan", planToJson(plan)}, {"report", reportToJson(report)}}.dump(4);
    return ofs.good();
}
