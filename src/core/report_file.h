#pragma once
#include <string>
#include <nlohmann/json.hpp>

#include "download_job.h"
#include "resource_plan.h"

/// JSON form of a plan: url, length, kind, destination and every block.
nlohmann::json planToJson(const ResourcePlan& plan);

/// JSON form of a job outcome, including per-block failures.
nlohmann::json reportToJson(const JobReport& report);

class ReportFile {
public:
    /// Write {"plan": ..., "report": ...} to path. Returns false on I/O failure.
    static bool save(const std::string& path, const ResourcePlan& plan, const JobReport& report);
};
