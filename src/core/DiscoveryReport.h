#pragma once
#include <string>
#include <vector>
#include <map>
#include <chrono>
#include "Asset.h"
#include "GapPrioritizer.h"
#include "GapAnalyzer.h"
#include "Report.h"

namespace asset_scan {

struct ReportStatistics {
    size_t total_assets = 0;
    size_t total_observations = 0;
    size_t total_gaps = 0;
    size_t validated_assets = 0;
    size_t credential_exposures = 0;   // assets with a leaked credential
    std::map<std::string, size_t> assets_by_type;
    std::map<std::string, size_t> assets_by_method;
    std::map<std::string, size_t> assets_by_confidence;
    std::map<std::string, size_t> gaps_by_kind;
    std::map<std::string, size_t> gaps_by_severity;
};

// Value snapshot of one run; holds no references into modules or the journal.
struct DiscoveryReport {
    std::string report_id;
    std::chrono::system_clock::time_point start_time{};
    std::chrono::system_clock::time_point end_time{};
    std::vector<DiscoveredAsset> assets;
    std::vector<GapPriorityScore> gaps;      // prioritised order
    std::vector<ModuleRun> modules;
    bool truncated = false;
    std::vector<RunWarning> warnings;
    std::vector<ValidationError> validation_errors;
    std::vector<SkippedRule> skipped_rules;
    ReportStatistics statistics;
    ResourcePlan resource_plan;

    std::vector<ModuleRun> skipped_modules() const {
        std::vector<ModuleRun> out;
        for(const auto& m : modules) if(m.status == ModuleStatus::Skipped) out.push_back(m);
        return out;
    }
};

}
