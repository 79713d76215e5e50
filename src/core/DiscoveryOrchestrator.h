#pragma once
#include <vector>
#include <string>
#include <chrono>
#include "DiscoveryModule.h"
#include "Report.h"
#include "Config.h"

namespace asset_scan {

struct DiscoveryOutcome {
    std::vector<CandidateObservation> observations; // sorted, ready for reconciliation
    bool truncated = false;
    std::chrono::system_clock::time_point start_time{};
    std::chrono::system_clock::time_point end_time{};
};

// Runs an injected set of discovery modules under a shared budget.
class DiscoveryOrchestrator {
public:
    DiscoveryOrchestrator() = default;
    explicit DiscoveryOrchestrator(std::vector<ModulePtr> modules);

    // Refuses modules that are not read-only; the rejection is reported on the next run.
    bool register_module(ModulePtr module);
    size_t module_count() const { return modules_.size(); }

    // Throws ConfigError when there is nothing to run.
    DiscoveryOutcome run(const Config& cfg, Report& report);
private:
    std::vector<ModulePtr> modules_;
    std::vector<std::string> rejected_;
};

}
