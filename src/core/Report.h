#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <mutex>
#include "Observation.h"

namespace asset_scan {

enum class WarnCode {
    ModuleUnavailable,
    ModuleDisabled,
    ModuleRejected,
    ModuleFailed,
    ModuleTimeout,
    ModuleAbandoned,
    ReconciliationConflict,
    InvalidRuleDefinition,
    InvalidDocumentationEntry,
    SkippedRule,
    BudgetExceeded,
    MemoryCeilingExceeded
};

const char* warn_code_to_string(WarnCode c);

struct RunWarning {
    std::string source;   // module, file or component that raised it
    WarnCode code = WarnCode::ModuleFailed;
    std::string detail;
};

// A rejected documentation entry or rule definition; the rest of the input is still used.
struct ValidationError {
    std::string source;   // file path
    size_t line = 0;
    WarnCode code = WarnCode::InvalidRuleDefinition;
    std::string detail;
};

enum class ModuleStatus { Pending, Running, Completed, Partial, Skipped, Failed, Abandoned };

const char* module_status_to_string(ModuleStatus s);

struct ModuleRun {
    std::string name;
    DiscoveryMethod method = DiscoveryMethod::Filesystem;
    ModuleStatus status = ModuleStatus::Pending;
    size_t observation_count = 0;
    std::chrono::system_clock::time_point start_time{};
    std::chrono::system_clock::time_point end_time{};
    std::string reason; // skip / failure / truncation reason
};

// Run journal: per-module outcomes and non-fatal warnings for one run.
class Report {
public:
    void start_module(const std::string& name, DiscoveryMethod method);
    void end_module(const std::string& name, ModuleStatus status, size_t count, const std::string& reason = {});
    void add_module(ModuleRun run);
    void add_warning(const std::string& source, WarnCode code, const std::string& detail);
    void set_truncated(bool t);

    std::vector<ModuleRun> modules() const;
    std::vector<RunWarning> warnings() const;
    bool truncated() const;
private:
    std::vector<ModuleRun> modules_;
    std::vector<RunWarning> warnings_;
    bool truncated_ = false;
    mutable std::mutex mutex_;
};

}
