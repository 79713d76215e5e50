#include "Report.h"
#include "Logging.h"
#include <algorithm>

namespace asset_scan {

const char* warn_code_to_string(WarnCode c){
    switch(c){
        case WarnCode::ModuleUnavailable: return "module_unavailable";
        case WarnCode::ModuleDisabled: return "module_disabled";
        case WarnCode::ModuleRejected: return "module_rejected";
        case WarnCode::ModuleFailed: return "module_failed";
        case WarnCode::ModuleTimeout: return "module_timeout";
        case WarnCode::ModuleAbandoned: return "module_abandoned";
        case WarnCode::ReconciliationConflict: return "reconciliation_conflict";
        case WarnCode::InvalidRuleDefinition: return "invalid_rule_definition";
        case WarnCode::InvalidDocumentationEntry: return "invalid_documentation_entry";
        case WarnCode::SkippedRule: return "skipped_rule";
        case WarnCode::BudgetExceeded: return "budget_exceeded";
        case WarnCode::MemoryCeilingExceeded: return "memory_ceiling_exceeded";
    }
    return "unknown";
}

const char* module_status_to_string(ModuleStatus s){
    switch(s){
        case ModuleStatus::Pending: return "pending";
        case ModuleStatus::Running: return "running";
        case ModuleStatus::Completed: return "completed";
        case ModuleStatus::Partial: return "partial";
        case ModuleStatus::Skipped: return "skipped";
        case ModuleStatus::Failed: return "failed";
        case ModuleStatus::Abandoned: return "abandoned";
    }
    return "unknown";
}

void Report::start_module(const std::string& name, DiscoveryMethod method){
    std::lock_guard<std::mutex> lock(mutex_);
    ModuleRun run;
    run.name = name;
    run.method = method;
    run.status = ModuleStatus::Running;
    run.start_time = std::chrono::system_clock::now();
    modules_.push_back(std::move(run));
}

void Report::end_module(const std::string& name, ModuleStatus status, size_t count, const std::string& reason){
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(modules_.begin(), modules_.end(), [&](const ModuleRun& r){ return r.name == name; });
    if(it == modules_.end()) return;
    it->status = status;
    it->observation_count = count;
    it->reason = reason;
    it->end_time = std::chrono::system_clock::now();
}

void Report::add_module(ModuleRun run){
    std::lock_guard<std::mutex> lock(mutex_);
    modules_.push_back(std::move(run));
}

void Report::add_warning(const std::string& source, WarnCode code, const std::string& detail){
    Logger::instance().warn(source + ": " + warn_code_to_string(code) + (detail.empty() ? std::string() : " (" + detail + ")"));
    std::lock_guard<std::mutex> lock(mutex_);
    warnings_.push_back({source, code, detail});
}

void Report::set_truncated(bool t){
    std::lock_guard<std::mutex> lock(mutex_);
    truncated_ = t;
}

std::vector<ModuleRun> Report::modules() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return modules_;
}

std::vector<RunWarning> Report::warnings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return warnings_;
}

bool Report::truncated() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return truncated_;
}

}
