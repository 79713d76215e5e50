#include "ConfigValidator.h"
#include "Logging.h"
#include "Utils.h"
#include <iostream>
#include <algorithm>
#include <filesystem>
#include <set>

namespace fs = std::filesystem;

namespace asset_scan {

namespace {

std::vector<std::string> dedupe(const std::vector<std::string>& in){
    std::vector<std::string> out;
    std::set<std::string> seen;
    for(const auto& s : in){
        std::string t = utils::trim(s);
        if(t.empty() || !seen.insert(t).second) continue;
        out.push_back(t);
    }
    return out;
}

}

bool ConfigValidator::validate(Config& cfg) {
    // pretty vs compact: compact wins
    if(cfg.pretty && cfg.compact) cfg.pretty = false;
    if(cfg.ndjson && (cfg.pretty || cfg.compact)){
        std::cerr << "--ndjson cannot be combined with --pretty or --compact\n";
        return false;
    }

    if(!validate_severity(cfg.fail_on_severity, "--fail-on")) return false;
    LogLevel lvl;
    if(!parse_log_level(cfg.log_level, lvl)){
        std::cerr << "Invalid --log-level value: " << cfg.log_level << "\n";
        return false;
    }

    for(const auto& m : cfg.enable_modules){
        if(std::find(cfg.disable_modules.begin(), cfg.disable_modules.end(), m) != cfg.disable_modules.end()){
            std::cerr << "Cannot enable and disable the same module: " << m << "\n";
            return false;
        }
    }

    if(!(cfg.budget_seconds > 0)){ std::cerr << "--timeout must be positive\n"; return false; }
    if(!(cfg.module_timeout_seconds >= 0)){ std::cerr << "--module-timeout must not be negative\n"; return false; }
    if(cfg.budget_seconds > kMaxRunSeconds){
        Logger::instance().warn("--timeout clamped to " + std::to_string(static_cast<long long>(kMaxRunSeconds)) + " seconds");
        cfg.budget_seconds = kMaxRunSeconds;
    }
    if(cfg.module_timeout_seconds > kMaxRunSeconds){
        Logger::instance().warn("--module-timeout clamped to " + std::to_string(static_cast<long long>(kMaxRunSeconds)) + " seconds");
        cfg.module_timeout_seconds = kMaxRunSeconds;
    }
    if(cfg.grace_ms < 0){ std::cerr << "--grace-ms must not be negative\n"; return false; }
    if(cfg.max_workers < 1){ std::cerr << "--workers must be at least 1\n"; return false; }
    if(cfg.memory_ceiling_mb < 1){ std::cerr << "--memory-mb must be at least 1\n"; return false; }
    if(cfg.max_file_size_mb < 0){ std::cerr << "--max-file-size-mb must not be negative\n"; return false; }
    if(cfg.staleness_days < 0){ std::cerr << "--staleness-days must not be negative\n"; return false; }
    if(cfg.completeness_threshold < 0.0 || cfg.completeness_threshold > 1.0){
        std::cerr << "--completeness must be within [0,1]\n";
        return false;
    }
    if(cfg.weight_severity < 0 || cfg.weight_regulatory < 0 || cfg.weight_exposure < 0){
        std::cerr << "--weights must not be negative\n";
        return false;
    }
    if(cfg.weight_severity + cfg.weight_regulatory + cfg.weight_exposure <= 0){
        std::cerr << "--weights must not all be zero\n";
        return false;
    }
    if(cfg.keep_cap_dac && !cfg.drop_priv){
        std::cerr << "--keep-cap-dac requires --drop-priv\n";
        return false;
    }

    cfg.scan_paths = dedupe(cfg.scan_paths);
    cfg.code_paths = dedupe(cfg.code_paths);
    if(cfg.scan_paths.empty()){ std::cerr << "--paths must name at least one path\n"; return false; }
    for(auto& ext : cfg.db_extensions){
        ext = utils::to_lower(ext);
        if(!ext.empty() && ext[0] != '.') ext = "." + ext;
    }
    return true;
}

bool ConfigValidator::load_external_files(const Config& cfg, GapInputs& inputs) {
    bool success = true;
    std::error_code ec;
    if(!cfg.docs_path.empty()){
        if(!fs::exists(cfg.docs_path, ec)){
            std::cerr << "Documentation path not accessible: " << cfg.docs_path << "\n";
            success = false;
        } else {
            inputs.documentation = DocumentationIndex::load(cfg.docs_path, inputs.errors);
        }
    }
    if(!cfg.rules_path.empty()){
        if(!fs::exists(cfg.rules_path, ec)){
            std::cerr << "Rules path not accessible: " << cfg.rules_path << "\n";
            success = false;
        } else {
            inputs.rules = RuleSet::load(cfg.rules_path, inputs.errors);
        }
    }
    return success;
}

bool ConfigValidator::validate_severity(const std::string& severity, const std::string& flag_name) {
    std::string trimmed = utils::trim(severity);
    if(trimmed.empty()) return true;
    std::string lower_severity = utils::to_lower(trimmed);
    if(std::find(allowed_severities_.begin(), allowed_severities_.end(), lower_severity) == allowed_severities_.end()) {
        std::cerr << "Invalid " << flag_name << " value: " << severity << "\n";
        return false;
    }
    return true;
}

int ConfigValidator::severity_rank(const std::string& severity) const {
    std::string s = utils::to_lower(utils::trim(severity));
    if(s == "info") return 0;
    if(s == "low") return 1;
    if(s == "medium") return 2;
    if(s == "high") return 3;
    if(s == "critical") return 4;
    return -1;
}

}
