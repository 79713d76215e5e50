#pragma once
#include <string>
#include <vector>
#include "Config.h"
#include "ReportAssembler.h"

namespace asset_scan {

class ConfigValidator {
public:
    // Normalises cfg in place; prints the problem to stderr and returns false when invalid.
    bool validate(Config& cfg);
    // Loads --docs / --rules inputs. Individual bad entries land in inputs.errors;
    // an unreadable path prints to stderr and returns false.
    bool load_external_files(const Config& cfg, GapInputs& inputs);

    bool validate_severity(const std::string& severity, const std::string& flag_name);
    int severity_rank(const std::string& severity) const;
private:
    std::vector<std::string> allowed_severities_ = {"info", "low", "medium", "high", "critical"};
};

}
