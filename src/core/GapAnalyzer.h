#pragma once
#include <vector>
#include <string>
#include <chrono>
#include "Asset.h"
#include "Gap.h"
#include "DocumentationIndex.h"
#include "ComplianceRules.h"

namespace asset_scan {

struct GapAnalysisOptions {
    int staleness_days = 90;
    double completeness_threshold = 0.7;
    bool report_dangling = true;
    bool truncated_run = false; // dangling entries are not reported for truncated runs
};

struct SkippedRule {
    std::string rule_id;
    std::string reason;
};

struct GapAnalysis {
    std::vector<Gap> gaps;
    std::vector<SkippedRule> skipped_rules;
};

// Stateless: the same inputs always produce the same gaps.
class GapAnalyzer {
public:
    explicit GapAnalyzer(GapAnalysisOptions opts = {}) : opts_(opts) {}
    GapAnalysis analyze(const std::vector<DiscoveredAsset>& inventory, const DocumentationIndex& docs,
                        const RuleSet& rules, std::chrono::system_clock::time_point now) const;
private:
    GapAnalysisOptions opts_;
};

}
