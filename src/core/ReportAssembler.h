#pragma once
#include <vector>
#include "DiscoveryReport.h"
#include "DiscoveryOrchestrator.h"
#include "DocumentationIndex.h"
#include "ComplianceRules.h"

namespace asset_scan {

// Documentation and rules loaded for gap analysis, with per-entry rejections.
struct GapInputs {
    DocumentationIndex documentation;
    RuleSet rules;
    std::vector<ValidationError> errors;
};

class ReportAssembler {
public:
    DiscoveryReport assemble(const DiscoveryOutcome& outcome,
                             std::vector<DiscoveredAsset> assets,
                             std::vector<GapPriorityScore> gaps,
                             const Report& journal,
                             std::vector<ValidationError> validation_errors,
                             std::vector<SkippedRule> skipped_rules) const;

    static ReportStatistics statistics(const std::vector<DiscoveredAsset>& assets, const std::vector<GapPriorityScore>& gaps, size_t observations);
};

// Full pipeline: discovery, reconciliation, gap analysis, prioritisation, assembly.
DiscoveryReport run_pipeline(const Config& cfg, DiscoveryOrchestrator& orchestrator, const GapInputs& inputs);

}
