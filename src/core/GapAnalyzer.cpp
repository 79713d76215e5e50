#include "GapAnalyzer.h"
#include "JsonUtil.h"
#include "Utils.h"
#include <algorithm>
#include <set>

namespace asset_scan {

namespace {

bool is_critical(const DiscoveredAsset& a){
    return utils::to_lower(a.attribute(attr::Criticality)) == "critical";
}

bool is_high_or_critical(const DiscoveredAsset& a){
    std::string c = utils::to_lower(a.attribute(attr::Criticality));
    return c == "critical" || c == "high";
}

std::string primary_locator(const DiscoveredAsset& a){
    return a.locators.empty() ? std::string() : a.locators.front();
}

}

GapAnalysis GapAnalyzer::analyze(const std::vector<DiscoveredAsset>& inventory, const DocumentationIndex& docs,
                                 const RuleSet& rules, std::chrono::system_clock::time_point now) const {
    GapAnalysis out;
    const auto stale_after = std::chrono::hours(24) * opts_.staleness_days;
    std::set<const DocumentationEntry*> matched;

    for(const auto& asset : inventory){
        const DocumentationEntry* entry = docs.find(asset);
        for(const auto& e : docs.entries()) if(DocumentationIndex::matches(e, asset)) matched.insert(&e);
        bool owned = !asset.attribute(attr::Owner).empty();

        if(!entry && !owned){
            Gap g;
            g.gap_id = orphaned_gap_id(asset.asset_id);
            g.kind = GapKind::Orphaned;
            g.asset_id = asset.asset_id;
            g.detected_at = now;
            g.severity = is_high_or_critical(asset) ? Severity::High : Severity::Medium;
            g.evidence.push_back("no documentation entry");
            g.evidence.push_back("no owner attribute");
            g.evidence.push_back("locator: " + primary_locator(asset));
            out.gaps.push_back(std::move(g));
        } else {
            std::vector<DocumentationIssue> issues;
            std::vector<std::string> evidence;
            if(!entry){
                issues.push_back(DocumentationIssue::Missing);
                evidence.push_back("owner '" + asset.attribute(attr::Owner) + "' but no documentation entry");
            } else {
                if(entry->completeness_score < opts_.completeness_threshold){
                    issues.push_back(DocumentationIssue::Incomplete);
                    evidence.push_back("completeness " + jsonutil::format_double(entry->completeness_score) +
                                       " below " + jsonutil::format_double(opts_.completeness_threshold));
                }
                if(now - entry->last_updated > stale_after){
                    issues.push_back(DocumentationIssue::Stale);
                    evidence.push_back("last updated " + jsonutil::time_to_iso(entry->last_updated) +
                                       ", older than " + std::to_string(opts_.staleness_days) + " days");
                }
            }
            if(!issues.empty()){
                Gap g;
                g.gap_id = documentation_gap_id(asset.asset_id);
                g.kind = GapKind::Documentation;
                g.asset_id = asset.asset_id;
                g.detected_at = now;
                g.severity = is_critical(asset) ? Severity::High : Severity::Medium;
                g.issues = std::move(issues);
                g.evidence = std::move(evidence);
                if(entry) g.entry_key = entry->key;
                out.gaps.push_back(std::move(g));
            }
        }

        for(const auto& rule : rules.rules()){
            RuleOutcome res = evaluate_rule(rule, asset);
            if(res != RuleOutcome::Fail) continue;
            Gap g;
            g.gap_id = compliance_gap_id(rule.framework, rule.id, asset.asset_id);
            g.kind = GapKind::Compliance;
            g.asset_id = asset.asset_id;
            g.detected_at = now;
            g.severity = rule.severity;
            g.framework = rule.framework;
            g.rule_id = rule.id;
            g.violated_rule = rule.description.empty() ? rule.predicate_name + " " + rule.field : rule.description;
            std::string ev = rule.predicate_name;
            if(!rule.field.empty()) ev += " " + rule.field;
            if(!rule.value.empty()) ev += " " + rule.value;
            g.evidence.push_back("failed predicate: " + ev);
            if(!rule.field.empty()){
                std::string actual = asset.attribute(rule.field);
                g.evidence.push_back(rule.field + " = " + (actual.empty() ? std::string("<absent>") : actual));
            }
            out.gaps.push_back(std::move(g));
        }
    }

    for(const auto& rule : rules.rules()){
        if(rule.predicate == PredicateKind::Unknown) out.skipped_rules.push_back({rule.id, "unsupported predicate '" + rule.predicate_name + "'"});
    }

    if(opts_.report_dangling && !opts_.truncated_run){
        std::set<std::string> seen;
        for(const auto& e : docs.entries()){
            if(matched.count(&e) || !seen.insert(e.key).second) continue;
            Gap g;
            g.gap_id = dangling_documentation_gap_id(e.key);
            g.kind = GapKind::Documentation;
            g.detected_at = now;
            g.severity = Severity::Low;
            g.issues.push_back(DocumentationIssue::Dangling);
            g.entry_key = e.key;
            g.evidence.push_back("documentation entry matches no discovered asset (" + e.source + ":" + std::to_string(e.line) + ")");
            out.gaps.push_back(std::move(g));
        }
    }
    std::sort(out.gaps.begin(), out.gaps.end(), [](const Gap& a, const Gap& b){ return a.gap_id < b.gap_id; });
    return out;
}

}
