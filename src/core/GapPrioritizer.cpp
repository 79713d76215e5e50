#include "GapPrioritizer.h"
#include "Config.h"
#include "Utils.h"
#include <algorithm>
#include <unordered_map>

namespace asset_scan {

namespace {

double effort_base(const Gap& gap){
    switch(gap.kind){
        case GapKind::Orphaned: return 6.0;
        case GapKind::Compliance: return 12.0;
        case GapKind::Documentation:
            return std::find(gap.issues.begin(), gap.issues.end(), DocumentationIssue::Missing) != gap.issues.end() ? 8.0 : 4.0;
    }
    return 4.0;
}

double effort_scale(Severity s){
    switch(s){
        case Severity::Critical: return 1.5;
        case Severity::High: return 1.3;
        case Severity::Medium: return 1.0;
        case Severity::Low:
        case Severity::Info: return 0.8;
    }
    return 1.0;
}

const char* team_for(GapKind k){
    switch(k){
        case GapKind::Orphaned: return "asset_management";
        case GapKind::Documentation: return "documentation";
        case GapKind::Compliance: return "compliance";
    }
    return "asset_management";
}

PriorityLevel level_for(double normalized){
    if(normalized >= 0.8) return PriorityLevel::Critical;
    if(normalized >= 0.6) return PriorityLevel::High;
    if(normalized >= 0.4) return PriorityLevel::Medium;
    return PriorityLevel::Low;
}

}

const char* priority_level_to_string(PriorityLevel l){
    switch(l){
        case PriorityLevel::Low: return "low";
        case PriorityLevel::Medium: return "medium";
        case PriorityLevel::High: return "high";
        case PriorityLevel::Critical: return "critical";
    }
    return "low";
}

double criticality_factor(const std::string& criticality){
    std::string c = utils::to_lower(utils::trim(criticality));
    if(c == "critical") return 1.0;
    if(c == "high") return 0.8;
    if(c == "medium") return 0.6;
    if(c == "low") return 0.3;
    return 0.5;
}

double regulatory_factor(const Gap& gap){
    if(gap.kind != GapKind::Compliance) return 0.4;
    if(gap.framework == "gdpr") return 1.0;
    if(gap.framework == "soc2" || gap.framework == "nist") return 0.8;
    return 0.4;
}

double exposure_factor(ConfidenceLevel level, AssetType type){
    double c = 0.4;
    switch(level){
        case ConfidenceLevel::High: c = 1.0; break;
        case ConfidenceLevel::Medium: c = 0.8; break;
        case ConfidenceLevel::Low: c = 0.6; break;
        case ConfidenceLevel::VeryLow: c = 0.4; break;
    }
    double t = 0.5;
    switch(type){
        case AssetType::PostgreSQL: t = 1.0; break;
        case AssetType::SQLite:
        case AssetType::DuckDB: t = 0.7; break;
        case AssetType::FileStorage: t = 0.6; break;
        case AssetType::Other: t = 0.5; break;
    }
    return c * t;
}

GapPrioritizer::GapPrioritizer(PriorityWeights weights) : weights_(weights) {
    if(weights_.severity < 0 || weights_.regulatory < 0 || weights_.exposure < 0) throw ConfigError("priority weights must not be negative");
    if(weights_.severity + weights_.regulatory + weights_.exposure <= 0) throw ConfigError("priority weights must not all be zero");
}

std::vector<GapPriorityScore> GapPrioritizer::prioritize(const std::vector<Gap>& gaps, const std::vector<DiscoveredAsset>& inventory) const {
    std::unordered_map<std::string, const DiscoveredAsset*> by_id;
    for(const auto& a : inventory) by_id[a.asset_id] = &a;
    const double weight_sum = weights_.severity + weights_.regulatory + weights_.exposure;

    std::vector<GapPriorityScore> out;
    out.reserve(gaps.size());
    for(const auto& gap : gaps){
        const DiscoveredAsset* asset = nullptr;
        if(gap.asset_id){
            auto it = by_id.find(*gap.asset_id);
            if(it != by_id.end()) asset = it->second;
        }
        double sev = criticality_factor(asset ? asset->attribute(attr::Criticality) : std::string());
        double reg = regulatory_factor(gap);
        double exp = asset ? exposure_factor(asset->confidence_level, asset->asset_type) : 0.5;

        GapPriorityScore s;
        s.gap = gap;
        s.contributing_factors["severity"] = sev;
        s.contributing_factors["regulatory"] = reg;
        s.contributing_factors["exposure"] = exp;
        s.composite_score = weights_.severity * sev + weights_.regulatory * reg + weights_.exposure * exp;
        s.priority_level = level_for(s.composite_score / weight_sum);
        s.effort_hours = effort_base(gap) * effort_scale(gap.severity);
        s.team = team_for(gap.kind);
        out.push_back(std::move(s));
    }
    std::sort(out.begin(), out.end(), [](const GapPriorityScore& a, const GapPriorityScore& b){
        if(a.composite_score != b.composite_score) return a.composite_score > b.composite_score;
        return a.gap.gap_id < b.gap.gap_id;
    });
    return out;
}

ResourcePlan GapPrioritizer::plan(const std::vector<GapPriorityScore>& scores){
    ResourcePlan p;
    for(const auto& s : scores){
        if(s.priority_level == PriorityLevel::Critical || s.priority_level == PriorityLevel::High) ++p.immediate;
        else ++p.scheduled;
        p.total_effort_hours += s.effort_hours;
        ++p.gaps_by_team[s.team];
        p.hours_by_team[s.team] += s.effort_hours;
    }
    return p;
}

}
