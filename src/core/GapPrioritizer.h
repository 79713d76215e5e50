#pragma once
#include <vector>
#include <string>
#include <map>
#include "Gap.h"
#include "Asset.h"

namespace asset_scan {

struct PriorityWeights {
    double severity = 1.0;
    double regulatory = 1.0;
    double exposure = 1.0;
};

enum class PriorityLevel { Low, Medium, High, Critical };
const char* priority_level_to_string(PriorityLevel l);

struct GapPriorityScore {
    Gap gap;
    double composite_score = 0.0;
    std::map<std::string, double> contributing_factors; // unweighted severity, regulatory, exposure
    PriorityLevel priority_level = PriorityLevel::Low;
    double effort_hours = 0.0;
    std::string team;
};

struct ResourcePlan {
    size_t immediate = 0;     // critical + high priority
    size_t scheduled = 0;
    double total_effort_hours = 0.0;
    std::map<std::string, size_t> gaps_by_team;
    std::map<std::string, double> hours_by_team;
};

double criticality_factor(const std::string& criticality);
double regulatory_factor(const Gap& gap);
double exposure_factor(ConfidenceLevel level, AssetType type);

// Weighted scoring of gaps; the output order is total and reproducible.
class GapPrioritizer {
public:
    // Throws ConfigError for negative or all-zero weights.
    explicit GapPrioritizer(PriorityWeights weights = {});

    std::vector<GapPriorityScore> prioritize(const std::vector<Gap>& gaps, const std::vector<DiscoveredAsset>& inventory) const;
    static ResourcePlan plan(const std::vector<GapPriorityScore>& scores);
private:
    PriorityWeights weights_;
};

}
