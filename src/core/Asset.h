#pragma once
#include <string>
#include <vector>
#include <map>
#include "Observation.h"

namespace asset_scan {

// One reconciled data-storage asset. Built once per run and not mutated afterwards.
struct DiscoveredAsset {
    std::string asset_id;
    AssetType asset_type = AssetType::Other;
    std::vector<std::string> locators;       // sorted, unique
    std::vector<std::string> identity_keys;  // sorted, unique
    std::vector<DiscoveryMethod> supporting_methods; // sorted by name, unique
    size_t observation_count = 0;
    double confidence_score = 0.0;
    ConfidenceLevel confidence_level = ConfidenceLevel::VeryLow;
    std::map<std::string, std::string> attributes;
    // Set by validate_assets after reconciliation.
    bool validated = false;
    std::vector<std::string> validation_errors;

    // Empty string when absent.
    std::string attribute(const std::string& key) const {
        auto it = attributes.find(key);
        return it == attributes.end() ? std::string() : it->second;
    }
};

}
