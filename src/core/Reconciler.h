#pragma once
#include <vector>
#include <string>
#include "Asset.h"
#include "Report.h"

namespace asset_scan {

double combine_confidence(const std::vector<double>& confidences);

// Merges candidate observations into assets. Observations are grouped by
// identity key; different keys are joined only through explicit links.
class Reconciler {
public:
    // Conflicts are recorded on the journal when one is given. Output is sorted by asset_id.
    std::vector<DiscoveredAsset> reconcile(const std::vector<CandidateObservation>& observations, Report* journal = nullptr) const;

    static std::string make_asset_id(const std::vector<std::string>& identity_keys);
};

// Read-only re-check of each reconciled asset: a known engine, at least one
// resolvable locator, and file-backed locators that still exist. Fills
// validated and validation_errors; returns how many assets passed.
size_t validate_assets(std::vector<DiscoveredAsset>& assets);

}
