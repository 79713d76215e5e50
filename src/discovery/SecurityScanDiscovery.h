#pragma once
#include "../core/DiscoveryModule.h"

namespace asset_scan {

// Database endpoints revealed by exposed credentials. Secrets are never
// emitted: locators are sanitised and only the fact of exposure is recorded.
class SecurityScanDiscovery : public DiscoveryModule {
public:
    std::string name() const override { return "security"; }
    std::string description() const override { return "Database endpoints referenced by hard-coded credentials"; }
    DiscoveryMethod method() const override { return DiscoveryMethod::SecurityScan; }
    std::optional<std::string> availability(const ScopeConfig& scope) const override;
    std::unique_ptr<ObservationStream> discover(const ScopeConfig& scope, const Deadline& deadline) override;
};

}
