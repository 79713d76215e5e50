#pragma once
#include "../core/DiscoveryModule.h"

namespace asset_scan {

// Connection strings, connect() calls and db-owner annotations in source code.
class CodeDiscovery : public DiscoveryModule {
public:
    std::string name() const override { return "code"; }
    std::string description() const override { return "Database references in source code"; }
    DiscoveryMethod method() const override { return DiscoveryMethod::CodeAnalysis; }
    std::optional<std::string> availability(const ScopeConfig& scope) const override;
    std::unique_ptr<ObservationStream> discover(const ScopeConfig& scope, const Deadline& deadline) override;
};

}
