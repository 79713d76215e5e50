#pragma once
#include "../core/DiscoveryModule.h"

namespace asset_scan {

// Database files found by extension and magic header, plus connection strings
// in configuration files.
class FilesystemDiscovery : public DiscoveryModule {
public:
    std::string name() const override { return "filesystem"; }
    std::string description() const override { return "Database files and configuration files under the scan paths"; }
    DiscoveryMethod method() const override { return DiscoveryMethod::Filesystem; }
    std::optional<std::string> availability(const ScopeConfig& scope) const override;
    std::unique_ptr<ObservationStream> discover(const ScopeConfig& scope, const Deadline& deadline) override;
};

enum class FileMagic { None, SQLite, DuckDB };
// Inspects the first bytes of a file.
FileMagic detect_magic(const std::string& path);

}
