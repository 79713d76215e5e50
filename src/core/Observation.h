#pragma once
#include <string>
#include <vector>
#include <map>
#include <cstddef>

namespace asset_scan {

enum class DiscoveryMethod { Container, Network, Filesystem, CodeAnalysis, SecurityScan };
enum class AssetType { PostgreSQL, SQLite, DuckDB, FileStorage, Other };
enum class ConfidenceLevel { VeryLow, Low, Medium, High };

const char* method_to_string(DiscoveryMethod m);
bool parse_method(const std::string& s, DiscoveryMethod& out);
const char* asset_type_to_string(AssetType t);
// Unrecognised engine names map to Other.
AssetType parse_asset_type(const std::string& s);
const char* confidence_level_to_string(ConfidenceLevel l);
ConfidenceLevel confidence_level_for(double score);

// Lower value = more authoritative; used to break asset_type ties.
int method_precedence(DiscoveryMethod m);

// Well-known attribute keys shared by modules and the gap engine.
namespace attr {
inline constexpr const char* Engine = "engine";
inline constexpr const char* Owner = "owner";
inline constexpr const char* Criticality = "criticality";
inline constexpr const char* Source = "source";
inline constexpr const char* Version = "version";
inline constexpr const char* Database = "database";
inline constexpr const char* CredentialExposure = "credential_exposure";
}

struct CandidateObservation {
    DiscoveryMethod method = DiscoveryMethod::Filesystem;
    std::string module;   // producing module name
    std::string locator;
    std::vector<std::string> links; // locators explicitly asserted to be the same asset
    std::map<std::string, std::string> attributes;
    double method_confidence = 0.0;

    // Approximate heap footprint, used for the run memory ceiling.
    size_t approx_bytes() const;
};

// Total order used before reconciliation: (locator, method) first.
bool observation_less(const CandidateObservation& a, const CandidateObservation& b);

}
