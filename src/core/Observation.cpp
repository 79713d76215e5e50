#include "Observation.h"
#include "Utils.h"
#include <tuple>

namespace asset_scan {

const char* method_to_string(DiscoveryMethod m){
    switch(m){
        case DiscoveryMethod::Container: return "container";
        case DiscoveryMethod::Network: return "network";
        case DiscoveryMethod::Filesystem: return "filesystem";
        case DiscoveryMethod::CodeAnalysis: return "code_analysis";
        case DiscoveryMethod::SecurityScan: return "security_scan";
    }
    return "filesystem";
}

bool parse_method(const std::string& s, DiscoveryMethod& out){
    std::string v = utils::to_lower(utils::trim(s));
    if(v=="container") { out = DiscoveryMethod::Container; return true; }
    if(v=="network") { out = DiscoveryMethod::Network; return true; }
    if(v=="filesystem") { out = DiscoveryMethod::Filesystem; return true; }
    if(v=="code_analysis") { out = DiscoveryMethod::CodeAnalysis; return true; }
    if(v=="security_scan") { out = DiscoveryMethod::SecurityScan; return true; }
    return false;
}

const char* asset_type_to_string(AssetType t){
    switch(t){
        case AssetType::PostgreSQL: return "postgresql";
        case AssetType::SQLite: return "sqlite";
        case AssetType::DuckDB: return "duckdb";
        case AssetType::FileStorage: return "file_storage";
        case AssetType::Other: return "other";
    }
    return "other";
}

AssetType parse_asset_type(const std::string& s){
    std::string v = utils::to_lower(utils::trim(s));
    if(v=="postgresql" || v=="postgres") return AssetType::PostgreSQL;
    if(v=="sqlite" || v=="sqlite3") return AssetType::SQLite;
    if(v=="duckdb") return AssetType::DuckDB;
    if(v=="file_storage") return AssetType::FileStorage;
    return AssetType::Other;
}

const char* confidence_level_to_string(ConfidenceLevel l){
    switch(l){
        case ConfidenceLevel::High: return "high";
        case ConfidenceLevel::Medium: return "medium";
        case ConfidenceLevel::Low: return "low";
        case ConfidenceLevel::VeryLow: return "very_low";
    }
    return "very_low";
}

ConfidenceLevel confidence_level_for(double score){
    if(score >= 0.9) return ConfidenceLevel::High;
    if(score >= 0.7) return ConfidenceLevel::Medium;
    if(score >= 0.5) return ConfidenceLevel::Low;
    return ConfidenceLevel::VeryLow;
}

int method_precedence(DiscoveryMethod m){
    switch(m){
        case DiscoveryMethod::CodeAnalysis: return 0;
        case DiscoveryMethod::Container: return 1;
        case DiscoveryMethod::Filesystem: return 2;
        case DiscoveryMethod::Network: return 3;
        case DiscoveryMethod::SecurityScan: return 4;
    }
    return 5;
}

size_t CandidateObservation::approx_bytes() const {
    size_t n = sizeof(CandidateObservation) + module.size() + locator.size();
    for(const auto& l : links) n += sizeof(std::string) + l.size();
    for(const auto& kv : attributes) n += 2*sizeof(std::string) + kv.first.size() + kv.second.size() + 32;
    return n;
}

bool observation_less(const CandidateObservation& a, const CandidateObservation& b){
    const char* am = method_to_string(a.method);
    const char* bm = method_to_string(b.method);
    int lc = a.locator.compare(b.locator);
    if(lc != 0) return lc < 0;
    int mc = std::string(am).compare(bm);
    if(mc != 0) return mc < 0;
    return std::tie(a.module, a.method_confidence, a.links, a.attributes) < std::tie(b.module, b.method_confidence, b.links, b.attributes);
}

}
