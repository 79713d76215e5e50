#include "Gap.h"

namespace asset_scan {

const char* gap_kind_to_string(GapKind k){
    switch(k){
        case GapKind::Orphaned: return "orphaned";
        case GapKind::Documentation: return "documentation";
        case GapKind::Compliance: return "compliance";
    }
    return "unknown";
}

const char* documentation_issue_to_string(DocumentationIssue i){
    switch(i){
        case DocumentationIssue::Missing: return "missing";
        case DocumentationIssue::Incomplete: return "incomplete";
        case DocumentationIssue::Stale: return "stale";
        case DocumentationIssue::Dangling: return "dangling";
    }
    return "unknown";
}

std::string orphaned_gap_id(const std::string& asset_id){ return "orphaned:" + asset_id; }
std::string documentation_gap_id(const std::string& asset_id){ return "documentation:" + asset_id; }
std::string dangling_documentation_gap_id(const std::string& entry_key){ return "documentation:dangling:" + entry_key; }
std::string compliance_gap_id(const std::string& framework, const std::string& rule_id, const std::string& asset_id){
    return "compliance:" + framework + ":" + rule_id + ":" + asset_id;
}

}
