#pragma once
#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include "Severity.h"

namespace asset_scan {

enum class GapKind { Orphaned, Documentation, Compliance };
enum class DocumentationIssue { Missing, Incomplete, Stale, Dangling };

const char* gap_kind_to_string(GapKind k);
const char* documentation_issue_to_string(DocumentationIssue i);

struct Gap {
    std::string gap_id;
    GapKind kind = GapKind::Orphaned;
    std::optional<std::string> asset_id;   // absent for systemic gaps
    std::chrono::system_clock::time_point detected_at{};
    std::vector<std::string> evidence;
    Severity severity = Severity::Medium;

    // Documentation gaps
    std::vector<DocumentationIssue> issues;
    std::string entry_key;                 // documentation entry involved, if any

    // Compliance gaps
    std::string framework;
    std::string rule_id;
    std::string violated_rule;             // rule description

    bool systemic() const { return !asset_id.has_value(); }
};

std::string orphaned_gap_id(const std::string& asset_id);
std::string documentation_gap_id(const std::string& asset_id);
std::string dangling_documentation_gap_id(const std::string& entry_key);
std::string compliance_gap_id(const std::string& framework, const std::string& rule_id, const std::string& asset_id);

}
