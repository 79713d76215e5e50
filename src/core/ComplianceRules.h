#pragma once
#include <string>
#include <vector>
#include "Asset.h"
#include "Severity.h"
#include "Report.h"

namespace asset_scan {

enum class PredicateKind {
    AttributePresent,
    AttributeEquals,
    AttributeNotEquals,
    AttributeIn,
    ConfidenceAtLeast,
    AssetTypeIn,
    Unknown
};

PredicateKind parse_predicate(const std::string& s);

// A requirement the asset must satisfy; an asset failing the predicate is non-compliant.
struct ComplianceRule {
    std::string id;
    std::string framework;               // gdpr | soc2 | nist
    PredicateKind predicate = PredicateKind::Unknown;
    std::string predicate_name;
    std::string field;
    std::string value;
    std::vector<std::string> values;     // value split on ',' for *_in predicates
    double threshold = 0.0;              // confidence_at_least
    std::vector<AssetType> applies_to;   // empty = every asset type
    Severity severity = Severity::Medium;
    std::string description;
    std::string source;
    size_t line = 0;

    bool applies(const DiscoveredAsset& asset) const;
};

enum class RuleOutcome { Pass, Fail, NotApplicable, Unsupported };

RuleOutcome evaluate_rule(const ComplianceRule& rule, const DiscoveredAsset& asset);

// Rules in file-name order, rule order within a file preserved.
class RuleSet {
public:
    bool add(ComplianceRule rule);   // false on duplicate id
    const std::vector<ComplianceRule>& rules() const { return rules_; }
    const ComplianceRule* find(const std::string& id) const;
    bool contains(const std::string& id) const { return find(id) != nullptr; }
    bool empty() const { return rules_.empty(); }

    static RuleSet parse(const std::vector<std::string>& lines, const std::string& source, std::vector<ValidationError>& errors);
    static RuleSet load(const std::string& path, std::vector<ValidationError>& errors);
private:
    // Validates and appends, recording a rejection otherwise.
    void parse_into(const std::vector<std::string>& lines, const std::string& source, std::vector<ValidationError>& errors);
    std::vector<ComplianceRule> rules_;
};

}
