#include "ComplianceRules.h"
#include "Utils.h"
#include "Logging.h"
#include <algorithm>

namespace asset_scan {

PredicateKind parse_predicate(const std::string& s){
    std::string v = utils::to_lower(utils::trim(s));
    if(v == "attribute_present") return PredicateKind::AttributePresent;
    if(v == "attribute_equals") return PredicateKind::AttributeEquals;
    if(v == "attribute_not_equals") return PredicateKind::AttributeNotEquals;
    if(v == "attribute_in") return PredicateKind::AttributeIn;
    if(v == "confidence_at_least") return PredicateKind::ConfidenceAtLeast;
    if(v == "asset_type_in") return PredicateKind::AssetTypeIn;
    return PredicateKind::Unknown;
}

bool ComplianceRule::applies(const DiscoveredAsset& asset) const {
    if(applies_to.empty()) return true;
    return std::find(applies_to.begin(), applies_to.end(), asset.asset_type) != applies_to.end();
}

RuleOutcome evaluate_rule(const ComplianceRule& rule, const DiscoveredAsset& asset){
    if(!rule.applies(asset)) return RuleOutcome::NotApplicable;
    auto it = asset.attributes.find(rule.field);
    bool present = it != asset.attributes.end() && !it->second.empty();
    bool ok = false;
    switch(rule.predicate){
        case PredicateKind::AttributePresent:
            ok = present;
            break;
        case PredicateKind::AttributeEquals:
            ok = present && utils::to_lower(it->second) == utils::to_lower(rule.value);
            break;
        case PredicateKind::AttributeNotEquals:
            ok = !present || utils::to_lower(it->second) != utils::to_lower(rule.value);
            break;
        case PredicateKind::AttributeIn:
            ok = present && std::find(rule.values.begin(), rule.values.end(), utils::to_lower(it->second)) != rule.values.end();
            break;
        case PredicateKind::ConfidenceAtLeast:
            ok = asset.confidence_score >= rule.threshold;
            break;
        case PredicateKind::AssetTypeIn:
            ok = std::find(rule.values.begin(), rule.values.end(), asset_type_to_string(asset.asset_type)) != rule.values.end();
            break;
        case PredicateKind::Unknown:
            return RuleOutcome::Unsupported;
    }
    return ok ? RuleOutcome::Pass : RuleOutcome::Fail;
}

bool RuleSet::add(ComplianceRule rule){
    if(contains(rule.id)) return false;
    rules_.push_back(std::move(rule));
    return true;
}

const ComplianceRule* RuleSet::find(const std::string& id) const {
    for(const auto& r : rules_) if(r.id == id) return &r;
    return nullptr;
}

void RuleSet::parse_into(const std::vector<std::string>& lines, const std::string& source, std::vector<ValidationError>& errors){
    auto reject = [&](const utils::KeyValueBlock& b, const std::string& why){
        Logger::instance().warn("Rejected rule at " + b.source + ":" + std::to_string(b.line) + ": " + why);
        errors.push_back({b.source, b.line, WarnCode::InvalidRuleDefinition, why});
    };
    for(const auto& block : utils::parse_kv_blocks(lines, "id", source)){
        if(!block.malformed.empty()){ reject(block, "malformed line: " + block.malformed.front()); continue; }
        auto get = [&](const char* k){ auto it = block.values.find(k); return it == block.values.end() ? std::string() : it->second; };
        ComplianceRule r;
        r.source = block.source;
        r.line = block.line;
        r.id = get("id");
        if(r.id.empty()){ reject(block, "empty rule id"); continue; }
        std::string version = get("rule_version");
        if(!version.empty() && version != "1"){ reject(block, "unsupported rule_version " + version); continue; }
        r.framework = utils::to_lower(get("framework"));
        if(r.framework != "gdpr" && r.framework != "soc2" && r.framework != "nist"){
            reject(block, "rule " + r.id + ": unknown framework '" + get("framework") + "'");
            continue;
        }
        r.predicate_name = utils::to_lower(get("predicate"));
        if(r.predicate_name.empty()){ reject(block, "rule " + r.id + ": missing predicate"); continue; }
        r.predicate = parse_predicate(r.predicate_name);
        r.field = get("field");
        r.value = get("value");
        r.description = get("description");
        bool attribute_kind = r.predicate == PredicateKind::AttributePresent || r.predicate == PredicateKind::AttributeEquals ||
                              r.predicate == PredicateKind::AttributeNotEquals || r.predicate == PredicateKind::AttributeIn;
        if(attribute_kind && r.field.empty()){ reject(block, "rule " + r.id + ": predicate " + r.predicate_name + " requires field"); continue; }
        bool needs_value = r.predicate != PredicateKind::AttributePresent && r.predicate != PredicateKind::Unknown;
        if(needs_value && r.value.empty()){ reject(block, "rule " + r.id + ": predicate " + r.predicate_name + " requires value"); continue; }
        if(r.predicate == PredicateKind::ConfidenceAtLeast){
            try {
                size_t pos = 0;
                r.threshold = std::stod(r.value, &pos);
                if(pos != r.value.size() || r.threshold < 0.0 || r.threshold > 1.0) throw std::invalid_argument(r.value);
            } catch(const std::exception&){
                reject(block, "rule " + r.id + ": confidence threshold must be in [0,1]");
                continue;
            }
        }
        for(const auto& v : utils::split_csv(r.value)) r.values.push_back(utils::to_lower(v));
        bool bad_type = false;
        if(r.predicate == PredicateKind::AssetTypeIn){
            for(const auto& v : r.values){
                if(v != "other" && parse_asset_type(v) == AssetType::Other){ reject(block, "rule " + r.id + ": unknown asset type '" + v + "'"); bad_type = true; break; }
            }
            if(bad_type) continue;
            for(auto& v : r.values) v = asset_type_to_string(parse_asset_type(v));
        }
        for(const auto& t : utils::split_csv(get("applies_to"))){
            std::string lt = utils::to_lower(t);
            if(lt != "other" && parse_asset_type(lt) == AssetType::Other){ reject(block, "rule " + r.id + ": unknown applies_to type '" + t + "'"); bad_type = true; break; }
            r.applies_to.push_back(parse_asset_type(lt));
        }
        if(bad_type) continue;
        std::string sev = get("severity");
        if(!sev.empty() && !parse_severity(sev, r.severity)){ reject(block, "rule " + r.id + ": invalid severity '" + sev + "'"); continue; }
        std::string id = r.id;
        if(!add(std::move(r))){ reject(block, "duplicate rule id " + id); continue; }
    }
}

RuleSet RuleSet::parse(const std::vector<std::string>& lines, const std::string& source, std::vector<ValidationError>& errors){
    RuleSet rs;
    rs.parse_into(lines, source, errors);
    return rs;
}

RuleSet RuleSet::load(const std::string& path, std::vector<ValidationError>& errors){
    RuleSet rs;
    for(const auto& file : utils::list_input_files(path, ".rule")){
        rs.parse_into(utils::read_lines(file), file, errors);
    }
    Logger::instance().debug("Loaded " + std::to_string(rs.rules_.size()) + " compliance rules from " + path);
    return rs;
}

}
