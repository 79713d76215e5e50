#include "Reconciler.h"
#include "IdentityKey.h"
#include "Utils.h"
#include <algorithm>
#include <filesystem>
#include <map>
#include <set>

namespace asset_scan {

namespace {

class UnionFind {
public:
    const std::string& find(const std::string& k){
        auto it = parent_.find(k);
        if(it == parent_.end()) it = parent_.emplace(k, k).first;
        if(it->second == k) return it->first;
        std::string root = find(it->second);
        it->second = root;
        return parent_.find(root)->first;
    }
    void unite(const std::string& a, const std::string& b){
        std::string ra = find(a), rb = find(b);
        if(ra == rb) return;
        // Smaller key becomes the root so grouping is order independent.
        if(rb < ra) std::swap(ra, rb);
        parent_[rb] = ra;
    }
    std::vector<std::string> keys() const {
        std::vector<std::string> out;
        for(const auto& kv : parent_) out.push_back(kv.first);
        return out;
    }
private:
    std::map<std::string, std::string> parent_;
};

struct Group {
    std::vector<const CandidateObservation*> observations;
    std::set<std::string> keys;
    std::set<std::string> locators;
};

}

double combine_confidence(const std::vector<double>& confidences){
    double miss = 1.0;
    for(double c : confidences){
        c = std::min(1.0, std::max(0.0, c));
        miss *= (1.0 - c);
    }
    return std::min(1.0, std::max(0.0, 1.0 - miss));
}

std::string Reconciler::make_asset_id(const std::vector<std::string>& identity_keys){
    if(identity_keys.empty()) return {};
    auto best = std::min_element(identity_keys.begin(), identity_keys.end(), [](const std::string& a, const std::string& b){
        int sa = key_specificity(a), sb = key_specificity(b);
        if(sa != sb) return sa < sb;
        return a < b;
    });
    return "asset-" + utils::sha256_hex(*best).substr(0, 16);
}

std::vector<DiscoveredAsset> Reconciler::reconcile(const std::vector<CandidateObservation>& observations, Report* journal) const {
    UnionFind uf;
    std::vector<std::string> primary;
    primary.reserve(observations.size());
    for(const auto& obs : observations){
        std::string key = identity_key(obs.locator);
        uf.find(key);
        for(const auto& link : obs.links) uf.unite(key, identity_key(link));
        primary.push_back(std::move(key));
    }

    std::map<std::string, Group> groups;
    for(const auto& key : uf.keys()){
        groups[uf.find(key)].keys.insert(key);
    }
    for(size_t i = 0; i < observations.size(); ++i){
        auto& g = groups[uf.find(primary[i])];
        g.observations.push_back(&observations[i]);
        g.locators.insert(observations[i].locator);
        for(const auto& link : observations[i].links) g.locators.insert(link);
    }

    std::vector<DiscoveredAsset> assets;
    for(auto& entry : groups){
        Group& g = entry.second;
        if(g.observations.empty()) continue;
        DiscoveredAsset a;
        a.identity_keys.assign(g.keys.begin(), g.keys.end());
        a.locators.assign(g.locators.begin(), g.locators.end());
        a.asset_id = make_asset_id(a.identity_keys);
        a.observation_count = g.observations.size();

        std::vector<double> confidences;
        std::set<std::string> method_names;
        for(const auto* o : g.observations){
            confidences.push_back(o->method_confidence);
            method_names.insert(method_to_string(o->method));
        }
        a.confidence_score = combine_confidence(confidences);
        a.confidence_level = confidence_level_for(a.confidence_score);
        for(const auto& name : method_names){
            DiscoveryMethod m;
            if(parse_method(name, m)) a.supporting_methods.push_back(m);
        }

        // Higher confidence wins; on a tie the lexicographically first method wins.
        std::vector<const CandidateObservation*> ordered = g.observations;
        std::sort(ordered.begin(), ordered.end(), [](const CandidateObservation* x, const CandidateObservation* y){
            if(x->method_confidence != y->method_confidence) return x->method_confidence < y->method_confidence;
            std::string mx = method_to_string(x->method), my = method_to_string(y->method);
            if(mx != my) return mx > my;
            return observation_less(*y, *x);
        });
        for(const auto* o : ordered){
            for(const auto& kv : o->attributes){
                auto it = a.attributes.find(kv.first);
                if(it != a.attributes.end() && it->second != kv.second && kv.first != attr::Source && kv.first != attr::Engine && journal){
                    journal->add_warning(a.asset_id, WarnCode::ReconciliationConflict,
                        "attribute '" + kv.first + "': '" + it->second + "' replaced by '" + kv.second + "' from " + method_to_string(o->method));
                }
                a.attributes[kv.first] = kv.second;
            }
        }

        std::map<AssetType, size_t> votes;
        std::map<AssetType, int> best_precedence;
        for(const auto* o : g.observations){
            auto it = o->attributes.find(attr::Engine);
            if(it == o->attributes.end() || it->second.empty() || it->second == "unknown") continue;
            AssetType t = parse_asset_type(it->second);
            ++votes[t];
            int p = method_precedence(o->method);
            auto bp = best_precedence.find(t);
            if(bp == best_precedence.end() || p < bp->second) best_precedence[t] = p;
        }
        if(!votes.empty()){
            auto winner = votes.begin();
            for(auto it = votes.begin(); it != votes.end(); ++it){
                if(it->second > winner->second ||
                   (it->second == winner->second && best_precedence[it->first] < best_precedence[winner->first])) winner = it;
            }
            a.asset_type = winner->first;
            // The engine attribute follows the vote, taken from the most confident voter.
            for(auto it = ordered.rbegin(); it != ordered.rend(); ++it){
                auto e = (*it)->attributes.find(attr::Engine);
                if(e == (*it)->attributes.end() || e->second.empty() || e->second == "unknown") continue;
                if(parse_asset_type(e->second) != a.asset_type) continue;
                a.attributes[attr::Engine] = e->second;
                break;
            }
            if(votes.size() > 1 && journal){
                std::string detail = "engine votes:";
                for(const auto& v : votes) detail += std::string(" ") + asset_type_to_string(v.first) + "=" + std::to_string(v.second);
                detail += std::string(", chose ") + asset_type_to_string(a.asset_type);
                journal->add_warning(a.asset_id, WarnCode::ReconciliationConflict, detail);
            }
        }
        assets.push_back(std::move(a));
    }
    std::sort(assets.begin(), assets.end(), [](const DiscoveredAsset& x, const DiscoveredAsset& y){ return x.asset_id < y.asset_id; });
    return assets;
}

size_t validate_assets(std::vector<DiscoveredAsset>& assets){
    size_t passed = 0;
    for(auto& a : assets){
        a.validation_errors.clear();
        std::string engine = a.attribute(attr::Engine);
        if(a.asset_type == AssetType::Other && (engine.empty() || engine == "unknown")){
            a.validation_errors.push_back("unknown database type");
        }
        bool resolvable = std::any_of(a.identity_keys.begin(), a.identity_keys.end(),
                                      [](const std::string& k){ return !utils::starts_with(k, "other:"); });
        if(!resolvable) a.validation_errors.push_back("no connection information");
        for(const auto& key : a.identity_keys){
            if(!utils::starts_with(key, "file:")) continue;
            std::error_code ec;
            std::string path = key.substr(5);
            if(!std::filesystem::exists(path, ec)) a.validation_errors.push_back("file no longer exists: " + path);
        }
        a.validated = a.validation_errors.empty();
        if(a.validated) ++passed;
    }
    return passed;
}

}
