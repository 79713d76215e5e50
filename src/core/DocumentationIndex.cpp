#include "DocumentationIndex.h"
#include "IdentityKey.h"
#include "Utils.h"
#include "Logging.h"
#include <algorithm>

namespace asset_scan {

namespace {

bool parse_score(const std::string& text, double& out){
    try {
        size_t pos = 0;
        double v = std::stod(text, &pos);
        if(pos != text.size()) return false;
        if(v < 0.0 || v > 1.0) return false;
        out = v;
        return true;
    } catch(const std::exception&){
        return false;
    }
}

}

void DocumentationIndex::add(DocumentationEntry entry){
    if(entry.identity.empty()) entry.identity = identity_key(entry.key);
    entries_.push_back(std::move(entry));
}

bool DocumentationIndex::matches(const DocumentationEntry& entry, const DiscoveredAsset& asset){
    if(entry.key == asset.asset_id) return true;
    if(std::find(asset.locators.begin(), asset.locators.end(), entry.key) != asset.locators.end()) return true;
    return std::binary_search(asset.identity_keys.begin(), asset.identity_keys.end(), entry.identity);
}

const DocumentationEntry* DocumentationIndex::find(const DiscoveredAsset& asset) const {
    for(const auto& e : entries_){
        if(matches(e, asset)) return &e;
    }
    return nullptr;
}

DocumentationIndex DocumentationIndex::parse(const std::vector<std::string>& lines, const std::string& source, std::vector<ValidationError>& errors){
    DocumentationIndex idx;
    auto reject = [&](const utils::KeyValueBlock& b, const std::string& why){
        Logger::instance().warn("Rejected documentation entry at " + b.source + ":" + std::to_string(b.line) + ": " + why);
        errors.push_back({b.source, b.line, WarnCode::InvalidDocumentationEntry, why});
    };
    for(const auto& block : utils::parse_kv_blocks(lines, "asset", source)){
        if(!block.malformed.empty()){ reject(block, "malformed line: " + block.malformed.front()); continue; }
        DocumentationEntry e;
        e.source = block.source;
        e.line = block.line;
        auto get = [&](const char* k){ auto it = block.values.find(k); return it == block.values.end() ? std::string() : it->second; };
        e.key = get("asset");
        if(e.key.empty()){ reject(block, "empty asset key"); continue; }
        if(auto problem = locator_problem(e.key)){ reject(block, *problem); continue; }
        std::string completeness = get("completeness");
        if(completeness.empty()){ reject(block, "missing completeness"); continue; }
        if(!parse_score(completeness, e.completeness_score)){ reject(block, "completeness must be a number in [0,1]: " + completeness); continue; }
        std::string updated = get("last_updated");
        if(updated.empty()){ reject(block, "missing last_updated"); continue; }
        auto tp = utils::parse_iso8601(updated);
        if(!tp){ reject(block, "invalid last_updated: " + updated); continue; }
        e.last_updated = *tp;
        e.owner = get("owner");
        idx.add(std::move(e));
    }
    return idx;
}

DocumentationIndex DocumentationIndex::load(const std::string& path, std::vector<ValidationError>& errors){
    DocumentationIndex idx;
    for(const auto& file : utils::list_input_files(path, ".doc")){
        auto part = parse(utils::read_lines(file), file, errors);
        for(auto& e : part.entries_) idx.add(std::move(e));
    }
    Logger::instance().debug("Loaded " + std::to_string(idx.entries_.size()) + " documentation entries from " + path);
    return idx;
}

}
