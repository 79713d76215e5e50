#pragma once
#include <string>
#include <vector>
#include <chrono>
#include "Asset.h"
#include "Report.h"

namespace asset_scan {

struct DocumentationEntry {
    std::string key;            // asset id, locator or anything identity_key() accepts
    std::string identity;       // identity_key(key)
    double completeness_score = 0.0;
    std::chrono::system_clock::time_point last_updated{};
    std::string owner;
    std::string source;
    size_t line = 0;
};

// Documentation supplied by the caller, keyed by asset id or locator.
class DocumentationIndex {
public:
    void add(DocumentationEntry entry);
    const std::vector<DocumentationEntry>& entries() const { return entries_; }
    bool empty() const { return entries_.empty(); }

    // First entry matching the asset id, any locator or any identity key.
    const DocumentationEntry* find(const DiscoveredAsset& asset) const;
    static bool matches(const DocumentationEntry& entry, const DiscoveredAsset& asset);

    // .doc block files; malformed entries are appended to errors and skipped.
    static DocumentationIndex parse(const std::vector<std::string>& lines, const std::string& source, std::vector<ValidationError>& errors);
    static DocumentationIndex load(const std::string& path, std::vector<ValidationError>& errors);
private:
    std::vector<DocumentationEntry> entries_;
};

}
