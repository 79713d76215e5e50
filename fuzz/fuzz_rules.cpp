#include "core/ComplianceRules.h"
#include "core/DocumentationIndex.h"
#include <cstdint>
#include <cstddef>
#include <sstream>
#include <vector>
#include <string>

// Feeds the same bytes to the rule and documentation block parsers.
// Seed inputs live in fuzz/corpus/fuzz_rules.
extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    std::string input(reinterpret_cast<const char*>(data), size);
    std::vector<std::string> lines;
    std::istringstream in(input);
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);

    std::vector<asset_scan::ValidationError> errors;
    auto rules = asset_scan::RuleSet::parse(lines, "fuzz.rule", errors);
    auto docs = asset_scan::DocumentationIndex::parse(lines, "fuzz.doc", errors);
    (void)rules.rules().size();
    (void)docs.entries().size();
    return 0;
}
