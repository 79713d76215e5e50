#pragma once
#include <string>
#include "DiscoveryReport.h"
#include "Config.h"

namespace asset_scan {

// Serialises a DiscoveryReport. Object keys are emitted in sorted order so the
// same report always yields byte-identical output.
class JSONWriter {
public:
    std::string write(const DiscoveryReport& report, const Config& cfg) const;
};

}
