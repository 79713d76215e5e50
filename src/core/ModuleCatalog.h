#pragma once
#include <vector>
#include "DiscoveryModule.h"
#include "Config.h"

namespace asset_scan {

// The standard five discovery modules, in a fixed order.
std::vector<ModulePtr> default_modules(const Config& cfg);

}
