#include "ModuleCatalog.h"
#include "../discovery/ContainerDiscovery.h"
#include "../discovery/NetworkDiscovery.h"
#include "../discovery/FilesystemDiscovery.h"
#include "../discovery/CodeDiscovery.h"
#include "../discovery/SecurityScanDiscovery.h"

namespace asset_scan {

std::vector<ModulePtr> default_modules(const Config& cfg){
    (void)cfg;
    return {
        std::make_shared<ContainerDiscovery>(),
        std::make_shared<NetworkDiscovery>(),
        std::make_shared<FilesystemDiscovery>(),
        std::make_shared<CodeDiscovery>(),
        std::make_shared<SecurityScanDiscovery>(),
    };
}

}
