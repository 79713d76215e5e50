#pragma once
#include <string>
#include <vector>
#include <map>
#include "../core/DiscoveryModule.h"

namespace asset_scan {

// One service from a compose file, reduced to what discovery needs.
struct ComposeService {
    std::string name;
    std::string container_name;
    std::string image;
    std::vector<std::string> ports;     // raw entries, e.g. "127.0.0.1:5433:5432"
    std::vector<std::string> volumes;   // raw entries, e.g. "pgdata:/var/lib/postgresql/data"
    std::map<std::string, std::string> labels;
};

// Indentation-based reader for the services section of docker-compose files.
std::vector<ComposeService> parse_compose(const std::vector<std::string>& lines);

// Published host port of a compose port entry, 0 when none.
unsigned published_port(const std::string& entry);

// Engine name for a container image reference, empty when not a database image.
std::string engine_for_image(const std::string& image);

// Container id from /proc/<pid>/cgroup contents, empty when not containerised.
std::string container_id_from_cgroup(const std::vector<std::string>& cgroup_lines);

class ContainerDiscovery : public DiscoveryModule {
public:
    std::string name() const override { return "containers"; }
    std::string description() const override { return "Database services in compose files and containerised database processes"; }
    DiscoveryMethod method() const override { return DiscoveryMethod::Container; }
    std::optional<std::string> availability(const ScopeConfig& scope) const override;
    std::unique_ptr<ObservationStream> discover(const ScopeConfig& scope, const Deadline& deadline) override;
};

}
