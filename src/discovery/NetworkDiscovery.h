#pragma once
#include <string>
#include <vector>
#include <optional>
#include <sys/socket.h>
#include "../core/DiscoveryModule.h"

namespace asset_scan {

struct ListenSocket {
    std::string address;   // dotted quad or IPv6 text, no brackets
    unsigned port = 0;
    bool v6 = false;
};

// LISTEN entries of a /proc/net/tcp or tcp6 table.
std::vector<ListenSocket> parse_proc_net_tcp(const std::vector<std::string>& lines, bool v6);

// host:port locator for a listening socket; wildcard and loopback become localhost.
std::string listen_locator(const ListenSocket& s);

// Passive discovery from the kernel socket tables, optional active TCP probes.
class NetworkDiscovery : public DiscoveryModule {
public:
    std::string name() const override { return "network"; }
    std::string description() const override { return "Listening database ports and reachable database endpoints"; }
    DiscoveryMethod method() const override { return DiscoveryMethod::Network; }
    std::optional<std::string> availability(const ScopeConfig& scope) const override;
    std::unique_ptr<ObservationStream> discover(const ScopeConfig& scope, const Deadline& deadline) override;
};

// Probe target resolved once per run; the port is filled in per probe.
struct ResolvedHost {
    std::string name;
    sockaddr_storage addr{};
    socklen_t addr_len = 0;
};

// First address getaddrinfo returns for host; nullopt if it does not resolve.
std::optional<ResolvedHost> resolve_host(const std::string& host);

// Non-blocking connect bounded by timeout_ms; true when the port accepted.
bool tcp_probe(const ResolvedHost& target, unsigned port, int timeout_ms);
bool tcp_probe(const std::string& host, unsigned port, int timeout_ms);

}
