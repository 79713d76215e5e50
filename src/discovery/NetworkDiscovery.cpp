#include "NetworkDiscovery.h"
#include "ConnectionStrings.h"
#include "../core/IdentityKey.h"
#include "../core/Utils.h"
#include "../core/Logging.h"
#include <sstream>
#include <set>
#include <algorithm>
#include <cstring>
#include <cstdint>
#include <cerrno>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <netdb.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace fs = std::filesystem;

namespace asset_scan {

namespace {

struct FdGuard {
    int fd;
    explicit FdGuard(int f) : fd(f) {}
    ~FdGuard(){ if(fd >= 0) ::close(fd); }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;
};

struct AddrInfoGuard {
    addrinfo* res = nullptr;
    ~AddrInfoGuard(){ if(res) freeaddrinfo(res); }
};

bool in_ranges(const std::vector<PortRange>& ranges, unsigned port){
    return std::any_of(ranges.begin(), ranges.end(), [&](const PortRange& r){ return r.contains(port); });
}

std::string decode_v4(const std::string& hex){
    unsigned long raw = std::stoul(hex, nullptr, 16);
    in_addr a{};
    a.s_addr = static_cast<uint32_t>(raw); // kernel prints the address in host byte order
    char buf[INET_ADDRSTRLEN] = {};
    inet_ntop(AF_INET, &a, buf, sizeof(buf));
    return buf;
}

std::string decode_v6(const std::string& hex){
    in6_addr a{};
    for(int w = 0; w < 4; ++w){
        uint32_t word = static_cast<uint32_t>(std::stoul(hex.substr(w * 8, 8), nullptr, 16));
        std::memcpy(&a.s6_addr[w * 4], &word, 4);
    }
    char buf[INET6_ADDRSTRLEN] = {};
    inet_ntop(AF_INET6, &a, buf, sizeof(buf));
    return buf;
}

class NetworkStream : public QueuedStream {
public:
    NetworkStream(ScopeConfig scope, Deadline deadline) : QueuedStream(std::move(deadline)), scope_(std::move(scope)) {}
protected:
    bool advance() override {
        if(phase_ == 0){ passive_table("tcp", false); phase_ = 1; return true; }
        if(phase_ == 1){ passive_table("tcp6", true); phase_ = 2; return true; }
        if(phase_ == 2){
            // One lookup per step so the deadline is checked between lookups.
            if(next_host_ < scope_.hosts.size()){
                const auto& host = scope_.hosts[next_host_++];
                if(auto target = resolve_host(host)) targets_.push_back(std::move(*target));
                else Logger::instance().debug("Could not resolve probe host: " + host);
                return true;
            }
            build_probes();
            phase_ = 3;
            return true;
        }
        if(next_probe_ >= probes_.size()) return false;
        const auto& probe = probes_[next_probe_++];
        const ResolvedHost& target = targets_[probe.first];
        int timeout = scope_.connect_timeout_ms;
        auto left = deadline().remaining().count();
        if(left < timeout) timeout = static_cast<int>(left);
        if(timeout <= 0) return true;
        if(tcp_probe(target, probe.second, timeout)){
            std::string locator = target.name + ":" + std::to_string(probe.second);
            if(target.name.find(':') != std::string::npos) locator = "[" + target.name + "]:" + std::to_string(probe.second);
            if(!seen_.insert(locator).second) return true;
            CandidateObservation obs = make(locator, probe.second, 0.75, "tcp_connect");
            emit(std::move(obs));
        }
        return true;
    }

private:
    void passive_table(const char* file, bool v6){
        auto lines = utils::read_lines((fs::path(scope_.proc_root) / "net" / file).string());
        for(const auto& s : parse_proc_net_tcp(lines, v6)){
            if(!in_ranges(scope_.ports, s.port)) continue;
            std::string locator = listen_locator(s);
            if(!seen_.insert(locator).second) continue;
            CandidateObservation obs = make(locator, s.port, 0.7, "proc_net_tcp");
            obs.attributes["listen_address"] = s.address;
            emit(std::move(obs));
        }
    }

    void build_probes(){
        for(size_t t = 0; t < targets_.size(); ++t){
            for(const auto& r : scope_.ports){
                for(unsigned p = r.first; p <= r.last; ++p) probes_.emplace_back(t, p);
            }
        }
    }

    static CandidateObservation make(const std::string& locator, unsigned port, double confidence, const char* source){
        CandidateObservation obs;
        obs.method = DiscoveryMethod::Network;
        obs.module = "network";
        obs.locator = locator;
        obs.method_confidence = confidence;
        obs.attributes[attr::Engine] = engine_for_port(port);
        obs.attributes["port"] = std::to_string(port);
        obs.attributes[attr::Source] = source;
        return obs;
    }

    ScopeConfig scope_;
    int phase_ = 0;
    std::vector<ResolvedHost> targets_;
    size_t next_host_ = 0;
    std::vector<std::pair<size_t, unsigned>> probes_;
    size_t next_probe_ = 0;
    std::set<std::string> seen_;
};

}

std::vector<ListenSocket> parse_proc_net_tcp(const std::vector<std::string>& lines, bool v6){
    std::vector<ListenSocket> out;
    for(size_t i = 1; i < lines.size(); ++i){ // skip header
        std::istringstream is(lines[i]);
        std::string sl, local, remote, state;
        if(!(is >> sl >> local >> remote >> state)) continue;
        if(state != "0A") continue; // TCP_LISTEN
        auto colon = local.find(':');
        if(colon == std::string::npos) continue;
        std::string addr_hex = local.substr(0, colon);
        if(addr_hex.size() != (v6 ? 32u : 8u)) continue;
        try {
            ListenSocket s;
            s.v6 = v6;
            s.port = static_cast<unsigned>(std::stoul(local.substr(colon + 1), nullptr, 16));
            s.address = v6 ? decode_v6(addr_hex) : decode_v4(addr_hex);
            out.push_back(std::move(s));
        } catch(const std::exception& ex){
            Logger::instance().debug(std::string("Unparsable socket table line: ") + ex.what());
        }
    }
    return out;
}

std::string listen_locator(const ListenSocket& s){
    std::string host = normalize_host(s.address);
    if(s.v6 && host != "localhost") return "[" + host + "]:" + std::to_string(s.port);
    return host + ":" + std::to_string(s.port);
}

std::optional<ResolvedHost> resolve_host(const std::string& host){
    if(host.empty()) return std::nullopt;
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    AddrInfoGuard ai;
    if(getaddrinfo(host.c_str(), nullptr, &hints, &ai.res) != 0 || !ai.res) return std::nullopt;
    if(ai.res->ai_addrlen > sizeof(sockaddr_storage)) return std::nullopt;
    ResolvedHost out;
    out.name = host;
    std::memcpy(&out.addr, ai.res->ai_addr, ai.res->ai_addrlen);
    out.addr_len = ai.res->ai_addrlen;
    return out;
}

bool tcp_probe(const ResolvedHost& target, unsigned port, int timeout_ms){
    sockaddr_storage addr = target.addr;
    if(addr.ss_family == AF_INET) reinterpret_cast<sockaddr_in*>(&addr)->sin_port = htons(static_cast<uint16_t>(port));
    else if(addr.ss_family == AF_INET6) reinterpret_cast<sockaddr_in6*>(&addr)->sin6_port = htons(static_cast<uint16_t>(port));
    else return false;
    FdGuard sock(::socket(addr.ss_family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0));
    if(sock.fd < 0) return false;
    int rc = ::connect(sock.fd, reinterpret_cast<const sockaddr*>(&addr), target.addr_len);
    if(rc == 0) return true;
    if(errno != EINPROGRESS) return false;
    pollfd pfd{sock.fd, POLLOUT, 0};
    if(::poll(&pfd, 1, timeout_ms) <= 0) return false;
    int err = 0;
    socklen_t len = sizeof(err);
    if(::getsockopt(sock.fd, SOL_SOCKET, SO_ERROR, &err, &len) != 0) return false;
    return err == 0;
}

bool tcp_probe(const std::string& host, unsigned port, int timeout_ms){
    auto target = resolve_host(host);
    return target && tcp_probe(*target, port, timeout_ms);
}

std::optional<std::string> NetworkDiscovery::availability(const ScopeConfig& scope) const {
    std::error_code ec;
    bool have_proc = fs::exists(fs::path(scope.proc_root) / "net" / "tcp", ec) || fs::exists(fs::path(scope.proc_root) / "net" / "tcp6", ec);
    if(!have_proc && scope.hosts.empty()) return std::string("no socket tables under " + scope.proc_root + "/net and no hosts to probe");
    if(scope.ports.empty()) return std::string("no ports configured");
    return std::nullopt;
}

std::unique_ptr<ObservationStream> NetworkDiscovery::discover(const ScopeConfig& scope, const Deadline& deadline){
    return std::make_unique<NetworkStream>(scope, deadline);
}

}
