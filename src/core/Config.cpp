#include "Config.h"
#include "Utils.h"
#include <cstdlib>

namespace asset_scan {

ScopeConfig Config::scope_for(DiscoveryMethod method) const {
    ScopeConfig s;
    s.proc_root = proc_root;
    s.max_file_size = max_file_size_mb > 0 ? static_cast<std::uint64_t>(max_file_size_mb) * 1024ull * 1024ull : 0;
    s.connect_timeout_ms = connect_timeout_ms;
    s.exclude = exclude;
    switch(method){
        case DiscoveryMethod::Filesystem:
            s.paths = scan_paths;
            s.extensions = db_extensions;
            break;
        case DiscoveryMethod::CodeAnalysis:
            s.paths = code_paths;
            s.extensions = code_extensions;
            break;
        case DiscoveryMethod::Container:
            s.paths = compose_paths.empty() ? scan_paths : compose_paths;
            break;
        case DiscoveryMethod::Network:
            s.ports = ports;
            s.hosts = hosts;
            break;
        case DiscoveryMethod::SecurityScan:
            s.paths = scan_paths;
            for(const auto& c : code_paths){
                bool dup = false; for(const auto& p : s.paths) if(p==c) dup = true;
                if(!dup) s.paths.push_back(c);
            }
            s.exclude.insert(s.exclude.end(), credential_exclude.begin(), credential_exclude.end());
            break;
    }
    return s;
}

bool parse_port_ranges(const std::string& text, std::vector<PortRange>& out){
    std::vector<PortRange> parsed;
    for(const auto& tok : utils::split_csv(text)){
        auto dash = tok.find('-');
        std::string a = dash==std::string::npos ? tok : tok.substr(0, dash);
        std::string b = dash==std::string::npos ? tok : tok.substr(dash+1);
        char* end = nullptr;
        unsigned long lo = std::strtoul(a.c_str(), &end, 10); if(a.empty() || *end) return false;
        unsigned long hi = std::strtoul(b.c_str(), &end, 10); if(b.empty() || *end) return false;
        if(lo==0 || hi>65535 || lo>hi) return false;
        parsed.push_back(PortRange{static_cast<unsigned>(lo), static_cast<unsigned>(hi)});
    }
    if(parsed.empty()) return false;
    out = std::move(parsed);
    return true;
}

}
