#include "IdentityKey.h"
#include "Utils.h"
#include <filesystem>
#include <cctype>
#include <cstdlib>
#include <algorithm>

namespace fs = std::filesystem;

namespace asset_scan {

namespace {

bool all_digits(const std::string& s){
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c); });
}

// Decimal port in 1..65535, or -1.
int parse_port(const std::string& s){
    if(!all_digits(s) || s.size() > 5) return -1;
    unsigned long v = std::strtoul(s.c_str(), nullptr, 10);
    return v >= 1 && v <= 65535 ? static_cast<int>(v) : -1;
}

int default_port(const std::string& scheme){
    if(scheme == "postgresql" || scheme == "postgres") return 5432;
    if(scheme == "mysql" || scheme == "mariadb") return 3306;
    if(scheme == "mssql" || scheme == "sqlserver") return 1433;
    if(scheme == "mongodb") return 27017;
    if(scheme == "redis") return 6379;
    if(scheme == "http") return 80;
    if(scheme == "https") return 443;
    return 0;
}

std::string file_key(const std::string& raw){
    std::string p = raw;
    while(p.size() > 1 && p[0] == '/' && p[1] == '/') p.erase(0, 1);
    if(!p.empty() && p[0] == '~'){
        const char* home = std::getenv("HOME");
        if(home) p = std::string(home) + p.substr(1);
    }
    fs::path path(p);
    if(path.is_relative()){
        std::error_code ec;
        fs::path abs = fs::absolute(path, ec);
        if(!ec) path = abs;
    }
    std::string out = path.lexically_normal().string();
    while(out.size() > 1 && out.back() == '/') out.pop_back();
    return "file:" + out;
}

std::string net_key(const std::string& host, int port){
    std::string h = normalize_host(host);
    if(port <= 0) return "net:" + h;
    return "net:" + h + ":" + std::to_string(port);
}

// host[:port] or [v6]:port
bool split_host_port(const std::string& hp, std::string& host, std::string& port){
    if(!hp.empty() && hp[0] == '['){
        auto close = hp.find(']');
        if(close == std::string::npos) return false;
        host = hp.substr(0, close + 1);
        if(close + 1 < hp.size()){
            if(hp[close + 1] != ':') return false;
            port = hp.substr(close + 2);
        }
        return true;
    }
    auto colon = hp.rfind(':');
    if(colon == std::string::npos){ host = hp; return true; }
    host = hp.substr(0, colon);
    port = hp.substr(colon + 1);
    return true;
}

bool looks_like_path(const std::string& s){
    if(s.empty()) return false;
    if(s[0] == '/' || s[0] == '~' || utils::starts_with(s, "./") || utils::starts_with(s, "../")) return true;
    return s.find('/') != std::string::npos && s.find(':') == std::string::npos;
}

}

std::string normalize_host(const std::string& host){
    std::string h = utils::to_lower(utils::trim(host));
    if(h == "[::]" || h == "[::1]" || h == "::1" || h == "::" || h == "localhost" || h == "127.0.0.1" || h == "0.0.0.0") return "localhost";
    if(h.size() > 2 && h.front() == '[' && h.back() == ']') h = h.substr(1, h.size() - 2);
    return h;
}

namespace {

std::string resolve_identity(const std::string& locator, std::string* problem){
    std::string loc = utils::trim(locator);
    if(utils::starts_with(loc, "container:")) return loc;

    auto sep = loc.find("://");
    if(sep != std::string::npos){
        std::string scheme = utils::to_lower(loc.substr(0, sep));
        auto plus = scheme.find('+');
        if(plus != std::string::npos) scheme = scheme.substr(0, plus);
        std::string rest = loc.substr(sep + 3);
        if(scheme == "sqlite" || scheme == "duckdb" || scheme == "file"){
            auto q = rest.find('?');
            if(q != std::string::npos) rest = rest.substr(0, q);
            // sqlite:///rel.db is relative, sqlite:////abs.db absolute; file:///abs is absolute.
            if(scheme != "file" && !rest.empty() && rest[0] == '/') rest.erase(0, 1);
            if(rest.empty() || rest == "/" || rest == ":memory:") return "other:" + utils::to_lower(loc);
            return file_key(rest);
        }
        auto end = rest.find_first_of("/?");
        std::string authority = end == std::string::npos ? rest : rest.substr(0, end);
        auto at = authority.rfind('@');
        if(at != std::string::npos) authority = authority.substr(at + 1);
        // Multi-host URLs: the first host identifies the asset.
        auto comma = authority.find(',');
        if(comma != std::string::npos) authority = authority.substr(0, comma);
        std::string host, port;
        if(authority.empty() || !split_host_port(authority, host, port)){
            if(problem) *problem = "malformed host in " + sanitize_locator(loc);
            return "other:" + utils::to_lower(loc);
        }
        int p = port.empty() ? default_port(scheme) : parse_port(port);
        if(p < 0){
            if(problem) *problem = "invalid port '" + port + "' in " + sanitize_locator(loc);
            return "other:" + utils::to_lower(loc);
        }
        return net_key(host, p);
    }

    if(looks_like_path(loc)) return file_key(loc);

    std::string host, port;
    if(split_host_port(loc, host, port) && !host.empty()){
        int p = parse_port(port);
        if(p > 0) return net_key(host, p);
    }
    return "other:" + utils::to_lower(loc);
}

}

std::string identity_key(const std::string& locator){
    return resolve_identity(locator, nullptr);
}

std::optional<std::string> locator_problem(const std::string& locator){
    std::string problem;
    resolve_identity(locator, &problem);
    if(problem.empty()) return std::nullopt;
    return problem;
}

int key_specificity(const std::string& key){
    if(utils::starts_with(key, "file:")) return 0;
    if(utils::starts_with(key, "net:")) return 1;
    if(utils::starts_with(key, "container:")) return 2;
    return 3;
}

std::string sanitize_locator(const std::string& locator){
    auto sep = locator.find("://");
    if(sep == std::string::npos) return locator;
    auto auth_start = sep + 3;
    auto auth_end = locator.find_first_of("/?", auth_start);
    if(auth_end == std::string::npos) auth_end = locator.size();
    auto at = locator.rfind('@', auth_end);
    if(at == std::string::npos || at < auth_start) return locator;
    std::string userinfo = locator.substr(auth_start, at - auth_start);
    auto colon = userinfo.find(':');
    if(colon == std::string::npos) return locator;
    return locator.substr(0, auth_start) + userinfo.substr(0, colon) + ":***" + locator.substr(at);
}

}
