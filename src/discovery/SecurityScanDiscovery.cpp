#include "SecurityScanDiscovery.h"
#include "FileWalker.h"
#include "ConnectionStrings.h"
#include "../core/IdentityKey.h"
#include "../core/Utils.h"
#include <regex>
#include <map>
#include <set>
#include <algorithm>
#include <cctype>

namespace fs = std::filesystem;

namespace asset_scan {

namespace {

const std::vector<std::string> kTextExtensions = {
    ".env", ".ini", ".conf", ".cfg", ".yml", ".yaml", ".json", ".toml", ".properties", ".sh",
    ".py", ".js", ".ts", ".go", ".java", ".rb", ".rs", ".cpp", ".cc", ".h", ".hpp"
};

// PREFIX_HOST=..., PREFIX_PASSWORD=..., PREFIX_PORT=...
const std::regex& env_regex(){
    static const std::regex re(R"(^\s*(?:export\s+)?([A-Z][A-Z0-9]*)_(HOST|PASSWORD|PASS|PWD|PORT)\s*[=:]\s*["']?([^"'\s#]*))",
                               std::regex::optimize);
    return re;
}

unsigned default_port_for_prefix(const std::string& prefix){
    if(prefix.find("POSTGRES") != std::string::npos || prefix == "PG" || prefix == "DB") return 5432;
    if(prefix.find("MYSQL") != std::string::npos || prefix.find("MARIADB") != std::string::npos) return 3306;
    if(prefix.find("MONGO") != std::string::npos) return 27017;
    if(prefix.find("REDIS") != std::string::npos) return 6379;
    if(prefix.find("MSSQL") != std::string::npos) return 1433;
    return 0;
}

struct EnvGroup {
    std::string host, port, line;
    bool password = false;
};

class SecurityStream : public FileWalkStream {
public:
    using FileWalkStream::FileWalkStream;
protected:
    bool wants(const fs::path& p) const override {
        std::string name = p.filename().string();
        if(name == ".env" || utils::starts_with(name, ".env.")) return true;
        const auto& exts = scope().extensions.empty() ? kTextExtensions : scope().extensions;
        return std::find(exts.begin(), exts.end(), lower_extension(p)) != exts.end();
    }

    void inspect(const fs::path& p, std::uintmax_t) override {
        auto lines = read_text_lines(p);
        std::set<std::string> seen;
        std::map<std::string, EnvGroup> env;
        for(size_t i = 0; i < lines.size(); ++i){
            const std::string& line = lines[i];
            std::string where = p.string() + ":" + std::to_string(i + 1);
            for(const auto& m : find_connection_strings(line)){
                if(!m.has_password) continue;
                std::string locator = sanitize_locator(m.url);
                if(!seen.insert(locator).second) continue;
                CandidateObservation obs = make(locator, m.engine, "credential_url", where);
                if(m.tls_disabled) obs.attributes["tls_disabled"] = "true";
                emit(std::move(obs));
            }
            std::smatch em;
            if(std::regex_search(line, em, env_regex())){
                auto& g = env[em[1].str()];
                std::string kind = em[2].str();
                std::string value = em[3].str();
                if(kind == "HOST"){ g.host = value; if(g.line.empty()) g.line = where; }
                else if(kind == "PORT") g.port = value;
                else if(!is_placeholder(value)) g.password = true;
            }
        }
        for(const auto& kv : env){
            const EnvGroup& g = kv.second;
            if(!g.password || g.host.empty() || is_placeholder(g.host)) continue;
            unsigned port = 0;
            if(!g.port.empty() && std::all_of(g.port.begin(), g.port.end(), [](unsigned char c){ return std::isdigit(c) != 0; }) && g.port.size() <= 5) port = static_cast<unsigned>(std::stoul(g.port));
            if(!port) port = default_port_for_prefix(kv.first);
            std::string locator = port ? g.host + ":" + std::to_string(port) : g.host;
            if(!seen.insert(locator).second) continue;
            std::string engine = port ? engine_for_port(port) : std::string("unknown");
            emit(make(locator, engine, "credential_env", g.line.empty() ? p.string() : g.line));
        }
    }

private:
    static CandidateObservation make(const std::string& locator, const std::string& engine, const char* pattern, const std::string& where){
        CandidateObservation obs;
        obs.method = DiscoveryMethod::SecurityScan;
        obs.module = "security";
        obs.locator = locator;
        obs.method_confidence = 0.5;
        obs.attributes[attr::Engine] = engine;
        obs.attributes[attr::CredentialExposure] = "true";
        obs.attributes["finding"] = "hardcoded_credentials";
        obs.attributes[attr::Source] = std::string(pattern) + ":" + where;
        return obs;
    }
};

}

std::optional<std::string> SecurityScanDiscovery::availability(const ScopeConfig& scope) const {
    std::error_code ec;
    for(const auto& p : scope.paths){
        if(fs::exists(p, ec)) return std::nullopt;
    }
    return std::string("none of the scan paths exist");
}

std::unique_ptr<ObservationStream> SecurityScanDiscovery::discover(const ScopeConfig& scope, const Deadline& deadline){
    return std::make_unique<SecurityStream>(scope, deadline);
}

}
