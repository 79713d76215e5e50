#include "ConnectionStrings.h"
#include "../core/Utils.h"
#include <regex>

namespace fs = std::filesystem;

namespace asset_scan {

namespace {

const std::regex& url_regex(){
    static const std::regex re(R"(\b(postgres(?:ql)?|mysql|mariadb|mongodb|redis|mssql|sqlserver|sqlite|duckdb)(\+[a-z0-9_]+)?://[^\s'"`<>]*)",
                               std::regex::icase | std::regex::optimize);
    return re;
}

}

std::string engine_for_scheme(const std::string& scheme){
    std::string s = utils::to_lower(scheme);
    if(s == "postgres" || s == "postgresql") return "postgresql";
    if(s == "mysql" || s == "mariadb") return "mysql";
    if(s == "mongodb") return "mongodb";
    if(s == "redis") return "redis";
    if(s == "mssql" || s == "sqlserver") return "mssql";
    if(s == "sqlite") return "sqlite";
    if(s == "duckdb") return "duckdb";
    return "unknown";
}

std::string engine_for_port(unsigned port){
    if(port >= 5432 && port <= 5439) return "postgresql";
    switch(port){
        case 3306: return "mysql";
        case 1433: return "mssql";
        case 27017: return "mongodb";
        case 6379: return "redis";
        default: return "unknown";
    }
}

bool is_placeholder(const std::string& value){
    return value.empty() || value.find("${") != std::string::npos || value.find("{{") != std::string::npos ||
           value[0] == '$' || value[0] == '<' || value.find("***") != std::string::npos;
}

std::vector<ConnectionMatch> find_connection_strings(const std::string& line){
    std::vector<ConnectionMatch> out;
    for(auto it = std::sregex_iterator(line.begin(), line.end(), url_regex()); it != std::sregex_iterator(); ++it){
        ConnectionMatch m;
        m.url = (*it)[0].str();
        while(!m.url.empty() && std::string(",;)]}").find(m.url.back()) != std::string::npos) m.url.pop_back();
        m.scheme = utils::to_lower((*it)[1].str());
        m.engine = engine_for_scheme(m.scheme);
        auto auth_start = m.url.find("://") + 3;
        auto auth_end = m.url.find_first_of("/?", auth_start);
        std::string authority = m.url.substr(auth_start, auth_end == std::string::npos ? std::string::npos : auth_end - auth_start);
        auto at = authority.rfind('@');
        if(at != std::string::npos){
            std::string userinfo = authority.substr(0, at);
            auto colon = userinfo.find(':');
            m.has_password = colon != std::string::npos && !is_placeholder(userinfo.substr(colon + 1));
        }
        std::string lower = utils::to_lower(line);
        m.tls_disabled = lower.find("sslmode=disable") != std::string::npos || lower.find("ssl=false") != std::string::npos;
        out.push_back(std::move(m));
    }
    return out;
}

std::string resolve_path(const std::string& raw, const fs::path& base){
    fs::path p(raw);
    if(p.is_relative()) p = base / p;
    return p.lexically_normal().string();
}

std::optional<std::string> url_file_path(const ConnectionMatch& m, const fs::path& base){
    if(m.engine != "sqlite" && m.engine != "duckdb") return std::nullopt;
    std::string rest = m.url.substr(m.url.find("://") + 3);
    auto q = rest.find('?');
    if(q != std::string::npos) rest = rest.substr(0, q);
    if(!rest.empty() && rest[0] == '/') rest.erase(0, 1);
    if(rest.empty() || rest == ":memory:") return std::nullopt;
    return resolve_path(rest, base);
}

}
