#include "ContainerDiscovery.h"
#include "FileWalker.h"
#include "ConnectionStrings.h"
#include "../core/Utils.h"
#include "../core/Logging.h"
#include <algorithm>
#include <regex>
#include <cctype>
#include <set>

namespace fs = std::filesystem;

namespace asset_scan {

namespace {

const std::vector<std::pair<std::string, const char*>> kDataDirs = {
    {"/var/lib/postgresql", "postgresql"},
    {"/var/lib/mysql", "mysql"},
    {"/data/db", "mongodb"},
    {"/bitnami/postgresql", "postgresql"},
    {"/bitnami/mysql", "mysql"},
};

const std::vector<std::pair<std::string, const char*>> kServerProcesses = {
    {"postgres", "postgresql"},
    {"postmaster", "postgresql"},
    {"mysqld", "mysql"},
    {"mariadbd", "mysql"},
    {"mongod", "mongodb"},
    {"redis-server", "redis"},
    {"sqlservr", "mssql"},
};

size_t indent_of(const std::string& line){
    size_t n = 0;
    while(n < line.size() && line[n] == ' ') ++n;
    return n;
}

std::string unquote(std::string v){
    v = utils::trim(v);
    auto hash = v.find(" #");
    if(hash != std::string::npos) v = utils::trim(v.substr(0, hash));
    if(v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front()) v = v.substr(1, v.size() - 2);
    return v;
}

bool is_compose_file(const fs::path& p){
    std::string name = utils::to_lower(p.filename().string());
    std::string ext = lower_extension(p);
    if(ext != ".yml" && ext != ".yaml") return false;
    return utils::starts_with(name, "docker-compose") || utils::starts_with(name, "compose.");
}

std::string image_tag(const std::string& image){
    auto slash = image.rfind('/');
    auto colon = image.rfind(':');
    if(colon == std::string::npos || (slash != std::string::npos && colon < slash)) return "";
    return image.substr(colon + 1);
}

class ContainerStream : public FileWalkStream {
public:
    using FileWalkStream::FileWalkStream;
protected:
    bool advance() override {
        if(!walk_done()){
            FileWalkStream::advance();
            return true;
        }
        return scan_next_process();
    }

    bool wants(const fs::path& p) const override { return is_compose_file(p); }

    void inspect(const fs::path& p, std::uintmax_t) override {
        auto services = parse_compose(read_text_lines(p));
        std::string project = p.parent_path().filename().string();
        for(const auto& svc : services){
            std::string engine = engine_for_image(svc.image);
            if(engine.empty()) continue;
            CandidateObservation obs;
            obs.method = DiscoveryMethod::Container;
            obs.module = "containers";
            obs.locator = "container:" + (svc.container_name.empty() ? svc.name : svc.container_name);
            obs.method_confidence = 0.9;
            obs.attributes[attr::Engine] = engine;
            obs.attributes["image"] = svc.image;
            std::string tag = image_tag(svc.image);
            if(!tag.empty()) obs.attributes[attr::Version] = tag;
            obs.attributes[attr::Source] = "compose:" + p.string();
            for(const auto& l : svc.labels){
                std::string key = utils::to_lower(l.first);
                auto dot = key.rfind('.');
                std::string leaf = dot == std::string::npos ? key : key.substr(dot + 1);
                if(leaf == "owner") obs.attributes[attr::Owner] = l.second;
                else if(leaf == "criticality") obs.attributes[attr::Criticality] = l.second;
            }
            for(const auto& port : svc.ports){
                unsigned host_port = published_port(port);
                if(host_port) obs.links.push_back("localhost:" + std::to_string(host_port));
            }
            std::sort(obs.links.begin(), obs.links.end());
            obs.links.erase(std::unique(obs.links.begin(), obs.links.end()), obs.links.end());
            emit(std::move(obs));

            for(const auto& vol : svc.volumes) emit_volume(p, project, svc, vol);
        }
    }

private:
    void emit_volume(const fs::path& compose, const std::string& project, const ComposeService& svc, const std::string& entry){
        auto colon = entry.find(':');
        if(colon == std::string::npos) return;
        std::string source = entry.substr(0, colon);
        std::string target = entry.substr(colon + 1);
        auto opt = target.find(':');
        if(opt != std::string::npos) target = target.substr(0, opt);
        const char* engine = nullptr;
        for(const auto& d : kDataDirs){
            if(utils::starts_with(target, d.first)){ engine = d.second; break; }
        }
        if(!engine) return;
        CandidateObservation obs;
        obs.method = DiscoveryMethod::Container;
        obs.module = "containers";
        bool bind = utils::starts_with(source, "/") || utils::starts_with(source, ".") || utils::starts_with(source, "~");
        obs.locator = bind ? resolve_path(source, compose.parent_path()) : "volume:" + project + "_" + source;
        obs.method_confidence = 0.6;
        obs.attributes[attr::Engine] = "file_storage";
        obs.attributes["data_engine"] = engine;
        obs.attributes["mount_target"] = target;
        obs.attributes["service"] = svc.name;
        obs.attributes[attr::Source] = "compose_volume:" + compose.string();
        emit(std::move(obs));
    }

    bool scan_next_process(){
        if(!pids_loaded_){
            pids_loaded_ = true;
            std::error_code ec;
            for(const auto& entry : fs::directory_iterator(scope().proc_root, fs::directory_options::skip_permission_denied, ec)){
                std::string name = entry.path().filename().string();
                if(!name.empty() && std::all_of(name.begin(), name.end(), [](unsigned char c){ return std::isdigit(c); })) pids_.push_back(name);
            }
            std::sort(pids_.begin(), pids_.end());
        }
        if(next_pid_ >= pids_.size()) return false;
        const std::string pid = pids_[next_pid_++];
        fs::path dir = fs::path(scope().proc_root) / pid;
        auto comm_lines = utils::read_lines((dir / "comm").string());
        if(comm_lines.empty()) return true;
        std::string comm = utils::trim(comm_lines.front());
        const char* engine = nullptr;
        for(const auto& p : kServerProcesses){
            if(comm == p.first){ engine = p.second; break; }
        }
        if(!engine) return true;
        std::string id = container_id_from_cgroup(utils::read_lines((dir / "cgroup").string()));
        if(id.empty() || !seen_containers_.insert(id + engine).second) return true;
        CandidateObservation obs;
        obs.method = DiscoveryMethod::Container;
        obs.module = "containers";
        obs.locator = "container:" + id;
        obs.method_confidence = 0.75;
        obs.attributes[attr::Engine] = engine;
        obs.attributes["pid"] = pid;
        obs.attributes["process"] = comm;
        obs.attributes[attr::Source] = "process";
        emit(std::move(obs));
        return true;
    }

    bool pids_loaded_ = false;
    std::vector<std::string> pids_;
    size_t next_pid_ = 0;
    std::set<std::string> seen_containers_;
};

}

std::vector<ComposeService> parse_compose(const std::vector<std::string>& lines){
    std::vector<ComposeService> services;
    bool in_services = false;
    size_t service_indent = 0, field_indent = 0;
    std::string field;
    ComposeService* cur = nullptr;
    for(const auto& raw : lines){
        std::string t = utils::trim(raw);
        if(t.empty() || t[0] == '#') continue;
        size_t ind = indent_of(raw);
        if(ind == 0){
            in_services = utils::starts_with(t, "services:");
            cur = nullptr;
            service_indent = 0;
            continue;
        }
        if(!in_services) continue;
        if(service_indent == 0) service_indent = ind;
        if(ind == service_indent){
            auto colon = t.find(':');
            if(colon == std::string::npos) continue;
            services.push_back(ComposeService{});
            cur = &services.back();
            cur->name = unquote(t.substr(0, colon));
            field.clear();
            field_indent = 0;
            continue;
        }
        if(!cur || ind < service_indent) continue;
        if(field_indent == 0) field_indent = ind;
        if(ind == field_indent && t[0] != '-'){
            auto colon = t.find(':');
            if(colon == std::string::npos) continue;
            field = utils::to_lower(utils::trim(t.substr(0, colon)));
            std::string value = unquote(t.substr(colon + 1));
            if(field == "image") cur->image = value;
            else if(field == "container_name") cur->container_name = value;
            else if(!value.empty() && value.front() == '[' && value.back() == ']'){
                // Flow sequence: ports: ["5432:5432"]
                for(const auto& item : utils::split_csv(value.substr(1, value.size() - 2))){
                    if(field == "ports") cur->ports.push_back(unquote(item));
                    else if(field == "volumes") cur->volumes.push_back(unquote(item));
                }
            }
            continue;
        }
        if(ind < field_indent) continue;
        // Long syntax: published: 5433 / source: pgdata / target: /var/lib/...
        auto long_syntax = [&](const std::string& entry){
            auto colon = entry.find(':');
            if(colon == std::string::npos) return;
            std::string key = utils::trim(entry.substr(0, colon));
            std::string value = unquote(entry.substr(colon + 1));
            if(field == "ports" && key == "published") cur->ports.push_back(value + ":0");
            else if(field == "volumes" && key == "source") cur->volumes.push_back(value + ":");
            else if(field == "volumes" && key == "target" && !cur->volumes.empty() && cur->volumes.back().back() == ':') cur->volumes.back() += value;
        };
        if(t[0] == '-'){
            std::string item = unquote(t.substr(1));
            bool mapping = (field == "ports" || field == "volumes") &&
                           (item.find(": ") != std::string::npos || (!item.empty() && item.back() == ':'));
            if(mapping) long_syntax(item);
            else if(field == "ports") cur->ports.push_back(item);
            else if(field == "volumes") cur->volumes.push_back(item);
            else if(field == "labels"){
                auto eq = item.find('=');
                if(eq != std::string::npos) cur->labels[utils::trim(item.substr(0, eq))] = unquote(item.substr(eq + 1));
            }
        } else if(field == "labels"){
            auto colon = t.find(':');
            if(colon != std::string::npos) cur->labels[unquote(t.substr(0, colon))] = unquote(t.substr(colon + 1));
        } else if(field == "ports" || field == "volumes"){
            long_syntax(t);
        }
    }
    return services;
}

unsigned published_port(const std::string& entry){
    std::string e = entry;
    auto slash = e.find('/');
    if(slash != std::string::npos) e = e.substr(0, slash); // "5432:5432/tcp"
    auto parts = std::vector<std::string>();
    size_t start = 0;
    // Split on ':' but keep bracketed IPv6 hosts intact.
    for(size_t i = 0, depth = 0; i <= e.size(); ++i){
        if(i < e.size() && e[i] == '[') ++depth;
        if(i < e.size() && e[i] == ']' && depth) --depth;
        if(i == e.size() || (e[i] == ':' && depth == 0)){
            parts.push_back(e.substr(start, i - start));
            start = i + 1;
        }
    }
    if(parts.size() < 2) return 0; // container-only port, not published
    std::string host = parts[parts.size() - 2];
    auto dash = host.find('-');
    if(dash != std::string::npos) host = host.substr(0, dash); // ranges publish their first port
    try {
        size_t pos = 0;
        unsigned long v = std::stoul(host, &pos);
        if(pos != host.size() || v == 0 || v > 65535) return 0;
        return static_cast<unsigned>(v);
    } catch(const std::exception&){
        return 0;
    }
}

std::string engine_for_image(const std::string& image){
    std::string name = utils::to_lower(image);
    auto at = name.find('@');
    if(at != std::string::npos) name = name.substr(0, at);
    auto slash = name.rfind('/');
    if(slash != std::string::npos) name = name.substr(slash + 1);
    auto colon = name.find(':');
    if(colon != std::string::npos) name = name.substr(0, colon);
    if(name.find("postgres") != std::string::npos || name.find("postgis") != std::string::npos || name == "timescaledb") return "postgresql";
    if(name.find("mysql") != std::string::npos || name.find("mariadb") != std::string::npos) return "mysql";
    if(name.find("mongo") != std::string::npos) return "mongodb";
    if(name.find("redis") != std::string::npos) return "redis";
    if(name.find("mssql") != std::string::npos) return "mssql";
    if(name.find("sqlite") != std::string::npos) return "sqlite";
    if(name.find("duckdb") != std::string::npos) return "duckdb";
    return "";
}

std::string container_id_from_cgroup(const std::vector<std::string>& cgroup_lines){
    static const std::regex id_re(R"(([0-9a-f]{64}))");
    for(const auto& line : cgroup_lines){
        if(line.find("docker") == std::string::npos && line.find("containerd") == std::string::npos &&
           line.find("kubepods") == std::string::npos && line.find("libpod") == std::string::npos) continue;
        std::smatch m;
        if(std::regex_search(line, m, id_re)) return m[1].str().substr(0, 12);
    }
    return "";
}

std::optional<std::string> ContainerDiscovery::availability(const ScopeConfig& scope) const {
    std::error_code ec;
    for(const auto& p : scope.paths){
        if(fs::exists(p, ec)) return std::nullopt;
    }
    if(fs::is_directory(scope.proc_root, ec)) return std::nullopt;
    return std::string("no compose paths and no procfs at " + scope.proc_root);
}

std::unique_ptr<ObservationStream> ContainerDiscovery::discover(const ScopeConfig& scope, const Deadline& deadline){
    return std::make_unique<ContainerStream>(scope, deadline);
}

}
