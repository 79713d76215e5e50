#include "FilesystemDiscovery.h"
#include "FileWalker.h"
#include "ConnectionStrings.h"
#include "../core/IdentityKey.h"
#include "../core/Utils.h"
#include <fstream>
#include <cstring>
#include <set>
#include <algorithm>

namespace fs = std::filesystem;

namespace asset_scan {

namespace {

const std::vector<std::string> kConfigExtensions = {".env", ".ini", ".conf", ".cfg", ".yml", ".yaml", ".json", ".toml", ".properties"};

bool is_config_file(const fs::path& p){
    std::string name = p.filename().string();
    if(name == ".env" || utils::starts_with(name, ".env.")) return true;
    std::string ext = lower_extension(p);
    return std::find(kConfigExtensions.begin(), kConfigExtensions.end(), ext) != kConfigExtensions.end();
}

std::string engine_for_extension(const std::string& ext){
    if(ext == ".duckdb") return "duckdb";
    return "sqlite";
}

const char* magic_engine(FileMagic m){
    return m == FileMagic::DuckDB ? "duckdb" : "sqlite";
}

class FilesystemStream : public FileWalkStream {
public:
    using FileWalkStream::FileWalkStream;
protected:
    bool wants(const fs::path&) const override { return true; }

    void inspect(const fs::path& p, std::uintmax_t size) override {
        std::string ext = lower_extension(p);
        const auto& exts = scope().extensions;
        bool ext_match = std::find(exts.begin(), exts.end(), ext) != exts.end();
        if(is_config_file(p)){
            scan_config(p);
            return;
        }
        FileMagic magic = size >= 16 ? detect_magic(p.string()) : FileMagic::None;
        if(!ext_match && magic == FileMagic::None) return;

        CandidateObservation obs;
        obs.method = DiscoveryMethod::Filesystem;
        obs.module = "filesystem";
        obs.locator = p.string();
        obs.attributes["size_bytes"] = std::to_string(size);
        if(ext_match && magic != FileMagic::None){
            obs.method_confidence = 0.95;
            obs.attributes[attr::Engine] = magic_engine(magic);
            obs.attributes[attr::Source] = "extension+magic_header";
        } else if(magic != FileMagic::None){
            obs.method_confidence = 0.9;
            obs.attributes[attr::Engine] = magic_engine(magic);
            obs.attributes[attr::Source] = "magic_header";
        } else {
            obs.method_confidence = 0.7;
            obs.attributes[attr::Engine] = engine_for_extension(ext);
            obs.attributes[attr::Source] = "extension";
        }
        emit(std::move(obs));
    }

private:
    void scan_config(const fs::path& p){
        auto lines = read_text_lines(p);
        std::set<std::string> seen;
        for(size_t i = 0; i < lines.size(); ++i){
            for(const auto& m : find_connection_strings(lines[i])){
                CandidateObservation obs;
                obs.method = DiscoveryMethod::Filesystem;
                obs.module = "filesystem";
                auto file = url_file_path(m, p.parent_path());
                obs.locator = file ? *file : sanitize_locator(m.url);
                if(!seen.insert(obs.locator).second) continue;
                obs.method_confidence = 0.6;
                obs.attributes[attr::Engine] = m.engine;
                obs.attributes[attr::Source] = "config:" + p.string() + ":" + std::to_string(i + 1);
                if(file) obs.attributes["connection_string"] = sanitize_locator(m.url);
                emit(std::move(obs));
            }
        }
    }
};

}

FileMagic detect_magic(const std::string& path){
    std::ifstream f(path, std::ios::binary);
    if(!f) return FileMagic::None;
    char header[16] = {};
    f.read(header, sizeof(header));
    if(f.gcount() < 16) return FileMagic::None;
    if(std::memcmp(header, "SQLite format 3\0", 16) == 0) return FileMagic::SQLite;
    if(std::memcmp(header + 8, "DUCK", 4) == 0) return FileMagic::DuckDB;
    return FileMagic::None;
}

std::optional<std::string> FilesystemDiscovery::availability(const ScopeConfig& scope) const {
    std::error_code ec;
    for(const auto& p : scope.paths){
        if(fs::exists(p, ec)) return std::nullopt;
    }
    return std::string("none of the scan paths exist");
}

std::unique_ptr<ObservationStream> FilesystemDiscovery::discover(const ScopeConfig& scope, const Deadline& deadline){
    return std::make_unique<FilesystemStream>(scope, deadline);
}

}
