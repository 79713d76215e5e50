#include "CodeDiscovery.h"
#include "FileWalker.h"
#include "ConnectionStrings.h"
#include "../core/IdentityKey.h"
#include "../core/Utils.h"
#include <regex>
#include <map>
#include <algorithm>

namespace fs = std::filesystem;

namespace asset_scan {

namespace {

const std::regex& connect_regex(){
    static const std::regex re(R"(\b(sqlite3|aiosqlite|duckdb)\.connect\(\s*(?:database\s*=\s*)?[rbfu]?["']([^"']+)["'])",
                               std::regex::optimize);
    return re;
}

const std::regex& annotation_regex(){
    static const std::regex re(R"(db-(owner|criticality)\s*:\s*([A-Za-z0-9_.@-]+))", std::regex::optimize);
    return re;
}

class CodeStream : public FileWalkStream {
public:
    using FileWalkStream::FileWalkStream;
protected:
    bool wants(const fs::path& p) const override {
        const auto& exts = scope().extensions;
        return std::find(exts.begin(), exts.end(), lower_extension(p)) != exts.end();
    }

    void inspect(const fs::path& p, std::uintmax_t) override {
        auto lines = read_text_lines(p);
        std::map<std::string, CandidateObservation> found; // by locator, first reference wins
        std::map<std::string, std::string> annotations;
        for(size_t i = 0; i < lines.size(); ++i){
            const std::string& line = lines[i];
            std::string where = p.string() + ":" + std::to_string(i + 1);
            for(const auto& m : find_connection_strings(line)){
                auto file = url_file_path(m, p.parent_path());
                std::string locator = file ? *file : sanitize_locator(m.url);
                if(found.count(locator)) continue;
                CandidateObservation obs = make(locator, m.engine, 0.8, "connection_string", where);
                if(file) obs.attributes["connection_string"] = sanitize_locator(m.url);
                found.emplace(locator, std::move(obs));
            }
            for(auto it = std::sregex_iterator(line.begin(), line.end(), connect_regex()); it != std::sregex_iterator(); ++it){
                std::string target = (*it)[2].str();
                if(target == ":memory:" || target.find("://") != std::string::npos) continue;
                std::string engine = (*it)[1].str() == "duckdb" ? "duckdb" : "sqlite";
                std::string locator = resolve_path(target, p.parent_path());
                auto existing = found.find(locator);
                if(existing != found.end()){
                    existing->second.method_confidence = std::max(existing->second.method_confidence, 0.85);
                    continue;
                }
                found.emplace(locator, make(locator, engine, 0.85, "connect_call", where));
            }
            std::smatch am;
            if(std::regex_search(line, am, annotation_regex())){
                annotations.emplace(am[1].str() == "owner" ? attr::Owner : attr::Criticality, am[2].str());
            }
        }
        for(auto& kv : found){
            for(const auto& a : annotations) kv.second.attributes[a.first] = a.second;
            emit(std::move(kv.second));
        }
    }

private:
    static CandidateObservation make(const std::string& locator, const std::string& engine, double confidence,
                                     const char* pattern, const std::string& where){
        CandidateObservation obs;
        obs.method = DiscoveryMethod::CodeAnalysis;
        obs.module = "code";
        obs.locator = locator;
        obs.method_confidence = confidence;
        obs.attributes[attr::Engine] = engine;
        obs.attributes[attr::Source] = std::string(pattern) + ":" + where;
        return obs;
    }
};

}

std::optional<std::string> CodeDiscovery::availability(const ScopeConfig& scope) const {
    std::error_code ec;
    for(const auto& p : scope.paths){
        if(fs::exists(p, ec)) return std::nullopt;
    }
    return std::string("none of the code paths exist");
}

std::unique_ptr<ObservationStream> CodeDiscovery::discover(const ScopeConfig& scope, const Deadline& deadline){
    return std::make_unique<CodeStream>(scope, deadline);
}

}
