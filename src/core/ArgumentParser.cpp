#include "ArgumentParser.h"
#include "Utils.h"
#include "BuildInfo.h"
#include <iostream>
#include <stdexcept>

namespace asset_scan {

namespace {

int need_int(const std::string& v, const char* flag){
    try {
        size_t pos = 0;
        int n = std::stoi(v, &pos);
        if(pos == v.size()) return n;
    } catch(const std::exception&){}
    throw std::invalid_argument(std::string("Invalid integer for ") + flag + ": " + v);
}

double need_double(const std::string& v, const char* flag){
    try {
        size_t pos = 0;
        double d = std::stod(v, &pos);
        if(pos == v.size()) return d;
    } catch(const std::exception&){}
    throw std::invalid_argument(std::string("Invalid number for ") + flag + ": " + v);
}

}

ArgumentParser::ArgumentParser() {
    using K = ArgKind;
    specs_ = {
        {"--enable", K::CSV, "name[,name...]", "Only run the named discovery modules", [](Config& c, const std::string& v){ c.enable_modules = utils::split_csv(v); }},
        {"--disable", K::CSV, "name[,name...]", "Skip the named discovery modules", [](Config& c, const std::string& v){ c.disable_modules = utils::split_csv(v); }},
        {"--paths", K::CSV, "dir[,dir...]", "Filesystem scan roots (default .)", [](Config& c, const std::string& v){ c.scan_paths = utils::split_csv(v); }},
        {"--code-paths", K::CSV, "dir[,dir...]", "Source code roots (default .)", [](Config& c, const std::string& v){ c.code_paths = utils::split_csv(v); }},
        {"--compose-paths", K::CSV, "dir[,dir...]", "Where to look for compose files (default --paths)", [](Config& c, const std::string& v){ c.compose_paths = utils::split_csv(v); }},
        {"--exclude", K::CSV, "pat[,pat...]", "Extra path substrings to skip", [](Config& c, const std::string& v){ for(auto& p : utils::split_csv(v)) c.exclude.push_back(p); }},
        {"--ports", K::String, "list", "Ports or ranges for network discovery, e.g. 5432,5433-5439", [](Config& c, const std::string& v){
            std::vector<PortRange> ranges;
            if(!parse_port_ranges(v, ranges)) throw std::invalid_argument("Invalid --ports value: " + v);
            c.ports = ranges; }},
        {"--hosts", K::CSV, "host[,host...]", "Hosts to probe actively (default passive only)", [](Config& c, const std::string& v){ c.hosts = utils::split_csv(v); }},
        {"--proc-root", K::String, "DIR", "procfs mount point (default /proc)", [](Config& c, const std::string& v){ c.proc_root = v; }},
        {"--max-file-size-mb", K::Int, "N", "Skip files larger than N MB", [](Config& c, const std::string& v){ c.max_file_size_mb = need_int(v, "--max-file-size-mb"); }},
        {"--connect-timeout-ms", K::Int, "N", "Active probe connect timeout", [](Config& c, const std::string& v){ c.connect_timeout_ms = need_int(v, "--connect-timeout-ms"); }},
        {"--timeout", K::Double, "SECONDS", "Global discovery budget (default 300)", [](Config& c, const std::string& v){ c.budget_seconds = need_double(v, "--timeout"); }},
        {"--module-timeout", K::Double, "SECONDS", "Per-module deadline (default: global budget)", [](Config& c, const std::string& v){ c.module_timeout_seconds = need_double(v, "--module-timeout"); }},
        {"--grace-ms", K::Int, "N", "Wait for cancelled modules before abandoning them", [](Config& c, const std::string& v){ c.grace_ms = need_int(v, "--grace-ms"); }},
        {"--memory-mb", K::Int, "N", "Memory ceiling for collected observations", [](Config& c, const std::string& v){ c.memory_ceiling_mb = need_int(v, "--memory-mb"); }},
        {"--workers", K::Int, "N", "Maximum concurrent modules (default 4)", [](Config& c, const std::string& v){ c.max_workers = need_int(v, "--workers"); }},
        {"--docs", K::String, "FILE|DIR", "Documentation index (.doc files)", [](Config& c, const std::string& v){ c.docs_path = v; }},
        {"--rules", K::String, "FILE|DIR", "Compliance rule set (.rule files)", [](Config& c, const std::string& v){ c.rules_path = v; }},
        {"--staleness-days", K::Int, "N", "Documentation older than N days is stale (default 90)", [](Config& c, const std::string& v){ c.staleness_days = need_int(v, "--staleness-days"); }},
        {"--completeness", K::Double, "X", "Minimum documentation completeness (default 0.7)", [](Config& c, const std::string& v){ c.completeness_threshold = need_double(v, "--completeness"); }},
        {"--weights", K::CSV, "s,r,e", "Severity, regulatory and exposure weights", [](Config& c, const std::string& v){
            auto parts = utils::split_csv(v);
            if(parts.size() != 3) throw std::invalid_argument("--weights expects three comma-separated numbers");
            c.weight_severity = need_double(parts[0], "--weights");
            c.weight_regulatory = need_double(parts[1], "--weights");
            c.weight_exposure = need_double(parts[2], "--weights"); }},
        {"--no-dangling-docs", K::None, "", "Do not report documentation matching no asset", [](Config& c, const std::string&){ c.report_dangling_docs = false; }},
        {"--output", K::String, "FILE", "Write the report to FILE (default stdout)", [](Config& c, const std::string& v){ c.output_file = v; }},
        {"--pretty", K::None, "", "Pretty-print JSON", [](Config& c, const std::string&){ c.pretty = true; }},
        {"--compact", K::None, "", "Minified JSON output", [](Config& c, const std::string&){ c.compact = true; }},
        {"--ndjson", K::None, "", "Emit NDJSON (meta, summary, modules, assets, gaps)", [](Config& c, const std::string&){ c.ndjson = true; }},
        {"--fail-on", K::String, "SEV", "Exit 1 if any gap has severity >= SEV", [](Config& c, const std::string& v){ c.fail_on_severity = v; }},
        {"--drop-priv", K::None, "", "Drop Linux capabilities before discovery", [](Config& c, const std::string&){ c.drop_priv = true; }},
        {"--keep-cap-dac", K::None, "", "Retain CAP_DAC_READ_SEARCH when dropping", [](Config& c, const std::string&){ c.keep_cap_dac = true; }},
        {"--seccomp", K::None, "", "Apply the read-only seccomp profile", [](Config& c, const std::string&){ c.seccomp = true; }},
        {"--log-level", K::String, "LEVEL", "error|warn|info|debug|trace", [](Config& c, const std::string& v){ c.log_level = v; }},
        {"--verbose", K::None, "", "Same as --log-level debug", [](Config& c, const std::string&){ c.log_level = "debug"; }},
        {"--quiet", K::None, "", "Same as --log-level error", [](Config& c, const std::string&){ c.log_level = "error"; }},
    };
}

const ArgumentParser::FlagSpec* ArgumentParser::find_spec(const std::string& flag) const {
    for(const auto& s : specs_) if(flag == s.name) return &s;
    return nullptr;
}

bool ArgumentParser::parse(int argc, char** argv, Config& cfg) {
    help_ = version_ = false;
    error_.clear();
    for(int i = 1; i < argc; ++i){
        std::string a = argv[i];
        if(a == "--help"){ help_ = true; return false; }
        if(a == "--version"){ version_ = true; return false; }
        std::string val;
        bool inline_val = false;
        auto eq = a.find('=');
        if(utils::starts_with(a, "--") && eq != std::string::npos){
            val = a.substr(eq + 1);
            a = a.substr(0, eq);
            inline_val = true;
        }
        const FlagSpec* spec = find_spec(a);
        if(!spec){ error_ = "Unknown arg: " + a; return false; }
        if(spec->kind == ArgKind::None){
            if(inline_val){ error_ = a + " takes no value"; return false; }
        } else if(!inline_val){
            if(i + 1 >= argc){ error_ = "Missing value for " + a; return false; }
            val = argv[++i];
        }
        try {
            spec->apply(cfg, val);
        } catch(const std::invalid_argument& ex){
            error_ = ex.what();
            return false;
        }
    }
    return true;
}

void ArgumentParser::print_help() const {
    std::cout << "asset-scan options:\n";
    auto show = [](const std::string& name, const std::string& help){
        std::cout << "  " << name;
        if(name.size() < 32) for(size_t i = name.size(); i < 32; ++i) std::cout << ' '; else std::cout << ' ';
        std::cout << help << "\n";
    };
    for(const auto& s : specs_){
        std::string name = s.name;
        if(s.kind != ArgKind::None) name += std::string(" ") + s.metavar;
        show(name, s.help);
    }
    show("--version", "Print version & exit");
    show("--help", "Show this help");
}

void ArgumentParser::print_version() const {
    std::cout << "asset-scan " << buildinfo::APP_VERSION << " (git=" << buildinfo::GIT_COMMIT
              << ", compiler=" << buildinfo::COMPILER_ID << " " << buildinfo::COMPILER_VERSION
              << ", cxx_std=" << buildinfo::CXX_STANDARD << ")\n";
}

}
