#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <stdexcept>
#include "Observation.h"

namespace asset_scan {

struct PortRange {
    unsigned first = 0;
    unsigned last = 0;
    bool contains(unsigned port) const { return port >= first && port <= last; }
};

// Subset of Config handed to a single discovery module.
struct ScopeConfig {
    std::vector<std::string> paths;
    std::vector<std::string> exclude;          // substring patterns
    std::vector<std::string> extensions;       // lower-case, with leading dot
    std::vector<PortRange> ports;
    std::vector<std::string> hosts;            // active probe targets
    std::string proc_root = "/proc";
    std::uint64_t max_file_size = 0;           // bytes, 0 = unlimited
    int connect_timeout_ms = 1000;
};

// Upper bound for --timeout and --module-timeout; larger values are clamped.
constexpr double kMaxRunSeconds = 7 * 24 * 3600.0;

struct Config {
    std::vector<std::string> enable_modules;   // if non-empty, only these
    std::vector<std::string> disable_modules;

    // Discovery scope
    std::vector<std::string> scan_paths = {"."};
    std::vector<std::string> code_paths = {"."};
    std::vector<std::string> exclude = {".git", "node_modules", "__pycache__", ".venv", "venv", ".pytest_cache"};
    std::vector<std::string> credential_exclude = {"tests/", "test/"};
    std::vector<std::string> db_extensions = {".db", ".sqlite", ".sqlite3", ".duckdb"};
    std::vector<std::string> code_extensions = {".py", ".js", ".ts", ".go", ".java", ".rb", ".rs", ".cpp", ".cc", ".h", ".hpp"};
    std::vector<std::string> compose_paths;    // empty = scan_paths
    std::vector<PortRange> ports = {{5432,5432},{3306,3306},{1433,1433},{27017,27017},{6379,6379},{5433,5439}};
    std::vector<std::string> hosts;            // empty = passive network discovery only
    std::string proc_root = "/proc";
    int max_file_size_mb = 1000;
    int connect_timeout_ms = 1000;

    // Run budget
    double budget_seconds = 300;
    double module_timeout_seconds = 0;         // 0 = global budget only
    int grace_ms = 500;
    int memory_ceiling_mb = 512;
    int max_workers = 4;

    // Gap analysis inputs and thresholds
    std::string docs_path;
    std::string rules_path;
    int staleness_days = 90;
    double completeness_threshold = 0.7;
    bool report_dangling_docs = true;

    // Prioritisation weights: severity, regulatory, exposure
    double weight_severity = 1.0;
    double weight_regulatory = 1.0;
    double weight_exposure = 1.0;

    // Output
    std::string output_file;
    bool pretty = false;
    bool compact = false;
    bool ndjson = false;
    std::string fail_on_severity;              // exit 1 if any gap >= this

    // Process hardening
    bool drop_priv = false;
    bool keep_cap_dac = false;
    bool seccomp = false;

    std::string log_level = "info";

    // Fan-out of the relevant subset for one discovery method.
    ScopeConfig scope_for(DiscoveryMethod method) const;
};

// Malformed top-level configuration; the run is rejected before it starts.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

bool parse_port_ranges(const std::string& text, std::vector<PortRange>& out);

}
