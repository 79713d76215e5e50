#pragma once
#include <string>
#include <vector>
#include <optional>
#include <filesystem>

namespace asset_scan {

struct ConnectionMatch {
    std::string url;        // as written, credentials included
    std::string scheme;     // lower case, driver suffix removed
    std::string engine;
    bool has_password = false;
    bool tls_disabled = false;
};

// Database connection URLs appearing in a line of text.
std::vector<ConnectionMatch> find_connection_strings(const std::string& line);

std::string engine_for_scheme(const std::string& scheme);
std::string engine_for_port(unsigned port);

// Absolute path for a file-backed URL (sqlite:///, duckdb:///), relative paths
// resolved against base; nullopt for in-memory databases or non-file URLs.
std::optional<std::string> url_file_path(const ConnectionMatch& m, const std::filesystem::path& base);
std::string resolve_path(const std::string& raw, const std::filesystem::path& base);

// Placeholders such as ${DB_PASSWORD} or {{ secret }} are not credentials.
bool is_placeholder(const std::string& value);

}
