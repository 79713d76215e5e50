#pragma once
#include <string>
#include <vector>
#include <optional>
#include <map>
#include <chrono>
#include <cstddef>

namespace asset_scan {
namespace utils {

std::vector<std::string> read_lines(const std::string& path);
std::optional<std::string> read_file(const std::string& path, size_t max_bytes = static_cast<size_t>(-1));
std::string trim(const std::string& s);
std::string to_lower(std::string s);
std::vector<std::string> split_csv(const std::string& s);
bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);
bool contains_any(const std::string& s, const std::vector<std::string>& needles);

// Lower-case hex SHA-256 digest (OpenSSL EVP).
std::string sha256_hex(const std::string& data);

// Accepts YYYY-MM-DD, YYYY-MM-DDTHH:MM:SS and an optional trailing Z; always UTC.
std::optional<std::chrono::system_clock::time_point> parse_iso8601(const std::string& s);

// key=value block files (.rule / .doc). A new block starts at every line whose
// key equals start_key; '#' comments and blank lines are ignored.
struct KeyValueBlock {
    std::string source;   // file path
    size_t line = 0;      // line of the start key
    std::map<std::string, std::string> values;
    std::vector<std::string> malformed; // lines without '=' inside the block
};
std::vector<KeyValueBlock> parse_kv_blocks(const std::vector<std::string>& lines, const std::string& start_key, const std::string& source);

// Files with the given extension under path (or path itself), sorted by name.
std::vector<std::string> list_input_files(const std::string& path, const std::string& extension);

}
}
