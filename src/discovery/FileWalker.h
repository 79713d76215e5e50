#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <cstdint>
#include "../core/DiscoveryModule.h"

namespace asset_scan {

// Lazy walk over the scope's paths, one directory entry per unit of work.
// Excluded directories are pruned; symlinked directories are not followed.
class FileWalkStream : public QueuedStream {
public:
    FileWalkStream(ScopeConfig scope, Deadline deadline);

protected:
    bool advance() override;
    bool walk_done() const { return walk_done_; }

    virtual bool wants(const std::filesystem::path& p) const = 0;
    virtual void inspect(const std::filesystem::path& p, std::uintmax_t size) = 0;

    const ScopeConfig& scope() const { return scope_; }
    bool excluded(const std::filesystem::path& p, bool is_dir) const;
    // Lines of a text file, reading stops early once the deadline expires.
    std::vector<std::string> read_text_lines(const std::filesystem::path& p) const;

private:
    void visit_file(const std::filesystem::path& p);
    ScopeConfig scope_;
    size_t root_idx_ = 0;
    std::optional<std::filesystem::recursive_directory_iterator> it_;
    bool walk_done_ = false;
};

bool path_component_matches(const std::filesystem::path& p, const std::string& pattern, bool is_dir);
std::string lower_extension(const std::filesystem::path& p);

}
