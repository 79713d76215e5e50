#include "FileWalker.h"
#include "../core/Utils.h"
#include "../core/Logging.h"
#include <fstream>

namespace fs = std::filesystem;

namespace asset_scan {

bool path_component_matches(const fs::path& p, const std::string& pattern, bool is_dir){
    if(pattern.empty()) return false;
    if(pattern.find('/') != std::string::npos){
        std::string s = "/" + p.generic_string();
        if(is_dir) s += '/';
        std::string pat = pattern[0] == '/' ? pattern : "/" + pattern;
        return s.find(pat) != std::string::npos;
    }
    for(const auto& part : p){
        if(part.string() == pattern) return true;
    }
    return false;
}

std::string lower_extension(const fs::path& p){
    return utils::to_lower(p.extension().string());
}

FileWalkStream::FileWalkStream(ScopeConfig scope, Deadline deadline)
    : QueuedStream(std::move(deadline)), scope_(std::move(scope)) {}

bool FileWalkStream::excluded(const fs::path& p, bool is_dir) const {
    for(const auto& pat : scope_.exclude){
        if(path_component_matches(p, pat, is_dir)) return true;
    }
    return false;
}

void FileWalkStream::visit_file(const fs::path& p){
    if(!wants(p)) return;
    std::error_code ec;
    auto size = fs::file_size(p, ec);
    if(ec) return;
    if(scope_.max_file_size > 0 && size > scope_.max_file_size){
        Logger::instance().trace("Skipping oversized file: " + p.string());
        return;
    }
    inspect(p, size);
}

bool FileWalkStream::advance(){
    if(walk_done_) return false;
    std::error_code ec;
    if(!it_){
        if(root_idx_ >= scope_.paths.size()){ walk_done_ = true; return false; }
        fs::path root = fs::absolute(scope_.paths[root_idx_++], ec).lexically_normal();
        if(ec) return true;
        if(fs::is_regular_file(root, ec)){
            if(!excluded(root, false)) visit_file(root);
            return true;
        }
        if(!fs::is_directory(root, ec)){
            Logger::instance().debug("Scan path not found: " + root.string());
            return true;
        }
        it_.emplace(root, fs::directory_options::skip_permission_denied, ec);
        if(ec) it_.reset();
        return true;
    }
    auto& it = *it_;
    if(it == fs::recursive_directory_iterator()){
        it_.reset();
        return true;
    }
    const fs::directory_entry& entry = *it;
    bool is_dir = entry.is_directory(ec) && !entry.is_symlink(ec);
    if(is_dir){
        if(excluded(entry.path(), true)) it.disable_recursion_pending();
    } else if(entry.is_regular_file(ec) && !excluded(entry.path(), false)){
        visit_file(entry.path());
    }
    it.increment(ec);
    if(ec){
        Logger::instance().debug("Directory walk stopped early: " + ec.message());
        it_.reset();
    }
    return true;
}

std::vector<std::string> FileWalkStream::read_text_lines(const fs::path& p) const {
    std::vector<std::string> lines;
    std::ifstream f(p);
    if(!f) return lines;
    std::string line;
    size_t n = 0;
    while(std::getline(f, line)){
        // A NUL byte means binary content.
        if(line.find('\0') != std::string::npos) return {};
        lines.push_back(line);
        if(++n % 256 == 0 && deadline().expired()) break;
    }
    return lines;
}

}
