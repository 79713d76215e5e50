#include "Utils.h"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <cstdio>
#include <filesystem>
#include <openssl/evp.h>

namespace fs = std::filesystem;

namespace asset_scan {
namespace utils {

std::vector<std::string> read_lines(const std::string& path){
    std::vector<std::string> out; std::ifstream f(path); if(!f) return out;
    std::string line; while(std::getline(f,line)) out.push_back(line);
    return out;
}

std::optional<std::string> read_file(const std::string& path, size_t max_bytes){
    std::ifstream f(path, std::ios::binary); if(!f) return std::nullopt;
    std::string out; char buf[8192];
    while(f && out.size() < max_bytes){
        size_t want = std::min(sizeof(buf), max_bytes - out.size());
        f.read(buf, static_cast<std::streamsize>(want));
        std::streamsize got = f.gcount(); if(got<=0) break;
        out.append(buf, static_cast<size_t>(got));
    }
    return out;
}

std::string trim(const std::string& s){
    size_t b = 0, e = s.size();
    while(b<e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while(e>b && std::isspace(static_cast<unsigned char>(s[e-1]))) --e;
    return s.substr(b, e-b);
}

std::string to_lower(std::string s){
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

std::vector<std::string> split_csv(const std::string& s){
    std::vector<std::string> out; std::string cur;
    for(char c: s){ if(c==','){ cur = trim(cur); if(!cur.empty()) out.push_back(cur); cur.clear(); } else cur.push_back(c); }
    cur = trim(cur); if(!cur.empty()) out.push_back(cur);
    return out;
}

bool starts_with(const std::string& s, const std::string& prefix){ return s.rfind(prefix, 0) == 0; }

bool ends_with(const std::string& s, const std::string& suffix){
    return s.size() >= suffix.size() && s.compare(s.size()-suffix.size(), suffix.size(), suffix) == 0;
}

bool contains_any(const std::string& s, const std::vector<std::string>& needles){
    for(const auto& n: needles){ if(!n.empty() && s.find(n)!=std::string::npos) return true; }
    return false;
}

std::string sha256_hex(const std::string& data){
    unsigned char md[EVP_MAX_MD_SIZE]; unsigned int mdlen = 0;
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    std::string hexsum;
    if(ctx && EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr)==1
       && EVP_DigestUpdate(ctx, data.data(), data.size())==1
       && EVP_DigestFinal_ex(ctx, md, &mdlen)==1){
        static const char* hx = "0123456789abcdef";
        hexsum.reserve(mdlen*2);
        for(unsigned i=0;i<mdlen;i++){ hexsum.push_back(hx[md[i]>>4]); hexsum.push_back(hx[md[i]&0xF]); }
    }
    if(ctx) EVP_MD_CTX_free(ctx);
    return hexsum;
}

std::optional<std::chrono::system_clock::time_point> parse_iso8601(const std::string& raw){
    std::string s = trim(raw);
    if(!s.empty() && (s.back()=='Z' || s.back()=='z')) s.pop_back();
    int Y=0,M=0,D=0,h=0,m=0,sec=0; char tail=0;
    int n = std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%c", &Y,&M,&D,&h,&m,&sec,&tail);
    if(n==6){
        // full timestamp
    } else if(n==3 && s.size()==10){
        h=m=sec=0;
    } else {
        return std::nullopt;
    }
    if(M<1 || M>12 || D<1 || D>31 || h<0 || h>23 || m<0 || m>59 || sec<0 || sec>60) return std::nullopt;
    std::tm tm{}; tm.tm_year = Y-1900; tm.tm_mon = M-1; tm.tm_mday = D; tm.tm_hour = h; tm.tm_min = m; tm.tm_sec = sec;
    std::time_t t = timegm(&tm);
    if(t == static_cast<std::time_t>(-1)) return std::nullopt;
    return std::chrono::system_clock::from_time_t(t);
}

std::vector<KeyValueBlock> parse_kv_blocks(const std::vector<std::string>& lines, const std::string& start_key, const std::string& source){
    std::vector<KeyValueBlock> blocks;
    for(size_t i=0;i<lines.size();++i){
        std::string line = trim(lines[i]);
        if(line.empty() || line[0]=='#') continue;
        auto eq = line.find('=');
        if(eq==std::string::npos){
            if(!blocks.empty()) blocks.back().malformed.push_back(line);
            continue;
        }
        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq+1));
        if(key == start_key){
            KeyValueBlock b; b.source = source; b.line = i+1;
            blocks.push_back(std::move(b));
        }
        if(blocks.empty()) continue; // keys before the first start key belong to no block
        blocks.back().values[key] = value;
    }
    return blocks;
}

std::vector<std::string> list_input_files(const std::string& path, const std::string& extension){
    std::vector<std::string> out; std::error_code ec;
    if(fs::is_regular_file(path, ec)){ out.push_back(path); return out; }
    if(!fs::is_directory(path, ec)) return out;
    for(const auto& entry : fs::directory_iterator(path, fs::directory_options::skip_permission_denied, ec)){
        if(ec) break;
        if(!entry.is_regular_file(ec)) continue;
        if(entry.path().extension() == extension) out.push_back(entry.path().string());
    }
    std::sort(out.begin(), out.end());
    return out;
}

}
}
