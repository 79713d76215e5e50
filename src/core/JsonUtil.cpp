#include "JsonUtil.h"
#include <cstdio>
#include <ctime>

namespace asset_scan {
namespace jsonutil {

std::string escape(const std::string& s){
    std::string out; out.reserve(s.size()+8);
    for(char c: s){
        switch(c){
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){
                    char buf[7]; std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c)); out += buf;
                } else out.push_back(c);
        }
    }
    return out;
}

std::string time_to_iso(std::chrono::system_clock::time_point tp){
    if(tp.time_since_epoch().count()==0) return "";
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{}; gmtime_r(&t, &tm);
    char buf[32]; std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

std::string format_double(double v){
    char buf[64]; std::snprintf(buf, sizeof(buf), "%.6f", v);
    return buf;
}

}
}
