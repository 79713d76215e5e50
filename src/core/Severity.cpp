#include "Severity.h"
#include "Utils.h"

namespace asset_scan {

const char* severity_to_string(Severity s){
    switch(s){
        case Severity::Info: return "info";
        case Severity::Low: return "low";
        case Severity::Medium: return "medium";
        case Severity::High: return "high";
        case Severity::Critical: return "critical";
    }
    return "info";
}

bool parse_severity(const std::string& text, Severity& out){
    std::string s = utils::to_lower(utils::trim(text));
    if(s=="info") { out = Severity::Info; return true; }
    if(s=="low") { out = Severity::Low; return true; }
    if(s=="medium") { out = Severity::Medium; return true; }
    if(s=="high") { out = Severity::High; return true; }
    if(s=="critical") { out = Severity::Critical; return true; }
    return false;
}

}
