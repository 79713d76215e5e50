#pragma once
#include <string>

namespace asset_scan {

enum class Severity { Info=0, Low=1, Medium=2, High=3, Critical=4 };

const char* severity_to_string(Severity s);
// Case-insensitive; false when the text names no severity.
bool parse_severity(const std::string& text, Severity& out);
inline int severity_rank(Severity s){ return static_cast<int>(s); }

}
