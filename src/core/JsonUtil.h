#pragma once
#include <string>
#include <chrono>

namespace asset_scan {
namespace jsonutil {

std::string escape(const std::string& s);
// ISO-8601 UTC with second precision; empty for a default-constructed time point.
std::string time_to_iso(std::chrono::system_clock::time_point tp);
// Fixed six-decimal rendering so repeated runs serialise scores identically.
std::string format_double(double v);

}
}
