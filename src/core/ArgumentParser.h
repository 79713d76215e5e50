#pragma once
#include <string>
#include <vector>
#include <functional>
#include "Config.h"

namespace asset_scan {

// Table-driven command line parsing into Config.
class ArgumentParser {
public:
    enum class ArgKind { None, String, Int, Double, CSV };
    struct FlagSpec {
        const char* name;
        ArgKind kind;
        const char* metavar;
        const char* help;
        std::function<void(Config&, const std::string&)> apply;
    };

    ArgumentParser();

    // false on --help, --version or an error; see help_requested() / version_requested() / error().
    bool parse(int argc, char** argv, Config& cfg);
    void print_help() const;
    void print_version() const;

    bool help_requested() const { return help_; }
    bool version_requested() const { return version_; }
    const std::string& error() const { return error_; }
    const std::vector<FlagSpec>& specs() const { return specs_; }
private:
    const FlagSpec* find_spec(const std::string& flag) const;
    std::vector<FlagSpec> specs_;
    bool help_ = false;
    bool version_ = false;
    std::string error_;
};

}
