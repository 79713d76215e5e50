#include "core/ArgumentParser.h"
#include "core/ConfigValidator.h"
#include "core/DiscoveryOrchestrator.h"
#include "core/ModuleCatalog.h"
#include "core/ReportAssembler.h"
#include "core/JSONWriter.h"
#include "core/Logging.h"
#include "core/Privilege.h"
#include "core/Severity.h"
#include <iostream>
#include <fstream>

using namespace asset_scan;

int main(int argc, char** argv) {
    Logger::instance().set_level(LogLevel::Info);
    Config cfg;
    ArgumentParser parser;
    if(!parser.parse(argc, argv, cfg)){
        if(parser.help_requested()){ parser.print_help(); return 0; }
        if(parser.version_requested()){ parser.print_version(); return 0; }
        std::cerr << parser.error() << "\n";
        parser.print_help();
        return 2;
    }

    ConfigValidator validator;
    if(!validator.validate(cfg)) return 2;
    LogLevel lvl;
    if(parse_log_level(cfg.log_level, lvl)) Logger::instance().set_level(lvl);

    GapInputs inputs;
    if(!validator.load_external_files(cfg, inputs)) return 2;

    if(cfg.drop_priv && !drop_capabilities(cfg.keep_cap_dac)){
        Logger::instance().warn("Continuing without dropping capabilities");
    }
    if(cfg.seccomp && !apply_seccomp_profile()){
        Logger::instance().warn("Continuing without seccomp profile");
    }

    DiscoveryOrchestrator orchestrator(default_modules(cfg));
    DiscoveryReport report;
    try {
        report = run_pipeline(cfg, orchestrator, inputs);
    } catch(const ConfigError& ex){
        std::cerr << "Configuration error: " << ex.what() << "\n";
        return 2;
    }

    JSONWriter writer;
    std::string json = writer.write(report, cfg);
    if(cfg.output_file.empty()){
        std::cout << json;
        if(!cfg.ndjson && !cfg.pretty) std::cout << "\n";
    } else {
        std::ofstream ofs(cfg.output_file);
        if(!ofs){
            std::cerr << "Failed to open output file: " << cfg.output_file << "\n";
            return 2;
        }
        ofs << json;
    }

    if(!cfg.fail_on_severity.empty()){
        Severity threshold;
        if(parse_severity(cfg.fail_on_severity, threshold)){
            for(const auto& g : report.gaps){
                if(severity_rank(g.gap.severity) >= severity_rank(threshold)) return 1;
            }
        }
    }
    return 0;
}
