#include "ReportAssembler.h"
#include "Reconciler.h"
#include "JsonUtil.h"
#include "Utils.h"
#include "Logging.h"

namespace asset_scan {

ReportStatistics ReportAssembler::statistics(const std::vector<DiscoveredAsset>& assets, const std::vector<GapPriorityScore>& gaps, size_t observations){
    ReportStatistics st;
    st.total_assets = assets.size();
    st.total_observations = observations;
    st.total_gaps = gaps.size();
    for(const auto& a : assets){
        ++st.assets_by_type[asset_type_to_string(a.asset_type)];
        ++st.assets_by_confidence[confidence_level_to_string(a.confidence_level)];
        for(auto m : a.supporting_methods) ++st.assets_by_method[method_to_string(m)];
        if(a.validated) ++st.validated_assets;
        if(a.attribute(attr::CredentialExposure) == "true") ++st.credential_exposures;
    }
    for(const auto& g : gaps){
        ++st.gaps_by_kind[gap_kind_to_string(g.gap.kind)];
        ++st.gaps_by_severity[severity_to_string(g.gap.severity)];
    }
    return st;
}

DiscoveryReport ReportAssembler::assemble(const DiscoveryOutcome& outcome,
                                          std::vector<DiscoveredAsset> assets,
                                          std::vector<GapPriorityScore> gaps,
                                          const Report& journal,
                                          std::vector<ValidationError> validation_errors,
                                          std::vector<SkippedRule> skipped_rules) const {
    DiscoveryReport r;
    r.start_time = outcome.start_time;
    r.end_time = outcome.end_time;
    r.truncated = outcome.truncated || journal.truncated();
    r.modules = journal.modules();
    r.warnings = journal.warnings();
    r.statistics = statistics(assets, gaps, outcome.observations.size());
    r.resource_plan = GapPrioritizer::plan(gaps);

    std::string seed = jsonutil::time_to_iso(r.start_time);
    for(const auto& a : assets) seed += "|" + a.asset_id;
    r.report_id = "report-" + utils::sha256_hex(seed).substr(0, 16);

    r.assets = std::move(assets);
    r.gaps = std::move(gaps);
    r.validation_errors = std::move(validation_errors);
    r.skipped_rules = std::move(skipped_rules);
    return r;
}

DiscoveryReport run_pipeline(const Config& cfg, DiscoveryOrchestrator& orchestrator, const GapInputs& inputs){
    PriorityWeights weights{cfg.weight_severity, cfg.weight_regulatory, cfg.weight_exposure};
    GapPrioritizer prioritizer(weights); // validates weights before any module runs

    Report journal;
    DiscoveryOutcome outcome = orchestrator.run(cfg, journal);

    Reconciler reconciler;
    auto assets = reconciler.reconcile(outcome.observations, &journal);
    Logger::instance().info("Reconciled " + std::to_string(outcome.observations.size()) + " observations into " +
                            std::to_string(assets.size()) + " assets");
    size_t validated = validate_assets(assets);
    Logger::instance().debug("Validated " + std::to_string(validated) + " of " + std::to_string(assets.size()) + " assets");

    GapAnalysisOptions opts;
    opts.staleness_days = cfg.staleness_days;
    opts.completeness_threshold = cfg.completeness_threshold;
    opts.report_dangling = cfg.report_dangling_docs;
    opts.truncated_run = outcome.truncated;
    GapAnalyzer analyzer(opts);
    auto analysis = analyzer.analyze(assets, inputs.documentation, inputs.rules, std::chrono::system_clock::now());
    for(const auto& s : analysis.skipped_rules) journal.add_warning(s.rule_id, WarnCode::SkippedRule, s.reason);

    auto scores = prioritizer.prioritize(analysis.gaps, assets);
    Logger::instance().info("Identified " + std::to_string(scores.size()) + " gaps");

    ReportAssembler assembler;
    return assembler.assemble(outcome, std::move(assets), std::move(scores), journal, inputs.errors, std::move(analysis.skipped_rules));
}

}
