#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "core/JSONWriter.h"
#include "core/Config.h"
#include "core/DiscoveryReport.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdlib>
#include <sstream>

namespace asset_scan {

class JSONWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        ::setenv("ASSET_SCAN_META_HOSTNAME", "test-host", 1);
        ::unsetenv("ASSET_SCAN_CANON_TIME_ZERO");

        report.report_id = "report-0123456789abcdef";
        report.start_time = std::chrono::system_clock::from_time_t(86400);
        report.end_time = report.start_time + std::chrono::milliseconds(1500);

        DiscoveredAsset asset;
        asset.asset_id = "asset-aaaa";
        asset.asset_type = AssetType::PostgreSQL;
        asset.locators = {"localhost:5432", "container:orders_pg"};
        asset.identity_keys = {"container:orders_pg", "net:localhost:5432"};
        asset.supporting_methods = {DiscoveryMethod::Container, DiscoveryMethod::Network};
        asset.observation_count = 2;
        asset.confidence_score = 0.97;
        asset.confidence_level = ConfidenceLevel::High;
        asset.attributes = {{"engine", "postgresql"}, {"note", "line\nbreak \"quoted\""}};
        asset.validation_errors = {"no connection information"};
        report.assets.push_back(asset);

        GapPriorityScore doc;
        doc.gap.gap_id = dangling_documentation_gap_id("/srv/gone.db");
        doc.gap.kind = GapKind::Documentation;
        doc.gap.severity = Severity::Low;
        doc.gap.issues = {DocumentationIssue::Dangling};
        doc.gap.entry_key = "/srv/gone.db";
        doc.composite_score = 1.4;
        doc.priority_level = PriorityLevel::Medium;
        doc.effort_hours = 3.2;
        doc.team = "documentation";

        GapPriorityScore comp;
        comp.gap.gap_id = compliance_gap_id("gdpr", "GDPR-ENC-1", "asset-aaaa");
        comp.gap.kind = GapKind::Compliance;
        comp.gap.asset_id = "asset-aaaa";
        comp.gap.severity = Severity::High;
        comp.gap.framework = "gdpr";
        comp.gap.rule_id = "GDPR-ENC-1";
        comp.gap.violated_rule = "Encrypt personal data at rest";
        comp.gap.evidence = {"encryption_at_rest = <absent>"};
        comp.composite_score = 3.0;
        comp.contributing_factors = {{"severity", 1.0}, {"regulatory", 1.0}, {"exposure", 1.0}};
        comp.priority_level = PriorityLevel::Critical;
        comp.effort_hours = 15.6;
        comp.team = "compliance";
        report.gaps = {comp, doc};

        ModuleRun fs;
        fs.name = "filesystem";
        fs.status = ModuleStatus::Completed;
        fs.observation_count = 4;
        ModuleRun ct;
        ct.name = "container";
        ct.method = DiscoveryMethod::Container;
        ct.status = ModuleStatus::Skipped;
        ct.reason = "no compose files in scope";
        report.modules = {fs, ct};
        report.warnings.push_back({"container", WarnCode::ModuleUnavailable, "no compose files in scope"});
        report.validation_errors.push_back({"bad.rule", 7, WarnCode::InvalidRuleDefinition, "unknown framework 'hipaa'"});
        report.skipped_rules.push_back({"FUTURE-1", "unsupported predicate 'retention_days_at_most'"});
        report.statistics.total_assets = 1;
        report.statistics.total_gaps = 2;
        report.statistics.credential_exposures = 1;
        report.statistics.assets_by_type["postgresql"] = 1;
        report.resource_plan.immediate = 1;
        report.resource_plan.scheduled = 1;
    }
    void TearDown() override {
        ::unsetenv("ASSET_SCAN_META_HOSTNAME");
        ::unsetenv("ASSET_SCAN_CANON_TIME_ZERO");
    }

    Config config;
    DiscoveryReport report;
    JSONWriter writer;
};

TEST_F(JSONWriterTest, EmptyReport) {
    DiscoveryReport empty;
    std::string json_output = writer.write(empty, config);
    nlohmann::json parsed;
    ASSERT_NO_THROW(parsed = nlohmann::json::parse(json_output));
    EXPECT_TRUE(parsed["assets"].is_array());
    EXPECT_TRUE(parsed["gaps"].empty());
    EXPECT_TRUE(parsed["skipped_modules"].empty());
    EXPECT_EQ(parsed["meta"]["truncated"], false);
    EXPECT_EQ(parsed["statistics"]["total_assets"], 0);
}

TEST_F(JSONWriterTest, MetaBlock) {
    nlohmann::json parsed = nlohmann::json::parse(writer.write(report, config));
    const auto& meta = parsed["meta"];
    EXPECT_EQ(meta["report_id"], "report-0123456789abcdef");
    EXPECT_EQ(meta["hostname"], "test-host");
    EXPECT_EQ(meta["start_time"], "1970-01-02T00:00:00Z");
    EXPECT_EQ(meta["duration_ms"], 1500);
    EXPECT_EQ(meta["json_schema_version"], "1");
    EXPECT_FALSE(meta.contains("normalized_time"));
}

TEST_F(JSONWriterTest, AssetsAndEscaping) {
    nlohmann::json parsed = nlohmann::json::parse(writer.write(report, config));
    ASSERT_EQ(parsed["assets"].size(), 1u);
    const auto& a = parsed["assets"][0];
    EXPECT_EQ(a["asset_type"], "postgresql");
    EXPECT_EQ(a["confidence_level"], "high");
    EXPECT_DOUBLE_EQ(a["confidence_score"].get<double>(), 0.97);
    EXPECT_EQ(a["supporting_methods"], nlohmann::json::array({"container", "network"}));
    EXPECT_EQ(a["attributes"]["note"], "line\nbreak \"quoted\"");
    EXPECT_EQ(a["validated"], false);
    EXPECT_EQ(a["validation_errors"], nlohmann::json::array({"no connection information"}));
    EXPECT_EQ(parsed["statistics"]["credential_exposures"], 1);
    EXPECT_EQ(parsed["statistics"]["validated_assets"], 0);
}

TEST_F(JSONWriterTest, GapsKeepPriorityOrderWithRanks) {
    nlohmann::json parsed = nlohmann::json::parse(writer.write(report, config));
    const auto& gaps = parsed["gaps"];
    ASSERT_EQ(gaps.size(), 2u);
    EXPECT_EQ(gaps[0]["rank"], 1);
    EXPECT_EQ(gaps[0]["kind"], "compliance");
    EXPECT_EQ(gaps[0]["framework"], "gdpr");
    EXPECT_EQ(gaps[0]["priority_level"], "critical");
    EXPECT_DOUBLE_EQ(gaps[0]["contributing_factors"]["regulatory"].get<double>(), 1.0);
    EXPECT_EQ(gaps[1]["rank"], 2);
    EXPECT_TRUE(gaps[1]["asset_id"].is_null());
    EXPECT_EQ(gaps[1]["issues"], nlohmann::json::array({"dangling"}));
    EXPECT_EQ(gaps[1]["entry_key"], "/srv/gone.db");
    EXPECT_FALSE(gaps[1].contains("framework"));
}

TEST_F(JSONWriterTest, ModulesWarningsAndErrors) {
    nlohmann::json parsed = nlohmann::json::parse(writer.write(report, config));
    ASSERT_EQ(parsed["modules"].size(), 2u);
    EXPECT_EQ(parsed["modules"][0]["status"], "completed");
    EXPECT_EQ(parsed["modules"][0]["truncated"], false);
    ASSERT_EQ(parsed["skipped_modules"].size(), 1u);
    EXPECT_EQ(parsed["skipped_modules"][0]["name"], "container");
    EXPECT_EQ(parsed["warnings"][0]["code"], "module_unavailable");
    EXPECT_EQ(parsed["validation_errors"][0]["line"], 7);
    EXPECT_EQ(parsed["skipped_rules"][0]["rule_id"], "FUTURE-1");
    EXPECT_EQ(parsed["resource_plan"]["immediate"], 1);
}

TEST_F(JSONWriterTest, OutputIsByteIdenticalAcrossWrites) {
    EXPECT_EQ(writer.write(report, config), writer.write(report, config));
    std::string out = writer.write(report, config);
    EXPECT_LT(out.find("\"assets\""), out.find("\"gaps\""));
    EXPECT_LT(out.find("\"gaps\""), out.find("\"meta\""));
}

TEST_F(JSONWriterTest, CanonicalTimeZero) {
    ::setenv("ASSET_SCAN_CANON_TIME_ZERO", "1", 1);
    nlohmann::json parsed = nlohmann::json::parse(writer.write(report, config));
    EXPECT_EQ(parsed["meta"]["start_time"], "");
    EXPECT_EQ(parsed["meta"]["duration_ms"], 0);
    EXPECT_EQ(parsed["meta"]["normalized_time"], true);
}

TEST_F(JSONWriterTest, PrettyOutputParsesToSameDocument) {
    std::string compact = writer.write(report, config);
    config.pretty = true;
    std::string pretty = writer.write(report, config);
    EXPECT_NE(compact, pretty);
    EXPECT_NE(pretty.find("\n  \"assets\""), std::string::npos);
    EXPECT_EQ(nlohmann::json::parse(compact), nlohmann::json::parse(pretty));
}

TEST_F(JSONWriterTest, NdjsonEmitsOneTypedObjectPerLine) {
    config.ndjson = true;
    std::istringstream in(writer.write(report, config));
    std::vector<std::string> types;
    std::string line;
    while (std::getline(in, line)) {
        auto obj = nlohmann::json::parse(line);
        types.push_back(obj["type"].get<std::string>());
    }
    EXPECT_THAT(types, ::testing::ElementsAre("meta", "summary", "module", "module", "asset", "gap", "gap",
                                              "warning", "validation_error"));
}

}
