#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "core/GapAnalyzer.h"
#include "core/IdentityKey.h"
#include "core/Reconciler.h"
#include <algorithm>

namespace asset_scan {

namespace {

using clock_t_ = std::chrono::system_clock;

DiscoveredAsset make_asset(const std::string& locator, std::map<std::string, std::string> attrs = {}) {
    DiscoveredAsset a;
    a.locators = {locator};
    a.identity_keys = {identity_key(locator)};
    a.asset_id = Reconciler::make_asset_id(a.identity_keys);
    a.asset_type = AssetType::PostgreSQL;
    a.confidence_score = 0.9;
    a.confidence_level = ConfidenceLevel::High;
    a.attributes = std::move(attrs);
    return a;
}

DocumentationEntry make_entry(const std::string& key, double completeness, clock_t_::time_point updated, const std::string& owner = "") {
    DocumentationEntry e;
    e.key = key;
    e.completeness_score = completeness;
    e.last_updated = updated;
    e.owner = owner;
    e.source = "catalog.doc";
    e.line = 1;
    return e;
}

size_t count_kind(const GapAnalysis& a, GapKind k) {
    return static_cast<size_t>(std::count_if(a.gaps.begin(), a.gaps.end(), [k](const Gap& g){ return g.kind == k; }));
}

}

class GapAnalyzerTest : public ::testing::Test {
protected:
    clock_t_::time_point now = clock_t_::from_time_t(1717200000); // 2024-06-01
    DocumentationIndex docs;
    RuleSet rules;
};

TEST_F(GapAnalyzerTest, UnownedUndocumentedAssetIsOrphaned) {
    auto asset = make_asset("/srv/a.db");
    auto result = GapAnalyzer().analyze({asset}, docs, rules, now);
    ASSERT_EQ(count_kind(result, GapKind::Orphaned), 1u);
    const Gap& g = result.gaps[0];
    EXPECT_EQ(g.gap_id, orphaned_gap_id(asset.asset_id));
    EXPECT_EQ(g.asset_id.value(), asset.asset_id);
    EXPECT_EQ(g.severity, Severity::Medium);
    EXPECT_EQ(g.detected_at, now);
    EXPECT_FALSE(g.evidence.empty());
    EXPECT_EQ(result.gaps.size(), 1u);
}

TEST_F(GapAnalyzerTest, GivingAnOwnerRemovesOrphanedGap) {
    auto asset = make_asset("/srv/a.db");
    GapAnalyzer analyzer;
    EXPECT_EQ(count_kind(analyzer.analyze({asset}, docs, rules, now), GapKind::Orphaned), 1u);
    asset.attributes["owner"] = "payments";
    auto again = analyzer.analyze({asset}, docs, rules, now);
    EXPECT_EQ(count_kind(again, GapKind::Orphaned), 0u);
    ASSERT_EQ(count_kind(again, GapKind::Documentation), 1u);
    EXPECT_THAT(again.gaps[0].issues, ::testing::ElementsAre(DocumentationIssue::Missing));
}

TEST_F(GapAnalyzerTest, DocumentedAssetIsNeverOrphaned) {
    auto asset = make_asset("/srv/a.db");
    docs.add(make_entry("/srv/a.db", 0.9, now));
    auto result = GapAnalyzer().analyze({asset}, docs, rules, now);
    EXPECT_TRUE(result.gaps.empty());
}

TEST_F(GapAnalyzerTest, CriticalAssetRaisesSeverity) {
    auto asset = make_asset("/srv/a.db", {{"criticality", "critical"}});
    auto result = GapAnalyzer().analyze({asset}, docs, rules, now);
    ASSERT_EQ(result.gaps.size(), 1u);
    EXPECT_EQ(result.gaps[0].severity, Severity::High);
}

TEST_F(GapAnalyzerTest, IncompleteAndStaleDocumentation) {
    auto asset = make_asset("/srv/a.db");
    docs.add(make_entry(asset.asset_id, 0.5, now - std::chrono::hours(24 * 200)));
    auto result = GapAnalyzer().analyze({asset}, docs, rules, now);
    ASSERT_EQ(result.gaps.size(), 1u);
    const Gap& g = result.gaps[0];
    EXPECT_EQ(g.kind, GapKind::Documentation);
    EXPECT_EQ(g.entry_key, asset.asset_id);
    EXPECT_THAT(g.issues, ::testing::ElementsAre(DocumentationIssue::Incomplete, DocumentationIssue::Stale));
    EXPECT_EQ(g.evidence.size(), 2u);
}

TEST_F(GapAnalyzerTest, ThresholdsAreConfigurable) {
    auto asset = make_asset("/srv/a.db");
    docs.add(make_entry("/srv/a.db", 0.5, now - std::chrono::hours(24 * 200)));
    GapAnalysisOptions opts;
    opts.completeness_threshold = 0.4;
    opts.staleness_days = 365;
    auto result = GapAnalyzer(opts).analyze({asset}, docs, rules, now);
    EXPECT_TRUE(result.gaps.empty());
}

TEST_F(GapAnalyzerTest, NoRulesMeansNoComplianceGaps) {
    auto asset = make_asset("/srv/a.db", {{"owner", "x"}});
    docs.add(make_entry("/srv/a.db", 1.0, now));
    auto result = GapAnalyzer().analyze({asset}, docs, rules, now);
    EXPECT_EQ(count_kind(result, GapKind::Compliance), 0u);
}

TEST_F(GapAnalyzerTest, FailingRuleProducesComplianceGap) {
    auto ok = make_asset("/srv/a.db", {{"owner", "x"}, {"encryption_at_rest", "true"}});
    auto bad = make_asset("/srv/b.db", {{"owner", "y"}});
    docs.add(make_entry("/srv/a.db", 1.0, now));
    docs.add(make_entry("/srv/b.db", 1.0, now));
    ComplianceRule r;
    r.id = "GDPR-ENC-1";
    r.framework = "gdpr";
    r.predicate = PredicateKind::AttributeEquals;
    r.predicate_name = "attribute_equals";
    r.field = "encryption_at_rest";
    r.value = "true";
    r.severity = Severity::High;
    r.description = "Encrypt personal data at rest";
    rules.add(r);

    auto result = GapAnalyzer().analyze({ok, bad}, docs, rules, now);
    ASSERT_EQ(result.gaps.size(), 1u);
    const Gap& g = result.gaps[0];
    EXPECT_EQ(g.kind, GapKind::Compliance);
    EXPECT_EQ(g.gap_id, compliance_gap_id("gdpr", "GDPR-ENC-1", bad.asset_id));
    EXPECT_EQ(g.framework, "gdpr");
    EXPECT_EQ(g.severity, Severity::High);
    EXPECT_EQ(g.violated_rule, "Encrypt personal data at rest");
    EXPECT_THAT(g.evidence, ::testing::Contains("encryption_at_rest = <absent>"));
}

TEST_F(GapAnalyzerTest, UnsupportedPredicateIsSkippedNotFailed) {
    ComplianceRule r;
    r.id = "FUTURE";
    r.framework = "nist";
    r.predicate = PredicateKind::Unknown;
    r.predicate_name = "retention_days_at_most";
    rules.add(r);
    auto asset = make_asset("/srv/a.db", {{"owner", "x"}});
    docs.add(make_entry("/srv/a.db", 1.0, now));
    auto result = GapAnalyzer().analyze({asset}, docs, rules, now);
    EXPECT_TRUE(result.gaps.empty());
    ASSERT_EQ(result.skipped_rules.size(), 1u);
    EXPECT_EQ(result.skipped_rules[0].rule_id, "FUTURE");
}

TEST_F(GapAnalyzerTest, DanglingEntriesAreSystemicLowSeverityGaps) {
    docs.add(make_entry("/srv/gone.db", 1.0, now));
    docs.add(make_entry("/srv/gone.db", 0.2, now));
    auto result = GapAnalyzer().analyze({}, docs, rules, now);
    ASSERT_EQ(result.gaps.size(), 1u);
    const Gap& g = result.gaps[0];
    EXPECT_TRUE(g.systemic());
    EXPECT_EQ(g.severity, Severity::Low);
    EXPECT_THAT(g.issues, ::testing::ElementsAre(DocumentationIssue::Dangling));
    EXPECT_EQ(g.gap_id, dangling_documentation_gap_id("/srv/gone.db"));
}

TEST_F(GapAnalyzerTest, DanglingSuppressedForTruncatedRunsOrWhenDisabled) {
    docs.add(make_entry("/srv/gone.db", 1.0, now));
    GapAnalysisOptions truncated;
    truncated.truncated_run = true;
    EXPECT_TRUE(GapAnalyzer(truncated).analyze({}, docs, rules, now).gaps.empty());
    GapAnalysisOptions off;
    off.report_dangling = false;
    EXPECT_TRUE(GapAnalyzer(off).analyze({}, docs, rules, now).gaps.empty());
}

TEST_F(GapAnalyzerTest, OutputIsDeterministicAndSorted) {
    std::vector<DiscoveredAsset> inventory;
    for (int i = 0; i < 30; ++i) {
        std::map<std::string, std::string> attrs;
        if (i % 3 == 0) attrs["owner"] = "team" + std::to_string(i);
        inventory.push_back(make_asset("/srv/db" + std::to_string(i) + ".db", attrs));
    }
    GapAnalyzer analyzer;
    auto first = analyzer.analyze(inventory, docs, rules, now);
    auto second = analyzer.analyze(inventory, docs, rules, now);
    ASSERT_EQ(first.gaps.size(), 30u);
    ASSERT_EQ(first.gaps.size(), second.gaps.size());
    for (size_t i = 0; i < first.gaps.size(); ++i) EXPECT_EQ(first.gaps[i].gap_id, second.gaps[i].gap_id);
    EXPECT_TRUE(std::is_sorted(first.gaps.begin(), first.gaps.end(), [](const Gap& a, const Gap& b){ return a.gap_id < b.gap_id; }));
}

}
