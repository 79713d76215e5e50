#include <gtest/gtest.h>
#include "core/ConfigValidator.h"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace asset_scan {

class ConfigValidatorTest : public ::testing::Test {
protected:
    Config cfg;
    ConfigValidator validator;
};

TEST_F(ConfigValidatorTest, DefaultsAreValid) {
    EXPECT_TRUE(validator.validate(cfg));
}

TEST_F(ConfigValidatorTest, CompactWinsOverPretty) {
    cfg.pretty = true;
    cfg.compact = true;
    EXPECT_TRUE(validator.validate(cfg));
    EXPECT_FALSE(cfg.pretty);
}

TEST_F(ConfigValidatorTest, NdjsonExcludesOtherFormats) {
    cfg.ndjson = true;
    cfg.pretty = true;
    testing::internal::CaptureStderr();
    EXPECT_FALSE(validator.validate(cfg));
    EXPECT_NE(testing::internal::GetCapturedStderr().find("--ndjson"), std::string::npos);
}

TEST_F(ConfigValidatorTest, RejectsBadSeverityAndLogLevel) {
    cfg.fail_on_severity = "urgent";
    EXPECT_FALSE(validator.validate(cfg));
    cfg.fail_on_severity = " HIGH ";
    EXPECT_TRUE(validator.validate(cfg));
    cfg.log_level = "chatty";
    EXPECT_FALSE(validator.validate(cfg));
}

TEST_F(ConfigValidatorTest, RejectsConflictingModuleSelection) {
    cfg.enable_modules = {"network"};
    cfg.disable_modules = {"network"};
    EXPECT_FALSE(validator.validate(cfg));
}

TEST_F(ConfigValidatorTest, RejectsOutOfRangeNumbers) {
    struct Case { const char* name; void (*mutate)(Config&); };
    const Case cases[] = {
        {"zero budget", [](Config& c){ c.budget_seconds = 0; }},
        {"negative module timeout", [](Config& c){ c.module_timeout_seconds = -1; }},
        {"negative grace", [](Config& c){ c.grace_ms = -5; }},
        {"no workers", [](Config& c){ c.max_workers = 0; }},
        {"no memory", [](Config& c){ c.memory_ceiling_mb = 0; }},
        {"completeness above one", [](Config& c){ c.completeness_threshold = 1.5; }},
        {"negative weight", [](Config& c){ c.weight_exposure = -0.1; }},
        {"all zero weights", [](Config& c){ c.weight_severity = c.weight_regulatory = c.weight_exposure = 0; }},
        {"keep cap without drop", [](Config& c){ c.keep_cap_dac = true; }},
    };
    for (const auto& tc : cases) {
        Config c;
        tc.mutate(c);
        EXPECT_FALSE(validator.validate(c)) << tc.name;
    }
}

TEST_F(ConfigValidatorTest, ClampsHugeTimeouts) {
    cfg.budget_seconds = 1e18;
    cfg.module_timeout_seconds = 1e300;
    EXPECT_TRUE(validator.validate(cfg));
    EXPECT_DOUBLE_EQ(cfg.budget_seconds, kMaxRunSeconds);
    EXPECT_DOUBLE_EQ(cfg.module_timeout_seconds, kMaxRunSeconds);
}

TEST_F(ConfigValidatorTest, RejectsNotANumberTimeouts) {
    cfg.budget_seconds = std::nan("");
    EXPECT_FALSE(validator.validate(cfg));
    Config other;
    other.module_timeout_seconds = std::nan("");
    EXPECT_FALSE(validator.validate(other));
}

TEST_F(ConfigValidatorTest, NormalisesPathsAndExtensions) {
    cfg.scan_paths = {"/srv", " /srv ", "", "/data"};
    cfg.db_extensions = {"DB", ".SQLite"};
    EXPECT_TRUE(validator.validate(cfg));
    EXPECT_EQ(cfg.scan_paths, (std::vector<std::string>{"/srv", "/data"}));
    EXPECT_EQ(cfg.db_extensions, (std::vector<std::string>{".db", ".sqlite"}));
    cfg.scan_paths = {""};
    EXPECT_FALSE(validator.validate(cfg));
}

TEST_F(ConfigValidatorTest, SeverityRank) {
    EXPECT_EQ(validator.severity_rank("info"), 0);
    EXPECT_EQ(validator.severity_rank("Critical"), 4);
    EXPECT_EQ(validator.severity_rank("bogus"), -1);
    EXPECT_TRUE(validator.validate_severity("", "--fail-on"));
}

TEST_F(ConfigValidatorTest, LoadsDocumentationAndRules) {
    fs::path dir = fs::temp_directory_path() / ("asset_scan_cfg_" + std::to_string(::getpid()));
    fs::create_directories(dir);
    {
        std::ofstream(dir / "catalog.doc") << "asset=/srv/a.db\ncompleteness=0.9\nlast_updated=2024-01-01\n"
                                            << "asset=/srv/b.db\ncompleteness=7\nlast_updated=2024-01-01\n";
        std::ofstream(dir / "gdpr.rule") << "id=GDPR-1\nframework=gdpr\npredicate=attribute_present\nfield=owner\n";
    }
    cfg.docs_path = (dir / "catalog.doc").string();
    cfg.rules_path = (dir / "gdpr.rule").string();
    GapInputs inputs;
    EXPECT_TRUE(validator.load_external_files(cfg, inputs));
    fs::remove_all(dir);
    EXPECT_EQ(inputs.documentation.entries().size(), 1u);
    EXPECT_EQ(inputs.rules.rules().size(), 1u);
    ASSERT_EQ(inputs.errors.size(), 1u);
    EXPECT_EQ(inputs.errors[0].code, WarnCode::InvalidDocumentationEntry);
}

TEST_F(ConfigValidatorTest, MissingInputPathFails) {
    cfg.rules_path = "/nonexistent/asset_scan/rules";
    GapInputs inputs;
    testing::internal::CaptureStderr();
    EXPECT_FALSE(validator.load_external_files(cfg, inputs));
    EXPECT_NE(testing::internal::GetCapturedStderr().find("Rules path"), std::string::npos);
}

}
