#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "common/logging.h"
#include "config/audit_config.h"
#include "config/config_loader.h"

using namespace UiAudit;

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        timestamp_ = std::to_string(std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
        Common::initLogging(("logs/test_config_loader_" + timestamp_ + ".log").c_str());
        LOG_INFO("=== Starting ConfigLoader Test ===");
        config_ = AuditConfig::defaults();
    }

    void TearDown() override {
        LOG_INFO("=== ConfigLoader Test Completed ===");
        Common::shutdownLogging();
    }

    std::string timestamp_;
    AuditConfig config_;
    std::string error_;
};

// ========== Defaults ==========

TEST_F(ConfigLoaderTest, DefaultsCarryProjectConventions) {
    EXPECT_EQ(config_.project_root, ".");
    EXPECT_EQ(config_.source_roots, std::vector<std::string>{"src"});
    EXPECT_EQ(config_.line_basis, LineBasis::SEARCHED);
    EXPECT_TRUE(config_.use_default_rules);
    EXPECT_EQ(config_.canonical.index_css, "src/index.css");
    EXPECT_FALSE(config_.allowlist.directories.empty());
    EXPECT_FALSE(config_.allowlist.classes.empty());
    ASSERT_EQ(config_.copy.preferred_terms.size(), 1u);
    EXPECT_EQ(config_.copy.preferred_terms[0].preferred, "Activity");
    EXPECT_STREQ(lineBasisName(LineBasis::ORIGINAL), "original");
}

// ========== Overlay ==========

TEST_F(ConfigLoaderTest, OverlayReplacesOnlyPresentKeys) {
    const char* json = R"({
        "project_root": "../crm",
        "source_roots": ["app", "lib"],
        "line_basis": "original",
        "workers": 4,
        "canonical": { "table": "app/ui/Table.tsx" },
        "disabled_rules": ["no-raw-palette"],
        "copy": { "forbidden_phrases": ["(?i)click here"] }
    })";

    ASSERT_TRUE(ConfigLoader::loadString(json, &config_, &error_)) << error_;

    EXPECT_EQ(config_.project_root, "../crm");
    EXPECT_EQ(config_.source_roots, (std::vector<std::string>{"app", "lib"}));
    EXPECT_EQ(config_.line_basis, LineBasis::ORIGINAL);
    EXPECT_EQ(config_.workers, 4u);
    EXPECT_EQ(config_.canonical.table, "app/ui/Table.tsx");
    EXPECT_EQ(config_.canonical.dialog, "src/components/ui/dialog.tsx") << "untouched canonical keys keep defaults";
    EXPECT_EQ(config_.disabled_rules, std::vector<std::string>{"no-raw-palette"});

    ASSERT_EQ(config_.copy.forbidden_phrases.size(), 1u);
    EXPECT_TRUE(config_.copy.forbidden_phrases[0].icase);
    EXPECT_EQ(config_.copy.forbidden_phrases[0].source, "click here");
    EXPECT_FALSE(config_.copy.preferred_terms.empty()) << "sibling keys of copy keep defaults";
}

TEST_F(ConfigLoaderTest, AllowlistTiersParsedSeparately) {
    const char* json = R"({
        "allowlist": {
            "directories": [ { "path": "^src/charts/", "reason": "charts" } ],
            "classes": [ { "path": "^src/features/x/", "content": "bg-info", "reason": "info" } ]
        }
    })";

    ASSERT_TRUE(ConfigLoader::loadString(json, &config_, &error_)) << error_;
    ASSERT_EQ(config_.allowlist.directories.size(), 1u);
    ASSERT_EQ(config_.allowlist.classes.size(), 1u);
    EXPECT_EQ(config_.allowlist.directories[0].path.source, "^src/charts/");
    EXPECT_EQ(config_.allowlist.classes[0].content.source, "bg-info");
}

TEST_F(ConfigLoaderTest, CustomRulesOfEveryKind) {
    const char* json = R"({
        "use_default_rules": false,
        "rules": [
            { "id": "no-todo", "kind": "pattern", "category": "copy-terminology",
              "scope": "document", "normalize": "comments",
              "patterns": ["TODO", { "pattern": "FIXME", "excerpt": "fix me", "exempt_paths": ["^src/legacy/"] }] },
            { "id": "needs-title", "kind": "file_requirement", "category": "layout",
              "require": "<Title", "excerpt": "missing title" },
            { "id": "one-grid", "kind": "duplicate", "category": "component-duplication",
              "primary": "src/ui/grid.tsx", "secondary": "src/ui/grid2.tsx", "wrapper": true },
            { "id": "tokens-defined", "kind": "canonical", "category": "token-usage",
              "strictness": "hard", "combine": "any",
              "clauses": [ { "files": ["src/index.css"], "pattern": "--primary", "hit_when": "absent" } ] }
        ]
    })";

    ASSERT_TRUE(ConfigLoader::loadString(json, &config_, &error_)) << error_;
    EXPECT_FALSE(config_.use_default_rules);
    ASSERT_EQ(config_.rules.size(), 4u);

    const RuleSpec& todo = config_.rules[0];
    EXPECT_EQ(todo.kind, RuleKind::PATTERN);
    EXPECT_EQ(todo.scope, Scope::DOCUMENT);
    EXPECT_EQ(todo.normalize, NormalizeLevel::COMMENTS);
    ASSERT_EQ(todo.patterns.size(), 2u);
    EXPECT_EQ(todo.patterns[1].excerpt, "fix me");
    ASSERT_EQ(todo.patterns[1].exempt_paths.size(), 1u);

    EXPECT_EQ(config_.rules[1].kind, RuleKind::FILE_REQUIREMENT);
    ASSERT_TRUE(config_.rules[1].require.has_value());

    const RuleSpec& grid = config_.rules[2];
    EXPECT_EQ(grid.kind, RuleKind::DUPLICATE_IMPLEMENTATION);
    EXPECT_TRUE(grid.wrapper_import.has_value()) << "wrapper: true derives the import pattern";

    const RuleSpec& tokens = config_.rules[3];
    EXPECT_EQ(tokens.strictness, Strictness::HARD);
    EXPECT_FALSE(tokens.require_all);
    ASSERT_EQ(tokens.clauses.size(), 1u);
    EXPECT_FALSE(tokens.clauses[0].hit_when_present);
}

// ========== Errors ==========

TEST_F(ConfigLoaderTest, MalformedJsonLeavesConfigUntouched) {
    EXPECT_FALSE(ConfigLoader::loadString(R"({ "workers": 2, )", &config_, &error_));
    EXPECT_NE(error_.find("malformed config JSON"), std::string::npos);
    EXPECT_EQ(config_.workers, 0u);
}

TEST_F(ConfigLoaderTest, TypeMismatchIsAnError) {
    EXPECT_FALSE(ConfigLoader::loadString(R"({ "workers": "many" })", &config_, &error_));
    EXPECT_NE(error_.find("workers"), std::string::npos);

    EXPECT_FALSE(ConfigLoader::loadString(R"({ "source_roots": "src" })", &config_, &error_));
    EXPECT_NE(error_.find("source_roots"), std::string::npos);
}

TEST_F(ConfigLoaderTest, UnknownEnumValueIsAnError) {
    EXPECT_FALSE(ConfigLoader::loadString(R"({ "line_basis": "physical" })", &config_, &error_));
    EXPECT_NE(error_.find("physical"), std::string::npos);

    EXPECT_FALSE(ConfigLoader::loadString(R"({ "log_level": "verbose" })", &config_, &error_));
    EXPECT_EQ(config_.log_level, "info");
}

TEST_F(ConfigLoaderTest, FailedRulePartLeavesPreviousSectionsUnapplied) {
    const char* json = R"({
        "project_root": "changed",
        "rules": [ { "kind": "pattern", "pattern": "x" } ]
    })";
    EXPECT_FALSE(ConfigLoader::loadString(json, &config_, &error_));
    EXPECT_NE(error_.find("id"), std::string::npos);
    EXPECT_EQ(config_.project_root, ".");
}

TEST_F(ConfigLoaderTest, LoadFileReadsDiskAndReportsMissing) {
    const std::string path = (std::filesystem::temp_directory_path() / ("ui_audit_cfg_" + timestamp_ + ".json")).string();
    std::ofstream(path) << R"({ "alias_root": "app" })";

    ASSERT_TRUE(ConfigLoader::loadFile(path.c_str(), &config_, &error_)) << error_;
    EXPECT_EQ(config_.alias_root, "app");
    std::filesystem::remove(path);

    EXPECT_FALSE(ConfigLoader::loadFile("/nonexistent/ui_audit.json", &config_, &error_));
    EXPECT_NE(error_.find("cannot open config file"), std::string::npos);
}

TEST_F(ConfigLoaderTest, ShippedSampleConfigLoads) {
    const std::filesystem::path sample = std::filesystem::path(__FILE__).parent_path() / "../../config/ui_audit.json";
    ASSERT_TRUE(std::filesystem::exists(sample));
    ASSERT_TRUE(ConfigLoader::loadFile(sample.string().c_str(), &config_, &error_)) << error_;
    EXPECT_EQ(config_.rules.size(), 1u);
    EXPECT_EQ(config_.hard_rules, std::vector<std::string>{"no-dual-color-systems"});
}
