#include <gtest/gtest.h>
#include <chrono>
#include <string>

#include "auditor/default_rules.h"
#include "auditor/rule_registry.h"
#include "common/logging.h"
#include "config/audit_config.h"

using namespace UiAudit;

class RuleRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::string timestamp = std::to_string(std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
        Common::initLogging(("logs/test_rule_registry_" + timestamp + ".log").c_str());
        LOG_INFO("=== Starting RuleRegistry Test ===");
        config_ = AuditConfig::defaults();
    }

    void TearDown() override {
        LOG_INFO("=== RuleRegistry Test Completed ===");
        Common::shutdownLogging();
    }

    static RuleSpec simplePattern(const char* id, const char* pattern) {
        RuleSpec spec;
        spec.id = id;
        spec.kind = RuleKind::PATTERN;
        spec.patterns.push_back({PatternSpec(pattern), {}, {}});
        return spec;
    }

    AuditConfig config_;
    RuleRegistry registry_;
    std::string error_;
};

// ========== Default rule set ==========

TEST_F(RuleRegistryTest, DefaultRulesInRegistrationOrder) {
    ASSERT_TRUE(registry_.build(config_, &error_)) << error_;
    ASSERT_EQ(registry_.size(), 20u);

    const auto& rules = registry_.rules();
    EXPECT_EQ(rules.front().id, "no-raw-hex");
    EXPECT_EQ(rules.back().id, "pages-no-form-orchestration");

    // Every category is represented
    bool seen[6] = {};
    for (const auto& rule : rules) {
        seen[static_cast<size_t>(rule.category)] = true;
        EXPECT_FALSE(rule.header.empty()) << rule.id;
        EXPECT_FALSE(rule.remediation_hint.empty()) << rule.id;
        EXPECT_EQ(rule.strictness, Strictness::SOFT) << rule.id;
    }
    for (bool s : seen) EXPECT_TRUE(s);
}

TEST_F(RuleRegistryTest, RuleKindsAndPhases) {
    ASSERT_TRUE(registry_.build(config_, &error_)) << error_;

    const RuleDefinition* hex = registry_.find("no-raw-hex");
    ASSERT_NE(hex, nullptr);
    EXPECT_EQ(hex->kind(), RuleKind::PATTERN);
    EXPECT_TRUE(hex->perFile());

    const RuleDefinition* container = registry_.find("page-container-required");
    ASSERT_NE(container, nullptr);
    EXPECT_EQ(container->kind(), RuleKind::FILE_REQUIREMENT);
    EXPECT_TRUE(container->perFile());

    const RuleDefinition* table = registry_.find("no-duplicate-table");
    ASSERT_NE(table, nullptr);
    EXPECT_EQ(table->kind(), RuleKind::DUPLICATE_IMPLEMENTATION);
    EXPECT_FALSE(table->perFile());

    const RuleDefinition* colors = registry_.find("no-dual-color-systems");
    ASSERT_NE(colors, nullptr);
    EXPECT_EQ(colors->kind(), RuleKind::CANONICAL_CONTENT);

    EXPECT_EQ(registry_.find("no-such-rule"), nullptr);
}

TEST_F(RuleRegistryTest, TokenFilesExcludedFromHexRule) {
    ASSERT_TRUE(registry_.build(config_, &error_)) << error_;
    const RuleDefinition* hex = registry_.find("no-raw-hex");
    ASSERT_NE(hex, nullptr);

    EXPECT_FALSE(hex->filter.accepts("src/index.css", ".css"));
    EXPECT_FALSE(hex->filter.accepts("src/styles/new/colors.css", ".css"));
    EXPECT_TRUE(hex->filter.accepts("src/pages/Widget.tsx", ".tsx"));
    EXPECT_TRUE(hex->filter.accepts("src/legacy/index.css", ".css"));
    EXPECT_FALSE(hex->filter.accepts("src/pages/logo.svg", ".svg"));
}

TEST_F(RuleRegistryTest, TermExceptionsBecomeEntryExemptions) {
    ASSERT_TRUE(registry_.build(config_, &error_)) << error_;
    const RuleDefinition* terms = registry_.find("preferred-terminology");
    ASSERT_NE(terms, nullptr);

    const auto& body = std::get<PatternRule>(terms->body);
    ASSERT_EQ(body.entries.size(), 2u);
    EXPECT_EQ(body.entries[0].excerpt, "Use \"Activity\" instead of \"Interaction\"");
    ASSERT_EQ(body.entries[0].exempt_paths.size(), 1u);
    EXPECT_TRUE(body.entries[0].exempt_paths[0].search("src/features/interactions/List.tsx"));
    EXPECT_TRUE(body.entries[0].pattern.icase());
}

// ========== Configuration ==========

TEST_F(RuleRegistryTest, DisabledAndHardRules) {
    config_.disabled_rules = {"no-raw-palette", "not-a-rule"};
    config_.hard_rules = {"no-dual-color-systems"};

    ASSERT_TRUE(registry_.build(config_, &error_)) << error_;
    EXPECT_EQ(registry_.size(), 19u);
    EXPECT_EQ(registry_.find("no-raw-palette"), nullptr);

    const RuleDefinition* colors = registry_.find("no-dual-color-systems");
    ASSERT_NE(colors, nullptr);
    EXPECT_EQ(colors->strictness, Strictness::HARD);
}

TEST_F(RuleRegistryTest, CustomRulesAppendOrReplace) {
    config_.rules.push_back(simplePattern("no-inline-style", "style=\\{\\{"));

    ASSERT_TRUE(registry_.build(config_, &error_)) << error_;
    EXPECT_EQ(registry_.size(), 21u);
    EXPECT_EQ(registry_.rules().back().id, "no-inline-style");

    config_.use_default_rules = false;
    ASSERT_TRUE(registry_.build(config_, &error_)) << error_;
    ASSERT_EQ(registry_.size(), 1u);
    EXPECT_EQ(registry_.rules()[0].header, "Rule no-inline-style violated.");
}

TEST_F(RuleRegistryTest, NoForbiddenPhrasesNoCopyRule) {
    config_.copy.forbidden_phrases.clear();
    ASSERT_TRUE(registry_.build(config_, &error_)) << error_;
    EXPECT_EQ(registry_.find("no-create-new-copy"), nullptr);
}

// ========== Errors ==========

TEST_F(RuleRegistryTest, DuplicateIdRejected) {
    config_.rules.push_back(simplePattern("no-raw-hex", "#"));
    EXPECT_FALSE(registry_.build(config_, &error_));
    EXPECT_NE(error_.find("duplicate rule id 'no-raw-hex'"), std::string::npos);
    EXPECT_EQ(registry_.size(), 0u);
}

TEST_F(RuleRegistryTest, MalformedPatternNamesRuleAndPattern) {
    config_.rules.push_back(simplePattern("broken", "bg-[("));
    EXPECT_FALSE(registry_.build(config_, &error_));
    EXPECT_NE(error_.find("rule 'broken'"), std::string::npos);
    EXPECT_NE(error_.find("bg-[("), std::string::npos);
}

TEST_F(RuleRegistryTest, IncompleteRulesRejected) {
    RuleDefinition def;

    RuleSpec empty_pattern;
    empty_pattern.id = "p";
    EXPECT_FALSE(compileRule(empty_pattern, &def, &error_));

    RuleSpec requirement;
    requirement.id = "r";
    requirement.kind = RuleKind::FILE_REQUIREMENT;
    EXPECT_FALSE(compileRule(requirement, &def, &error_));
    EXPECT_NE(error_.find("forbid"), std::string::npos);

    RuleSpec duplicate;
    duplicate.id = "d";
    duplicate.kind = RuleKind::DUPLICATE_IMPLEMENTATION;
    duplicate.primary = "src/a.tsx";
    EXPECT_FALSE(compileRule(duplicate, &def, &error_));

    RuleSpec canonical;
    canonical.id = "c";
    canonical.kind = RuleKind::CANONICAL_CONTENT;
    canonical.clauses.push_back({{}, PatternSpec("x"), true, ""});
    EXPECT_FALSE(compileRule(canonical, &def, &error_));
    EXPECT_NE(error_.find("without files"), std::string::npos);
}

// ========== Helpers ==========

TEST_F(RuleRegistryTest, WrapperImportPattern) {
    Pattern p;
    ASSERT_TRUE(Pattern::compile(wrapperImportFor("src/components/ui/table.tsx"), &p, &error_)) << error_;

    EXPECT_TRUE(p.search("import { Table } from \"./table\";"));
    EXPECT_TRUE(p.search("export * from '@/components/ui/table';"));
    EXPECT_FALSE(p.search("import { x } from \"./table-utils\";"));
    EXPECT_FALSE(p.search("import { x } from \"./simple-table\";"));
}

TEST_F(RuleRegistryTest, PathPatternHelpers) {
    Pattern exact, under;
    ASSERT_TRUE(Pattern::compile(exactPath("./src/index.css"), &exact, &error_)) << error_;
    ASSERT_TRUE(Pattern::compile(underDirectory("src/pages/"), &under, &error_)) << error_;

    EXPECT_TRUE(exact.search("src/index.css"));
    EXPECT_FALSE(exact.search("src/index.cssx"));
    EXPECT_TRUE(under.search("src/pages/Home.tsx"));
    EXPECT_FALSE(under.search("src/pagesX/Home.tsx"));
    EXPECT_FALSE(under.search("app/src/pages/Home.tsx"));
}
