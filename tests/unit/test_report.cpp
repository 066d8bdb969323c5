#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <rapidjson/document.h>

#include "auditor/report.h"
#include "common/logging.h"

using namespace UiAudit;

class ReportTest : public ::testing::Test {
protected:
    void SetUp() override {
        timestamp_ = std::to_string(std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
        Common::initLogging(("logs/test_report_" + timestamp_ + ".log").c_str());
        LOG_INFO("=== Starting Report Test ===");

        rules_.resize(2);
        rules_[0].id = "no-raw-hex";
        rules_[0].category = Category::TOKEN_USAGE;
        rules_[0].header = "Found hardcoded HEX colors outside token files.";
        rules_[0].remediation_hint = "Replace with semantic token classes.";
        rules_[1].id = "no-empty-table-header";
        rules_[1].category = Category::ACCESSIBILITY;
        rules_[1].header = "Empty <th> detected.";
    }

    void TearDown() override {
        LOG_INFO("=== Report Test Completed ===");
        Common::shutdownLogging();
    }

    std::string timestamp_;
    std::vector<RuleDefinition> rules_;
};

// ========== Aggregation ==========

TEST_F(ReportTest, SortsDeduplicatesAndKeepsRuleOrder) {
    ViolationAggregator aggregator(rules_);
    aggregator.add(1, {Match{"src/b.tsx", 4, "<th></th>"}});
    aggregator.add(0, {Match{"src/z.tsx", 1, "#fff"}, Match{"src/a.tsx", 9, "#000"}});
    aggregator.add(0, {Match{"src/a.tsx", 2, "#111"}, Match{"src/z.tsx", 1, "#fff"}});

    AuditResult result;
    aggregator.build(&result);

    ASSERT_EQ(result.reports.size(), 2u);
    EXPECT_EQ(result.reports[0].rule_id, "no-raw-hex");
    EXPECT_EQ(result.reports[1].rule_id, "no-empty-table-header");

    const auto& hex = result.reports[0].matches;
    ASSERT_EQ(hex.size(), 3u);
    EXPECT_EQ(hex[0].file_path, "src/a.tsx");
    EXPECT_EQ(hex[0].line_number, 2u);
    EXPECT_EQ(hex[1].line_number, 9u);
    EXPECT_EQ(hex[2].file_path, "src/z.tsx");

    EXPECT_FALSE(result.passed);
    EXPECT_EQ(result.rules_evaluated, 2u);
    EXPECT_EQ(result.totalMatches(), 4u);
}

TEST_F(ReportTest, RulesWithoutMatchesProduceNoReport) {
    ViolationAggregator aggregator(rules_);
    aggregator.add(1, {});

    AuditResult result;
    aggregator.build(&result);
    EXPECT_TRUE(result.reports.empty());
    EXPECT_TRUE(result.passed);
    EXPECT_EQ(result.evaluated_rules.size(), 2u);
}

TEST_F(ReportTest, ConcurrentAddsAreNotLost) {
    ViolationAggregator aggregator(rules_);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&aggregator, t] {
            for (uint32_t i = 0; i < 250; ++i) {
                aggregator.add(0, {Match{"src/f" + std::to_string(t) + ".tsx", i + 1, "#fff"}});
            }
        });
    }
    for (auto& th : threads) th.join();

    AuditResult result;
    aggregator.build(&result);
    ASSERT_EQ(result.reports.size(), 1u);
    EXPECT_EQ(result.reports[0].matches.size(), 1000u);
}

// ========== Formats ==========

TEST_F(ReportTest, ExcerptCollapsesWhitespace) {
    EXPECT_EQ(makeExcerpt("  <div\t\tclassName=\"x\">\n  text  "), "<div className=\"x\"> text");
    EXPECT_EQ(makeExcerpt(std::string(1000, 'a')).size(), MAX_EXCERPT_LEN);
    EXPECT_EQ(makeExcerpt(""), "");
}

TEST_F(ReportTest, ExcerptCapKeepsUtf8Characters) {
    // 239 ASCII bytes then a 3-byte em dash: the dash cannot fit, drop it whole
    const std::string dash = "\xE2\x80\x94";
    const std::string cut = makeExcerpt(std::string(239, 'a') + dash);
    EXPECT_EQ(cut, std::string(239, 'a'));

    // A character ending exactly at the cap is kept
    const std::string fits = makeExcerpt(std::string(237, 'a') + dash + "tail");
    EXPECT_EQ(fits, std::string(237, 'a') + dash);

    // No trailing space left behind when the cut lands after a collapsed run
    const std::string spaced = makeExcerpt(std::string(238, 'a') + "   " + dash);
    EXPECT_EQ(spaced, std::string(238, 'a'));
}

TEST_F(ReportTest, ViolationTextFormat) {
    ViolationReport report;
    report.rule_id = "no-raw-hex";
    report.header = "Found hardcoded HEX colors outside token files.";
    report.remediation_hint = "Replace with semantic token classes.";
    report.matches = {Match{"src/pages/Widget.tsx", 3, "color: #ff0000"}};

    EXPECT_EQ(formatViolation(report),
              "Found hardcoded HEX colors outside token files.\n"
              " - src/pages/Widget.tsx:3 \xE2\x80\x94 color: #ff0000\n"
              "Fix: Replace with semantic token classes.\n");

    report.remediation_hint.clear();
    EXPECT_EQ(formatViolation(report).find("Fix:"), std::string::npos);
}

TEST_F(ReportTest, IdeWarningsOnePerMatch) {
    ViolationAggregator aggregator(rules_);
    aggregator.add(0, {Match{"src/a.tsx", 2, "#111"}});
    aggregator.add(1, {Match{"src/b.tsx", 4, "<th></th>"}});
    AuditResult result;
    aggregator.build(&result);

    EXPECT_EQ(formatIDEWarnings(result),
              "src/a.tsx:2:1: error: #111 [no-raw-hex]\n"
              "src/b.tsx:4:1: error: <th></th> [no-empty-table-header]\n");
}

TEST_F(ReportTest, JsonDocumentStructure) {
    ViolationAggregator aggregator(rules_);
    aggregator.add(0, {Match{"src/a.tsx", 2, "say \"#111\""}});
    AuditResult result;
    aggregator.build(&result);
    result.files_scanned = 7;

    const std::string json = formatJSON(result);
    rapidjson::Document doc;
    doc.Parse(json.c_str());
    ASSERT_FALSE(doc.HasParseError());

    EXPECT_FALSE(doc["passed"].GetBool());
    EXPECT_EQ(doc["summary"]["files_scanned"].GetUint(), 7u);
    EXPECT_EQ(doc["summary"]["violations"].GetUint64(), 1u);

    const auto& reports = doc["reports"];
    ASSERT_EQ(reports.Size(), 1u);
    EXPECT_STREQ(reports[0]["rule"].GetString(), "no-raw-hex");
    EXPECT_STREQ(reports[0]["category"].GetString(), "token-usage");
    EXPECT_STREQ(reports[0]["matches"][0]["excerpt"].GetString(), "say \"#111\"");
    EXPECT_EQ(reports[0]["matches"][0]["line"].GetUint(), 2u);
}

TEST_F(ReportTest, JunitHasTestcasePerRule) {
    ViolationAggregator aggregator(rules_);
    aggregator.add(1, {Match{"src/b.tsx", 4, "<th></th>"}});
    AuditResult result;
    aggregator.build(&result);

    const std::string xml = formatJUnit(result);
    EXPECT_NE(xml.find("tests=\"2\" failures=\"1\""), std::string::npos);
    EXPECT_NE(xml.find("<testcase classname=\"ui_audit\" name=\"no-raw-hex\"/>"), std::string::npos);
    EXPECT_NE(xml.find("message=\"Empty &lt;th&gt; detected.\""), std::string::npos);
    EXPECT_NE(xml.find("&lt;th&gt;&lt;/th&gt;"), std::string::npos);
    EXPECT_EQ(xml.find("<th></th>"), std::string::npos);
}

TEST_F(ReportTest, WriteReportFile) {
    const std::string path =
        (std::filesystem::temp_directory_path() / ("ui_audit_report_" + timestamp_ + ".txt")).string();

    ASSERT_TRUE(writeReportFile(path.c_str(), "PASS\n"));
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    EXPECT_EQ(buffer.str(), "PASS\n");
    std::filesystem::remove(path);

    EXPECT_FALSE(writeReportFile("/nonexistent-dir/report.txt", "x"));
}
