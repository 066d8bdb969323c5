#include <gtest/gtest.h>
#include <chrono>
#include <string>

#include "auditor/content_normalizer.h"
#include "auditor/source_file.h"
#include "common/logging.h"

using namespace UiAudit;

class ContentNormalizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::string timestamp = std::to_string(std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
        Common::initLogging(("logs/test_normalizer_" + timestamp + ".log").c_str());
        LOG_INFO("=== Starting ContentNormalizer Test ===");
    }

    void TearDown() override {
        LOG_INFO("=== ContentNormalizer Test Completed ===");
        Common::shutdownLogging();
    }
};

// ========== Comment stripping ==========

TEST_F(ContentNormalizerTest, LineCommentRemovedLineKept) {
    auto out = ContentNormalizer::stripComments("a // x\nb");
    EXPECT_EQ(out.text, "a \nb");
    ASSERT_EQ(out.line_origins.size(), 2u);
    EXPECT_EQ(out.originLine(1), 1u);
    EXPECT_EQ(out.originLine(2), 2u);
}

TEST_F(ContentNormalizerTest, BlockCommentSplicesLines) {
    // === INPUT SPECIFICATION ===
    // Raw:    "a /* x\ny */ b\nc"   (3 raw lines)
    // Output: "a  b\nc"            (2 lines, second starts on raw line 3)
    auto out = ContentNormalizer::stripComments("a /* x\ny */ b\nc");
    EXPECT_EQ(out.text, "a  b\nc");
    EXPECT_EQ(out.originLine(1), 1u);
    EXPECT_EQ(out.originLine(2), 3u);
    EXPECT_EQ(out.originLine(3), 0u);
}

TEST_F(ContentNormalizerTest, CommentOpenersInsideStringsAreText) {
    auto out = ContentNormalizer::stripComments("const u = \"http://x/*y*/\"; // gone");
    EXPECT_EQ(out.text, "const u = \"http://x/*y*/\"; ");
}

TEST_F(ContentNormalizerTest, UnterminatedQuoteEndsAtLineBreak) {
    // JSX text with an apostrophe must not swallow the rest of the file
    auto out = ContentNormalizer::stripComments("<p>Don't stop</p>\nnext // gone");
    EXPECT_EQ(out.text, "<p>Don't stop</p>\nnext ");
}

TEST_F(ContentNormalizerTest, BacktickStringSpansLines) {
    auto out = ContentNormalizer::stripComments("`a\n// kept`\nb // gone");
    EXPECT_EQ(out.text, "`a\n// kept`\nb ");
    EXPECT_EQ(out.originLine(3), 3u);
}

TEST_F(ContentNormalizerTest, StylesheetKeepsDoubleSlash) {
    auto out = ContentNormalizer::stripComments("background: url(//cdn/x.png); /* c */",
                                                CommentSyntax::STYLESHEET);
    EXPECT_EQ(out.text, "background: url(//cdn/x.png); ");
    EXPECT_EQ(ContentNormalizer::syntaxForExtension(".css"), CommentSyntax::STYLESHEET);
    EXPECT_EQ(ContentNormalizer::syntaxForExtension(".tsx"), CommentSyntax::SCRIPT);
}

// ========== Declaration lines ==========

TEST_F(ContentNormalizerTest, DeclarationHeuristics) {
    EXPECT_TRUE(ContentNormalizer::isDeclarationOnly("import x from 'y';"));
    EXPECT_TRUE(ContentNormalizer::isDeclarationOnly("  type Props = {"));
    EXPECT_TRUE(ContentNormalizer::isDeclarationOnly("export interface Row {"));
    EXPECT_TRUE(ContentNormalizer::isDeclarationOnly("const items = ["));
    EXPECT_TRUE(ContentNormalizer::isDeclarationOnly("const { a, b } = props;"));

    EXPECT_FALSE(ContentNormalizer::isDeclarationOnly("<div className=\"p-4\">"));
    EXPECT_FALSE(ContentNormalizer::isDeclarationOnly("<div>{value}</div>"));
    EXPECT_FALSE(ContentNormalizer::isDeclarationOnly("const x = 1;"));
    EXPECT_FALSE(ContentNormalizer::isDeclarationOnly(""));
}

TEST_F(ContentNormalizerTest, FullNormalizationTracksOrigins) {
    const std::string raw =
        "import A from 'a';\n"
        "// comment\n"
        "const x = 1;\n"
        "<div>Create New</div>";

    auto out = ContentNormalizer::normalize(raw, NormalizeLevel::FULL);
    EXPECT_EQ(out.text, "\nconst x = 1;\n<div>Create New</div>");
    ASSERT_EQ(out.line_origins.size(), 3u);
    EXPECT_EQ(out.originLine(1), 2u);
    EXPECT_EQ(out.originLine(2), 3u);
    EXPECT_EQ(out.originLine(3), 4u);
}

TEST_F(ContentNormalizerTest, NoneIsIdentity) {
    const std::string raw = "a\n/* b */\nc\n";
    auto out = ContentNormalizer::normalize(raw, NormalizeLevel::NONE);
    EXPECT_EQ(out.text, raw);
    EXPECT_EQ(out.line_origins.size(), 4u);
    EXPECT_EQ(out.originLine(4), 4u);
}

// ========== SourceFile views ==========

TEST_F(ContentNormalizerTest, SourceFileViewsNeverTouchRaw) {
    SourceFile file("src/pages/Home.TSX", "const a = 1; // note\r\n<div/>\r\n");

    EXPECT_EQ(file.extension(), ".tsx");
    EXPECT_EQ(file.raw(), "const a = 1; // note\r\n<div/>\r\n");
    EXPECT_EQ(file.rawLine(1), "const a = 1; // note");
    EXPECT_EQ(file.rawLine(2), "<div/>");
    EXPECT_EQ(file.rawLine(99), "");
    EXPECT_EQ(file.view(NormalizeLevel::NONE).text, file.raw());
    EXPECT_EQ(file.view(NormalizeLevel::COMMENTS).text.find("note"), std::string::npos);
}
