#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "auditor/file_collector.h"
#include "auditor/source_tree.h"
#include "common/logging.h"

using namespace UiAudit;

class FileCollectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        timestamp_ = std::to_string(std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
        Common::initLogging(("logs/test_file_collector_" + timestamp_ + ".log").c_str());
        LOG_INFO("=== Starting FileCollector Test ===");

        options_.roots = {"src"};
        options_.extensions = {".ts", ".tsx", ".css"};
        options_.excluded_dirs = {"__tests__", "node_modules"};
    }

    void TearDown() override {
        LOG_INFO("=== FileCollector Test Completed ===");
        Common::shutdownLogging();
        if (!temp_root_.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(temp_root_, ec);
        }
    }

    void writeFile(const std::string& rel, const std::string& content) {
        const std::filesystem::path p = std::filesystem::path(temp_root_) / rel;
        std::filesystem::create_directories(p.parent_path());
        std::ofstream(p) << content;
    }

    std::string timestamp_;
    std::string temp_root_;
    FileCollector::Options options_;
};

// ========== Path helpers ==========

TEST_F(FileCollectorTest, PathNormalization) {
    EXPECT_EQ(normalizePath("./src//pages/../App.tsx"), "src/App.tsx");
    EXPECT_EQ(normalizePath("/src/"), "src");
    EXPECT_EQ(normalizePath("../../x"), "x");
    EXPECT_EQ(joinPath("src/pages", "../components/ui/table"), "src/components/ui/table");
    EXPECT_EQ(dirName("src/pages/A.tsx"), "src/pages");
    EXPECT_EQ(dirName("A.tsx"), "");
}

TEST_F(FileCollectorTest, TestAndDeclarationFiles) {
    EXPECT_TRUE(FileCollector::isTestFile("src/a/Button.test.tsx"));
    EXPECT_TRUE(FileCollector::isTestFile("src/a/util.spec.ts"));
    EXPECT_FALSE(FileCollector::isTestFile("src/a/test.helpers.ts"));
    EXPECT_FALSE(FileCollector::isTestFile("src/a/Button.test.css"));

    EXPECT_TRUE(FileCollector::isDeclarationFile("src/vite-env.d.ts"));
    EXPECT_FALSE(FileCollector::isDeclarationFile("src/d.ts"));
    EXPECT_FALSE(FileCollector::isDeclarationFile("src/a.d.b.ts"));
}

// ========== In-memory tree ==========

TEST_F(FileCollectorTest, FiltersAndSortsMemoryTree) {
    MemoryTree tree;
    tree.add("src/pages/Widget.tsx", "");
    tree.add("src/index.css", "");
    tree.add("src/App.tsx", "");
    tree.add("src/logo.svg", "");
    tree.add("src/__tests__/App.tsx", "");
    tree.add("src/components/node_modules/x.ts", "");
    tree.add("src/.cache/y.ts", "");
    tree.add("src/pages/Widget.test.tsx", "");
    tree.add("src/types/env.d.ts", "");
    tree.add("other/Outside.tsx", "");

    auto files = FileCollector(tree, options_).collect();

    const std::vector<std::string> expected = {"src/App.tsx", "src/index.css", "src/pages/Widget.tsx"};
    EXPECT_EQ(files, expected);
}

TEST_F(FileCollectorTest, ExcludePathPatternsAndDuplicateRoots) {
    MemoryTree tree;
    tree.add("src/generated/api.ts", "");
    tree.add("src/pages/Home.tsx", "");

    Pattern generated;
    std::string error;
    ASSERT_TRUE(Pattern::compile(PatternSpec("^src/generated/"), &generated, &error)) << error;
    options_.exclude_paths.push_back(generated);
    options_.roots = {"src", "src/pages", "missing"};

    auto files = FileCollector(tree, options_).collect();
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0], "src/pages/Home.tsx");
}

// ========== Disk tree ==========

TEST_F(FileCollectorTest, DiskTreeWalksAndReads) {
    temp_root_ = (std::filesystem::temp_directory_path() / ("ui_audit_collector_" + timestamp_)).string();
    writeFile("src/pages/Widget.tsx", "color: #ff0000\n");
    writeFile("src/components/ui/table.tsx", "export const Table = 1;\n");
    writeFile("src/node_modules/lib/index.ts", "x\n");
    writeFile("src/.hidden/secret.ts", "x\n");
    writeFile("src/empty.css", "");

    DiskTree tree(temp_root_);
    auto files = FileCollector(tree, options_).collect();

    const std::vector<std::string> expected = {
        "src/components/ui/table.tsx", "src/empty.css", "src/pages/Widget.tsx"};
    EXPECT_EQ(files, expected);

    std::string content;
    ASSERT_TRUE(tree.read("src/pages/Widget.tsx", &content));
    EXPECT_EQ(content, "color: #ff0000\n");

    ASSERT_TRUE(tree.read("src/empty.css", &content));
    EXPECT_TRUE(content.empty());

    EXPECT_TRUE(tree.exists("src/components/ui/table.tsx"));
    EXPECT_FALSE(tree.exists("src/components/ui/dialog.tsx"));
    EXPECT_FALSE(tree.exists("src/pages")) << "directories are not files";
    EXPECT_FALSE(tree.read("src/missing.tsx", &content));
}

TEST_F(FileCollectorTest, DiskTreeDoesNotFollowSymlinks) {
    // === INPUT SPECIFICATION ===
    // src/pages/A.tsx plus src/pages/loop -> .. (a cycle back up the tree)
    // and src/pages/alias.tsx -> A.tsx

    // === EXPECTED OUTPUT SPECIFICATION ===
    // Only the real file is collected, once
    temp_root_ = (std::filesystem::temp_directory_path() / ("ui_audit_symlink_" + timestamp_)).string();
    writeFile("src/pages/A.tsx", "export const A = 1;\n");

    std::error_code ec;
    std::filesystem::create_directory_symlink("..", std::filesystem::path(temp_root_) / "src/pages/loop", ec);
    ASSERT_FALSE(ec) << ec.message();
    std::filesystem::create_symlink("A.tsx", std::filesystem::path(temp_root_) / "src/pages/alias.tsx", ec);
    ASSERT_FALSE(ec) << ec.message();

    DiskTree tree(temp_root_);
    auto files = FileCollector(tree, options_).collect();
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0], "src/pages/A.tsx");
}

TEST_F(FileCollectorTest, MissingRootCollectsNothing) {
    temp_root_ = (std::filesystem::temp_directory_path() / ("ui_audit_empty_" + timestamp_)).string();
    std::filesystem::create_directories(temp_root_);

    DiskTree tree(temp_root_);
    EXPECT_TRUE(FileCollector(tree, options_).collect().empty());
}
