#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "pattern.h"
#include "source_tree.h"

namespace UiAudit {

/// Enumerates candidate files under the configured roots
class FileCollector {
public:
    struct Options {
        std::vector<std::string> roots;          // relative to the project root
        std::vector<std::string> extensions;     // with dot, lowercase (".tsx")
        std::vector<std::string> excluded_dirs;  // directory names never entered
        std::vector<Pattern> exclude_paths;      // matched against the relative path
    };

    FileCollector(const SourceTree& tree, Options options);

    /// Sorted, de-duplicated relative paths. Missing roots contribute nothing.
    [[nodiscard]] std::vector<std::string> collect() const noexcept;

    /// "*.test.*" / "*.spec.*" for ts, tsx, js and jsx files
    [[nodiscard]] static bool isTestFile(std::string_view path) noexcept;

    /// Generated declaration files ("*.d.ts", "*.d.css", ...)
    [[nodiscard]] static bool isDeclarationFile(std::string_view path) noexcept;

private:
    [[nodiscard]] bool accepts(const std::string& path) const noexcept;

    const SourceTree& tree_;
    Options options_;
};

} // namespace UiAudit
