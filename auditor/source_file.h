#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "audit_types.h"
#include "content_normalizer.h"

namespace UiAudit {

/// One collected file: raw content plus its derived normalized views.
///
/// Normalized views are built once at construction and never mutate the raw
/// content. Instances live only for the duration of one audit run.
class SourceFile {
public:
    SourceFile(std::string path, std::string content);

    SourceFile(const SourceFile&) = delete;
    SourceFile& operator=(const SourceFile&) = delete;
    SourceFile(SourceFile&&) = default;
    SourceFile& operator=(SourceFile&&) = default;

    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] const std::string& extension() const noexcept { return extension_; }
    [[nodiscard]] const std::string& raw() const noexcept { return raw_.text; }

    [[nodiscard]] uint32_t lineCount() const noexcept { return static_cast<uint32_t>(line_starts_.size()); }

    /// 1-based physical line without its terminator ("\n" or "\r\n"); empty when out of range
    [[nodiscard]] std::string_view rawLine(uint32_t line) const noexcept;

    [[nodiscard]] const NormalizedText& view(NormalizeLevel level) const noexcept;

    /// Lowercase extension including the dot (".tsx"), empty when none
    [[nodiscard]] static std::string extensionOf(std::string_view path);

private:
    std::string path_;
    std::string extension_;
    NormalizedText raw_;
    NormalizedText comments_;
    NormalizedText full_;
    std::vector<size_t> line_starts_;
};

} // namespace UiAudit
