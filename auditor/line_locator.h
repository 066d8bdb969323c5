#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "pattern.h"

namespace UiAudit {

/// 1-based line of a character offset: newlines strictly before offset, plus one
[[nodiscard]] inline uint32_t lineAtOffset(std::string_view content, size_t offset) noexcept {
    if (offset > content.size()) offset = content.size();
    uint32_t line = 1;
    for (size_t i = 0; i < offset; ++i) {
        if (content[i] == '\n') ++line;
    }
    return line;
}

/// Incremental locator for many ascending offsets in the same content
class LineLocator {
public:
    explicit LineLocator(std::string_view content) noexcept : content_(content) {}

    /// Offsets must be non-decreasing between calls; a smaller one restarts the scan
    [[nodiscard]] uint32_t lineAt(size_t offset) noexcept {
        if (offset < pos_) {
            pos_ = 0;
            line_ = 1;
        }
        if (offset > content_.size()) offset = content_.size();
        for (; pos_ < offset; ++pos_) {
            if (content_[pos_] == '\n') ++line_;
        }
        return line_;
    }

private:
    std::string_view content_;
    size_t pos_ = 0;
    uint32_t line_ = 1;
};

/// Inline suppression: a raw line carrying the marker exempts only itself
class SuppressionCheck {
public:
    static constexpr const char* DEFAULT_MARKER = "ui-audit:\\s*allow";

    SuppressionCheck() = default;

    [[nodiscard]] bool init(const PatternSpec& marker, std::string* error) noexcept {
        return Pattern::compile(marker, &marker_, error);
    }

    [[nodiscard]] bool isSuppressed(std::string_view raw_line) const noexcept {
        return marker_.valid() && marker_.search(raw_line);
    }

private:
    Pattern marker_;
};

} // namespace UiAudit
