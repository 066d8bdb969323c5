#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "audit_types.h"

namespace UiAudit {

/// Comment grammar of the file being normalized
enum class CommentSyntax : uint8_t {
    SCRIPT = 0,      // "//" line comments and "/* */" block comments
    STYLESHEET = 1   // "/* */" only, "//" is ordinary text (e.g. unquoted url())
};

/// Text with comments and/or declaration lines removed.
///
/// line_origins[i] is the 1-based raw line on which normalized line i+1 starts.
struct NormalizedText {
    std::string text;
    std::vector<uint32_t> line_origins;

    /// Raw line for a 1-based line of `text`, 0 when out of range
    [[nodiscard]] uint32_t originLine(uint32_t searched_line) const noexcept {
        if (searched_line == 0 || searched_line > line_origins.size()) return 0;
        return line_origins[searched_line - 1];
    }
};

class ContentNormalizer {
public:
    /// Remove block and line comments.
    ///
    /// Explicit state machine over CODE, LINE_COMMENT, BLOCK_COMMENT and
    /// STRING states. Quotes inside strings and comment openers inside strings
    /// are ordinary text. Single and double quoted strings end at a newline,
    /// backtick strings span lines. Block comments are removed together with
    /// the newlines they span.
    [[nodiscard]] static NormalizedText stripComments(std::string_view raw,
                                                      CommentSyntax syntax = CommentSyntax::SCRIPT) noexcept;

    /// Drop lines that only declare (imports, type/interface headers, plain
    /// arrays and object literals without markup)
    [[nodiscard]] static NormalizedText stripDeclarations(const NormalizedText& input) noexcept;

    [[nodiscard]] static NormalizedText normalize(std::string_view raw, NormalizeLevel level,
                                                  CommentSyntax syntax = CommentSyntax::SCRIPT) noexcept;

    [[nodiscard]] static bool isDeclarationOnly(std::string_view line) noexcept;

    /// Syntax chosen by extension: ".css" is STYLESHEET, everything else SCRIPT
    [[nodiscard]] static CommentSyntax syntaxForExtension(std::string_view extension) noexcept;

    ContentNormalizer() = delete;
};

} // namespace UiAudit
