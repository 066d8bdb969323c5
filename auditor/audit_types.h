#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace UiAudit {

/// Excerpts are whitespace-collapsed and capped at this many bytes
constexpr size_t MAX_EXCERPT_LEN = 240;

/// Collapse every whitespace run to one space, trim both ends, cap at MAX_EXCERPT_LEN.
/// The cap backs off to a UTF-8 character boundary.
[[nodiscard]] std::string makeExcerpt(std::string_view text) noexcept;

/// Rule categories
enum class Category : uint8_t {
    TOKEN_USAGE = 0,
    LAYOUT = 1,
    COMPONENT_DUPLICATION = 2,
    COPY_TERMINOLOGY = 3,
    ACCESSIBILITY = 4,
    ARCHITECTURE_LAYERING = 5
};

[[nodiscard]] const char* categoryName(Category category) noexcept;
[[nodiscard]] bool parseCategory(std::string_view name, Category* out) noexcept;

/// Single physical line of the raw file vs. the whole normalized document
enum class Scope : uint8_t {
    LINE = 0,
    DOCUMENT = 1
};

/// How much of the raw text is stripped before a document-scope search
enum class NormalizeLevel : uint8_t {
    NONE = 0,      // raw text
    COMMENTS = 1,  // block and line comments removed
    FULL = 2       // comments and declaration-only lines removed
};

enum class RuleKind : uint8_t {
    PATTERN = 0,
    FILE_REQUIREMENT = 1,
    DUPLICATE_IMPLEMENTATION = 2,
    CANONICAL_CONTENT = 3
};

[[nodiscard]] const char* ruleKindName(RuleKind kind) noexcept;

/// Hard rules turn a missing canonical file into a configuration error
enum class Strictness : uint8_t {
    SOFT = 0,
    HARD = 1
};

/// Which line a document-scope match reports
enum class LineBasis : uint8_t {
    SEARCHED = 0,  // line within the text that was actually searched
    ORIGINAL = 1   // raw line, recovered through the normalizer's origin table
};

/// One rule hit in one file
struct Match {
    std::string file_path;
    uint32_t line_number = 0;
    std::string excerpt;

    bool operator<(const Match& other) const noexcept {
        return std::tie(file_path, line_number, excerpt) <
               std::tie(other.file_path, other.line_number, other.excerpt);
    }

    bool operator==(const Match& other) const noexcept {
        return line_number == other.line_number &&
               file_path == other.file_path &&
               excerpt == other.excerpt;
    }
};

/// All surviving matches of one rule
struct ViolationReport {
    std::string rule_id;
    Category category = Category::TOKEN_USAGE;
    std::string header;
    std::string remediation_hint;
    std::vector<Match> matches;
};

struct AuditResult {
    std::vector<ViolationReport> reports;
    bool passed = true;
    uint32_t files_scanned = 0;
    uint32_t files_skipped = 0;
    uint32_t rules_evaluated = 0;
    std::vector<std::string> evaluated_rules;  // registration order, passing rules included

    [[nodiscard]] size_t totalMatches() const noexcept {
        size_t total = 0;
        for (const auto& report : reports) {
            total += report.matches.size();
        }
        return total;
    }
};

enum class AuditStatus : uint8_t {
    OK = 0,
    CONFIG_ERROR = 1,
    INTERNAL_ERROR = 2   // a worker failed; the result is incomplete
};

} // namespace UiAudit
