#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "audit_types.h"
#include "pattern.h"

namespace UiAudit {

// ========== Uncompiled rule descriptions (configuration side) ==========

struct PatternEntrySpec {
    PatternSpec pattern;
    std::string excerpt;                     // fixed excerpt, empty = hit text
    std::vector<PatternSpec> exempt_paths;   // entry is skipped in matching files
};

struct ClauseSpec {
    std::vector<std::string> files;          // searched one by one, any match counts
    PatternSpec pattern;
    bool hit_when_present = true;
    std::string description;
};

/// Flat description of one rule of any kind, as built in code or read from JSON
struct RuleSpec {
    std::string id;
    RuleKind kind = RuleKind::PATTERN;
    Category category = Category::TOKEN_USAGE;
    std::string header;
    std::string hint;

    // File filter
    std::vector<std::string> extensions;
    std::vector<PatternSpec> include_paths;
    std::vector<PatternSpec> exclude_paths;

    // PATTERN
    std::vector<PatternEntrySpec> patterns;
    Scope scope = Scope::LINE;
    NormalizeLevel normalize = NormalizeLevel::NONE;
    std::optional<PatternSpec> tag_filter;
    bool use_allowlist = false;

    // FILE_REQUIREMENT
    std::optional<PatternSpec> forbid;
    std::optional<PatternSpec> require;
    std::optional<PatternSpec> import_filter;
    std::optional<PatternSpec> wrapper_marker;
    std::string excerpt;

    // DUPLICATE_IMPLEMENTATION
    std::string primary;
    std::string secondary;
    std::optional<PatternSpec> secondary_name;
    std::optional<PatternSpec> wrapper_import;
    bool require_referenced = false;
    std::vector<std::string> reference_tokens;

    // CANONICAL_CONTENT
    std::vector<ClauseSpec> clauses;
    bool require_all = true;

    Strictness strictness = Strictness::SOFT;
};

// ========== Compiled rules ==========

/// Which files a rule looks at
struct FileFilter {
    std::vector<std::string> extensions;   // empty accepts every extension
    std::vector<Pattern> include_paths;    // when non-empty one must match
    std::vector<Pattern> exclude_paths;    // none may match

    [[nodiscard]] bool accepts(const std::string& path, const std::string& extension) const noexcept;
};

struct PatternEntry {
    Pattern pattern;
    std::string excerpt;
    std::vector<Pattern> exempt_paths;
};

/// Regex search over raw lines (LINE) or a normalized document (DOCUMENT)
struct PatternRule {
    std::vector<PatternEntry> entries;
    Scope scope = Scope::LINE;
    NormalizeLevel normalize = NormalizeLevel::NONE;
    std::optional<Pattern> tag_filter;     // a hit is kept only if this also matches it
    bool use_allowlist = false;
};

/// Per-file presence/absence check reported once at line 1
struct FileRequirementRule {
    std::optional<Pattern> forbid;
    std::optional<Pattern> require;
    std::optional<Pattern> import_filter;  // import lines whose target may satisfy `require`
    std::optional<Pattern> wrapper_marker; // searched in imported files, defaults to `require`
    std::string excerpt;
};

/// Two implementations of the same component
struct DuplicateRule {
    std::string primary;
    std::string secondary;
    std::optional<Pattern> secondary_name;
    std::optional<Pattern> wrapper_import;
    bool require_referenced = false;
    std::vector<std::string> reference_tokens;
};

struct CanonicalClause {
    std::vector<std::string> files;
    Pattern pattern;
    bool hit_when_present = true;
    std::string description;
};

/// Clauses over canonical files combined with all/any
struct CanonicalRule {
    std::vector<CanonicalClause> clauses;
    bool require_all = true;
};

using RuleBody = std::variant<PatternRule, FileRequirementRule, DuplicateRule, CanonicalRule>;

struct RuleDefinition {
    std::string id;
    Category category = Category::TOKEN_USAGE;
    std::string header;
    std::string remediation_hint;
    FileFilter filter;
    Strictness strictness = Strictness::SOFT;
    RuleBody body;

    [[nodiscard]] RuleKind kind() const noexcept { return static_cast<RuleKind>(body.index()); }

    /// PATTERN and FILE_REQUIREMENT run per file; the others run once over the project
    [[nodiscard]] bool perFile() const noexcept {
        return kind() == RuleKind::PATTERN || kind() == RuleKind::FILE_REQUIREMENT;
    }
};

/// Compile a spec; on failure `error` names the rule and the offending pattern
[[nodiscard]] bool compileRule(const RuleSpec& spec, RuleDefinition* out, std::string* error) noexcept;

} // namespace UiAudit
