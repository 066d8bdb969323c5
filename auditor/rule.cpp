#include "rule.h"

#include <algorithm>

namespace UiAudit {

namespace {

bool compileInto(const std::string& rule_id, const char* field, const PatternSpec& spec,
                 Pattern* out, std::string* error) noexcept {
    std::string detail;
    if (Pattern::compile(spec, out, &detail)) {
        return true;
    }
    if (error) {
        *error = "rule '" + rule_id + "' " + field + ": " + detail;
    }
    return false;
}

bool compileOptional(const std::string& rule_id, const char* field, const std::optional<PatternSpec>& spec,
                     std::optional<Pattern>* out, std::string* error) noexcept {
    if (!spec) {
        out->reset();
        return true;
    }
    Pattern compiled;
    if (!compileInto(rule_id, field, *spec, &compiled, error)) {
        return false;
    }
    *out = std::move(compiled);
    return true;
}

bool compileList(const std::string& rule_id, const char* field, const std::vector<PatternSpec>& specs,
                 std::vector<Pattern>* out, std::string* error) noexcept {
    out->clear();
    out->reserve(specs.size());
    for (const auto& spec : specs) {
        Pattern compiled;
        if (!compileInto(rule_id, field, spec, &compiled, error)) {
            return false;
        }
        out->push_back(std::move(compiled));
    }
    return true;
}

bool fail(const std::string& rule_id, const char* what, std::string* error) noexcept {
    if (error) {
        *error = "rule '" + rule_id + "': " + what;
    }
    return false;
}

} // namespace

bool FileFilter::accepts(const std::string& path, const std::string& extension) const noexcept {
    if (!extensions.empty() &&
        std::find(extensions.begin(), extensions.end(), extension) == extensions.end()) {
        return false;
    }
    if (!include_paths.empty()) {
        bool included = false;
        for (const auto& p : include_paths) {
            if (p.search(path)) {
                included = true;
                break;
            }
        }
        if (!included) return false;
    }
    for (const auto& p : exclude_paths) {
        if (p.search(path)) return false;
    }
    return true;
}

bool compileRule(const RuleSpec& spec, RuleDefinition* out, std::string* error) noexcept {
    if (spec.id.empty()) {
        if (error) *error = "rule without an id";
        return false;
    }

    out->id = spec.id;
    out->category = spec.category;
    out->header = spec.header.empty() ? "Rule " + spec.id + " violated." : spec.header;
    out->remediation_hint = spec.hint;
    out->strictness = spec.strictness;
    out->filter.extensions = spec.extensions;

    if (!compileList(spec.id, "include_paths", spec.include_paths, &out->filter.include_paths, error) ||
        !compileList(spec.id, "exclude_paths", spec.exclude_paths, &out->filter.exclude_paths, error)) {
        return false;
    }

    switch (spec.kind) {
        case RuleKind::PATTERN: {
            if (spec.patterns.empty()) {
                return fail(spec.id, "pattern rule needs at least one pattern", error);
            }
            PatternRule rule;
            rule.scope = spec.scope;
            rule.normalize = spec.normalize;
            rule.use_allowlist = spec.use_allowlist;
            for (const auto& entry_spec : spec.patterns) {
                PatternEntry entry;
                entry.excerpt = makeExcerpt(entry_spec.excerpt);
                if (!compileInto(spec.id, "pattern", entry_spec.pattern, &entry.pattern, error) ||
                    !compileList(spec.id, "exempt_paths", entry_spec.exempt_paths, &entry.exempt_paths, error)) {
                    return false;
                }
                rule.entries.push_back(std::move(entry));
            }
            if (!compileOptional(spec.id, "tag_filter", spec.tag_filter, &rule.tag_filter, error)) {
                return false;
            }
            out->body = std::move(rule);
            return true;
        }

        case RuleKind::FILE_REQUIREMENT: {
            if (!spec.forbid && !spec.require) {
                return fail(spec.id, "file requirement needs 'forbid' or 'require'", error);
            }
            FileRequirementRule rule;
            rule.excerpt = makeExcerpt(spec.excerpt.empty() ? out->header : spec.excerpt);
            if (!compileOptional(spec.id, "forbid", spec.forbid, &rule.forbid, error) ||
                !compileOptional(spec.id, "require", spec.require, &rule.require, error) ||
                !compileOptional(spec.id, "import_filter", spec.import_filter, &rule.import_filter, error) ||
                !compileOptional(spec.id, "wrapper_marker", spec.wrapper_marker, &rule.wrapper_marker, error)) {
                return false;
            }
            out->body = std::move(rule);
            return true;
        }

        case RuleKind::DUPLICATE_IMPLEMENTATION: {
            if (spec.primary.empty()) {
                return fail(spec.id, "duplicate rule needs a primary file", error);
            }
            if (spec.secondary.empty() && !spec.secondary_name) {
                return fail(spec.id, "duplicate rule needs 'secondary' or 'secondary_name'", error);
            }
            DuplicateRule rule;
            rule.primary = spec.primary;
            rule.secondary = spec.secondary;
            rule.require_referenced = spec.require_referenced;
            rule.reference_tokens = spec.reference_tokens;
            if (!compileOptional(spec.id, "secondary_name", spec.secondary_name, &rule.secondary_name, error) ||
                !compileOptional(spec.id, "wrapper_import", spec.wrapper_import, &rule.wrapper_import, error)) {
                return false;
            }
            out->body = std::move(rule);
            return true;
        }

        case RuleKind::CANONICAL_CONTENT: {
            if (spec.clauses.empty()) {
                return fail(spec.id, "canonical rule needs at least one clause", error);
            }
            CanonicalRule rule;
            rule.require_all = spec.require_all;
            for (const auto& clause_spec : spec.clauses) {
                if (clause_spec.files.empty()) {
                    return fail(spec.id, "canonical clause without files", error);
                }
                CanonicalClause clause;
                clause.files = clause_spec.files;
                clause.hit_when_present = clause_spec.hit_when_present;
                clause.description = makeExcerpt(clause_spec.description);
                if (!compileInto(spec.id, "clause pattern", clause_spec.pattern, &clause.pattern, error)) {
                    return false;
                }
                rule.clauses.push_back(std::move(clause));
            }
            out->body = std::move(rule);
            return true;
        }
    }

    return fail(spec.id, "unknown rule kind", error);
}

} // namespace UiAudit
