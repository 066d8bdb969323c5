#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "allowlist.h"
#include "audit_types.h"
#include "line_locator.h"
#include "rule.h"
#include "source_file.h"
#include "source_tree.h"

namespace UiAudit {

/// Single evaluator every rule kind flows through.
///
/// Filtering order for every candidate match: inline suppression on the raw
/// line the match starts on, then the allowlist when the rule opts in.
/// Stateless after construction; evaluateFile() may run on many threads.
class RuleEvaluator {
public:
    RuleEvaluator(const SourceTree& tree, const Allowlist& allowlist, const SuppressionCheck& suppression,
                  LineBasis line_basis, std::string alias_root);

    RuleEvaluator(const RuleEvaluator&) = delete;
    RuleEvaluator& operator=(const RuleEvaluator&) = delete;

    /// PATTERN and FILE_REQUIREMENT rules against one file (other kinds are ignored)
    void evaluateFile(const RuleDefinition& rule, const SourceFile& file, std::vector<Match>* out) const;

    /// DUPLICATE_IMPLEMENTATION and CANONICAL_CONTENT rules over the whole project.
    /// `files` must be sorted by path. CONFIG_ERROR only for a hard rule whose
    /// canonical file is absent.
    [[nodiscard]] AuditStatus evaluateProject(const RuleDefinition& rule, const std::vector<const SourceFile*>& files,
                                              std::vector<Match>* out, std::string* error) const;

    /// Module specifier of an `import ... from "<target>"` line
    [[nodiscard]] static std::optional<std::string_view> importTarget(std::string_view line) noexcept;

    /// Project-relative path of an import, "@/" mapped to the alias root, ".tsx" appended when missing
    [[nodiscard]] std::string resolveImport(std::string_view importer, std::string_view target) const;

private:
    void evaluatePattern(const RuleDefinition& def, const PatternRule& rule, const SourceFile& file,
                         std::vector<Match>* out) const noexcept;
    void evaluateRequirement(const FileRequirementRule& rule, const SourceFile& file,
                             std::vector<Match>* out) const;
    [[nodiscard]] bool satisfiedByImport(const FileRequirementRule& rule, const SourceFile& file) const;

    [[nodiscard]] AuditStatus evaluateDuplicate(const RuleDefinition& def, const DuplicateRule& rule,
                                                const std::vector<const SourceFile*>& files,
                                                std::vector<Match>* out, std::string* error) const;
    [[nodiscard]] AuditStatus evaluateCanonical(const RuleDefinition& def, const CanonicalRule& rule,
                                                std::vector<Match>* out, std::string* error) const;

    [[nodiscard]] AuditStatus missingCanonical(const RuleDefinition& def, const std::string& path,
                                               std::string* error) const noexcept;

    /// Collected file content when available, otherwise read through the tree
    [[nodiscard]] bool loadContent(const std::string& path, const std::vector<const SourceFile*>& files,
                                   std::string* out) const;

    [[nodiscard]] bool suppressedAt(std::string_view content, uint32_t line) const noexcept;

    const SourceTree& tree_;
    const Allowlist& allowlist_;
    const SuppressionCheck& suppression_;
    LineBasis line_basis_;
    std::string alias_root_;
};

} // namespace UiAudit
