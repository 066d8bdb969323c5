#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "rule.h"

namespace UiAudit {

struct AuditConfig;

/// Built-in rule set, in registration order, derived from the configured
/// canonical paths, copy lists and terminology map
[[nodiscard]] std::vector<RuleSpec> defaultRuleSpecs(const AuditConfig& config);

/// Matches an import of the primary's stem from any directory:
/// "src/components/ui/table.tsx" -> from "./table", from "@/components/ui/table"
[[nodiscard]] PatternSpec wrapperImportFor(std::string_view primary_path);

/// Anchored pattern matching exactly one relative path
[[nodiscard]] PatternSpec exactPath(std::string_view path);

/// Anchored pattern matching everything below a directory
[[nodiscard]] PatternSpec underDirectory(std::string_view dir);

} // namespace UiAudit
