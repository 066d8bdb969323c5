#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "rule.h"

namespace UiAudit {

struct AuditConfig;

/// Ordered, compiled rule set of one audit run
class RuleRegistry {
public:
    RuleRegistry() = default;

    /// Default rules (unless disabled by config) followed by configured rules,
    /// minus disabled ids, with hard_rules promoted to Strictness::HARD.
    /// False on a duplicate id or a malformed pattern.
    [[nodiscard]] bool build(const AuditConfig& config, std::string* error) noexcept;

    /// Compile and append one rule
    [[nodiscard]] bool add(const RuleSpec& spec, std::string* error) noexcept;

    [[nodiscard]] const std::vector<RuleDefinition>& rules() const noexcept { return rules_; }
    [[nodiscard]] size_t size() const noexcept { return rules_.size(); }

    /// Rule by id, nullptr when absent
    [[nodiscard]] const RuleDefinition* find(std::string_view id) const noexcept;

private:
    std::vector<RuleDefinition> rules_;
};

} // namespace UiAudit
