#include "rule_registry.h"

#include <algorithm>

#include "common/logging.h"
#include "config/audit_config.h"
#include "default_rules.h"

namespace UiAudit {

namespace {

bool listed(const std::vector<std::string>& ids, const std::string& id) noexcept {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

} // namespace

bool RuleRegistry::add(const RuleSpec& spec, std::string* error) noexcept {
    if (find(spec.id) != nullptr) {
        if (error) *error = "duplicate rule id '" + spec.id + "'";
        return false;
    }
    RuleDefinition rule;
    if (!compileRule(spec, &rule, error)) {
        return false;
    }
    rules_.push_back(std::move(rule));
    return true;
}

bool RuleRegistry::build(const AuditConfig& config, std::string* error) noexcept {
    rules_.clear();

    std::vector<RuleSpec> specs;
    if (config.use_default_rules) {
        specs = defaultRuleSpecs(config);
    }
    specs.insert(specs.end(), config.rules.begin(), config.rules.end());

    for (auto& spec : specs) {
        if (listed(config.disabled_rules, spec.id)) {
            LOG_INFO("Rule disabled by config: %s", spec.id.c_str());
            continue;
        }
        if (listed(config.hard_rules, spec.id)) {
            spec.strictness = Strictness::HARD;
        }
        if (!add(spec, error)) {
            rules_.clear();
            return false;
        }
    }

    std::vector<std::string> known_ids;
    known_ids.reserve(specs.size());
    for (const auto& spec : specs) {
        known_ids.push_back(spec.id);
    }
    for (const auto& id : config.disabled_rules) {
        if (!listed(known_ids, id)) {
            LOG_WARN("disabled_rules names unknown rule: %s", id.c_str());
        }
    }
    for (const auto& id : config.hard_rules) {
        if (find(id) == nullptr) {
            LOG_WARN("hard_rules names unknown or disabled rule: %s", id.c_str());
        }
    }

    LOG_INFO("Rule registry built: %zu rules", rules_.size());
    return true;
}

const RuleDefinition* RuleRegistry::find(std::string_view id) const noexcept {
    for (const auto& rule : rules_) {
        if (rule.id == id) return &rule;
    }
    return nullptr;
}

} // namespace UiAudit
