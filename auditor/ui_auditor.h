#pragma once

#include <string>
#include <vector>

#include "allowlist.h"
#include "audit_types.h"
#include "file_collector.h"
#include "line_locator.h"
#include "rule_registry.h"
#include "source_tree.h"
#include "config/audit_config.h"

namespace UiAudit {

/// Orchestrates one audit: collect, evaluate every rule, aggregate.
///
/// Usage:
///   UiAuditor auditor(config, tree);
///   AuditResult result;
///   AuditStatus status = auditor.run(&result);
///   return UiAuditor::exitCodeFor(status, result);
///
/// Per-file rules run on a Common::ThreadPool; cross-file rules run afterwards
/// on the calling thread. Every rule runs even when earlier ones fired.
class UiAuditor {
public:
    UiAuditor(const AuditConfig& config, const SourceTree& tree);

    UiAuditor(const UiAuditor&) = delete;
    UiAuditor& operator=(const UiAuditor&) = delete;

    /// Compile rules, allowlist, suppression marker and path filters.
    /// Called by run() when needed; false leaves the reason in lastError().
    [[nodiscard]] bool prepare() noexcept;

    /// OK with a filled result, CONFIG_ERROR, or INTERNAL_ERROR if a scan task or cross-file rule threw
    [[nodiscard]] AuditStatus run(AuditResult* result) noexcept;

    [[nodiscard]] const std::string& lastError() const noexcept { return last_error_; }
    [[nodiscard]] const RuleRegistry& registry() const noexcept { return registry_; }
    [[nodiscard]] const Allowlist& allowlist() const noexcept { return allowlist_; }

    /// 0 pass, 1 violations, 2 configuration error, 3 internal error
    [[nodiscard]] static int exitCodeFor(AuditStatus status, const AuditResult& result) noexcept;

private:
    [[nodiscard]] bool buildAllowlist() noexcept;
    [[nodiscard]] bool buildCollectorOptions() noexcept;

    const AuditConfig& config_;
    const SourceTree& tree_;

    RuleRegistry registry_;
    Allowlist allowlist_;
    SuppressionCheck suppression_;
    FileCollector::Options collector_options_;

    bool prepared_ = false;
    std::string last_error_;
};

} // namespace UiAudit
