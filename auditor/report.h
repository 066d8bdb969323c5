#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "audit_types.h"
#include "rule.h"

namespace UiAudit {

/// Shared match accumulator of one run.
///
/// Workers append under a lock; build() imposes the deterministic order
/// (rule registration order, then file, line, excerpt) and drops exact
/// duplicates, so the result does not depend on scheduling.
class ViolationAggregator {
public:
    explicit ViolationAggregator(const std::vector<RuleDefinition>& rules);

    ViolationAggregator(const ViolationAggregator&) = delete;
    ViolationAggregator& operator=(const ViolationAggregator&) = delete;

    /// Append matches of the rule at registration index `rule_index`
    void add(size_t rule_index, std::vector<Match>&& matches) noexcept;

    /// One report per rule with at least one match; sets `passed`
    void build(AuditResult* result) noexcept;

private:
    const std::vector<RuleDefinition>& rules_;
    std::mutex mutex_;
    std::vector<std::vector<Match>> buckets_;
};

// ========== Report formats ==========

/// Header, " - path:line — excerpt" per match, "Fix: hint"
[[nodiscard]] std::string formatViolation(const ViolationReport& report);

/// Every report of the result separated by blank lines, followed by a summary line
[[nodiscard]] std::string formatTextReport(const AuditResult& result);

/// "path:line:1: error: excerpt [rule-id]" per match
[[nodiscard]] std::string formatIDEWarnings(const AuditResult& result);

/// Structured result document
[[nodiscard]] std::string formatJSON(const AuditResult& result);

/// One testcase per evaluated rule, failing ones carry their matches
[[nodiscard]] std::string formatJUnit(const AuditResult& result);

/// Write text to path (created or truncated); false with a LOG_ERROR on failure
[[nodiscard]] bool writeReportFile(const char* path, const std::string& text) noexcept;

} // namespace UiAudit
