#include "ui_auditor.h"

#include <atomic>
#include <exception>
#include <future>
#include <memory>
#include <optional>

#include "common/logging.h"
#include "common/thread_utils.h"
#include "common/time_utils.h"
#include "report.h"
#include "rule_evaluator.h"
#include "source_file.h"

namespace UiAudit {

UiAuditor::UiAuditor(const AuditConfig& config, const SourceTree& tree)
    : config_(config), tree_(tree) {}

// ========== Preparation ==========

bool UiAuditor::buildAllowlist() noexcept {
    allowlist_ = Allowlist();
    std::string err;
    for (const auto& spec : config_.allowlist.directories) {
        if (!allowlist_.addDirectoryExemption(spec.path, spec.reason, &err)) {
            last_error_ = "allowlist directory exemption: " + err;
            return false;
        }
    }
    for (const auto& spec : config_.allowlist.classes) {
        if (!allowlist_.addClassExemption(spec.path, spec.content, spec.reason, &err)) {
            last_error_ = "allowlist class exemption: " + err;
            return false;
        }
    }
    LOG_INFO("Allowlist: %zu directory exemptions, %zu class exemptions",
             allowlist_.directoryCount(), allowlist_.classCount());
    return true;
}

bool UiAuditor::buildCollectorOptions() noexcept {
    collector_options_ = FileCollector::Options();
    collector_options_.roots = config_.source_roots;
    collector_options_.extensions = config_.extensions;
    collector_options_.excluded_dirs = config_.excluded_dirs;

    std::string err;
    for (const auto& spec : config_.exclude_paths) {
        Pattern p;
        if (!Pattern::compile(spec, &p, &err)) {
            last_error_ = "exclude_paths: " + err;
            return false;
        }
        collector_options_.exclude_paths.push_back(std::move(p));
    }
    return true;
}

bool UiAuditor::prepare() noexcept {
    prepared_ = false;
    last_error_.clear();

    if (!registry_.build(config_, &last_error_)) {
        LOG_ERROR("Configuration error: %s", last_error_.c_str());
        return false;
    }
    if (!buildAllowlist() || !buildCollectorOptions()) {
        LOG_ERROR("Configuration error: %s", last_error_.c_str());
        return false;
    }

    std::string err;
    if (!suppression_.init(PatternSpec(config_.suppression_marker), &err)) {
        last_error_ = "suppression_marker: " + err;
        LOG_ERROR("Configuration error: %s", last_error_.c_str());
        return false;
    }

    prepared_ = true;
    return true;
}

// ========== Run ==========

AuditStatus UiAuditor::run(AuditResult* result) noexcept {
    *result = AuditResult();
    if (!prepared_ && !prepare()) {
        return AuditStatus::CONFIG_ERROR;
    }

    const uint64_t start_ns = Common::getNanosSinceEpoch();
    const size_t workers = Common::resolveWorkerCount(config_.workers);
    LOG_INFO("UI audit started: root=%s rules=%zu workers=%zu line_basis=%s",
             config_.project_root.c_str(), registry_.size(), workers, lineBasisName(config_.line_basis));

    const std::vector<RuleDefinition>& rules = registry_.rules();
    const std::vector<std::string> paths = FileCollector(tree_, collector_options_).collect();
    LOG_INFO("Collected %zu files", paths.size());

    RuleEvaluator evaluator(tree_, allowlist_, suppression_, config_.line_basis, config_.alias_root);
    ViolationAggregator aggregator(rules);

    // One slot per path; a worker owns exactly one slot
    std::vector<std::optional<SourceFile>> slots(paths.size());
    std::atomic<uint32_t> skipped{0};

    auto scanOne = [&](size_t index) {
        const std::string& path = paths[index];
        std::string content;
        if (!tree_.read(path, &content)) {
            LOG_WARN("Skipping unreadable file: %s", path.c_str());
            skipped.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        slots[index].emplace(path, std::move(content));
        const SourceFile& file = *slots[index];

        for (size_t r = 0; r < rules.size(); ++r) {
            if (!rules[r].perFile()) continue;
            std::vector<Match> matches;
            evaluator.evaluateFile(rules[r], file, &matches);
            aggregator.add(r, std::move(matches));
        }
    };

    AuditStatus status = AuditStatus::OK;

    if (workers <= 1) {
        for (size_t i = 0; i < paths.size(); ++i) {
            try {
                scanOne(i);
            } catch (const std::exception& e) {
                LOG_ERROR("Scan of %s failed: %s", paths[i].c_str(), e.what());
                last_error_ = "scan of " + paths[i] + " failed: " + e.what();
                status = AuditStatus::INTERNAL_ERROR;
            }
        }
    } else {
        Common::ThreadPool pool(workers, "ui_audit_wrk");
        std::vector<std::future<void>> pending;
        pending.reserve(paths.size());
        for (size_t i = 0; i < paths.size(); ++i) {
            pending.push_back(pool.enqueue(scanOne, i));
        }
        for (size_t i = 0; i < pending.size(); ++i) {
            try {
                pending[i].get();
            } catch (const std::exception& e) {
                LOG_ERROR("Scan of %s failed: %s", paths[i].c_str(), e.what());
                last_error_ = "scan of " + paths[i] + " failed: " + e.what();
                status = AuditStatus::INTERNAL_ERROR;
            }
        }
    }

    if (status != AuditStatus::OK) {
        return status;
    }

    std::vector<const SourceFile*> files;
    files.reserve(slots.size());
    for (const auto& slot : slots) {
        if (slot) files.push_back(&*slot);
    }

    for (size_t r = 0; r < rules.size(); ++r) {
        if (rules[r].perFile()) continue;
        std::vector<Match> matches;
        try {
            if (evaluator.evaluateProject(rules[r], files, &matches, &last_error_) != AuditStatus::OK) {
                LOG_ERROR("Configuration error: %s", last_error_.c_str());
                return AuditStatus::CONFIG_ERROR;
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Rule %s failed: %s", rules[r].id.c_str(), e.what());
            last_error_ = "rule '" + rules[r].id + "' failed: " + e.what();
            return AuditStatus::INTERNAL_ERROR;
        }
        aggregator.add(r, std::move(matches));
    }

    aggregator.build(result);
    result->files_scanned = static_cast<uint32_t>(files.size());
    result->files_skipped = skipped.load(std::memory_order_relaxed);

    for (const auto& report : result->reports) {
        LOG_INFO("[%s] %zu violation(s)", report.rule_id.c_str(), report.matches.size());
    }

    const uint64_t elapsed_us = (Common::getNanosSinceEpoch() - start_ns) / 1000;
    LOG_INFO("UI audit finished: %s, %zu violations, %u files scanned, %u skipped, %lu us",
             result->passed ? "PASS" : "FAIL", result->totalMatches(),
             result->files_scanned, result->files_skipped, static_cast<unsigned long>(elapsed_us));
    return AuditStatus::OK;
}

int UiAuditor::exitCodeFor(AuditStatus status, const AuditResult& result) noexcept {
    switch (status) {
        case AuditStatus::CONFIG_ERROR:
            return 2;
        case AuditStatus::INTERNAL_ERROR:
            return 3;
        case AuditStatus::OK:
            break;
    }
    return result.passed ? 0 : 1;
}

} // namespace UiAudit
