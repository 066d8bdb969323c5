#include "report.h"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include "common/logging.h"

namespace UiAudit {

ViolationAggregator::ViolationAggregator(const std::vector<RuleDefinition>& rules)
    : rules_(rules), buckets_(rules.size()) {}

void ViolationAggregator::add(size_t rule_index, std::vector<Match>&& matches) noexcept {
    if (matches.empty() || rule_index >= buckets_.size()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto& bucket = buckets_[rule_index];
    bucket.insert(bucket.end(), std::make_move_iterator(matches.begin()), std::make_move_iterator(matches.end()));
}

void ViolationAggregator::build(AuditResult* result) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    result->reports.clear();
    result->evaluated_rules.clear();

    for (size_t i = 0; i < rules_.size(); ++i) {
        result->evaluated_rules.push_back(rules_[i].id);

        auto& bucket = buckets_[i];
        if (bucket.empty()) continue;

        std::sort(bucket.begin(), bucket.end());
        bucket.erase(std::unique(bucket.begin(), bucket.end()), bucket.end());

        ViolationReport report;
        report.rule_id = rules_[i].id;
        report.category = rules_[i].category;
        report.header = rules_[i].header;
        report.remediation_hint = rules_[i].remediation_hint;
        report.matches = bucket;
        result->reports.push_back(std::move(report));
    }

    result->rules_evaluated = static_cast<uint32_t>(rules_.size());
    result->passed = result->reports.empty();
}

// ========== Text ==========

std::string formatViolation(const ViolationReport& report) {
    std::string out;
    out += report.header;
    out += '\n';
    for (const auto& m : report.matches) {
        out += " - ";
        out += m.file_path;
        out += ':';
        out += std::to_string(m.line_number);
        out += " \xE2\x80\x94 ";  // em dash
        out += m.excerpt;
        out += '\n';
    }
    if (!report.remediation_hint.empty()) {
        out += "Fix: ";
        out += report.remediation_hint;
        out += '\n';
    }
    return out;
}

std::string formatTextReport(const AuditResult& result) {
    std::string out;
    for (const auto& report : result.reports) {
        out += "[";
        out += report.rule_id;
        out += "] (";
        out += categoryName(report.category);
        out += ")\n";
        out += formatViolation(report);
        out += '\n';
    }

    char summary[256];
    snprintf(summary, sizeof(summary),
             "%s: %zu violation(s) in %zu rule(s); %u files scanned, %u skipped, %u rules evaluated\n",
             result.passed ? "PASS" : "FAIL",
             result.totalMatches(), result.reports.size(),
             result.files_scanned, result.files_skipped, result.rules_evaluated);
    out += summary;
    return out;
}

std::string formatIDEWarnings(const AuditResult& result) {
    std::string out;
    for (const auto& report : result.reports) {
        for (const auto& m : report.matches) {
            out += m.file_path;
            out += ':';
            out += std::to_string(m.line_number);
            out += ":1: error: ";
            out += m.excerpt;
            out += " [";
            out += report.rule_id;
            out += "]\n";
        }
    }
    return out;
}

// ========== JSON ==========

std::string formatJSON(const AuditResult& result) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();
    writer.Key("passed");
    writer.Bool(result.passed);

    writer.Key("summary");
    writer.StartObject();
    writer.Key("files_scanned");
    writer.Uint(result.files_scanned);
    writer.Key("files_skipped");
    writer.Uint(result.files_skipped);
    writer.Key("rules_evaluated");
    writer.Uint(result.rules_evaluated);
    writer.Key("violations");
    writer.Uint64(result.totalMatches());
    writer.EndObject();

    writer.Key("reports");
    writer.StartArray();
    for (const auto& report : result.reports) {
        writer.StartObject();
        writer.Key("rule");
        writer.String(report.rule_id.c_str(), static_cast<rapidjson::SizeType>(report.rule_id.size()));
        writer.Key("category");
        writer.String(categoryName(report.category));
        writer.Key("header");
        writer.String(report.header.c_str(), static_cast<rapidjson::SizeType>(report.header.size()));
        writer.Key("hint");
        writer.String(report.remediation_hint.c_str(),
                      static_cast<rapidjson::SizeType>(report.remediation_hint.size()));

        writer.Key("matches");
        writer.StartArray();
        for (const auto& m : report.matches) {
            writer.StartObject();
            writer.Key("file");
            writer.String(m.file_path.c_str(), static_cast<rapidjson::SizeType>(m.file_path.size()));
            writer.Key("line");
            writer.Uint(m.line_number);
            writer.Key("excerpt");
            writer.String(m.excerpt.c_str(), static_cast<rapidjson::SizeType>(m.excerpt.size()));
            writer.EndObject();
        }
        writer.EndArray();
        writer.EndObject();
    }
    writer.EndArray();
    writer.EndObject();

    return std::string(buffer.GetString(), buffer.GetSize()) + "\n";
}

// ========== JUnit ==========

namespace {

std::string xmlEscape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':  out += "&amp;"; break;
            case '<':  out += "&lt;"; break;
            case '>':  out += "&gt;"; break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default:   out += c; break;
        }
    }
    return out;
}

const ViolationReport* reportFor(const AuditResult& result, const std::string& rule_id) noexcept {
    for (const auto& report : result.reports) {
        if (report.rule_id == rule_id) return &report;
    }
    return nullptr;
}

} // namespace

std::string formatJUnit(const AuditResult& result) {
    std::string out;
    out += "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    out += "<testsuite name=\"ui_audit\" tests=\"" + std::to_string(result.evaluated_rules.size()) +
           "\" failures=\"" + std::to_string(result.reports.size()) + "\">\n";

    for (const auto& rule_id : result.evaluated_rules) {
        const ViolationReport* report = reportFor(result, rule_id);
        out += "  <testcase classname=\"ui_audit\" name=\"" + xmlEscape(rule_id) + "\"";
        if (!report) {
            out += "/>\n";
            continue;
        }
        out += ">\n";
        out += "    <failure message=\"" + xmlEscape(report->header) + "\" type=\"" +
               categoryName(report->category) + "\">";
        out += xmlEscape(formatViolation(*report));
        out += "</failure>\n";
        out += "  </testcase>\n";
    }

    out += "</testsuite>\n";
    return out;
}

bool writeReportFile(const char* path, const std::string& text) noexcept {
    int fd = open(path, O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        LOG_ERROR("Failed to create report file %s: %s", path, strerror(errno));
        return false;
    }

    size_t written = 0;
    while (written < text.size()) {
        const ssize_t n = write(fd, text.data() + written, text.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("Failed to write report file %s: %s", path, strerror(errno));
            close(fd);
            return false;
        }
        written += static_cast<size_t>(n);
    }

    close(fd);
    LOG_INFO("Report written: %s (%zu bytes)", path, text.size());
    return true;
}

} // namespace UiAudit
