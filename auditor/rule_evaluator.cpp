#include "rule_evaluator.h"

#include <algorithm>

#include "common/logging.h"

namespace UiAudit {

namespace {

bool anyMatches(const std::vector<Pattern>& patterns, const std::string& text) noexcept {
    for (const auto& p : patterns) {
        if (p.search(text)) return true;
    }
    return false;
}

/// 1-based line of content without its terminator
std::string_view lineOf(std::string_view content, uint32_t line) noexcept {
    size_t begin = 0;
    for (uint32_t i = 1; i < line; ++i) {
        const size_t nl = content.find('\n', begin);
        if (nl == std::string_view::npos) return {};
        begin = nl + 1;
    }
    size_t end = content.find('\n', begin);
    if (end == std::string_view::npos) end = content.size();
    if (end > begin && content[end - 1] == '\r') --end;
    return content.substr(begin, end - begin);
}

std::string withoutExtension(std::string_view path) {
    const size_t slash = path.find_last_of('/');
    const size_t dot = path.find_last_of('.');
    if (dot == std::string_view::npos || (slash != std::string_view::npos && dot < slash)) {
        return std::string(path);
    }
    return std::string(path.substr(0, dot));
}

} // namespace

RuleEvaluator::RuleEvaluator(const SourceTree& tree, const Allowlist& allowlist,
                             const SuppressionCheck& suppression, LineBasis line_basis,
                             std::string alias_root)
    : tree_(tree),
      allowlist_(allowlist),
      suppression_(suppression),
      line_basis_(line_basis),
      alias_root_(normalizePath(alias_root)) {}

// ========== Per-file rules ==========

void RuleEvaluator::evaluateFile(const RuleDefinition& rule, const SourceFile& file,
                                 std::vector<Match>* out) const {
    if (!rule.filter.accepts(file.path(), file.extension())) {
        return;
    }
    if (const auto* pattern = std::get_if<PatternRule>(&rule.body)) {
        evaluatePattern(rule, *pattern, file, out);
    } else if (const auto* requirement = std::get_if<FileRequirementRule>(&rule.body)) {
        evaluateRequirement(*requirement, file, out);
    }
}

void RuleEvaluator::evaluatePattern(const RuleDefinition& def, const PatternRule& rule, const SourceFile& file,
                                    std::vector<Match>* out) const noexcept {
    const std::string& path = file.path();

    auto emit = [&](uint32_t line, std::string excerpt) {
        Match m{path, line, std::move(excerpt)};
        if (rule.use_allowlist) {
            if (const AllowEntry* entry = allowlist_.findExemption(m)) {
                LOG_DEBUG("[%s] %s:%u exempt by %s exemption (%s)", def.id.c_str(), path.c_str(), line,
                          allowTierName(entry->tier), entry->reason.c_str());
                return;
            }
        }
        out->push_back(std::move(m));
    };

    for (const auto& entry : rule.entries) {
        if (anyMatches(entry.exempt_paths, path)) {
            continue;
        }

        if (rule.scope == Scope::LINE) {
            const uint32_t count = file.lineCount();
            for (uint32_t ln = 1; ln <= count; ++ln) {
                const std::string_view line = file.rawLine(ln);

                bool hit = false;
                if (rule.tag_filter) {
                    entry.pattern.forEachMatch(line, [&](size_t, std::string_view m) {
                        hit = hit || rule.tag_filter->search(m);
                    });
                } else {
                    hit = entry.pattern.search(line);
                }
                if (!hit || suppression_.isSuppressed(line)) {
                    continue;
                }
                emit(ln, entry.excerpt.empty() ? makeExcerpt(line) : entry.excerpt);
            }
            continue;
        }

        // Document scope: search the normalized text, recover lines by offset
        const NormalizedText& view = file.view(rule.normalize);
        LineLocator locator(view.text);
        entry.pattern.forEachMatch(view.text, [&](size_t offset, std::string_view hit) {
            if (hit.empty()) return;
            if (rule.tag_filter && !rule.tag_filter->search(hit)) return;

            const uint32_t searched_line = locator.lineAt(offset);
            const uint32_t origin_line = view.originLine(searched_line);
            if (suppression_.isSuppressed(file.rawLine(origin_line))) return;

            const uint32_t line = (line_basis_ == LineBasis::ORIGINAL) ? origin_line : searched_line;
            emit(line, entry.excerpt.empty() ? makeExcerpt(hit) : entry.excerpt);
        });
    }
}

void RuleEvaluator::evaluateRequirement(const FileRequirementRule& rule, const SourceFile& file,
                                        std::vector<Match>* out) const {
    const std::string& raw = file.raw();

    bool violated = rule.forbid && rule.forbid->search(raw);
    if (!violated && rule.require && !rule.require->search(raw)) {
        violated = !satisfiedByImport(rule, file);
    }
    if (!violated || suppression_.isSuppressed(file.rawLine(1))) {
        return;
    }
    out->push_back(Match{file.path(), 1, rule.excerpt});
}

bool RuleEvaluator::satisfiedByImport(const FileRequirementRule& rule, const SourceFile& file) const {
    if (!rule.import_filter) {
        return false;
    }
    const Pattern& marker = rule.wrapper_marker ? *rule.wrapper_marker : *rule.require;

    const uint32_t count = file.lineCount();
    for (uint32_t ln = 1; ln <= count; ++ln) {
        const std::string_view line = file.rawLine(ln);
        if (!rule.import_filter->search(line)) continue;

        const auto target = importTarget(line);
        if (!target) continue;

        const std::string resolved = resolveImport(file.path(), *target);
        if (!tree_.exists(resolved)) {
            LOG_DEBUG("%s: import %.*s does not resolve to %s", file.path().c_str(),
                      static_cast<int>(target->size()), target->data(), resolved.c_str());
            continue;
        }

        std::string content;
        if (tree_.read(resolved, &content) && marker.search(content)) {
            return true;
        }
    }
    return false;
}

std::optional<std::string_view> RuleEvaluator::importTarget(std::string_view line) noexcept {
    size_t pos = 0;
    while ((pos = line.find("from", pos)) != std::string_view::npos) {
        size_t i = pos + 4;
        pos = i;
        const size_t ws_begin = i;
        while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) ++i;
        if (i == ws_begin || i >= line.size()) continue;

        const char quote = line[i];
        if (quote != '"' && quote != '\'') continue;

        const size_t close = line.find(quote, i + 1);
        if (close == std::string_view::npos || close == i + 1) continue;
        return line.substr(i + 1, close - i - 1);
    }
    return std::nullopt;
}

std::string RuleEvaluator::resolveImport(std::string_view importer, std::string_view target) const {
    std::string resolved;
    if (target.substr(0, 2) == "@/") {
        resolved = joinPath(alias_root_, target.substr(2));
    } else if (!target.empty() && target.front() == '/') {
        resolved = normalizePath(target);
    } else {
        resolved = joinPath(dirName(importer), target);
    }

    static constexpr std::string_view TSX = ".tsx";
    if (resolved.size() < TSX.size() || resolved.compare(resolved.size() - TSX.size(), TSX.size(), TSX) != 0) {
        resolved += TSX;
    }
    return resolved;
}

// ========== Project rules ==========

AuditStatus RuleEvaluator::evaluateProject(const RuleDefinition& rule, const std::vector<const SourceFile*>& files,
                                           std::vector<Match>* out, std::string* error) const {
    if (const auto* duplicate = std::get_if<DuplicateRule>(&rule.body)) {
        return evaluateDuplicate(rule, *duplicate, files, out, error);
    }
    if (const auto* canonical = std::get_if<CanonicalRule>(&rule.body)) {
        return evaluateCanonical(rule, *canonical, out, error);
    }
    return AuditStatus::OK;
}

AuditStatus RuleEvaluator::missingCanonical(const RuleDefinition& def, const std::string& path,
                                            std::string* error) const noexcept {
    if (def.strictness == Strictness::HARD) {
        if (error) {
            *error = "rule '" + def.id + "': canonical file missing: " + path;
        }
        LOG_ERROR("[%s] canonical file missing: %s", def.id.c_str(), path.c_str());
        return AuditStatus::CONFIG_ERROR;
    }
    LOG_DEBUG("[%s] optional canonical file absent, rule skipped: %s", def.id.c_str(), path.c_str());
    return AuditStatus::OK;
}

bool RuleEvaluator::loadContent(const std::string& path, const std::vector<const SourceFile*>& files,
                                std::string* out) const {
    auto it = std::lower_bound(files.begin(), files.end(), path,
                               [](const SourceFile* f, const std::string& p) { return f->path() < p; });
    if (it != files.end() && (*it)->path() == path) {
        *out = (*it)->raw();
        return true;
    }
    return tree_.read(path, out);
}

bool RuleEvaluator::suppressedAt(std::string_view content, uint32_t line) const noexcept {
    return suppression_.isSuppressed(lineOf(content, line));
}

AuditStatus RuleEvaluator::evaluateDuplicate(const RuleDefinition& def, const DuplicateRule& rule,
                                             const std::vector<const SourceFile*>& files,
                                             std::vector<Match>* out, std::string* error) const {
    if (!tree_.exists(rule.primary)) {
        return missingCanonical(def, rule.primary, error);
    }

    std::vector<std::string> secondaries;
    if (!rule.secondary.empty()) {
        if (tree_.exists(rule.secondary)) {
            secondaries.push_back(normalizePath(rule.secondary));
        }
    } else if (rule.secondary_name) {
        for (const SourceFile* f : files) {
            if (f->path() != rule.primary &&
                def.filter.accepts(f->path(), f->extension()) &&
                rule.secondary_name->search(f->path())) {
                secondaries.push_back(f->path());
            }
        }
    }

    for (const auto& secondary : secondaries) {
        std::string content;
        if (!loadContent(secondary, files, &content)) {
            continue;
        }

        if (rule.wrapper_import && rule.wrapper_import->search(content)) {
            LOG_DEBUG("[%s] %s is a thin wrapper over %s", def.id.c_str(), secondary.c_str(), rule.primary.c_str());
            continue;
        }

        if (rule.require_referenced) {
            std::vector<std::string> tokens = rule.reference_tokens;
            if (tokens.empty()) {
                // "src/components/ui/new/Button.tsx" -> "components/ui/new/Button"
                std::string token = withoutExtension(secondary);
                const std::string alias_prefix = alias_root_.empty() ? std::string() : alias_root_ + "/";
                if (!alias_prefix.empty() && token.compare(0, alias_prefix.size(), alias_prefix) == 0) {
                    token.erase(0, alias_prefix.size());
                }
                tokens.push_back(std::move(token));
            }

            bool referenced = false;
            for (const SourceFile* f : files) {
                if (f->path() == secondary) continue;
                for (const auto& token : tokens) {
                    if (f->raw().find(token) != std::string::npos) {
                        referenced = true;
                        break;
                    }
                }
                if (referenced) break;
            }
            if (!referenced) {
                LOG_DEBUG("[%s] %s exists but is never referenced", def.id.c_str(), secondary.c_str());
                continue;
            }
        }

        if (suppressedAt(content, 1)) {
            continue;
        }
        out->push_back(Match{secondary, 1, makeExcerpt("duplicates " + rule.primary)});
    }
    return AuditStatus::OK;
}

AuditStatus RuleEvaluator::evaluateCanonical(const RuleDefinition& def, const CanonicalRule& rule,
                                             std::vector<Match>* out, std::string* error) const {
    struct Outcome {
        bool hit = false;
        Match match;
    };
    std::vector<Outcome> outcomes;
    outcomes.reserve(rule.clauses.size());

    for (const auto& clause : rule.clauses) {
        Outcome outcome;
        bool any_exists = false;
        bool present = false;
        std::string first_existing;
        std::string first_content;

        for (const auto& file : clause.files) {
            if (!tree_.exists(file)) {
                continue;
            }
            std::string content;
            if (!tree_.read(file, &content)) {
                continue;
            }
            if (!any_exists) {
                any_exists = true;
                first_existing = normalizePath(file);
                first_content = content;
            }
            if (present) continue;

            clause.pattern.forEachMatch(content, [&](size_t offset, std::string_view hit) {
                if (present) return;
                present = true;
                outcome.match.file_path = normalizePath(file);
                outcome.match.line_number = lineAtOffset(content, offset);
                outcome.match.excerpt = clause.description.empty() ? makeExcerpt(hit) : clause.description;
            });
        }

        // Any file of the clause is enough; the others are optional variants
        if (!any_exists) {
            return missingCanonical(def, clause.files.front(), error);
        }

        outcome.hit = (present == clause.hit_when_present);
        if (outcome.hit && !present) {
            outcome.match.file_path = first_existing;
            outcome.match.line_number = 1;
            outcome.match.excerpt = clause.description.empty()
                ? makeExcerpt("missing /" + clause.pattern.source() + "/")
                : clause.description;
        }
        if (outcome.hit) {
            std::string content;
            if (outcome.match.file_path == first_existing) {
                content = first_content;
            } else if (!tree_.read(outcome.match.file_path, &content)) {
                content.clear();
            }
            if (suppressedAt(content, outcome.match.line_number)) {
                outcome.hit = false;
            }
        }
        outcomes.push_back(std::move(outcome));
    }

    bool holds = rule.require_all;
    for (const auto& o : outcomes) {
        holds = rule.require_all ? (holds && o.hit) : (holds || o.hit);
    }
    if (!holds) {
        return AuditStatus::OK;
    }

    for (auto& o : outcomes) {
        if (o.hit) {
            out->push_back(std::move(o.match));
        }
    }
    return AuditStatus::OK;
}

} // namespace UiAudit
