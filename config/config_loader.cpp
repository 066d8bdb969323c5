#include "config_loader.h"

#include <cerrno>
#include <cstdio>
#include <cstring>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include "auditor/default_rules.h"
#include "common/logging.h"

namespace UiAudit {

namespace {

using rapidjson::Value;

auto typeError(const char* key, const char* expected, std::string* error) noexcept -> bool {
    if (error) {
        *error = std::string("config key '") + key + "': expected " + expected;
    }
    return false;
}

auto valueError(const char* key, const char* value, std::string* error) noexcept -> bool {
    if (error) {
        *error = std::string("config key '") + key + "': unknown value '" + value + "'";
    }
    return false;
}

// ========== Scalar readers (absent keys leave the target untouched) ==========

auto readString(const Value& obj, const char* key, std::string* out, std::string* error) noexcept -> bool {
    if (!obj.HasMember(key)) return true;
    const Value& v = obj[key];
    if (!v.IsString()) return typeError(key, "string", error);
    out->assign(v.GetString(), v.GetStringLength());
    return true;
}

auto readBool(const Value& obj, const char* key, bool* out, std::string* error) noexcept -> bool {
    if (!obj.HasMember(key)) return true;
    const Value& v = obj[key];
    if (!v.IsBool()) return typeError(key, "boolean", error);
    *out = v.GetBool();
    return true;
}

auto readUint(const Value& obj, const char* key, uint32_t* out, std::string* error) noexcept -> bool {
    if (!obj.HasMember(key)) return true;
    const Value& v = obj[key];
    if (!v.IsUint()) return typeError(key, "non-negative integer", error);
    *out = v.GetUint();
    return true;
}

auto readStringList(const Value& obj, const char* key, std::vector<std::string>* out,
                    std::string* error) noexcept -> bool {
    if (!obj.HasMember(key)) return true;
    const Value& v = obj[key];
    if (!v.IsArray()) return typeError(key, "array of strings", error);
    std::vector<std::string> items;
    for (const auto& item : v.GetArray()) {
        if (!item.IsString()) return typeError(key, "array of strings", error);
        items.emplace_back(item.GetString(), item.GetStringLength());
    }
    *out = std::move(items);
    return true;
}

auto readPattern(const Value& obj, const char* key, std::optional<PatternSpec>* out,
                 std::string* error) noexcept -> bool {
    if (!obj.HasMember(key)) return true;
    const Value& v = obj[key];
    if (!v.IsString()) return typeError(key, "pattern string", error);
    *out = PatternSpec::parse(std::string_view(v.GetString(), v.GetStringLength()));
    return true;
}

auto readPatternList(const Value& obj, const char* key, std::vector<PatternSpec>* out,
                     std::string* error) noexcept -> bool {
    std::vector<std::string> raw;
    bool present = obj.HasMember(key);
    if (!readStringList(obj, key, &raw, error)) return false;
    if (!present) return true;
    out->clear();
    for (const auto& s : raw) {
        out->push_back(PatternSpec::parse(s));
    }
    return true;
}

/// Reads key into `out` only when its string value is one of `names`
template<typename E, size_t N>
auto readEnum(const Value& obj, const char* key, const char* const (&names)[N], const E (&values)[N],
              E* out, std::string* error) noexcept -> bool {
    if (!obj.HasMember(key)) return true;
    const Value& v = obj[key];
    if (!v.IsString()) return typeError(key, "string", error);
    for (size_t i = 0; i < N; ++i) {
        if (std::strcmp(v.GetString(), names[i]) == 0) {
            *out = values[i];
            return true;
        }
    }
    return valueError(key, v.GetString(), error);
}

// ========== Sections ==========

auto parseCanonical(const Value& obj, CanonicalFiles* canonical, std::string* error) noexcept -> bool {
    if (!obj.IsObject()) return typeError("canonical", "object", error);

    static const struct {
        const char* key;
        std::string CanonicalFiles::*field;
    } FIELDS[] = {
        {"index_css", &CanonicalFiles::index_css},
        {"colors_css", &CanonicalFiles::colors_css},
        {"pages_dir", &CanonicalFiles::pages_dir},
        {"container", &CanonicalFiles::container},
        {"page_container", &CanonicalFiles::page_container},
        {"button", &CanonicalFiles::button},
        {"button_variants", &CanonicalFiles::button_variants},
        {"alt_button", &CanonicalFiles::alt_button},
        {"table", &CanonicalFiles::table},
        {"simple_table", &CanonicalFiles::simple_table},
        {"dialog", &CanonicalFiles::dialog},
        {"standard_dialog", &CanonicalFiles::standard_dialog},
        {"form_submit", &CanonicalFiles::form_submit},
        {"duplicate_submit_name", &CanonicalFiles::duplicate_submit_name},
    };

    for (const auto& f : FIELDS) {
        if (!readString(obj, f.key, &(canonical->*f.field), error)) return false;
    }
    return readStringList(obj, "alt_button_imports", &canonical->alt_button_imports, error);
}

auto parseAllowEntries(const Value& obj, const char* key, bool with_content,
                       std::vector<AllowSpec>* out, std::string* error) noexcept -> bool {
    if (!obj.HasMember(key)) return true;
    const Value& arr = obj[key];
    if (!arr.IsArray()) return typeError(key, "array of objects", error);

    std::vector<AllowSpec> entries;
    for (const auto& item : arr.GetArray()) {
        if (!item.IsObject()) return typeError(key, "array of objects", error);
        std::optional<PatternSpec> path;
        std::optional<PatternSpec> content;
        AllowSpec entry;
        if (!readPattern(item, "path", &path, error) ||
            !readPattern(item, "content", &content, error) ||
            !readString(item, "reason", &entry.reason, error)) {
            return false;
        }
        if (!path) return typeError("path", "pattern string in every allowlist entry", error);
        if (with_content && !content) return typeError("content", "pattern string in every class exemption", error);
        entry.path = *path;
        if (content) entry.content = *content;
        entries.push_back(std::move(entry));
    }
    *out = std::move(entries);
    return true;
}

auto parseAllowlist(const Value& obj, AllowlistConfig* allowlist, std::string* error) noexcept -> bool {
    if (!obj.IsObject()) return typeError("allowlist", "object", error);
    return parseAllowEntries(obj, "directories", false, &allowlist->directories, error) &&
           parseAllowEntries(obj, "classes", true, &allowlist->classes, error);
}

auto parseCopy(const Value& obj, CopyConfig* copy, std::string* error) noexcept -> bool {
    if (!obj.IsObject()) return typeError("copy", "object", error);

    if (!readPatternList(obj, "include_dirs", &copy->include_dirs, error) ||
        !readPatternList(obj, "exclude_dirs", &copy->exclude_dirs, error) ||
        !readPatternList(obj, "forbidden_phrases", &copy->forbidden_phrases, error)) {
        return false;
    }

    if (obj.HasMember("preferred_terms")) {
        const Value& terms = obj["preferred_terms"];
        if (!terms.IsObject()) return typeError("preferred_terms", "object of arrays", error);
        std::vector<PreferredTerm> parsed;
        for (auto it = terms.MemberBegin(); it != terms.MemberEnd(); ++it) {
            PreferredTerm term;
            term.preferred.assign(it->name.GetString(), it->name.GetStringLength());
            if (!it->value.IsArray()) return typeError("preferred_terms", "object of arrays", error);
            for (const auto& f : it->value.GetArray()) {
                if (!f.IsString()) return typeError("preferred_terms", "object of string arrays", error);
                term.forbidden.emplace_back(f.GetString(), f.GetStringLength());
            }
            parsed.push_back(std::move(term));
        }
        copy->preferred_terms = std::move(parsed);
    }

    if (obj.HasMember("term_exceptions")) {
        const Value& arr = obj["term_exceptions"];
        if (!arr.IsArray()) return typeError("term_exceptions", "array of objects", error);
        std::vector<TermException> parsed;
        for (const auto& item : arr.GetArray()) {
            if (!item.IsObject()) return typeError("term_exceptions", "array of objects", error);
            std::optional<PatternSpec> path;
            TermException ex;
            if (!readPattern(item, "path", &path, error) ||
                !readStringList(item, "terms", &ex.terms, error)) {
                return false;
            }
            if (!path) return typeError("path", "pattern string in every term exception", error);
            ex.path = *path;
            parsed.push_back(std::move(ex));
        }
        copy->term_exceptions = std::move(parsed);
    }
    return true;
}

auto parseRule(const Value& obj, RuleSpec* rule, std::string* error) noexcept -> bool {
    if (!obj.IsObject()) return typeError("rules", "array of objects", error);

    static const char* const KIND_NAMES[] = {"pattern", "file_requirement", "duplicate", "canonical"};
    static const RuleKind KIND_VALUES[] = {RuleKind::PATTERN, RuleKind::FILE_REQUIREMENT,
                                           RuleKind::DUPLICATE_IMPLEMENTATION, RuleKind::CANONICAL_CONTENT};
    static const char* const CATEGORY_NAMES[] = {"token-usage", "layout", "component-duplication",
                                                 "copy-terminology", "accessibility", "architecture-layering"};
    static const Category CATEGORY_VALUES[] = {Category::TOKEN_USAGE, Category::LAYOUT,
                                               Category::COMPONENT_DUPLICATION, Category::COPY_TERMINOLOGY,
                                               Category::ACCESSIBILITY, Category::ARCHITECTURE_LAYERING};
    static const char* const SCOPE_NAMES[] = {"line", "document"};
    static const Scope SCOPE_VALUES[] = {Scope::LINE, Scope::DOCUMENT};
    static const char* const NORMALIZE_NAMES[] = {"none", "comments", "full"};
    static const NormalizeLevel NORMALIZE_VALUES[] = {NormalizeLevel::NONE, NormalizeLevel::COMMENTS,
                                                      NormalizeLevel::FULL};
    static const char* const COMBINE_NAMES[] = {"all", "any"};
    static const bool COMBINE_VALUES[] = {true, false};
    static const char* const STRICTNESS_NAMES[] = {"soft", "hard"};
    static const Strictness STRICTNESS_VALUES[] = {Strictness::SOFT, Strictness::HARD};

    if (!readString(obj, "id", &rule->id, error) ||
        !readEnum(obj, "kind", KIND_NAMES, KIND_VALUES, &rule->kind, error) ||
        !readEnum(obj, "category", CATEGORY_NAMES, CATEGORY_VALUES, &rule->category, error) ||
        !readString(obj, "header", &rule->header, error) ||
        !readString(obj, "hint", &rule->hint, error) ||
        !readStringList(obj, "extensions", &rule->extensions, error) ||
        !readPatternList(obj, "include_paths", &rule->include_paths, error) ||
        !readPatternList(obj, "exclude_paths", &rule->exclude_paths, error) ||
        !readEnum(obj, "scope", SCOPE_NAMES, SCOPE_VALUES, &rule->scope, error) ||
        !readEnum(obj, "normalize", NORMALIZE_NAMES, NORMALIZE_VALUES, &rule->normalize, error) ||
        !readPattern(obj, "tag_filter", &rule->tag_filter, error) ||
        !readBool(obj, "allowlist", &rule->use_allowlist, error) ||
        !readPattern(obj, "forbid", &rule->forbid, error) ||
        !readPattern(obj, "require", &rule->require, error) ||
        !readPattern(obj, "import_filter", &rule->import_filter, error) ||
        !readPattern(obj, "wrapper_marker", &rule->wrapper_marker, error) ||
        !readString(obj, "excerpt", &rule->excerpt, error) ||
        !readString(obj, "primary", &rule->primary, error) ||
        !readString(obj, "secondary", &rule->secondary, error) ||
        !readPattern(obj, "secondary_name", &rule->secondary_name, error) ||
        !readPattern(obj, "wrapper_import", &rule->wrapper_import, error) ||
        !readBool(obj, "require_referenced", &rule->require_referenced, error) ||
        !readStringList(obj, "reference_tokens", &rule->reference_tokens, error) ||
        !readEnum(obj, "combine", COMBINE_NAMES, COMBINE_VALUES, &rule->require_all, error) ||
        !readEnum(obj, "strictness", STRICTNESS_NAMES, STRICTNESS_VALUES, &rule->strictness, error)) {
        return false;
    }

    // "pattern": "<re>" is shorthand for a single entry
    std::optional<PatternSpec> single;
    if (!readPattern(obj, "pattern", &single, error)) return false;
    if (single) {
        rule->patterns.push_back({*single, {}, {}});
    }

    if (obj.HasMember("patterns")) {
        const Value& arr = obj["patterns"];
        if (!arr.IsArray()) return typeError("patterns", "array", error);
        for (const auto& item : arr.GetArray()) {
            PatternEntrySpec entry;
            if (item.IsString()) {
                entry.pattern = PatternSpec::parse(std::string_view(item.GetString(), item.GetStringLength()));
            } else if (item.IsObject()) {
                std::optional<PatternSpec> p;
                if (!readPattern(item, "pattern", &p, error) ||
                    !readString(item, "excerpt", &entry.excerpt, error) ||
                    !readPatternList(item, "exempt_paths", &entry.exempt_paths, error)) {
                    return false;
                }
                if (!p) return typeError("pattern", "pattern string in every pattern entry", error);
                entry.pattern = *p;
            } else {
                return typeError("patterns", "array of strings or objects", error);
            }
            rule->patterns.push_back(std::move(entry));
        }
    }

    bool wrapper = false;
    if (!readBool(obj, "wrapper", &wrapper, error)) return false;
    if (wrapper && !rule->wrapper_import && !rule->primary.empty()) {
        rule->wrapper_import = wrapperImportFor(rule->primary);
    }

    if (obj.HasMember("clauses")) {
        const Value& arr = obj["clauses"];
        if (!arr.IsArray()) return typeError("clauses", "array of objects", error);
        static const char* const HIT_NAMES[] = {"present", "absent"};
        static const bool HIT_VALUES[] = {true, false};
        for (const auto& item : arr.GetArray()) {
            if (!item.IsObject()) return typeError("clauses", "array of objects", error);
            ClauseSpec clause;
            std::optional<PatternSpec> p;
            if (!readStringList(item, "files", &clause.files, error) ||
                !readPattern(item, "pattern", &p, error) ||
                !readEnum(item, "hit_when", HIT_NAMES, HIT_VALUES, &clause.hit_when_present, error) ||
                !readString(item, "description", &clause.description, error)) {
                return false;
            }
            if (!p) return typeError("pattern", "pattern string in every clause", error);
            clause.pattern = *p;
            rule->clauses.push_back(std::move(clause));
        }
    }

    if (rule->id.empty()) {
        if (error) *error = "config key 'rules': every rule needs an 'id'";
        return false;
    }
    return true;
}

auto applyDocument(const Value& doc, AuditConfig* config, std::string* error) noexcept -> bool {
    if (!doc.IsObject()) return typeError("<root>", "object", error);

    static const char* const BASIS_NAMES[] = {"searched", "original"};
    static const LineBasis BASIS_VALUES[] = {LineBasis::SEARCHED, LineBasis::ORIGINAL};

    if (!readString(doc, "project_root", &config->project_root, error) ||
        !readStringList(doc, "source_roots", &config->source_roots, error) ||
        !readString(doc, "alias_root", &config->alias_root, error) ||
        !readStringList(doc, "extensions", &config->extensions, error) ||
        !readStringList(doc, "excluded_dirs", &config->excluded_dirs, error) ||
        !readPatternList(doc, "exclude_paths", &config->exclude_paths, error) ||
        !readString(doc, "suppression_marker", &config->suppression_marker, error) ||
        !readEnum(doc, "line_basis", BASIS_NAMES, BASIS_VALUES, &config->line_basis, error) ||
        !readUint(doc, "workers", &config->workers, error) ||
        !readBool(doc, "use_default_rules", &config->use_default_rules, error) ||
        !readStringList(doc, "disabled_rules", &config->disabled_rules, error) ||
        !readStringList(doc, "hard_rules", &config->hard_rules, error) ||
        !readString(doc, "log_file", &config->log_file, error) ||
        !readString(doc, "log_level", &config->log_level, error)) {
        return false;
    }

    if (doc.HasMember("canonical") && !parseCanonical(doc["canonical"], &config->canonical, error)) return false;
    if (doc.HasMember("allowlist") && !parseAllowlist(doc["allowlist"], &config->allowlist, error)) return false;
    if (doc.HasMember("copy") && !parseCopy(doc["copy"], &config->copy, error)) return false;

    if (doc.HasMember("rules")) {
        const Value& arr = doc["rules"];
        if (!arr.IsArray()) return typeError("rules", "array of objects", error);
        std::vector<RuleSpec> rules;
        for (const auto& item : arr.GetArray()) {
            RuleSpec rule;
            if (!parseRule(item, &rule, error)) return false;
            rules.push_back(std::move(rule));
        }
        config->rules = std::move(rules);
    }

    Common::Logger::Level level;
    if (!Common::parseLogLevel(config->log_level.c_str(), &level)) {
        return valueError("log_level", config->log_level.c_str(), error);
    }
    return true;
}

} // namespace

auto ConfigLoader::loadString(std::string_view json, AuditConfig* config, std::string* error) noexcept -> bool {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        if (error) {
            char buffer[256];
            std::snprintf(buffer, sizeof(buffer), "malformed config JSON at offset %zu: %s",
                          doc.GetErrorOffset(), rapidjson::GetParseError_En(doc.GetParseError()));
            *error = buffer;
        }
        return false;
    }

    AuditConfig updated = *config;
    if (!applyDocument(doc, &updated, error)) {
        return false;
    }
    *config = std::move(updated);
    return true;
}

auto ConfigLoader::loadFile(const char* path, AuditConfig* config, std::string* error) noexcept -> bool {
    FILE* file = std::fopen(path, "rb");
    if (!file) {
        if (error) {
            *error = std::string("cannot open config file ") + path + ": " + std::strerror(errno);
        }
        return false;
    }

    std::string content;
    char buffer[4096];
    size_t n;
    while ((n = std::fread(buffer, 1, sizeof(buffer), file)) > 0) {
        content.append(buffer, n);
    }
    const bool read_failed = std::ferror(file) != 0;
    std::fclose(file);

    if (read_failed) {
        if (error) *error = std::string("failed reading config file ") + path;
        return false;
    }

    if (!loadString(content, config, error)) {
        if (error) *error = std::string(path) + ": " + *error;
        LOG_ERROR("Config load failed: %s", error ? error->c_str() : path);
        return false;
    }

    LOG_INFO("Loaded config: %s", path);
    return true;
}

} // namespace UiAudit
