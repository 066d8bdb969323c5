#include "default_rules.h"

#include <algorithm>

#include "config/audit_config.h"
#include "source_tree.h"

namespace UiAudit {

// ========== Patterns ==========

namespace Patterns {
    constexpr const char* RAW_HEX = R"re(#[0-9a-fA-F]{3,8}\b)re";
    constexpr const char* ARBITRARY_UTILITY =
        R"re((?:className|class)\s*=\s*["`'][^"`']*\[[^\]]+\][^"`']*["`'])re";
    constexpr const char* TAILWIND_PALETTE =
        R"re(\b(bg|text|border|from|to|via|fill|stroke)-(rose|pink|fuchsia|purple|violet|indigo|blue|sky|cyan|teal|emerald|green|lime|yellow|amber|orange|red|stone|neutral|gray|slate|zinc)-\d{2,3}\b)re";
    constexpr const char* OKLCH = R"re(oklch\s*\()re";
    constexpr const char* HSL_OR_HEX = R"re((hsl\s*\(|#[0-9a-fA-F]{3,8}\b))re";
    constexpr const char* PX_FONT_SIZE = R"re(font-size\s*:\s*1[0-9]px)re";

    constexpr const char* CONTAINER_USE = R"re(<PageContainer[\s>]|<Container[\s>])re";
    constexpr const char* LAYOUT_IMPORT = R"re(from\s+["']@?\/?\.?\/.*components\/(layout|templates))re";
    constexpr const char* CONTAINER_MARKER = R"re((<PageContainer|<Container|data-page-container))re";
    constexpr const char* PAGE_LAYOUT_CLASSES = R"re((max-w-|mx-auto|px-\[?\d|bg-\[|bg-#|rounded-(sm|md|lg|xl|2xl)))re";
    constexpr const char* STYLE_FLAG = R"re(\bUSE_NEW_STYLE\b)re";

    constexpr const char* FOCUS_STYLES =
        R"re((focus-visible:|:focus-visible|focus:ring|ring-offset-|focus:outline|outline-offset-))re";

    constexpr const char* CHECKBOX_TAG = R"re(<input[^>]*type\s*=\s*["']checkbox["'][^>]*>)re";
    constexpr const char* CHECKBOX_WITHOUT_NAME =
        R"re(<input[^>]*type\s*=\s*["']checkbox["'](?![^>]*(aria-label|aria-labelledby)=)[^>]*>)re";
    constexpr const char* EMPTY_TABLE_HEADER = R"re(<th[^>]*>\s*<\/th>)re";
    constexpr const char* HEADER_WITHOUT_NAME = R"re(^<th(?![^>]*\baria-(label|labelledby)=))re";

    constexpr const char* ATOM_INPUT = R"re(from\s+["']@\/components\/ui\/input["']|<Input[\s>])re";
    constexpr const char* FORM_ORCHESTRATION = R"re(\buseForm\s*\()re";
}

// ========== Helpers ==========

PatternSpec exactPath(std::string_view path) {
    return PatternSpec("^" + escapeRegex(normalizePath(path)) + "$");
}

PatternSpec underDirectory(std::string_view dir) {
    const std::string norm = normalizePath(dir);
    return PatternSpec(norm.empty() ? std::string("^") : "^" + escapeRegex(norm) + "/");
}

PatternSpec wrapperImportFor(std::string_view primary_path) {
    std::string_view name = primary_path;
    const size_t slash = name.find_last_of('/');
    if (slash != std::string_view::npos) name = name.substr(slash + 1);
    const size_t dot = name.find_last_of('.');
    if (dot != std::string_view::npos && dot > 0) name = name.substr(0, dot);

    return PatternSpec(R"re(from\s+["'](?:[^"']*/)?)re" + escapeRegex(name) + R"re(["'])re");
}

namespace {

RuleSpec patternRule(const char* id, Category category, Scope scope, const char* header, const char* hint) {
    RuleSpec rule;
    rule.id = id;
    rule.kind = RuleKind::PATTERN;
    rule.category = category;
    rule.scope = scope;
    rule.header = header;
    rule.hint = hint;
    return rule;
}

RuleSpec canonicalRule(const char* id, Category category, bool require_all, const char* header, const char* hint) {
    RuleSpec rule;
    rule.id = id;
    rule.kind = RuleKind::CANONICAL_CONTENT;
    rule.category = category;
    rule.require_all = require_all;
    rule.header = header;
    rule.hint = hint;
    return rule;
}

RuleSpec duplicateRule(const char* id, const std::string& primary, const char* header, const char* hint) {
    RuleSpec rule;
    rule.id = id;
    rule.kind = RuleKind::DUPLICATE_IMPLEMENTATION;
    rule.category = Category::COMPONENT_DUPLICATION;
    rule.primary = primary;
    rule.header = header;
    rule.hint = hint;
    return rule;
}

void addEntry(RuleSpec* rule, PatternSpec pattern) {
    PatternEntrySpec entry;
    entry.pattern = std::move(pattern);
    rule->patterns.push_back(std::move(entry));
}

} // namespace

std::vector<RuleSpec> defaultRuleSpecs(const AuditConfig& config) {
    const CanonicalFiles& canon = config.canonical;
    const std::vector<std::string> SCRIPT_AND_STYLE{".tsx", ".ts", ".css"};
    const std::vector<std::string> MARKUP{".tsx"};
    const PatternSpec pages = underDirectory(canon.pages_dir);

    std::vector<RuleSpec> rules;

    // ---------- 1. Token usage ----------
    {
        RuleSpec r = patternRule("no-raw-hex", Category::TOKEN_USAGE, Scope::LINE,
            "Found hardcoded HEX colors outside token files.",
            "Replace with semantic token classes (e.g., bg-destructive) or CSS vars.");
        r.extensions = SCRIPT_AND_STYLE;
        r.exclude_paths = {exactPath(canon.index_css), exactPath(canon.colors_css)};
        addEntry(&r, PatternSpec(Patterns::RAW_HEX));
        rules.push_back(std::move(r));
    }
    {
        RuleSpec r = patternRule("no-arbitrary-utility-values", Category::TOKEN_USAGE, Scope::DOCUMENT,
            "Found non-tokenized Tailwind arbitrary values.",
            "Use semantic utilities (e.g., \"bg-background\", \"text-foreground\", \"bg-destructive\"), "
            "or add a scoped allow: `/* ui-audit: allow */`.");
        r.extensions = SCRIPT_AND_STYLE;
        r.normalize = NormalizeLevel::FULL;
        r.use_allowlist = true;
        r.exclude_paths = {exactPath(canon.index_css), PatternSpec("/styles/new/")};
        addEntry(&r, PatternSpec(Patterns::ARBITRARY_UTILITY));
        rules.push_back(std::move(r));
    }
    {
        RuleSpec r = patternRule("no-raw-palette", Category::TOKEN_USAGE, Scope::LINE,
            "Found raw Tailwind palette classes.",
            "Use semantic utilities (e.g., \"bg-background\", \"text-foreground\", \"bg-destructive\"), "
            "or add a scoped allow: `/* ui-audit: allow */`.");
        r.extensions = SCRIPT_AND_STYLE;
        r.use_allowlist = true;
        r.exclude_paths = {exactPath(canon.index_css), PatternSpec("/styles/new/")};
        addEntry(&r, PatternSpec(Patterns::TAILWIND_PALETTE));
        rules.push_back(std::move(r));
    }
    {
        RuleSpec r = canonicalRule("no-dual-color-systems", Category::TOKEN_USAGE, true,
            "Detected dual color systems (OKLCH in index.css + HSL/HEX in styles/new/colors.css).",
            "Consolidate to a single token system using CSS custom properties with semantic names.");
        r.clauses.push_back({{canon.index_css}, PatternSpec(Patterns::OKLCH, true), true,
                             "index.css contains oklch(…)"});
        r.clauses.push_back({{canon.colors_css}, PatternSpec(Patterns::HSL_OR_HEX), true,
                             "colors.css contains hsl()/HEX"});
        rules.push_back(std::move(r));
    }
    {
        RuleSpec r = canonicalRule("rem-typography", Category::TOKEN_USAGE, true,
            "index.css sets base font-size in px.",
            "Prefer rem-based scale via Tailwind typography utilities.");
        r.clauses.push_back({{canon.index_css}, PatternSpec(Patterns::PX_FONT_SIZE), true,
                             "index.css sets font-size in px"});
        rules.push_back(std::move(r));
    }

    // ---------- 2. Layout ----------
    {
        RuleSpec r;
        r.id = "page-container-required";
        r.kind = RuleKind::FILE_REQUIREMENT;
        r.category = Category::LAYOUT;
        r.header = "Some pages bypass the shared container.";
        r.hint = "Wrap top-level content in <PageContainer> for consistent width/gutters.";
        r.extensions = MARKUP;
        r.include_paths = {pages};
        r.require = PatternSpec(Patterns::CONTAINER_USE);
        r.import_filter = PatternSpec(Patterns::LAYOUT_IMPORT);
        r.wrapper_marker = PatternSpec(Patterns::CONTAINER_MARKER);
        r.excerpt = "Missing <PageContainer> or <Container> wrapper";
        rules.push_back(std::move(r));
    }
    {
        RuleSpec r = patternRule("no-page-layout-classes", Category::LAYOUT, Scope::LINE,
            "Pages contain layout/styling classes that should live in Container/AppShell.",
            "Move width/padding/background/radius to PageContainer/AppShell.");
        r.extensions = MARKUP;
        r.include_paths = {pages};
        addEntry(&r, PatternSpec(Patterns::PAGE_LAYOUT_CLASSES));
        rules.push_back(std::move(r));
    }
    {
        RuleSpec r = patternRule("no-style-feature-flags", Category::LAYOUT, Scope::LINE,
            "Conditional page backgrounds detected (USE_NEW_STYLE).",
            "Remove the flag and standardize background via tokens.");
        r.extensions = MARKUP;
        r.include_paths = {pages};
        addEntry(&r, PatternSpec(Patterns::STYLE_FLAG));
        rules.push_back(std::move(r));
    }
    {
        RuleSpec r = canonicalRule("container-responsive-padding", Category::LAYOUT, false,
            "Container/PageContainer missing responsive padding.",
            "Add `px-4 sm:px-6` (or your standard).");
        const std::vector<std::string> containers{canon.container, canon.page_container};
        r.clauses.push_back({containers, PatternSpec("px-4"), false, "Container/PageContainer lack px-4"});
        r.clauses.push_back({containers, PatternSpec("sm:px-6"), false, "Container/PageContainer lack sm:px-6"});
        rules.push_back(std::move(r));
    }

    // ---------- 3. Component duplication ----------
    {
        RuleSpec r = duplicateRule("no-duplicate-table", canon.table,
            "Duplicate tables found.",
            "Merge into one responsive <Table> API or ensure the secondary file is a thin wrapper importing ./table.");
        r.secondary = canon.simple_table;
        r.wrapper_import = wrapperImportFor(canon.table);
        rules.push_back(std::move(r));
    }
    {
        RuleSpec r = duplicateRule("no-duplicate-dialog", canon.dialog,
            "Duplicate dialogs found.",
            "Standardize on one dialog or make the second a thin wrapper importing ./dialog.");
        r.secondary = canon.standard_dialog;
        r.wrapper_import = wrapperImportFor(canon.dialog);
        rules.push_back(std::move(r));
    }
    {
        RuleSpec r = duplicateRule("no-duplicate-button", canon.button,
            "Alternate Button in use.",
            "Consolidate to a single Button with a variant system.");
        r.secondary = canon.alt_button;
        r.require_referenced = true;
        r.reference_tokens = canon.alt_button_imports;
        rules.push_back(std::move(r));
    }
    {
        RuleSpec r = duplicateRule("single-form-submit-button", canon.form_submit,
            "Duplicate submit buttons found.",
            "Use a single FormSubmitButton.");
        r.extensions = MARKUP;
        r.secondary_name = PatternSpec(canon.duplicate_submit_name);
        rules.push_back(std::move(r));
    }
    {
        RuleSpec r = canonicalRule("button-focus-visible", Category::COMPONENT_DUPLICATION, true,
            "Button lacks visible focus styles.",
            "Add `focus-visible:` or ring/outline utilities.");
        r.clauses.push_back({{canon.button, canon.button_variants}, PatternSpec(Patterns::FOCUS_STYLES), false,
                             "Button lacks visible focus styles"});
        rules.push_back(std::move(r));
    }

    // ---------- 4. Copy & terminology ----------
    if (!config.copy.forbidden_phrases.empty()) {
        RuleSpec r = patternRule("no-create-new-copy", Category::COPY_TERMINOLOGY, Scope::DOCUMENT,
            "Inconsistent creation labels detected (e.g., \"Create New\", \"New Product\").",
            "Standardize to \"Add <Entity>\". If intentional, add `/* ui-audit: allow */` on that line.");
        r.extensions = MARKUP;
        r.normalize = NormalizeLevel::COMMENTS;
        r.include_paths = config.copy.include_dirs;
        r.exclude_paths = config.copy.exclude_dirs;
        for (const auto& phrase : config.copy.forbidden_phrases) {
            addEntry(&r, phrase);
        }
        rules.push_back(std::move(r));
    }
    {
        RuleSpec r = patternRule("preferred-terminology", Category::COPY_TERMINOLOGY, Scope::DOCUMENT,
            "Mixed terminology detected in UI-facing files.",
            "Align on the preferred term across UI, or add `/* ui-audit: allow */` if domain-specific.");
        r.extensions = MARKUP;
        r.normalize = NormalizeLevel::FULL;
        r.include_paths = config.copy.include_dirs;
        r.exclude_paths = config.copy.exclude_dirs;
        for (const auto& term : config.copy.preferred_terms) {
            for (const auto& forbidden : term.forbidden) {
                PatternEntrySpec entry;
                entry.pattern = PatternSpec("\\b" + escapeRegex(forbidden) + "\\b", true);
                entry.excerpt = "Use \"" + term.preferred + "\" instead of \"" + forbidden + "\"";
                for (const auto& ex : config.copy.term_exceptions) {
                    if (std::find(ex.terms.begin(), ex.terms.end(), forbidden) != ex.terms.end()) {
                        entry.exempt_paths.push_back(ex.path);
                    }
                }
                r.patterns.push_back(std::move(entry));
            }
        }
        if (!r.patterns.empty()) {
            rules.push_back(std::move(r));
        }
    }

    // ---------- 5. Accessibility ----------
    {
        RuleSpec r = patternRule("checkbox-accessible-name", Category::ACCESSIBILITY, Scope::DOCUMENT,
            "Checkbox inputs missing aria-label/aria-labelledby.",
            "Add aria-label=\"Select {entity}\" or aria-labelledby.");
        r.extensions = MARKUP;
        r.tag_filter = PatternSpec(Patterns::CHECKBOX_WITHOUT_NAME, true);
        addEntry(&r, PatternSpec(Patterns::CHECKBOX_TAG, true));
        rules.push_back(std::move(r));
    }
    {
        RuleSpec r = patternRule("no-empty-table-header", Category::ACCESSIBILITY, Scope::DOCUMENT,
            "Empty <th> detected.",
            "Add accessible label (e.g., aria-label=\"Select all organizations\").");
        r.extensions = MARKUP;
        r.tag_filter = PatternSpec(Patterns::HEADER_WITHOUT_NAME, true);
        addEntry(&r, PatternSpec(Patterns::EMPTY_TABLE_HEADER, true));
        rules.push_back(std::move(r));
    }

    // ---------- 6. Architecture layering ----------
    {
        RuleSpec r;
        r.id = "pages-no-atom-imports";
        r.kind = RuleKind::FILE_REQUIREMENT;
        r.category = Category::ARCHITECTURE_LAYERING;
        r.header = "Pages are using atoms directly.";
        r.hint = "Create/use molecule-level wrappers (e.g., <FormField> wrapping <Input>).";
        r.extensions = MARKUP;
        r.include_paths = {pages};
        r.forbid = PatternSpec(Patterns::ATOM_INPUT);
        r.excerpt = "Page imports/uses <Input> directly; prefer FormField molecule.";
        rules.push_back(std::move(r));
    }
    {
        RuleSpec r = patternRule("pages-no-form-orchestration", Category::ARCHITECTURE_LAYERING, Scope::LINE,
            "Form logic found in page components.",
            "Extract to an organism (e.g., ProductManagement) and render from the page.");
        r.extensions = MARKUP;
        r.include_paths = {pages};
        addEntry(&r, PatternSpec(Patterns::FORM_ORCHESTRATION));
        rules.push_back(std::move(r));
    }

    return rules;
}

} // namespace UiAudit
