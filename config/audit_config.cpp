#include "audit_config.h"

namespace UiAudit {

namespace {

/// "\b(bg-(red|green)-\d+|text-(red|green)-\d+|...)\b" for the given utilities and hues
std::string semanticColors(const std::vector<const char*>& utilities, const char* hues) {
    std::string out = "\\b(";
    for (size_t i = 0; i < utilities.size(); ++i) {
        if (i > 0) out += "|";
        out += utilities[i];
        out += "-(";
        out += hues;
        out += ")-\\d+";
    }
    out += ")\\b";
    return out;
}

const std::vector<const char*> STATE_UTILITIES{"bg", "text", "border", "hover:bg", "hover:text"};
const std::vector<const char*> HOVER_BG_UTILITIES{"bg", "text", "border", "hover:bg"};
const std::vector<const char*> PLAIN_UTILITIES{"bg", "text", "border"};

} // namespace

AuditConfig AuditConfig::defaults() {
    AuditConfig config;

    // ---------- Directory exemptions (visually complex, high-churn areas) ----------
    auto& dirs = config.allowlist.directories;
    dirs.push_back({PatternSpec("features/dashboard/components", true), {}, "dashboard charts and cards"});
    dirs.push_back({PatternSpec("components/ui/", true), {}, "base UI primitives"});
    dirs.push_back({PatternSpec("features/import-export/", true), {}, "import/export tables and wizards"});
    dirs.push_back({PatternSpec("(Dialog|Wizard|Modal|features/\\w+/components/\\w+Dialog)", true), {},
                    "dialog sizing"});
    dirs.push_back({PatternSpec("(layout/components|Header)", true), {}, "header and navigation sizing"});
    dirs.push_back({PatternSpec("components/forms/", true), {}, "form components"});
    dirs.push_back({PatternSpec("(pages/|styles/|hooks/)", true), {}, "style guides, global styles and hooks"});

    // ---------- Class exemptions (semantic state colors per feature) ----------
    auto& classes = config.allowlist.classes;
    classes.push_back({PatternSpec("features/auth/", true),
                       PatternSpec(semanticColors(STATE_UTILITIES, "red|green|blue|gray|amber|yellow")),
                       "form state colors"});
    classes.push_back({PatternSpec("features/contacts/", true),
                       PatternSpec(semanticColors(STATE_UTILITIES, "blue|green|red|gray|amber|yellow")),
                       "contact badges and states"});
    classes.push_back({PatternSpec("features/organizations/", true),
                       PatternSpec(semanticColors(STATE_UTILITIES, "blue|green|red|gray|amber|yellow|purple")),
                       "priority badges and status indicators"});
    classes.push_back({PatternSpec("configs/forms/", true),
                       PatternSpec(semanticColors(PLAIN_UTILITIES, "amber|red|green|blue|gray|yellow")),
                       "alert colors in form configurations"});
    classes.push_back({PatternSpec("features/\\w+/hooks/", true),
                       PatternSpec(semanticColors(STATE_UTILITIES,
                           "red|green|blue|gray|yellow|orange|purple|indigo|cyan|pink|rose|emerald|violet|slate")),
                       "badge and priority helpers"});
    classes.push_back({PatternSpec("features/interactions/", true),
                       PatternSpec(semanticColors(HOVER_BG_UTILITIES,
                           "blue|green|red|gray|yellow|purple|orange|indigo|cyan|pink")),
                       "timeline and activity states"});
    classes.push_back({PatternSpec("features/opportunities/", true),
                       PatternSpec(semanticColors(HOVER_BG_UTILITIES,
                           "blue|green|red|gray|yellow|purple|orange|indigo|cyan|pink|emerald")),
                       "stage and status colors"});
    classes.push_back({PatternSpec("features/(products|monitoring)/", true),
                       PatternSpec(semanticColors(HOVER_BG_UTILITIES, "blue|green|red|gray|amber|yellow|purple")),
                       "product and monitoring states"});
    classes.push_back({PatternSpec("(Skeleton|skeleton|EmptyState|Loading)", true),
                       PatternSpec("\\b(h-\\[\\d+px\\]|w-\\[\\d+px\\]|max-w-\\[\\d+px\\]|min-w-\\[\\d+px\\])\\b"),
                       "skeleton and loading placeholder sizes"});
    classes.push_back({PatternSpec("error-boundaries"),
                       PatternSpec("text-red-|bg-red-|border-red-|text-gray-|bg-gray-"),
                       "error boundary colors"});

    // ---------- Microcopy ----------
    config.copy.include_dirs = {PatternSpec("pages", true), PatternSpec("components", true),
                                PatternSpec("features", true)};
    config.copy.exclude_dirs = {PatternSpec("types", true), PatternSpec("stores", true),
                                PatternSpec("hooks", true), PatternSpec("__tests__", true)};
    config.copy.forbidden_phrases = {
        PatternSpec("Create\\s+New\\b", true),
        PatternSpec("\\bNew\\s+(Organization|Contact|Product|Opportunity)\\b", true)
    };
    config.copy.preferred_terms = {{"Activity", {"Interaction", "Interactions"}}};
    config.copy.term_exceptions = {{PatternSpec("features/interactions/", true), {"Interaction", "Interactions"}}};

    return config;
}

const char* lineBasisName(LineBasis basis) noexcept {
    return basis == LineBasis::ORIGINAL ? "original" : "searched";
}

} // namespace UiAudit
