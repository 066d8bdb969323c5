#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "auditor/audit_types.h"
#include "auditor/pattern.h"
#include "auditor/rule.h"

namespace UiAudit {

/// Reference files of the audited project, relative to the project root
struct CanonicalFiles {
    std::string index_css{"src/index.css"};
    std::string colors_css{"src/styles/new/colors.css"};
    std::string pages_dir{"src/pages"};
    std::string container{"src/components/layout/Container.tsx"};
    std::string page_container{"src/components/layout/PageContainer.tsx"};
    std::string button{"src/components/ui/button.tsx"};
    std::string button_variants{"src/components/ui/button.variants.ts"};
    std::string alt_button{"src/components/ui/new/Button.tsx"};
    std::string table{"src/components/ui/table.tsx"};
    std::string simple_table{"src/components/ui/simple-table.tsx"};
    std::string dialog{"src/components/ui/dialog.tsx"};
    std::string standard_dialog{"src/components/ui/StandardDialog.tsx"};
    std::string form_submit{"src/components/forms/FormSubmitButton.tsx"};
    std::string duplicate_submit_name{"ContactFormSubmitButton\\.tsx$"};
    std::vector<std::string> alt_button_imports{"@/components/ui/new/Button", "./components/ui/new/Button"};
};

struct AllowSpec {
    PatternSpec path;
    PatternSpec content;   // ignored for directory exemptions
    std::string reason;
};

struct AllowlistConfig {
    std::vector<AllowSpec> directories;
    std::vector<AllowSpec> classes;
};

struct PreferredTerm {
    std::string preferred;
    std::vector<std::string> forbidden;
};

struct TermException {
    PatternSpec path;
    std::vector<std::string> terms;
};

/// Microcopy scanning: which files are UI-facing and which phrases/terms are banned
struct CopyConfig {
    std::vector<PatternSpec> include_dirs;
    std::vector<PatternSpec> exclude_dirs;
    std::vector<PatternSpec> forbidden_phrases;
    std::vector<PreferredTerm> preferred_terms;
    std::vector<TermException> term_exceptions;
};

/// Complete input of one audit run
struct AuditConfig {
    std::string project_root{"."};
    std::vector<std::string> source_roots{"src"};
    std::string alias_root{"src"};   // target of the "@/" import alias
    std::vector<std::string> extensions{".ts", ".tsx", ".css"};
    std::vector<std::string> excluded_dirs{"__tests__", "tests", "node_modules", ".git", "dist"};
    std::vector<PatternSpec> exclude_paths;

    CanonicalFiles canonical;
    AllowlistConfig allowlist;
    CopyConfig copy;

    std::string suppression_marker{"ui-audit:\\s*allow"};
    LineBasis line_basis = LineBasis::SEARCHED;
    uint32_t workers = 0;            // 0 = one per hardware thread, 1 = sequential

    bool use_default_rules = true;
    std::vector<std::string> disabled_rules;
    std::vector<std::string> hard_rules;
    std::vector<RuleSpec> rules;     // appended to (or replacing) the default set

    std::string log_file{"logs/ui_audit.log"};
    std::string log_level{"info"};

    /// Conventions of the audited project: allowlist tiers, copy rules and terminology
    [[nodiscard]] static AuditConfig defaults();
};

[[nodiscard]] const char* lineBasisName(LineBasis basis) noexcept;

} // namespace UiAudit
