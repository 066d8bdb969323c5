#include "audit_types.h"

namespace UiAudit {

static inline bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

std::string makeExcerpt(std::string_view text) noexcept {
    std::string out;
    out.reserve(text.size() < MAX_EXCERPT_LEN ? text.size() : MAX_EXCERPT_LEN);

    bool pending_space = false;
    for (char c : text) {
        if (is_space(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            if (out.size() >= MAX_EXCERPT_LEN) break;
            out.push_back(' ');
            pending_space = false;
        }
        if (out.size() >= MAX_EXCERPT_LEN) break;
        out.push_back(c);
    }

    // Never end inside a multi-byte UTF-8 sequence
    if (out.size() >= MAX_EXCERPT_LEN) {
        size_t cut = out.size();
        size_t lead = cut;
        while (lead > 0 && (static_cast<unsigned char>(out[lead - 1]) & 0xC0) == 0x80) --lead;
        if (lead > 0) {
            const unsigned char c = static_cast<unsigned char>(out[lead - 1]);
            const size_t need = (c >= 0xF0) ? 4 : (c >= 0xE0) ? 3 : (c >= 0xC0) ? 2 : 1;
            if (cut - (lead - 1) < need) cut = lead - 1;
        }
        out.resize(cut);
        while (!out.empty() && out.back() == ' ') out.pop_back();
    }
    return out;
}

const char* categoryName(Category category) noexcept {
    switch (category) {
        case Category::TOKEN_USAGE:           return "token-usage";
        case Category::LAYOUT:                return "layout";
        case Category::COMPONENT_DUPLICATION: return "component-duplication";
        case Category::COPY_TERMINOLOGY:      return "copy-terminology";
        case Category::ACCESSIBILITY:         return "accessibility";
        case Category::ARCHITECTURE_LAYERING: return "architecture-layering";
    }
    return "unknown";
}

bool parseCategory(std::string_view name, Category* out) noexcept {
    static constexpr Category ALL[] = {
        Category::TOKEN_USAGE, Category::LAYOUT, Category::COMPONENT_DUPLICATION,
        Category::COPY_TERMINOLOGY, Category::ACCESSIBILITY, Category::ARCHITECTURE_LAYERING
    };
    for (Category c : ALL) {
        if (name == categoryName(c)) {
            *out = c;
            return true;
        }
    }
    return false;
}

const char* ruleKindName(RuleKind kind) noexcept {
    switch (kind) {
        case RuleKind::PATTERN:                  return "pattern";
        case RuleKind::FILE_REQUIREMENT:         return "file_requirement";
        case RuleKind::DUPLICATE_IMPLEMENTATION: return "duplicate";
        case RuleKind::CANONICAL_CONTENT:        return "canonical";
    }
    return "unknown";
}

} // namespace UiAudit
