#pragma once

#include <cstddef>
#include <memory>
#include <regex>
#include <string>
#include <string_view>

#include "common/logging.h"

namespace UiAudit {

/// Uncompiled pattern as written in configuration
struct PatternSpec {
    std::string source;
    bool icase = false;

    PatternSpec() = default;
    PatternSpec(std::string src, bool ci = false) : source(std::move(src)), icase(ci) {}

    /// Accepts a leading "(?i)" as the case-insensitive flag
    [[nodiscard]] static PatternSpec parse(std::string_view text);
};

/// Compiled ECMAScript regular expression shared between rule copies.
///
/// Compilation is the only place a std::regex_error can surface at
/// configuration time; it is converted to a false return with a diagnostic.
class Pattern {
public:
    Pattern() = default;

    [[nodiscard]] static bool compile(const PatternSpec& spec, Pattern* out, std::string* error) noexcept;

    [[nodiscard]] bool valid() const noexcept { return regex_ != nullptr; }
    [[nodiscard]] const std::string& source() const noexcept { return spec_.source; }
    [[nodiscard]] bool icase() const noexcept { return spec_.icase; }

    /// True when the pattern matches anywhere in text
    [[nodiscard]] bool search(std::string_view text) const noexcept;

    /// Calls fn(offset, matched_text) for every non-overlapping match, in order
    template<typename F>
    void forEachMatch(std::string_view text, F&& fn) const noexcept {
        if (!regex_) return;
        try {
            auto begin = std::cregex_iterator(text.data(), text.data() + text.size(), *regex_);
            auto end = std::cregex_iterator();
            for (auto it = begin; it != end; ++it) {
                const auto& m = *it;
                fn(static_cast<size_t>(m.position(0)),
                   std::string_view(text.data() + m.position(0), static_cast<size_t>(m.length(0))));
            }
        } catch (const std::regex_error& e) {
            LOG_WARN("Pattern '%s' aborted on %zu bytes: %s", spec_.source.c_str(), text.size(), e.what());
        }
    }

private:
    PatternSpec spec_;
    std::shared_ptr<const std::regex> regex_;
};

/// Escape every ECMAScript metacharacter so text matches literally
[[nodiscard]] std::string escapeRegex(std::string_view text);

} // namespace UiAudit
