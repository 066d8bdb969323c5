#include "pattern.h"

#include <cstring>

namespace UiAudit {

PatternSpec PatternSpec::parse(std::string_view text) {
    static constexpr std::string_view ICASE_PREFIX = "(?i)";
    if (text.substr(0, ICASE_PREFIX.size()) == ICASE_PREFIX) {
        return PatternSpec(std::string(text.substr(ICASE_PREFIX.size())), true);
    }
    return PatternSpec(std::string(text), false);
}

bool Pattern::compile(const PatternSpec& spec, Pattern* out, std::string* error) noexcept {
    auto flags = std::regex::ECMAScript | std::regex::optimize;
    if (spec.icase) {
        flags |= std::regex::icase;
    }
    try {
        out->regex_ = std::make_shared<const std::regex>(spec.source, flags);
        out->spec_ = spec;
        return true;
    } catch (const std::regex_error& e) {
        if (error) {
            *error = "malformed pattern '" + spec.source + "': " + e.what();
        }
        out->regex_.reset();
        return false;
    }
}

bool Pattern::search(std::string_view text) const noexcept {
    if (!regex_) return false;
    try {
        return std::regex_search(text.data(), text.data() + text.size(), *regex_);
    } catch (const std::regex_error& e) {
        LOG_WARN("Pattern '%s' aborted on %zu bytes: %s", spec_.source.c_str(), text.size(), e.what());
        return false;
    }
}

std::string escapeRegex(std::string_view text) {
    static const char* META = "\\^$.|?*+()[]{}/-";
    std::string out;
    out.reserve(text.size() * 2);
    for (char c : text) {
        if (c != '\0' && std::strchr(META, c) != nullptr) {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

} // namespace UiAudit
