#include "allowlist.h"

namespace UiAudit {

const char* allowTierName(AllowTier tier) noexcept {
    return tier == AllowTier::DIRECTORY ? "directory" : "class";
}

bool Allowlist::addDirectoryExemption(const PatternSpec& path_re, std::string reason,
                                      std::string* error) noexcept {
    AllowEntry entry;
    entry.tier = AllowTier::DIRECTORY;
    entry.reason = std::move(reason);
    if (!Pattern::compile(path_re, &entry.path, error) ||
        !Pattern::compile(PatternSpec(".+"), &entry.content, error)) {
        return false;
    }
    directories_.push_back(std::move(entry));
    return true;
}

bool Allowlist::addClassExemption(const PatternSpec& path_re, const PatternSpec& content_re,
                                  std::string reason, std::string* error) noexcept {
    AllowEntry entry;
    entry.tier = AllowTier::CLASS;
    entry.reason = std::move(reason);
    if (!Pattern::compile(path_re, &entry.path, error) ||
        !Pattern::compile(content_re, &entry.content, error)) {
        return false;
    }
    classes_.push_back(std::move(entry));
    return true;
}

bool Allowlist::entryMatches(const AllowEntry& entry, const Match& match) noexcept {
    return entry.path.search(match.file_path) && entry.content.search(match.excerpt);
}

const AllowEntry* Allowlist::findExemption(const Match& match) const noexcept {
    for (const auto& entry : directories_) {
        if (entryMatches(entry, match)) return &entry;
    }
    for (const auto& entry : classes_) {
        if (entryMatches(entry, match)) return &entry;
    }
    return nullptr;
}

bool Allowlist::isExempt(const Match& match) const noexcept {
    return findExemption(match) != nullptr;
}

} // namespace UiAudit
