#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "audit_types.h"
#include "pattern.h"

namespace UiAudit {

enum class AllowTier : uint8_t {
    DIRECTORY = 0,  // broad: a path pattern exempting everything in it
    CLASS = 1       // narrow: a path pattern plus a specific content pattern
};

[[nodiscard]] const char* allowTierName(AllowTier tier) noexcept;

/// Exemption: holds for a match when BOTH patterns match
struct AllowEntry {
    Pattern path;
    Pattern content;
    AllowTier tier = AllowTier::CLASS;
    std::string reason;
};

/// Two-tier exemption table consulted by rules that opt in
class Allowlist {
public:
    /// Everything under files whose path matches path_re is exempt
    [[nodiscard]] bool addDirectoryExemption(const PatternSpec& path_re, std::string reason,
                                             std::string* error) noexcept;

    /// Excerpts matching content_re in files matching path_re are exempt
    [[nodiscard]] bool addClassExemption(const PatternSpec& path_re, const PatternSpec& content_re,
                                         std::string reason, std::string* error) noexcept;

    /// Conjunctive per entry, disjunctive across entries
    [[nodiscard]] bool isExempt(const Match& match) const noexcept;

    /// Matching entry or nullptr
    [[nodiscard]] const AllowEntry* findExemption(const Match& match) const noexcept;

    [[nodiscard]] size_t directoryCount() const noexcept { return directories_.size(); }
    [[nodiscard]] size_t classCount() const noexcept { return classes_.size(); }
    [[nodiscard]] bool empty() const noexcept { return directories_.empty() && classes_.empty(); }

private:
    static bool entryMatches(const AllowEntry& entry, const Match& match) noexcept;

    std::vector<AllowEntry> directories_;
    std::vector<AllowEntry> classes_;
};

} // namespace UiAudit
