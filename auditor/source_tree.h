#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace UiAudit {

/// Collapse "//", "./" and "dir/.." segments and strip leading/trailing slashes.
/// ".." that would climb above the root is dropped.
[[nodiscard]] std::string normalizePath(std::string_view path);

/// normalizePath(dir + "/" + rel)
[[nodiscard]] std::string joinPath(std::string_view dir, std::string_view rel);

/// Directory part of a relative path ("src/pages/A.tsx" -> "src/pages"), empty at top level
[[nodiscard]] std::string_view dirName(std::string_view path) noexcept;

/// Read-only view of a project tree addressed by root-relative, forward-slash paths
class SourceTree {
public:
    virtual ~SourceTree() = default;

    /// True when rel_path names a regular file
    [[nodiscard]] virtual bool exists(std::string_view rel_path) const noexcept = 0;

    /// Whole file content; false when missing or unreadable.
    /// Implementations may throw on faults they cannot report as false;
    /// the auditor turns those into INTERNAL_ERROR.
    [[nodiscard]] virtual bool read(std::string_view rel_path, std::string* out) const = 0;

    /// Append every regular file below root. Directories named in
    /// excluded_dirs are not entered. False when root is not a directory.
    virtual bool walk(std::string_view root, const std::vector<std::string>& excluded_dirs,
                      std::vector<std::string>* out) const noexcept = 0;
};

/// Files on disk below a project root
class DiskTree : public SourceTree {
public:
    explicit DiskTree(std::string project_root);

    [[nodiscard]] bool exists(std::string_view rel_path) const noexcept override;
    [[nodiscard]] bool read(std::string_view rel_path, std::string* out) const noexcept override;
    bool walk(std::string_view root, const std::vector<std::string>& excluded_dirs,
              std::vector<std::string>* out) const noexcept override;

    [[nodiscard]] const std::string& projectRoot() const noexcept { return project_root_; }

private:
    std::string absolute(std::string_view rel_path) const;
    void walkRecursive(const std::string& abs_dir, const std::string& rel_dir,
                       const std::vector<std::string>& excluded_dirs,
                       std::vector<std::string>* out) const noexcept;

    std::string project_root_;
};

/// Synthetic tree held in memory, used to audit generated content and by tests
class MemoryTree : public SourceTree {
public:
    MemoryTree() = default;

    void add(std::string_view rel_path, std::string content);

    /// Listed by walk() but every read() fails
    void markUnreadable(std::string_view rel_path);

    [[nodiscard]] bool exists(std::string_view rel_path) const noexcept override;
    [[nodiscard]] bool read(std::string_view rel_path, std::string* out) const noexcept override;
    bool walk(std::string_view root, const std::vector<std::string>& excluded_dirs,
              std::vector<std::string>* out) const noexcept override;

    [[nodiscard]] size_t size() const noexcept { return files_.size(); }

private:
    std::map<std::string, std::optional<std::string>> files_;
};

} // namespace UiAudit
