#include "source_tree.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include "common/logging.h"

namespace UiAudit {

// ========== Path helpers ==========

std::string normalizePath(std::string_view path) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string_view::npos) end = path.size();
        std::string_view seg = path.substr(start, end - start);
        if (seg.empty() || seg == ".") {
            // skip
        } else if (seg == "..") {
            if (!parts.empty()) parts.pop_back();
        } else {
            parts.push_back(seg);
        }
        start = end + 1;
    }

    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out.push_back('/');
        out.append(parts[i]);
    }
    return out;
}

std::string joinPath(std::string_view dir, std::string_view rel) {
    std::string combined(dir);
    combined.push_back('/');
    combined.append(rel);
    return normalizePath(combined);
}

std::string_view dirName(std::string_view path) noexcept {
    const size_t slash = path.find_last_of('/');
    return slash == std::string_view::npos ? std::string_view() : path.substr(0, slash);
}

static bool isExcludedDir(const char* name, const std::vector<std::string>& excluded_dirs) noexcept {
    for (const auto& ex : excluded_dirs) {
        if (ex == name) return true;
    }
    return false;
}

// ========== DiskTree ==========

DiskTree::DiskTree(std::string project_root)
    : project_root_(project_root.empty() ? std::string(".") : std::move(project_root)) {
    while (project_root_.size() > 1 && project_root_.back() == '/') {
        project_root_.pop_back();
    }
}

std::string DiskTree::absolute(std::string_view rel_path) const {
    std::string rel = normalizePath(rel_path);
    if (rel.empty()) return project_root_;
    return project_root_ + "/" + rel;
}

bool DiskTree::exists(std::string_view rel_path) const noexcept {
    struct stat st;
    return stat(absolute(rel_path).c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

bool DiskTree::read(std::string_view rel_path, std::string* out) const noexcept {
    const std::string path = absolute(rel_path);

    int fd = open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        LOG_WARN("Failed to open file: %s (%s)", path.c_str(), std::strerror(errno));
        return false;
    }

    struct stat sb;
    if (fstat(fd, &sb) < 0 || !S_ISREG(sb.st_mode)) {
        LOG_WARN("Failed to stat file: %s", path.c_str());
        close(fd);
        return false;
    }

    if (sb.st_size == 0) {
        out->clear();
        close(fd);
        return true;
    }

    const size_t size = static_cast<size_t>(sb.st_size);
    const char* content = static_cast<const char*>(
        mmap(nullptr, size, PROT_READ, MAP_PRIVATE, fd, 0)
    );

    if (content == MAP_FAILED) {
        LOG_WARN("Failed to map file: %s (%s)", path.c_str(), std::strerror(errno));
        close(fd);
        return false;
    }

    out->assign(content, size);

    munmap(const_cast<char*>(content), size);
    close(fd);
    return true;
}

bool DiskTree::walk(std::string_view root, const std::vector<std::string>& excluded_dirs,
                    std::vector<std::string>* out) const noexcept {
    const std::string rel_root = normalizePath(root);
    const std::string abs_root = absolute(rel_root);

    struct stat st;
    if (stat(abs_root.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
        LOG_DEBUG("Source root not found: %s", abs_root.c_str());
        return false;
    }

    walkRecursive(abs_root, rel_root, excluded_dirs, out);
    return true;
}

void DiskTree::walkRecursive(const std::string& abs_dir, const std::string& rel_dir,
                             const std::vector<std::string>& excluded_dirs,
                             std::vector<std::string>* out) const noexcept {
    DIR* dir = opendir(abs_dir.c_str());
    if (!dir) {
        LOG_WARN("Skipping unreadable directory: %s (%s)", abs_dir.c_str(), std::strerror(errno));
        return;
    }

    struct dirent* entry;
    while ((entry = readdir(dir)) != nullptr) {
        const char* name = entry->d_name;
        if (std::strcmp(name, ".") == 0 || std::strcmp(name, "..") == 0) continue;

        const std::string abs_path = abs_dir + "/" + name;
        const std::string rel_path = rel_dir.empty() ? std::string(name) : rel_dir + "/" + name;

        struct stat st;
        if (lstat(abs_path.c_str(), &st) != 0) {
            LOG_WARN("Skipping entry that cannot be stat'ed: %s", abs_path.c_str());
            continue;
        }

        // Symlinks are not followed; a link back up the tree would repeat it
        if (S_ISLNK(st.st_mode)) {
            LOG_DEBUG("Skipping symlink: %s", rel_path.c_str());
            continue;
        }

        if (S_ISDIR(st.st_mode)) {
            // Hidden directories (.git, .cache, ...) are never part of the audited sources
            if (name[0] == '.' || isExcludedDir(name, excluded_dirs)) {
                LOG_DEBUG("Skipping directory: %s", rel_path.c_str());
                continue;
            }
            walkRecursive(abs_path, rel_path, excluded_dirs, out);
        } else if (S_ISREG(st.st_mode)) {
            out->push_back(rel_path);
        }
    }

    closedir(dir);
}

// ========== MemoryTree ==========

void MemoryTree::add(std::string_view rel_path, std::string content) {
    files_[normalizePath(rel_path)] = std::move(content);
}

void MemoryTree::markUnreadable(std::string_view rel_path) {
    files_[normalizePath(rel_path)] = std::nullopt;
}

bool MemoryTree::exists(std::string_view rel_path) const noexcept {
    return files_.find(normalizePath(rel_path)) != files_.end();
}

bool MemoryTree::read(std::string_view rel_path, std::string* out) const noexcept {
    auto it = files_.find(normalizePath(rel_path));
    if (it == files_.end()) {
        return false;
    }
    if (!it->second) {
        LOG_WARN("Failed to read file: %s", it->first.c_str());
        return false;
    }
    *out = *it->second;
    return true;
}

bool MemoryTree::walk(std::string_view root, const std::vector<std::string>& excluded_dirs,
                      std::vector<std::string>* out) const noexcept {
    const std::string rel_root = normalizePath(root);
    const std::string prefix = rel_root.empty() ? std::string() : rel_root + "/";

    bool found = false;
    for (auto it = files_.lower_bound(prefix); it != files_.end(); ++it) {
        const std::string& path = it->first;
        if (path.compare(0, prefix.size(), prefix) != 0) break;
        found = true;

        // Every directory between the root and the file must be enterable
        std::string_view rest = std::string_view(path).substr(prefix.size());
        bool excluded = false;
        size_t start = 0;
        size_t slash;
        while ((slash = rest.find('/', start)) != std::string_view::npos) {
            std::string_view dir = rest.substr(start, slash - start);
            if (dir.front() == '.' ||
                std::find(excluded_dirs.begin(), excluded_dirs.end(), dir) != excluded_dirs.end()) {
                excluded = true;
                break;
            }
            start = slash + 1;
        }
        if (!excluded) {
            out->push_back(path);
        }
    }
    return found;
}

} // namespace UiAudit
