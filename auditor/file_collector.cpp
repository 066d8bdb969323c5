#include "file_collector.h"

#include <algorithm>

#include "common/logging.h"
#include "source_file.h"

namespace UiAudit {

namespace {

std::string_view baseName(std::string_view path) noexcept {
    const size_t slash = path.find_last_of('/');
    return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

} // namespace

FileCollector::FileCollector(const SourceTree& tree, Options options)
    : tree_(tree), options_(std::move(options)) {}

bool FileCollector::isTestFile(std::string_view path) noexcept {
    static constexpr std::string_view MARKERS[] = {".test.", ".spec."};
    static constexpr std::string_view SCRIPT_EXTS[] = {"ts", "tsx", "js", "jsx"};

    const std::string_view name = baseName(path);
    for (auto marker : MARKERS) {
        const size_t pos = name.find(marker);
        if (pos == std::string_view::npos) continue;
        const std::string_view tail = name.substr(pos + marker.size());
        for (auto ext : SCRIPT_EXTS) {
            if (tail == ext) return true;
        }
    }
    return false;
}

bool FileCollector::isDeclarationFile(std::string_view path) noexcept {
    const std::string_view name = baseName(path);
    const size_t pos = name.find(".d.");
    // "*.d.<ext>" where the ".d." is the second-to-last dot
    return pos != std::string_view::npos && pos > 0 &&
           name.find('.', pos + 3) == std::string_view::npos;
}

bool FileCollector::accepts(const std::string& path) const noexcept {
    const std::string ext = SourceFile::extensionOf(path);
    if (std::find(options_.extensions.begin(), options_.extensions.end(), ext) == options_.extensions.end()) {
        return false;
    }
    if (isTestFile(path) || isDeclarationFile(path)) {
        return false;
    }
    for (const auto& pattern : options_.exclude_paths) {
        if (pattern.search(path)) {
            return false;
        }
    }
    return true;
}

std::vector<std::string> FileCollector::collect() const noexcept {
    std::vector<std::string> candidates;
    for (const auto& root : options_.roots) {
        if (!tree_.walk(root, options_.excluded_dirs, &candidates)) {
            LOG_INFO("Source root missing, nothing collected from: %s", root.c_str());
        }
    }

    std::vector<std::string> files;
    files.reserve(candidates.size());
    for (auto& path : candidates) {
        if (accepts(path)) {
            files.push_back(std::move(path));
        }
    }

    std::sort(files.begin(), files.end());
    files.erase(std::unique(files.begin(), files.end()), files.end());

    LOG_DEBUG("Collected %zu of %zu candidate files", files.size(), candidates.size());
    return files;
}

} // namespace UiAudit
