#include "source_file.h"

#include <cctype>

namespace UiAudit {

SourceFile::SourceFile(std::string path, std::string content)
    : path_(std::move(path)),
      extension_(extensionOf(path_)),
      raw_(),
      comments_(),
      full_(),
      line_starts_() {
    const CommentSyntax syntax = ContentNormalizer::syntaxForExtension(extension_);

    raw_ = ContentNormalizer::normalize(content, NormalizeLevel::NONE, syntax);
    comments_ = ContentNormalizer::stripComments(raw_.text, syntax);
    full_ = ContentNormalizer::stripDeclarations(comments_);

    line_starts_.push_back(0);
    for (size_t i = 0; i < raw_.text.size(); ++i) {
        if (raw_.text[i] == '\n') {
            line_starts_.push_back(i + 1);
        }
    }
}

std::string_view SourceFile::rawLine(uint32_t line) const noexcept {
    if (line == 0 || line > line_starts_.size()) return {};

    const std::string_view text(raw_.text);
    const size_t begin = line_starts_[line - 1];
    size_t end = (line < line_starts_.size()) ? line_starts_[line] - 1 : text.size();
    if (end > begin && text[end - 1] == '\r') {
        --end;
    }
    return text.substr(begin, end - begin);
}

const NormalizedText& SourceFile::view(NormalizeLevel level) const noexcept {
    switch (level) {
        case NormalizeLevel::NONE:     return raw_;
        case NormalizeLevel::COMMENTS: return comments_;
        case NormalizeLevel::FULL:     return full_;
    }
    return raw_;
}

std::string SourceFile::extensionOf(std::string_view path) {
    const size_t slash = path.find_last_of('/');
    const size_t dot = path.find_last_of('.');
    if (dot == std::string_view::npos || (slash != std::string_view::npos && dot < slash)) {
        return {};
    }
    std::string ext(path.substr(dot));
    for (char& c : ext) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return ext;
}

} // namespace UiAudit
