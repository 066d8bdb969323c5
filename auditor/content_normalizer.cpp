#include "content_normalizer.h"

namespace UiAudit {

namespace {

enum class LexState : uint8_t {
    CODE,
    LINE_COMMENT,
    BLOCK_COMMENT,
    STRING
};

inline bool startsWith(std::string_view s, std::string_view prefix) noexcept {
    return s.substr(0, prefix.size()) == prefix;
}

inline bool contains(std::string_view s, std::string_view needle) noexcept {
    return s.find(needle) != std::string_view::npos;
}

inline std::string_view trimLeft(std::string_view s) noexcept {
    size_t i = 0;
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t' || s[i] == '\r')) ++i;
    return s.substr(i);
}

} // namespace

NormalizedText ContentNormalizer::stripComments(std::string_view raw, CommentSyntax syntax) noexcept {
    NormalizedText out;
    out.text.reserve(raw.size());
    out.line_origins.push_back(1);

    const bool line_comments = (syntax == CommentSyntax::SCRIPT);
    LexState state = LexState::CODE;
    char quote = '\0';
    uint32_t raw_line = 1;

    auto newline = [&](bool emit) {
        ++raw_line;
        if (emit) {
            out.text.push_back('\n');
            out.line_origins.push_back(raw_line);
        }
    };

    const size_t n = raw.size();
    for (size_t i = 0; i < n; ++i) {
        const char c = raw[i];
        const char next = (i + 1 < n) ? raw[i + 1] : '\0';

        switch (state) {
            case LexState::CODE:
                if (c == '/' && next == '*') {
                    state = LexState::BLOCK_COMMENT;
                    ++i;
                } else if (line_comments && c == '/' && next == '/') {
                    state = LexState::LINE_COMMENT;
                    ++i;
                } else if (c == '"' || c == '\'' || c == '`') {
                    state = LexState::STRING;
                    quote = c;
                    out.text.push_back(c);
                } else if (c == '\n') {
                    newline(true);
                } else {
                    out.text.push_back(c);
                }
                break;

            case LexState::LINE_COMMENT:
                if (c == '\n') {
                    state = LexState::CODE;
                    newline(true);
                }
                break;

            case LexState::BLOCK_COMMENT:
                if (c == '*' && next == '/') {
                    state = LexState::CODE;
                    ++i;
                } else if (c == '\n') {
                    newline(false);
                }
                break;

            case LexState::STRING:
                if (c == '\\' && i + 1 < n) {
                    out.text.push_back(c);
                    if (next == '\n') {
                        newline(true);
                    } else {
                        out.text.push_back(next);
                    }
                    ++i;
                } else if (c == quote) {
                    out.text.push_back(c);
                    state = LexState::CODE;
                } else if (c == '\n') {
                    // Unterminated ' or " (JSX text like "Don't") ends at the line break
                    if (quote != '`') {
                        state = LexState::CODE;
                    }
                    newline(true);
                } else {
                    out.text.push_back(c);
                }
                break;
        }
    }

    return out;
}

bool ContentNormalizer::isDeclarationOnly(std::string_view line) noexcept {
    std::string_view t = trimLeft(line);

    if (startsWith(t, "import ") ||
        startsWith(t, "type ") ||
        startsWith(t, "interface ") ||
        startsWith(t, "export type ") ||
        startsWith(t, "export interface ")) {
        return true;
    }

    const bool has_class_name = contains(line, "className");

    // Array declarations (option lists, route tables)
    if (contains(line, "= [") && !has_class_name) {
        return true;
    }

    // Destructuring or object literals without markup
    if (contains(line, "{") && contains(line, "}") && !has_class_name && !contains(line, "<")) {
        return true;
    }

    return false;
}

NormalizedText ContentNormalizer::stripDeclarations(const NormalizedText& input) noexcept {
    NormalizedText out;
    out.text.reserve(input.text.size());

    std::string_view text(input.text);
    size_t line_index = 0;
    size_t start = 0;
    bool first = true;

    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();

        std::string_view line = text.substr(start, end - start);
        if (!isDeclarationOnly(line)) {
            if (!first) {
                out.text.push_back('\n');
            }
            out.text.append(line);
            out.line_origins.push_back(line_index < input.line_origins.size()
                                       ? input.line_origins[line_index] : 0);
            first = false;
        }

        ++line_index;
        start = end + 1;
    }

    if (out.line_origins.empty()) {
        out.line_origins.push_back(input.line_origins.empty() ? 1 : input.line_origins.front());
    }
    return out;
}

NormalizedText ContentNormalizer::normalize(std::string_view raw, NormalizeLevel level,
                                            CommentSyntax syntax) noexcept {
    switch (level) {
        case NormalizeLevel::NONE: {
            NormalizedText out;
            out.text.assign(raw);
            uint32_t line = 1;
            out.line_origins.push_back(line);
            for (char c : raw) {
                if (c == '\n') {
                    out.line_origins.push_back(++line);
                }
            }
            return out;
        }
        case NormalizeLevel::COMMENTS:
            return stripComments(raw, syntax);
        case NormalizeLevel::FULL:
            return stripDeclarations(stripComments(raw, syntax));
    }
    return stripComments(raw, syntax);
}

CommentSyntax ContentNormalizer::syntaxForExtension(std::string_view extension) noexcept {
    return extension == ".css" ? CommentSyntax::STYLESHEET : CommentSyntax::SCRIPT;
}

} // namespace UiAudit
