#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace codectx::core {

inline std::string_view trimView(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

inline bool contains(std::string_view haystack, std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
}

inline bool startsWith(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

// Views into content split on '\n'; a trailing newline yields a final empty line
inline std::vector<std::string_view> splitLines(std::string_view content) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (true) {
        size_t nl = content.find('\n', start);
        if (nl == std::string_view::npos) {
            lines.push_back(content.substr(start));
            break;
        }
        lines.push_back(content.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

inline int countLines(std::string_view content) {
    return static_cast<int>(std::count(content.begin(), content.end(), '\n')) + 1;
}

// 1-based column of a byte offset
inline int columnAtOffset(std::string_view content, size_t offset) {
    offset = std::min(offset, content.size());
    size_t lineStart = content.rfind('\n', offset == 0 ? 0 : offset - 1);
    if (lineStart == std::string_view::npos || (offset == 0)) {
        return static_cast<int>(offset) + 1;
    }
    return static_cast<int>(offset - lineStart);
}

/**
 * @brief Offset of the '}' closing the '{' at open.
 *
 * Plain counting: braces in strings and comments are not skipped. Returns npos
 * when open is not a '{' or the block never closes.
 */
inline size_t findMatchingBrace(std::string_view s, size_t open) {
    if (open >= s.size() || s[open] != '{') {
        return std::string_view::npos;
    }
    int depth = 0;
    for (size_t i = open; i < s.size(); ++i) {
        if (s[i] == '{') {
            ++depth;
        } else if (s[i] == '}') {
            if (--depth == 0) {
                return i;
            }
        }
    }
    return std::string_view::npos;
}

/**
 * @brief Offset to line lookup over a fixed buffer.
 *
 * Line starts are computed once; lineAt() is a binary search.
 */
class LineIndex {
public:
    explicit LineIndex(std::string_view content) : size_(content.size()) {
        starts_.push_back(0);
        for (size_t i = 0; i < content.size(); ++i) {
            if (content[i] == '\n') {
                starts_.push_back(i + 1);
            }
        }
    }

    // 1-based line containing offset
    int lineAt(size_t offset) const {
        offset = std::min(offset, size_);
        auto it = std::upper_bound(starts_.begin(), starts_.end(), offset);
        return static_cast<int>(it - starts_.begin());
    }

    int lineCount() const { return static_cast<int>(starts_.size()); }

private:
    std::vector<size_t> starts_;
    size_t size_;
};

} // namespace codectx::core
