#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include <boost/regex.hpp>

namespace codectx::parser {

/**
 * @brief Pattern compiled with Perl syntax, where '^' also matches after a newline
 */
inline boost::regex compilePattern(const char* pattern) {
    return boost::regex(pattern, boost::regex::perl);
}

inline boost::regex compilePattern(const std::string& pattern) {
    return boost::regex(pattern, boost::regex::perl);
}

/**
 * @brief Call fn for every non-overlapping match in text.
 *
 * fn receives the match; returning false stops the scan. Regex engine errors
 * (complexity limits) propagate as boost::regex_error.
 */
template <typename Fn> void forEachMatch(std::string_view text, const boost::regex& re, Fn&& fn) {
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    boost::cregex_iterator it(begin, end, re);
    boost::cregex_iterator last;
    for (; it != last; ++it) {
        if (!fn(*it)) {
            break;
        }
    }
}

inline size_t countMatches(std::string_view text, const boost::regex& re) {
    size_t count = 0;
    forEachMatch(text, re, [&](const boost::cmatch&) {
        ++count;
        return true;
    });
    return count;
}

inline bool containsMatch(std::string_view text, const boost::regex& re) {
    return boost::regex_search(text.data(), text.data() + text.size(), re);
}

// Text of a capture group, empty when the group did not participate
inline std::string group(const boost::cmatch& m, int index) {
    if (index >= static_cast<int>(m.size()) || !m[index].matched) {
        return {};
    }
    return m[index].str();
}

// Byte offset of a capture group relative to base; the whole match when the group is unmatched
inline size_t groupOffset(const boost::cmatch& m, int index, const char* base) {
    if (index < static_cast<int>(m.size()) && m[index].matched) {
        return static_cast<size_t>(m[index].first - base);
    }
    return static_cast<size_t>(m[0].first - base);
}

} // namespace codectx::parser
