/**
 * Wordlist Line Normalizer
 *
 * Turns one raw wordlist line into a canonical prefix token, or nothing
 * when the line is blank or a comment.
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace subforge {

// Same set as the C locale's isspace()
inline bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

/**
 * Normalize a raw line:
 *   1. drop one trailing '\r' (CRLF files)
 *   2. trim whitespace on both ends (space, tab, CR, LF, VT, FF)
 *   3. skip if empty or starting with '#'
 *   4. ASCII lowercase
 *
 * Never fails. A returned prefix is never empty.
 */
inline std::optional<std::string> normalize_line(std::string_view line) {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }

    size_t start = 0;
    while (start < line.size() && is_blank(line[start])) start++;

    size_t end = line.size();
    while (end > start && is_blank(line[end - 1])) end--;

    line = line.substr(start, end - start);

    if (line.empty() || line.front() == '#') {
        return std::nullopt;
    }

    std::string prefix;
    prefix.reserve(line.size());
    for (char c : line) {
        // Non-ASCII bytes pass through untouched
        prefix += (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    }
    return prefix;
}

}  // namespace subforge
