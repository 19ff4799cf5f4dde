#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace marginalia::text {

[[nodiscard]] inline bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

[[nodiscard]] inline std::string_view trim(std::string_view s) {
    size_t begin = 0;
    while (begin < s.size() && is_space(s[begin])) ++begin;
    size_t end = s.size();
    while (end > begin && is_space(s[end - 1])) --end;
    return s.substr(begin, end - begin);
}

[[nodiscard]] inline bool is_blank(std::string_view s) {
    return trim(s).empty();
}

[[nodiscard]] inline std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

/**
 * Case-insensitive substring test (ASCII folding). An empty needle matches.
 */
[[nodiscard]] inline bool contains_ignore_case(std::string_view haystack, std::string_view needle) {
    if (needle.empty()) return true;
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

/**
 * Truncate to at most `max_length` characters, ending in "..." when cut.
 */
[[nodiscard]] inline std::string excerpt(std::string_view s, size_t max_length = 100) {
    if (s.size() <= max_length) return std::string(s);
    if (max_length <= 3) return std::string(s.substr(0, max_length));
    return std::string(s.substr(0, max_length - 3)) + "...";
}

/**
 * Create a snippet around the first case-insensitive match of `query`.
 *
 * @param context_chars Number of characters before/after match to include
 * @return Snippet with ellipsis if truncated
 */
[[nodiscard]] inline std::string create_snippet(
    std::string_view s,
    std::string_view query,
    size_t context_chars = 30
) {
    const auto head = [&]() {
        if (s.size() <= context_chars * 2) return std::string(s);
        return std::string(s.substr(0, context_chars * 2)) + "...";
    };

    if (query.empty() || s.empty()) return head();

    const size_t match_pos = to_lower(s).find(to_lower(query));
    if (match_pos == std::string::npos) return head();

    size_t start = (match_pos > context_chars) ? match_pos - context_chars : 0;
    size_t end = std::min(s.size(), match_pos + query.size() + context_chars);

    std::string snippet;
    if (start > 0) snippet += "...";
    snippet += s.substr(start, end - start);
    if (end < s.size()) snippet += "...";
    return snippet;
}

} // namespace marginalia::text
