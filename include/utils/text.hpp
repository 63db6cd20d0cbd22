#pragma once

#include <string_view>
#include <vector>

namespace Slowosiec {

inline constexpr std::string_view WHITESPACE = " \t\r\n";

inline bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/**
 * @brief Split on runs of whitespace. Empty tokens are never produced.
 *
 * The returned views point into @p s.
 */
inline std::vector<std::string_view> split_whitespace(std::string_view s) {
    std::vector<std::string_view> tokens;
    size_t pos = 0;
    while (true) {
        size_t start = s.find_first_not_of(WHITESPACE, pos);
        if (start == std::string_view::npos) break;
        size_t end = s.find_first_of(WHITESPACE, start);
        if (end == std::string_view::npos) {
            tokens.push_back(s.substr(start));
            break;
        }
        tokens.push_back(s.substr(start, end - start));
        pos = end;
    }
    return tokens;
}

} // namespace Slowosiec
