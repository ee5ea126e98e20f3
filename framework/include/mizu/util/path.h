#ifndef MIZU_UTIL_PATH_H
#define MIZU_UTIL_PATH_H

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace mizu::util {

/**
 * @brief Splits a URL path into its non-empty '/'-separated segments.
 *
 * Leading, trailing and repeated separators produce no segments, so "/", ""
 * and "//" all yield an empty list. The views point into @p path.
 */
std::vector<std::string_view> split_path(std::string_view path);

/**
 * @brief Re-joins segments [from, end) with '/'. Returns "" when nothing remains.
 */
std::string join_segments(const std::vector<std::string_view>& segments, size_t from = 0);

/**
 * @brief Removes @p prefix from the front of @p path.
 *
 * The result always starts with '/': "/" when the path does not start with the
 * prefix or nothing is left, and "/users" for "/api/users" stripped of "/api/".
 */
std::string strip_prefix(std::string_view path, std::string_view prefix);

/**
 * @brief Parses "a=1&b=2" into a map. Keys and values are URL-decoded, a key
 * without '=' maps to "", and the last occurrence of a repeated key wins.
 */
std::unordered_map<std::string, std::string> parse_query(std::string_view query);

} // namespace mizu::util

#endif // MIZU_UTIL_PATH_H
