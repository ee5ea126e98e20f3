#ifndef MIZU_UTIL_STRING_H
#define MIZU_UTIL_STRING_H

#include <string>
#include <string_view>
#include <vector>

namespace mizu::util {

/**
 * @brief Decodes a URL-encoded string (e.g., %20 to space).
 * Handles both '+' and '%xx' encodings; malformed escapes are kept verbatim.
 */
std::string url_decode(std::string_view str);

/**
 * @brief ASCII upper-casing, used for method comparisons.
 */
std::string to_upper(std::string_view str);

/**
 * @brief Joins the items with the separator (e.g., {"GET", "POST"} -> "GET, POST").
 */
std::string join(const std::vector<std::string>& items, std::string_view separator);

} // namespace mizu::util

#endif // MIZU_UTIL_STRING_H
