/**
 * @file json_utils.h
 * @brief Minimal JSON helpers for the known API response shapes
 *
 * Not a general JSON parser: enough to pull string values and flat
 * string-to-string objects out of responses with a fixed structure.
 */

#ifndef LATCH_LDATA_REMOTE_JSON_UTILS_H
#define LATCH_LDATA_REMOTE_JSON_UTILS_H

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace latch::ldata::json_utils {

/**
 * @brief Quote and escape @p value as a JSON string literal
 */
auto quote(std::string_view value) -> std::string;

/**
 * @brief Extract the value of the first member named @p key
 * @return Unescaped string for string values, raw text for scalars,
 *         nullopt if the key is missing or the value is an object/array
 */
auto extract_json_value(const std::string& json,
                        const std::string& key) -> std::optional<std::string>;

/**
 * @brief Extract the raw text of the object value of member @p key
 * @return Text from '{' to the matching '}', or nullopt
 */
auto extract_json_object(const std::string& json,
                         const std::string& key) -> std::optional<std::string>;

/**
 * @brief Parse a flat object whose values are all strings
 * @return Members in document order, or nullopt on malformed input
 */
auto parse_string_map(const std::string& object)
    -> std::optional<std::vector<std::pair<std::string, std::string>>>;

}  // namespace latch::ldata::json_utils

#endif  // LATCH_LDATA_REMOTE_JSON_UTILS_H
