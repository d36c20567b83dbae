/**
 * @file json_utils.cpp
 * @brief Minimal JSON helpers for the known API response shapes
 */

#include "latch/ldata/remote/json_utils.h"

#include <cstdint>
#include <cstdio>

namespace latch::ldata::json_utils {

namespace {

constexpr const char* whitespace = " \t\n\r";

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

auto parse_hex4(const std::string& s, std::size_t pos) -> std::optional<uint32_t> {
    if (pos + 4 > s.size()) {
        return std::nullopt;
    }
    uint32_t value = 0;
    for (std::size_t i = pos; i < pos + 4; ++i) {
        value <<= 4;
        char c = s[i];
        if (c >= '0' && c <= '9') {
            value |= static_cast<uint32_t>(c - '0');
        } else if (c >= 'a' && c <= 'f') {
            value |= static_cast<uint32_t>(c - 'a' + 10);
        } else if (c >= 'A' && c <= 'F') {
            value |= static_cast<uint32_t>(c - 'A' + 10);
        } else {
            return std::nullopt;
        }
    }
    return value;
}

/**
 * @brief Parse the string literal starting at @p pos (the opening quote)
 *
 * On success @p pos is left one past the closing quote.
 */
auto parse_string(const std::string& json, std::size_t& pos) -> std::optional<std::string> {
    if (pos >= json.size() || json[pos] != '"') {
        return std::nullopt;
    }

    std::string out;
    ++pos;
    while (pos < json.size()) {
        char c = json[pos++];
        if (c == '"') {
            return out;
        }
        if (c != '\\') {
            out += c;
            continue;
        }
        if (pos >= json.size()) {
            return std::nullopt;
        }
        char esc = json[pos++];
        switch (esc) {
            case '"': out += '"'; break;
            case '\\': out += '\\'; break;
            case '/': out += '/'; break;
            case 'b': out += '\b'; break;
            case 'f': out += '\f'; break;
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            case 't': out += '\t'; break;
            case 'u': {
                auto cp = parse_hex4(json, pos);
                if (!cp) return std::nullopt;
                pos += 4;
                // surrogate pair
                if (*cp >= 0xD800 && *cp <= 0xDBFF &&
                    pos + 6 <= json.size() && json[pos] == '\\' && json[pos + 1] == 'u') {
                    auto low = parse_hex4(json, pos + 2);
                    if (low && *low >= 0xDC00 && *low <= 0xDFFF) {
                        *cp = 0x10000 + ((*cp - 0xD800) << 10) + (*low - 0xDC00);
                        pos += 6;
                    }
                }
                append_utf8(out, *cp);
                break;
            }
            default:
                return std::nullopt;
        }
    }
    return std::nullopt;
}

/**
 * @brief Position just after the ':' of member @p key, whitespace skipped
 */
auto find_member_value(const std::string& json, const std::string& key)
    -> std::optional<std::size_t> {
    std::string search = quote(key);
    std::size_t from = 0;
    while (true) {
        auto pos = json.find(search, from);
        if (pos == std::string::npos) {
            return std::nullopt;
        }
        auto colon = json.find_first_not_of(whitespace, pos + search.size());
        if (colon != std::string::npos && json[colon] == ':') {
            auto value = json.find_first_not_of(whitespace, colon + 1);
            if (value == std::string::npos) {
                return std::nullopt;
            }
            return value;
        }
        // the key text appeared as a value, keep looking
        from = pos + search.size();
    }
}

}  // namespace

auto quote(std::string_view value) -> std::string {
    std::string out;
    out.reserve(value.size() + 2);
    out += '"';
    for (char c : value) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    out += '"';
    return out;
}

auto extract_json_value(const std::string& json,
                        const std::string& key) -> std::optional<std::string> {
    auto pos = find_member_value(json, key);
    if (!pos) {
        return std::nullopt;
    }

    if (json[*pos] == '"') {
        auto p = *pos;
        return parse_string(json, p);
    }
    if (json[*pos] == '{' || json[*pos] == '[') {
        return std::nullopt;
    }

    auto end_pos = json.find_first_of(",}]\n", *pos);
    if (end_pos == std::string::npos) {
        end_pos = json.size();
    }
    auto value = json.substr(*pos, end_pos - *pos);
    auto last = value.find_last_not_of(whitespace);
    return last == std::string::npos ? std::string{} : value.substr(0, last + 1);
}

auto extract_json_object(const std::string& json,
                         const std::string& key) -> std::optional<std::string> {
    auto pos = find_member_value(json, key);
    if (!pos || json[*pos] != '{') {
        return std::nullopt;
    }

    int depth = 0;
    auto p = *pos;
    while (p < json.size()) {
        char c = json[p];
        if (c == '"') {
            if (!parse_string(json, p)) {
                return std::nullopt;
            }
            continue;
        }
        if (c == '{') {
            ++depth;
        } else if (c == '}') {
            if (--depth == 0) {
                return json.substr(*pos, p - *pos + 1);
            }
        }
        ++p;
    }
    return std::nullopt;
}

auto parse_string_map(const std::string& object)
    -> std::optional<std::vector<std::pair<std::string, std::string>>> {
    std::vector<std::pair<std::string, std::string>> members;

    auto pos = object.find_first_not_of(whitespace);
    if (pos == std::string::npos || object[pos] != '{') {
        return std::nullopt;
    }
    pos = object.find_first_not_of(whitespace, pos + 1);
    if (pos != std::string::npos && object[pos] == '}') {
        return members;
    }

    while (pos != std::string::npos) {
        auto name = parse_string(object, pos);
        if (!name) return std::nullopt;

        pos = object.find_first_not_of(whitespace, pos);
        if (pos == std::string::npos || object[pos] != ':') return std::nullopt;

        pos = object.find_first_not_of(whitespace, pos + 1);
        if (pos == std::string::npos) return std::nullopt;
        auto value = parse_string(object, pos);
        if (!value) return std::nullopt;

        members.emplace_back(std::move(*name), std::move(*value));

        pos = object.find_first_not_of(whitespace, pos);
        if (pos == std::string::npos) return std::nullopt;
        if (object[pos] == '}') return members;
        if (object[pos] != ',') return std::nullopt;
        pos = object.find_first_not_of(whitespace, pos + 1);
    }
    return std::nullopt;
}

}  // namespace latch::ldata::json_utils
