#pragma once
/**
 * @file ini_parser.hpp
 * @brief INI file parser utilities for configuration loading.
 *
 * Simple, dependency-free helpers supporting:
 * - Comments (# and ;), also trailing a value
 * - Sections [section_name]
 * - Key-value pairs (key = value)
 * - Boolean and string values, quoted or unquoted
 */

#include <cctype>
#include <string>

namespace waterfalls {
namespace ini_parser {

/**
 * @brief Trim whitespace from both ends of a string.
 */
inline std::string trim(const std::string& str) {
    size_t start = 0;
    size_t end = str.length();

    while (start < end && std::isspace((unsigned char)str[start])) ++start;
    while (end > start && std::isspace((unsigned char)str[end - 1])) --end;

    return str.substr(start, end - start);
}

inline std::string to_lower(std::string s) {
    for (char& c : s) {
        c = (char)std::tolower((unsigned char)c);
    }
    return s;
}

/**
 * @brief Parse boolean value from string.
 *
 * Accepts: true/false, 1/0, on/off, yes/no (case-insensitive).
 *
 * @param value Raw value text
 * @param ok Set to false when the text is not a recognized boolean
 * @return Parsed value, false when unrecognized
 */
inline bool parse_bool(const std::string& value, bool* ok = nullptr) {
    std::string v = to_lower(trim(value));
    if (ok) *ok = true;

    if (v == "true" || v == "1" || v == "on" || v == "yes") return true;
    if (v == "false" || v == "0" || v == "off" || v == "no") return false;

    if (ok) *ok = false;
    return false;
}

/**
 * @brief Remove quotes from string if present.
 */
inline std::string unquote(const std::string& str) {
    std::string s = trim(str);
    if (s.length() >= 2 && s[0] == '"' && s[s.length()-1] == '"') {
        return s.substr(1, s.length() - 2);
    }
    return s;
}

/**
 * @brief Drop an inline `#` or `;` comment from an unquoted value.
 */
inline std::string strip_comment(const std::string& value) {
    std::string v = trim(value);
    if (!v.empty() && v[0] == '"') {
        size_t close = v.find('"', 1);
        if (close != std::string::npos) {
            return v.substr(0, close + 1);
        }
        return v;
    }
    size_t pos = v.find_first_of("#;");
    if (pos != std::string::npos) {
        v = trim(v.substr(0, pos));
    }
    return v;
}

} // namespace ini_parser
} // namespace waterfalls
