#pragma once

#include "civcad/core/types.h"
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

namespace civcad {

// =============================================================================
// UTF-8
// =============================================================================

// Counts code points; continuation bytes are not counted, so malformed input
// degrades to a byte count rather than failing.
inline std::size_t utf8Length(std::string_view content) {
    std::size_t count = 0;
    for (const char ch : content) {
        const unsigned char c = static_cast<unsigned char>(ch);
        if ((c & 0xC0) != 0x80) ++count;
    }
    return count;
}

// =============================================================================
// Trimming / case
// =============================================================================

inline std::string_view trimView(std::string_view s) {
    std::size_t begin = 0;
    std::size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

inline std::string toUpperAscii(std::string_view s) {
    std::string out(s);
    for (char& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return out;
}

inline std::string toLowerAscii(std::string_view s) {
    std::string out(s);
    for (char& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

// =============================================================================
// Numbers
// =============================================================================

inline std::optional<double> parseDouble(std::string_view text) {
    const std::string buffer(trimView(text));
    if (buffer.empty()) return std::nullopt;
    char* end = nullptr;
    const double value = std::strtod(buffer.c_str(), &end);
    if (end == buffer.c_str()) return std::nullopt;
    return value;
}

inline std::optional<long> parseInteger(std::string_view text) {
    const std::string buffer(trimView(text));
    if (buffer.empty()) return std::nullopt;
    char* end = nullptr;
    const long value = std::strtol(buffer.c_str(), &end, 10);
    if (end == buffer.c_str()) return std::nullopt;
    return value;
}

// =============================================================================
// Hex colors ("#RRGGBB")
// =============================================================================

inline std::optional<Rgb> parseHexColor(std::string_view text) {
    std::string_view s = trimView(text);
    if (!s.empty() && s.front() == '#') s.remove_prefix(1);
    if (s.size() != 6) return std::nullopt;
    Rgb value = 0;
    for (const char ch : s) {
        const unsigned char c = static_cast<unsigned char>(ch);
        value <<= 4;
        if (c >= '0' && c <= '9') value |= static_cast<Rgb>(c - '0');
        else if (c >= 'a' && c <= 'f') value |= static_cast<Rgb>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') value |= static_cast<Rgb>(c - 'A' + 10);
        else return std::nullopt;
    }
    return value;
}

inline std::string formatHexColor(Rgb color) {
    static constexpr char kDigits[] = "0123456789ABCDEF";
    std::string out = "#000000";
    for (int i = 0; i < 6; ++i) {
        out[static_cast<std::size_t>(6 - i)] = kDigits[(color >> (4 * i)) & 0xF];
    }
    return out;
}

} // namespace civcad
