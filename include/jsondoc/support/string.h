#pragma once

#include <string>
#include <sstream>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <optional>

#include <jsondoc/support/types.h>
#include <jsondoc/support/exception.h>

namespace jsondoc {

inline
std::string int_to_str(int64_t v) {
    char buf[24];
    auto len = std::snprintf(buf, 23, "%lld", (long long)v);
    ASSERT(len > 0);
    return {buf, (size_t)len};
}

inline
std::string int_to_str(uint64_t v) {
    char buf[24];
    auto len = std::snprintf(buf, 23, "%llu", (unsigned long long)v);
    ASSERT(len > 0);
    return {buf, (size_t)len};
}

inline
std::string float_to_str(double v) {
    char buf[26];
    // There are 53-bits in IEEE 754 (64-bit float) standard, and log10(2**53) equals 15.95, so
    // round to 15 digits precision.
    auto len = std::snprintf(buf, 25, "%.15g", v);
    ASSERT(len > 0);
    return {buf, (size_t)len};
}

/// Number of UTF-8 encoded characters, counting lead bytes only.
inline
size_t utf8_length(const StringView& str) {
    size_t count = 0;
    for (unsigned char c : str)
        if ((c & 0xC0) != 0x80) ++count;
    return count;
}

/// Append the UTF-8 encoding of a code point.
inline
void append_utf8(std::string& str, uint32_t cp) {
    if (cp < 0x80) {
        str.push_back((char)cp);
    } else if (cp < 0x800) {
        str.push_back((char)(0xC0 | (cp >> 6)));
        str.push_back((char)(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        str.push_back((char)(0xE0 | (cp >> 12)));
        str.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        str.push_back((char)(0x80 | (cp & 0x3F)));
    } else {
        str.push_back((char)(0xF0 | (cp >> 18)));
        str.push_back((char)(0x80 | ((cp >> 12) & 0x3F)));
        str.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        str.push_back((char)(0x80 | (cp & 0x3F)));
    }
}

/// JSON string literal, with control characters escaped.
inline
std::string json_quoted(const StringView& str) {
    std::string out;
    out.reserve(str.size() + 2);
    out.push_back('"');
    for (char c : str) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if ((unsigned char)c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", (unsigned)c);
                    out += buf;
                } else {
                    out.push_back(c);
                }
        }
    }
    out.push_back('"');
    return out;
}

inline
bool is_identifier(const StringView& str) {
    if (str.size() == 0) return false;
    if (!(std::isalpha((unsigned char)str[0]) || str[0] == '_')) return false;
    for (char c : str)
        if (!(std::isalnum((unsigned char)c) || c == '_'))
            return false;
    return true;
}

/// Parse a base 10 integer, empty when the text is not one or is out of range.
inline
std::optional<Int> str_to_int(const StringView& str) {
    Int value;
    const char* beg = str.data();
    const char* end = beg + str.size();
    auto result = std::from_chars(beg, end, value);
    if (result.ec != std::errc() || result.ptr != end) return {};
    return value;
}

} // namespace jsondoc
