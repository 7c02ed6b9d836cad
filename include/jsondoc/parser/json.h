// Copyright 2024 Robert A. Dunnagan
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#pragma once

#include <jsondoc/core/Value.h>
#include <jsondoc/support/parse.h>
#include <jsondoc/support/exception.h>
#include <jsondoc/support/string.h>

#include <cctype>
#include <cstdlib>
#include <cerrno>
#include <cstring>
#include <optional>

#include <fmt/core.h>

namespace jsondoc {
namespace json {

namespace impl {

template <typename StreamType>
struct Parser
{
  public:
    Parser(const StreamType& stream) : m_it{stream} {}

    Parser(Parser&&) =  default;
    Parser(const Parser&) = delete;
    auto operator = (Parser&&) = delete;
    auto operator = (const Parser&) = delete;

    bool parse_document();
    bool parse_value(char term_char);
    bool parse_number();
    bool parse_string();
    bool parse_escape(std::string& str);
    bool parse_hex4(uint32_t& cp);
    bool parse_map();
    bool parse_array();

    template <typename T>
    bool expect(const char* seq, T value);

    void consume_whitespace();

    void create_error(const std::string& message);

    StreamType m_it;
    Value m_curr;
    std::string m_scratch;
    size_t m_error_offset = 0;
    std::string m_error_message;
};

template <typename StreamType>
bool Parser<StreamType>::parse_document()
{
    if (!parse_value('\0')) {
        if (m_error_message.size() == 0) {
            create_error("No value in json text");
        }
        return false;
    }

    consume_whitespace();
    if (!m_it.done()) {
        create_error("Unexpected text after value");
        return false;
    }
    return true;
}

template <typename StreamType>
bool Parser<StreamType>::parse_value(char term_char)
{
    for (; !m_it.done(); m_it.next()) {
        switch (m_it.peek())
        {
            case ' ':
            case '\t':
            case '\r':
            case '\n':
                continue;

            case '-':
            case '0':
            case '1':
            case '2':
            case '3':
            case '4':
            case '5':
            case '6':
            case '7':
            case '8':
            case '9':
                return parse_number();

            case '\'':
            case '"':
                return parse_string();

            case '[': return parse_array();
            case '{': return parse_map();

            case 't': return expect("true", true);
            case 'f': return expect("false", false);
            case 'n': return expect("null", nil);

            default:
                if (m_it.peek() != term_char)
                    create_error("Unexpected character");
                return false;
        }
    }
    return false;
}

template <typename StreamType>
bool Parser<StreamType>::parse_number() {
    m_scratch.clear();

    bool is_done = false;
    bool is_float = false;
    for (; !m_it.done(); m_it.next()) {
        char c = m_it.peek();
        switch (c) {
            case '+':
            case '-':
            case '0':
            case '1':
            case '2':
            case '3':
            case '4':
            case '5':
            case '6':
            case '7':
            case '8':
            case '9':
                break;
            case '.':
            case 'e':
            case 'E':
                is_float = true;
                break;
            default:
                is_done = true;
                break;
        }
        if (is_done) break;
        m_scratch.push_back(c);
    }

    if (is_float) {
        auto decimal = Decimal::parse(m_scratch);
        if (!decimal) {
            create_error("Numeric syntax error");
            return false;
        }
        m_curr = Value{*decimal};
        return true;
    }

    const char* str = m_scratch.c_str();
    const char* scratch_end = str + m_scratch.size();
    char* end = 0;
    errno = 0;
    m_curr = Value{(Int)strtoll(str, &end, 10)};
    if (errno == ERANGE && m_scratch[0] != '-') {
        errno = 0;
        m_curr = Value{(UInt)strtoull(str, &end, 10)};
    }

    if (errno == ERANGE && end == scratch_end) {
        // wider than 64 bits, keep the literal
        errno = 0;
        m_curr = Value{Decimal{m_scratch}};
        return true;
    } else if (errno) {
        create_error(strerror(errno));
        errno = 0;
        return false;
    } else if (end != scratch_end) {
        create_error("Numeric syntax error");
        return false;
    } else {
        return true;
    }
}

template <typename StreamType>
bool Parser<StreamType>::parse_string() {
    char quote = m_it.peek();
    m_it.next();
    std::string str;
    for(; !m_it.done(); m_it.next()) {
        char c = m_it.peek();
        if (c == '\\') {
            m_it.next();
            if (!parse_escape(str)) return false;
        } else if (c == quote) {
            m_it.next();
            quote = 0;
            break;
        } else {
            str.push_back(c);
        }
    }

    if (quote != 0) {
        create_error("Unterminated string");
        return false;
    }

    m_curr = Value{std::move(str)};
    return true;
}

// Called with the stream positioned on the character following the backslash.
// The stream is left on the last character of the escape sequence.
template <typename StreamType>
bool Parser<StreamType>::parse_escape(std::string& str) {
    if (m_it.done()) {
        create_error("Unterminated string");
        return false;
    }

    char c = m_it.peek();
    switch (c) {
        case 'b': str.push_back('\b'); break;
        case 'f': str.push_back('\f'); break;
        case 'n': str.push_back('\n'); break;
        case 'r': str.push_back('\r'); break;
        case 't': str.push_back('\t'); break;
        case 'u': {
            uint32_t cp = 0;
            if (!parse_hex4(cp)) return false;
            if (cp >= 0xDC00 && cp <= 0xDFFF) {
                create_error("Unpaired surrogate in unicode escape");
                return false;
            }
            if (cp >= 0xD800 && cp <= 0xDBFF) {
                // a high surrogate must be followed by an escaped low surrogate
                m_it.next();
                if (m_it.peek() != '\\') {
                    create_error("Unpaired surrogate in unicode escape");
                    return false;
                }
                m_it.next();
                if (m_it.peek() != 'u') {
                    create_error("Unpaired surrogate in unicode escape");
                    return false;
                }
                uint32_t low = 0;
                if (!parse_hex4(low)) return false;
                if (low < 0xDC00 || low > 0xDFFF) {
                    create_error("Unpaired surrogate in unicode escape");
                    return false;
                }
                cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
            }
            append_utf8(str, cp);
            break;
        }
        default:
            str.push_back(c);
            break;
    }
    return true;
}

// Called with the stream positioned on the 'u' of a unicode escape.
template <typename StreamType>
bool Parser<StreamType>::parse_hex4(uint32_t& cp) {
    cp = 0;
    for (int i = 0; i < 4; ++i) {
        m_it.next();
        unsigned char h = (unsigned char)m_it.peek();
        if (m_it.done() || !std::isxdigit(h)) {
            create_error("Invalid unicode escape");
            return false;
        }
        cp = (cp << 4) | (uint32_t)(std::isdigit(h)? h - '0': (std::tolower(h) - 'a' + 10));
    }
    return true;
}

template <typename StreamType>
bool Parser<StreamType>::parse_array() {
    Array array;
    m_it.next();  // consume [
    consume_whitespace();
    if (m_it.peek() == ']') {
        m_it.next();
        m_curr = Value{std::move(array)};
        return true;
    }
    while (!m_it.done()) {
        if (!parse_value(']')) {
            if (m_error_message.size() == 0)
                create_error("Expected value");
            return false;
        }
        array.push_back(m_curr);
        consume_whitespace();
        char c = m_it.peek();
        if (c == ']') {
            m_it.next();
            m_curr = Value{std::move(array)};
            return true;
        } else if (c == ',') {
            m_it.next();
            continue;
        } else {
            create_error("Expected token ',' or ']'");
            return false;
        }
    }

    create_error("Unterminated array");
    return false;
}

template <typename StreamType>
bool Parser<StreamType>::parse_map() {
    Map map;
    m_it.next();  // consume {
    consume_whitespace();
    if (m_it.peek() == '}') {
        m_it.next();
        m_curr = Value{std::move(map)};
        return true;
    }

    while (!m_it.done()) {
        // key
        consume_whitespace();
        char c = m_it.peek();
        if (c != '"' && c != '\'') {
            create_error("Expected string key");
            return false;
        }
        if (!parse_string())
            return false;

        String key = m_curr.as<String>();

        consume_whitespace();
        c = m_it.peek();
        if (c != ':') {
            create_error("Expected token ':'");
            return false;
        }

        // consume :
        m_it.next();

        // value
        if (!parse_value('}')) {
            if (m_error_message.size() == 0)
                create_error("Expected object value");
            return false;
        }

        map.insert_or_assign(key, m_curr);
        consume_whitespace();

        c = m_it.peek();
        if (c == '}') {
            m_it.next();
            m_curr = Value{std::move(map)};
            return true;
        } else if (c == ',') {
            m_it.next();
            continue;
        } else {
            create_error("Expected token ',' or '}'");
            return false;
        }
    }

    create_error("Unterminated object");
    return false;
}

template <typename StreamType>
template <typename T>
bool Parser<StreamType>::expect(const char* seq, T value) {
    const char* seq_it = seq;
    for (; *seq_it != 0; m_it.next(), seq_it++) {
        if (m_it.done() || *seq_it != m_it.peek()) {
            create_error("Invalid literal");
            return false;
        }
    }
    m_curr = Value{value};
    return true;
}

template <typename StreamType>
void Parser<StreamType>::consume_whitespace()
{
    while (!m_it.done() && std::isspace((unsigned char)m_it.peek())) m_it.next();
}

template <typename StreamType>
void Parser<StreamType>::create_error(const std::string& message)
{
    m_error_message = message;
    m_error_offset = m_it.consumed();
}

} // namespace impl


struct Error
{
    size_t error_offset = 0;
    std::string error_message;

    std::string to_str() const {
        if (error_message.size() > 0)
            return fmt::format("JSON parse error at {}: {}", error_offset, error_message);
        return "";
    }
};


inline
Value parse(const std::string_view& str, std::optional<Error>& error) {
    impl::Parser parser{parse::StringStreamAdapter{str}};
    if (!parser.parse_document()) {
        error = Error{parser.m_error_offset, std::move(parser.m_error_message)};
        return nil;
    }
    return parser.m_curr;
}

/// Parse json text.
/// - Strings may be quoted with either double or single quotes.
/// - Integers that do not fit a signed 64-bit integer are parsed as unsigned.
/// - Numbers with a fraction or exponent, and integers wider than 64 bits,
///   are parsed as Decimal, keeping the literal text.
/// @throws parse::SyntaxError
inline
Value parse(const std::string_view& str) {
    impl::Parser parser{parse::StringStreamAdapter{str}};
    if (!parser.parse_document()) {
        throw parse::SyntaxError(str, parser.m_error_offset, parser.m_error_message);
    }
    return parser.m_curr;
}

} // namespace json

inline
Value operator ""_json (const char* str, size_t size) {
    return json::parse(std::string_view{str, size});
}

} // namespace jsondoc
