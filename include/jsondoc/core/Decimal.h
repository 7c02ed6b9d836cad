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

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <optional>
#include <string>

#include <jsondoc/support/parse.h>
#include <jsondoc/support/string.h>
#include <jsondoc/support/types.h>

namespace jsondoc {

//////////////////////////////////////////////////////////////////////////////
/// @brief An exact decimal number, held as the literal it was written with.
/// - The literal is rendered back unchanged, so "1.10" stays "1.10".
/// - Two decimals are equal when they denote the same number, regardless of
///   how they were written: "1.10", "1.1" and "11e-1" are equal.
//////////////////////////////////////////////////////////////////////////////
class Decimal
{
  public:
    static std::optional<Decimal> parse(const StringView& literal);

    explicit Decimal(const StringView& literal);
    explicit Decimal(is_like_Int auto v)  : m_literal{int_to_str((Int)v)} { normalize(); }
    explicit Decimal(is_like_UInt auto v) : m_literal{int_to_str((UInt)v)} { normalize(); }

    const String& str() const { return m_literal; }
    bool is_zero() const      { return m_digits.empty(); }
    bool is_integer_literal() const { return m_literal.find_first_of(".eE") == String::npos; }
    Float to_float() const    { return std::strtod(m_literal.c_str(), nullptr); }

    bool operator == (const Decimal& other) const;

  private:
    Decimal() = default;
    bool normalize();

    String m_literal;
    bool m_negative = false;
    String m_digits;     // significant digits, no leading or trailing zeros
    Int m_exponent = 0;  // value is m_digits * 10 ** m_exponent
};

inline
std::optional<Decimal> Decimal::parse(const StringView& literal) {
    Decimal decimal;
    decimal.m_literal = String{literal.data(), literal.size()};
    if (!decimal.normalize()) return {};
    return decimal;
}

inline
Decimal::Decimal(const StringView& literal) : m_literal{literal.data(), literal.size()} {
    if (!normalize()) throw parse::SyntaxError(literal, 0, "Invalid decimal literal");
}

inline
bool Decimal::normalize() {
    auto& s = m_literal;
    auto is_digit = [&s] (size_t pos) { return pos < s.size() && std::isdigit((unsigned char)s[pos]); };

    size_t pos = 0;
    bool negative = false;
    if (pos < s.size() && (s[pos] == '-' || s[pos] == '+')) {
        negative = s[pos] == '-';
        ++pos;
    }

    String digits;
    Int frac_digits = 0;
    while (is_digit(pos)) digits.push_back(s[pos++]);
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        for (; is_digit(pos); ++frac_digits) digits.push_back(s[pos++]);
    }
    if (digits.empty()) return false;

    Int exponent = 0;
    if (pos < s.size() && (s[pos] == 'e' || s[pos] == 'E')) {
        ++pos;
        bool neg_exponent = false;
        if (pos < s.size() && (s[pos] == '-' || s[pos] == '+')) {
            neg_exponent = s[pos] == '-';
            ++pos;
        }
        auto begin = pos;
        while (is_digit(pos)) ++pos;
        if (pos == begin) return false;
        auto result = std::from_chars(s.data() + begin, s.data() + pos, exponent);
        if (result.ec != std::errc()) return false;
        if (neg_exponent) exponent = -exponent;
    }
    if (pos != s.size()) return false;

    auto first = digits.find_first_not_of('0');
    if (first == String::npos) {
        m_negative = false;
        m_digits.clear();
        m_exponent = 0;
        return true;
    }

    auto last = digits.find_last_not_of('0');
    m_negative = negative;
    m_digits = digits.substr(first, last - first + 1);
    m_exponent = exponent - frac_digits + (Int)(digits.size() - 1 - last);
    return true;
}

inline
bool Decimal::operator == (const Decimal& other) const {
    return m_negative == other.m_negative && m_digits == other.m_digits && m_exponent == other.m_exponent;
}

} // namespace jsondoc
