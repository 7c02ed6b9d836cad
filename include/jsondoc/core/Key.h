/** @file */
#pragma once

#include <string>
#include <ostream>
#include <functional>
#include <stdexcept>
#include <vector>

#include <jsondoc/support/string.h>
#include <jsondoc/support/exception.h>
#include <jsondoc/support/types.h>

using namespace std::literals::string_literals;
using namespace std::literals::string_view_literals;

/// jsondoc namespace
namespace jsondoc {

/////////////////////////////////////////////////////////////////////////////
/// A key into a Value container.
/// - A Key is either a string, which addresses an object member, or a signed
///   integer, which addresses an array element.
/// - Negative indices count from the end of an array. They are normalized
///   before a Fragment records them in its Path.
/// - A literal operator `""_key` is provided.
/////////////////////////////////////////////////////////////////////////////
class Key
{
  public:
    enum ReprIX {
        INT,
        STR
    };

    static std::string_view type_name(ReprIX repr_ix) {
        switch (repr_ix) {
            case INT:   return "index";
            case STR:   return "string";
            default:    throw std::logic_error("invalid repr_ix");
        }
    }

  public:
    Key()                     : m_index{0}, m_repr_ix{INT} {}
    Key(const String& s)      : m_str{s}, m_index{0}, m_repr_ix{STR} {}
    Key(String&& s)           : m_str{std::move(s)}, m_index{0}, m_repr_ix{STR} {}
    Key(const StringView& s)  : m_str{s}, m_index{0}, m_repr_ix{STR} {}
    Key(const char* s)        : m_str{s}, m_index{0}, m_repr_ix{STR} { ASSERT(s != nullptr); }
    Key(is_like_Int auto v)   : m_index{(Int)v}, m_repr_ix{INT} {}
    Key(is_like_UInt auto v)  : m_index{(Int)v}, m_repr_ix{INT} {}

    Key(const Key&) = default;
    Key(Key&&) = default;
    Key& operator = (const Key&) = default;
    Key& operator = (Key&&) = default;

    ReprIX type() const          { return m_repr_ix; }
    std::string_view type_name() const { return type_name(m_repr_ix); }

    bool is_index() const        { return m_repr_ix == INT; }
    bool is_str() const          { return m_repr_ix == STR; }

    Int index() const {
        if (m_repr_ix != INT) throw WrongType(type_name(), type_name(INT));
        return m_index;
    }

    const String& str() const {
        if (m_repr_ix != STR) throw WrongType(type_name(), type_name(STR));
        return m_str;
    }

    bool operator == (const Key& other) const {
        if (m_repr_ix != other.m_repr_ix) return false;
        return (m_repr_ix == INT)? m_index == other.m_index: m_str == other.m_str;
    }

    bool operator == (const StringView& other) const { return m_repr_ix == STR && m_str == other; }
    bool operator == (const char* other) const       { return m_repr_ix == STR && m_str == other; }
    bool operator == (is_like_Int auto other) const  { return m_repr_ix == INT && m_index == other; }

    size_t hash() const {
        return (m_repr_ix == INT)? std::hash<Int>{}(m_index): std::hash<String>{}(m_str);
    }

    String to_str() const { return (m_repr_ix == INT)? int_to_str(m_index): m_str; }
    String to_json() const { return (m_repr_ix == INT)? int_to_str(m_index): json_quoted(m_str); }
    void to_step(std::ostream&, bool is_first = false) const;

  private:
    String m_str;
    Int m_index;
    ReprIX m_repr_ix;
};

/// Write one step of a path expression.
/// - Identifier keys are written in dot notation, other string keys and
///   indices in bracket notation.
inline
void Key::to_step(std::ostream& os, bool is_first) const {
    if (m_repr_ix == INT) {
        os << '[' << m_index << ']';
    } else if (is_identifier(m_str)) {
        if (!is_first) os << '.';
        os << m_str;
    } else {
        os << '[' << json_quoted(m_str) << ']';
    }
}

inline
std::ostream& operator << (std::ostream& os, const Key& key) {
    os << key.to_str();
    return os;
}

struct KeyHash
{
    size_t operator () (const Key& key) const { return key.hash(); }
};

using KeyList = std::vector<Key>;

inline
Key operator ""_key (const char* str, size_t size) {
    return StringView{str, size};
}

} // namespace jsondoc
