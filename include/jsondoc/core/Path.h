/** @file */
#pragma once

#include <algorithm>
#include <cctype>
#include <vector>

#include <jsondoc/core/Key.h>
#include <jsondoc/support/parse.h>

namespace jsondoc {

struct InvalidPath : public JsonDocException
{
    InvalidPath() : JsonDocException("Invalid path"s) {}
};

//////////////////////////////////////////////////////////////////////////////
/// @brief A path consisting of a list of keys.
/// - A Path addresses a slot relative to a document root (or a schema root,
///   or any Value).
/// - Path literals can be created using the ""_path literal operator, which
///   accepts dotted identifiers, bracketed indices, and bracketed quoted keys,
///   for example `"a.b[0]['x y']"_path`.
/// - Path::to_str renders a path expression rooted at a name, for example
///   `object.age` or `schema.properties.age.type`.
//////////////////////////////////////////////////////////////////////////////
class Path
{
  public:
    using Iterator = KeyList::iterator;
    using ConstIterator = KeyList::const_iterator;

    Path() {}
    Path(const StringView& spec);
    Path(const char* spec) : Path(StringView{spec}) {}

    Path(const KeyList& keys) : m_keys{keys} {}
    Path(KeyList&& keys)      : m_keys{std::forward<KeyList>(keys)} {}

    void append(const Key& key) { m_keys.push_back(key); }
    void append(Key&& key)      { m_keys.emplace_back(std::forward<Key>(key)); }

    Path child(const Key& key) const {
        Path path{*this};
        path.append(key);
        return path;
    }

    Path parent() const {
        if (m_keys.size() == 0) throw InvalidPath();
        return KeyList{m_keys.begin(), m_keys.end() - 1};
    }

    bool is_root() const { return m_keys.size() == 0; }
    size_t size() const  { return m_keys.size(); }
    const Key& leaf() const { ASSERT(m_keys.size() > 0); return m_keys.back(); }

    bool is_prefix_of(const Path& other) const {
        if (m_keys.size() > other.m_keys.size()) return false;
        return std::equal(m_keys.begin(), m_keys.end(), other.m_keys.begin());
    }

    bool operator == (const Path& other) const { return m_keys == other.m_keys; }

    String to_str(const StringView& root) const {
        StringStream ss;
        ss << root;
        for (auto& key : m_keys)
            key.to_step(ss, root.size() == 0 && &key == &m_keys.front());
        return ss.str();
    }

    String to_str() const {
        if (m_keys.size() == 0) return ".";
        return to_str("");
    }

    size_t hash() const {
        size_t result = 0;
        for (auto& key : *this)
            result ^= key.hash();
        return result;
    }

    const KeyList& keys() const { return m_keys; }

    Iterator begin() { return m_keys.begin(); }
    Iterator end() { return m_keys.end(); }
    ConstIterator begin() const { return m_keys.cbegin(); }
    ConstIterator end() const { return m_keys.cend(); }

  private:
    StringView parse_quoted(const StringView&, StringView::const_iterator&);
    void consume_whitespace(const StringView&, StringView::const_iterator&);
    Key parse_brace_key(const StringView&, StringView::const_iterator&);
    Key parse_dot_key(const StringView&, StringView::const_iterator&);

  private:
    KeyList m_keys;
};


inline
Path::Path(const StringView& spec) {
    if (spec.size() == 0) return;
    auto it = spec.cbegin();
    consume_whitespace(spec, it);
    if (it == spec.cend()) return;
    char c = *it;
    if (c != '.' && c != '[') {
        append(parse_dot_key(spec, it));
    }

    while (it != spec.cend()) {
        char c = *it;
        if (c == '.') {
            if (++it != spec.cend()) {
                append(parse_dot_key(spec, it));
            }
        } else if (c == '[') {
            if (++it != spec.cend()) {
                append(parse_brace_key(spec, it));
            } else {
                throw parse::SyntaxError{spec, it - spec.cbegin(), "Missing closing ']':"};
            }
        } else {
            throw parse::SyntaxError{spec, it - spec.cbegin(), "Expected '.' or '[':"};
        }
    }
}

inline
Key Path::parse_brace_key(const StringView& spec, StringView::const_iterator& it) {
    consume_whitespace(spec, it);
    auto key_start = it;
    char c = (it != spec.cend())? *it: 0;
    if (c == '\'' || c == '"') {
        auto key = parse_quoted(spec, it);
        consume_whitespace(spec, it);
        if (it == spec.cend() || *it != ']') throw parse::SyntaxError{spec, key_start - spec.cbegin(), "Missing closing ']':"};
        ++it;
        return String{key};
    } else {
        for (; it != spec.cend() && *it != ']'; ++it);
        if (it == spec.cend()) throw parse::SyntaxError{spec, key_start - spec.cbegin(), "Missing closing ']':"};
        StringView key{key_start, it};
        ++it;
        bool is_int = key.size() > 0;
        for (size_t i = 0; i < key.size(); ++i) {
            if (!(std::isdigit((unsigned char)key[i]) || (i == 0 && key[i] == '-' && key.size() > 1)))
                is_int = false;
        }
        if (!is_int) throw parse::SyntaxError{spec, key_start - spec.cbegin(), "Expected integer index:"};
        auto index = str_to_int(key);
        if (!index) throw parse::SyntaxError{spec, key_start - spec.cbegin(), "Index out of range:"};
        return *index;
    }
}

inline
Key Path::parse_dot_key(const StringView& spec, StringView::const_iterator& it) {
    auto key_start = it;
    for (; it != spec.cend() && (std::isalnum((unsigned char)*it) || *it == '_'); ++it);
    if (it == key_start) throw parse::SyntaxError{spec, key_start - spec.cbegin(), "Expected key:"};
    return StringView{key_start, it};
}

inline
StringView Path::parse_quoted(const StringView& spec, StringView::const_iterator& it) {
    char quote = *it; ++it;
    auto start_it = it;
    bool escaped = false;
    for (; it != spec.cend(); ++it) {
        if (escaped) {
            escaped = false;
            continue;
        }
        char c = *it;
        if (c == '\\') {
            escaped = true;
        } else if (c == quote) {
            return {start_it, it++};
        }
    }
    throw parse::SyntaxError(spec, spec.size() - 1, "Missing closing quote:");
}

inline
void Path::consume_whitespace(const StringView& spec, StringView::const_iterator& it) {
    for (; it != spec.cend() && std::isspace((unsigned char)*it); ++it);
}

inline
std::ostream& operator << (std::ostream& os, const Path& path) {
    os << path.to_str();
    return os;
}

inline
Path operator ""_path (const char* str, size_t size) {
    return Path{StringView{str, size}};
}

} // namespace jsondoc
