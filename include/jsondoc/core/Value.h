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

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>
#include <tsl/ordered_map.h>

#include <jsondoc/core/Decimal.h>
#include <jsondoc/core/Key.h>
#include <jsondoc/support/exception.h>
#include <jsondoc/support/integer.h>
#include <jsondoc/support/string.h>
#include <jsondoc/support/types.h>

namespace jsondoc {

struct EmptyReference : public JsonDocException
{
    EmptyReference() : JsonDocException("uninitialized value"s) {}
};

struct WriteProtect : public JsonDocException
{
    WriteProtect() : JsonDocException("Value is write protected"s) {}
};

struct NoSuchElement : public JsonDocException
{
    NoSuchElement(const Key& key) : JsonDocException("No such element: "s + key.to_json()) {}
};

class Value;

using Array = std::vector<Value>;
using Map = tsl::ordered_map<String, Value>;
using Item = std::pair<Key, Value>;
using ItemList = std::vector<Item>;

// heap block shared by every Value handle that refers to it
template <typename T>
struct IRC
{
    IRC(const T& data) : data(data) {}
    IRC(T&& data) : data(std::forward<T>(data)) {}

    T data;
    refcnt_t ref_count = 1;
    bool frozen = false;
};

using IRCString = IRC<String>;
using IRCDecimal = IRC<Decimal>;
using IRCArray = IRC<Array>;
using IRCMap = IRC<Map>;

using IRCStringPtr = IRCString*;
using IRCDecimalPtr = IRCDecimal*;
using IRCArrayPtr = IRCArray*;
using IRCMapPtr = IRCMap*;


//////////////////////////////////////////////////////////////////////////////
/// @brief A node of the document value store.
/// - A Value is a handle. Scalars are held in the handle. Strings, arrays and
///   maps are held in reference counted heap blocks, and every handle copied
///   from another refers to the same block. Use Value::copy to obtain an
///   independent deep copy, and Value::is to test identity.
/// - Maps preserve insertion order.
/// - Numbers read from JSON text with a fraction or exponent, or too large
///   for a 64-bit integer, are DECIMAL and keep their literal.
/// - Every handle carries a default mark. A container slot holding a value
///   that was synthesized from a schema default carries the mark.
///   Value::set stores a value unmarked, Value::set_default stores it marked.
/// - Value::copy keeps the marks of the copied slots, Value::copy_unmarked
///   clears them at every level.
/// - Heap blocks may be frozen, after which any mutation throws WriteProtect.
//////////////////////////////////////////////////////////////////////////////
class Value
{
  public:
    enum ReprIX {
        EMPTY,   // uninitialized handle, or an absent slot
        NIL,     // json null
        BOOL,
        INT,
        UINT,
        FLOAT,
        DECIMAL, // exact number, see Decimal
        STR,
        ARRAY,
        MAP,
        INVALID = 127
    };

    union Repr {
        Repr()                : z{nullptr} {}
        Repr(bool v)          : b{v} {}
        Repr(Int v)           : i{v} {}
        Repr(UInt v)          : u{v} {}
        Repr(Float v)         : f{v} {}
        Repr(IRCStringPtr p)  : ps{p} {}
        Repr(IRCDecimalPtr p) : pd{p} {}
        Repr(IRCArrayPtr p)   : pa{p} {}
        Repr(IRCMapPtr p)     : pm{p} {}

        void*        z;
        bool         b;
        Int          i;
        UInt         u;
        Float        f;
        IRCStringPtr ps;
        IRCDecimalPtr pd;
        IRCArrayPtr  pa;
        IRCMapPtr    pm;
    };

    struct Fields
    {
        Fields(uint8_t repr_ix) : repr_ix{repr_ix}, is_default{0} {}

        uint8_t repr_ix:7;
        uint8_t is_default:1;
    };

  public:
    static std::string_view type_name(uint8_t repr_ix) {
      switch (repr_ix) {
          case EMPTY: return "empty";
          case NIL:   return "null";
          case BOOL:  return "bool";
          case INT:   return "int";
          case UINT:  return "uint";
          case FLOAT: return "float";
          case DECIMAL: return "decimal";
          case STR:   return "string";
          case ARRAY: return "array";
          case MAP:   return "object";
          case INVALID: return "invalid";
          default:    return "<undefined>";
      }
    }

  public:
    Value()                           : m_repr{}, m_fields{EMPTY} {}
    Value(nil_t)                      : m_repr{}, m_fields{NIL} {}
    Value(const String& str)          : m_repr{new IRCString{str}}, m_fields{STR} {}
    Value(String&& str)               : m_repr{new IRCString{std::forward<String>(str)}}, m_fields{STR} {}
    Value(const StringView& sv)       : m_repr{new IRCString{String{sv.data(), sv.size()}}}, m_fields{STR} {}
    Value(const char* v)              : m_repr{}, m_fields{STR} { ASSERT(v != nullptr); m_repr.ps = new IRCString{String{v}}; }
    Value(bool v)                     : m_repr{v}, m_fields{BOOL} {}
    Value(is_like_Float auto v)       : m_repr{(Float)v}, m_fields{FLOAT} {}
    Value(const Decimal& v)           : m_repr{new IRCDecimal{v}}, m_fields{DECIMAL} {}
    Value(is_like_Int auto v)         : m_repr{(Int)v}, m_fields{INT} {}
    Value(is_like_UInt auto v)        : m_repr{}, m_fields{INT} { init_uint((UInt)v); }

    Value(const Array&);
    Value(Array&&);
    Value(const Map&);
    Value(Map&&);

    Value(ReprIX type);

    Value(const Value& other);
    Value(Value&& other);

    ~Value() { dec_ref_count(); }

    Value& operator = (const Value& other);
    Value& operator = (Value&& other);

    ReprIX type() const { return (ReprIX)m_fields.repr_ix; }
    std::string_view type_name() const { return type_name(m_fields.repr_ix); }

    bool is_empty() const     { return m_fields.repr_ix == EMPTY; }
    bool is_nil() const       { return m_fields.repr_ix == NIL; }
    bool is_bool() const      { return m_fields.repr_ix == BOOL; }
    bool is_int() const       { return m_fields.repr_ix == INT; }
    bool is_uint() const      { return m_fields.repr_ix == UINT; }
    bool is_any_int() const   { return m_fields.repr_ix == INT || m_fields.repr_ix == UINT; }
    bool is_float() const     { return m_fields.repr_ix == FLOAT; }
    bool is_decimal() const   { return m_fields.repr_ix == DECIMAL; }
    bool is_num() const       { auto t = m_fields.repr_ix; return t == INT || t == UINT || t == FLOAT || t == DECIMAL; }
    bool is_str() const       { return m_fields.repr_ix == STR; }
    bool is_array() const     { return m_fields.repr_ix == ARRAY; }
    bool is_map() const       { return m_fields.repr_ix == MAP; }
    bool is_container() const { return m_fields.repr_ix == ARRAY || m_fields.repr_ix == MAP; }

    template <typename T> T as() const requires is_byvalue<T>;
    template <typename T> const T& as() const requires std::is_same<T, String>::value;
    template <typename T> const T& as() const requires std::is_same<T, Decimal>::value;
    template <typename T> const T& as() const requires std::is_same<T, Array>::value;
    template <typename T> const T& as() const requires std::is_same<T, Map>::value;

    bool to_bool() const;
    Int to_int() const;
    UInt to_uint() const;
    Float to_float() const;
    String to_str() const;

    String to_json(int indent = 0) const;
    void to_json(std::ostream&, int indent = 0) const;

    Value get(const Key& key) const;
    bool contains(const Key& key) const;
    size_t size() const;
    KeyList keys() const;
    ItemList items() const;

    Value set(const Key& key, const Value& value);
    Value set_default(const Key& key, const Value& value);
    Value append(const Value& value);
    void del(const Key& key);

    bool is_default() const { return m_fields.is_default; }
    bool is_default(const Key& key) const;
    Value& mark_default(bool is_default = true) { m_fields.is_default = is_default; return *this; }
    void clear_default(const Key& key);

    void freeze();
    bool is_frozen() const;

    Value copy() const;
    Value copy_unmarked() const;
    Value without_defaults() const;

    bool is(const Value& other) const;

    bool operator == (const Value&) const;
    bool operator == (nil_t) const { return m_fields.repr_ix == NIL; }

    static WrongType wrong_type(uint8_t actual)                   { return type_name(actual); };
    static WrongType wrong_type(uint8_t actual, uint8_t expected) { return {type_name(actual), type_name(expected)}; };
    static EmptyReference empty_reference()                       { return {}; }

    static bool norm_index(Int& index, UInt size);

  protected:
    void init_uint(UInt v);
    void inc_ref_count() const;
    void dec_ref_count() const;
    void check_writable() const;
    Value* slot(const Key& key) const;
    Value store(const Key& key, const Value& value, bool is_default);
    Value copy(bool keep_marks) const;
    void to_json(std::ostream&, int indent, int depth) const;

  protected:
    Repr m_repr;
    Fields m_fields;
};


inline
Value::Value(const Array& array) : m_repr{new IRCArray{array}}, m_fields{ARRAY} {}

inline
Value::Value(Array&& array) : m_repr{new IRCArray{std::forward<Array>(array)}}, m_fields{ARRAY} {}

inline
Value::Value(const Map& map) : m_repr{new IRCMap{map}}, m_fields{MAP} {}

inline
Value::Value(Map&& map) : m_repr{new IRCMap{std::forward<Map>(map)}}, m_fields{MAP} {}

inline
Value::Value(ReprIX type) : m_repr{}, m_fields{(uint8_t)type} {
    switch (type) {
        case EMPTY: break;
        case NIL:   break;
        case BOOL:  m_repr.b = false; break;
        case INT:   m_repr.i = 0; break;
        case UINT:  m_repr.u = 0; break;
        case FLOAT: m_repr.f = 0; break;
        case DECIMAL: m_repr.pd = new IRCDecimal{Decimal{"0"}}; break;
        case STR:   m_repr.ps = new IRCString{String{}}; break;
        case ARRAY: m_repr.pa = new IRCArray{Array{}}; break;
        case MAP:   m_repr.pm = new IRCMap{Map{}}; break;
        default:    throw wrong_type(type);
    }
}

inline
Value::Value(const Value& other) : m_repr{other.m_repr}, m_fields{other.m_fields.repr_ix} {
    m_fields.is_default = other.m_fields.is_default;
    inc_ref_count();
}

inline
Value::Value(Value&& other) : m_repr{other.m_repr}, m_fields{other.m_fields.repr_ix} {
    m_fields.is_default = other.m_fields.is_default;
    other.m_fields.repr_ix = EMPTY;
    other.m_repr.z = nullptr;
}

inline
Value& Value::operator = (const Value& other) {
    if (this == &other) return *this;
    other.inc_ref_count();
    dec_ref_count();
    m_repr = other.m_repr;
    m_fields.repr_ix = other.m_fields.repr_ix;
    m_fields.is_default = other.m_fields.is_default;
    return *this;
}

inline
Value& Value::operator = (Value&& other) {
    if (this == &other) return *this;
    dec_ref_count();
    m_repr = other.m_repr;
    m_fields.repr_ix = other.m_fields.repr_ix;
    m_fields.is_default = other.m_fields.is_default;
    other.m_fields.repr_ix = EMPTY;
    other.m_repr.z = nullptr;
    return *this;
}

inline
void Value::init_uint(UInt v) {
    if (v > (UInt)std::numeric_limits<Int>::max()) {
        m_fields.repr_ix = UINT;
        m_repr.u = v;
    } else {
        m_repr.i = (Int)v;
    }
}

inline
void Value::inc_ref_count() const {
    switch (m_fields.repr_ix) {
        case STR:   ++(m_repr.ps->ref_count); break;
        case DECIMAL: ++(m_repr.pd->ref_count); break;
        case ARRAY: ++(m_repr.pa->ref_count); break;
        case MAP:   ++(m_repr.pm->ref_count); break;
        default:    break;
    }
}

inline
void Value::dec_ref_count() const {
    switch (m_fields.repr_ix) {
        case STR:   if (--(m_repr.ps->ref_count) == 0) delete m_repr.ps; break;
        case DECIMAL: if (--(m_repr.pd->ref_count) == 0) delete m_repr.pd; break;
        case ARRAY: if (--(m_repr.pa->ref_count) == 0) delete m_repr.pa; break;
        case MAP:   if (--(m_repr.pm->ref_count) == 0) delete m_repr.pm; break;
        default:    break;
    }
}

template <typename T>
T Value::as() const requires is_byvalue<T> {
    if constexpr (std::is_same<T, bool>::value) {
        if (m_fields.repr_ix == BOOL) return m_repr.b;
        throw wrong_type(m_fields.repr_ix, BOOL);
    } else if constexpr (std::is_same<T, Int>::value) {
        if (m_fields.repr_ix == INT) return m_repr.i;
        throw wrong_type(m_fields.repr_ix, INT);
    } else if constexpr (std::is_same<T, UInt>::value) {
        if (m_fields.repr_ix == UINT) return m_repr.u;
        throw wrong_type(m_fields.repr_ix, UINT);
    } else {
        if (m_fields.repr_ix == FLOAT) return (T)m_repr.f;
        throw wrong_type(m_fields.repr_ix, FLOAT);
    }
}

template <typename T>
const T& Value::as() const requires std::is_same<T, String>::value {
    if (m_fields.repr_ix == STR) return m_repr.ps->data;
    throw wrong_type(m_fields.repr_ix, STR);
}

template <typename T>
const T& Value::as() const requires std::is_same<T, Decimal>::value {
    if (m_fields.repr_ix == DECIMAL) return m_repr.pd->data;
    throw wrong_type(m_fields.repr_ix, DECIMAL);
}

template <typename T>
const T& Value::as() const requires std::is_same<T, Array>::value {
    if (m_fields.repr_ix == ARRAY) return m_repr.pa->data;
    throw wrong_type(m_fields.repr_ix, ARRAY);
}

template <typename T>
const T& Value::as() const requires std::is_same<T, Map>::value {
    if (m_fields.repr_ix == MAP) return m_repr.pm->data;
    throw wrong_type(m_fields.repr_ix, MAP);
}

inline
bool Value::to_bool() const {
    switch (m_fields.repr_ix) {
        case EMPTY: throw empty_reference();
        case NIL:   return false;
        case BOOL:  return m_repr.b;
        case INT:   return m_repr.i;
        case UINT:  return m_repr.u;
        case FLOAT: return m_repr.f;
        case DECIMAL: return !m_repr.pd->data.is_zero();
        case STR:   return m_repr.ps->data.size() > 0;
        case ARRAY: return m_repr.pa->data.size() > 0;
        case MAP:   return m_repr.pm->data.size() > 0;
        default:    throw wrong_type(m_fields.repr_ix);
    }
}

inline
Int Value::to_int() const {
    switch (m_fields.repr_ix) {
        case EMPTY: throw empty_reference();
        case BOOL:  return m_repr.b;
        case INT:   return m_repr.i;
        case UINT:  return (Int)m_repr.u;
        case FLOAT: return (Int)m_repr.f;
        case DECIMAL: return (Int)m_repr.pd->data.to_float();
        default:    throw wrong_type(m_fields.repr_ix, INT);
    }
}

inline
UInt Value::to_uint() const {
    switch (m_fields.repr_ix) {
        case EMPTY: throw empty_reference();
        case BOOL:  return m_repr.b;
        case INT:   return (UInt)m_repr.i;
        case UINT:  return m_repr.u;
        case FLOAT: return (UInt)m_repr.f;
        case DECIMAL: return (UInt)m_repr.pd->data.to_float();
        default:    throw wrong_type(m_fields.repr_ix, UINT);
    }
}

inline
Float Value::to_float() const {
    switch (m_fields.repr_ix) {
        case EMPTY: throw empty_reference();
        case BOOL:  return m_repr.b;
        case INT:   return (Float)m_repr.i;
        case UINT:  return (Float)m_repr.u;
        case FLOAT: return m_repr.f;
        case DECIMAL: return m_repr.pd->data.to_float();
        default:    throw wrong_type(m_fields.repr_ix, FLOAT);
    }
}

inline
String Value::to_str() const {
    switch (m_fields.repr_ix) {
        case EMPTY: throw empty_reference();
        case STR:   return m_repr.ps->data;
        default:    return to_json();
    }
}

inline
String Value::to_json(int indent) const {
    StringStream ss;
    to_json(ss, indent);
    return ss.str();
}

inline
void Value::to_json(std::ostream& os, int indent) const {
    to_json(os, indent, 0);
}

inline
void Value::to_json(std::ostream& os, int indent, int depth) const {
    auto newline = [&os, indent] (int level) {
        if (indent > 0) {
            os << '\n';
            for (int i = 0; i < indent * level; ++i) os << ' ';
        }
    };

    switch (m_fields.repr_ix) {
        case EMPTY: throw empty_reference();
        case NIL:   os << "null"; break;
        case BOOL:  os << (m_repr.b? "true": "false"); break;
        case INT:   os << int_to_str(m_repr.i); break;
        case UINT:  os << int_to_str(m_repr.u); break;
        case FLOAT: os << float_to_str(m_repr.f); break;
        case DECIMAL: os << m_repr.pd->data.str(); break;
        case STR:   os << json_quoted(m_repr.ps->data); break;
        case ARRAY: {
            auto& array = m_repr.pa->data;
            os << '[';
            bool first = true;
            for (auto& item : array) {
                if (!first) os << ((indent > 0)? ",": ", ");
                first = false;
                newline(depth + 1);
                item.to_json(os, indent, depth + 1);
            }
            if (!first) newline(depth);
            os << ']';
            break;
        }
        case MAP: {
            auto& map = m_repr.pm->data;
            os << '{';
            bool first = true;
            for (auto& [key, item] : map) {
                if (!first) os << ((indent > 0)? ",": ", ");
                first = false;
                newline(depth + 1);
                os << json_quoted(key) << ": ";
                item.to_json(os, indent, depth + 1);
            }
            if (!first) newline(depth);
            os << '}';
            break;
        }
        default: throw wrong_type(m_fields.repr_ix);
    }
}

inline
bool Value::norm_index(Int& index, UInt size) {
    if (index < 0) index += size;
    if (index < 0 || (UInt)index >= size) return false;
    return true;
}

inline
Value* Value::slot(const Key& key) const {
    switch (m_fields.repr_ix) {
        case EMPTY: throw empty_reference();
        case ARRAY: {
            if (!key.is_index()) throw WrongType(key.type_name(), Key::type_name(Key::INT));
            auto& array = m_repr.pa->data;
            Int index = key.index();
            if (!norm_index(index, array.size())) return nullptr;
            return &array[index];
        }
        case MAP: {
            if (!key.is_str()) throw WrongType(key.type_name(), Key::type_name(Key::STR));
            auto& map = m_repr.pm->data;
            auto it = map.find(key.str());
            if (it == map.end()) return nullptr;
            return &it.value();
        }
        default:
            throw wrong_type(m_fields.repr_ix);
    }
}

inline
Value Value::get(const Key& key) const {
    auto p_value = slot(key);
    return (p_value == nullptr)? Value{}: *p_value;
}

inline
bool Value::contains(const Key& key) const {
    return slot(key) != nullptr;
}

inline
size_t Value::size() const {
    switch (m_fields.repr_ix) {
        case EMPTY: throw empty_reference();
        case STR:   return m_repr.ps->data.size();
        case ARRAY: return m_repr.pa->data.size();
        case MAP:   return m_repr.pm->data.size();
        default:    return 0;
    }
}

inline
KeyList Value::keys() const {
    KeyList keys;
    switch (m_fields.repr_ix) {
        case EMPTY: throw empty_reference();
        case ARRAY: {
            auto size = m_repr.pa->data.size();
            keys.reserve(size);
            for (size_t i = 0; i < size; ++i)
                keys.emplace_back((Int)i);
            break;
        }
        case MAP: {
            keys.reserve(m_repr.pm->data.size());
            for (auto& [key, _] : m_repr.pm->data)
                keys.emplace_back(key);
            break;
        }
        default:
            throw wrong_type(m_fields.repr_ix);
    }
    return keys;
}

inline
ItemList Value::items() const {
    ItemList items;
    switch (m_fields.repr_ix) {
        case EMPTY: throw empty_reference();
        case ARRAY: {
            auto& array = m_repr.pa->data;
            items.reserve(array.size());
            for (size_t i = 0; i < array.size(); ++i)
                items.emplace_back((Int)i, array[i]);
            break;
        }
        case MAP: {
            items.reserve(m_repr.pm->data.size());
            for (auto& [key, value] : m_repr.pm->data)
                items.emplace_back(key, value);
            break;
        }
        default:
            throw wrong_type(m_fields.repr_ix);
    }
    return items;
}

inline
void Value::check_writable() const {
    if (is_frozen()) throw WriteProtect();
}

inline
Value Value::store(const Key& key, const Value& in_val, bool is_default) {
    if (in_val.is_empty()) throw empty_reference();
    check_writable();
    Value out_val = in_val;
    out_val.m_fields.is_default = is_default;
    switch (m_fields.repr_ix) {
        case EMPTY: throw empty_reference();
        case ARRAY: {
            if (!key.is_index()) throw WrongType(key.type_name(), Key::type_name(Key::INT));
            auto& array = m_repr.pa->data;
            Int index = key.index();
            if (index == (Int)array.size()) {
                array.push_back(out_val);
            } else if (norm_index(index, array.size())) {
                array[index] = out_val;
            } else {
                throw NoSuchElement(key);
            }
            return out_val;
        }
        case MAP: {
            if (!key.is_str()) throw WrongType(key.type_name(), Key::type_name(Key::STR));
            m_repr.pm->data.insert_or_assign(key.str(), out_val);
            return out_val;
        }
        default:
            throw wrong_type(m_fields.repr_ix);
    }
}

inline
Value Value::set(const Key& key, const Value& value) {
    return store(key, value, false);
}

inline
Value Value::set_default(const Key& key, const Value& value) {
    return store(key, value, true);
}

inline
Value Value::append(const Value& value) {
    if (m_fields.repr_ix != ARRAY) throw wrong_type(m_fields.repr_ix, ARRAY);
    return store((Int)m_repr.pa->data.size(), value, false);
}

inline
void Value::del(const Key& key) {
    check_writable();
    switch (m_fields.repr_ix) {
        case EMPTY: throw empty_reference();
        case ARRAY: {
            if (!key.is_index()) throw WrongType(key.type_name(), Key::type_name(Key::INT));
            auto& array = m_repr.pa->data;
            Int index = key.index();
            if (norm_index(index, array.size()))
                array.erase(array.begin() + index);
            break;
        }
        case MAP: {
            if (!key.is_str()) throw WrongType(key.type_name(), Key::type_name(Key::STR));
            m_repr.pm->data.erase(key.str());
            break;
        }
        default:
            throw wrong_type(m_fields.repr_ix);
    }
}

inline
bool Value::is_default(const Key& key) const {
    auto p_value = slot(key);
    return p_value != nullptr && p_value->m_fields.is_default;
}

inline
void Value::clear_default(const Key& key) {
    auto p_value = slot(key);
    if (p_value != nullptr && p_value->m_fields.is_default) {
        check_writable();
        p_value->m_fields.is_default = 0;
    }
}

inline
void Value::freeze() {
    switch (m_fields.repr_ix) {
        case STR:   m_repr.ps->frozen = true; break;
        case ARRAY: {
            m_repr.pa->frozen = true;
            for (auto& item : m_repr.pa->data)
                item.freeze();
            break;
        }
        case MAP: {
            m_repr.pm->frozen = true;
            for (auto it = m_repr.pm->data.begin(); it != m_repr.pm->data.end(); ++it)
                it.value().freeze();
            break;
        }
        default: break;
    }
}

inline
bool Value::is_frozen() const {
    switch (m_fields.repr_ix) {
        case STR:   return m_repr.ps->frozen;
        case ARRAY: return m_repr.pa->frozen;
        case MAP:   return m_repr.pm->frozen;
        default:    return false;
    }
}

inline
Value Value::copy() const {
    return copy(true);
}

/// Return a deep copy in which no slot carries a default mark.
inline
Value Value::copy_unmarked() const {
    return copy(false);
}

inline
Value Value::copy(bool keep_marks) const {
    Value result;
    switch (m_fields.repr_ix) {
        case EMPTY: throw empty_reference();
        case STR:   result = Value{m_repr.ps->data}; break;
        case ARRAY: {
            Array array;
            array.reserve(m_repr.pa->data.size());
            for (auto& item : m_repr.pa->data)
                array.push_back(item.copy(keep_marks));
            result = Value{std::move(array)};
            break;
        }
        case MAP: {
            Map map;
            map.reserve(m_repr.pm->data.size());
            for (auto& [key, item] : m_repr.pm->data)
                map.insert({key, item.copy(keep_marks)});
            result = Value{std::move(map)};
            break;
        }
        default:
            result = *this;
            break;
    }
    result.m_fields.is_default = keep_marks? m_fields.is_default: 0;
    return result;
}

inline
Value Value::without_defaults() const {
    switch (m_fields.repr_ix) {
        case EMPTY: throw empty_reference();
        case ARRAY: {
            Array array;
            array.reserve(m_repr.pa->data.size());
            for (auto& item : m_repr.pa->data)
                array.push_back(item.without_defaults());
            return array;
        }
        case MAP: {
            Map map;
            for (auto& [key, item] : m_repr.pm->data) {
                if (!item.is_default())
                    map.insert({key, item.without_defaults()});
            }
            return map;
        }
        default: {
            Value result = copy();
            result.m_fields.is_default = 0;
            return result;
        }
    }
}

inline
bool Value::is(const Value& other) const {
    auto repr_ix = m_fields.repr_ix;
    if (other.m_fields.repr_ix != repr_ix) return false;
    switch (repr_ix) {
        case EMPTY: throw empty_reference();
        case NIL:   return true;
        case BOOL:  return m_repr.b == other.m_repr.b;
        case INT:   return m_repr.i == other.m_repr.i;
        case UINT:  return m_repr.u == other.m_repr.u;
        case FLOAT: return m_repr.f == other.m_repr.f;
        case DECIMAL: return m_repr.pd == other.m_repr.pd;
        case STR:   return m_repr.ps == other.m_repr.ps;
        case ARRAY: return m_repr.pa == other.m_repr.pa;
        case MAP:   return m_repr.pm == other.m_repr.pm;
        default:    throw wrong_type(m_fields.repr_ix);
    }
}

inline
bool Value::operator == (const Value& obj) const {
    if (is_empty() || obj.is_empty()) throw empty_reference();

    switch (m_fields.repr_ix) {
        case NIL:   return obj.m_fields.repr_ix == NIL;
        case BOOL:  return obj.m_fields.repr_ix == BOOL && m_repr.b == obj.m_repr.b;
        case INT: {
            switch (obj.m_fields.repr_ix)
            {
                case INT:   return m_repr.i == obj.m_repr.i;
                case UINT:  return equal(obj.m_repr.u, m_repr.i);
                case FLOAT: return m_repr.i == obj.m_repr.f;
                case DECIMAL: return Decimal{m_repr.i} == obj.m_repr.pd->data;
                default:    return false;
            }
        }
        case UINT: {
            switch (obj.m_fields.repr_ix)
            {
                case INT:   return equal(m_repr.u, obj.m_repr.i);
                case UINT:  return m_repr.u == obj.m_repr.u;
                case FLOAT: return m_repr.u == obj.m_repr.f;
                case DECIMAL: return Decimal{m_repr.u} == obj.m_repr.pd->data;
                default:    return false;
            }
        }
        case FLOAT: {
            switch (obj.m_fields.repr_ix)
            {
                case INT:   return m_repr.f == obj.m_repr.i;
                case UINT:  return m_repr.f == obj.m_repr.u;
                case FLOAT: return m_repr.f == obj.m_repr.f;
                case DECIMAL: return m_repr.f == obj.m_repr.pd->data.to_float();
                default:    return false;
            }
        }
        case DECIMAL: {
            auto& decimal = m_repr.pd->data;
            switch (obj.m_fields.repr_ix)
            {
                case INT:   return decimal == Decimal{obj.m_repr.i};
                case UINT:  return decimal == Decimal{obj.m_repr.u};
                case FLOAT: return decimal.to_float() == obj.m_repr.f;
                case DECIMAL: return decimal == obj.m_repr.pd->data;
                default:    return false;
            }
        }
        case STR: {
            if (obj.m_fields.repr_ix == STR) return m_repr.ps->data == obj.m_repr.ps->data;
            return false;
        }
        case ARRAY: {
            if (obj.m_fields.repr_ix != ARRAY) return false;
            auto& lhs = m_repr.pa->data;
            auto& rhs = obj.m_repr.pa->data;
            if (lhs.size() != rhs.size()) return false;
            for (Array::size_type i=0; i<lhs.size(); i++)
                if (!(lhs[i] == rhs[i]))
                    return false;
            return true;
        }
        case MAP: {
            if (obj.m_fields.repr_ix != MAP) return false;
            auto& lhs = m_repr.pm->data;
            auto& rhs = obj.m_repr.pm->data;
            if (lhs.size() != rhs.size()) return false;
            for (auto& [key, item] : lhs) {
                auto it = rhs.find(key);
                if (it == rhs.end() || !(item == it->second))
                    return false;
            }
            return true;
        }
        default:
            throw wrong_type(m_fields.repr_ix);
    }
}

inline
std::ostream& operator << (std::ostream& os, const Value& value) {
    if (value.is_empty()) os << "<empty>"; else value.to_json(os);
    return os;
}

} // namespace jsondoc
