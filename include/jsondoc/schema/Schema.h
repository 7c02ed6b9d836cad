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

#include <optional>
#include <set>
#include <stdexcept>
#include <string>

#include <fmt/core.h>

#include <jsondoc/core/Key.h>
#include <jsondoc/core/Path.h>
#include <jsondoc/core/Value.h>
#include <jsondoc/support/exception.h>

namespace jsondoc {

struct SchemaError : public JsonDocException
{
    SchemaError(std::string&& msg) : JsonDocException(std::forward<std::string>(msg)) {}
};

struct NoDefault : public JsonDocException
{
    NoDefault() : JsonDocException("Schema does not declare a default"s) {}
    NoDefault(const Path& path) : JsonDocException(fmt::format("Schema does not declare a default: {}", path.to_str())) {}
};

//////////////////////////////////////////////////////////////////////////////
/// @brief Read-only view of a schema node.
/// - A schema node is an object Value using the json-schema draft-03
///   vocabulary: `type`, `default`, `optional`, `properties`, `items`,
///   `additionalItems`, `additionalProperties`, `title`, `description`, plus
///   the fragment class key `__fragment_cls`.
/// - A default constructed Schema, or one wrapping an empty object, accepts
///   any value.
/// - Navigation never fails. A key the schema says nothing about yields the
///   empty schema.
/// - Malformed content is reported by throwing SchemaError from the accessor
///   that reads it.
//////////////////////////////////////////////////////////////////////////////
class Schema
{
  public:
    enum class Type {
        ANY,
        NIL,
        BOOLEAN,
        INTEGER,
        NUMBER,
        STRING,
        ARRAY,
        OBJECT
    };

    using TypeSet = std::set<Type>;

    static constexpr const char* fragment_class_key = "__fragment_cls";

    static std::string_view type_name(Type type);
    static Type type_from_name(const StringView& name);

  public:
    Schema() {}
    Schema(const Value& node);

    const Value& node() const { return m_node; }
    bool is_empty() const     { return m_node.is_empty() || m_node.size() == 0; }

    Value keyword(const StringView& name) const;

    Schema child(const Key& key) const;
    Schema property(const String& name) const;
    std::optional<Schema> items() const;
    std::optional<Schema> additional_properties() const;
    std::optional<Schema> additional_items() const;
    bool allows_additional_properties() const;
    bool allows_additional_items() const;

    bool has_default() const { return !keyword("default").is_empty(); }
    Value default_value() const;
    bool is_optional() const;
    TypeSet types() const;
    std::optional<String> fragment_class() const;
    String title() const;
    String description() const;

  private:
    String string_keyword(const StringView& name) const;

  private:
    Value m_node;
};


inline
std::string_view Schema::type_name(Type type) {
    switch (type) {
        case Type::ANY:     return "any";
        case Type::NIL:     return "null";
        case Type::BOOLEAN: return "boolean";
        case Type::INTEGER: return "integer";
        case Type::NUMBER:  return "number";
        case Type::STRING:  return "string";
        case Type::ARRAY:   return "array";
        case Type::OBJECT:  return "object";
        default:            throw std::logic_error("invalid schema type");
    }
}

inline
Schema::Type Schema::type_from_name(const StringView& name) {
    if (name == "any")     return Type::ANY;
    if (name == "null")    return Type::NIL;
    if (name == "boolean") return Type::BOOLEAN;
    if (name == "integer") return Type::INTEGER;
    if (name == "number")  return Type::NUMBER;
    if (name == "string")  return Type::STRING;
    if (name == "array")   return Type::ARRAY;
    if (name == "object")  return Type::OBJECT;
    throw SchemaError(fmt::format("Unknown schema type: {}", name));
}

inline
Schema::Schema(const Value& node) {
    if (node.is_empty() || node.is_nil()) return;
    if (!node.is_map()) throw SchemaError(fmt::format("Schema must be an object, not {}", node.type_name()));
    m_node = node;
}

inline
Value Schema::keyword(const StringView& name) const {
    if (m_node.is_empty()) return {};
    return m_node.get(name);
}

inline
Schema Schema::property(const String& name) const {
    auto properties = keyword("properties");
    if (properties.is_empty()) return {};
    if (!properties.is_map()) throw SchemaError("Schema keyword 'properties' must be an object"s);
    return properties.get(name);
}

inline
std::optional<Schema> Schema::items() const {
    auto items = keyword("items");
    if (items.is_empty() || items.is_array()) return {};
    return Schema{items};
}

inline
std::optional<Schema> Schema::additional_properties() const {
    auto additional = keyword("additionalProperties");
    if (additional.is_empty() || additional.is_bool()) return {};
    return Schema{additional};
}

inline
std::optional<Schema> Schema::additional_items() const {
    auto additional = keyword("additionalItems");
    if (additional.is_empty() || additional.is_bool()) return {};
    return Schema{additional};
}

inline
bool Schema::allows_additional_properties() const {
    auto additional = keyword("additionalProperties");
    return !additional.is_bool() || additional.as<bool>();
}

inline
bool Schema::allows_additional_items() const {
    auto additional = keyword("additionalItems");
    return !additional.is_bool() || additional.as<bool>();
}

/// Return the schema aligned to a child slot.
/// - String keys resolve through `properties`, then `additionalProperties`.
/// - Index keys resolve through `items`. When `items` is a list of schemas
///   the positional schema is used, then `additionalItems`.
inline
Schema Schema::child(const Key& key) const {
    if (m_node.is_empty()) return {};

    if (key.is_str()) {
        auto properties = keyword("properties");
        if (!properties.is_empty()) {
            if (!properties.is_map()) throw SchemaError("Schema keyword 'properties' must be an object"s);
            auto property = properties.get(key);
            if (!property.is_empty()) return property;
        }
        auto additional = additional_properties();
        return additional? *additional: Schema{};
    }

    auto items = keyword("items");
    if (items.is_empty()) return {};
    if (items.is_map()) return items;
    if (!items.is_array()) throw SchemaError("Schema keyword 'items' must be an object or a list"s);

    Int index = key.index();
    if (index >= 0 && (UInt)index < items.size())
        return items.get(index);

    auto additional = additional_items();
    return additional? *additional: Schema{};
}

inline
Value Schema::default_value() const {
    auto value = keyword("default");
    if (value.is_empty()) throw NoDefault();
    return value;
}

inline
bool Schema::is_optional() const {
    auto optional = keyword("optional");
    if (optional.is_empty()) return false;
    if (!optional.is_bool()) throw SchemaError("Schema keyword 'optional' must be a boolean"s);
    return optional.as<bool>();
}

inline
Schema::TypeSet Schema::types() const {
    auto type = keyword("type");
    if (type.is_empty()) return {Type::ANY};
    if (type.is_str()) return {type_from_name(type.as<String>())};
    if (!type.is_array()) throw SchemaError("Schema keyword 'type' must be a string or a list"s);

    TypeSet types;
    for (auto& item : type.as<Array>()) {
        if (!item.is_str()) throw SchemaError("Schema keyword 'type' must be a list of strings"s);
        types.insert(type_from_name(item.as<String>()));
    }
    if (types.size() == 0) types.insert(Type::ANY);
    return types;
}

inline
std::optional<String> Schema::fragment_class() const {
    auto name = keyword(fragment_class_key);
    if (name.is_empty()) return {};
    if (!name.is_str()) throw SchemaError(fmt::format("Schema keyword '{}' must be a string", fragment_class_key));
    return name.as<String>();
}

inline
String Schema::string_keyword(const StringView& name) const {
    auto value = keyword(name);
    if (value.is_empty()) return "";
    if (!value.is_str()) throw SchemaError(fmt::format("Schema keyword '{}' must be a string", name));
    return value.as<String>();
}

inline
String Schema::title() const {
    return string_keyword("title");
}

inline
String Schema::description() const {
    return string_keyword("description");
}

} // namespace jsondoc
