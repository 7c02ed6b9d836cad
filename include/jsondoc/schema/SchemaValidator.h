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
#include <regex>
#include <string>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include <jsondoc/core/Path.h>
#include <jsondoc/core/Value.h>
#include <jsondoc/schema/Schema.h>
#include <jsondoc/schema/Validator.h>
#include <jsondoc/support/string.h>

namespace jsondoc {

//////////////////////////////////////////////////////////////////////////////
/// @brief Validator for the json-schema draft-03 keywords understood by
/// Schema.
/// - Supported keywords: `type`, `properties`, `optional`,
///   `additionalProperties`, `items`, `additionalItems`, `enum`, `minimum`,
///   `maximum`, `exclusiveMinimum`, `exclusiveMaximum`, `minLength`,
///   `maxLength`, `pattern`, `minItems`, `maxItems` and `uniqueItems`.
/// - A missing property is accepted when it is optional, or when its schema
///   declares a default.
//////////////////////////////////////////////////////////////////////////////
class SchemaValidator : public Validator
{
  public:
    using Result = std::optional<ValidationError>;

    Result validate(const Value& value, const Schema& schema) const override {
        return validate(value, schema, Path{}, Path{});
    }

  private:
    Result validate(const Value&, const Schema&, const Path&, const Path&) const;
    Result check_type(const Value&, const Schema&, const Path&, const Path&) const;
    Result check_enum(const Value&, const Schema&, const Path&, const Path&) const;
    Result check_number(const Value&, const Schema&, const Path&, const Path&) const;
    Result check_string(const Value&, const Schema&, const Path&, const Path&) const;
    Result check_array(const Value&, const Schema&, const Path&, const Path&) const;
    Result check_object(const Value&, const Schema&, const Path&, const Path&) const;

    static bool is_type(const Value& value, Schema::Type type);
    static UInt size_keyword(const Schema& schema, const char* name, const Path& schema_path);
};


inline
SchemaValidator::Result SchemaValidator::validate(const Value& value, const Schema& schema, const Path& value_path, const Path& schema_path) const {
    if (schema.is_empty()) return {};

    if (auto error = check_type(value, schema, value_path, schema_path)) return error;
    if (auto error = check_enum(value, schema, value_path, schema_path)) return error;

    switch (value.type()) {
        case Value::INT:
        case Value::UINT:
        case Value::FLOAT:
        case Value::DECIMAL: return check_number(value, schema, value_path, schema_path);
        case Value::STR:   return check_string(value, schema, value_path, schema_path);
        case Value::ARRAY: return check_array(value, schema, value_path, schema_path);
        case Value::MAP:   return check_object(value, schema, value_path, schema_path);
        default:           return {};
    }
}

inline
bool SchemaValidator::is_type(const Value& value, Schema::Type type) {
    switch (type) {
        case Schema::Type::ANY:     return true;
        case Schema::Type::NIL:     return value.is_nil();
        case Schema::Type::BOOLEAN: return value.is_bool();
        case Schema::Type::INTEGER: return value.is_any_int() || (value.is_decimal() && value.as<Decimal>().is_integer_literal());
        case Schema::Type::NUMBER:  return value.is_num();
        case Schema::Type::STRING:  return value.is_str();
        case Schema::Type::ARRAY:   return value.is_array();
        case Schema::Type::OBJECT:  return value.is_map();
        default:                    return false;
    }
}

inline
UInt SchemaValidator::size_keyword(const Schema& schema, const char* name, const Path& schema_path) {
    auto limit = schema.keyword(name);
    if (!limit.is_any_int() || limit.to_int() < 0)
        throw SchemaError(fmt::format("{} must be a non-negative integer", schema_path.child(name).to_str("schema")));
    return limit.to_uint();
}

inline
SchemaValidator::Result SchemaValidator::check_type(const Value& value, const Schema& schema, const Path& value_path, const Path& schema_path) const {
    auto types = schema.types();
    for (auto type : types) {
        if (is_type(value, type)) return {};
    }

    std::vector<std::string_view> names;
    for (auto type : types)
        names.push_back(Schema::type_name(type));

    return ValidationError{value_path, schema_path.child("type"),
                           fmt::format("expected {}, got {}", fmt::join(names, " or "), value.type_name())};
}

inline
SchemaValidator::Result SchemaValidator::check_enum(const Value& value, const Schema& schema, const Path& value_path, const Path& schema_path) const {
    auto choices = schema.keyword("enum");
    if (choices.is_empty()) return {};
    if (!choices.is_array()) throw SchemaError(fmt::format("{} must be a list", schema_path.child("enum").to_str("schema")));

    for (auto& choice : choices.as<Array>()) {
        if (choice == value) return {};
    }
    return ValidationError{value_path, schema_path.child("enum"),
                           fmt::format("{} is not one of {}", value.to_json(), choices.to_json())};
}

inline
SchemaValidator::Result SchemaValidator::check_number(const Value& value, const Schema& schema, const Path& value_path, const Path& schema_path) const {
    auto number = value.to_float();

    auto minimum = schema.keyword("minimum");
    if (!minimum.is_empty()) {
        if (!minimum.is_num()) throw SchemaError(fmt::format("{} must be a number", schema_path.child("minimum").to_str("schema")));
        auto exclusive = schema.keyword("exclusiveMinimum");
        bool is_exclusive = exclusive.is_bool() && exclusive.as<bool>();
        auto limit = minimum.to_float();
        if (number < limit || (is_exclusive && number == limit)) {
            return ValidationError{value_path, schema_path.child("minimum"),
                                   fmt::format("{} is less than {}{}", value.to_json(), is_exclusive? "or equal to ": "", minimum.to_json())};
        }
    }

    auto maximum = schema.keyword("maximum");
    if (!maximum.is_empty()) {
        if (!maximum.is_num()) throw SchemaError(fmt::format("{} must be a number", schema_path.child("maximum").to_str("schema")));
        auto exclusive = schema.keyword("exclusiveMaximum");
        bool is_exclusive = exclusive.is_bool() && exclusive.as<bool>();
        auto limit = maximum.to_float();
        if (number > limit || (is_exclusive && number == limit)) {
            return ValidationError{value_path, schema_path.child("maximum"),
                                   fmt::format("{} is greater than {}{}", value.to_json(), is_exclusive? "or equal to ": "", maximum.to_json())};
        }
    }

    return {};
}

inline
SchemaValidator::Result SchemaValidator::check_string(const Value& value, const Schema& schema, const Path& value_path, const Path& schema_path) const {
    auto& str = value.as<String>();
    auto length = utf8_length(str);

    if (!schema.keyword("minLength").is_empty()) {
        auto limit = size_keyword(schema, "minLength", schema_path);
        if (length < limit)
            return ValidationError{value_path, schema_path.child("minLength"),
                                   fmt::format("string is shorter than {} characters", limit)};
    }

    if (!schema.keyword("maxLength").is_empty()) {
        auto limit = size_keyword(schema, "maxLength", schema_path);
        if (length > limit)
            return ValidationError{value_path, schema_path.child("maxLength"),
                                   fmt::format("string is longer than {} characters", limit)};
    }

    auto pattern = schema.keyword("pattern");
    if (!pattern.is_empty()) {
        if (!pattern.is_str()) throw SchemaError(fmt::format("{} must be a string", schema_path.child("pattern").to_str("schema")));
        std::regex re;
        try {
            re = std::regex{pattern.as<String>(), std::regex::ECMAScript};
        } catch (const std::regex_error& err) {
            throw SchemaError(fmt::format("{} is not a valid regular expression: {}", schema_path.child("pattern").to_str("schema"), err.what()));
        }
        if (!std::regex_search(str, re))
            return ValidationError{value_path, schema_path.child("pattern"),
                                   fmt::format("{} does not match {}", json_quoted(str), json_quoted(pattern.as<String>()))};
    }

    return {};
}

inline
SchemaValidator::Result SchemaValidator::check_array(const Value& value, const Schema& schema, const Path& value_path, const Path& schema_path) const {
    auto& array = value.as<Array>();

    if (!schema.keyword("minItems").is_empty()) {
        auto limit = size_keyword(schema, "minItems", schema_path);
        if (array.size() < limit)
            return ValidationError{value_path, schema_path.child("minItems"),
                                   fmt::format("array has fewer than {} items", limit)};
    }

    if (!schema.keyword("maxItems").is_empty()) {
        auto limit = size_keyword(schema, "maxItems", schema_path);
        if (array.size() > limit)
            return ValidationError{value_path, schema_path.child("maxItems"),
                                   fmt::format("array has more than {} items", limit)};
    }

    auto unique = schema.keyword("uniqueItems");
    if (unique.is_bool() && unique.as<bool>()) {
        for (size_t i = 1; i < array.size(); ++i) {
            for (size_t j = 0; j < i; ++j) {
                if (array[i] == array[j])
                    return ValidationError{value_path.child((Int)i), schema_path.child("uniqueItems"),
                                           fmt::format("duplicate of item {}", j)};
            }
        }
    }

    auto items = schema.keyword("items");
    if (items.is_empty()) return {};

    if (items.is_map()) {
        auto item_schema_path = schema_path.child("items");
        for (size_t i = 0; i < array.size(); ++i) {
            if (auto error = validate(array[i], items, value_path.child((Int)i), item_schema_path))
                return error;
        }
        return {};
    }

    if (!items.is_array()) throw SchemaError(fmt::format("{} must be an object or a list", schema_path.child("items").to_str("schema")));

    auto& positional = items.as<Array>();
    for (size_t i = 0; i < array.size(); ++i) {
        if (i < positional.size()) {
            if (auto error = validate(array[i], positional[i], value_path.child((Int)i), schema_path.child("items").child((Int)i)))
                return error;
        } else if (!schema.allows_additional_items()) {
            return ValidationError{value_path.child((Int)i), schema_path.child("additionalItems"),
                                   fmt::format("array has more than {} items", positional.size())};
        } else if (auto additional = schema.additional_items()) {
            if (auto error = validate(array[i], *additional, value_path.child((Int)i), schema_path.child("additionalItems")))
                return error;
        }
    }

    return {};
}

inline
SchemaValidator::Result SchemaValidator::check_object(const Value& value, const Schema& schema, const Path& value_path, const Path& schema_path) const {
    auto properties = schema.keyword("properties");
    if (!properties.is_empty()) {
        if (!properties.is_map()) throw SchemaError(fmt::format("{} must be an object", schema_path.child("properties").to_str("schema")));
        auto properties_path = schema_path.child("properties");
        for (auto& [name, property] : properties.items()) {
            Schema property_schema{property};
            auto item = value.get(name);
            if (item.is_empty()) {
                if (!property_schema.is_optional() && !property_schema.has_default())
                    return ValidationError{value_path.child(name), properties_path.child(name).child("optional"),
                                           "required property is missing"};
                continue;
            }
            if (auto error = validate(item, property_schema, value_path.child(name), properties_path.child(name)))
                return error;
        }
    }

    bool allows_additional = schema.allows_additional_properties();
    auto additional = schema.additional_properties();
    if (allows_additional && !additional) return {};

    for (auto& [name, item] : value.items()) {
        if (properties.is_map() && properties.contains(name)) continue;
        if (!allows_additional)
            return ValidationError{value_path.child(name), schema_path.child("additionalProperties"),
                                   fmt::format("property {} is not allowed", name.to_json())};
        if (auto error = validate(item, *additional, value_path.child(name), schema_path.child("additionalProperties")))
            return error;
    }

    return {};
}

} // namespace jsondoc
