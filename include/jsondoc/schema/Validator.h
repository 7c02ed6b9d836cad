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
#include <string>

#include <fmt/core.h>

#include <jsondoc/core/Path.h>
#include <jsondoc/core/Value.h>
#include <jsondoc/schema/Schema.h>
#include <jsondoc/support/exception.h>
#include <jsondoc/support/types.h>

namespace jsondoc {

template <class> class Ref;

//////////////////////////////////////////////////////////////////////////////
/// @brief A schema conformance failure.
/// - The value path is rooted at `object`, for example `object.age`.
/// - The schema path is rooted at `schema` and names the violated keyword,
///   for example `schema.properties.age.type`.
//////////////////////////////////////////////////////////////////////////////
class ValidationError : public JsonDocException
{
  public:
    static std::string make_message(const Path& value_path, const Path& schema_path, const std::string& reason) {
        return fmt::format("{}: {} ({})", value_path.to_str("object"), reason, schema_path.to_str("schema"));
    }

    ValidationError(const Path& value_path, const Path& schema_path, const std::string& reason)
      : JsonDocException(make_message(value_path, schema_path, reason))
      , m_value_path{value_path}
      , m_schema_path{schema_path}
      , m_reason{reason}
    {}

    String value_path() const  { return m_value_path.to_str("object"); }
    String schema_path() const { return m_schema_path.to_str("schema"); }
    const String& reason() const { return m_reason; }

    const Path& value_keys() const  { return m_value_path; }
    const Path& schema_keys() const { return m_schema_path; }

  private:
    Path m_value_path;
    Path m_schema_path;
    String m_reason;
};

//////////////////////////////////////////////////////////////////////////////
/// @brief Checks a value against a schema.
/// - Implementations return the first mismatch found, or std::nullopt.
/// - Held by documents through Ref<Validator>.
//////////////////////////////////////////////////////////////////////////////
class Validator
{
  public:
    virtual ~Validator() = default;
    virtual std::optional<ValidationError> validate(const Value& value, const Schema& schema) const = 0;

  private:
    refcnt_t m_ref_count = 0;

  template <class> friend class Ref;
};

} // namespace jsondoc
