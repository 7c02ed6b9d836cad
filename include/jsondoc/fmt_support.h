#pragma once

#include <fmt/format.h>
#include <jsondoc/core/Key.h>
#include <jsondoc/core/Path.h>
#include <jsondoc/core/Value.h>

namespace fmt {

template <>
struct formatter<jsondoc::Key> : formatter<std::string> {
  auto format(const jsondoc::Key& key, format_context& ctx) const {
    return formatter<std::string>::format(key.to_str(), ctx);
  }
};

template <>
struct formatter<jsondoc::Value> : formatter<std::string> {
  auto format(const jsondoc::Value& value, format_context& ctx) const {
    return formatter<std::string>::format(value.is_empty()? std::string{"<empty>"}: value.to_str(), ctx);
  }
};

template <>
struct formatter<jsondoc::Path> : formatter<std::string> {
  auto format(const jsondoc::Path& path, format_context& ctx) const {
    return formatter<std::string>::format(path.to_str(), ctx);
  }
};

} // namespace fmt
