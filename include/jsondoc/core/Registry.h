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

#include <functional>
#include <memory>
#include <optional>
#include <unordered_map>

#include <fmt/core.h>

#include <jsondoc/core/Key.h>
#include <jsondoc/core/Path.h>
#include <jsondoc/core/Value.h>
#include <jsondoc/schema/Schema.h>
#include <jsondoc/schema/Validator.h>
#include <jsondoc/support/Ref.h>
#include <jsondoc/support/logging.h>
#include <jsondoc/support/types.h>

namespace jsondoc {

class Fragment;
class Document;

struct FragmentClassError : public JsonDocException
{
    FragmentClassError(const String& name) : JsonDocException(fmt::format("Fragment class is not registered: {}", name)) {}
    FragmentClassError(const String& name, const Path& path)
      : JsonDocException(fmt::format("Fragment at {} is not an instance of {}", path.to_str(), name)) {}
};

/// Everything a Fragment constructor needs to bind to a slot of a document.
struct FragmentInit
{
    std::shared_ptr<Document> document;
    std::shared_ptr<Fragment> parent;
    std::optional<Key> item;
    Path path;
    Schema schema;
    Value container;   // parent container block holding the slot
    Value value;       // value in the slot when the fragment was created
    Ref<Validator> validator;
};

/////////////////////////////////////////////////////////////////////////////
/// @brief A registry of Fragment factories keyed by fragment class name.
/// - A schema node selects a class by naming it under the `__fragment_cls`
///   keyword. Navigation to a slot whose schema names a class creates the
///   fragment using the associated factory.
/// - The process-wide registry is created by the JSONDOC_INIT macro and
///   returned by global_registry(). Documents may be given a different
///   registry through Document::Options.
/////////////////////////////////////////////////////////////////////////////
class Registry
{
  public:
    using Factory = std::function<std::shared_ptr<Fragment>(FragmentInit&&)>;

    void associate(const String& name, const Factory& factory);
    template <class T> void associate(const String& name);

    Factory get_association(const String& name) const;
    bool is_empty() const;

  protected:
    std::unordered_map<String, Factory> m_class_map;

  private:
    refcnt_t m_ref_count = 0;

  template <typename> friend class ::jsondoc::Ref;
};


inline
void Registry::associate(const String& name, const Factory& factory) {
    if (m_class_map.contains(name)) {
        WARN("Replacing fragment class association: {}", name);
    }
    m_class_map[name] = factory;
}

template <class T>
void Registry::associate(const String& name) {
    associate(name, [] (FragmentInit&& init) { return std::make_shared<T>(std::forward<FragmentInit>(init)); });
}

inline
Registry::Factory Registry::get_association(const String& name) const {
    if (auto it = m_class_map.find(name); it != m_class_map.end()) {
        return it->second;
    }
    return {};
}

inline
bool Registry::is_empty() const {
    return m_class_map.size() == 0;
}

namespace impl {

/////////////////////////////////////////////////////////////////////////////
/// @brief Registry initialization macro.
/// This macro must be instantiated once in a program before fragment
/// classes are registered or documents are created.
/////////////////////////////////////////////////////////////////////////////
#define JSONDOC_INIT_REGISTRY namespace jsondoc::impl { ::jsondoc::Ref<::jsondoc::Registry> global_registry{new ::jsondoc::Registry}; }
extern Ref<Registry> global_registry;

} // namespace impl

/// Returns the process-wide registry.
inline
Ref<Registry> global_registry() {
    return impl::global_registry;
}

/// Associate a Fragment subclass with a name in the process-wide registry.
template <class T>
void register_fragment_class(const String& name) {
    impl::global_registry->associate<T>(name);
}

} // namespace jsondoc
