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

#include <memory>

#include <jsondoc/core/Fragment.h>
#include <jsondoc/core/Key.h>
#include <jsondoc/core/Value.h>

/////////////////////////////////////////////////////////////////////////////
/// Accessor generation for Fragment and Document subclasses.
///
/// ```
/// class Settings : public jsondoc::Document
/// {
///   public:
///     using Document::Document;
///     JSONDOC_READWRITE_BRIDGE(save_on_exit)
///     JSONDOC_READONLY_BRIDGE(version)
///     JSONDOC_FRAGMENT_BRIDGE(counter, Counter)
/// };
/// ```
///
/// - JSONDOC_READONLY_BRIDGE(name) defines `Value name()`, which returns the
///   value of the child named `name`.
/// - JSONDOC_READWRITE_BRIDGE(name) also defines `void set_name(const Value&)`.
/// - JSONDOC_FRAGMENT_BRIDGE(name, Type) defines `std::shared_ptr<Type> name()`,
///   which returns the child fragment itself.
/////////////////////////////////////////////////////////////////////////////
#define JSONDOC_FRAGMENT_BRIDGE(name, Type) \
    std::shared_ptr<Type> name() { return ::jsondoc::bridge::fragment<Type>(*this, #name); }

#define JSONDOC_READONLY_BRIDGE(name) \
    ::jsondoc::Value name() { return ::jsondoc::bridge::read(*this, #name); }

#define JSONDOC_READWRITE_BRIDGE(name) \
    JSONDOC_READONLY_BRIDGE(name) \
    void set_##name(const ::jsondoc::Value& value) { ::jsondoc::bridge::write(*this, #name, value); }

namespace jsondoc::bridge {

template <class T = Fragment>
std::shared_ptr<T> fragment(Fragment& self, const Key& key) {
    return self.get_as<T>(key);
}

inline
Value read(Fragment& self, const Key& key) {
    return self.get(key)->value();
}

inline
void write(Fragment& self, const Key& key, const Value& value) {
    self.set(key, value);
}

} // namespace jsondoc::bridge
