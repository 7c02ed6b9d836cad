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
#include <optional>
#include <type_traits>
#include <typeinfo>

#include <fmt/core.h>

#include <jsondoc/fmt_support.h>

#include <jsondoc/core/Key.h>
#include <jsondoc/core/Path.h>
#include <jsondoc/core/Registry.h>
#include <jsondoc/core/Value.h>
#include <jsondoc/schema/Schema.h>
#include <jsondoc/schema/SchemaValidator.h>
#include <jsondoc/schema/Validator.h>
#include <jsondoc/support/Ref.h>
#include <jsondoc/support/exception.h>
#include <jsondoc/support/logging.h>
#include <jsondoc/support/string.h>

namespace jsondoc {

class FragmentRange;

struct TypeMismatch : public JsonDocException
{
    TypeMismatch(std::string&& msg) : JsonDocException(std::forward<std::string>(msg)) {}
};

struct OrphanedFragment : public JsonDocException
{
    OrphanedFragment(const Path& path) : JsonDocException(fmt::format("Fragment is orphaned: {}", path)) {}
};

struct UnsupportedOperation : public JsonDocException
{
    UnsupportedOperation(std::string&& msg) : JsonDocException(std::forward<std::string>(msg)) {}
};

//////////////////////////////////////////////////////////////////////////////
/// @brief A live, schema aware handle on one slot of a Document.
///
/// A Fragment is identified by its document and its path. While attached, the
/// value returned by Fragment::value is the Value stored in the document at
/// that path, so that changes made through either one are visible through
/// the other.
///
/// ### Defaults
/// When a slot of an object is absent and the schema aligned to the slot
/// declares a default, navigation writes a copy of the default into the
/// store and marks the slot as default. The mark is cleared when a value is
/// written to the slot, or to any slot below it. Default marked slots are
/// not counted by Fragment::size, Fragment::contains and Fragment::keys.
/// Array slots never synthesize defaults.
///
/// ### Orphans
/// A fragment records the container block of its parent when it is created.
/// When the parent's value is replaced, or the slot disappears without a
/// default to take its place, the fragment becomes orphaned. Orphaning is
/// detected when the fragment is next used. An orphaned fragment has no
/// parent and no document, and its value is a frozen copy of the last value
/// seen in the slot. Reading an orphan succeeds, while navigating or
/// modifying one throws OrphanedFragment.
///
/// Replacing the value at a path orphans the fragments below that path. A
/// fragment addressing the replaced slot itself remains attached and
/// observes the new value.
///
/// Fragments are created by Fragment::get, and by the registered factory
/// when the aligned schema names a fragment class. Subclasses inherit the
/// constructor with `using Fragment::Fragment`.
//////////////////////////////////////////////////////////////////////////////
class Fragment : public std::enable_shared_from_this<Fragment>
{
  public:
    Fragment(FragmentInit&& init);
    virtual ~Fragment() = default;

    Fragment(const Fragment&) = delete;
    Fragment& operator = (const Fragment&) = delete;

    Value value() const { return resolve(); }
    void set_value(const Value& value);

    const Schema& schema() const { return m_schema; }
    const Path& path() const     { return m_path; }
    const std::optional<Key>& item() const { return m_item; }

    std::shared_ptr<Fragment> parent() const;
    virtual std::shared_ptr<Document> document() const;

    bool is_root() const { return !m_item.has_value(); }
    virtual bool is_default() const;
    bool is_orphaned() const;

    Value default_value() const;
    bool default_value_exists() const { return m_schema.has_default(); }
    virtual void revert_to_default();

    std::shared_ptr<Fragment> get(const Key& key);
    std::shared_ptr<Fragment> get(const char* key) { return get(Key{key}); }
    std::shared_ptr<Fragment> get(is_like_Int auto index) { return get(Key{index}); }
    std::shared_ptr<Fragment> get(const Path& path);
    template <class T> std::shared_ptr<T> get_as(const Key& key);

    void set(const Key& key, const Value& value);

    size_t size() const;
    bool contains(const Value& value) const;
    KeyList keys() const;
    FragmentRange children();

    std::optional<ValidationError> validate() const;
    void ensure_valid() const;

  protected:
    virtual Value resolve() const;
    virtual void store(const Value& value);
    virtual bool ensure_not_default();

    void check_attached() const;
    void touch();

  private:
    void orphan() const;
    Key checked_key(const Value& container, const Key& key, bool for_write) const;
    std::shared_ptr<Fragment> make_child(const Key& key, const Value& container, const Value& value);

  protected:
    Path m_path;
    std::optional<Key> m_item;
    Schema m_schema;
    Ref<Validator> m_validator;

  private:
    mutable std::shared_ptr<Document> m_document;
    mutable std::shared_ptr<Fragment> m_parent;
    mutable Value m_container;
    mutable Value m_last;
    mutable Value m_snapshot;
    mutable bool m_orphaned = false;
};


/// Document configuration.
struct DocumentOptions
{
    Ref<Registry> registry = global_registry();
    Ref<Validator> validator = new SchemaValidator{};
};

struct DocumentInit
{
    Value value;
    Schema schema;
    DocumentOptions options;
};

//////////////////////////////////////////////////////////////////////////////
/// @brief The root fragment of a tree, and the owner of the root Value.
/// - Documents are created with Document::create, which optionally creates
///   a subclass of Document.
/// - An omitted root value is absent. Reading an absent root yields a copy of
///   the root schema default, marked as default, or an empty object when the
///   schema declares no default. A `null` root is preserved.
/// - Document::revision counts the modifications made through the document
///   and its fragments.
//////////////////////////////////////////////////////////////////////////////
class Document : public Fragment
{
  public:
    using Options = DocumentOptions;

    Document(DocumentInit&& init);

    template <class T = Document>
    static std::shared_ptr<T> create(const Value& value = Value{}, const Schema& schema = Schema{}, const Options& options = Options{});

    std::shared_ptr<Document> document() const override;
    bool is_default() const override;
    void revert_to_default() override;

    UInt revision() const { return m_revision; }
    Ref<Registry> registry() const { return m_options.registry; }
    Ref<Validator> validator() const { return m_options.validator; }

  protected:
    Value resolve() const override;
    void store(const Value& value) override;
    bool ensure_not_default() override;

  private:
    mutable Value m_value;
    Options m_options;
    UInt m_revision = 0;

  friend class Fragment;
};


//////////////////////////////////////////////////////////////////////////////
/// @brief Iterator over the children of a fragment.
/// - Child fragments are created as the iterator is dereferenced.
//////////////////////////////////////////////////////////////////////////////
class FragmentIterator
{
  public:
    FragmentIterator() {}
    FragmentIterator(const std::shared_ptr<Fragment>& parent, const std::shared_ptr<KeyList>& keys)
      : mp_parent{parent}, mp_keys{keys} {}

    FragmentIterator& operator ++ () { ++m_pos; return *this; }
    std::shared_ptr<Fragment> operator * () const { return mp_parent->get((*mp_keys)[m_pos]); }
    bool operator == (const FragmentIterator& other) const { return done() == other.done() && (done() || m_pos == other.m_pos); }

  private:
    bool done() const { return !mp_keys || m_pos >= mp_keys->size(); }

  private:
    std::shared_ptr<Fragment> mp_parent;
    std::shared_ptr<KeyList> mp_keys;
    size_t m_pos = 0;
};

//////////////////////////////////////////////////////////////////////////////
/// @brief Restartable range of the children of an object or array fragment.
/// - Object children are visited in insertion order, skipping default
///   marked slots. Array children are visited in index order.
/// - The keys are collected each time the range is started.
//////////////////////////////////////////////////////////////////////////////
class FragmentRange
{
  public:
    FragmentRange(const std::shared_ptr<Fragment>& parent) : mp_parent{parent} {}

    FragmentIterator begin() const { return {mp_parent, std::make_shared<KeyList>(mp_parent->keys())}; }
    FragmentIterator end() const   { return {}; }

  private:
    std::shared_ptr<Fragment> mp_parent;
};


inline
Fragment::Fragment(FragmentInit&& init)
  : m_path{std::move(init.path)}
  , m_item{std::move(init.item)}
  , m_schema{std::move(init.schema)}
  , m_validator{std::move(init.validator)}
  , m_document{std::move(init.document)}
  , m_parent{std::move(init.parent)}
  , m_container{std::move(init.container)}
  , m_last{std::move(init.value)}
{}

inline
std::shared_ptr<Fragment> Fragment::parent() const {
    resolve();
    return m_parent;
}

inline
std::shared_ptr<Document> Fragment::document() const {
    resolve();
    return m_document;
}

inline
bool Fragment::is_orphaned() const {
    resolve();
    return m_orphaned;
}

inline
bool Fragment::is_default() const {
    resolve();
    if (m_orphaned) return m_snapshot.is_default();
    return m_container.is_default(*m_item) || m_parent->is_default();
}

inline
Value Fragment::default_value() const {
    return m_schema.default_value().copy_unmarked();
}

inline
void Fragment::check_attached() const {
    resolve();
    if (m_orphaned) throw OrphanedFragment(m_path);
}

inline
void Fragment::touch() {
    auto doc = document();
    ++(doc->m_revision);
}

inline
void Fragment::orphan() const {
    auto last = m_container.get(*m_item);
    if (last.is_empty()) last = m_last;
    m_snapshot = last.copy();
    m_snapshot.freeze();
    m_orphaned = true;
    m_document.reset();
    m_parent.reset();
    m_container = Value{};
    m_last = Value{};
    DEBUG("Fragment orphaned: {}", m_path);
}

/// Return the live value of the slot, detecting orphaning on the way.
inline
Value Fragment::resolve() const {
    if (m_orphaned) return m_snapshot;

    auto parent_value = m_parent->resolve();
    if (m_parent->m_orphaned || !parent_value.is(m_container)) {
        orphan();
        return m_snapshot;
    }

    auto value = m_container.get(*m_item);
    if (value.is_empty()) {
        if (!m_container.is_map() || !m_schema.has_default()) {
            orphan();
            return m_snapshot;
        }
        value = m_container.set_default(*m_item, default_value());
        DEBUG("Default materialized: {}", m_path);
    }

    m_last = value;
    return value;
}

inline
void Fragment::store(const Value& value) {
    if (!is_default() && m_container.get(*m_item).without_defaults() == value)
        return;
    m_parent->ensure_not_default();
    m_container.set(*m_item, value.copy_unmarked());
    touch();
}

/// Clear the default marks of this slot and of every slot above it.
/// Returns true if a mark was cleared.
inline
bool Fragment::ensure_not_default() {
    bool cleared = m_container.is_default(*m_item);
    m_container.clear_default(*m_item);
    return m_parent->ensure_not_default() || cleared;
}

inline
void Fragment::set_value(const Value& value) {
    check_attached();
    store(value);
}

inline
void Fragment::revert_to_default() {
    check_attached();
    if (!m_schema.has_default()) throw NoDefault(m_path);
    if (m_container.is_array())
        throw UnsupportedOperation(fmt::format("Array items cannot be reverted to a default: {}", m_path));

    if (is_default()) return;
    m_parent->ensure_not_default();
    m_container.del(*m_item);
    touch();
}

inline
Key Fragment::checked_key(const Value& container, const Key& key, bool for_write) const {
    if (container.is_map()) {
        if (!key.is_str())
            throw TypeMismatch(fmt::format("Object at {} cannot be indexed by {}", m_path, key.to_json()));
        return key;
    }

    if (container.is_array()) {
        if (!key.is_index())
            throw TypeMismatch(fmt::format("Array at {} cannot be indexed by {}", m_path, key.to_json()));
        Int index = key.index();
        auto size = container.size();
        if (for_write && index == (Int)size) return index;
        if (!Value::norm_index(index, size)) throw NoSuchElement(key);
        return index;
    }

    throw TypeMismatch(fmt::format("Value at {} is not a container: {}", m_path, container.type_name()));
}

inline
std::shared_ptr<Fragment> Fragment::make_child(const Key& key, const Value& container, const Value& value) {
    auto doc = document();
    auto schema = m_schema.child(key);

    FragmentInit init{doc, shared_from_this(), key, m_path.child(key), schema, container, value, m_validator};

    if (auto class_name = schema.fragment_class()) {
        auto factory = doc->registry()->get_association(*class_name);
        if (!factory) throw FragmentClassError(*class_name);
        return factory(std::move(init));
    }

    return std::make_shared<Fragment>(std::move(init));
}

inline
std::shared_ptr<Fragment> Fragment::get(const Key& key) {
    check_attached();
    auto container = resolve();
    auto child_key = checked_key(container, key, false);

    auto value = container.get(child_key);
    if (value.is_empty()) {
        auto child_schema = m_schema.child(child_key);
        if (!container.is_map() || !child_schema.has_default())
            throw NoSuchElement(child_key);
        value = container.set_default(child_key, child_schema.default_value().copy_unmarked());
        DEBUG("Default materialized: {}", m_path.child(child_key));
    }

    return make_child(child_key, container, value);
}

inline
std::shared_ptr<Fragment> Fragment::get(const Path& path) {
    auto fragment = shared_from_this();
    for (auto& key : path)
        fragment = fragment->get(key);
    return fragment;
}

/// Navigate to a child and cast it to a Fragment subclass.
/// @throws FragmentClassError if the child was not created as a T.
template <class T>
std::shared_ptr<T> Fragment::get_as(const Key& key) {
    auto child = get(key);
    auto result = std::dynamic_pointer_cast<T>(child);
    if (!result) throw FragmentClassError(typeid(T).name(), child->path());
    return result;
}

inline
void Fragment::set(const Key& key, const Value& value) {
    check_attached();
    auto container = resolve();
    auto child_key = checked_key(container, key, true);

    auto current = container.get(child_key);
    if (!current.is_empty() && !current.is_default() && !is_default() && current.without_defaults() == value)
        return;

    ensure_not_default();
    container.set(child_key, value.copy_unmarked());
    touch();
}

inline
size_t Fragment::size() const {
    auto value = resolve();
    switch (value.type()) {
        case Value::STR: return utf8_length(value.as<String>());
        case Value::ARRAY: return value.size();
        case Value::MAP: {
            size_t count = 0;
            for (auto& [_, item] : value.as<Map>()) {
                if (!item.is_default()) ++count;
            }
            return count;
        }
        default:
            throw TypeMismatch(fmt::format("Value at {} has no size: {}", m_path, value.type_name()));
    }
}

inline
bool Fragment::contains(const Value& item) const {
    auto value = resolve();
    switch (value.type()) {
        case Value::STR: {
            if (!item.is_str()) return false;
            return value.as<String>().find(item.as<String>()) != String::npos;
        }
        case Value::ARRAY: {
            for (auto& element : value.as<Array>()) {
                if (element == item) return true;
            }
            return false;
        }
        case Value::MAP: {
            if (!item.is_str()) return false;
            auto slot = value.get(item.as<String>());
            return !slot.is_empty() && !slot.is_default();
        }
        default:
            throw TypeMismatch(fmt::format("Value at {} is not a container: {}", m_path, value.type_name()));
    }
}

inline
KeyList Fragment::keys() const {
    auto value = resolve();
    switch (value.type()) {
        case Value::ARRAY: return value.keys();
        case Value::MAP: {
            KeyList keys;
            for (auto& [key, item] : value.as<Map>()) {
                if (!item.is_default()) keys.emplace_back(key);
            }
            return keys;
        }
        default:
            throw TypeMismatch(fmt::format("Value at {} is not a container: {}", m_path, value.type_name()));
    }
}

inline
FragmentRange Fragment::children() {
    check_attached();
    keys();
    return {shared_from_this()};
}

inline
std::optional<ValidationError> Fragment::validate() const {
    return m_validator->validate(resolve(), m_schema);
}

inline
void Fragment::ensure_valid() const {
    if (auto error = validate())
        throw *error;
}


inline
Document::Document(DocumentInit&& init)
  : Fragment{FragmentInit{nullptr, nullptr, std::nullopt, Path{}, init.schema, Value{}, Value{}, init.options.validator}}
  , m_value{init.value.is_empty()? Value{}: init.value.copy_unmarked()}
  , m_options{std::move(init.options)}
{
    m_value.mark_default(false);
}

/// Create a document, optionally as an instance of a subclass of Document.
/// - The value is copied into the document. An omitted value leaves the root
///   absent.
template <class T>
std::shared_ptr<T> Document::create(const Value& value, const Schema& schema, const Options& options) {
    static_assert(std::is_base_of<Document, T>::value, "T must derive from Document");
    return std::make_shared<T>(DocumentInit{value, schema, options});
}

inline
std::shared_ptr<Document> Document::document() const {
    return std::static_pointer_cast<Document>(std::const_pointer_cast<Fragment>(shared_from_this()));
}

inline
bool Document::is_default() const {
    resolve();
    return m_value.is_default();
}

inline
Value Document::resolve() const {
    if (m_value.is_empty()) {
        if (m_schema.has_default()) {
            m_value = m_schema.default_value().copy_unmarked();
            m_value.mark_default();
            DEBUG("Default materialized: {}", m_path);
        } else {
            m_value = Value{Value::MAP};
        }
    }
    return m_value;
}

inline
void Document::store(const Value& value) {
    auto current = resolve();
    if (!current.is_default() && current.without_defaults() == value)
        return;
    m_value = value.copy_unmarked();
    m_value.mark_default(false);
    touch();
}

inline
bool Document::ensure_not_default() {
    resolve();
    bool cleared = m_value.is_default();
    m_value.mark_default(false);
    return cleared;
}

inline
void Document::revert_to_default() {
    if (!m_schema.has_default()) throw NoDefault(m_path);
    if (m_value.is_empty() || m_value.is_default()) return;
    m_value = Value{};
    touch();
}

} // namespace jsondoc
