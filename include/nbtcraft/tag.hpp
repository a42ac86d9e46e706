#ifndef NBTCRAFT_TAG_HPP
#define NBTCRAFT_TAG_HPP

#include <algorithm>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "error.hpp"

namespace nbtcraft {

typedef unsigned char byte_t;
typedef int8_t sbyte_t;
typedef int16_t short_t;
typedef uint16_t ushort_t;
typedef int32_t int_t;
typedef uint32_t uint_t;
typedef int64_t long_t;
typedef uint64_t ulong_t;

/// @brief NBT tag kinds. The numeric value is the kind ID used on the wire.
enum TagType : byte_t {
    TAG_END = 0,
    TAG_BYTE = 1,
    TAG_SHORT = 2,
    TAG_INT = 3,
    TAG_LONG = 4,
    TAG_FLOAT = 5,
    TAG_DOUBLE = 6,
    TAG_BYTEARRAY = 7,
    TAG_STRING = 8,
    TAG_LIST = 9,
    TAG_COMPOUND = 10,
    TAG_INTARRAY = 11,
    TAG_LONGARRAY = 12,
};

constexpr int TAG_TYPE_COUNT = 13;

constexpr bool is_valid_tag_type(int id) {
    return id >= TAG_END && id < TAG_TYPE_COUNT;
}

inline std::string tag_type_name(TagType type) {
    switch (type) {
        case TAG_END: return "End";
        case TAG_BYTE: return "Byte";
        case TAG_SHORT: return "Short";
        case TAG_INT: return "Int";
        case TAG_LONG: return "Long";
        case TAG_FLOAT: return "Float";
        case TAG_DOUBLE: return "Double";
        case TAG_BYTEARRAY: return "ByteArray";
        case TAG_STRING: return "String";
        case TAG_LIST: return "List";
        case TAG_COMPOUND: return "Compound";
        case TAG_INTARRAY: return "IntArray";
        case TAG_LONGARRAY: return "LongArray";
    }
    return "N/A (" + std::to_string(static_cast<int>(type)) + ")";
}

class NBTTag;
struct NamedTag;

typedef std::vector<sbyte_t> ByteArray;
typedef std::vector<int_t> IntArray;
typedef std::vector<long_t> LongArray;

/// @brief A homogeneous sequence of unnamed tags.
/// The element kind is fixed at construction. An empty list may declare `TAG_END`, in which case the first
/// element pushed decides the kind.
class List {
public:
    typedef std::vector<NBTTag>::const_iterator const_iterator;

    List();
    explicit List(TagType element_type);
    /// @exception Throws `type_mismatch` if any item is not of kind `element_type`.
    List(TagType element_type, std::vector<NBTTag> items);

    TagType element_type() const { return m_element_type; }
    std::size_t size() const;
    bool empty() const;

    /// @exception Throws `no_such_entry` if `index` is out of range.
    const NBTTag& at(std::size_t index) const;
    const NBTTag& operator[](std::size_t index) const;
    const_iterator begin() const;
    const_iterator end() const;

    /// @exception Throws `type_mismatch` if `tag` is not of this list's element kind.
    void push_back(NBTTag tag);
    /// @exception Throws `type_mismatch` on a kind mismatch and `no_such_entry` if `index` is out of range.
    void set(std::size_t index, NBTTag tag);
    void erase(std::size_t index);
    /// @brief Removes every element. The declared element kind is kept.
    void clear();

    bool operator==(const List& other) const;

private:
    void check(const NBTTag& tag);

    TagType m_element_type;
    std::vector<NBTTag> m_items;
};

/// @brief An insertion-ordered mapping from names to tags with unique keys.
class Compound {
public:
    typedef std::vector<NamedTag>::const_iterator const_iterator;

    Compound();
    Compound(std::initializer_list<NamedTag> entries);

    std::size_t size() const;
    bool empty() const;
    bool contains(const std::string& name) const;

    /// @return The tag stored under `name`, or `nullptr`.
    const NBTTag* find(const std::string& name) const;
    NBTTag* find(const std::string& name);
    /// @exception Throws `no_such_entry` if there is no entry named `name`.
    const NBTTag& at(const std::string& name) const;
    NBTTag& at(const std::string& name);

    /// @brief Typed lookup.
    /// @exception Throws `no_such_entry` if the key is missing and `type_mismatch` if it holds another kind.
    template <typename T> const T& get(const std::string& name) const;

    /// @brief Inserts or replaces. A replaced entry keeps its position.
    /// @exception Throws `type_mismatch` if `tag` is `TAG_END`, which cannot be a compound child.
    void set(const std::string& name, NBTTag tag);
    /// @return Whether an entry was removed.
    bool erase(const std::string& name);
    void clear();

    const_iterator begin() const;
    const_iterator end() const;

    /// @brief Mapping equality: same key set and equal values. Entry order is not compared.
    bool operator==(const Compound& other) const;

private:
    void reindex(std::size_t from);

    std::vector<NamedTag> m_entries;
    // name -> position in m_entries
    std::unordered_map<std::string, std::size_t> m_index;
};

namespace internal {

template <typename T> constexpr bool is_nbt_type = false;
template <> constexpr bool is_nbt_type<sbyte_t> = true;
template <> constexpr bool is_nbt_type<short_t> = true;
template <> constexpr bool is_nbt_type<int_t> = true;
template <> constexpr bool is_nbt_type<long_t> = true;
template <> constexpr bool is_nbt_type<float> = true;
template <> constexpr bool is_nbt_type<double> = true;
template <> constexpr bool is_nbt_type<ByteArray> = true;
template <> constexpr bool is_nbt_type<std::string> = true;
template <> constexpr bool is_nbt_type<List> = true;
template <> constexpr bool is_nbt_type<Compound> = true;
template <> constexpr bool is_nbt_type<IntArray> = true;
template <> constexpr bool is_nbt_type<LongArray> = true;

template <typename T> constexpr TagType tag_type_of = TAG_END;
template <> constexpr TagType tag_type_of<sbyte_t> = TAG_BYTE;
template <> constexpr TagType tag_type_of<short_t> = TAG_SHORT;
template <> constexpr TagType tag_type_of<int_t> = TAG_INT;
template <> constexpr TagType tag_type_of<long_t> = TAG_LONG;
template <> constexpr TagType tag_type_of<float> = TAG_FLOAT;
template <> constexpr TagType tag_type_of<double> = TAG_DOUBLE;
template <> constexpr TagType tag_type_of<ByteArray> = TAG_BYTEARRAY;
template <> constexpr TagType tag_type_of<std::string> = TAG_STRING;
template <> constexpr TagType tag_type_of<List> = TAG_LIST;
template <> constexpr TagType tag_type_of<Compound> = TAG_COMPOUND;
template <> constexpr TagType tag_type_of<IntArray> = TAG_INTARRAY;
template <> constexpr TagType tag_type_of<LongArray> = TAG_LONGARRAY;

}

template <typename T> concept NbtType = internal::is_nbt_type<T>;

/// @brief One NBT value. A default-constructed tag is `TAG_END`.
/// @note Strings hold raw UTF-8 bytes. The game writes modified UTF-8, which differs for U+0000 and for characters
/// outside the BMP; such strings are carried byte for byte but are not transcoded.
class NBTTag {
public:
    // Alternative index == TagType.
    using DataType = std::variant<std::monostate, sbyte_t, short_t, int_t, long_t, float, double,
        ByteArray, std::string, List, Compound, IntArray, LongArray>;

    NBTTag() : value() {}
    template <NbtType T> NBTTag(T v) : value(std::move(v)) {}
    NBTTag(const char* str) : value(std::string(str)) {}

    TagType type() const { return static_cast<TagType>(this->value.index()); }

    template <NbtType T> bool is() const { return std::holds_alternative<T>(this->value); }

    /// @brief Gets the value of this tag.
    /// @exception Throws `type_mismatch` if the tag is not of kind `T`. No numeric widening is done, so `get<int_t>`
    /// on a `TAG_BYTE` throws.
    template <NbtType T> const T& get() const;
    template <NbtType T> T& get();

    /// @brief Compound element access.
    /// @exception Throws `type_mismatch` if this is not a compound and `no_such_entry` if the key is missing.
    const NBTTag& at(const std::string& name) const;
    NBTTag& at(const std::string& name);
    /// @brief List element access.
    const NBTTag& at(std::size_t index) const;
    bool contains(const std::string& name) const;

    /// @brief Number of elements of an array, list, compound or string; 0 for everything else.
    std::size_t size() const;

    bool operator==(const NBTTag& other) const;

    DataType value;
};

struct NamedTag {
    std::string name;
    NBTTag tag;

    bool operator==(const NamedTag& other) const {
        return this->name == other.name && this->tag == other.tag;
    }
};

template <NbtType T> const T& NBTTag::get() const {
    if (const T* ptr = std::get_if<T>(&this->value))
        return *ptr;
    throw nbt_error(errc::type_mismatch,
        "Tried to extract " + tag_type_name(internal::tag_type_of<T>) +
        " from " + tag_type_name(this->type()) + " tag");
}

template <NbtType T> T& NBTTag::get() {
    return const_cast<T&>(static_cast<const NBTTag*>(this)->get<T>());
}

inline const NBTTag& NBTTag::at(const std::string& name) const {
    return this->get<Compound>().at(name);
}
inline NBTTag& NBTTag::at(const std::string& name) {
    return this->get<Compound>().at(name);
}
inline const NBTTag& NBTTag::at(std::size_t index) const {
    return this->get<List>().at(index);
}
inline bool NBTTag::contains(const std::string& name) const {
    return this->get<Compound>().contains(name);
}

inline std::size_t NBTTag::size() const {
    switch (this->type()) {
        case TAG_BYTEARRAY: return std::get<ByteArray>(this->value).size();
        case TAG_STRING: return std::get<std::string>(this->value).size();
        case TAG_LIST: return std::get<List>(this->value).size();
        case TAG_COMPOUND: return std::get<Compound>(this->value).size();
        case TAG_INTARRAY: return std::get<IntArray>(this->value).size();
        case TAG_LONGARRAY: return std::get<LongArray>(this->value).size();
        default: return 0;
    }
}

inline bool NBTTag::operator==(const NBTTag& other) const {
    return this->value == other.value;
}

// List

inline List::List() : m_element_type(TAG_END) {}

inline List::List(TagType element_type) : m_element_type(element_type) {}

inline List::List(TagType element_type, std::vector<NBTTag> items) : m_element_type(element_type) {
    if (element_type == TAG_END && !items.empty())
        throw nbt_error(errc::type_mismatch, "A List of End must be empty");
    for (const NBTTag& tag : items) {
        if (tag.type() != element_type)
            throw nbt_error(errc::type_mismatch, "List of " + tag_type_name(element_type) +
                " cannot hold a " + tag_type_name(tag.type()) + " element");
    }
    m_items = std::move(items);
}

inline std::size_t List::size() const { return m_items.size(); }
inline bool List::empty() const { return m_items.empty(); }

inline const NBTTag& List::at(std::size_t index) const {
    if (index >= m_items.size())
        throw nbt_error(errc::no_such_entry, "List index " + std::to_string(index) +
            " out of range (size " + std::to_string(m_items.size()) + ")");
    return m_items[index];
}
inline const NBTTag& List::operator[](std::size_t index) const { return m_items[index]; }
inline List::const_iterator List::begin() const { return m_items.begin(); }
inline List::const_iterator List::end() const { return m_items.end(); }

inline void List::check(const NBTTag& tag) {
    if (tag.type() == TAG_END)
        throw nbt_error(errc::type_mismatch, "End tags cannot be List elements");
    if (tag.type() == m_element_type)
        return;
    // an untyped empty list takes the kind of its first element
    if (m_element_type == TAG_END && m_items.empty()) {
        m_element_type = tag.type();
        return;
    }
    throw nbt_error(errc::type_mismatch, "List of " + tag_type_name(m_element_type) +
        " cannot hold a " + tag_type_name(tag.type()) + " element");
}

inline void List::push_back(NBTTag tag) {
    this->check(tag);
    m_items.push_back(std::move(tag));
}

inline void List::set(std::size_t index, NBTTag tag) {
    if (index >= m_items.size())
        throw nbt_error(errc::no_such_entry, "List index " + std::to_string(index) + " out of range");
    this->check(tag);
    m_items[index] = std::move(tag);
}

inline void List::erase(std::size_t index) {
    if (index >= m_items.size())
        throw nbt_error(errc::no_such_entry, "List index " + std::to_string(index) + " out of range");
    m_items.erase(m_items.begin() + static_cast<std::ptrdiff_t>(index));
}

inline void List::clear() { m_items.clear(); }

inline bool List::operator==(const List& other) const {
    return m_element_type == other.m_element_type && m_items == other.m_items;
}

// Compound

inline Compound::Compound() {}

inline Compound::Compound(std::initializer_list<NamedTag> entries) {
    for (const NamedTag& entry : entries)
        this->set(entry.name, entry.tag);
}

inline std::size_t Compound::size() const { return m_entries.size(); }
inline bool Compound::empty() const { return m_entries.empty(); }

inline bool Compound::contains(const std::string& name) const {
    return this->find(name) != nullptr;
}

inline const NBTTag* Compound::find(const std::string& name) const {
    auto it = m_index.find(name);
    return it == m_index.end() ? nullptr : &m_entries[it->second].tag;
}

inline NBTTag* Compound::find(const std::string& name) {
    return const_cast<NBTTag*>(static_cast<const Compound*>(this)->find(name));
}

inline const NBTTag& Compound::at(const std::string& name) const {
    if (const NBTTag* tag = this->find(name))
        return *tag;
    throw nbt_error(errc::no_such_entry, "No entry named \"" + name + "\" in compound");
}

inline NBTTag& Compound::at(const std::string& name) {
    return const_cast<NBTTag&>(static_cast<const Compound*>(this)->at(name));
}

template <typename T> const T& Compound::get(const std::string& name) const {
    return this->at(name).template get<T>();
}

inline void Compound::set(const std::string& name, NBTTag tag) {
    if (tag.type() == TAG_END)
        throw nbt_error(errc::type_mismatch, "Compound entry \"" + name + "\" cannot be an End tag");
    if (NBTTag* existing = this->find(name)) {
        *existing = std::move(tag);
        return;
    }
    m_index.emplace(name, m_entries.size());
    m_entries.push_back(NamedTag{name, std::move(tag)});
}

inline bool Compound::erase(const std::string& name) {
    auto it = m_index.find(name);
    if (it == m_index.end())
        return false;
    std::size_t pos = it->second;
    m_index.erase(it);
    m_entries.erase(m_entries.begin() + static_cast<std::ptrdiff_t>(pos));
    this->reindex(pos);
    return true;
}

// later entries shift down by one after an erase
inline void Compound::reindex(std::size_t from) {
    for (std::size_t i = from; i < m_entries.size(); ++i)
        m_index[m_entries[i].name] = i;
}

inline void Compound::clear() {
    m_entries.clear();
    m_index.clear();
}

inline Compound::const_iterator Compound::begin() const { return m_entries.begin(); }
inline Compound::const_iterator Compound::end() const { return m_entries.end(); }

inline bool Compound::operator==(const Compound& other) const {
    if (m_entries.size() != other.m_entries.size())
        return false;
    return std::all_of(m_entries.begin(), m_entries.end(), [&other](const NamedTag& entry) {
        const NBTTag* match = other.find(entry.name);
        return match != nullptr && *match == entry.tag;
    });
}

}

#endif
