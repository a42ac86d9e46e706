#ifndef NBTCRAFT_CORE_HPP
#define NBTCRAFT_CORE_HPP

#include <algorithm>
#include <cstddef>
#include <istream>
#include <limits>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

#include "error.hpp"
#include "io.hpp"
#include "log.hpp"
#include "tag.hpp"

namespace nbtcraft {

struct decode_options {
    /// Maximum nesting of lists and compounds below the root.
    std::size_t max_depth = 512;
};

namespace internal {

// Array counts are trusted only as far as the bytes actually present.
constexpr std::size_t ARRAY_READ_BLOCK = 1 << 16;

inline int_t read_count(std::istream& bytes, const char* what) {
    int_t length = read<int_t>(bytes, what);
    if (length < 0)
        throw nbt_error(errc::negative_length, std::string(what) + " is negative (" + std::to_string(length) + ")");
    return length;
}

inline TagType read_tag_type(std::istream& bytes, const char* what) {
    byte_t id = read<byte_t>(bytes, what);
    if (!is_valid_tag_type(id))
        throw nbt_error(errc::unknown_tag_kind, "Found illegal tag type " + std::to_string(id));
    return static_cast<TagType>(id);
}

template <typename T> std::vector<T> read_array(std::istream& bytes, const char* what) {
    int_t length = read_count(bytes, what);
    std::vector<T> out_values;
    out_values.reserve(std::min<std::size_t>(length, ARRAY_READ_BLOCK));
    if constexpr (sizeof(T) == 1) {
        std::size_t remaining = length;
        while (remaining > 0) {
            std::size_t block = std::min(remaining, ARRAY_READ_BLOCK);
            std::size_t offset = out_values.size();
            out_values.resize(offset + block);
            read_exact(bytes, reinterpret_cast<char*>(out_values.data() + offset), block, what);
            remaining -= block;
        }
    } else {
        for (int_t i = 0; i < length; ++i)
            out_values.push_back(read<T>(bytes, what));
    }
    return out_values;
}

inline NBTTag read_payload(std::istream& bytes, TagType type, std::size_t depth, const decode_options& options);

inline void enter(std::size_t depth, const decode_options& options) {
    if (depth > options.max_depth)
        throw nbt_error(errc::depth_exceeded, "Nesting exceeds the limit of " + std::to_string(options.max_depth));
}

inline List read_list(std::istream& bytes, std::size_t depth, const decode_options& options) {
    TagType type = read_tag_type(bytes, "list element type");
    int_t length = read_count(bytes, "list length");
    if (type == TAG_END && length > 0)
        throw nbt_error(errc::unknown_tag_kind, "List of End tags with " + std::to_string(length) + " elements");
    std::vector<NBTTag> out_values;
    out_values.reserve(std::min<std::size_t>(length, ARRAY_READ_BLOCK));
    for (int_t i = 0; i < length; ++i)
        out_values.push_back(read_payload(bytes, type, depth + 1, options));
    return List(type, std::move(out_values));
}

inline Compound read_compound(std::istream& bytes, std::size_t depth, const decode_options& options) {
    Compound out_values;
    TagType next_type = read_tag_type(bytes, "compound entry type");
    while (next_type != TAG_END) {
        std::string name = read_string(bytes);
        out_values.set(name, read_payload(bytes, next_type, depth + 1, options));
        next_type = read_tag_type(bytes, "compound entry type");
    }
    return out_values;
}

inline NBTTag read_payload(std::istream& bytes, TagType type, std::size_t depth, const decode_options& options) {
    switch (type) {
        case TAG_BYTE: return read<sbyte_t>(bytes, "byte");
        case TAG_SHORT: return read<short_t>(bytes, "short");
        case TAG_INT: return read<int_t>(bytes, "int");
        case TAG_LONG: return read<long_t>(bytes, "long");
        case TAG_FLOAT: return read<float>(bytes, "float");
        case TAG_DOUBLE: return read<double>(bytes, "double");
        case TAG_STRING: return read_string(bytes);
        case TAG_BYTEARRAY: return read_array<sbyte_t>(bytes, "byte array length");
        case TAG_INTARRAY: return read_array<int_t>(bytes, "int array length");
        case TAG_LONGARRAY: return read_array<long_t>(bytes, "long array length");
        case TAG_LIST:
            enter(depth, options);
            return read_list(bytes, depth, options);
        case TAG_COMPOUND:
            enter(depth, options);
            return read_compound(bytes, depth, options);
        case TAG_END:
            break;
    }
    throw nbt_error(errc::unknown_tag_kind, "Tag type " + tag_type_name(type) + " has no payload here");
}

inline int_t checked_count(std::size_t size) {
    if (size > static_cast<std::size_t>(std::numeric_limits<int_t>::max()))
        throw nbt_error(errc::string_too_long, "Value too long: " + std::to_string(size) + " elements");
    return static_cast<int_t>(size);
}

template <typename T> void write_array(std::ostream& stream, const std::vector<T>& values) {
    writei(stream, checked_count(values.size()));
    if constexpr (sizeof(T) == 1) {
        stream.write(reinterpret_cast<const char*>(values.data()), static_cast<std::streamsize>(values.size()));
    } else {
        for (T val : values)
            write<T>(stream, val);
    }
}

inline void write_payload(std::ostream& stream, const NBTTag& tag) {
    switch (tag.type()) {
        case TAG_BYTE: writeb(stream, static_cast<byte_t>(std::get<sbyte_t>(tag.value))); break;
        case TAG_SHORT: writes(stream, std::get<short_t>(tag.value)); break;
        case TAG_INT: writei(stream, std::get<int_t>(tag.value)); break;
        case TAG_LONG: writel(stream, std::get<long_t>(tag.value)); break;
        case TAG_FLOAT: writef(stream, std::get<float>(tag.value)); break;
        case TAG_DOUBLE: writed(stream, std::get<double>(tag.value)); break;
        case TAG_STRING: writestr(stream, std::get<std::string>(tag.value)); break;
        case TAG_BYTEARRAY: write_array(stream, std::get<ByteArray>(tag.value)); break;
        case TAG_INTARRAY: write_array(stream, std::get<IntArray>(tag.value)); break;
        case TAG_LONGARRAY: write_array(stream, std::get<LongArray>(tag.value)); break;
        case TAG_LIST: {
            const List& real_value = std::get<List>(tag.value);
            writeb(stream, real_value.element_type());
            writei(stream, checked_count(real_value.size()));
            for (const NBTTag& element : real_value)
                write_payload(stream, element);
            break;
        }
        case TAG_COMPOUND: {
            for (const NamedTag& entry : std::get<Compound>(tag.value)) {
                if (entry.tag.type() == TAG_END)
                    throw nbt_error(errc::type_mismatch, "Compound entry \"" + entry.name + "\" is an End tag");
                writeb(stream, entry.tag.type());
                writestr(stream, entry.name);
                write_payload(stream, entry.tag);
            }
            writeb(stream, TAG_END);
            break;
        }
        case TAG_END:
            throw nbt_error(errc::type_mismatch, "End tags have no payload to write");
    }
}

}

/// @brief Decodes one named root tag from `bytes`, leaving the stream just past it.
/// @exception Throws `nbt_error` with `unexpected_eof`, `unknown_tag_kind`, `negative_length` or `depth_exceeded`.
inline NamedTag from_nbt(std::istream& bytes, const decode_options& options = {}) {
    TagType type = internal::read_tag_type(bytes, "root tag type");
    if (type == TAG_END)
        throw nbt_error(errc::unknown_tag_kind, "Root tag cannot be End");
    NamedTag ret;
    ret.name = internal::read_string(bytes);
    ret.tag = internal::read_payload(bytes, type, 0, options);
    NBTCRAFT_LOG_TRACE("Decoded root {} \"{}\"", tag_type_name(type), ret.name);
    return ret;
}

inline NamedTag from_nbt(const byte_t* data, std::size_t size, const decode_options& options = {}) {
    internal::byte_view_buf buf(data, size);
    std::istream stream(&buf);
    return from_nbt(stream, options);
}

inline NamedTag from_nbt(const std::vector<byte_t>& bytes, const decode_options& options = {}) {
    return from_nbt(bytes.data(), bytes.size(), options);
}

/// @brief Decodes a bare payload of kind `type`, with no kind byte or name in front of it.
inline NBTTag payload_from_nbt(std::istream& bytes, TagType type, const decode_options& options = {}) {
    return internal::read_payload(bytes, type, 0, options);
}

/// @brief Encodes `root` as a named root tag.
/// @exception Throws `string_too_long` for unencodable lengths, `type_mismatch` for misplaced End tags and
/// `io_error` if the stream fails.
inline void to_nbt(std::ostream& stream, const NamedTag& root) {
    if (root.tag.type() == TAG_END)
        throw nbt_error(errc::type_mismatch, "Root tag cannot be End");
    internal::writeb(stream, root.tag.type());
    internal::writestr(stream, root.name);
    internal::write_payload(stream, root.tag);
    internal::check_sink(stream);
}

inline void to_nbt(std::ostream& stream, const std::string& name, const NBTTag& tag) {
    to_nbt(stream, NamedTag{name, tag});
}

inline std::vector<byte_t> to_nbt(const NamedTag& root) {
    std::ostringstream stream(std::ios::binary);
    to_nbt(stream, root);
    const std::string& str = stream.str();
    return std::vector<byte_t>(str.begin(), str.end());
}

}

#endif
