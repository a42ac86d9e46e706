#ifndef NBTCRAFT_IO_HPP
#define NBTCRAFT_IO_HPP

#include <bit>
#include <cstring>
#include <istream>
#include <ostream>
#include <string>
#include <type_traits>
#include <vector>

#include "tag.hpp"

namespace nbtcraft::internal {

inline bool is_little_endian() {
    return std::endian::native == std::endian::little;
}

inline uint16_t bswap(uint16_t v) { return __builtin_bswap16(v); }
inline uint32_t bswap(uint32_t v) { return __builtin_bswap32(v); }
inline uint64_t bswap(uint64_t v) { return __builtin_bswap64(v); }

/// @brief Reads exactly `count` bytes.
/// @exception Throws `unexpected_eof` if the stream runs dry first.
inline void read_exact(std::istream& bytes, char* dest, std::size_t count, const char* what) {
    bytes.read(dest, static_cast<std::streamsize>(count));
    if (static_cast<std::size_t>(bytes.gcount()) != count)
        throw nbt_error(errc::unexpected_eof, std::string("Stream ended while reading ") + what);
}

/// @brief Reads one big-endian value of an integral or IEEE-754 type.
template <typename T> T read(std::istream& bytes, const char* what) {
    static_assert(sizeof(T) == 1 || sizeof(T) == 2 || sizeof(T) == 4 || sizeof(T) == 8);
    if constexpr (sizeof(T) == 1) {
        char c;
        read_exact(bytes, &c, 1, what);
        return static_cast<T>(c);
    } else {
        using U = std::conditional_t<sizeof(T) == 2, uint16_t, std::conditional_t<sizeof(T) == 4, uint32_t, uint64_t>>;
        U raw;
        read_exact(bytes, reinterpret_cast<char*>(&raw), sizeof(U), what);
        if (is_little_endian())
            raw = bswap(raw);
        return std::bit_cast<T>(raw);
    }
}

inline void check_sink(std::ostream& bytes) {
    if (!bytes)
        throw nbt_error(errc::io_error, "Output stream failed");
}

/// @brief Writes one value big-endian.
template <typename T> void write(std::ostream& bytes, T num) {
    static_assert(sizeof(T) == 1 || sizeof(T) == 2 || sizeof(T) == 4 || sizeof(T) == 8);
    if constexpr (sizeof(T) == 1) {
        char c = static_cast<char>(num);
        bytes.write(&c, 1);
    } else {
        using U = std::conditional_t<sizeof(T) == 2, uint16_t, std::conditional_t<sizeof(T) == 4, uint32_t, uint64_t>>;
        U raw = std::bit_cast<U>(num);
        if (is_little_endian())
            raw = bswap(raw);
        bytes.write(reinterpret_cast<const char*>(&raw), sizeof(U));
    }
}

// write byte
inline void writeb(std::ostream& bytes, byte_t num) { write<byte_t>(bytes, num); }
// write short
inline void writes(std::ostream& bytes, short_t num) { write<short_t>(bytes, num); }
// write int
inline void writei(std::ostream& bytes, int_t num) { write<int_t>(bytes, num); }
// write long
inline void writel(std::ostream& bytes, long_t num) { write<long_t>(bytes, num); }
// write float
inline void writef(std::ostream& bytes, float num) { write<float>(bytes, num); }
// write double
inline void writed(std::ostream& bytes, double num) { write<double>(bytes, num); }

/// @brief Writes a u16 length prefix followed by the raw bytes.
/// @exception Throws `string_too_long` if `string` is longer than 65535 bytes.
inline void writestr(std::ostream& bytes, const std::string& string) {
    if (string.size() > 0xffff)
        throw nbt_error(errc::string_too_long, "String of " + std::to_string(string.size()) +
            " bytes exceeds the 65535-byte limit");
    write<ushort_t>(bytes, static_cast<ushort_t>(string.size()));
    bytes.write(string.data(), static_cast<std::streamsize>(string.size()));
}

inline std::string read_string(std::istream& bytes) {
    ushort_t len = read<ushort_t>(bytes, "string length");
    std::string ret(len, '\0');
    if (len > 0)
        read_exact(bytes, ret.data(), len, "string");
    return ret;
}

/// @brief An `std::streambuf` reading from a borrowed byte range without copying it.
class byte_view_buf : public std::streambuf {
public:
    byte_view_buf(const byte_t* data, std::size_t size) {
        char* begin = const_cast<char*>(reinterpret_cast<const char*>(data));
        this->setg(begin, begin, begin + size);
    }
};

}

#endif
