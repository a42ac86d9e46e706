#ifndef NBTCRAFT_COMPRESSION_HPP
#define NBTCRAFT_COMPRESSION_HPP

#include <fstream>
#include <ios>
#include <istream>
#include <iterator>
#include <ostream>
#include <string>
#include <vector>

#include <boost/iostreams/copy.hpp>
#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filter/zlib.hpp>
#include <boost/iostreams/filtering_streambuf.hpp>

#include "core.hpp"
#include "error.hpp"
#include "log.hpp"

namespace nbtcraft {

namespace internal {

template <typename Decompressor>
std::vector<byte_t> inflate(const byte_t* data, std::size_t size, const char* scheme) {
    std::string out;
    boost::iostreams::filtering_istreambuf buf;
    buf.push(Decompressor());
    buf.push(boost::iostreams::array_source(reinterpret_cast<const char*>(data), size));
    try {
        boost::iostreams::copy(buf, boost::iostreams::back_inserter(out));
    } catch (const boost::iostreams::gzip_error& e) {
        throw nbt_error(errc::compression_error, std::string("Invalid ") + scheme + " data: " + e.what());
    } catch (const boost::iostreams::zlib_error& e) {
        throw nbt_error(errc::compression_error, std::string("Invalid ") + scheme + " data: " + e.what());
    } catch (const std::ios_base::failure& e) {
        throw nbt_error(errc::compression_error, std::string("Failed to inflate ") + scheme + " data: " + e.what());
    }
    return std::vector<byte_t>(out.begin(), out.end());
}

template <typename Compressor>
std::vector<byte_t> deflate(const byte_t* data, std::size_t size) {
    std::string out;
    // compress on the read side, so the trailer is emitted when the source runs dry
    boost::iostreams::filtering_istreambuf buf;
    buf.push(Compressor());
    buf.push(boost::iostreams::array_source(reinterpret_cast<const char*>(data), size));
    boost::iostreams::copy(buf, boost::iostreams::back_inserter(out));
    return std::vector<byte_t>(out.begin(), out.end());
}

}

constexpr byte_t GZIP_MAGIC[2] = {0x1f, 0x8b};

inline bool is_gzip(const byte_t* data, std::size_t size) {
    return size >= 2 && data[0] == GZIP_MAGIC[0] && data[1] == GZIP_MAGIC[1];
}

/// @exception Throws `compression_error` if `data` is not a valid gzip stream.
inline std::vector<byte_t> gzip_decompress(const byte_t* data, std::size_t size) {
    return internal::inflate<boost::iostreams::gzip_decompressor>(data, size, "gzip");
}
inline std::vector<byte_t> gzip_decompress(const std::vector<byte_t>& data) {
    return gzip_decompress(data.data(), data.size());
}

/// @exception Throws `compression_error` if `data` is not a valid zlib stream.
inline std::vector<byte_t> zlib_decompress(const byte_t* data, std::size_t size) {
    return internal::inflate<boost::iostreams::zlib_decompressor>(data, size, "zlib");
}
inline std::vector<byte_t> zlib_decompress(const std::vector<byte_t>& data) {
    return zlib_decompress(data.data(), data.size());
}

inline std::vector<byte_t> gzip_compress(const std::vector<byte_t>& data) {
    return internal::deflate<boost::iostreams::gzip_compressor>(data.data(), data.size());
}

inline std::vector<byte_t> zlib_compress(const std::vector<byte_t>& data) {
    return internal::deflate<boost::iostreams::zlib_compressor>(data.data(), data.size());
}

/// @brief Reads a standalone NBT file from `stream`, inflating it first if it starts with the gzip magic.
/// @return The root tag and its name.
inline NamedTag read_nbt_file(std::istream& stream, const decode_options& options = {}) {
    std::vector<byte_t> raw{std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>()};
    if (is_gzip(raw.data(), raw.size())) {
        NBTCRAFT_LOG_DEBUG("Inflating {} bytes of gzip-framed NBT", raw.size());
        return from_nbt(gzip_decompress(raw), options);
    }
    NBTCRAFT_LOG_DEBUG("Reading {} bytes of uncompressed NBT", raw.size());
    return from_nbt(raw, options);
}

/// @brief Reads a standalone NBT file (such as `level.dat`), gzip-framed or raw.
/// @exception Throws `io_error` if the file cannot be opened.
inline NamedTag read_nbt_file(const std::string& path, const decode_options& options = {}) {
    std::ifstream input(path, std::ios::binary);
    if (!input)
        throw nbt_error(errc::io_error, "Cannot open " + path);
    NBTCRAFT_LOG_DEBUG("Reading NBT file {}", path);
    return read_nbt_file(input, options);
}

/// @brief Writes `root` to `stream` as gzip-framed NBT.
inline void write_nbt_file(std::ostream& stream, const NamedTag& root) {
    std::vector<byte_t> compressed = gzip_compress(to_nbt(root));
    stream.write(reinterpret_cast<const char*>(compressed.data()), static_cast<std::streamsize>(compressed.size()));
    internal::check_sink(stream);
}

/// @brief Writes `root` to `path` as gzip-framed NBT, overwriting it if it exists.
/// @exception Throws `io_error` if the file cannot be created.
inline void write_nbt_file(const std::string& path, const NamedTag& root) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output)
        throw nbt_error(errc::io_error, "Cannot create " + path);
    write_nbt_file(output, root);
    output.flush();
    internal::check_sink(output);
}

}

#endif
