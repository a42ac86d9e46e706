#ifndef NBTCRAFT_ERROR_HPP
#define NBTCRAFT_ERROR_HPP

#include <stdexcept>
#include <string>

namespace nbtcraft {

/// @brief The kind of failure an `nbt_error` reports.
enum class errc {
    unexpected_eof,
    unknown_tag_kind,
    negative_length,
    depth_exceeded,
    type_mismatch,
    unsupported_compression,
    corrupt_region_file,
    corrupt_chunk_entry,
    compression_error,
    string_too_long,
    io_error,
    invalid_snbt,
    no_such_entry,
};

inline const char* errc_name(errc code) {
    switch (code) {
        case errc::unexpected_eof: return "UnexpectedEof";
        case errc::unknown_tag_kind: return "UnknownTagKind";
        case errc::negative_length: return "NegativeLength";
        case errc::depth_exceeded: return "DepthExceeded";
        case errc::type_mismatch: return "TypeMismatch";
        case errc::unsupported_compression: return "UnsupportedCompression";
        case errc::corrupt_region_file: return "CorruptRegionFile";
        case errc::corrupt_chunk_entry: return "CorruptChunkEntry";
        case errc::compression_error: return "CompressionError";
        case errc::string_too_long: return "StringTooLong";
        case errc::io_error: return "IoError";
        case errc::invalid_snbt: return "InvalidSnbt";
        case errc::no_such_entry: return "NoSuchEntry";
    }
    return "Unknown";
}

/// @brief The single exception type thrown by this library.
/// `what()` reads as `<KindName>: <message>`.
class nbt_error : public std::runtime_error {
public:
    nbt_error(errc code, const std::string& message)
        : std::runtime_error(std::string(errc_name(code)) + ": " + message), m_code(code) {}

    errc code() const noexcept { return m_code; }

private:
    errc m_code;
};

}

#endif
