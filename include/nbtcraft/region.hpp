#ifndef NBTCRAFT_REGION_HPP
#define NBTCRAFT_REGION_HPP

#include <array>
#include <charconv>
#include <cstddef>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "compression.hpp"
#include "core.hpp"
#include "error.hpp"
#include "io.hpp"
#include "log.hpp"
#include "tag.hpp"

namespace nbtcraft {

/// @brief A compression scheme used for individual chunks.
enum CompressionScheme : byte_t {
    GZIP = 1,
    ZLIB = 2,
    NOTHING = 3,
    LZ4 = 4,
    CUSTOM = 127,
};

constexpr int REGION_WIDTH = 32;
constexpr std::size_t SLOT_COUNT = REGION_WIDTH * REGION_WIDTH;
constexpr std::size_t SECTOR_SIZE = 4096;
constexpr std::size_t HEADER_SIZE = 2 * SECTOR_SIZE;
constexpr std::size_t MAX_SECTOR_COUNT = 255;
// Set on the compression byte when the payload lives in a c.<x>.<z>.mcc file beside the region.
constexpr byte_t EXTERNAL_CHUNK_FLAG = 0x80;

enum class RegionFormat {
    anvil,  // .mca
    legacy, // .mcr
};

struct RegionPos {
    int x;
    int z;
    RegionFormat format;

    bool operator==(const RegionPos& other) const = default;
};

/// @brief Parses a region filename of the form `r.<x>.<z>.mca` or `r.<x>.<z>.mcr`.
/// Leading directories are ignored.
/// @return The region coordinates, or `std::nullopt` if the name does not match.
inline std::optional<RegionPos> parse_region_filename(const std::string& name) {
    static const std::regex pattern(R"(r\.(-?\d+)\.(-?\d+)\.(mca|mcr))");
    std::string filename = std::filesystem::path(name).filename().string();
    std::smatch m;
    if (!std::regex_match(filename, m, pattern))
        return std::nullopt;

    auto parse_int = [](const std::string& text, int& out) {
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
        return ec == std::errc() && ptr == text.data() + text.size();
    };
    RegionPos pos;
    if (!parse_int(m[1].str(), pos.x) || !parse_int(m[2].str(), pos.z))
        return std::nullopt;
    pos.format = m[3].str() == "mca" ? RegionFormat::anvil : RegionFormat::legacy;
    return pos;
}

/// @brief Maps a global chunk coordinate to its coordinate inside the region (always 0..31).
constexpr int local_coord(int coord) {
    return ((coord % REGION_WIDTH) + REGION_WIDTH) % REGION_WIDTH;
}

constexpr std::size_t slot_index(int local_x, int local_z) {
    return static_cast<std::size_t>(local_z) * REGION_WIDTH + static_cast<std::size_t>(local_x);
}

/// @brief One entry of the region header.
struct RegionSlot {
    uint_t sector_offset = 0;
    byte_t sector_count = 0;
    uint_t timestamp = 0;

    bool empty() const { return sector_offset == 0 && sector_count == 0; }
};

/// @brief One decoded chunk and where it sits in its region.
class Chunk {
public:
    Chunk(int local_x, int local_z, Compound nbt, std::optional<RegionPos> region = std::nullopt)
        : m_local_x(local_x), m_local_z(local_z), m_nbt(std::move(nbt)), m_region(region) {}

    int local_x() const { return m_local_x; }
    int local_z() const { return m_local_z; }

    /// @return Global chunk coordinates, known only when the region's own coordinates are.
    std::optional<std::pair<int, int>> global_pos() const {
        if (!m_region)
            return std::nullopt;
        return std::make_pair(m_region->x * REGION_WIDTH + m_local_x, m_region->z * REGION_WIDTH + m_local_z);
    }

    const Compound& nbt() const { return m_nbt; }

private:
    int m_local_x;
    int m_local_z;
    Compound m_nbt;
    std::optional<RegionPos> m_region;
};

namespace internal {

// pad the stream to the nearest 4096-byte sector end
inline void pad(std::ostream& stream) {
    std::size_t pos = stream.tellp();
    // offset from beginning of sector
    std::size_t offset = pos & (SECTOR_SIZE - 1);
    if (offset == 0) return;
    for (std::size_t bytes_left = SECTOR_SIZE - offset; bytes_left > 0; --bytes_left)
        stream.put(0);
}

inline uint_t be32(const byte_t* bytes) {
    return (uint_t)bytes[0] << 24 | (uint_t)bytes[1] << 16 | (uint_t)bytes[2] << 8 | (uint_t)bytes[3];
}

inline std::string external_chunk_name(int global_x, int global_z) {
    return "c." + std::to_string(global_x) + "." + std::to_string(global_z) + ".mcc";
}

inline std::vector<byte_t> read_whole_file(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input)
        throw nbt_error(errc::io_error, "Cannot open " + path.string());
    return std::vector<byte_t>{std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};
}

}

/// @brief A region file whose header has been read. Chunk payloads are read and decoded only on request.
/// Not copyable; owns its file handle.
class RegionFile {
public:
    class ChunkIterator;
    class ChunkRange;

    /// @brief Opens a region file and reads its two header blocks.
    /// @exception Throws `io_error` if the file cannot be opened and `corrupt_region_file` if it is shorter than the
    /// 8192-byte header.
    static RegionFile from_file(const std::string& path);

    RegionFile(RegionFile&&) = default;
    RegionFile& operator=(RegionFile&&) = default;

    /// @brief Reads and decodes the chunk at global chunk coordinates (x, z).
    /// Only `x mod 32` and `z mod 32` are used.
    /// @return The chunk, or `std::nullopt` if the slot is empty.
    /// @exception Throws `corrupt_chunk_entry` for a slot the header marks inconsistent,
    /// `unsupported_compression` for an unknown compression byte, and any decode error from the payload.
    std::optional<Chunk> get_chunk(int x, int z);

    /// @brief A restartable, lazy sequence over every non-empty slot in slot order (z-major, then x).
    /// Each dereference decodes one chunk.
    ChunkRange iter_nonempty();

    const RegionSlot& slot(int x, int z) const { return m_slots[slot_index(local_coord(x), local_coord(z))]; }
    const RegionSlot& slot_at(std::size_t index) const { return m_slots[index]; }
    std::size_t chunk_count() const;

    const std::string& path() const { return m_path; }
    const std::optional<RegionPos>& position() const { return m_position; }

private:
    RegionFile(std::string path, std::ifstream file, std::uintmax_t file_size);

    Chunk load_slot(std::size_t index);
    std::vector<byte_t> read_payload(std::size_t index, int local_x, int local_z);

    std::string m_path;
    std::optional<RegionPos> m_position;
    std::ifstream m_file;
    std::uintmax_t m_file_size;
    std::array<RegionSlot, SLOT_COUNT> m_slots;
};

/// @brief Input iterator over the non-empty slots of a region. Holds only a slot index.
class RegionFile::ChunkIterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Chunk;
    using difference_type = std::ptrdiff_t;
    using pointer = const Chunk*;
    using reference = const Chunk&;

    ChunkIterator() : m_region(nullptr), m_index(SLOT_COUNT) {}
    ChunkIterator(RegionFile* region, std::size_t index) : m_region(region), m_index(index) {
        this->skip_empty();
    }

    /// @exception Rethrows whatever decoding the current slot throws. The iterator stays usable and can be advanced
    /// past the failing slot.
    reference operator*() const {
        if (!m_current)
            m_current = m_region->load_slot(m_index);
        return *m_current;
    }
    pointer operator->() const { return &**this; }

    ChunkIterator& operator++() {
        m_current.reset();
        ++m_index;
        this->skip_empty();
        return *this;
    }
    void operator++(int) { ++*this; }

    std::size_t slot_index() const { return m_index; }

    bool operator==(const ChunkIterator& other) const { return m_index == other.m_index; }

private:
    void skip_empty() {
        while (m_index < SLOT_COUNT && m_region->m_slots[m_index].empty())
            ++m_index;
    }

    RegionFile* m_region;
    std::size_t m_index;
    mutable std::optional<Chunk> m_current;
};

class RegionFile::ChunkRange {
public:
    explicit ChunkRange(RegionFile* region) : m_region(region) {}

    ChunkIterator begin() const { return ChunkIterator(m_region, 0); }
    ChunkIterator end() const { return ChunkIterator(); }

private:
    RegionFile* m_region;
};

inline RegionFile::RegionFile(std::string path, std::ifstream file, std::uintmax_t file_size)
    : m_path(std::move(path)), m_position(parse_region_filename(m_path)), m_file(std::move(file)),
      m_file_size(file_size), m_slots() {}

inline RegionFile RegionFile::from_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file)
        throw nbt_error(errc::io_error, "Cannot open region file " + path);

    std::error_code ec;
    std::uintmax_t size = std::filesystem::file_size(path, ec);
    if (ec)
        throw nbt_error(errc::io_error, "Cannot stat region file " + path + ": " + ec.message());
    if (size < HEADER_SIZE)
        throw nbt_error(errc::corrupt_region_file, "Region file " + path + " is " + std::to_string(size) +
            " bytes, shorter than its " + std::to_string(HEADER_SIZE) + "-byte header");

    std::array<byte_t, HEADER_SIZE> header;
    internal::read_exact(file, reinterpret_cast<char*>(header.data()), HEADER_SIZE, "region header");

    RegionFile region(path, std::move(file), size);
    for (std::size_t i = 0; i < SLOT_COUNT; ++i) {
        uint_t location = internal::be32(header.data() + i * 4);
        region.m_slots[i].sector_offset = location >> 8;
        region.m_slots[i].sector_count = static_cast<byte_t>(location & 0xff);
        // not a batch read for endianness reasons
        region.m_slots[i].timestamp = internal::be32(header.data() + SECTOR_SIZE + i * 4);
    }
    NBTCRAFT_LOG_DEBUG("Loaded region {} ({} bytes, {} chunks)", path, size, region.chunk_count());
    return region;
}

inline std::size_t RegionFile::chunk_count() const {
    std::size_t count = 0;
    for (const RegionSlot& entry : m_slots)
        if (!entry.empty())
            ++count;
    return count;
}

inline RegionFile::ChunkRange RegionFile::iter_nonempty() {
    return ChunkRange(this);
}

inline std::optional<Chunk> RegionFile::get_chunk(int x, int z) {
    std::size_t index = slot_index(local_coord(x), local_coord(z));
    if (m_slots[index].empty()) {
        NBTCRAFT_LOG_TRACE("Chunk ({}, {}) of {} is absent", local_coord(x), local_coord(z), m_path);
        return std::nullopt;
    }
    return this->load_slot(index);
}

inline std::vector<byte_t> RegionFile::read_payload(std::size_t index, int local_x, int local_z) {
    const RegionSlot& entry = m_slots[index];
    auto corrupt = [&](const std::string& why) {
        NBTCRAFT_LOG_WARN("Corrupt chunk entry ({}, {}) in {}: {}", local_x, local_z, m_path, why);
        return nbt_error(errc::corrupt_chunk_entry,
            "Chunk (" + std::to_string(local_x) + ", " + std::to_string(local_z) + ") in " + m_path + ": " + why);
    };

    if (entry.sector_offset == 0 || entry.sector_count == 0)
        throw corrupt("sector offset " + std::to_string(entry.sector_offset) + " with sector count " +
            std::to_string(entry.sector_count));
    if (entry.sector_offset < HEADER_SIZE / SECTOR_SIZE)
        throw corrupt("sector offset " + std::to_string(entry.sector_offset) + " points into the header");

    std::uintmax_t start = static_cast<std::uintmax_t>(entry.sector_offset) * SECTOR_SIZE;
    if (start + 5 > m_file_size)
        throw corrupt("sector offset " + std::to_string(entry.sector_offset) + " is past the end of the file");

    m_file.clear();
    m_file.seekg(static_cast<std::streamoff>(start));
    uint_t byte_length = internal::read<uint_t>(m_file, "chunk length");
    if (byte_length == 0)
        throw corrupt("zero payload length");
    if (static_cast<std::uintmax_t>(byte_length) + 4 > static_cast<std::uintmax_t>(entry.sector_count) * SECTOR_SIZE)
        throw corrupt("payload length " + std::to_string(byte_length) + " does not fit in " +
            std::to_string(entry.sector_count) + " sectors");
    if (start + 4 + byte_length > m_file_size)
        throw corrupt("payload length " + std::to_string(byte_length) + " runs past the end of the file");

    byte_t compression = internal::read<byte_t>(m_file, "chunk compression");
    bool external = (compression & EXTERNAL_CHUNK_FLAG) != 0;
    byte_t scheme = static_cast<byte_t>(compression & ~EXTERNAL_CHUNK_FLAG);
    if (scheme != GZIP && scheme != ZLIB && scheme != NOTHING)
        throw nbt_error(errc::unsupported_compression, "Unsupported compression type with ordinal " +
            std::to_string(scheme) + " for chunk (" + std::to_string(local_x) + ", " + std::to_string(local_z) + ")");

    std::vector<byte_t> data;
    if (external) {
        if (!m_position)
            throw corrupt("payload is stored externally but the region coordinates are unknown");
        std::filesystem::path external_path = std::filesystem::path(m_path).parent_path() /
            internal::external_chunk_name(m_position->x * REGION_WIDTH + local_x, m_position->z * REGION_WIDTH + local_z);
        NBTCRAFT_LOG_DEBUG("Reading external chunk payload {}", external_path.string());
        try {
            data = internal::read_whole_file(external_path);
        } catch (const nbt_error& e) {
            throw corrupt(e.what());
        }
    } else {
        data.resize(byte_length - 1);
        if (!data.empty())
            internal::read_exact(m_file, reinterpret_cast<char*>(data.data()), data.size(), "chunk payload");
    }

    NBTCRAFT_LOG_TRACE("Chunk ({}, {}) at sector {}: {} bytes, compression {}", local_x, local_z,
        entry.sector_offset, data.size(), scheme);
    if (scheme == NOTHING)
        return data;
    try {
        return scheme == GZIP ? gzip_decompress(data) : zlib_decompress(data);
    } catch (const nbt_error& e) {
        throw corrupt(e.what());
    }
}

inline Chunk RegionFile::load_slot(std::size_t index) {
    int local_x = static_cast<int>(index % REGION_WIDTH);
    int local_z = static_cast<int>(index / REGION_WIDTH);
    NamedTag root = from_nbt(this->read_payload(index, local_x, local_z));
    if (root.tag.type() != TAG_COMPOUND)
        throw nbt_error(errc::corrupt_chunk_entry, "Chunk (" + std::to_string(local_x) + ", " +
            std::to_string(local_z) + ") root is a " + tag_type_name(root.tag.type()) + ", not a Compound");
    return Chunk(local_x, local_z, std::move(root.tag.get<Compound>()), m_position);
}

/// @brief Writes individual chunk NBT tags to a region file.
/// @param path The path to the region file. Overwrites it if it exists, and creates it if it does not.
/// @param chunks The chunk compounds in slot order, so that `x + z * 32` indexes the chunk at local `(x, z)`.
/// Empty optionals leave their slot empty.
/// @param chunk_compression The compression format to use for chunks. Defaults to `ZLIB` (which is also the game's
/// default). `LZ4` and `CUSTOM` are not supported.
/// @param timestamp The modification time stored for every written chunk. Defaults to now.
/// @note A chunk needing more than 255 sectors is written to `c.<x>.<z>.mcc` beside the region, which requires a
/// path of the form `r.<x>.<z>.mca`.
inline void write_region_file(const std::string& path, const std::array<std::optional<Compound>, SLOT_COUNT>& chunks,
    CompressionScheme chunk_compression = ZLIB, std::optional<uint_t> timestamp = std::nullopt) {
    if (chunk_compression != GZIP && chunk_compression != ZLIB && chunk_compression != NOTHING)
        throw nbt_error(errc::unsupported_compression,
            "Unsupported compression type with ordinal " + std::to_string(chunk_compression));

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file)
        throw nbt_error(errc::io_error, "Cannot create region file " + path);

    std::optional<RegionPos> position = parse_region_filename(path);
    uint_t now = timestamp ? *timestamp : static_cast<uint_t>(std::time(nullptr));

    // reserve the header, filled in at the end
    std::array<uint_t, SLOT_COUNT> locations{};
    std::array<uint_t, SLOT_COUNT> timestamps{};
    const std::array<char, HEADER_SIZE> zeros{};
    file.write(zeros.data(), zeros.size());

    for (std::size_t i = 0; i < SLOT_COUNT; ++i) {
        if (!chunks[i])
            continue;
        int local_x = static_cast<int>(i % REGION_WIDTH);
        int local_z = static_cast<int>(i / REGION_WIDTH);

        std::vector<byte_t> bytes = to_nbt(NamedTag{"", *chunks[i]});
        std::vector<byte_t> payload;
        switch (chunk_compression) {
            case GZIP: payload = gzip_compress(bytes); break;
            case ZLIB: payload = zlib_compress(bytes); break;
            default: payload = std::move(bytes); break;
        }

        byte_t compression = chunk_compression;
        if (5 + payload.size() > MAX_SECTOR_COUNT * SECTOR_SIZE) {
            if (!position)
                throw nbt_error(errc::corrupt_chunk_entry, "Chunk (" + std::to_string(local_x) + ", " +
                    std::to_string(local_z) + ") needs an external file, but " + path + " is not named r.<x>.<z>.mca");
            std::filesystem::path external_path = std::filesystem::path(path).parent_path() /
                internal::external_chunk_name(position->x * REGION_WIDTH + local_x, position->z * REGION_WIDTH + local_z);
            std::ofstream external(external_path, std::ios::binary | std::ios::trunc);
            external.write(reinterpret_cast<const char*>(payload.data()), static_cast<std::streamsize>(payload.size()));
            external.flush();
            if (!external)
                throw nbt_error(errc::io_error, "Cannot write " + external_path.string());
            NBTCRAFT_LOG_DEBUG("Chunk ({}, {}) is {} bytes, stored in {}", local_x, local_z, payload.size(),
                external_path.string());
            payload.clear();
            compression |= EXTERNAL_CHUNK_FLAG;
        }

        std::size_t pos = file.tellp();
        internal::writei(file, static_cast<int_t>(payload.size() + 1));
        internal::writeb(file, compression);
        file.write(reinterpret_cast<const char*>(payload.data()), static_cast<std::streamsize>(payload.size()));
        internal::pad(file);

        std::size_t new_pos = file.tellp();
        locations[i] = static_cast<uint_t>((pos / SECTOR_SIZE) << 8) | static_cast<uint_t>((new_pos - pos) / SECTOR_SIZE);
        timestamps[i] = now;
    }

    file.seekp(0);
    for (uint_t location : locations)
        internal::write<uint_t>(file, location);
    for (uint_t time : timestamps)
        internal::write<uint_t>(file, time);
    file.flush();
    internal::check_sink(file);
    NBTCRAFT_LOG_DEBUG("Wrote region {}", path);
}

}

#endif
