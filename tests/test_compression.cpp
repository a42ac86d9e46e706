/**
 * @file test_compression.cpp
 * @brief Unit tests for gzip/zlib framing and standalone NBT files
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "nbtcraft/compression.hpp"

#include "utils/TestFixtures.hpp"
#include "utils/TestHelpers.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace nbtcraft;
using namespace nbtcraft::test;

// =============================================================================
// Stream Compression Tests
// =============================================================================

class CompressionTest : public ::testing::Test {
protected:
    std::vector<byte_t> Sample() {
        std::string text = "the quick brown fox jumps over the lazy dog, again and again and again";
        return std::vector<byte_t>(text.begin(), text.end());
    }
};

TEST_F(CompressionTest, GzipRoundTrip) {
    std::vector<byte_t> compressed = gzip_compress(Sample());
    EXPECT_TRUE(is_gzip(compressed.data(), compressed.size()));
    EXPECT_EQ(Sample(), gzip_decompress(compressed));
}

TEST_F(CompressionTest, ZlibRoundTrip) {
    std::vector<byte_t> compressed = zlib_compress(Sample());
    EXPECT_FALSE(is_gzip(compressed.data(), compressed.size()));
    EXPECT_EQ(0x78, compressed[0]);
    EXPECT_EQ(Sample(), zlib_decompress(compressed));
}

TEST_F(CompressionTest, EmptyInputRoundTrips) {
    EXPECT_TRUE(gzip_decompress(gzip_compress({})).empty());
    EXPECT_TRUE(zlib_decompress(zlib_compress({})).empty());
}

TEST_F(CompressionTest, GarbageFailsWithCompressionError) {
    std::vector<byte_t> garbage = {0x1f, 0x8b, 0x00, 0x12, 0x34, 0x56, 0x78, 0x9a, 0xbc, 0xde};
    ExpectError(errc::compression_error, [&] { gzip_decompress(garbage); });

    std::vector<byte_t> not_zlib = {0x12, 0x34, 0x56, 0x78};
    ExpectError(errc::compression_error, [&] { zlib_decompress(not_zlib); });
}

// =============================================================================
// NBT File Tests
// =============================================================================

class NbtFileTest : public TempDirTest {
protected:
    NbtFileTest() : TempDirTest("nbtcraft_file_") {}

    void WriteRaw(const std::string& path, const std::vector<byte_t>& bytes) {
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }

    NamedTag Level() {
        return NamedTag{"", Compound{{"Data", Compound{{"LevelName", "My World"}, {"version", 19133}}}}};
    }
};

TEST_F(NbtFileTest, WriteThenReadGzipFile) {
    write_nbt_file(PathOf("level.dat"), Level());

    std::ifstream in(PathOf("level.dat"), std::ios::binary);
    byte_t magic[2] = {};
    in.read(reinterpret_cast<char*>(magic), 2);
    EXPECT_TRUE(is_gzip(magic, 2));

    EXPECT_EQ(Level(), read_nbt_file(PathOf("level.dat")));
}

TEST_F(NbtFileTest, ReadsUncompressedFile) {
    WriteRaw(PathOf("raw.nbt"), to_nbt(Level()));
    EXPECT_EQ(Level(), read_nbt_file(PathOf("raw.nbt")));
}

TEST_F(NbtFileTest, ReadsFromStream) {
    std::vector<byte_t> compressed = gzip_compress(to_nbt(Level()));
    std::istringstream stream(std::string(compressed.begin(), compressed.end()));
    NamedTag root = read_nbt_file(stream);
    EXPECT_EQ("My World", root.tag.at("Data").at("LevelName").get<std::string>());
}

TEST_F(NbtFileTest, MissingFileIsIoError) {
    ExpectError(errc::io_error, [&] { read_nbt_file(PathOf("absent.dat")); });
}

TEST_F(NbtFileTest, TruncatedGzipFails) {
    std::vector<byte_t> compressed = gzip_compress(to_nbt(Level()));
    compressed.resize(compressed.size() / 2);
    WriteRaw(PathOf("cut.dat"), compressed);
    // depending on where the cut lands, inflating fails or the inflated NBT ends early
    try {
        read_nbt_file(PathOf("cut.dat"));
        FAIL() << "truncated file decoded";
    } catch (const nbt_error& e) {
        EXPECT_THAT(e.code(), ::testing::AnyOf(errc::compression_error, errc::unexpected_eof)) << e.what();
    }
}
