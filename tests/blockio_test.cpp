#include "gtest/gtest.h"
#include "utilities/blockio.hpp"
#include "utilities/digest.hpp"
#include <algorithm> // For std::transform
#include <cstddef>   // For std::byte
#include <stdexcept> // For std::logic_error, std::runtime_error
#include <string>
#include <vector>

using dedupfs::utils::digest_to_hex;
using dedupfs::utils::HashAlgorithm;

// Helper function to create a vector of bytes from a string literal
static std::vector<std::byte> string_to_byte_vector(const std::string& str) {
    std::vector<std::byte> vec(str.length());
    std::transform(str.begin(), str.end(), vec.begin(), [](char c) {
        return std::byte(c);
    });
    return vec;
}

// Helper function to create a vector of bytes with sequential values
static std::vector<std::byte> create_byte_vector(size_t size) {
    std::vector<std::byte> vec(size);
    for (size_t i = 0; i < size; ++i) {
        vec[i] = std::byte(i % 256);
    }
    return vec;
}

TEST(BlockIOTest, IngestEmpty) {
    BlockIO bio;
    std::vector<std::byte> empty_data;
    bio.ingest(empty_data.data(), empty_data.size());
    EXPECT_TRUE(bio.finalize_raw().empty());
}

TEST(BlockIOTest, IngestMultipleAppends) {
    BlockIO bio;
    auto part1 = string_to_byte_vector("Hello ");
    auto part2 = string_to_byte_vector("World");
    bio.ingest(part1);
    bio.ingest(part2);
    EXPECT_EQ(bio.finalize_raw(), string_to_byte_vector("Hello World"));
}

TEST(BlockIOTest, FinalizeHashedSha256KnownVector) {
    BlockIO bio;
    bio.ingest(string_to_byte_vector("Hello World"));
    DigestResult result = bio.finalize_hashed();
    EXPECT_EQ(result.hex,
              "a591a6d40bf420404a011733cfb7b190d62c65bf0bcda32b57b277d9ad9f146e");
    EXPECT_EQ(digest_to_hex(result.digest), result.hex);
    EXPECT_EQ(result.raw, string_to_byte_vector("Hello World"));
}

TEST(BlockIOTest, FinalizeHashedEmptyInput) {
    BlockIO bio;
    DigestResult result = bio.finalize_hashed();
    EXPECT_EQ(result.hex,
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_TRUE(result.raw.empty());
}

TEST(BlockIOTest, FinalizeHashedTwiceThrows) {
    BlockIO bio;
    bio.ingest(string_to_byte_vector("abc"));
    (void)bio.finalize_hashed();
    EXPECT_THROW(bio.finalize_hashed(), std::logic_error);
}

TEST(BlockIOTest, IngestAfterFinalizeThrows) {
    BlockIO bio;
    (void)bio.finalize_hashed();
    auto more = string_to_byte_vector("late");
    EXPECT_THROW(bio.ingest(more), std::logic_error);
}

TEST(BlockIOTest, StaticHashMatchesStreaming) {
    auto data = create_byte_vector(10000);
    BlockIO bio;
    bio.ingest(data.data(), 4000);
    bio.ingest(data.data() + 4000, 6000);
    DigestResult streamed = bio.finalize_hashed();
    EXPECT_EQ(streamed.digest, BlockIO::hash(data, HashAlgorithm::SHA256));
}

TEST(BlockIOTest, Blake3DiffersFromSha256) {
    auto data = string_to_byte_vector("abc");
    auto sha = BlockIO::hash(data, HashAlgorithm::SHA256);
    auto b3 = BlockIO::hash(data, HashAlgorithm::BLAKE3);
    EXPECT_EQ(digest_to_hex(sha),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_NE(sha, b3);

    BlockIO bio(3, HashAlgorithm::BLAKE3);
    bio.ingest(data);
    EXPECT_EQ(bio.finalize_hashed().digest, b3);
    EXPECT_EQ(bio.hash_algorithm(), HashAlgorithm::BLAKE3);
}

TEST(BlockIOTest, CompressDecompressRoundTrip) {
    BlockIO bio;
    auto data = create_byte_vector(64 * 1024);
    auto compressed = bio.compress_data(data);
    EXPECT_LT(compressed.size(), data.size());
    EXPECT_EQ(bio.decompress_data(compressed), data);
    EXPECT_EQ(bio.decompress_data(compressed, data.size()), data);
}

TEST(BlockIOTest, CompressEmptyProducesValidFrame) {
    BlockIO bio;
    std::vector<std::byte> empty;
    auto compressed = bio.compress_data(empty);
    EXPECT_FALSE(compressed.empty());
    EXPECT_TRUE(bio.decompress_data(compressed).empty());
}

TEST(BlockIOTest, DecompressRejectsGarbage) {
    BlockIO bio;
    auto garbage = string_to_byte_vector("definitely not a zstd frame");
    EXPECT_THROW(bio.decompress_data(garbage), std::runtime_error);
    std::vector<std::byte> empty;
    EXPECT_THROW(bio.decompress_data(empty), std::runtime_error);
}

TEST(BlockIOTest, DecompressSizeMismatchThrows) {
    BlockIO bio;
    auto data = create_byte_vector(1000);
    auto compressed = bio.compress_data(data);
    EXPECT_THROW(bio.decompress_data(compressed, 999), std::runtime_error);
}

TEST(BlockIOTest, CompressionLevelIsReported) {
    BlockIO bio(7);
    EXPECT_EQ(bio.compression_level(), 7);
}
