#include "metadata.hpp"
#include "errors.hpp"
#include "fsplit.pb.h"
#include "test_utils.hpp"
#include <gtest/gtest.h>

namespace fsplit {
namespace {

MetadataRecord make_record(uint64_t size, uint64_t chunk) {
    MetadataRecord m;
    m.original_filename = "data.bin";
    m.original_size = size;
    m.chunk_size = chunk;
    m.part_count = expected_part_count(size, chunk);
    return m;
}

std::string serialize_partial(const Sidecar& sidecar) {
    std::string bytes;
    sidecar.SerializePartialToString(&bytes);
    return bytes;
}

Sidecar valid_sidecar() {
    Sidecar s;
    s.set_format_version(FORMAT_VERSION);
    s.set_original_filename("data.bin");
    s.set_original_size(10);
    s.set_chunk_size(3);
    s.set_part_count(4);
    return s;
}

TEST(MetadataTest, PartCountIsCeilingOfSizeOverChunk) {
    EXPECT_EQ(expected_part_count(0, 5), 0u);
    EXPECT_EQ(expected_part_count(1, 5), 1u);
    EXPECT_EQ(expected_part_count(5, 5), 1u);
    EXPECT_EQ(expected_part_count(6, 5), 2u);
    EXPECT_EQ(expected_part_count(10, 3), 4u);
    EXPECT_EQ(expected_part_count(9, 3), 3u);
    EXPECT_THROW(expected_part_count(10, 0), std::invalid_argument);
}

TEST(MetadataTest, TenMillionBytesInThreeMillionChunks) {
    MetadataRecord m = make_record(10000000, 3000000);
    ASSERT_EQ(m.part_count, 4u);
    EXPECT_EQ(expected_part_size(m, 1), 3000000u);
    EXPECT_EQ(expected_part_size(m, 2), 3000000u);
    EXPECT_EQ(expected_part_size(m, 3), 3000000u);
    EXPECT_EQ(expected_part_size(m, 4), 1000000u);
    EXPECT_EQ(part_offset(m, 1), 0u);
    EXPECT_EQ(part_offset(m, 4), 9000000u);
    EXPECT_THROW(expected_part_size(m, 0), std::out_of_range);
    EXPECT_THROW(expected_part_size(m, 5), std::out_of_range);
}

TEST(MetadataTest, ChunkLargerThanFileGivesOneWholePart) {
    MetadataRecord m = make_record(100, 1000);
    ASSERT_EQ(m.part_count, 1u);
    EXPECT_EQ(expected_part_size(m, 1), 100u);
}

TEST(MetadataTest, LastPartOfExactMultipleIsFull) {
    MetadataRecord m = make_record(12, 4);
    ASSERT_EQ(m.part_count, 3u);
    EXPECT_EQ(expected_part_size(m, 3), 4u);

    MetadataRecord plus_one = make_record(13, 4);
    ASSERT_EQ(plus_one.part_count, 4u);
    EXPECT_EQ(expected_part_size(plus_one, 4), 1u);
}

TEST(MetadataTest, PartNamesArePaddedToPartCount) {
    MetadataRecord m = make_record(10, 3);
    EXPECT_EQ(part_file_name(m, 1), "data.bin.part001");
    EXPECT_EQ(part_file_name(m, 4), "data.bin.part004");

    MetadataRecord many = make_record(1500, 1);
    EXPECT_EQ(part_file_name(many, 7), "data.bin.part0007");
    EXPECT_EQ(part_file_name(many, 1500), "data.bin.part1500");

    EXPECT_EQ(sidecar_file_name("data.bin"), "data.bin.info");
}

TEST(MetadataTest, RecognizesPartFileNames) {
    EXPECT_TRUE(is_part_file_name("data.bin.part001", "data.bin"));
    EXPECT_TRUE(is_part_file_name("data.bin.part12345", "data.bin"));
    EXPECT_FALSE(is_part_file_name("data.bin.part", "data.bin"));
    EXPECT_FALSE(is_part_file_name("data.bin.part01a", "data.bin"));
    EXPECT_FALSE(is_part_file_name("other.bin.part001", "data.bin"));
    EXPECT_FALSE(is_part_file_name("data.bin.info", "data.bin"));
}

TEST(MetadataTest, EncodeDecodeKeepsEveryField) {
    MetadataRecord m = make_record(10, 3);
    m.hash_algorithm = HashAlgorithm::Sha256;
    m.hash_value.assign(32, 0xAB);

    MetadataRecord decoded = decode_metadata(encode_metadata(m));
    EXPECT_EQ(decoded.original_filename, "data.bin");
    EXPECT_EQ(decoded.original_size, 10u);
    EXPECT_EQ(decoded.chunk_size, 3u);
    EXPECT_EQ(decoded.part_count, 4u);
    EXPECT_EQ(decoded.hash_algorithm, HashAlgorithm::Sha256);
    EXPECT_EQ(decoded.hash_value, m.hash_value);
}

TEST(MetadataTest, ZeroByteRecordIsValid) {
    MetadataRecord m = make_record(0, 4096);
    MetadataRecord decoded = decode_metadata(encode_metadata(m));
    EXPECT_EQ(decoded.original_size, 0u);
    EXPECT_EQ(decoded.part_count, 0u);
    EXPECT_FALSE(decoded.has_hash());
}

TEST(MetadataTest, DecodeRejectsGarbageAndTruncation) {
    EXPECT_THROW(decode_metadata(""), ParseError);
    EXPECT_THROW(decode_metadata("not a sidecar"), ParseError);

    std::string bytes = encode_metadata(make_record(10, 3));
    EXPECT_THROW(decode_metadata(bytes.substr(0, bytes.size() - 1)), ParseError);
}

TEST(MetadataTest, DecodeRejectsMissingRequiredField) {
    Sidecar s = valid_sidecar();
    s.clear_part_count();
    EXPECT_THROW(decode_metadata(serialize_partial(s)), ParseError);
}

TEST(MetadataTest, DecodeRejectsInconsistentRecords) {
    Sidecar wrong_count = valid_sidecar();
    wrong_count.set_part_count(5);
    EXPECT_THROW(decode_metadata(serialize_partial(wrong_count)), ParseError);

    Sidecar zero_chunk = valid_sidecar();
    zero_chunk.set_chunk_size(0);
    EXPECT_THROW(decode_metadata(serialize_partial(zero_chunk)), ParseError);

    Sidecar with_path = valid_sidecar();
    with_path.set_original_filename("../etc/passwd");
    EXPECT_THROW(decode_metadata(serialize_partial(with_path)), ParseError);

    Sidecar short_digest = valid_sidecar();
    short_digest.set_hash_algorithm(DIGEST_SHA256);
    short_digest.set_hash_value(std::string(16, 'x'));
    EXPECT_THROW(decode_metadata(serialize_partial(short_digest)), ParseError);

    Sidecar digest_without_algorithm = valid_sidecar();
    digest_without_algorithm.set_hash_value(std::string(32, 'x'));
    EXPECT_THROW(decode_metadata(serialize_partial(digest_without_algorithm)), ParseError);

    Sidecar future = valid_sidecar();
    future.set_format_version(FORMAT_VERSION + 1);
    EXPECT_THROW(decode_metadata(serialize_partial(future)), ParseError);
}

TEST(MetadataTest, DecodeSkipsUnknownFields) {
    std::string bytes = serialize_partial(valid_sidecar());
    // field 100, varint 1
    bytes += std::string("\xA0\x06\x01", 3);

    MetadataRecord decoded = decode_metadata(bytes);
    EXPECT_EQ(decoded.part_count, 4u);
}

TEST(MetadataTest, SaveAndLoadThroughFile) {
    test_utils::TempDir dir;
    std::string path = (dir / "data.bin.info").string();

    MetadataRecord m = make_record(10, 3);
    save_metadata(m, path);
    EXPECT_FALSE(std::filesystem::exists(path + ".tmp"));

    MetadataRecord loaded = load_metadata(path);
    EXPECT_EQ(loaded.original_filename, m.original_filename);
    EXPECT_EQ(loaded.part_count, m.part_count);

    EXPECT_THROW(load_metadata((dir / "missing.info").string()), ParseError);

    test_utils::write_file(dir / "broken.info", "garbage");
    EXPECT_THROW(load_metadata((dir / "broken.info").string()), ParseError);
}

} // namespace
} // namespace fsplit
