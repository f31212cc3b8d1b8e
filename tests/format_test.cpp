#include <array>
#include <string>
#include <vector>

#include <cstdint>
#include <gtest/gtest.h>
#include <pcapstore/format.hpp>
#include <pcapstore/store_config.hpp>

using namespace pcapstore;
using namespace pcapstore::format;

// =============================================================================
// Layout sizes
// =============================================================================

TEST(FormatTest, RecordSizes) {
    EXPECT_EQ(FileHeader::size, 16);
    EXPECT_EQ(PacketHeader::size, 16);
    EXPECT_EQ(IndexHeader::size, 32);
    EXPECT_EQ(IndexEntry::size, 96);
}

// =============================================================================
// File Header
// =============================================================================

TEST(FormatTest, FileHeaderIsLittleEndian) {
    FileHeader h{.magic = SEGMENT_MAGIC,
                 .version_major = VERSION_MAJOR,
                 .version_minor = VERSION_MINOR,
                 .timezone_offset = -3600,
                 .timestamp_accuracy = 0};
    auto bytes = encode(h);

    // 0xD4C3B2A1 little-endian
    EXPECT_EQ(bytes[0], 0xA1);
    EXPECT_EQ(bytes[1], 0xB2);
    EXPECT_EQ(bytes[2], 0xC3);
    EXPECT_EQ(bytes[3], 0xD4);
    EXPECT_EQ(bytes[4], 2);
    EXPECT_EQ(bytes[5], 0);
    EXPECT_EQ(bytes[6], 4);
    EXPECT_EQ(bytes[7], 0);

    auto decoded = decode_file_header(bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, h);
    EXPECT_EQ(decoded->timezone_offset, -3600);
    EXPECT_TRUE(matches(*decoded, SEGMENT_MAGIC, VERSION_MAJOR, VERSION_MINOR));
}

TEST(FormatTest, FileHeaderMismatchDetected) {
    FileHeader h{.magic = SEGMENT_MAGIC, .version_major = 2, .version_minor = 3};
    EXPECT_FALSE(matches(h, SEGMENT_MAGIC, VERSION_MAJOR, VERSION_MINOR));
    h.version_minor = 4;
    h.magic = INDEX_MAGIC;
    EXPECT_FALSE(matches(h, SEGMENT_MAGIC, VERSION_MAJOR, VERSION_MINOR));
}

TEST(FormatTest, ShortBufferIsFormatError) {
    std::array<uint8_t, 10> bytes{};
    auto file = decode_file_header(bytes);
    ASSERT_FALSE(file.has_value());
    EXPECT_EQ(file.error().code, ErrorCode::format_error);

    auto packet = decode_packet_header(bytes);
    ASSERT_FALSE(packet.has_value());
    EXPECT_EQ(packet.error().code, ErrorCode::format_error);

    std::array<uint8_t, 31> index_bytes{};
    EXPECT_FALSE(decode_index_header(index_bytes).has_value());
    std::array<uint8_t, 87> entry_bytes{};
    EXPECT_FALSE(decode_index_entry(entry_bytes).has_value());
}

// =============================================================================
// Packet Header
// =============================================================================

TEST(FormatTest, PacketHeaderFields) {
    PacketHeader h{.ts_seconds = 1'700'000'000,
                   .ts_nanoseconds = 999'999'999,
                   .payload_length = 0x00010203,
                   .checksum = 0xCAFEBABE};
    auto bytes = encode(h);

    EXPECT_EQ(bytes[8], 0x03);
    EXPECT_EQ(bytes[9], 0x02);
    EXPECT_EQ(bytes[10], 0x01);
    EXPECT_EQ(bytes[11], 0x00);
    EXPECT_EQ(bytes[12], 0xBE);
    EXPECT_EQ(bytes[15], 0xCA);

    auto decoded = decode_packet_header(bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, h);
    EXPECT_EQ(decoded->timestamp(), Timestamp(1'700'000'000, 999'999'999));
}

// =============================================================================
// Index Header / Entry
// =============================================================================

TEST(FormatTest, IndexHeaderFields) {
    IndexHeader h{.magic = INDEX_MAGIC,
                  .version_major = 2,
                  .version_minor = 4,
                  .interval_ns = 1'000'000'000ULL,
                  .max_packets_per_segment = 500,
                  .reserved = 0,
                  .created_seconds = 1'700'000'000,
                  .created_nanoseconds = 42};
    auto bytes = encode(h);

    // 0xA1B2C3D4 little-endian
    EXPECT_EQ(bytes[0], 0xD4);
    EXPECT_EQ(bytes[3], 0xA1);

    auto decoded = decode_index_header(bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, h);
    EXPECT_TRUE(matches(*decoded, INDEX_MAGIC, VERSION_MAJOR, VERSION_MINOR));
}

TEST(FormatTest, IndexEntryFields) {
    IndexEntry e{.timestamp = Timestamp(1'700'000'000, 250),
                 .offset = 0x0000000100000010ULL,
                 .packet_size = 1040,
                 .sequence = 0x0102030405ULL,
                 .segment = "data_231114_221320_0000000.pcap"};
    auto bytes = encode_entry(e);
    ASSERT_TRUE(bytes.has_value());

    // name_len at offset 20, sequence at 24, name at 32, rest zero-padded
    EXPECT_EQ((*bytes)[20], e.segment.size());
    EXPECT_EQ((*bytes)[21], 0);
    EXPECT_EQ((*bytes)[24], 0x05);
    EXPECT_EQ((*bytes)[28], 0x01);
    EXPECT_EQ((*bytes)[31], 0);
    EXPECT_EQ((*bytes)[32], 'd');
    EXPECT_EQ((*bytes)[32 + e.segment.size()], 0);

    auto decoded = decode_index_entry(*bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, e);
}

TEST(FormatTest, IndexEntryNameLimit) {
    IndexEntry e{.segment = std::string(64, 'x')};
    auto ok = encode_entry(e);
    ASSERT_TRUE(ok.has_value());
    auto decoded = decode_index_entry(*ok);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->segment.size(), 64);

    e.segment.push_back('x');
    auto too_long = encode_entry(e);
    ASSERT_FALSE(too_long.has_value());
    EXPECT_EQ(too_long.error().code, ErrorCode::validation_error);
}

TEST(FormatTest, CorruptEntryNameLength) {
    std::array<uint8_t, IndexEntry::size> raw{};
    raw[20] = 65;
    auto decoded = decode_index_entry(raw);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code, ErrorCode::format_error);
}
