// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <array>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <vector>

#include <cerrno>
#include <gtest/gtest.h>
#include <pcapstore/io/segment_reader.hpp>
#include <pcapstore/io/segment_writer.hpp>

#include "store_test_helpers.hpp"

using namespace pcapstore;
using namespace pcapstore::io;
using namespace pcapstore::test;

class SegmentWriterTest : public StoreTest {
protected:
    std::vector<uint8_t> read_file(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }
};

// =============================================================================
// Basic Functionality Tests
// =============================================================================

TEST_F(SegmentWriterTest, CreateWritesFileHeader) {
    auto path = temp_dir_ / "seg.pcap";
    {
        auto writer = SegmentWriter::create(path);
        ASSERT_TRUE(writer.has_value()) << writer.error().describe();
        EXPECT_TRUE(writer->is_open());
        EXPECT_EQ(writer->packets_written(), 0);
        EXPECT_EQ(writer->bytes_written(), format::FileHeader::size);
        EXPECT_EQ(writer->next_offset(), format::FileHeader::size);
    }

    auto bytes = read_file(path);
    ASSERT_EQ(bytes.size(), format::FileHeader::size);
    auto header = format::decode_file_header(bytes);
    ASSERT_TRUE(header.has_value());
    EXPECT_TRUE(matches(*header, SEGMENT_MAGIC, VERSION_MAJOR, VERSION_MINOR));
    EXPECT_EQ(header->timezone_offset, 0);
    EXPECT_EQ(header->timestamp_accuracy, 0U);
}

TEST_F(SegmentWriterTest, CreateFailsIfFileExists) {
    auto path = temp_dir_ / "seg.pcap";
    {
        auto first = SegmentWriter::create(path);
        ASSERT_TRUE(first.has_value());
    }

    auto second = SegmentWriter::create(path);
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code, ErrorCode::io_error);
    EXPECT_EQ(second.error().errno_value, EEXIST);

    auto replaced = SegmentWriter::create(path, {}, true);
    EXPECT_TRUE(replaced.has_value());
}

TEST_F(SegmentWriterTest, CreateInMissingDirectoryFails) {
    auto writer = SegmentWriter::create(temp_dir_ / "nope" / "seg.pcap");
    ASSERT_FALSE(writer.has_value());
    EXPECT_EQ(writer.error().code, ErrorCode::io_error);
    EXPECT_EQ(writer.error().errno_value, ENOENT);
}

TEST_F(SegmentWriterTest, AppendLaysOutHeaderThenPayload) {
    auto path = temp_dir_ / "seg.pcap";
    auto pkt = make_packet(base_time(), 5, 1);
    {
        auto writer = SegmentWriter::create(path);
        ASSERT_TRUE(writer.has_value());

        auto appended = writer->append(pkt);
        ASSERT_TRUE(appended.has_value());
        EXPECT_EQ(*appended, format::PacketHeader::size + 5);
        EXPECT_EQ(writer->packets_written(), 1);
        EXPECT_EQ(writer->next_offset(), 16 + 16 + 5);
        ASSERT_TRUE(writer->close().has_value());
        EXPECT_FALSE(writer->is_open());
    }

    auto bytes = read_file(path);
    ASSERT_EQ(bytes.size(), 16 + 16 + 5);
    auto header = format::decode_packet_header(std::span<const uint8_t>(bytes).subspan(16));
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(header->timestamp(), base_time());
    EXPECT_EQ(header->payload_length, 5);
    EXPECT_EQ(header->checksum, pkt.checksum());
    EXPECT_TRUE(std::equal(bytes.begin() + 32, bytes.end(), pkt.payload().begin()));
}

TEST_F(SegmentWriterTest, BufferedBytesReachDiskOnFlush) {
    auto path = temp_dir_ / "seg.pcap";
    auto writer = SegmentWriter::create(path, {}, false, 4096);
    ASSERT_TRUE(writer.has_value());

    ASSERT_TRUE(writer->append(make_packet(base_time(), 100)).has_value());
    EXPECT_EQ(std::filesystem::file_size(path), 16);
    EXPECT_EQ(writer->bytes_written(), 16 + 116);

    ASSERT_TRUE(writer->flush().has_value());
    EXPECT_EQ(std::filesystem::file_size(path), 16 + 116);
}

TEST_F(SegmentWriterTest, PacketLargerThanBufferWrittenDirectly) {
    auto path = temp_dir_ / "seg.pcap";
    auto writer = SegmentWriter::create(path, {}, false, 1024);
    ASSERT_TRUE(writer.has_value());

    ASSERT_TRUE(writer->append(make_packet(base_time(), 10)).has_value());
    ASSERT_TRUE(writer->append(make_packet(at_ms(1), 5000)).has_value());
    // Small packet drained ahead of the large one, which bypassed the buffer
    EXPECT_EQ(std::filesystem::file_size(path), 16 + 26 + 5016);
    EXPECT_EQ(writer->next_offset(), 16 + 26 + 5016);
    ASSERT_TRUE(writer->close().has_value());

    auto reader = SegmentReader::open(path);
    ASSERT_TRUE(reader.has_value());
    auto count = reader->count_packets();
    ASSERT_TRUE(count.has_value());
    EXPECT_EQ(*count, 2);
}

TEST_F(SegmentWriterTest, OversizedPacketRejected) {
    FormatConfig format;
    format.max_packet_size = 64;
    auto writer = SegmentWriter::create(temp_dir_ / "seg.pcap", format);
    ASSERT_TRUE(writer.has_value());

    auto result = writer->append(make_packet(base_time(), 65));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::validation_error);
    EXPECT_EQ(writer->packets_written(), 0);
    EXPECT_FALSE(writer->has_error());
}

TEST_F(SegmentWriterTest, AppendAfterCloseIsInvalidState) {
    auto writer = SegmentWriter::create(temp_dir_ / "seg.pcap");
    ASSERT_TRUE(writer.has_value());
    ASSERT_TRUE(writer->close().has_value());
    EXPECT_TRUE(writer->close().has_value()); // idempotent

    auto result = writer->append(make_packet(base_time(), 1));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::invalid_state);
}

TEST_F(SegmentWriterTest, MoveTransfersOwnership) {
    auto path = temp_dir_ / "seg.pcap";
    auto writer = SegmentWriter::create(path);
    ASSERT_TRUE(writer.has_value());
    ASSERT_TRUE(writer->append(make_packet(base_time(), 8)).has_value());

    SegmentWriter moved = std::move(*writer);
    EXPECT_TRUE(moved.is_open());
    EXPECT_EQ(moved.packets_written(), 1);
    ASSERT_TRUE(moved.append(make_packet(at_ms(1), 8)).has_value());
    ASSERT_TRUE(moved.close().has_value());

    EXPECT_EQ(std::filesystem::file_size(path), 16 + 2 * 24);
}

TEST_F(SegmentWriterTest, DestructorFlushes) {
    auto path = temp_dir_ / "seg.pcap";
    {
        auto writer = SegmentWriter::create(path);
        ASSERT_TRUE(writer.has_value());
        for (uint32_t i = 0; i < 10; ++i) {
            ASSERT_TRUE(writer->append(make_packet(at_ms(i), 10, i)).has_value());
        }
    }
    EXPECT_EQ(std::filesystem::file_size(path), 16 + 10 * 26);
}
