// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#include <chrono>
#include <filesystem>
#include <string>

#include <gtest/gtest.h>
#include <pcapstore/io/project_index.hpp>

#include "store_test_helpers.hpp"

using namespace pcapstore;
using namespace pcapstore::io;
using namespace pcapstore::test;

// =============================================================================
// In-memory index
// =============================================================================

TEST(ProjectIndexTest, EmptyIndex) {
    ProjectIndex index;
    EXPECT_TRUE(index.empty());
    EXPECT_EQ(index.size(), 0);
    EXPECT_FALSE(index.first_timestamp().has_value());
    EXPECT_FALSE(index.last_timestamp().has_value());
    EXPECT_FALSE(index.find_floor(base_time()).has_value());
    EXPECT_TRUE(index.should_sample(base_time()));
}

TEST(ProjectIndexTest, ShouldSampleHonoursInterval) {
    ProjectIndex index(std::chrono::milliseconds{100});
    ASSERT_TRUE(index.append_sample(at_ms(0), "a.pcap", 16, 32, 0).has_value());

    EXPECT_FALSE(index.should_sample(at_ms(0)));
    EXPECT_FALSE(index.should_sample(at_ms(99)));
    EXPECT_TRUE(index.should_sample(at_ms(100)));
    EXPECT_TRUE(index.should_sample(at_ms(250)));
}

TEST(ProjectIndexTest, RejectsOutOfOrderSample) {
    ProjectIndex index;
    ASSERT_TRUE(index.append_sample(at_ms(10), "a.pcap", 16, 32, 0).has_value());
    ASSERT_TRUE(index.append_sample(at_ms(10), "a.pcap", 48, 32, 10).has_value()); // equal is fine

    auto older = index.append_sample(at_ms(9), "a.pcap", 80, 32, 20);
    ASSERT_FALSE(older.has_value());
    EXPECT_EQ(older.error().code, ErrorCode::invalid_state);
    EXPECT_EQ(index.size(), 2);
}

TEST(ProjectIndexTest, RejectsSequenceThatDoesNotAdvance) {
    ProjectIndex index;
    ASSERT_TRUE(index.append_sample(at_ms(0), "a.pcap", 16, 32, 5).has_value());

    auto repeated = index.append_sample(at_ms(10), "a.pcap", 48, 32, 5);
    ASSERT_FALSE(repeated.has_value());
    EXPECT_EQ(repeated.error().code, ErrorCode::invalid_state);

    auto backwards = index.append_sample(at_ms(10), "a.pcap", 48, 32, 4);
    ASSERT_FALSE(backwards.has_value());
    EXPECT_EQ(index.size(), 1);
}

TEST(ProjectIndexTest, SegmentsInFirstAppearanceOrder) {
    ProjectIndex index;
    ASSERT_TRUE(index.append_sample(at_ms(0), "b.pcap", 16, 32, 0).has_value());
    ASSERT_TRUE(index.append_sample(at_ms(1), "b.pcap", 48, 32, 10).has_value());
    ASSERT_TRUE(index.append_sample(at_ms(2), "a.pcap", 16, 32, 20).has_value());
    ASSERT_TRUE(index.append_sample(at_ms(3), "c.pcap", 16, 32, 30).has_value());

    ASSERT_EQ(index.segments().size(), 3);
    EXPECT_EQ(index.segments()[0], "b.pcap");
    EXPECT_EQ(index.segments()[1], "a.pcap");
    EXPECT_EQ(index.segments()[2], "c.pcap");
}

TEST(ProjectIndexTest, FindFloor) {
    ProjectIndex index;
    ASSERT_TRUE(index.append_sample(at_ms(0), "a.pcap", 16, 32, 0).has_value());
    ASSERT_TRUE(index.append_sample(at_ms(100), "a.pcap", 400, 32, 10).has_value());
    ASSERT_TRUE(index.append_sample(at_ms(200), "b.pcap", 16, 32, 20).has_value());

    // Before first sample
    EXPECT_FALSE(index.find_floor(at_ms(-1)).has_value());

    auto exact = index.find_floor(at_ms(100));
    ASSERT_TRUE(exact.has_value());
    EXPECT_EQ(exact->entry_index, 1);
    EXPECT_EQ(exact->entry.offset, 400);

    auto between = index.find_floor(at_ms(150));
    ASSERT_TRUE(between.has_value());
    EXPECT_EQ(between->entry_index, 1);

    auto after = index.find_floor(at_ms(10'000));
    ASSERT_TRUE(after.has_value());
    EXPECT_EQ(after->entry_index, 2);
    EXPECT_EQ(after->entry.segment, "b.pcap");
}

TEST(ProjectIndexTest, FindFloorPrefersEarliestOfEqualSamples) {
    ProjectIndex index;
    ASSERT_TRUE(index.append_sample(at_ms(0), "a.pcap", 16, 32, 0).has_value());
    ASSERT_TRUE(index.append_sample(at_ms(50), "a.pcap", 200, 32, 10).has_value());
    ASSERT_TRUE(index.append_sample(at_ms(50), "b.pcap", 16, 32, 20).has_value());
    ASSERT_TRUE(index.append_sample(at_ms(50), "c.pcap", 16, 32, 30).has_value());

    auto floor = index.find_floor(at_ms(60));
    ASSERT_TRUE(floor.has_value());
    EXPECT_EQ(floor->entry_index, 1);
    EXPECT_EQ(floor->entry.segment, "a.pcap");
}

TEST(ProjectIndexTest, FindSequenceFloor) {
    ProjectIndex index;
    ASSERT_TRUE(index.append_sample(at_ms(0), "a.pcap", 16, 32, 0).has_value());
    ASSERT_TRUE(index.append_sample(at_ms(100), "a.pcap", 400, 32, 7).has_value());
    ASSERT_TRUE(index.append_sample(at_ms(200), "b.pcap", 16, 32, 10).has_value());

    auto first = index.find_sequence_floor(0);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->entry_index, 0);

    auto inside = index.find_sequence_floor(9);
    ASSERT_TRUE(inside.has_value());
    EXPECT_EQ(inside->entry.sequence, 7);
    EXPECT_EQ(inside->entry.offset, 400);

    auto last = index.find_sequence_floor(1'000);
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->entry.segment, "b.pcap");

    ProjectIndex late;
    ASSERT_TRUE(late.append_sample(at_ms(0), "a.pcap", 16, 32, 3).has_value());
    EXPECT_FALSE(late.find_sequence_floor(2).has_value());
}

// =============================================================================
// On-disk index
// =============================================================================

class ProjectIndexFileTest : public StoreTest {
protected:
    void SetUp() override {
        StoreTest::SetUp();
        path_ = temp_dir_ / "run.pcap";
        config_.index_interval = std::chrono::milliseconds{250};
        config_.max_packets_per_segment = 42;
    }

    void write_entries(size_t count) {
        auto writer = value_or_throw(ProjectIndexWriter::create(path_, config_, base_time()));
        for (size_t i = 0; i < count; ++i) {
            format::IndexEntry entry{.timestamp = at_ms(static_cast<int64_t>(i) * 250),
                                     .offset = 16 + i * 100,
                                     .packet_size = 100,
                                     .sequence = i * 3,
                                     .segment = "data_231114_221320_000000" +
                                                std::to_string(i % 2) + ".pcap"};
            value_or_throw(writer.append(entry));
        }
        EXPECT_EQ(writer.entries_written(), count);
        EXPECT_EQ(writer.bytes_written(),
                  format::IndexHeader::size + count * format::IndexEntry::size);
        value_or_throw(writer.close());
    }

    std::filesystem::path path_;
    StoreConfig config_;
};

TEST_F(ProjectIndexFileTest, WriteThenLoad) {
    write_entries(5);
    EXPECT_EQ(std::filesystem::file_size(path_),
              format::IndexHeader::size + 5 * format::IndexEntry::size);

    auto index = ProjectIndex::load(path_);
    ASSERT_TRUE(index.has_value()) << index.error().describe();
    EXPECT_EQ(index->size(), 5);
    EXPECT_EQ(index->interval(), std::chrono::milliseconds{250});
    ASSERT_TRUE(index->header().has_value());
    EXPECT_EQ(index->header()->max_packets_per_segment, 42);
    EXPECT_EQ(index->header()->created_seconds, BASE_SECONDS);

    EXPECT_EQ(index->entries()[3].timestamp, at_ms(750));
    EXPECT_EQ(index->entries()[3].offset, 316);
    EXPECT_EQ(index->entries()[3].sequence, 9);
    EXPECT_EQ(index->entries()[3].segment, "data_231114_221320_0000001.pcap");
    EXPECT_EQ(index->segments().size(), 2);
}

TEST_F(ProjectIndexFileTest, HeaderOnlyIndexIsEmpty) {
    write_entries(0);
    auto index = ProjectIndex::load(path_);
    ASSERT_TRUE(index.has_value());
    EXPECT_TRUE(index->empty());
}

TEST_F(ProjectIndexFileTest, CreateRefusesExistingFile) {
    write_entries(1);
    auto again = ProjectIndexWriter::create(path_, config_);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::io_error);
}

TEST_F(ProjectIndexFileTest, PartialTrailingEntryIgnored) {
    write_entries(3);
    chop_bytes(path_, 10);

    auto index = ProjectIndex::load(path_);
    ASSERT_TRUE(index.has_value());
    EXPECT_EQ(index->size(), 2);
}

TEST_F(ProjectIndexFileTest, LoadMissingFileIsIoError) {
    auto index = ProjectIndex::load(path_);
    ASSERT_FALSE(index.has_value());
    EXPECT_EQ(index.error().code, ErrorCode::io_error);
}

TEST_F(ProjectIndexFileTest, LoadRejectsBadMagic) {
    write_entries(1);
    flip_byte(path_, 0);
    auto index = ProjectIndex::load(path_);
    ASSERT_FALSE(index.has_value());
    EXPECT_EQ(index.error().code, ErrorCode::format_error);
}

TEST_F(ProjectIndexFileTest, LoadRejectsShortHeader) {
    write_raw(path_, {0xD4, 0xC3, 0xB2, 0xA1, 2, 0, 4, 0});
    auto index = ProjectIndex::load(path_);
    ASSERT_FALSE(index.has_value());
    EXPECT_EQ(index.error().code, ErrorCode::format_error);
}

TEST_F(ProjectIndexFileTest, LoadRejectsUnorderedEntries) {
    write_entries(3);
    // Bump entry 0's seconds field far into the future
    flip_byte(path_, format::IndexHeader::size + 3, 0x10);

    auto index = ProjectIndex::load(path_);
    ASSERT_FALSE(index.has_value());
    EXPECT_EQ(index.error().code, ErrorCode::format_error);
}

TEST_F(ProjectIndexFileTest, LoadRejectsRepeatedSequence) {
    write_entries(3);
    // Entry 2's sequence (6) becomes 2, behind entry 1's 3
    flip_byte(path_, format::IndexHeader::size + 2 * format::IndexEntry::size + 24, 0x04);

    auto index = ProjectIndex::load(path_);
    ASSERT_FALSE(index.has_value());
    EXPECT_EQ(index.error().code, ErrorCode::format_error);
}
