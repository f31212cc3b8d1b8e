// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#include <filesystem>
#include <fstream>

#include <gtest/gtest.h>
#include <pcapstore/io/store_layout.hpp>

#include "store_test_helpers.hpp"

using namespace pcapstore;
using namespace pcapstore::io;
using pcapstore::test::StoreTest;

// =============================================================================
// Paths
// =============================================================================

TEST(StoreLayoutTest, IndexAndSegmentPaths) {
    EXPECT_EQ(index_path("/data/rec", "run42"), std::filesystem::path("/data/rec/run42.pcap"));
    EXPECT_EQ(segment_directory("/data/rec", "run42"), std::filesystem::path("/data/rec/run42"));
}

TEST(StoreLayoutTest, SplitIndexPath) {
    auto [base, name] = split_index_path("/data/rec/run42.pcap");
    EXPECT_EQ(base, std::filesystem::path("/data/rec"));
    EXPECT_EQ(name, "run42");

    auto [local_base, local_name] = split_index_path("run7.pcap");
    EXPECT_EQ(local_base, std::filesystem::path("."));
    EXPECT_EQ(local_name, "run7");
}

// =============================================================================
// Segment names
// =============================================================================

TEST(StoreLayoutTest, SegmentFileNameIsUtc) {
    // 2023-11-14 22:13:20 UTC + 0.1234567 s
    Timestamp ts(1'700'000'000, 123'456'789);
    EXPECT_EQ(segment_file_name(ts), "data_231114_221320_1234567.pcap");
}

TEST(StoreLayoutTest, SegmentFileNameZeroPadded) {
    // 2001-02-03 04:05:06 UTC
    Timestamp ts(981'173'106, 700);
    EXPECT_EQ(segment_file_name(ts), "data_010203_040506_0000007.pcap");
}

TEST(StoreLayoutTest, SegmentFileNameFieldWidths) {
    // 2000-01-01 00:00:00 UTC, last tick of the second; 2099-12-31 23:59:59 UTC
    EXPECT_EQ(segment_file_name(Timestamp(946'684'800, 999'999'999)),
              "data_000101_000000_9999999.pcap");
    EXPECT_EQ(segment_file_name(Timestamp(4'102'444'799, 0)),
              "data_991231_235959_0000000.pcap");
}

TEST(StoreLayoutTest, TruncateToTick) {
    Timestamp ts(1'700'000'000, 123'456'789);
    EXPECT_EQ(truncate_to_segment_tick(ts), Timestamp(1'700'000'000, 123'456'700));
}

TEST(StoreLayoutTest, ParseSegmentFileName) {
    Timestamp ts(1'700'000'000, 123'456'700);
    auto parsed = parse_segment_file_name(segment_file_name(ts));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, ts);
}

TEST(StoreLayoutTest, ParseRejectsForeignNames) {
    EXPECT_FALSE(parse_segment_file_name("run42.pcap").has_value());
    EXPECT_FALSE(parse_segment_file_name("data_231114_221320_1234567.pcapng").has_value());
    EXPECT_FALSE(parse_segment_file_name("data_231114-221320_1234567.pcap").has_value());
    EXPECT_FALSE(parse_segment_file_name("data_2311x4_221320_1234567.pcap").has_value());
    EXPECT_FALSE(parse_segment_file_name("data_231314_221320_1234567.pcap").has_value());
    EXPECT_FALSE(parse_segment_file_name("data_231114_251320_1234567.pcap").has_value());
}

// =============================================================================
// Directory listing
// =============================================================================

TEST_F(StoreTest, ListSegmentFilesOrdersByTimestamp) {
    auto touch = [this](const std::string& name) {
        std::ofstream(temp_dir_ / name).put('x');
    };
    touch("data_231114_221320_0000200.pcap");
    touch("data_231114_221319_9999999.pcap");
    touch("data_231114_221320_0000100.pcap");
    touch("notes.txt");
    touch("run.pcap");
    std::filesystem::create_directories(temp_dir_ / "data_231114_221300_0000000.pcap");

    auto listed = list_segment_files(temp_dir_);
    ASSERT_TRUE(listed.has_value());
    ASSERT_EQ(listed->size(), 3);
    EXPECT_EQ((*listed)[0].filename(), "data_231114_221319_9999999.pcap");
    EXPECT_EQ((*listed)[1].filename(), "data_231114_221320_0000100.pcap");
    EXPECT_EQ((*listed)[2].filename(), "data_231114_221320_0000200.pcap");
}

TEST_F(StoreTest, ListMissingDirectoryIsIoError) {
    auto listed = list_segment_files(temp_dir_ / "missing");
    ASSERT_FALSE(listed.has_value());
    EXPECT_EQ(listed.error().code, ErrorCode::io_error);
}
