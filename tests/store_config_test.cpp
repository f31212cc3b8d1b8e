#include <chrono>

#include <gtest/gtest.h>
#include <pcapstore/error.hpp>
#include <pcapstore/store_config.hpp>

using namespace pcapstore;

TEST(StoreConfigTest, Defaults) {
    StoreConfig config;
    EXPECT_EQ(config.max_packets_per_segment, 500);
    EXPECT_EQ(config.index_interval, std::chrono::seconds{1});
    EXPECT_EQ(config.write_buffer_size, 64 * 1024);
    EXPECT_FALSE(config.auto_flush);
    EXPECT_TRUE(config.verify_checksums);
    EXPECT_FALSE(config.overwrite);
    EXPECT_TRUE(config.skip_corrupt_segments);

    EXPECT_EQ(config.format.segment_magic, 0xD4C3B2A1U);
    EXPECT_EQ(config.format.index_magic, 0xA1B2C3D4U);
    EXPECT_EQ(config.format.version_major, 2);
    EXPECT_EQ(config.format.version_minor, 4);
    EXPECT_EQ(config.format.max_packet_size, 30U * 1024U * 1024U);
    EXPECT_EQ(config.format, FormatConfig{});

    EXPECT_TRUE(validate(config).has_value());
}

TEST(StoreConfigTest, Presets) {
    auto fast = StoreConfig::high_throughput();
    EXPECT_EQ(fast.max_packets_per_segment, 2000);
    EXPECT_EQ(fast.write_buffer_size, 1024 * 1024);
    EXPECT_TRUE(validate(fast).has_value());

    auto small = StoreConfig::low_memory();
    EXPECT_EQ(small.max_packets_per_segment, 100);
    EXPECT_EQ(small.write_buffer_size, 4 * 1024);
    EXPECT_TRUE(validate(small).has_value());
}

TEST(StoreConfigTest, RejectsZeroSegmentSize) {
    StoreConfig config;
    config.max_packets_per_segment = 0;
    auto r = validate(config);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::validation_error);
}

TEST(StoreConfigTest, RejectsNonPositiveInterval) {
    StoreConfig config;
    config.index_interval = std::chrono::nanoseconds{0};
    EXPECT_FALSE(validate(config).has_value());
    config.index_interval = std::chrono::nanoseconds{-1};
    EXPECT_FALSE(validate(config).has_value());
}

TEST(StoreConfigTest, RejectsPacketLimitAboveHardLimit) {
    StoreConfig config;
    config.format.max_packet_size = MAX_PACKET_SIZE_LIMIT + 1;
    EXPECT_FALSE(validate(config).has_value());
    config.format.max_packet_size = 0;
    EXPECT_FALSE(validate(config).has_value());
    config.format.max_packet_size = 1024;
    EXPECT_TRUE(validate(config).has_value());
}

TEST(StoreConfigTest, RejectsTinyWriteBuffer) {
    StoreConfig config;
    config.write_buffer_size = MIN_WRITE_BUFFER_SIZE - 1;
    EXPECT_FALSE(validate(config).has_value());
}

TEST(StoreErrorTest, DescribeIncludesContext) {
    StoreError err{.code = ErrorCode::truncated_data,
                   .path = "/tmp/seg.pcap",
                   .offset = 128,
                   .errno_value = 0,
                   .packets_decoded = 3,
                   .detail = "file ends inside packet payload"};
    auto text = err.describe();
    EXPECT_NE(text.find("Truncated data"), std::string::npos);
    EXPECT_NE(text.find("file ends inside packet payload"), std::string::npos);
    EXPECT_NE(text.find("/tmp/seg.pcap @ 128"), std::string::npos);
}

TEST(StoreErrorTest, ReaderErrorHelpers) {
    ReaderError eof = EndOfStream{};
    EXPECT_TRUE(is_eof(eof));
    EXPECT_FALSE(is_error(eof));
    EXPECT_STREQ(error_message(eof), "End of stream");

    ReaderError err = StoreError{.code = ErrorCode::format_error};
    EXPECT_FALSE(is_eof(err));
    EXPECT_TRUE(has_code(err, ErrorCode::format_error));
    EXPECT_FALSE(has_code(err, ErrorCode::io_error));
    EXPECT_STREQ(error_message(err), "Format error");
}

TEST(StoreErrorTest, ValueOrThrow) {
    Result<int> ok = 7;
    EXPECT_EQ(value_or_throw(std::move(ok)), 7);

    Result<int> bad = make_error(ErrorCode::invalid_state, "closed");
    try {
        value_or_throw(std::move(bad));
        FAIL() << "expected StoreException";
    } catch (const StoreException& e) {
        EXPECT_EQ(e.code(), ErrorCode::invalid_state);
    }
}
