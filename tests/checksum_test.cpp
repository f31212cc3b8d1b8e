#include <span>
#include <string_view>
#include <vector>

#include <cstdint>
#include <gtest/gtest.h>
#include <pcapstore/checksum.hpp>

using namespace pcapstore;

namespace {

std::span<const uint8_t> as_bytes(std::string_view s) {
    return {reinterpret_cast<const uint8_t*>(s.data()), s.size()};
}

} // namespace

TEST(ChecksumTest, EmptyInputIsZero) {
    EXPECT_EQ(checksum::compute({}), 0U);
}

TEST(ChecksumTest, StandardCheckValue) {
    // CRC-32 (IEEE 802.3) check value
    EXPECT_EQ(checksum::compute(as_bytes("123456789")), 0xCBF43926U);
}

TEST(ChecksumTest, KnownVector) {
    EXPECT_EQ(checksum::compute(as_bytes("The quick brown fox jumps over the lazy dog")),
              0x414FA339U);
}

TEST(ChecksumTest, IncrementalMatchesOneShot) {
    std::vector<uint8_t> data(10'000);
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<uint8_t>(i * 7);
    }

    checksum::Crc32 crc;
    std::span<const uint8_t> all(data);
    crc.update(all.subspan(0, 1));
    crc.update(all.subspan(1, 4095));
    crc.update(all.subspan(4096));
    EXPECT_EQ(crc.value(), checksum::compute(data));

    crc.reset();
    EXPECT_EQ(crc.value(), 0U);
}

TEST(ChecksumTest, VerifyDetectsSingleBitFlip) {
    std::vector<uint8_t> data{1, 2, 3, 4, 5, 6, 7, 8};
    uint32_t crc = checksum::compute(data);
    EXPECT_TRUE(checksum::verify(data, crc));

    data[3] ^= 0x10;
    EXPECT_FALSE(checksum::verify(data, crc));
}
