#pragma once

#include <algorithm>
#include <limits>
#include <span>

#include <cstddef>
#include <cstdint>

#include <zlib.h>

namespace pcapstore::checksum {

/**
 * @brief Incremental CRC-32 (IEEE 802.3, reflected) accumulator
 *
 * Thin wrapper over zlib's crc32(). Spans larger than zlib's uInt are fed in chunks,
 * so payloads of any size produce the same value as a single-shot computation.
 */
class Crc32 {
public:
    Crc32() noexcept : value_(::crc32(0L, Z_NULL, 0)) {}

    void update(std::span<const uint8_t> bytes) noexcept {
        constexpr size_t max_chunk = std::numeric_limits<uInt>::max();
        const uint8_t* data = bytes.data();
        size_t remaining = bytes.size();
        while (remaining > 0) {
            size_t chunk = std::min(remaining, max_chunk);
            value_ = ::crc32(value_, reinterpret_cast<const Bytef*>(data),
                             static_cast<uInt>(chunk));
            data += chunk;
            remaining -= chunk;
        }
    }

    [[nodiscard]] uint32_t value() const noexcept { return static_cast<uint32_t>(value_); }

    void reset() noexcept { value_ = ::crc32(0L, Z_NULL, 0); }

private:
    uLong value_;
};

/**
 * @brief Compute the CRC-32 of a payload
 */
[[nodiscard]] inline uint32_t compute(std::span<const uint8_t> bytes) noexcept {
    Crc32 crc;
    crc.update(bytes);
    return crc.value();
}

/**
 * @brief Check a payload against an expected CRC-32
 */
[[nodiscard]] inline bool verify(std::span<const uint8_t> bytes, uint32_t expected) noexcept {
    return compute(bytes) == expected;
}

} // namespace pcapstore::checksum
