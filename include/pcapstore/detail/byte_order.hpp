#pragma once

#include <bit>

#include <cstddef>
#include <cstdint>
#include <cstring>

namespace pcapstore::detail {

// ============================================================================
// Little-endian host conversion
// All on-disk integers are little-endian regardless of host order.
// ============================================================================

[[nodiscard]] constexpr uint16_t host_to_le16(uint16_t value) noexcept {
    if constexpr (std::endian::native == std::endian::big) {
        return __builtin_bswap16(value);
    }
    return value;
}

[[nodiscard]] constexpr uint32_t host_to_le32(uint32_t value) noexcept {
    if constexpr (std::endian::native == std::endian::big) {
        return __builtin_bswap32(value);
    }
    return value;
}

[[nodiscard]] constexpr uint64_t host_to_le64(uint64_t value) noexcept {
    if constexpr (std::endian::native == std::endian::big) {
        return __builtin_bswap64(value);
    }
    return value;
}

[[nodiscard]] constexpr uint16_t le_to_host16(uint16_t value) noexcept {
    return host_to_le16(value);
}

[[nodiscard]] constexpr uint32_t le_to_host32(uint32_t value) noexcept {
    return host_to_le32(value);
}

[[nodiscard]] constexpr uint64_t le_to_host64(uint64_t value) noexcept {
    return host_to_le64(value);
}

// ============================================================================
// Unaligned buffer access (caller guarantees bounds)
// ============================================================================

[[nodiscard]] inline uint16_t read_le16(const uint8_t* data, size_t offset) noexcept {
    uint16_t value;
    std::memcpy(&value, data + offset, sizeof(value));
    return le_to_host16(value);
}

[[nodiscard]] inline uint32_t read_le32(const uint8_t* data, size_t offset) noexcept {
    uint32_t value;
    std::memcpy(&value, data + offset, sizeof(value));
    return le_to_host32(value);
}

[[nodiscard]] inline uint64_t read_le64(const uint8_t* data, size_t offset) noexcept {
    uint64_t value;
    std::memcpy(&value, data + offset, sizeof(value));
    return le_to_host64(value);
}

inline void write_le16(uint8_t* data, size_t offset, uint16_t value) noexcept {
    value = host_to_le16(value);
    std::memcpy(data + offset, &value, sizeof(value));
}

inline void write_le32(uint8_t* data, size_t offset, uint32_t value) noexcept {
    value = host_to_le32(value);
    std::memcpy(data + offset, &value, sizeof(value));
}

inline void write_le64(uint8_t* data, size_t offset, uint64_t value) noexcept {
    value = host_to_le64(value);
    std::memcpy(data + offset, &value, sizeof(value));
}

} // namespace pcapstore::detail
