#pragma once

#include <chrono>
#include <string>

#include <cstddef>
#include <cstdint>

#include "error.hpp"

namespace pcapstore {

// ============================================================================
// On-disk format constants
// ============================================================================

inline constexpr uint32_t SEGMENT_MAGIC = 0xD4C3B2A1;
inline constexpr uint32_t INDEX_MAGIC = 0xA1B2C3D4;
inline constexpr uint16_t VERSION_MAJOR = 2;
inline constexpr uint16_t VERSION_MINOR = 4;

/// Hard upper bound on a single payload (30 MiB)
inline constexpr uint32_t MAX_PACKET_SIZE_LIMIT = 30U * 1024U * 1024U;

inline constexpr uint32_t DEFAULT_MAX_PACKETS_PER_SEGMENT = 500;
inline constexpr size_t DEFAULT_WRITE_BUFFER_SIZE = 64 * 1024;
inline constexpr size_t MIN_WRITE_BUFFER_SIZE = 1024;

/**
 * @brief Format constants shared by every writer and reader of a store
 *
 * Injected into each component at construction so a store can be read back with
 * exactly the constants it was written with.
 */
struct FormatConfig {
    uint32_t segment_magic = SEGMENT_MAGIC;
    uint32_t index_magic = INDEX_MAGIC;
    uint16_t version_major = VERSION_MAJOR;
    uint16_t version_minor = VERSION_MINOR;
    int32_t timezone_offset = 0;    ///< Informational only
    uint32_t timestamp_accuracy = 0; ///< Reserved, always zero
    uint32_t max_packet_size = MAX_PACKET_SIZE_LIMIT;

    bool operator==(const FormatConfig&) const noexcept = default;
};

/**
 * @brief Store-level tuning knobs
 *
 * Aggregate; use designated initializers to override individual fields:
 * @code
 * pcapstore::StoreConfig config{.max_packets_per_segment = 1000, .auto_flush = true};
 * @endcode
 */
struct StoreConfig {
    FormatConfig format{};
    uint32_t max_packets_per_segment = DEFAULT_MAX_PACKETS_PER_SEGMENT;
    std::chrono::nanoseconds index_interval = std::chrono::seconds{1};
    size_t write_buffer_size = DEFAULT_WRITE_BUFFER_SIZE;
    bool auto_flush = false;           ///< Flush after every packet
    bool verify_checksums = true;      ///< Recompute CRC on read
    bool overwrite = false;            ///< Replace an existing store on create
    bool skip_corrupt_segments = true; ///< Reader skips unreadable segments instead of failing

    /**
     * @brief Larger segments and write buffer for sustained high packet rates
     */
    static StoreConfig high_throughput() {
        return StoreConfig{.max_packets_per_segment = 2000, .write_buffer_size = 1024 * 1024};
    }

    /**
     * @brief Small segments and write buffer for constrained hosts
     */
    static StoreConfig low_memory() {
        return StoreConfig{.max_packets_per_segment = 100, .write_buffer_size = 4 * 1024};
    }
};

/**
 * @brief Check a configuration before use
 * @return void on success, validation_error describing the first bad field otherwise
 */
[[nodiscard]] inline Result<void> validate(const StoreConfig& config) {
    if (config.max_packets_per_segment == 0) {
        return make_error(ErrorCode::validation_error, "max_packets_per_segment must be > 0");
    }
    if (config.index_interval.count() <= 0) {
        return make_error(ErrorCode::validation_error, "index_interval must be positive");
    }
    if (config.format.max_packet_size == 0 ||
        config.format.max_packet_size > MAX_PACKET_SIZE_LIMIT) {
        return make_error(ErrorCode::validation_error,
                          "max_packet_size must be in (0, " +
                              std::to_string(MAX_PACKET_SIZE_LIMIT) + "]");
    }
    if (config.write_buffer_size < MIN_WRITE_BUFFER_SIZE) {
        return make_error(ErrorCode::validation_error,
                          "write_buffer_size must be at least " +
                              std::to_string(MIN_WRITE_BUFFER_SIZE));
    }
    return {};
}

} // namespace pcapstore
