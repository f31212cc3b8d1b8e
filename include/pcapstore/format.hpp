#pragma once

#include <algorithm>
#include <array>
#include <span>
#include <string>
#include <string_view>

#include <cstddef>
#include <cstdint>

#include "detail/byte_order.hpp"
#include "error.hpp"
#include "timestamp.hpp"

/**
 * @file format.hpp
 * @brief Fixed-layout binary codecs for segment and index files
 *
 * Every structure on disk is little-endian with no padding. Encoders produce a
 * fixed-size std::array; decoders take a span and fail with format_error when the
 * span is shorter than the layout. Codecs perform no I/O.
 *
 * Segment file:
 * @code
 * [FileHeader 16B] [PacketHeader 16B][payload] [PacketHeader 16B][payload] ...
 * @endcode
 *
 * Index file:
 * @code
 * [IndexHeader 32B] [IndexEntry 96B] [IndexEntry 96B] ...
 * @endcode
 */

namespace pcapstore::format {

// ============================================================================
// File Header (16 bytes)
// ============================================================================

struct FileHeader {
    static constexpr size_t size = 16;

    uint32_t magic{0};
    uint16_t version_major{0};
    uint16_t version_minor{0};
    int32_t timezone_offset{0};
    uint32_t timestamp_accuracy{0};

    bool operator==(const FileHeader&) const noexcept = default;
};

// ============================================================================
// Packet Header (16 bytes)
// ============================================================================

struct PacketHeader {
    static constexpr size_t size = 16;

    uint32_t ts_seconds{0};
    uint32_t ts_nanoseconds{0};
    uint32_t payload_length{0};
    uint32_t checksum{0};

    [[nodiscard]] constexpr Timestamp timestamp() const noexcept {
        return Timestamp(ts_seconds, ts_nanoseconds);
    }

    bool operator==(const PacketHeader&) const noexcept = default;
};

// ============================================================================
// Index Header (32 bytes)
// ============================================================================

struct IndexHeader {
    static constexpr size_t size = 32;

    uint32_t magic{0};
    uint16_t version_major{0};
    uint16_t version_minor{0};
    uint64_t interval_ns{0};             ///< Sampling interval
    uint32_t max_packets_per_segment{0}; ///< Rotation threshold the store was written with
    uint32_t reserved{0};
    uint32_t created_seconds{0};
    uint32_t created_nanoseconds{0};

    bool operator==(const IndexHeader&) const noexcept = default;
};

// ============================================================================
// Index Entry (96 bytes)
// ============================================================================

struct IndexEntry {
    static constexpr size_t size = 96;
    static constexpr size_t max_segment_name = 64;
    static constexpr size_t name_offset = 32;

    Timestamp timestamp{};
    uint64_t offset{0};     ///< Byte offset of the packet header inside the segment
    uint32_t packet_size{0}; ///< Header + payload bytes
    uint64_t sequence{0};    ///< Ordinal of the packet in the store, as written
    std::string segment{};   ///< File name relative to the segment directory

    bool operator==(const IndexEntry&) const = default;
};

// ============================================================================
// Encoders
// ============================================================================

[[nodiscard]] inline std::array<uint8_t, FileHeader::size> encode(const FileHeader& h) noexcept {
    std::array<uint8_t, FileHeader::size> out{};
    detail::write_le32(out.data(), 0, h.magic);
    detail::write_le16(out.data(), 4, h.version_major);
    detail::write_le16(out.data(), 6, h.version_minor);
    detail::write_le32(out.data(), 8, static_cast<uint32_t>(h.timezone_offset));
    detail::write_le32(out.data(), 12, h.timestamp_accuracy);
    return out;
}

[[nodiscard]] inline std::array<uint8_t, PacketHeader::size>
encode(const PacketHeader& h) noexcept {
    std::array<uint8_t, PacketHeader::size> out{};
    detail::write_le32(out.data(), 0, h.ts_seconds);
    detail::write_le32(out.data(), 4, h.ts_nanoseconds);
    detail::write_le32(out.data(), 8, h.payload_length);
    detail::write_le32(out.data(), 12, h.checksum);
    return out;
}

[[nodiscard]] inline std::array<uint8_t, IndexHeader::size> encode(const IndexHeader& h) noexcept {
    std::array<uint8_t, IndexHeader::size> out{};
    detail::write_le32(out.data(), 0, h.magic);
    detail::write_le16(out.data(), 4, h.version_major);
    detail::write_le16(out.data(), 6, h.version_minor);
    detail::write_le64(out.data(), 8, h.interval_ns);
    detail::write_le32(out.data(), 16, h.max_packets_per_segment);
    detail::write_le32(out.data(), 20, h.reserved);
    detail::write_le32(out.data(), 24, h.created_seconds);
    detail::write_le32(out.data(), 28, h.created_nanoseconds);
    return out;
}

/**
 * @brief Encode an index entry
 * @return Encoded bytes, or validation_error if the segment name exceeds 64 bytes
 */
[[nodiscard]] inline Result<std::array<uint8_t, IndexEntry::size>>
encode_entry(const IndexEntry& e) {
    if (e.segment.size() > IndexEntry::max_segment_name) {
        return make_error(ErrorCode::validation_error,
                          "segment name longer than " +
                              std::to_string(IndexEntry::max_segment_name) +
                              " bytes: " + e.segment);
    }
    std::array<uint8_t, IndexEntry::size> out{};
    detail::write_le32(out.data(), 0, e.timestamp.seconds());
    detail::write_le32(out.data(), 4, e.timestamp.nanoseconds());
    detail::write_le64(out.data(), 8, e.offset);
    detail::write_le32(out.data(), 16, e.packet_size);
    detail::write_le16(out.data(), 20, static_cast<uint16_t>(e.segment.size()));
    detail::write_le16(out.data(), 22, 0);
    detail::write_le64(out.data(), 24, e.sequence);
    std::copy(e.segment.begin(), e.segment.end(), out.begin() + IndexEntry::name_offset);
    return out;
}

// ============================================================================
// Decoders
// ============================================================================

inline unexpected<StoreError> short_buffer(const char* what, size_t need, size_t have) {
    return make_error(ErrorCode::format_error, std::string(what) + " needs " +
                                                   std::to_string(need) + " bytes, got " +
                                                   std::to_string(have));
}

[[nodiscard]] inline Result<FileHeader> decode_file_header(std::span<const uint8_t> bytes) {
    if (bytes.size() < FileHeader::size) {
        return short_buffer("file header", FileHeader::size, bytes.size());
    }
    const uint8_t* p = bytes.data();
    return FileHeader{.magic = detail::read_le32(p, 0),
                      .version_major = detail::read_le16(p, 4),
                      .version_minor = detail::read_le16(p, 6),
                      .timezone_offset = static_cast<int32_t>(detail::read_le32(p, 8)),
                      .timestamp_accuracy = detail::read_le32(p, 12)};
}

[[nodiscard]] inline Result<PacketHeader> decode_packet_header(std::span<const uint8_t> bytes) {
    if (bytes.size() < PacketHeader::size) {
        return short_buffer("packet header", PacketHeader::size, bytes.size());
    }
    const uint8_t* p = bytes.data();
    return PacketHeader{.ts_seconds = detail::read_le32(p, 0),
                        .ts_nanoseconds = detail::read_le32(p, 4),
                        .payload_length = detail::read_le32(p, 8),
                        .checksum = detail::read_le32(p, 12)};
}

[[nodiscard]] inline Result<IndexHeader> decode_index_header(std::span<const uint8_t> bytes) {
    if (bytes.size() < IndexHeader::size) {
        return short_buffer("index header", IndexHeader::size, bytes.size());
    }
    const uint8_t* p = bytes.data();
    return IndexHeader{.magic = detail::read_le32(p, 0),
                       .version_major = detail::read_le16(p, 4),
                       .version_minor = detail::read_le16(p, 6),
                       .interval_ns = detail::read_le64(p, 8),
                       .max_packets_per_segment = detail::read_le32(p, 16),
                       .reserved = detail::read_le32(p, 20),
                       .created_seconds = detail::read_le32(p, 24),
                       .created_nanoseconds = detail::read_le32(p, 28)};
}

[[nodiscard]] inline Result<IndexEntry> decode_index_entry(std::span<const uint8_t> bytes) {
    if (bytes.size() < IndexEntry::size) {
        return short_buffer("index entry", IndexEntry::size, bytes.size());
    }
    const uint8_t* p = bytes.data();
    uint16_t name_len = detail::read_le16(p, 20);
    if (name_len > IndexEntry::max_segment_name) {
        return make_error(ErrorCode::format_error,
                          "index entry segment name length " + std::to_string(name_len) +
                              " exceeds " + std::to_string(IndexEntry::max_segment_name));
    }
    IndexEntry entry;
    entry.timestamp = Timestamp(detail::read_le32(p, 0), detail::read_le32(p, 4));
    entry.offset = detail::read_le64(p, 8);
    entry.packet_size = detail::read_le32(p, 16);
    entry.sequence = detail::read_le64(p, 24);
    entry.segment.assign(reinterpret_cast<const char*>(p + IndexEntry::name_offset), name_len);
    return entry;
}

// ============================================================================
// Header validation against configured constants
// ============================================================================

/**
 * @brief Check whether a decoded header matches the configured magic and version
 */
[[nodiscard]] constexpr bool matches(const FileHeader& h, uint32_t magic, uint16_t major,
                                     uint16_t minor) noexcept {
    return h.magic == magic && h.version_major == major && h.version_minor == minor;
}

[[nodiscard]] constexpr bool matches(const IndexHeader& h, uint32_t magic, uint16_t major,
                                     uint16_t minor) noexcept {
    return h.magic == magic && h.version_major == major && h.version_minor == minor;
}

} // namespace pcapstore::format
