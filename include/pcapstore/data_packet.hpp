#pragma once

#include <filesystem>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <cstddef>
#include <cstdint>

#include "checksum.hpp"
#include "error.hpp"
#include "format.hpp"
#include "store_config.hpp"
#include "timestamp.hpp"

namespace pcapstore {

/**
 * @brief Immutable timestamped payload
 *
 * The unit of storage. The checksum is computed once at creation on the write path, or
 * taken from the packet header on the read path (and verified separately).
 *
 * Example usage:
 * @code
 * auto pkt = pcapstore::DataPacket::create(pcapstore::Timestamp::now(), bytes);
 * if (pkt) {
 *     writer.write_packet(*pkt);
 * }
 * @endcode
 */
class DataPacket {
public:
    /**
     * @brief Build a packet from a payload, computing its checksum
     *
     * @param timestamp Capture time
     * @param payload Payload bytes (copied)
     * @param format Format constants providing the payload size limit
     * @return Packet, or validation_error if the payload exceeds format.max_packet_size
     */
    [[nodiscard]] static Result<DataPacket> create(Timestamp timestamp,
                                                   std::span<const uint8_t> payload,
                                                   const FormatConfig& format = {}) {
        if (payload.size() > format.max_packet_size) {
            return make_error(ErrorCode::validation_error,
                              "payload of " + std::to_string(payload.size()) +
                                  " bytes exceeds limit of " +
                                  std::to_string(format.max_packet_size));
        }
        std::vector<uint8_t> owned(payload.begin(), payload.end());
        uint32_t crc = checksum::compute(owned);
        return DataPacket(timestamp, std::move(owned), crc);
    }

    [[nodiscard]] static Result<DataPacket> create(Timestamp timestamp,
                                                   std::vector<uint8_t>&& payload,
                                                   const FormatConfig& format = {}) {
        if (payload.size() > format.max_packet_size) {
            return make_error(ErrorCode::validation_error,
                              "payload of " + std::to_string(payload.size()) +
                                  " bytes exceeds limit of " +
                                  std::to_string(format.max_packet_size));
        }
        uint32_t crc = checksum::compute(payload);
        return DataPacket(timestamp, std::move(payload), crc);
    }

    /**
     * @brief Rebuild a packet read from disk, keeping the stored checksum
     */
    [[nodiscard]] static DataPacket from_header(const format::PacketHeader& header,
                                                std::vector<uint8_t>&& payload) {
        return DataPacket(header.timestamp(), std::move(payload), header.checksum);
    }

    DataPacket() = default;

    [[nodiscard]] Timestamp timestamp() const noexcept { return timestamp_; }
    [[nodiscard]] std::span<const uint8_t> payload() const noexcept { return payload_; }
    [[nodiscard]] uint32_t checksum() const noexcept { return checksum_; }
    [[nodiscard]] size_t payload_length() const noexcept { return payload_.size(); }

    /**
     * @brief Bytes this packet occupies on disk (header + payload)
     */
    [[nodiscard]] size_t total_size() const noexcept {
        return format::PacketHeader::size + payload_.size();
    }

    [[nodiscard]] format::PacketHeader header() const noexcept {
        return format::PacketHeader{.ts_seconds = timestamp_.seconds(),
                                    .ts_nanoseconds = timestamp_.nanoseconds(),
                                    .payload_length = static_cast<uint32_t>(payload_.size()),
                                    .checksum = checksum_};
    }

    /**
     * @brief Recompute the payload CRC and compare with the carried checksum
     */
    [[nodiscard]] bool verify_checksum() const noexcept {
        return checksum::verify(payload_, checksum_);
    }

    bool operator==(const DataPacket&) const = default;

private:
    DataPacket(Timestamp timestamp, std::vector<uint8_t>&& payload, uint32_t crc)
        : timestamp_(timestamp),
          payload_(std::move(payload)),
          checksum_(crc) {}

    Timestamp timestamp_{};
    std::vector<uint8_t> payload_{};
    uint32_t checksum_{0};
};

/**
 * @brief Outcome of checksum validation for a packet read from disk
 */
enum class ChecksumStatus : uint8_t {
    not_checked, ///< Verification disabled for this read
    valid,       ///< Recomputed CRC matches the header
    mismatch     ///< Recomputed CRC differs; payload returned as stored
};

[[nodiscard]] constexpr const char* checksum_status_string(ChecksumStatus status) noexcept {
    switch (status) {
        case ChecksumStatus::not_checked:
            return "not_checked";
        case ChecksumStatus::valid:
            return "valid";
        case ChecksumStatus::mismatch:
            return "mismatch";
    }
    return "unknown";
}

/**
 * @brief A packet together with where it came from
 *
 * Returned by every read. Position metadata travels with the packet rather than being
 * tracked in a side table keyed by packet identity.
 */
struct PacketRecord {
    DataPacket packet;
    uint64_t sequence{0};           ///< 0-based position across the whole store
    std::filesystem::path segment{}; ///< Segment file the packet was read from
    uint64_t offset{0};             ///< Byte offset of the packet header in that segment
    ChecksumStatus checksum_status{ChecksumStatus::not_checked};

    [[nodiscard]] bool checksum_ok() const noexcept {
        return checksum_status != ChecksumStatus::mismatch;
    }
};

} // namespace pcapstore
