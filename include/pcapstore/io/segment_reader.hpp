// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <array>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <sys/types.h>

#include "../data_packet.hpp"
#include "../error.hpp"
#include "../expected.hpp"
#include "../format.hpp"
#include "../logging.hpp"
#include "../store_config.hpp"
#include "detail/file_handle.hpp"

namespace pcapstore::io {

/**
 * @brief Sequential reader for a single segment file
 *
 * Validates the File Header on open, then decodes {Packet Header, payload} pairs in
 * file order. Each call returns a PacketRecord carrying the packet, its byte offset and
 * the outcome of checksum verification.
 *
 * Error handling contract for read_next_packet():
 * - EndOfStream at the logical end of the file
 * - truncated_data when the file ends inside a packet; reported once, then EndOfStream
 * - format_error when a header declares a payload above the size limit; the segment is
 *   treated as exhausted afterwards
 * - io_error on an OS read failure
 * - A checksum mismatch is not an error: the record is returned with
 *   ChecksumStatus::mismatch and a warning is logged
 *
 * @warning This class is MOVE-ONLY due to file handle ownership.
 *
 * Example usage:
 * @code
 * auto reader = SegmentReader::open(path);
 * while (true) {
 *     auto rec = reader->read_next_packet();
 *     if (!rec) {
 *         break; // EndOfStream or StoreError
 *     }
 *     process(rec->packet);
 * }
 * @endcode
 */
class SegmentReader {
public:
    using ReadResult = expected<PacketRecord, ReaderError>;

    /**
     * @brief Open a segment and validate its File Header
     *
     * @return Reader positioned at the first packet; io_error if the file cannot be
     *         opened; format_error on a short header or magic/version mismatch
     */
    [[nodiscard]] static Result<SegmentReader> open(const std::filesystem::path& path,
                                                    const FormatConfig& format = {}) {
        detail::FileStream file(std::fopen(path.c_str(), "rb"));
        if (!file) {
            return make_error(ErrorCode::io_error, "cannot open segment file", path, -1, errno);
        }

        if (::fseeko(file.get(), 0, SEEK_END) != 0) {
            return make_error(ErrorCode::io_error, "cannot determine segment size", path, -1,
                              errno);
        }
        off_t end = ::ftello(file.get());
        if (end < 0 || ::fseeko(file.get(), 0, SEEK_SET) != 0) {
            return make_error(ErrorCode::io_error, "cannot determine segment size", path, -1,
                              errno);
        }
        uint64_t file_size = static_cast<uint64_t>(end);

        if (file_size < format::FileHeader::size) {
            return make_error(ErrorCode::format_error,
                              "segment shorter than file header (" + std::to_string(file_size) +
                                  " bytes)",
                              path, 0);
        }

        std::array<uint8_t, format::FileHeader::size> raw{};
        if (std::fread(raw.data(), raw.size(), 1, file.get()) != 1) {
            return make_error(ErrorCode::io_error, "cannot read segment file header", path, 0,
                              errno);
        }
        auto header = format::decode_file_header(raw);
        if (!header) {
            return unexpected<StoreError>(std::move(header.error()));
        }
        if (!format::matches(*header, format.segment_magic, format.version_major,
                             format.version_minor)) {
            return make_error(ErrorCode::format_error,
                              "segment magic/version mismatch (magic " +
                                  std::to_string(header->magic) + ", version " +
                                  std::to_string(header->version_major) + "." +
                                  std::to_string(header->version_minor) + ")",
                              path, 0);
        }

        PCAPSTORE_LOG_DEBUG("opened segment {} ({} bytes)", path.string(), file_size);
        return SegmentReader(path, std::move(file), format, *header, file_size);
    }

    SegmentReader(const SegmentReader&) = delete;
    SegmentReader& operator=(const SegmentReader&) = delete;

    SegmentReader(SegmentReader&&) noexcept = default;
    SegmentReader& operator=(SegmentReader&&) noexcept = default;

    /**
     * @brief Read the next packet
     *
     * @param verify Recompute the payload CRC and report the result in the record
     * @return Record on success, ReaderError otherwise
     */
    [[nodiscard]] ReadResult read_next_packet(bool verify = true) {
        uint64_t offset = current_offset_;
        format::PacketHeader header;
        if (auto status = next_header(header); status.has_value()) {
            if (has_code(*status, ErrorCode::truncated_data)) {
                const auto& err = std::get<StoreError>(*status);
                PCAPSTORE_LOG_WARN("{} in {} at offset {} after {} packets", err.detail,
                                   path_.string(), offset, packet_index_);
            }
            return unexpected<ReaderError>(std::move(*status));
        }

        std::vector<uint8_t> payload(header.payload_length);
        if (!payload.empty() &&
            std::fread(payload.data(), payload.size(), 1, file_.get()) != 1) {
            int err = errno;
            exhausted_ = true;
            return unexpected<ReaderError>(
                StoreError{.code = ErrorCode::io_error,
                           .path = path_,
                           .offset = static_cast<int64_t>(offset),
                           .errno_value = err,
                           .packets_decoded = packet_index_,
                           .detail = "cannot read packet payload"});
        }
        current_offset_ += header.payload_length;

        ChecksumStatus status = ChecksumStatus::not_checked;
        if (verify) {
            if (checksum::verify(payload, header.checksum)) {
                status = ChecksumStatus::valid;
            } else {
                status = ChecksumStatus::mismatch;
                PCAPSTORE_LOG_WARN("checksum mismatch in {} at offset {} (packet {})",
                                   path_.string(), offset, packet_index_);
            }
        }

        PacketRecord record{.packet = DataPacket::from_header(header, std::move(payload)),
                            .sequence = packet_index_,
                            .segment = path_,
                            .offset = offset,
                            .checksum_status = status};
        ++packet_index_;
        ++packets_read_;
        return record;
    }

    /**
     * @brief Position the cursor at a packet boundary recorded elsewhere
     *
     * Seeks straight to the offset without reading the packets before it. The offset
     * must be the start of a packet header (as recorded by the project index); a
     * mid-packet offset shows up as a format_error on the next read.
     *
     * @param offset Byte offset of a packet header
     * @param packet_index Ordinal of that packet within the segment
     * @return validation_error for offsets inside the File Header or past EOF;
     *         io_error if the seek fails
     */
    [[nodiscard]] Result<void> seek_to_offset(uint64_t offset, uint64_t packet_index) {
        if (offset < format::FileHeader::size || offset > file_size_) {
            return make_error(ErrorCode::validation_error,
                              "offset outside packet area of segment", path_,
                              static_cast<int64_t>(offset));
        }
        std::clearerr(file_.get());
        if (::fseeko(file_.get(), static_cast<off_t>(offset), SEEK_SET) != 0) {
            return make_error(ErrorCode::io_error, "cannot seek in segment", path_,
                              static_cast<int64_t>(offset), errno);
        }
        current_offset_ = offset;
        packet_index_ = packet_index;
        exhausted_ = false;
        truncated_reported_ = false;
        return {};
    }

    /**
     * @brief Advance past up to n packets reading only their headers
     *
     * Stops early at EndOfStream or in front of a truncated trailing packet (which the
     * next read_next_packet() then reports).
     *
     * @return Number of packets skipped, or format_error/io_error
     */
    [[nodiscard]] Result<size_t> skip_packets(size_t n) {
        size_t skipped = 0;
        while (skipped < n) {
            uint64_t offset = current_offset_;
            format::PacketHeader header;
            if (auto status = next_header(header); status.has_value()) {
                if (is_eof(*status)) {
                    break;
                }
                auto& err = std::get<StoreError>(*status);
                if (err.code == ErrorCode::truncated_data) {
                    // Leave the truncation for the next read to report
                    truncated_reported_ = false;
                    exhausted_ = false;
                    restore(offset);
                    break;
                }
                return unexpected<StoreError>(std::move(err));
            }
            if (!skip_payload(header)) {
                return make_error(ErrorCode::io_error, "cannot seek in segment", path_,
                                  static_cast<int64_t>(offset), errno);
            }
            ++packet_index_;
            ++skipped;
        }
        return skipped;
    }

    /**
     * @brief Count whole packets in the segment without reading payloads
     *
     * The cursor position is preserved.
     */
    [[nodiscard]] Result<size_t> count_packets() {
        uint64_t saved_offset = current_offset_;
        uint64_t saved_index = packet_index_;
        bool saved_exhausted = exhausted_;
        bool saved_truncated = truncated_reported_;

        rewind();
        auto counted = skip_packets(SIZE_MAX);

        restore(saved_offset);
        packet_index_ = saved_index;
        exhausted_ = saved_exhausted;
        truncated_reported_ = saved_truncated;
        return counted;
    }

    /**
     * @brief Rewind to the first packet
     */
    void rewind() noexcept {
        packet_index_ = 0;
        exhausted_ = false;
        truncated_reported_ = false;
        restore(format::FileHeader::size);
    }

    /**
     * @brief Get current byte offset in the file
     */
    [[nodiscard]] uint64_t tell() const noexcept { return current_offset_; }

    /**
     * @brief Get total file size
     */
    [[nodiscard]] uint64_t size() const noexcept { return file_size_; }

    /**
     * @brief Get number of packets returned by read_next_packet() since open
     */
    [[nodiscard]] size_t packets_read() const noexcept { return packets_read_; }

    /**
     * @brief Ordinal (within this segment) of the packet the cursor is at
     */
    [[nodiscard]] uint64_t packet_index() const noexcept { return packet_index_; }

    [[nodiscard]] const format::FileHeader& header() const noexcept { return header_; }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    /**
     * @brief Check if no further packets can be returned
     */
    [[nodiscard]] bool at_end() const noexcept {
        return exhausted_ || current_offset_ >= file_size_;
    }

private:
    SegmentReader(std::filesystem::path path, detail::FileStream file, const FormatConfig& format,
                  const format::FileHeader& header, uint64_t file_size)
        : path_(std::move(path)),
          file_(std::move(file)),
          format_(format),
          header_(header),
          file_size_(file_size),
          current_offset_(format::FileHeader::size) {}

    /**
     * Read and validate the header at the cursor.
     * Returns nullopt on success, otherwise the ReaderError to surface.
     */
    std::optional<ReaderError> next_header(format::PacketHeader& out) {
        if (exhausted_ || current_offset_ >= file_size_) {
            return EndOfStream{};
        }

        uint64_t offset = current_offset_;
        uint64_t remaining = file_size_ - current_offset_;
        if (remaining < format::PacketHeader::size) {
            return truncation(offset, "file ends inside packet header");
        }

        std::array<uint8_t, format::PacketHeader::size> raw{};
        if (std::fread(raw.data(), raw.size(), 1, file_.get()) != 1) {
            int err = errno;
            exhausted_ = true;
            return StoreError{.code = ErrorCode::io_error,
                              .path = path_,
                              .offset = static_cast<int64_t>(offset),
                              .errno_value = err,
                              .packets_decoded = packet_index_,
                              .detail = "cannot read packet header"};
        }
        auto header = format::decode_packet_header(raw);
        if (!header) {
            exhausted_ = true;
            return std::move(header.error());
        }
        if (header->payload_length > format_.max_packet_size) {
            exhausted_ = true;
            return StoreError{.code = ErrorCode::format_error,
                              .path = path_,
                              .offset = static_cast<int64_t>(offset),
                              .errno_value = 0,
                              .packets_decoded = packet_index_,
                              .detail = "corrupt packet header: payload length " +
                                        std::to_string(header->payload_length) +
                                        " exceeds limit " +
                                        std::to_string(format_.max_packet_size)};
        }
        if (remaining - format::PacketHeader::size < header->payload_length) {
            restore(offset);
            return truncation(offset, "file ends inside packet payload");
        }

        current_offset_ += format::PacketHeader::size;
        out = *header;
        return std::nullopt;
    }

    ReaderError truncation(uint64_t offset, const char* what) {
        exhausted_ = true;
        if (truncated_reported_) {
            return EndOfStream{};
        }
        truncated_reported_ = true;
        return StoreError{.code = ErrorCode::truncated_data,
                          .path = path_,
                          .offset = static_cast<int64_t>(offset),
                          .errno_value = 0,
                          .packets_decoded = packet_index_,
                          .detail = what};
    }

    bool skip_payload(const format::PacketHeader& header) noexcept {
        if (::fseeko(file_.get(), static_cast<off_t>(header.payload_length), SEEK_CUR) != 0) {
            return false;
        }
        current_offset_ += header.payload_length;
        return true;
    }

    void restore(uint64_t offset) noexcept {
        std::clearerr(file_.get());
        if (::fseeko(file_.get(), static_cast<off_t>(offset), SEEK_SET) == 0) {
            current_offset_ = offset;
        } else {
            exhausted_ = true;
        }
    }

    std::filesystem::path path_;
    detail::FileStream file_;
    FormatConfig format_;
    format::FileHeader header_;
    uint64_t file_size_{0};
    uint64_t current_offset_{0};
    uint64_t packet_index_{0};        ///< Ordinal of the packet at the cursor
    size_t packets_read_{0};
    bool exhausted_{false};           ///< No further packets (EOF, corrupt header or I/O error)
    bool truncated_reported_{false};  ///< truncated_data already returned once
};

} // namespace pcapstore::io
