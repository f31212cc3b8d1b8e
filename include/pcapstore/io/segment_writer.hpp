// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <filesystem>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

#include "../data_packet.hpp"
#include "../error.hpp"
#include "../format.hpp"
#include "../logging.hpp"
#include "../store_config.hpp"
#include "detail/file_handle.hpp"

namespace pcapstore::io {

/**
 * @brief Append-only writer for a single segment file
 *
 * Creates the file, writes the File Header, then appends {Packet Header, payload} pairs
 * through an internal buffer. Payloads that do not fit the buffer are written directly
 * after draining it, so memory use stays bounded regardless of packet size.
 *
 * Error model:
 * - Oversized payloads are rejected before anything is written
 * - An OS write failure makes the writer sticky-failed; every later append returns
 *   io_error carrying the original errno
 * - After close(), append returns invalid_state
 *
 * The writer does not decide when to rotate; StoreWriter checks packets_written()
 * against the configured threshold.
 *
 * @warning This class is MOVE-ONLY due to file handle ownership.
 *
 * Example usage:
 * @code
 * auto writer = SegmentWriter::create("rec/data_240101_120000_0000000.pcap");
 * if (!writer) {
 *     return writer.error();
 * }
 * writer->append(packet);
 * writer->close();
 * @endcode
 */
class SegmentWriter {
public:
    /**
     * @brief Create a segment file and write its File Header
     *
     * @param path File to create
     * @param format Format constants written to the header and enforced on append
     * @param overwrite Truncate an existing file instead of failing
     * @param buffer_size Size of the internal write buffer
     * @return Writer, or io_error (with errno) if the file exists or cannot be created
     */
    [[nodiscard]] static Result<SegmentWriter> create(const std::filesystem::path& path,
                                                      const FormatConfig& format = {},
                                                      bool overwrite = false,
                                                      size_t buffer_size = DEFAULT_WRITE_BUFFER_SIZE) {
        int flags = O_WRONLY | O_CREAT | O_CLOEXEC | (overwrite ? O_TRUNC : O_EXCL);
        detail::FileDescriptor fd(::open(path.c_str(), flags, 0644));
        if (!fd) {
            int err = errno;
            return make_error(ErrorCode::io_error,
                              err == EEXIST ? "segment file already exists"
                                            : "cannot create segment file",
                              path, -1, err);
        }

        SegmentWriter writer(path, std::move(fd), format, buffer_size);

        format::FileHeader header{.magic = format.segment_magic,
                                  .version_major = format.version_major,
                                  .version_minor = format.version_minor,
                                  .timezone_offset = format.timezone_offset,
                                  .timestamp_accuracy = format.timestamp_accuracy};
        auto encoded = format::encode(header);
        if (int err = detail::write_all(writer.fd_.get(), encoded.data(), encoded.size());
            err != 0) {
            return make_error(ErrorCode::io_error, "cannot write segment file header", path, 0,
                              err);
        }
        writer.file_bytes_ = encoded.size();
        writer.dirty_ = true;

        PCAPSTORE_LOG_DEBUG("created segment {}", path.string());
        return writer;
    }

    /**
     * @brief Destructor - flushes and closes file
     */
    ~SegmentWriter() noexcept { close_quietly(); }

    // Non-copyable due to file descriptor ownership
    SegmentWriter(const SegmentWriter&) = delete;
    SegmentWriter& operator=(const SegmentWriter&) = delete;

    // Move-only semantics
    SegmentWriter(SegmentWriter&& other) noexcept
        : path_(std::move(other.path_)),
          fd_(std::move(other.fd_)),
          format_(other.format_),
          buffer_(std::move(other.buffer_)),
          buffer_pos_(std::exchange(other.buffer_pos_, 0)),
          file_bytes_(other.file_bytes_),
          packets_written_(other.packets_written_),
          dirty_(std::exchange(other.dirty_, false)),
          last_errno_(other.last_errno_) {}

    SegmentWriter& operator=(SegmentWriter&& other) noexcept {
        if (this != &other) {
            close_quietly();
            path_ = std::move(other.path_);
            fd_ = std::move(other.fd_);
            format_ = other.format_;
            buffer_ = std::move(other.buffer_);
            buffer_pos_ = std::exchange(other.buffer_pos_, 0);
            file_bytes_ = other.file_bytes_;
            packets_written_ = other.packets_written_;
            dirty_ = std::exchange(other.dirty_, false);
            last_errno_ = other.last_errno_;
        }
        return *this;
    }

    /**
     * @brief Append one packet
     *
     * Header and payload are written as one logical unit; counters advance only once
     * both are accepted.
     *
     * @return Bytes appended (header + payload)
     */
    [[nodiscard]] Result<size_t> append(const DataPacket& packet) {
        if (!fd_) {
            return make_error(ErrorCode::invalid_state, "segment writer is closed", path_);
        }
        if (last_errno_ != 0) {
            return make_error(ErrorCode::io_error, "segment writer failed earlier", path_,
                              static_cast<int64_t>(next_offset()), last_errno_);
        }
        if (packet.payload_length() > format_.max_packet_size) {
            return make_error(ErrorCode::validation_error,
                              "payload of " + std::to_string(packet.payload_length()) +
                                  " bytes exceeds limit of " +
                                  std::to_string(format_.max_packet_size),
                              path_);
        }

        auto header = format::encode(packet.header());
        auto payload = packet.payload();
        size_t total = header.size() + payload.size();
        uint64_t offset = next_offset();

        if (buffer_pos_ + total > buffer_.size()) {
            if (auto r = drain_buffer(); !r) {
                return unexpected<StoreError>(std::move(r.error()));
            }
        }

        if (total > buffer_.size()) {
            // Too large for the buffer: write straight through
            if (int err = detail::write_all(fd_.get(), header.data(), header.size()); err != 0) {
                return fail("cannot write packet header", offset, err);
            }
            if (int err = detail::write_all(fd_.get(), payload.data(), payload.size());
                err != 0) {
                return fail("cannot write packet payload", offset, err);
            }
            file_bytes_ += total;
        } else {
            std::memcpy(buffer_.data() + buffer_pos_, header.data(), header.size());
            if (!payload.empty()) {
                std::memcpy(buffer_.data() + buffer_pos_ + header.size(), payload.data(),
                            payload.size());
            }
            buffer_pos_ += total;
        }

        dirty_ = true;
        ++packets_written_;
        return total;
    }

    /**
     * @brief Write buffered bytes and sync them to stable storage
     *
     * Issues fdatasync only when bytes were written since the last sync, so repeated
     * calls are cheap.
     */
    [[nodiscard]] Result<void> flush() {
        if (!fd_) {
            return {};
        }
        if (last_errno_ != 0) {
            return make_error(ErrorCode::io_error, "segment writer failed earlier", path_, -1,
                              last_errno_);
        }
        if (auto r = drain_buffer(); !r) {
            return r;
        }
        if (dirty_) {
            if (::fdatasync(fd_.get()) != 0) {
                return fail("fdatasync failed", -1, errno);
            }
            dirty_ = false;
        }
        return {};
    }

    /**
     * @brief Flush and release the file
     *
     * The file handle is released even if the flush fails; the flush error is returned.
     */
    [[nodiscard]] Result<void> close() {
        if (!fd_) {
            return {};
        }
        auto flushed = flush();
        int err = fd_.close();
        if (!flushed) {
            return flushed;
        }
        if (err != 0) {
            return make_error(ErrorCode::io_error, "close failed", path_, -1, err);
        }
        PCAPSTORE_LOG_DEBUG("closed segment {} ({} packets, {} bytes)", path_.string(),
                            packets_written_, file_bytes_);
        return {};
    }

    /**
     * @brief Get number of packets appended so far
     */
    [[nodiscard]] size_t packets_written() const noexcept { return packets_written_; }

    /**
     * @brief Get logical file size (header, written and buffered bytes)
     */
    [[nodiscard]] uint64_t bytes_written() const noexcept { return file_bytes_ + buffer_pos_; }

    /**
     * @brief Byte offset the next packet header will be written at
     */
    [[nodiscard]] uint64_t next_offset() const noexcept { return file_bytes_ + buffer_pos_; }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    [[nodiscard]] bool is_open() const noexcept { return fd_.valid(); }

    /**
     * @brief Check if a write has failed (sticky until the writer is closed)
     */
    [[nodiscard]] bool has_error() const noexcept { return last_errno_ != 0; }

    [[nodiscard]] int last_errno() const noexcept { return last_errno_; }

private:
    SegmentWriter(std::filesystem::path path, detail::FileDescriptor fd, const FormatConfig& format,
                  size_t buffer_size)
        : path_(std::move(path)),
          fd_(std::move(fd)),
          format_(format),
          buffer_(buffer_size) {}

    Result<void> drain_buffer() {
        if (buffer_pos_ == 0) {
            return {};
        }
        uint64_t offset = file_bytes_;
        if (int err = detail::write_all(fd_.get(), buffer_.data(), buffer_pos_); err != 0) {
            return fail("cannot write buffered packets", static_cast<int64_t>(offset), err);
        }
        file_bytes_ += buffer_pos_;
        buffer_pos_ = 0;
        return {};
    }

    unexpected<StoreError> fail(const char* what, int64_t offset, int err) {
        last_errno_ = err;
        return make_error(ErrorCode::io_error, what, path_, offset, err);
    }

    void close_quietly() noexcept {
        if (!fd_) {
            return;
        }
        if (auto r = close(); !r) {
            PCAPSTORE_LOG_ERROR("failed to close segment: {}", r.error().describe());
        }
    }

    std::filesystem::path path_;
    detail::FileDescriptor fd_;
    FormatConfig format_;
    std::vector<uint8_t> buffer_;
    size_t buffer_pos_{0};
    uint64_t file_bytes_{0};       ///< Bytes handed to the OS
    size_t packets_written_{0};
    bool dirty_{false};            ///< Bytes written since the last fdatasync
    int last_errno_{0};
};

} // namespace pcapstore::io
