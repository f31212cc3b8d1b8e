// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <cerrno>
#include <cstddef>
#include <cstdint>

#include "../data_packet.hpp"
#include "../error.hpp"
#include "../logging.hpp"
#include "../store_config.hpp"
#include "../timestamp.hpp"
#include "project_index.hpp"
#include "segment_writer.hpp"
#include "store_layout.hpp"

namespace pcapstore::io {

/**
 * @brief Lifecycle of a StoreWriter
 */
enum class WriterState : uint8_t {
    created, ///< Not yet initialized
    active,  ///< Accepting packets
    closed   ///< Closed; writes return invalid_state
};

[[nodiscard]] constexpr const char* writer_state_string(WriterState state) noexcept {
    switch (state) {
        case WriterState::created:
            return "created";
        case WriterState::active:
            return "active";
        case WriterState::closed:
            return "closed";
    }
    return "unknown";
}

/**
 * @brief Record packets into a segmented store
 *
 * Owns the project index and the current segment. Each packet is appended to the
 * current segment; once that segment holds max_packets_per_segment packets it is closed
 * and a new one is created before the next packet is accepted, so rotation never splits
 * a packet and the packet that reaches the threshold stays in the full segment.
 *
 * An index sample is recorded for the first packet of every segment and whenever the
 * sampling interval has elapsed since the last sample. Packets older than the last
 * sample are rejected with validation_error before anything is written, which keeps the
 * index sorted.
 *
 * Thread safety: none. Callers serialize write_packet(), flush() and close().
 *
 * @warning This class is MOVE-ONLY due to file handle ownership.
 *
 * Example usage:
 * @code
 * auto writer = StoreWriter::create("/data/recordings", "run42");
 * for (auto& pkt : packets) {
 *     if (auto r = writer->write_packet(pkt); !r) {
 *         log(r.error().describe());
 *         break;
 *     }
 * }
 * writer->close();
 * @endcode
 */
class StoreWriter {
public:
    /**
     * @brief Create a store at base_dir/name.pcap + base_dir/name/
     *
     * Creates the segment directory, the index file and the first segment.
     *
     * @return Active writer; validation_error for a bad config; io_error if the store
     *         already exists (and config.overwrite is false) or cannot be created
     */
    [[nodiscard]] static Result<StoreWriter> create(const std::filesystem::path& base_dir,
                                                    std::string_view name,
                                                    const StoreConfig& config = {}) {
        if (auto valid = validate(config); !valid) {
            return unexpected<StoreError>(std::move(valid.error()));
        }
        if (name.empty()) {
            return make_error(ErrorCode::validation_error, "store name must not be empty");
        }

        StoreWriter writer(base_dir, name, config);

        std::error_code ec;
        if (std::filesystem::exists(writer.index_path_, ec) && !config.overwrite) {
            return make_error(ErrorCode::io_error, "store already exists", writer.index_path_, -1,
                              EEXIST);
        }
        if (config.overwrite && std::filesystem::exists(writer.segment_dir_, ec)) {
            std::filesystem::remove_all(writer.segment_dir_, ec);
            if (ec) {
                return make_error(ErrorCode::io_error, "cannot remove previous segments",
                                  writer.segment_dir_, -1, ec.value());
            }
        }
        std::filesystem::create_directories(writer.segment_dir_, ec);
        if (ec) {
            return make_error(ErrorCode::io_error, "cannot create segment directory",
                              writer.segment_dir_, -1, ec.value());
        }

        auto index_writer = ProjectIndexWriter::create(writer.index_path_, config);
        if (!index_writer) {
            return unexpected<StoreError>(std::move(index_writer.error()));
        }
        writer.index_writer_.emplace(std::move(*index_writer));

        if (auto opened = writer.open_segment(); !opened) {
            return unexpected<StoreError>(std::move(opened.error()));
        }

        writer.state_ = WriterState::active;
        PCAPSTORE_LOG_INFO("created store {} (max {} packets/segment, sample every {} ns)",
                           writer.index_path_.string(), config.max_packets_per_segment,
                           config.index_interval.count());
        return writer;
    }

    /**
     * @brief Create a store from its index path ("B/N.pcap" -> base B, name N)
     */
    [[nodiscard]] static Result<StoreWriter> create(const std::filesystem::path& index_file,
                                                    const StoreConfig& config = {}) {
        auto [base, name] = split_index_path(index_file);
        return create(base, name, config);
    }

    /**
     * @brief Destructor - flushes and closes the current segment and the index
     */
    ~StoreWriter() noexcept {
        if (state_ == WriterState::active) {
            if (auto r = close(); !r) {
                PCAPSTORE_LOG_ERROR("failed to close store {}: {}", index_path_.string(),
                                    r.error().describe());
            }
        }
    }

    StoreWriter(const StoreWriter&) = delete;
    StoreWriter& operator=(const StoreWriter&) = delete;

    StoreWriter(StoreWriter&& other) noexcept
        : config_(other.config_),
          name_(std::move(other.name_)),
          index_path_(std::move(other.index_path_)),
          segment_dir_(std::move(other.segment_dir_)),
          index_(std::move(other.index_)),
          index_writer_(std::move(other.index_writer_)),
          segment_(std::move(other.segment_)),
          segment_paths_(std::move(other.segment_paths_)),
          packet_count_(other.packet_count_),
          closed_segment_bytes_(other.closed_segment_bytes_),
          last_segment_stamp_(other.last_segment_stamp_),
          state_(std::exchange(other.state_, WriterState::closed)) {}

    StoreWriter& operator=(StoreWriter&& other) noexcept {
        if (this != &other) {
            if (state_ == WriterState::active) {
                if (auto r = close(); !r) {
                    PCAPSTORE_LOG_ERROR("failed to close store {}: {}", index_path_.string(),
                                        r.error().describe());
                }
            }
            config_ = other.config_;
            name_ = std::move(other.name_);
            index_path_ = std::move(other.index_path_);
            segment_dir_ = std::move(other.segment_dir_);
            index_ = std::move(other.index_);
            index_writer_ = std::move(other.index_writer_);
            segment_ = std::move(other.segment_);
            segment_paths_ = std::move(other.segment_paths_);
            packet_count_ = other.packet_count_;
            closed_segment_bytes_ = other.closed_segment_bytes_;
            last_segment_stamp_ = other.last_segment_stamp_;
            state_ = std::exchange(other.state_, WriterState::closed);
        }
        return *this;
    }

    /**
     * @brief Append one packet, rotating segments and sampling the index as needed
     *
     * @return invalid_state if not active; validation_error for an oversized payload or
     *         a timestamp older than the last index sample; io_error on write failure.
     *         An io_error with packets_decoded == 1 means the packet was stored but its
     *         index sample could not be written: do not write it again.
     */
    [[nodiscard]] Result<void> write_packet(const DataPacket& packet) {
        if (state_ != WriterState::active) {
            return make_error(ErrorCode::invalid_state,
                              std::string("store writer is ") + writer_state_string(state_),
                              index_path_);
        }
        if (packet.payload_length() > config_.format.max_packet_size) {
            return make_error(ErrorCode::validation_error,
                              "payload of " + std::to_string(packet.payload_length()) +
                                  " bytes exceeds limit of " +
                                  std::to_string(config_.format.max_packet_size),
                              index_path_);
        }
        if (auto last = index_.last_timestamp(); last && packet.timestamp() < *last) {
            return make_error(ErrorCode::validation_error,
                              "packet timestamp precedes last index sample", index_path_);
        }

        if (segment_->packets_written() >= config_.max_packets_per_segment) {
            if (auto rotated = rotate(); !rotated) {
                return rotated;
            }
        }

        uint64_t offset = segment_->next_offset();
        auto appended = segment_->append(packet);
        if (!appended) {
            return unexpected<StoreError>(std::move(appended.error()));
        }
        uint64_t sequence = packet_count_++;

        if (segment_->packets_written() == 1 || index_.should_sample(packet.timestamp())) {
            format::IndexEntry entry{.timestamp = packet.timestamp(),
                                     .offset = offset,
                                     .packet_size = static_cast<uint32_t>(*appended),
                                     .sequence = sequence,
                                     .segment = segment_->path().filename().string()};
            if (auto written = index_writer_->append(entry); !written) {
                // The packet itself is in the segment; only its sample is missing
                auto err = std::move(written.error());
                err.packets_decoded = 1;
                err.detail += " (packet " + std::to_string(sequence) +
                              " was stored without its index sample)";
                return unexpected<StoreError>(std::move(err));
            }
            if (auto added = index_.append(std::move(entry)); !added) {
                return added;
            }
            PCAPSTORE_LOG_TRACE("index sample #{} at {} ns -> {}@{}", index_.size() - 1,
                                packet.timestamp().total_nanoseconds(),
                                segment_->path().filename().string(), offset);
        }

        if (config_.auto_flush) {
            return flush();
        }
        return {};
    }

    /**
     * @brief Append packets in order, stopping at the first failure
     *
     * @return Number of packets written. On failure the error is returned and its
     *         packets_decoded field holds the number of packets stored, including a
     *         failing packet that reached its segment.
     */
    template <typename Range>
    [[nodiscard]] Result<size_t> write_packets(const Range& packets) {
        size_t written = 0;
        for (const DataPacket& packet : packets) {
            if (auto r = write_packet(packet); !r) {
                auto err = std::move(r.error());
                err.packets_decoded += written;
                return unexpected<StoreError>(std::move(err));
            }
            ++written;
        }
        return written;
    }

    /**
     * @brief Make everything written so far durable (segment, then index)
     */
    [[nodiscard]] Result<void> flush() {
        if (state_ != WriterState::active) {
            return {};
        }
        if (auto r = segment_->flush(); !r) {
            return r;
        }
        return index_writer_->flush();
    }

    /**
     * @brief Flush and close the current segment and the index
     *
     * Both files are closed even if one fails; the first error is returned. Idempotent.
     */
    [[nodiscard]] Result<void> close() {
        if (state_ != WriterState::active) {
            return {};
        }
        state_ = WriterState::closed;
        auto segment_closed = segment_->close();
        auto index_closed = index_writer_->close();
        PCAPSTORE_LOG_INFO("closed store {} ({} packets in {} segments, {} index samples)",
                           index_path_.string(), packet_count_, segment_paths_.size(),
                           index_.size());
        if (!segment_closed) {
            return segment_closed;
        }
        return index_closed;
    }

    /**
     * @brief Get number of packets written so far
     */
    [[nodiscard]] uint64_t packet_count() const noexcept { return packet_count_; }

    /**
     * @brief Get cumulative bytes of the index and every segment (buffered bytes included)
     */
    [[nodiscard]] uint64_t file_size() const noexcept {
        uint64_t total = closed_segment_bytes_;
        if (segment_) {
            total += segment_->bytes_written();
        }
        if (index_writer_) {
            total += index_writer_->bytes_written();
        }
        return total;
    }

    [[nodiscard]] size_t segment_count() const noexcept { return segment_paths_.size(); }

    /**
     * @brief Segment files created so far, in write order
     */
    [[nodiscard]] const std::vector<std::filesystem::path>& segment_paths() const noexcept {
        return segment_paths_;
    }

    [[nodiscard]] const std::filesystem::path& index_path() const noexcept { return index_path_; }

    [[nodiscard]] const std::filesystem::path& segment_directory() const noexcept {
        return segment_dir_;
    }

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    /**
     * @brief In-memory copy of the index written so far
     */
    [[nodiscard]] const ProjectIndex& index() const noexcept { return index_; }

    [[nodiscard]] WriterState state() const noexcept { return state_; }
    [[nodiscard]] bool is_open() const noexcept { return state_ == WriterState::active; }
    [[nodiscard]] const StoreConfig& config() const noexcept { return config_; }

private:
    /// Attempts at finding an unused segment name before giving up
    static constexpr int max_name_attempts = 16;

    StoreWriter(const std::filesystem::path& base_dir, std::string_view name,
                const StoreConfig& config)
        : config_(config),
          name_(name),
          index_path_(pcapstore::io::index_path(base_dir, name)),
          segment_dir_(pcapstore::io::segment_directory(base_dir, name)),
          index_(config.index_interval) {}

    Result<void> rotate() {
        if (auto closed = segment_->close(); !closed) {
            return closed;
        }
        closed_segment_bytes_ += segment_->bytes_written();
        PCAPSTORE_LOG_DEBUG("segment {} full ({} packets), rotating",
                            segment_->path().filename().string(), segment_->packets_written());
        return open_segment();
    }

    /**
     * Create the next segment, named after the current time. Names are kept strictly
     * increasing at 100 ns resolution so segments sort in write order.
     */
    Result<void> open_segment() {
        Timestamp stamp = truncate_to_segment_tick(Timestamp::now());
        for (int attempt = 0; attempt < max_name_attempts; ++attempt) {
            if (stamp <= last_segment_stamp_) {
                stamp = last_segment_stamp_.offset_by(
                    std::chrono::nanoseconds{SEGMENT_NAME_TICK_NS});
            }
            last_segment_stamp_ = stamp;

            auto path = segment_dir_ / segment_file_name(stamp);
            auto created = SegmentWriter::create(path, config_.format, config_.overwrite,
                                                 config_.write_buffer_size);
            if (created) {
                segment_.emplace(std::move(*created));
                segment_paths_.push_back(std::move(path));
                PCAPSTORE_LOG_DEBUG("opened segment #{} {}", segment_paths_.size() - 1,
                                    segment_->path().filename().string());
                return {};
            }
            if (created.error().errno_value != EEXIST) {
                return unexpected<StoreError>(std::move(created.error()));
            }
        }
        return make_error(ErrorCode::io_error, "no unused segment name available", segment_dir_,
                          -1, EEXIST);
    }

    StoreConfig config_;
    std::string name_;
    std::filesystem::path index_path_;
    std::filesystem::path segment_dir_;
    ProjectIndex index_;
    std::optional<ProjectIndexWriter> index_writer_;
    std::optional<SegmentWriter> segment_;
    std::vector<std::filesystem::path> segment_paths_;
    uint64_t packet_count_{0};
    uint64_t closed_segment_bytes_{0};
    Timestamp last_segment_stamp_{};
    WriterState state_{WriterState::created};
};

} // namespace pcapstore::io
