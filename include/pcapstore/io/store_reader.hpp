// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <algorithm>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_set>
#include <utility>
#include <vector>

#include <cerrno>
#include <cstddef>
#include <cstdint>

#include "../data_packet.hpp"
#include "../error.hpp"
#include "../expected.hpp"
#include "../format.hpp"
#include "../logging.hpp"
#include "../store_config.hpp"
#include "../timestamp.hpp"
#include "detail/iteration_helpers.hpp"
#include "project_index.hpp"
#include "segment_reader.hpp"
#include "store_layout.hpp"

namespace pcapstore::io {

/**
 * @brief Replay packets from a segmented store
 *
 * Segments are taken from the project index in first-appearance order. When the index is
 * missing, unreadable, or empty while segment files exist, the reader falls back to the
 * segment directory listing ordered by the timestamp embedded in each file name (and
 * seeks by linear scan).
 *
 * Sequential reads cross segment boundaries transparently. Every record carries its
 * global sequence number. With an index this is the packet's ordinal as written, taken
 * from the sample at the start of each segment, so packets lost to a torn or skipped
 * segment leave a gap. After the directory fallback it counts the readable packets from
 * the first packet of the first segment.
 *
 * Error handling contract for read_next_packet():
 * - EndOfStream after the last packet of the last segment
 * - truncated_data is reported once for a segment that ends inside a packet; the next
 *   call continues with the following segment
 * - Segments that cannot be opened (bad header, missing file) are skipped, logged and
 *   listed in skipped_segments() when skip_corrupt_segments is set; otherwise the open
 *   error is returned
 * - Checksum mismatches are reported in PacketRecord::checksum_status
 *
 * Seeking:
 * - seek_to_time() positions at the first packet whose timestamp is >= the target
 * - seek_to_packet() positions at a global packet sequence number
 * With an index both jump straight to the sampled offset and only read forward from
 * there; earlier segments are never opened. After the fallback they walk from the first
 * segment.
 *
 * @warning This class is MOVE-ONLY due to file handle ownership.
 *
 * Example usage:
 * @code
 * auto reader = StoreReader::open("/data/recordings/run42.pcap");
 * if (reader->seek_to_time(start)) {
 *     while (auto rec = reader->read_next_packet()) {
 *         transmit(rec->packet);
 *     }
 * }
 * @endcode
 */
class StoreReader {
public:
    using ReadResult = expected<PacketRecord, ReaderError>;

    /**
     * @brief Open the store at base_dir/name.pcap + base_dir/name/
     *
     * @return Reader positioned before the first packet; validation_error for a bad
     *         config; io_error when neither a usable index nor a segment directory exists
     */
    [[nodiscard]] static Result<StoreReader> open(const std::filesystem::path& base_dir,
                                                  std::string_view name,
                                                  const StoreConfig& config = {}) {
        if (auto valid = validate(config); !valid) {
            return unexpected<StoreError>(std::move(valid.error()));
        }

        StoreReader reader(base_dir, name, config);

        auto loaded = ProjectIndex::load(reader.index_path_, config.format);
        if (loaded && !loaded->empty() && names_are_local(*loaded) &&
            starts_every_segment(*loaded)) {
            for (const auto& segment : loaded->segments()) {
                reader.segments_.push_back(reader.segment_dir_ / segment);
            }
            reader.segment_bases_ = first_sequences(*loaded);
            reader.index_ = std::move(*loaded);
            reader.has_index_ = true;
        } else {
            if (!loaded) {
                PCAPSTORE_LOG_WARN("index unusable, falling back to directory listing: {}",
                                   loaded.error().describe());
            } else if (!loaded->empty() && !names_are_local(*loaded)) {
                PCAPSTORE_LOG_WARN("index {} names segments outside {}, ignoring it",
                                   reader.index_path_.string(), reader.segment_dir_.string());
            } else if (!loaded->empty()) {
                PCAPSTORE_LOG_WARN("index {} misses the first packet of a segment, falling "
                                   "back to directory listing",
                                   reader.index_path_.string());
            }

            auto listed = list_segment_files(reader.segment_dir_);
            if (!listed) {
                if (!loaded) {
                    return unexpected<StoreError>(std::move(loaded.error()));
                }
                return unexpected<StoreError>(std::move(listed.error()));
            }
            if (loaded && loaded->empty() && !listed->empty()) {
                PCAPSTORE_LOG_WARN("index {} is empty, falling back to directory listing",
                                   reader.index_path_.string());
            }
            reader.segments_ = std::move(*listed);
        }

        reader.segment_counts_.assign(reader.segments_.size(), std::nullopt);
        PCAPSTORE_LOG_INFO("opened store {} ({} segments, {})", reader.index_path_.string(),
                           reader.segments_.size(),
                           reader.has_index_ ? "indexed" : "directory listing");
        return reader;
    }

    /**
     * @brief Open a store from its index path ("B/N.pcap" -> base B, name N)
     */
    [[nodiscard]] static Result<StoreReader> open(const std::filesystem::path& index_file,
                                                  const StoreConfig& config = {}) {
        auto [base, name] = split_index_path(index_file);
        return open(base, name, config);
    }

    StoreReader(const StoreReader&) = delete;
    StoreReader& operator=(const StoreReader&) = delete;

    StoreReader(StoreReader&&) noexcept = default;
    StoreReader& operator=(StoreReader&&) noexcept = default;

    /**
     * @brief Read the next packet in store order
     */
    [[nodiscard]] ReadResult read_next_packet() {
        if (pending_) {
            PacketRecord record = std::move(*pending_);
            pending_.reset();
            position_ = record.sequence + 1;
            return record;
        }
        if (pending_error_) {
            StoreError err = std::move(*pending_error_);
            pending_error_.reset();
            return unexpected<ReaderError>(std::move(err));
        }
        return read_from_segments();
    }

    /**
     * @brief Read up to count packets
     *
     * Stops early at the end of the store. A non-EOF error ends the batch; if packets
     * were already collected they are returned and the error is reported by the next
     * read call instead.
     */
    [[nodiscard]] Result<std::vector<PacketRecord>> read_packets(size_t count) {
        std::vector<PacketRecord> out;
        out.reserve(std::min<size_t>(count, 1024));
        while (out.size() < count) {
            auto rec = read_next_packet();
            if (rec) {
                out.push_back(std::move(*rec));
                continue;
            }
            if (is_eof(rec.error())) {
                break;
            }
            auto& err = std::get<StoreError>(rec.error());
            if (out.empty()) {
                return unexpected<StoreError>(std::move(err));
            }
            pending_error_ = std::move(err);
            break;
        }
        return out;
    }

    /**
     * @brief Position at the first packet whose timestamp is >= ts
     *
     * Uses the index floor entry at or before ts, then scans forward across segment
     * boundaries as needed.
     *
     * @return false if ts predates the first sample or the indexed location cannot be
     *         opened; true otherwise. When ts is after the last packet, returns true and
     *         the next read yields EndOfStream.
     */
    [[nodiscard]] bool seek_to_time(Timestamp ts) {
        if (has_index_) {
            auto floor = index_.find_floor(ts);
            if (!floor) {
                return false;
            }
            // Packets sharing the floor timestamp may precede the sample (a segment-start
            // sample in the middle of an equal-timestamp run); start one sample earlier
            // when that location is readable.
            bool placed = false;
            if (floor->entry.timestamp == ts && floor->entry_index > 0) {
                auto earlier = position_at(index_.entries()[floor->entry_index - 1]);
                if (!earlier) {
                    PCAPSTORE_LOG_DEBUG("cannot start before sample {}: {}", floor->entry_index,
                                        earlier.error().describe());
                }
                placed = earlier.has_value();
            }
            if (!placed) {
                if (auto positioned = position_at(floor->entry); !positioned) {
                    PCAPSTORE_LOG_WARN("seek to {} ns failed: {}", ts.total_nanoseconds(),
                                       positioned.error().describe());
                    return false;
                }
            }
        } else {
            auto first = first_timestamp();
            if (!first || ts < *first) {
                return false;
            }
            if (auto positioned = position_at(0, 0); !positioned) {
                PCAPSTORE_LOG_WARN("seek to {} ns failed: {}", ts.total_nanoseconds(),
                                   positioned.error().describe());
                return false;
            }
        }

        while (true) {
            auto rec = read_from_segments();
            if (rec) {
                if (rec->packet.timestamp() >= ts) {
                    position_ = rec->sequence;
                    pending_ = std::move(*rec);
                    return true;
                }
                continue;
            }
            if (is_eof(rec.error())) {
                return true;
            }
            const auto& err = std::get<StoreError>(rec.error());
            if (err.code == ErrorCode::truncated_data || err.code == ErrorCode::format_error) {
                continue; // already logged; the segment is exhausted
            }
            PCAPSTORE_LOG_WARN("seek to {} ns failed: {}", ts.total_nanoseconds(),
                               err.describe());
            return false;
        }
    }

    /**
     * @brief Position at a global packet sequence number
     *
     * With an index, starts from the last sample at or before index and skips forward
     * within that segment.
     *
     * @return false if no readable packet has that number or the store cannot be walked;
     *         the replay position is then unspecified until the next seek or rewind()
     */
    [[nodiscard]] bool seek_to_packet(uint64_t index) {
        if (has_index_) {
            auto floor = index_.find_sequence_floor(index);
            if (!floor) {
                return false;
            }
            if (auto positioned = position_at(floor->entry); !positioned) {
                PCAPSTORE_LOG_WARN("seek to packet {} failed: {}", index,
                                   positioned.error().describe());
                return false;
            }
            uint64_t distance = index - floor->entry.sequence;
            auto skipped = reader_->skip_packets(distance);
            if (!skipped || *skipped != distance) {
                PCAPSTORE_LOG_DEBUG("packet {} not found in {}", index,
                                    segments_[current_segment_].string());
                return false;
            }
            // A torn packet or the end of the segment may sit where the packet was written
            auto rec = read_from_segments();
            if (!rec || rec->sequence != index) {
                PCAPSTORE_LOG_DEBUG("packet {} is not readable", index);
                return false;
            }
            position_ = index;
            pending_ = std::move(*rec);
            return true;
        }

        uint64_t base = 0;
        for (size_t i = 0; i < segments_.size(); ++i) {
            auto count = segment_packet_count(i);
            if (!count) {
                PCAPSTORE_LOG_WARN("seek to packet {} failed: {}", index,
                                   count.error().describe());
                return false;
            }
            if (index < base + *count) {
                if (auto positioned = position_at(i, base); !positioned) {
                    PCAPSTORE_LOG_WARN("seek to packet {} failed: {}", index,
                                       positioned.error().describe());
                    return false;
                }
                auto skipped = reader_->skip_packets(index - base);
                if (!skipped || *skipped != index - base) {
                    PCAPSTORE_LOG_WARN("seek to packet {} failed: segment {} shorter than "
                                       "counted",
                                       index, segments_[i].string());
                    return false;
                }
                position_ = index;
                return true;
            }
            base += *count;
        }
        return false;
    }

    /**
     * @brief Read the packet with the given global sequence number
     * @return Record; validation_error if index is out of range
     */
    [[nodiscard]] ReadResult read_packet_at(uint64_t index) {
        if (!seek_to_packet(index)) {
            return unexpected<ReaderError>(
                StoreError{.code = ErrorCode::validation_error,
                           .path = index_path_,
                           .detail = "packet index " + std::to_string(index) + " out of range"});
        }
        return read_next_packet();
    }

    /**
     * @brief Return to the first packet of the store
     */
    void rewind() {
        reader_.reset();
        pending_.reset();
        pending_error_.reset();
        current_segment_ = 0;
        sequence_base_ = 0;
        position_ = 0;
    }

    /**
     * @brief Iterate over all remaining packets
     *
     * @param callback bool(const PacketRecord&); return false to stop
     * @return Number of packets passed to the callback
     */
    template <typename Callback>
    size_t for_each_packet(Callback&& callback) {
        return detail::for_each_packet(*this, std::forward<Callback>(callback));
    }

    /**
     * @brief Iterate over remaining packets whose checksum did not verify
     * @return Number of mismatching packets passed to the callback
     */
    template <typename Callback>
    size_t for_each_corrupt_packet(Callback&& callback) {
        return detail::for_each_corrupt_packet(*this, std::forward<Callback>(callback));
    }

    /**
     * @brief Total number of whole packets in the store (cached after the first call)
     */
    [[nodiscard]] Result<uint64_t> packet_count() {
        uint64_t total = 0;
        for (size_t i = 0; i < segments_.size(); ++i) {
            auto count = segment_packet_count(i);
            if (!count) {
                return unexpected<StoreError>(std::move(count.error()));
            }
            total += *count;
        }
        return total;
    }

    /**
     * @brief Timestamp of the first packet, or nullopt for an empty store
     */
    [[nodiscard]] std::optional<Timestamp> first_timestamp() {
        if (has_index_) {
            // The first packet of every segment is sampled
            return index_.first_timestamp();
        }
        for (const auto& path : segments_) {
            auto reader = SegmentReader::open(path, config_.format);
            if (!reader) {
                continue;
            }
            if (auto rec = reader->read_next_packet(false)) {
                return rec->packet.timestamp();
            }
        }
        return std::nullopt;
    }

    /**
     * @brief Timestamp of the last packet, or nullopt for an empty store
     *
     * Reads forward from the last index sample of the final non-empty segment.
     * Does not move the replay position.
     */
    [[nodiscard]] std::optional<Timestamp> last_timestamp() {
        for (size_t i = segments_.size(); i-- > 0;) {
            auto reader = SegmentReader::open(segments_[i], config_.format);
            if (!reader) {
                continue;
            }
            if (has_index_) {
                auto name = segments_[i].filename().string();
                const auto& entries = index_.entries();
                auto it = std::find_if(entries.rbegin(), entries.rend(),
                                       [&name](const auto& e) { return e.segment == name; });
                if (it != entries.rend()) {
                    if (auto sought = reader->seek_to_offset(it->offset,
                                                             it->sequence - segment_bases_[i]);
                        !sought) {
                        reader->rewind();
                    }
                }
            }
            std::optional<Timestamp> last;
            while (auto rec = reader->read_next_packet(false)) {
                last = rec->packet.timestamp();
            }
            if (last) {
                return last;
            }
        }
        return std::nullopt;
    }

    /**
     * @brief Bytes on disk of the index and all segments
     */
    [[nodiscard]] uint64_t file_size() const {
        uint64_t total = 0;
        std::error_code ec;
        if (auto size = std::filesystem::file_size(index_path_, ec); !ec) {
            total += size;
        }
        for (const auto& path : segments_) {
            if (auto size = std::filesystem::file_size(path, ec); !ec) {
                total += size;
            }
        }
        return total;
    }

    /**
     * @brief Global sequence number of the packet the next read returns
     */
    [[nodiscard]] uint64_t position() const noexcept { return position_; }

    [[nodiscard]] const std::vector<std::filesystem::path>& segment_paths() const noexcept {
        return segments_;
    }

    /**
     * @brief Segments that could not be opened and were skipped
     */
    [[nodiscard]] const std::vector<std::filesystem::path>& skipped_segments() const noexcept {
        return skipped_;
    }

    /**
     * @brief Check if seeks are index-assisted (false after directory fallback)
     */
    [[nodiscard]] bool has_index() const noexcept { return has_index_; }

    [[nodiscard]] const ProjectIndex& index() const noexcept { return index_; }
    [[nodiscard]] const std::filesystem::path& index_path() const noexcept { return index_path_; }
    [[nodiscard]] const StoreConfig& config() const noexcept { return config_; }

private:
    StoreReader(const std::filesystem::path& base_dir, std::string_view name,
                const StoreConfig& config)
        : config_(config),
          index_path_(pcapstore::io::index_path(base_dir, name)),
          segment_dir_(pcapstore::io::segment_directory(base_dir, name)),
          index_(config.index_interval) {}

    static bool names_are_local(const ProjectIndex& index) {
        return std::all_of(index.segments().begin(), index.segments().end(),
                           [](const std::string& name) {
                               return !name.empty() && name != "." && name != ".." &&
                                      name.find('/') == std::string::npos;
                           });
    }

    /**
     * Sequence bases come from the sample of each segment's first packet; an index that
     * lacks one cannot number the packets of that segment.
     */
    static bool starts_every_segment(const ProjectIndex& index) {
        std::unordered_set<std::string_view> seen;
        for (const auto& entry : index.entries()) {
            if (seen.insert(entry.segment).second && entry.offset != format::FileHeader::size) {
                return false;
            }
        }
        return true;
    }

    static std::vector<uint64_t> first_sequences(const ProjectIndex& index) {
        std::vector<uint64_t> bases;
        bases.reserve(index.segments().size());
        std::unordered_set<std::string_view> seen;
        for (const auto& entry : index.entries()) {
            if (seen.insert(entry.segment).second) {
                bases.push_back(entry.sequence);
            }
        }
        return bases;
    }

    std::optional<size_t> segment_position(std::string_view name) const {
        for (size_t i = 0; i < segments_.size(); ++i) {
            if (segments_[i].filename() == name) {
                return i;
            }
        }
        return std::nullopt;
    }

    bool skippable(const StoreError& err) const noexcept {
        return config_.skip_corrupt_segments &&
               (err.code == ErrorCode::format_error ||
                (err.code == ErrorCode::io_error && err.errno_value == ENOENT));
    }

    void record_skipped(size_t segment, const StoreError& err) {
        segment_counts_[segment] = 0;
        if (std::find(skipped_.begin(), skipped_.end(), segments_[segment]) == skipped_.end()) {
            PCAPSTORE_LOG_WARN("skipping segment: {}", err.describe());
            skipped_.push_back(segments_[segment]);
        }
    }

    /**
     * Open segment i as the current segment. Returns the open error if the segment is
     * unusable; skippable errors have already been recorded.
     */
    Result<void> open_current(size_t segment) {
        auto opened = SegmentReader::open(segments_[segment], config_.format);
        if (!opened) {
            if (skippable(opened.error())) {
                record_skipped(segment, opened.error());
            }
            return unexpected<StoreError>(std::move(opened.error()));
        }
        reader_.emplace(std::move(*opened));
        return {};
    }

    ReadResult read_from_segments() {
        while (true) {
            if (!reader_) {
                if (current_segment_ >= segments_.size()) {
                    return unexpected<ReaderError>(EndOfStream{});
                }
                if (has_index_) {
                    sequence_base_ = segment_bases_[current_segment_];
                }
                if (auto opened = open_current(current_segment_); !opened) {
                    // Reported once; the next read moves on to the following segment
                    ++current_segment_;
                    if (!skippable(opened.error())) {
                        return unexpected<ReaderError>(std::move(opened.error()));
                    }
                    continue;
                }
            }

            auto rec = reader_->read_next_packet(config_.verify_checksums);
            if (rec) {
                rec->sequence += sequence_base_;
                position_ = rec->sequence + 1;
                return rec;
            }
            if (is_eof(rec.error())) {
                finish_current_segment();
                continue;
            }
            if (auto* err = std::get_if<StoreError>(&rec.error())) {
                err->packets_decoded += sequence_base_;
            }
            return rec;
        }
    }

    void finish_current_segment() {
        uint64_t count = reader_->packet_index();
        segment_counts_[current_segment_] = count;
        sequence_base_ += count;
        reader_.reset();
        ++current_segment_;
    }

    Result<uint64_t> segment_packet_count(size_t segment) {
        if (segment_counts_[segment]) {
            return *segment_counts_[segment];
        }
        auto reader = SegmentReader::open(segments_[segment], config_.format);
        if (!reader) {
            if (skippable(reader.error())) {
                record_skipped(segment, reader.error());
                return uint64_t{0};
            }
            return unexpected<StoreError>(std::move(reader.error()));
        }
        auto counted = reader->count_packets();
        if (!counted) {
            if (counted.error().code == ErrorCode::format_error) {
                // Corrupt header mid-segment: only the packets before it are readable
                counted = counted.error().packets_decoded;
            } else {
                return unexpected<StoreError>(std::move(counted.error()));
            }
        }
        segment_counts_[segment] = *counted;
        return uint64_t{*counted};
    }

    /**
     * Make segment the current one with its first packet numbered base, optionally
     * jumping to a packet header at offset holding packet number packet_index within it.
     */
    Result<void> position_at(size_t segment, uint64_t base,
                             uint64_t offset = format::FileHeader::size,
                             uint64_t packet_index = 0) {
        reader_.reset();
        pending_.reset();
        pending_error_.reset();
        current_segment_ = segment;
        sequence_base_ = base;

        if (auto opened = open_current(segment); !opened) {
            return opened;
        }
        if (auto sought = reader_->seek_to_offset(offset, packet_index); !sought) {
            reader_.reset();
            return sought;
        }
        position_ = sequence_base_ + reader_->packet_index();
        return {};
    }

    Result<void> position_at(const format::IndexEntry& entry) {
        auto segment = segment_position(entry.segment);
        if (!segment) {
            return make_error(ErrorCode::format_error,
                              "index names unknown segment " + entry.segment, index_path_);
        }
        uint64_t base = segment_bases_[*segment];
        return position_at(*segment, base, entry.offset, entry.sequence - base);
    }

    StoreConfig config_;
    std::filesystem::path index_path_;
    std::filesystem::path segment_dir_;
    ProjectIndex index_;
    bool has_index_{false};
    std::vector<std::filesystem::path> segments_;
    std::vector<std::optional<uint64_t>> segment_counts_; ///< Whole packets per segment, once known
    std::vector<uint64_t> segment_bases_; ///< Sequence of each segment's first packet (indexed only)
    std::vector<std::filesystem::path> skipped_;

    std::optional<SegmentReader> reader_;
    size_t current_segment_{0};
    uint64_t sequence_base_{0}; ///< Global sequence of the current segment's first packet
    uint64_t position_{0};
    std::optional<PacketRecord> pending_;      ///< Packet found by a seek, not yet returned
    std::optional<StoreError> pending_error_;  ///< Error held back by read_packets
};

} // namespace pcapstore::io
