// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <algorithm>
#include <array>
#include <chrono>
#include <filesystem>
#include <iterator>
#include <optional>
#include <span>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

#include "../error.hpp"
#include "../format.hpp"
#include "../logging.hpp"
#include "../store_config.hpp"
#include "../timestamp.hpp"
#include "detail/file_handle.hpp"

namespace pcapstore::io {

/**
 * @brief Result of a floor search in the project index
 */
struct IndexLocation {
    size_t entry_index{0};     ///< Position of the entry within the index
    format::IndexEntry entry{}; ///< Copy of the matching entry
};

/**
 * @brief Ordered, time-sampled map from timestamps to packet locations
 *
 * Entries are appended in non-decreasing timestamp order at a fixed sampling interval.
 * find_floor() narrows a time seek to the last sample at or before the target; the
 * caller then scans forward from that location.
 */
class ProjectIndex {
public:
    explicit ProjectIndex(std::chrono::nanoseconds interval = std::chrono::seconds{1})
        : interval_(interval) {}

    /**
     * @brief Append a sample
     *
     * @param sequence Ordinal of the sampled packet in the store
     * @return invalid_state if ts is older than the last sample or sequence does not
     *         advance (entries must stay sorted on both)
     */
    [[nodiscard]] Result<void> append_sample(Timestamp ts, std::string segment, uint64_t offset,
                                             uint32_t packet_size, uint64_t sequence) {
        return append(format::IndexEntry{.timestamp = ts,
                                         .offset = offset,
                                         .packet_size = packet_size,
                                         .sequence = sequence,
                                         .segment = std::move(segment)});
    }

    [[nodiscard]] Result<void> append(format::IndexEntry entry) {
        if (!entries_.empty()) {
            const auto& last = entries_.back();
            if (entry.timestamp < last.timestamp) {
                return make_error(ErrorCode::invalid_state,
                                  "index sample older than previous sample (" +
                                      std::to_string(entry.timestamp.total_nanoseconds()) +
                                      " < " + std::to_string(last.timestamp.total_nanoseconds()) +
                                      " ns)");
            }
            if (entry.sequence <= last.sequence) {
                return make_error(ErrorCode::invalid_state,
                                  "index sample sequence " + std::to_string(entry.sequence) +
                                      " does not follow " + std::to_string(last.sequence));
            }
        }
        if (seen_segments_.insert(entry.segment).second) {
            segments_.push_back(entry.segment);
        }
        entries_.push_back(std::move(entry));
        return {};
    }

    /**
     * @brief Check whether a packet with this timestamp is due for sampling
     */
    [[nodiscard]] bool should_sample(Timestamp ts) const noexcept {
        if (entries_.empty()) {
            return true;
        }
        return ts - entries_.back().timestamp >= interval_;
    }

    /**
     * @brief Find the last sample at or before ts
     *
     * When several samples share that timestamp the earliest one is returned, so a
     * forward scan from it cannot miss an equal-timestamp packet.
     *
     * @return Location, or nullopt if ts predates the first sample
     */
    [[nodiscard]] std::optional<IndexLocation> find_floor(Timestamp ts) const {
        auto by_time = [](const format::IndexEntry& e, Timestamp t) { return e.timestamp < t; };
        auto after = std::upper_bound(
            entries_.begin(), entries_.end(), ts,
            [](Timestamp t, const format::IndexEntry& e) { return t < e.timestamp; });
        if (after == entries_.begin()) {
            return std::nullopt;
        }
        Timestamp floor_ts = std::prev(after)->timestamp;
        auto first = std::lower_bound(entries_.begin(), after, floor_ts, by_time);
        return IndexLocation{.entry_index = static_cast<size_t>(first - entries_.begin()),
                             .entry = *first};
    }

    /**
     * @brief Find the last sample whose packet sequence is <= sequence
     * @return Location, or nullopt if sequence precedes the first sample
     */
    [[nodiscard]] std::optional<IndexLocation> find_sequence_floor(uint64_t sequence) const {
        auto after = std::upper_bound(
            entries_.begin(), entries_.end(), sequence,
            [](uint64_t n, const format::IndexEntry& e) { return n < e.sequence; });
        if (after == entries_.begin()) {
            return std::nullopt;
        }
        auto floor = std::prev(after);
        return IndexLocation{.entry_index = static_cast<size_t>(floor - entries_.begin()),
                             .entry = *floor};
    }

    [[nodiscard]] const std::vector<format::IndexEntry>& entries() const noexcept {
        return entries_;
    }

    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    /**
     * @brief Distinct segment names in order of first appearance
     */
    [[nodiscard]] const std::vector<std::string>& segments() const noexcept { return segments_; }

    [[nodiscard]] std::optional<Timestamp> first_timestamp() const noexcept {
        if (entries_.empty()) {
            return std::nullopt;
        }
        return entries_.front().timestamp;
    }

    [[nodiscard]] std::optional<Timestamp> last_timestamp() const noexcept {
        if (entries_.empty()) {
            return std::nullopt;
        }
        return entries_.back().timestamp;
    }

    [[nodiscard]] std::chrono::nanoseconds interval() const noexcept { return interval_; }

    /**
     * @brief Header read by load(), if this index came from disk
     */
    [[nodiscard]] const std::optional<format::IndexHeader>& header() const noexcept {
        return header_;
    }

    /**
     * @brief Rebuild an index from its file
     *
     * A trailing partial entry (an interrupted append) is ignored with a warning.
     *
     * @return Index; io_error if unreadable; format_error on bad magic/version, a corrupt
     *         entry or entries out of timestamp or sequence order
     */
    [[nodiscard]] static Result<ProjectIndex> load(const std::filesystem::path& path,
                                                   const FormatConfig& format = {}) {
        detail::FileStream file(std::fopen(path.c_str(), "rb"));
        if (!file) {
            return make_error(ErrorCode::io_error, "cannot open index file", path, -1, errno);
        }

        std::array<uint8_t, format::IndexHeader::size> raw_header{};
        size_t got = std::fread(raw_header.data(), 1, raw_header.size(), file.get());
        if (got != raw_header.size()) {
            if (std::ferror(file.get())) {
                return make_error(ErrorCode::io_error, "cannot read index header", path, 0,
                                  errno);
            }
            return make_error(ErrorCode::format_error,
                              "index shorter than header (" + std::to_string(got) + " bytes)",
                              path, 0);
        }
        auto header = format::decode_index_header(raw_header);
        if (!header) {
            return unexpected<StoreError>(std::move(header.error()));
        }
        if (!format::matches(*header, format.index_magic, format.version_major,
                             format.version_minor)) {
            return make_error(ErrorCode::format_error, "index magic/version mismatch", path, 0);
        }

        std::chrono::nanoseconds interval{static_cast<int64_t>(header->interval_ns)};
        if (interval.count() <= 0) {
            interval = std::chrono::seconds{1};
        }
        ProjectIndex index(interval);
        index.header_ = *header;

        uint64_t offset = format::IndexHeader::size;
        std::array<uint8_t, format::IndexEntry::size> raw{};
        while (true) {
            got = std::fread(raw.data(), 1, raw.size(), file.get());
            if (got == 0) {
                if (std::ferror(file.get())) {
                    return make_error(ErrorCode::io_error, "cannot read index entry", path,
                                      static_cast<int64_t>(offset), errno);
                }
                break;
            }
            if (got < raw.size()) {
                if (std::ferror(file.get())) {
                    return make_error(ErrorCode::io_error, "cannot read index entry", path,
                                      static_cast<int64_t>(offset), errno);
                }
                PCAPSTORE_LOG_WARN("ignoring partial index entry in {} at offset {} ({} bytes)",
                                   path.string(), offset, got);
                break;
            }

            auto entry = format::decode_index_entry(raw);
            if (!entry) {
                auto err = std::move(entry.error());
                err.path = path;
                err.offset = static_cast<int64_t>(offset);
                return unexpected<StoreError>(std::move(err));
            }
            if (auto r = index.append(std::move(*entry)); !r) {
                return make_error(ErrorCode::format_error,
                                  "index entries out of order: " + r.error().detail, path,
                                  static_cast<int64_t>(offset));
            }
            offset += format::IndexEntry::size;
        }

        PCAPSTORE_LOG_DEBUG("loaded index {} ({} entries, {} segments)", path.string(),
                            index.size(), index.segments().size());
        return index;
    }

private:
    std::chrono::nanoseconds interval_;
    std::vector<format::IndexEntry> entries_;
    std::vector<std::string> segments_;
    std::unordered_set<std::string> seen_segments_;
    std::optional<format::IndexHeader> header_;
};

/**
 * @brief Append-only writer for the project index file
 *
 * Writes the Index Header on creation; each append() writes one encoded entry straight
 * to the file so the index on disk never lags the segments by more than one sample.
 *
 * @warning This class is MOVE-ONLY due to file handle ownership.
 */
class ProjectIndexWriter {
public:
    [[nodiscard]] static Result<ProjectIndexWriter>
    create(const std::filesystem::path& path, const StoreConfig& config,
           Timestamp created_at = Timestamp::now()) {
        int flags = O_WRONLY | O_CREAT | O_CLOEXEC | (config.overwrite ? O_TRUNC : O_EXCL);
        detail::FileDescriptor fd(::open(path.c_str(), flags, 0644));
        if (!fd) {
            int err = errno;
            return make_error(ErrorCode::io_error,
                              err == EEXIST ? "index file already exists"
                                            : "cannot create index file",
                              path, -1, err);
        }

        format::IndexHeader header{
            .magic = config.format.index_magic,
            .version_major = config.format.version_major,
            .version_minor = config.format.version_minor,
            .interval_ns = static_cast<uint64_t>(config.index_interval.count()),
            .max_packets_per_segment = config.max_packets_per_segment,
            .reserved = 0,
            .created_seconds = created_at.seconds(),
            .created_nanoseconds = created_at.nanoseconds()};
        auto encoded = format::encode(header);
        if (int err = detail::write_all(fd.get(), encoded.data(), encoded.size()); err != 0) {
            return make_error(ErrorCode::io_error, "cannot write index header", path, 0, err);
        }
        return ProjectIndexWriter(path, std::move(fd), header);
    }

    ~ProjectIndexWriter() noexcept {
        if (fd_) {
            if (auto r = close(); !r) {
                PCAPSTORE_LOG_ERROR("failed to close index: {}", r.error().describe());
            }
        }
    }

    ProjectIndexWriter(const ProjectIndexWriter&) = delete;
    ProjectIndexWriter& operator=(const ProjectIndexWriter&) = delete;

    ProjectIndexWriter(ProjectIndexWriter&& other) noexcept = default;

    ProjectIndexWriter& operator=(ProjectIndexWriter&& other) noexcept {
        if (this != &other) {
            if (fd_) {
                if (auto r = close(); !r) {
                    PCAPSTORE_LOG_ERROR("failed to close index: {}", r.error().describe());
                }
            }
            path_ = std::move(other.path_);
            fd_ = std::move(other.fd_);
            header_ = other.header_;
            entries_written_ = other.entries_written_;
            dirty_ = std::exchange(other.dirty_, false);
        }
        return *this;
    }

    [[nodiscard]] Result<void> append(const format::IndexEntry& entry) {
        if (!fd_) {
            return make_error(ErrorCode::invalid_state, "index writer is closed", path_);
        }
        auto encoded = format::encode_entry(entry);
        if (!encoded) {
            return unexpected<StoreError>(std::move(encoded.error()));
        }
        if (int err = detail::write_all(fd_.get(), encoded->data(), encoded->size()); err != 0) {
            rollback_partial_entry();
            return make_error(ErrorCode::io_error, "cannot write index entry", path_,
                              static_cast<int64_t>(bytes_written()), err);
        }
        ++entries_written_;
        dirty_ = true;
        return {};
    }

    [[nodiscard]] Result<void> flush() {
        if (!fd_ || !dirty_) {
            return {};
        }
        if (::fdatasync(fd_.get()) != 0) {
            return make_error(ErrorCode::io_error, "fdatasync failed", path_, -1, errno);
        }
        dirty_ = false;
        return {};
    }

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
        return {};
    }

    [[nodiscard]] size_t entries_written() const noexcept { return entries_written_; }

    [[nodiscard]] uint64_t bytes_written() const noexcept {
        return format::IndexHeader::size +
               static_cast<uint64_t>(entries_written_) * format::IndexEntry::size;
    }

    [[nodiscard]] const format::IndexHeader& header() const noexcept { return header_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] bool is_open() const noexcept { return fd_.valid(); }

private:
    ProjectIndexWriter(std::filesystem::path path, detail::FileDescriptor fd,
                       const format::IndexHeader& header)
        : path_(std::move(path)),
          fd_(std::move(fd)),
          header_(header),
          dirty_(true) {}

    // Drop any bytes of a torn entry so the next append stays aligned
    void rollback_partial_entry() noexcept {
        auto end = static_cast<off_t>(bytes_written());
        if (::ftruncate(fd_.get(), end) != 0 || ::lseek(fd_.get(), end, SEEK_SET) != end) {
            PCAPSTORE_LOG_WARN("cannot roll back partial entry in {}: {}", path_.string(),
                               std::strerror(errno));
        }
    }

    std::filesystem::path path_;
    detail::FileDescriptor fd_;
    format::IndexHeader header_;
    size_t entries_written_{0};
    bool dirty_{false};
};

} // namespace pcapstore::io
