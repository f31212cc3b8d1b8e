// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <future>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

#include <cstddef>
#include <cstdint>

#include "../data_packet.hpp"
#include "../error.hpp"
#include "../expected.hpp"
#include "../timestamp.hpp"
#include "store_reader.hpp"
#include "store_writer.hpp"

/**
 * @file async.hpp
 * @brief Non-blocking wrappers around the store facades
 *
 * Each wrapper runs the blocking call on a worker thread and returns a std::future.
 * Cancellation is checked once, when the worker begins: a stop requested before that
 * point yields ErrorCode::cancelled and the operation never runs; once begun, the
 * operation always completes. A caller therefore observes either "not started" or
 * "fully completed", never a partial write or seek.
 *
 * The facade must outlive the future, and no other call may be issued on the same
 * facade until the future is ready.
 *
 * Example usage:
 * @code
 * std::stop_source stop;
 * auto pending = pcapstore::io::write_packet_async(writer, pkt, stop.get_token());
 * auto result = pending.get();
 * @endcode
 */

namespace pcapstore::io {

namespace detail {

inline StoreError cancelled_error(const char* operation) {
    return StoreError{.code = ErrorCode::cancelled,
                      .detail = std::string(operation) + " cancelled before it started"};
}

template <typename R, typename Fn>
std::future<R> launch(std::stop_token stop, const char* operation, Fn&& fn) {
    return std::async(std::launch::async,
                      [stop = std::move(stop), operation, fn = std::forward<Fn>(fn)]() mutable -> R {
                          if (stop.stop_requested()) {
                              return R(unexpect, cancelled_error(operation));
                          }
                          return fn();
                      });
}

} // namespace detail

// =============================================================================
// Writer
// =============================================================================

inline std::future<Result<void>> write_packet_async(StoreWriter& writer, DataPacket packet,
                                                    std::stop_token stop = {}) {
    return detail::launch<Result<void>>(std::move(stop), "write_packet",
                                        [&writer, packet = std::move(packet)] {
                                            return writer.write_packet(packet);
                                        });
}

inline std::future<Result<size_t>> write_packets_async(StoreWriter& writer,
                                                       std::vector<DataPacket> packets,
                                                       std::stop_token stop = {}) {
    return detail::launch<Result<size_t>>(std::move(stop), "write_packets",
                                          [&writer, packets = std::move(packets)] {
                                              return writer.write_packets(packets);
                                          });
}

inline std::future<Result<void>> flush_async(StoreWriter& writer, std::stop_token stop = {}) {
    return detail::launch<Result<void>>(std::move(stop), "flush",
                                        [&writer] { return writer.flush(); });
}

inline std::future<Result<void>> close_async(StoreWriter& writer, std::stop_token stop = {}) {
    return detail::launch<Result<void>>(std::move(stop), "close",
                                        [&writer] { return writer.close(); });
}

// =============================================================================
// Reader
// =============================================================================

inline std::future<StoreReader::ReadResult> read_next_packet_async(StoreReader& reader,
                                                                   std::stop_token stop = {}) {
    return detail::launch<StoreReader::ReadResult>(std::move(stop), "read_next_packet",
                                                   [&reader] { return reader.read_next_packet(); });
}

inline std::future<Result<std::vector<PacketRecord>>>
read_packets_async(StoreReader& reader, size_t count, std::stop_token stop = {}) {
    return detail::launch<Result<std::vector<PacketRecord>>>(
        std::move(stop), "read_packets", [&reader, count] { return reader.read_packets(count); });
}

inline std::future<Result<bool>> seek_to_time_async(StoreReader& reader, Timestamp ts,
                                                    std::stop_token stop = {}) {
    return detail::launch<Result<bool>>(std::move(stop), "seek_to_time", [&reader, ts] {
        return Result<bool>(reader.seek_to_time(ts));
    });
}

inline std::future<Result<bool>> seek_to_packet_async(StoreReader& reader, uint64_t index,
                                                      std::stop_token stop = {}) {
    return detail::launch<Result<bool>>(std::move(stop), "seek_to_packet", [&reader, index] {
        return Result<bool>(reader.seek_to_packet(index));
    });
}

} // namespace pcapstore::io
