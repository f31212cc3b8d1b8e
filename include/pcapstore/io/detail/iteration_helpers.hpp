#pragma once

#include <concepts>
#include <utility>
#include <variant>

#include <cstddef>

#include "../../data_packet.hpp"
#include "../../error.hpp"
#include "../../expected.hpp"

namespace pcapstore::io::detail {

/**
 * @brief Concept for packet readers that provide read_next_packet()
 *
 * Any reader (segment, store) that provides read_next_packet() returning
 * expected<PacketRecord, ReaderError> can use these iteration helpers.
 */
template <typename T>
concept PacketReader = requires(T& reader) {
    { reader.read_next_packet() } -> std::same_as<pcapstore::expected<PacketRecord, ReaderError>>;
};

/**
 * @brief Iterate over all readable packets
 *
 * Error handling contract:
 * - EndOfStream: Stop iteration (normal termination)
 * - truncated_data / format_error: Continue (the reader moves past the damaged segment)
 * - Any other StoreError: Stop iteration (unrecoverable)
 *
 * @tparam Reader Type satisfying PacketReader concept
 * @tparam Callback Function type with signature: bool(const PacketRecord&)
 * @param reader Reader providing read_next_packet()
 * @param callback Function called for each packet. Return false to stop iteration.
 * @return Number of packets processed
 */
template <PacketReader Reader, typename Callback>
size_t for_each_packet(Reader& reader, Callback&& callback) {
    size_t count = 0;

    while (true) {
        auto result = reader.read_next_packet();

        if (!result.has_value()) {
            const auto& err = result.error();
            if (has_code(err, ErrorCode::truncated_data) ||
                has_code(err, ErrorCode::format_error)) {
                continue;
            }
            break;
        }

        ++count;
        if (!callback(*result)) {
            break; // Callback requested stop
        }
    }

    return count;
}

/**
 * @brief Iterate over packets whose checksum did not verify
 *
 * Same error contract as for_each_packet(). Useful for integrity reports.
 *
 * @return Number of mismatching packets passed to the callback
 */
template <PacketReader Reader, typename Callback>
size_t for_each_corrupt_packet(Reader& reader, Callback&& callback) {
    size_t count = 0;
    for_each_packet(reader, [&](const PacketRecord& record) {
        if (record.checksum_status != ChecksumStatus::mismatch) {
            return true;
        }
        ++count;
        return static_cast<bool>(callback(record));
    });
    return count;
}

} // namespace pcapstore::io::detail
