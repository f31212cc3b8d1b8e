// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

#include <cstddef>
#include <cstdint>

#include "expected.hpp"

namespace pcapstore {

/**
 * @brief Failure categories reported by the storage engine
 */
enum class ErrorCode : uint8_t {
    io_error,          ///< OS-level open/read/write/sync failure
    format_error,      ///< Bad magic, version or corrupt header
    validation_error,  ///< Caller supplied an out-of-range value
    truncated_data,    ///< File ended inside a packet
    checksum_mismatch, ///< Payload CRC does not match its header
    invalid_state,     ///< Operation not allowed in the current state
    cancelled          ///< Async operation stopped before it began
};

/**
 * @brief Get string representation of ErrorCode
 */
[[nodiscard]] constexpr const char* error_code_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::io_error:
            return "I/O error";
        case ErrorCode::format_error:
            return "Format error";
        case ErrorCode::validation_error:
            return "Validation error";
        case ErrorCode::truncated_data:
            return "Truncated data";
        case ErrorCode::checksum_mismatch:
            return "Checksum mismatch";
        case ErrorCode::invalid_state:
            return "Invalid state";
        case ErrorCode::cancelled:
            return "Cancelled";
    }
    return "Unknown error";
}

/**
 * @brief Error information from a failed store operation
 *
 * Carries enough context to diagnose a corrupt or unreadable recording: the file
 * involved, the byte offset of the failing record and the OS errno where one exists.
 */
struct StoreError {
    ErrorCode code{ErrorCode::io_error};
    std::filesystem::path path{}; ///< File the operation targeted (may be empty)
    int64_t offset{-1};           ///< Byte offset of the failing record, -1 if not applicable
    int errno_value{0};           ///< errno captured at failure, 0 if none
    size_t packets_decoded{0};    ///< Whole packets decoded before truncation
    std::string detail{};         ///< Free-form description

    /**
     * @brief Get short message for the error category
     */
    [[nodiscard]] const char* message() const noexcept { return error_code_string(code); }

    /**
     * @brief Build a full human-readable description including context
     */
    [[nodiscard]] std::string describe() const {
        std::string out = message();
        if (!detail.empty()) {
            out += ": ";
            out += detail;
        }
        if (!path.empty()) {
            out += " [";
            out += path.string();
            if (offset >= 0) {
                out += " @ ";
                out += std::to_string(offset);
            }
            out += "]";
        }
        if (errno_value != 0) {
            out += " (";
            out += std::generic_category().message(errno_value);
            out += ")";
        }
        return out;
    }
};

/**
 * @brief Result of a store operation: value on success, StoreError on failure
 */
template <typename T>
using Result = expected<T, StoreError>;

/**
 * @brief Build an unexpected StoreError
 */
[[nodiscard]] inline unexpected<StoreError> make_error(ErrorCode code, std::string detail,
                                                       std::filesystem::path path = {},
                                                       int64_t offset = -1,
                                                       int errno_value = 0) {
    return unexpected<StoreError>(StoreError{.code = code,
                                             .path = std::move(path),
                                             .offset = offset,
                                             .errno_value = errno_value,
                                             .packets_decoded = 0,
                                             .detail = std::move(detail)});
}

/**
 * @brief Represents end-of-stream (no error, just no more data)
 *
 * Returned when a reader reaches EOF during normal operation.
 */
struct EndOfStream {};

/**
 * @brief Unified reader error type
 *
 * A variant that can represent:
 * - EndOfStream: Normal end of data
 * - StoreError: I/O failure, truncation or corrupt data
 */
using ReaderError = std::variant<EndOfStream, StoreError>;

/**
 * @brief Check if error represents end of stream
 */
[[nodiscard]] inline bool is_eof(const ReaderError& e) noexcept {
    return std::holds_alternative<EndOfStream>(e);
}

/**
 * @brief Check if error is a StoreError
 */
[[nodiscard]] inline bool is_error(const ReaderError& e) noexcept {
    return std::holds_alternative<StoreError>(e);
}

/**
 * @brief Check if error carries the given code
 */
[[nodiscard]] inline bool has_code(const ReaderError& e, ErrorCode code) noexcept {
    const auto* err = std::get_if<StoreError>(&e);
    return err != nullptr && err->code == code;
}

/**
 * @brief Get human-readable error message from any ReaderError
 */
[[nodiscard]] inline const char* error_message(const ReaderError& e) noexcept {
    return std::visit(
        [](auto&& err) -> const char* {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, EndOfStream>) {
                return "End of stream";
            } else if constexpr (std::is_same_v<T, StoreError>) {
                return err.message();
            }
            return "Unknown error";
        },
        e);
}

/**
 * @brief Exception wrapper for StoreError
 *
 * The library API reports failures through Result; this type exists for callers
 * that prefer exceptions (language bindings, test helpers).
 */
class StoreException : public std::runtime_error {
public:
    explicit StoreException(StoreError error)
        : std::runtime_error(error.describe()),
          error_(std::move(error)) {}

    [[nodiscard]] const StoreError& error() const noexcept { return error_; }
    [[nodiscard]] ErrorCode code() const noexcept { return error_.code; }

private:
    StoreError error_;
};

/**
 * @brief Unwrap a Result, throwing StoreException on failure
 */
template <typename T>
T value_or_throw(Result<T>&& result) {
    if (!result) {
        throw StoreException(std::move(result.error()));
    }
    if constexpr (!std::is_void_v<T>) {
        return std::move(*result);
    }
}

} // namespace pcapstore
