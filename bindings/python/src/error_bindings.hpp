#pragma once
// Error bindings: ErrorCode, ChecksumStatus, StoreIOError, StoreFormatError, StoreError

#include <nanobind/nanobind.h>

#include <pcapstore/data_packet.hpp>
#include <pcapstore/error.hpp>

#include "py_types.hpp"

#include <stdexcept>
#include <string>

namespace nb = nanobind;
using namespace nb::literals;

namespace pcapstore_python {

inline void bind_errors(nb::module_& m) {
    // =========================================================================
    // ErrorCode enum
    // =========================================================================

    nb::enum_<pcapstore::ErrorCode>(m, "ErrorCode", "Error categories reported by the store")
        .value("io_error", pcapstore::ErrorCode::io_error, "OS-level I/O failure")
        .value("format_error", pcapstore::ErrorCode::format_error,
               "Bad magic, version or corrupt header")
        .value("validation_error", pcapstore::ErrorCode::validation_error,
               "Out-of-range argument")
        .value("truncated_data", pcapstore::ErrorCode::truncated_data,
               "File ended inside a packet")
        .value("checksum_mismatch", pcapstore::ErrorCode::checksum_mismatch,
               "Payload CRC does not match its header")
        .value("invalid_state", pcapstore::ErrorCode::invalid_state,
               "Operation not allowed in the current state")
        .value("cancelled", pcapstore::ErrorCode::cancelled,
               "Operation stopped before it began")
        .def("__str__", [](pcapstore::ErrorCode c) {
            return std::string(pcapstore::error_code_string(c));
        });

    nb::enum_<pcapstore::ChecksumStatus>(m, "ChecksumStatus",
                                         "Outcome of payload verification on read")
        .value("not_checked", pcapstore::ChecksumStatus::not_checked,
               "Verification disabled")
        .value("valid", pcapstore::ChecksumStatus::valid, "CRC matches")
        .value("mismatch", pcapstore::ChecksumStatus::mismatch, "CRC differs")
        .def("__str__", [](pcapstore::ChecksumStatus s) {
            return std::string(pcapstore::checksum_status_string(s));
        });

    // =========================================================================
    // Custom Exceptions
    // =========================================================================

    // StoreIOError inherits from OSError to match Python conventions for I/O errors
    auto io_error = nb::exception<std::runtime_error>(m, "StoreIOError", PyExc_OSError);
    store_io_error_type = io_error.ptr();

    // StoreFormatError - bad headers, truncation, checksum failures
    auto format_error =
        nb::exception<std::runtime_error>(m, "StoreFormatError", PyExc_ValueError);
    store_format_error_type = format_error.ptr();

    // StoreError - invalid state, cancellation
    auto store_error = nb::exception<std::runtime_error>(m, "StoreError", PyExc_RuntimeError);
    store_error_type = store_error.ptr();
}

} // namespace pcapstore_python
