#pragma once
// Python wrapper types for pcapstore bindings

#include <nanobind/nanobind.h>

#include <pcapstore/pcapstore.hpp>

#include <cerrno>
#include <span>
#include <string>
#include <type_traits>
#include <utility>

namespace nb = nanobind;

namespace pcapstore_python {

// Exception type pointers (set during module init)
extern PyObject* store_io_error_type;
extern PyObject* store_format_error_type;
extern PyObject* store_error_type;

/**
 * @brief Raise the Python exception matching a StoreError
 *
 * io_error -> StoreIOError (OSError), format/truncation/checksum -> StoreFormatError
 * (ValueError), everything else -> StoreError (RuntimeError).
 */
[[noreturn]] inline void raise_store_error(const pcapstore::StoreError& err) {
    PyObject* type = store_error_type;
    switch (err.code) {
        case pcapstore::ErrorCode::io_error:
            type = store_io_error_type;
            break;
        case pcapstore::ErrorCode::format_error:
        case pcapstore::ErrorCode::truncated_data:
        case pcapstore::ErrorCode::checksum_mismatch:
            type = store_format_error_type;
            break;
        case pcapstore::ErrorCode::validation_error:
            type = PyExc_ValueError;
            break;
        default:
            break;
    }
    PyErr_SetString(type, err.describe().c_str());
    throw nb::python_error();
}

template <typename T>
T unwrap(pcapstore::Result<T>&& result) {
    if (!result) {
        raise_store_error(result.error());
    }
    if constexpr (!std::is_void_v<T>) {
        return std::move(*result);
    }
}

inline std::span<const uint8_t> as_span(const nb::bytes& data) {
    return {reinterpret_cast<const uint8_t*>(data.c_str()), data.size()};
}

inline nb::bytes to_bytes(std::span<const uint8_t> data) {
    return nb::bytes(reinterpret_cast<const char*>(data.data()), data.size());
}

/**
 * @brief Python wrapper for StoreWriter
 */
struct PyStoreWriter {
    pcapstore::StoreWriter writer;

    explicit PyStoreWriter(pcapstore::StoreWriter&& w) : writer(std::move(w)) {}

    PyStoreWriter(const PyStoreWriter&) = delete;
    PyStoreWriter& operator=(const PyStoreWriter&) = delete;
};

/**
 * @brief Python wrapper for StoreReader
 */
struct PyStoreReader {
    pcapstore::StoreReader reader;
    size_t skipped_count{0}; ///< Truncated or corrupt segments passed over by __next__

    explicit PyStoreReader(pcapstore::StoreReader&& r) : reader(std::move(r)) {}

    PyStoreReader(const PyStoreReader&) = delete;
    PyStoreReader& operator=(const PyStoreReader&) = delete;
};

} // namespace pcapstore_python
