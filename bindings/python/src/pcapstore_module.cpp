// pcapstore Python Bindings
// Main module entry point - includes component bindings

#include <nanobind/nanobind.h>

// Binding components
#include "core_bindings.hpp"
#include "error_bindings.hpp"
#include "store_bindings.hpp"

namespace nb = nanobind;

// Define the exception type pointers (declared extern in py_types.hpp)
namespace pcapstore_python {
PyObject* store_io_error_type = nullptr;
PyObject* store_format_error_type = nullptr;
PyObject* store_error_type = nullptr;
} // namespace pcapstore_python

NB_MODULE(pcapstore, m) {
    m.doc() = "pcapstore - segmented packet record/replay store";

    // Bind components in dependency order:
    // 1. Error types (sets the exception pointers, ErrorCode, ChecksumStatus)
    pcapstore_python::bind_errors(m);

    // 2. Core types (Timestamp, StoreConfig, DataPacket, PacketRecord) - needs exceptions
    pcapstore_python::bind_core(m);

    // 3. Store facades - needs core types
    pcapstore_python::bind_store(m);

    // Library logging goes to stderr at warn level; let Python callers adjust it
    m.def(
        "set_log_level",
        [](const std::string& level) {
            pcapstore::set_log_level(spdlog::level::from_str(level));
        },
        "level"_a, "Set library log level (trace, debug, info, warn, err, critical, off)");
}
