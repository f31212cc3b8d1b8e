#pragma once
// Store bindings: StoreWriter, StoreReader

#include <nanobind/nanobind.h>
#include <nanobind/stl/filesystem.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

#include <pcapstore/pcapstore.hpp>

#include "py_types.hpp"

#include <sstream>
#include <variant>

namespace nb = nanobind;
using namespace nb::literals;

namespace pcapstore_python {

inline void bind_store(nb::module_& m) {
    // =========================================================================
    // WriterState
    // =========================================================================

    nb::enum_<pcapstore::WriterState>(m, "WriterState", "StoreWriter lifecycle")
        .value("created", pcapstore::WriterState::created)
        .value("active", pcapstore::WriterState::active)
        .value("closed", pcapstore::WriterState::closed)
        .def("__str__", [](pcapstore::WriterState s) {
            return std::string(pcapstore::io::writer_state_string(s));
        });

    // =========================================================================
    // StoreWriter
    // =========================================================================

    nb::class_<PyStoreWriter>(m, "StoreWriter", "Record packets into a segmented store")
        .def(
            "__init__",
            [](PyStoreWriter* self, const std::filesystem::path& base_dir,
               const std::string& name, const pcapstore::StoreConfig& config) {
                new (self) PyStoreWriter(
                    unwrap(pcapstore::StoreWriter::create(base_dir, name, config)));
            },
            "base_dir"_a, "name"_a, "config"_a = pcapstore::StoreConfig{},
            "Create base_dir/name.pcap and base_dir/name/. Raises StoreIOError if the store "
            "exists.")
        .def(
            "write_packet",
            [](PyStoreWriter& w, const pcapstore::DataPacket& packet) {
                auto result = [&]() {
                    nb::gil_scoped_release release;
                    return w.writer.write_packet(packet);
                }();
                unwrap(std::move(result));
            },
            "packet"_a, "Append one packet")
        .def(
            "write",
            [](PyStoreWriter& w, const pcapstore::Timestamp& ts, const nb::bytes& payload) {
                auto packet = unwrap(pcapstore::DataPacket::create(ts, as_span(payload)));
                auto result = [&]() {
                    nb::gil_scoped_release release;
                    return w.writer.write_packet(packet);
                }();
                unwrap(std::move(result));
            },
            "timestamp"_a, "payload"_a, "Append a payload with the given timestamp")
        .def("flush", [](PyStoreWriter& w) {
            auto result = [&]() {
                nb::gil_scoped_release release;
                return w.writer.flush();
            }();
            unwrap(std::move(result));
        }, "Make everything written so far durable")
        .def("close", [](PyStoreWriter& w) { unwrap(w.writer.close()); },
             "Flush and close the store (idempotent)")
        .def("__enter__", [](PyStoreWriter& w) -> PyStoreWriter& { return w; },
             nb::rv_policy::reference)
        .def("__exit__",
             [](PyStoreWriter& w, nb::handle, nb::handle, nb::handle) {
                 unwrap(w.writer.close());
             },
             nb::arg().none(), nb::arg().none(), nb::arg().none())
        .def_prop_ro("packet_count", [](PyStoreWriter& w) { return w.writer.packet_count(); })
        .def_prop_ro("segment_count", [](PyStoreWriter& w) { return w.writer.segment_count(); })
        .def_prop_ro("segment_paths", [](PyStoreWriter& w) { return w.writer.segment_paths(); })
        .def_prop_ro("file_size", [](PyStoreWriter& w) { return w.writer.file_size(); },
                     "Bytes written to the index and all segments")
        .def_prop_ro("index_path", [](PyStoreWriter& w) { return w.writer.index_path(); })
        .def_prop_ro("state", [](PyStoreWriter& w) { return w.writer.state(); })
        .def_prop_ro("is_open", [](PyStoreWriter& w) { return w.writer.is_open(); })
        .def("__repr__", [](PyStoreWriter& w) {
            std::ostringstream oss;
            oss << "StoreWriter(" << w.writer.index_path().string()
                << ", packets=" << w.writer.packet_count()
                << ", segments=" << w.writer.segment_count()
                << ", state=" << pcapstore::io::writer_state_string(w.writer.state()) << ")";
            return oss.str();
        });

    // =========================================================================
    // StoreReader
    // =========================================================================

    nb::class_<PyStoreReader>(m, "StoreReader", "Replay packets from a segmented store")
        .def(
            "__init__",
            [](PyStoreReader* self, const std::filesystem::path& base_dir,
               const std::string& name, const pcapstore::StoreConfig& config) {
                new (self) PyStoreReader(
                    unwrap(pcapstore::StoreReader::open(base_dir, name, config)));
            },
            "base_dir"_a, "name"_a, "config"_a = pcapstore::StoreConfig{},
            "Open base_dir/name.pcap. Raises StoreIOError if the store cannot be found.")
        // read_next_packet - returns PacketRecord or None at end of store
        .def(
            "read_next_packet",
            [](PyStoreReader& r) -> nb::object {
                auto result = [&]() {
                    nb::gil_scoped_release release;
                    return r.reader.read_next_packet();
                }();
                if (!result.has_value()) {
                    if (pcapstore::is_eof(result.error())) {
                        return nb::none();
                    }
                    raise_store_error(std::get<pcapstore::StoreError>(result.error()));
                }
                return nb::cast(std::move(*result));
            },
            "Read next packet. Returns PacketRecord, or None at the end of the store.\n\n"
            "Raises StoreFormatError once for a truncated segment; the next call continues "
            "with the following segment.")
        .def(
            "read_packets",
            [](PyStoreReader& r, size_t count) {
                auto result = [&]() {
                    nb::gil_scoped_release release;
                    return r.reader.read_packets(count);
                }();
                return unwrap(std::move(result));
            },
            "count"_a, "Read up to count packets")
        // Iterator protocol
        .def("__iter__", [](PyStoreReader& r) -> PyStoreReader& {
            return r;
        }, nb::rv_policy::reference)
        .def("__next__", [](PyStoreReader& r) -> nb::object {
            while (true) {
                auto result = [&]() {
                    nb::gil_scoped_release release;
                    return r.reader.read_next_packet();
                }();

                if (!result.has_value()) {
                    const auto& err = result.error();
                    if (pcapstore::is_eof(err)) {
                        throw nb::stop_iteration();
                    }
                    // Damaged segment -> count it and continue with the next one
                    if (pcapstore::has_code(err, pcapstore::ErrorCode::truncated_data) ||
                        pcapstore::has_code(err, pcapstore::ErrorCode::format_error)) {
                        r.skipped_count++;
                        continue;
                    }
                    raise_store_error(std::get<pcapstore::StoreError>(err));
                }
                return nb::cast(std::move(*result));
            }
        })
        .def("seek_to_time",
             [](PyStoreReader& r, const pcapstore::Timestamp& ts) {
                 nb::gil_scoped_release release;
                 return r.reader.seek_to_time(ts);
             },
             "timestamp"_a,
             "Position at the first packet at or after timestamp. Returns False if the "
             "timestamp predates the store.")
        .def("seek_to_packet",
             [](PyStoreReader& r, uint64_t index) {
                 nb::gil_scoped_release release;
                 return r.reader.seek_to_packet(index);
             },
             "index"_a, "Position at a global packet sequence number")
        .def("rewind", [](PyStoreReader& r) { r.reader.rewind(); },
             "Return to the first packet")
        .def("packet_count", [](PyStoreReader& r) { return unwrap(r.reader.packet_count()); },
             "Total number of whole packets in the store")
        .def_prop_ro("first_timestamp",
                     [](PyStoreReader& r) { return r.reader.first_timestamp(); })
        .def_prop_ro("last_timestamp",
                     [](PyStoreReader& r) { return r.reader.last_timestamp(); })
        .def_prop_ro("position", [](PyStoreReader& r) { return r.reader.position(); },
                     "Sequence number of the packet the next read returns")
        .def_prop_ro("file_size", [](PyStoreReader& r) { return r.reader.file_size(); })
        .def_prop_ro("segment_paths", [](PyStoreReader& r) { return r.reader.segment_paths(); })
        .def_prop_ro("skipped_segments",
                     [](PyStoreReader& r) { return r.reader.skipped_segments(); })
        .def_prop_ro("has_index", [](PyStoreReader& r) { return r.reader.has_index(); })
        .def_prop_ro("skipped_count", [](PyStoreReader& r) {
            return r.skipped_count;
        }, "Number of damaged segments passed over during iteration")
        .def("__repr__", [](PyStoreReader& r) {
            std::ostringstream oss;
            oss << "StoreReader(" << r.reader.index_path().string()
                << ", segments=" << r.reader.segment_paths().size()
                << ", position=" << r.reader.position();
            if (!r.reader.has_index()) {
                oss << ", no index";
            }
            oss << ")";
            return oss.str();
        });
}

} // namespace pcapstore_python
