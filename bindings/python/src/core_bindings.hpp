#pragma once
// Core bindings: Timestamp, StoreConfig, DataPacket, PacketRecord, constants

#include <nanobind/nanobind.h>
#include <nanobind/stl/chrono.h>
#include <nanobind/stl/filesystem.h>
#include <nanobind/stl/string.h>

#include <pcapstore/data_packet.hpp>
#include <pcapstore/store_config.hpp>
#include <pcapstore/timestamp.hpp>

#include "py_types.hpp"

#include <chrono>
#include <sstream>

namespace nb = nanobind;
using namespace nb::literals;

namespace pcapstore_python {

inline void bind_core(nb::module_& m) {
    // =========================================================================
    // Constants
    // =========================================================================

    m.attr("SEGMENT_MAGIC") = pcapstore::SEGMENT_MAGIC;
    m.attr("INDEX_MAGIC") = pcapstore::INDEX_MAGIC;
    m.attr("VERSION_MAJOR") = pcapstore::VERSION_MAJOR;
    m.attr("VERSION_MINOR") = pcapstore::VERSION_MINOR;
    m.attr("MAX_PACKET_SIZE") = pcapstore::MAX_PACKET_SIZE_LIMIT;

    // =========================================================================
    // Timestamp
    // =========================================================================

    nb::class_<pcapstore::Timestamp>(m, "Timestamp", "UTC timestamp (seconds + nanoseconds)")
        .def(nb::init<>())
        .def(nb::init<uint32_t, uint32_t>(), "seconds"_a, "nanoseconds"_a = 0,
             "Create from seconds and nanoseconds (nanoseconds >= 1e9 carry into seconds)")
        .def_static("now", &pcapstore::Timestamp::now, "Current wall-clock time")
        .def_static(
            "from_nanoseconds",
            [](int64_t ns) {
                return pcapstore::Timestamp::from_nanoseconds(std::chrono::nanoseconds{ns});
            },
            "nanoseconds"_a, "Create from nanoseconds since the Unix epoch")
        .def_prop_ro("seconds", &pcapstore::Timestamp::seconds)
        .def_prop_ro("nanoseconds", &pcapstore::Timestamp::nanoseconds)
        .def_prop_ro("total_nanoseconds", &pcapstore::Timestamp::total_nanoseconds)
        .def("__eq__", [](const pcapstore::Timestamp& a,
                          const pcapstore::Timestamp& b) { return a == b; })
        .def("__lt__", [](const pcapstore::Timestamp& a,
                          const pcapstore::Timestamp& b) { return a < b; })
        .def("__le__", [](const pcapstore::Timestamp& a,
                          const pcapstore::Timestamp& b) { return a <= b; })
        .def("__hash__",
             [](const pcapstore::Timestamp& t) { return t.total_nanoseconds(); })
        .def("__repr__", [](const pcapstore::Timestamp& t) {
            std::ostringstream oss;
            oss << "Timestamp(seconds=" << t.seconds() << ", nanoseconds=" << t.nanoseconds()
                << ")";
            return oss.str();
        });

    // =========================================================================
    // StoreConfig
    // =========================================================================

    nb::class_<pcapstore::StoreConfig>(m, "StoreConfig", "Store tuning parameters")
        .def(nb::init<>())
        .def_static("high_throughput", &pcapstore::StoreConfig::high_throughput,
                    "Large segments and write buffer")
        .def_static("low_memory", &pcapstore::StoreConfig::low_memory,
                    "Small segments and write buffer")
        .def_rw("max_packets_per_segment", &pcapstore::StoreConfig::max_packets_per_segment,
                "Packets per segment before rotation")
        .def_rw("index_interval", &pcapstore::StoreConfig::index_interval,
                "Minimum time between index samples")
        .def_rw("write_buffer_size", &pcapstore::StoreConfig::write_buffer_size,
                "Segment write buffer in bytes")
        .def_rw("auto_flush", &pcapstore::StoreConfig::auto_flush,
                "Flush to disk after every packet")
        .def_rw("verify_checksums", &pcapstore::StoreConfig::verify_checksums,
                "Recompute payload CRC on read")
        .def_rw("overwrite", &pcapstore::StoreConfig::overwrite,
                "Replace an existing store on create")
        .def_rw("skip_corrupt_segments", &pcapstore::StoreConfig::skip_corrupt_segments,
                "Skip unreadable segments instead of failing")
        .def("validate",
             [](const pcapstore::StoreConfig& c) { unwrap(pcapstore::validate(c)); },
             "Raise ValueError if any field is out of range")
        .def("__repr__", [](const pcapstore::StoreConfig& c) {
            std::ostringstream oss;
            oss << "StoreConfig(max_packets_per_segment=" << c.max_packets_per_segment
                << ", index_interval_ns=" << c.index_interval.count()
                << ", write_buffer_size=" << c.write_buffer_size << ")";
            return oss.str();
        });

    // =========================================================================
    // DataPacket
    // =========================================================================

    nb::class_<pcapstore::DataPacket>(m, "DataPacket", "Timestamped payload with CRC-32")
        .def(
            "__init__",
            [](pcapstore::DataPacket* self, const pcapstore::Timestamp& ts,
               const nb::bytes& payload) {
                new (self) pcapstore::DataPacket(
                    unwrap(pcapstore::DataPacket::create(ts, as_span(payload))));
            },
            "timestamp"_a, "payload"_a,
            "Create a packet. Raises ValueError if the payload exceeds 30 MiB.")
        .def_prop_ro("timestamp", &pcapstore::DataPacket::timestamp)
        .def_prop_ro("payload",
                     [](const pcapstore::DataPacket& p) { return to_bytes(p.payload()); })
        .def_prop_ro("checksum", &pcapstore::DataPacket::checksum)
        .def_prop_ro("total_size", &pcapstore::DataPacket::total_size,
                     "Header plus payload bytes on disk")
        .def("verify_checksum", &pcapstore::DataPacket::verify_checksum)
        .def("__len__", &pcapstore::DataPacket::payload_length)
        .def("__eq__", [](const pcapstore::DataPacket& a,
                          const pcapstore::DataPacket& b) { return a == b; })
        .def("__repr__", [](const pcapstore::DataPacket& p) {
            std::ostringstream oss;
            oss << "DataPacket(timestamp=" << p.timestamp().total_nanoseconds()
                << "ns, payload_length=" << p.payload_length() << ")";
            return oss.str();
        });

    // =========================================================================
    // PacketRecord
    // =========================================================================

    nb::class_<pcapstore::PacketRecord>(m, "PacketRecord",
                                        "Packet read back with its store position")
        .def_ro("packet", &pcapstore::PacketRecord::packet)
        .def_ro("sequence", &pcapstore::PacketRecord::sequence,
                "0-based position across the whole store")
        .def_ro("segment", &pcapstore::PacketRecord::segment)
        .def_ro("offset", &pcapstore::PacketRecord::offset,
                "Byte offset of the packet header in its segment")
        .def_ro("checksum_status", &pcapstore::PacketRecord::checksum_status)
        .def("__repr__", [](const pcapstore::PacketRecord& r) {
            std::ostringstream oss;
            oss << "PacketRecord(sequence=" << r.sequence
                << ", segment=" << r.segment.filename().string() << ", offset=" << r.offset
                << ", checksum=" << pcapstore::checksum_status_string(r.checksum_status)
                << ")";
            return oss.str();
        });
}

} // namespace pcapstore_python
