#pragma once

/**
 * @file pcapstore.hpp
 * @brief Convenience header for the segmented packet store
 *
 * This header provides everything needed to record and replay timestamped binary
 * packets.
 *
 * Primary types:
 * - StoreWriter: Record packets, rotating segments and maintaining the time index
 * - StoreReader: Replay packets sequentially or from a wall-clock time
 * - DataPacket: Immutable timestamped payload with CRC-32
 * - PacketRecord: A packet read back together with its position and checksum status
 * - StoreConfig / FormatConfig: Tuning knobs and on-disk constants
 *
 * Lower-level building blocks (for tools that inspect individual files):
 * - SegmentWriter / SegmentReader: One segment file
 * - ProjectIndex / ProjectIndexWriter: The time index
 * - format:: codecs and checksum:: helpers
 */

#include "checksum.hpp"
#include "data_packet.hpp"
#include "error.hpp"
#include "expected.hpp"
#include "format.hpp"
#include "io/async.hpp"
#include "io/project_index.hpp"
#include "io/segment_reader.hpp"
#include "io/segment_writer.hpp"
#include "io/store_layout.hpp"
#include "io/store_reader.hpp"
#include "io/store_writer.hpp"
#include "logging.hpp"
#include "store_config.hpp"
#include "timestamp.hpp"

namespace pcapstore {

// Store facades - the recommended entry points
using StoreWriter = io::StoreWriter;
using StoreReader = io::StoreReader;
using WriterState = io::WriterState;

// Single-file access (validators, repair tools)
using SegmentWriter = io::SegmentWriter;
using SegmentReader = io::SegmentReader;
using ProjectIndex = io::ProjectIndex;
using ProjectIndexWriter = io::ProjectIndexWriter;

} // namespace pcapstore
