#pragma once

// PCAPSTORE Expected Type
//
// Exposes tl::expected in the pcapstore namespace for consistent error handling.
// This provides a std::expected-compatible API (C++23) using the TartanLlama
// implementation for C++20 compatibility.
//
// Usage:
//   pcapstore::Result<SegmentWriter> writer = SegmentWriter::create(path, format);
//   if (!writer) {
//       log(writer.error().describe());
//   }
//
// Monadic operations:
//   result.and_then(f)  - chain on success
//   result.map(f)       - transform value
//   result.or_else(f)   - chain on error
//   result.map_error(f) - transform error

#include <tl/expected.hpp>

namespace pcapstore {

using tl::expected;
using tl::make_unexpected;
using tl::unexpect;
using tl::unexpect_t;
using tl::unexpected;

} // namespace pcapstore
