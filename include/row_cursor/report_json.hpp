#pragma once
#include "row_cursor/cached_row_cursor.hpp"
#include "row_cursor/metrics.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace rc {

struct CursorReport {
  // Input metadata
  std::string filename;
  std::uint64_t file_size = 0;

  // Cursor configuration and state
  unsigned separator = '\n'; // byte value
  std::uint64_t granularity = 0;
  std::uint64_t byte_position = 0;
  std::uint64_t row_position = 0;
  std::optional<std::uint64_t> total_length; // null until end of stream was seen
  std::optional<std::uint64_t> total_rows;

  // Sparse index
  std::uint64_t cache_samples = 0;
  std::uint64_t last_sample_row = 0;
  std::uint64_t last_sample_byte = 0;

  ScanStats scan;
  RunStats run;
};

// Copies the observable state of `c` into a report (run timings left empty).
CursorReport make_report(const CachedRowCursor& c, std::string filename, std::uint64_t file_size);

class ReportJsonWriter {
public:
  // Serialize report to a compact JSON object.
  static std::string to_json(const CursorReport& r);
};

}
