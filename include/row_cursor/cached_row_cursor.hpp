#pragma once
#include "row_cursor/cursor_error.hpp"
#include "row_cursor/seek_from.hpp"
#include "row_cursor/source.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace rc {

// Work the cursor has done against its source.
struct ScanStats {
  std::uint64_t rows_scanned  = 0; // rows consumed by the row scanner, seeks included
  std::uint64_t bytes_scanned = 0;
  std::uint64_t repositions   = 0; // seeks issued to the source
};

// Random access by byte offset or by row index over a separator-delimited stream.
//
// Row seeks start from a sparse (row -> byte offset) index sampled every
// `granularity` rows and scan forward from there. The index is filled as a side
// effect of every row scan and always contains (0, 0).
//
// Byte offsets are relative to where the source stood when it was handed over:
// the cursor only issues relative seeks.
//
// On failure every operation sets `ec` and returns the current position; source
// errors are passed through unchanged, negative seek targets yield
// CursorErrc::invalid_seek without touching the source.
class CachedRowCursor {
public:
  struct Config {
    char          separator   = '\n';
    std::uint64_t granularity = 1024; // rows between index samples, > 0
  };

  using RowIndex = std::map<std::uint64_t, std::uint64_t>; // row -> byte offset

  // Throws std::invalid_argument when the source is null or granularity == 0.
  CachedRowCursor(std::unique_ptr<SeekableSource> src, Config cfg);
  CachedRowCursor(std::unique_ptr<SeekableSource> src, char separator, std::uint64_t granularity);

  std::uint64_t position() const noexcept { return pos_; }
  std::uint64_t row_position() const noexcept { return row_pos_; }

  // Moves to byte `pos`. A target inside a row leaves that row uncounted.
  // Clamps to end of stream.
  std::uint64_t set_position(std::uint64_t pos, std::error_code& ec);

  // Moves to the start of row `row`. Clamps to the row count.
  std::uint64_t set_row_position(std::uint64_t row, std::error_code& ec);

  // Appends the next row, separator included, to `buf`. Returns 0 at end of stream.
  std::size_t read_row(std::string& buf, std::error_code& ec);

  std::uint64_t seek(SeekFrom pos, std::error_code& ec);
  std::uint64_t seek_row(SeekFrom pos, std::error_code& ec);

  // Scans forward until end of stream has been observed once.
  void scan_to_end(std::error_code& ec);

  // Buffered pass-through. Row counting here is best-effort: a row split across
  // two reads is counted when its separator shows up.
  std::size_t read(char* dst, std::size_t len, std::error_code& ec);
  std::string_view fill_buf(std::error_code& ec);
  void consume(std::size_t amt); // amt must not exceed the last fill_buf window
  std::size_t read_until(char byte, std::string& buf, std::error_code& ec);

  char separator() const noexcept { return sep_; }
  void set_separator(char sep) noexcept { sep_ = sep; }
  std::uint64_t granularity() const noexcept { return granularity_; }
  void set_granularity(std::uint64_t g);

  std::optional<std::uint64_t> total_length() const noexcept { return total_length_; }
  std::optional<std::uint64_t> total_rows() const noexcept { return total_rows_; }

  const RowIndex& cache() const noexcept { return cache_; }
  const ScanStats& stats() const noexcept { return stats_; }

private:
  bool reposition(std::uint64_t byte, std::error_code& ec);

  std::unique_ptr<SeekableSource> inner_;
  std::uint64_t pos_{0};
  std::uint64_t row_pos_{0};
  std::optional<std::uint64_t> total_length_;
  std::optional<std::uint64_t> total_rows_;
  char sep_{'\n'};
  std::uint64_t granularity_{1};
  RowIndex cache_{{0, 0}};
  ScanStats stats_;
};

}
