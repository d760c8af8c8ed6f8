#pragma once
#include "row_cursor/source.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <system_error>

namespace rc {

// Row reader for sources that cannot seek (pipes, sockets, stdin).
// Keeps the same byte/row counters as CachedRowCursor but no index: it only
// moves forward.
class ForwardRowReader {
public:
  // Throws std::invalid_argument when the source is null.
  explicit ForwardRowReader(std::unique_ptr<SequentialSource> src, char separator = '\n');

  std::size_t read_row(std::string& buf, std::error_code& ec);

  // Discards up to `n` rows. Returns how many were actually skipped.
  std::uint64_t skip_rows(std::uint64_t n, std::error_code& ec);

  std::size_t read(char* dst, std::size_t len, std::error_code& ec);

  std::uint64_t position() const noexcept { return pos_; }
  std::uint64_t row_position() const noexcept { return row_pos_; }
  std::optional<std::uint64_t> total_rows() const noexcept { return total_rows_; }

  char separator() const noexcept { return sep_; }
  void set_separator(char sep) noexcept { sep_ = sep; }

private:
  std::unique_ptr<SequentialSource> inner_;
  std::uint64_t pos_{0};
  std::uint64_t row_pos_{0};
  std::optional<std::uint64_t> total_rows_;
  char sep_{'\n'};
};

}
