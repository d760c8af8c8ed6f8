#pragma once
#include "row_cursor/seek_from.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace rc {

// Buffered, forward-only byte source.
// Implementations provide the buffer window (fill_buf/consume); plain reads and
// delimiter reads are derived from it.
class SequentialSource {
public:
  virtual ~SequentialSource() = default;

  // Returns the buffered bytes, refilling from the device when the window is empty.
  // An empty view with `ec` clear means end of stream.
  virtual std::string_view fill_buf(std::error_code& ec) = 0;

  // Marks `amt` bytes of the current window as read.
  virtual void consume(std::size_t amt) = 0;

  // Copies at most `len` bytes out of one window. Returns 0 at end of stream.
  std::size_t read(char* dst, std::size_t len, std::error_code& ec);

  // Appends bytes to `out` up to and including `delim` (or end of stream).
  // On failure the bytes already appended are still reported in the return value.
  std::size_t read_until(char delim, std::string& out, std::error_code& ec);
};

class SeekableSource : public SequentialSource {
public:
  // Repositions the stream and returns the new absolute offset.
  // A negative target fails with std::errc::invalid_argument.
  virtual std::uint64_t seek(SeekFrom pos, std::error_code& ec) = 0;
};

}
