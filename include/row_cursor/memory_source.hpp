#pragma once
#include "row_cursor/source.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace rc {

// Seekable source over an owned byte string.
// `fill_limit` caps the window handed out by fill_buf (0 = everything left), which
// lets callers emulate a device that returns short reads.
class MemorySource : public SeekableSource {
public:
  explicit MemorySource(std::string data, std::size_t fill_limit = 0);

  std::string_view fill_buf(std::error_code& ec) override;
  void consume(std::size_t amt) override;
  std::uint64_t seek(SeekFrom pos, std::error_code& ec) override;

  std::uint64_t offset() const noexcept { return pos_; }
  std::size_t size() const noexcept { return data_.size(); }

private:
  std::string data_;
  std::size_t fill_limit_{0};
  std::uint64_t pos_{0};
};

}
