#include "row_cursor/memory_source.hpp"
#include <algorithm>
#include <utility>

namespace rc {

MemorySource::MemorySource(std::string data, std::size_t fill_limit)
  : data_(std::move(data)), fill_limit_(fill_limit), pos_(0) {}

std::string_view MemorySource::fill_buf(std::error_code& ec) {
  ec.clear();
  if (pos_ >= data_.size()) return {};
  std::size_t left = data_.size() - static_cast<std::size_t>(pos_);
  if (fill_limit_ && left > fill_limit_) left = fill_limit_;
  return std::string_view(data_.data() + pos_, left);
}

void MemorySource::consume(std::size_t amt) {
  if (pos_ >= data_.size()) return;
  pos_ += std::min<std::uint64_t>(amt, data_.size() - pos_);
}

std::uint64_t MemorySource::seek(SeekFrom pos, std::error_code& ec) {
  std::uint64_t base = 0;
  switch (pos.whence) {
    case SeekFrom::Whence::Start:   base = 0; break;
    case SeekFrom::Whence::Current: base = pos_; break;
    case SeekFrom::Whence::End:     base = data_.size(); break;
  }
  const std::int64_t target = offset_from(base, pos.offset);
  if (target < 0) {
    ec = std::make_error_code(std::errc::invalid_argument);
    return pos_;
  }
  ec.clear();
  pos_ = static_cast<std::uint64_t>(target); // past-the-end is allowed; reads return 0
  return pos_;
}

}
