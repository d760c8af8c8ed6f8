#include "row_cursor/forward_row_reader.hpp"
#include "row_cursor/row_scan.hpp"
#include <stdexcept>
#include <string_view>
#include <utility>

namespace rc {

ForwardRowReader::ForwardRowReader(std::unique_ptr<SequentialSource> src, char separator)
  : inner_(std::move(src)), sep_(separator) {
  if (!inner_) throw std::invalid_argument("source is null");
}

std::size_t ForwardRowReader::read_row(std::string& buf, std::error_code& ec) {
  const std::size_t n = inner_->read_until(sep_, buf, ec);
  pos_ += n;
  if (ec) return n;
  if (n != 0) ++row_pos_;
  else if (!total_rows_) total_rows_ = row_pos_;
  return n;
}

std::uint64_t ForwardRowReader::skip_rows(std::uint64_t n, std::error_code& ec) {
  ec.clear();
  std::string scratch;
  std::uint64_t skipped = 0;
  while (skipped < n) {
    scratch.clear();
    if (read_row(scratch, ec) == 0 || ec) break;
    ++skipped;
  }
  return skipped;
}

std::size_t ForwardRowReader::read(char* dst, std::size_t len, std::error_code& ec) {
  const std::size_t n = inner_->read(dst, len, ec);
  pos_ += n;
  row_pos_ += count_separators(std::string_view(dst, n), sep_);
  return n;
}

}
