#include "row_cursor/cached_row_cursor.hpp"
#include "row_cursor/row_scan.hpp"
#include <stdexcept>
#include <utility>

namespace rc {

CachedRowCursor::CachedRowCursor(std::unique_ptr<SeekableSource> src, Config cfg)
  : inner_(std::move(src)), sep_(cfg.separator), granularity_(cfg.granularity) {
  if (!inner_) throw std::invalid_argument("source is null");
  if (granularity_ == 0) throw std::invalid_argument("granularity == 0");
}

CachedRowCursor::CachedRowCursor(std::unique_ptr<SeekableSource> src, char separator,
                                 std::uint64_t granularity)
  : CachedRowCursor(std::move(src), Config{separator, granularity}) {}

void CachedRowCursor::set_granularity(std::uint64_t g) {
  if (g == 0) throw std::invalid_argument("granularity == 0");
  granularity_ = g;
}

bool CachedRowCursor::reposition(std::uint64_t byte, std::error_code& ec) {
  const std::int64_t delta = static_cast<std::int64_t>(byte) - static_cast<std::int64_t>(pos_);
  if (delta != 0) {
    inner_->seek(SeekFrom::current(delta), ec);
    if (ec) return false;
    ++stats_.repositions;
  }
  pos_ = byte;
  return true;
}

std::size_t CachedRowCursor::read_row(std::string& buf, std::error_code& ec) {
  const std::size_t n = inner_->read_until(sep_, buf, ec);
  pos_ += n;
  stats_.bytes_scanned += n;
  if (ec) return n; // a partial row stays uncounted

  if (n != 0) {
    ++row_pos_;
    ++stats_.rows_scanned;
    if (row_pos_ % granularity_ == 0) cache_.emplace(row_pos_, pos_); // never overwrites
  } else {
    if (!total_rows_)   total_rows_   = row_pos_;
    if (!total_length_) total_length_ = pos_;
  }
  return n;
}

std::uint64_t CachedRowCursor::set_position(std::uint64_t pos, std::error_code& ec) {
  ec.clear();

  // Last sample strictly before the target; offsets grow with rows.
  std::uint64_t from_row = 0, from_byte = 0;
  for (const auto& [row, byte] : cache_) {
    if (byte >= pos) break;
    from_row = row;
    from_byte = byte;
  }

  if (!reposition(from_byte, ec)) return pos_;
  row_pos_ = from_row;

  std::string scratch;
  while (pos_ < pos) {
    scratch.clear();
    if (read_row(scratch, ec) == 0 || ec) break;
  }
  if (ec) return pos_;

  // Landed past the target: step back into the row, which is no longer complete.
  if (pos_ > pos) {
    inner_->seek(SeekFrom::current(static_cast<std::int64_t>(pos) - static_cast<std::int64_t>(pos_)), ec);
    if (ec) return pos_;
    ++stats_.repositions;
    pos_ = pos;
    --row_pos_;
  }
  return pos_;
}

std::uint64_t CachedRowCursor::set_row_position(std::uint64_t row, std::error_code& ec) {
  ec.clear();

  auto it = cache_.upper_bound(row);
  --it; // (0, 0) is always present

  if (!reposition(it->second, ec)) return row_pos_;
  row_pos_ = it->first;

  std::string scratch;
  while (row_pos_ < row) {
    scratch.clear();
    if (read_row(scratch, ec) == 0 || ec) break;
  }
  return row_pos_;
}

void CachedRowCursor::scan_to_end(std::error_code& ec) {
  ec.clear();
  std::string scratch;
  while (!total_length_) {
    scratch.clear();
    read_row(scratch, ec);
    if (ec) return;
  }
}

std::uint64_t CachedRowCursor::seek(SeekFrom pos, std::error_code& ec) {
  ec.clear();
  std::int64_t target = 0;
  switch (pos.whence) {
    case SeekFrom::Whence::Start:
      target = pos.offset;
      break;
    case SeekFrom::Whence::Current:
      target = offset_from(pos_, pos.offset);
      break;
    case SeekFrom::Whence::End:
      scan_to_end(ec);
      if (ec) return pos_;
      target = offset_from(*total_length_, pos.offset);
      if (target >= 0) --target; // End(0) is the last byte
      break;
  }

  if (target < 0) {
    ec = CursorErrc::invalid_seek;
    return pos_;
  }
  return set_position(static_cast<std::uint64_t>(target), ec);
}

std::uint64_t CachedRowCursor::seek_row(SeekFrom pos, std::error_code& ec) {
  ec.clear();
  std::int64_t target = 0;
  switch (pos.whence) {
    case SeekFrom::Whence::Start:
      target = pos.offset;
      break;
    case SeekFrom::Whence::Current:
      target = offset_from(row_pos_, pos.offset);
      break;
    case SeekFrom::Whence::End:
      scan_to_end(ec);
      if (ec) return row_pos_;
      target = offset_from(*total_rows_, pos.offset);
      if (target >= 0) --target; // End(0) is the last row
      break;
  }

  if (target < 0) {
    ec = CursorErrc::invalid_seek;
    return row_pos_;
  }
  return set_row_position(static_cast<std::uint64_t>(target), ec);
}

std::size_t CachedRowCursor::read(char* dst, std::size_t len, std::error_code& ec) {
  const std::size_t n = inner_->read(dst, len, ec);
  pos_ += n;
  row_pos_ += count_separators(std::string_view(dst, n), sep_);
  return n;
}

std::string_view CachedRowCursor::fill_buf(std::error_code& ec) { return inner_->fill_buf(ec); }

void CachedRowCursor::consume(std::size_t amt) {
  pos_ += amt;
  inner_->consume(amt);
}

std::size_t CachedRowCursor::read_until(char byte, std::string& buf, std::error_code& ec) {
  if (byte == sep_) return read_row(buf, ec);

  const std::size_t before = buf.size();
  const std::size_t n = inner_->read_until(byte, buf, ec);
  pos_ += n;
  // The target byte differs from the separator, so every separator appended precedes it.
  row_pos_ += count_separators(std::string_view(buf).substr(before, n), sep_);
  return n;
}

}
