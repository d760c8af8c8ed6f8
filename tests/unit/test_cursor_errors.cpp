#include "row_cursor/cached_row_cursor.hpp"
#include "row_cursor/cursor_error.hpp"
#include "../support/check.hpp"
#include <algorithm>
#include <limits>
#include <memory>
#include <string>
#include <utility>

namespace {

const std::string kFixture = "foo\nbar\nbiz\nbaz\nbuz\n";

// Source that fails with EIO once the read head reaches `fail_at`.
class FlakySource : public rc::SeekableSource {
public:
  FlakySource(std::string data, std::uint64_t fail_at)
    : data_(std::move(data)), fail_at_(fail_at) {}

  std::string_view fill_buf(std::error_code& ec) override {
    ++calls;
    if (pos_ >= fail_at_) {
      ec = std::make_error_code(std::errc::io_error);
      return {};
    }
    ec.clear();
    if (pos_ >= data_.size()) return {};
    std::uint64_t end = std::min<std::uint64_t>(data_.size(), fail_at_);
    return std::string_view(data_.data() + pos_, static_cast<std::size_t>(end - pos_));
  }

  void consume(std::size_t amt) override { pos_ += amt; }

  std::uint64_t seek(rc::SeekFrom pos, std::error_code& ec) override {
    ++calls;
    std::int64_t base = pos.whence == rc::SeekFrom::Whence::Start ? 0
                      : pos.whence == rc::SeekFrom::Whence::Current ? static_cast<std::int64_t>(pos_)
                      : static_cast<std::int64_t>(data_.size());
    std::int64_t target = base + pos.offset;
    if (target < 0) { ec = std::make_error_code(std::errc::invalid_argument); return pos_; }
    ec.clear();
    pos_ = static_cast<std::uint64_t>(target);
    return pos_;
  }

  void heal() { fail_at_ = std::numeric_limits<std::uint64_t>::max(); }

  int calls = 0;

private:
  std::string data_;
  std::uint64_t fail_at_;
  std::uint64_t pos_{0};
};

void category_basics() {
  std::error_code ec = rc::CursorErrc::invalid_seek;
  rc_test::check(ec.category() == rc::cursor_category(), "ec.category() == rc::cursor_category()");
  rc_test::check(std::string(ec.category().name()) == "row_cursor", "std::string(ec.category().name()) == \"row_cursor\"");
  rc_test::check(ec.message() == "invalid seek to a negative position", "ec.message() == \"invalid seek to a negative position\"");
  rc_test::check(ec == std::errc::invalid_argument, "ec == std::errc::invalid_argument");
  rc_test::check(ec != std::errc::io_error, "ec != std::errc::io_error");
}

void read_failure_is_passed_through() {
  auto owned = std::make_unique<FlakySource>(kFixture, 10);
  FlakySource* src = owned.get();
  rc::CachedRowCursor cur(std::move(owned), '\n', 1);
  std::error_code ec;

  std::string row;
  cur.read_row(row, ec);
  row.clear();
  cur.read_row(row, ec);
  rc_test::check(!ec && cur.row_position() == 2, "!ec && cur.row_position() == 2");

  row.clear();
  rc_test::check(cur.read_row(row, ec) == 2, "cur.read_row(row, ec) == 2");
  rc_test::check(ec == std::errc::io_error, "ec == std::errc::io_error");
  rc_test::check(row == "bi", "row == \"bi\"");
  rc_test::check(cur.position() == 10, "cur.position() == 10"); // bytes taken from the source are counted
  rc_test::check(cur.row_position() == 2, "cur.row_position() == 2");
  rc_test::check(!cur.total_rows(), "!cur.total_rows()");

  // Once the device recovers the partial row completes normally.
  src->heal();
  row.clear();
  rc_test::check(cur.read_row(row, ec) == 2 && !ec, "cur.read_row(row, ec) == 2 && !ec");
  rc_test::check(row == "z\n", "row == \"z\\n\"");
  rc_test::check(cur.position() == 12, "cur.position() == 12");
  rc_test::check(cur.row_position() == 3, "cur.row_position() == 3");
}

void invalid_seek_touches_nothing() {
  auto owned = std::make_unique<FlakySource>(kFixture, 1000);
  FlakySource* src = owned.get();
  rc::CachedRowCursor cur(std::move(owned), '\n', 1);
  std::error_code ec;

  cur.set_row_position(2, ec);
  const int calls = src->calls;

  rc_test::check(cur.seek(rc::SeekFrom::current(-9), ec) == 8, "cur.seek(rc::SeekFrom::current(-9), ec) == 8");
  rc_test::check(ec == rc::CursorErrc::invalid_seek, "ec == rc::CursorErrc::invalid_seek");
  rc_test::check(cur.seek_row(rc::SeekFrom::current(-3), ec) == 2, "cur.seek_row(rc::SeekFrom::current(-3), ec) == 2");
  rc_test::check(ec == rc::CursorErrc::invalid_seek, "ec == rc::CursorErrc::invalid_seek");
  rc_test::check(src->calls == calls, "src->calls == calls");
  rc_test::check(cur.position() == 8 && cur.row_position() == 2, "cur.position() == 8 && cur.row_position() == 2");
}

void end_seek_reports_scan_failure() {
  rc::CachedRowCursor cur(std::make_unique<FlakySource>(kFixture, 10), '\n', 1);
  std::error_code ec;

  cur.seek(rc::SeekFrom::end(0), ec);
  rc_test::check(ec == std::errc::io_error, "ec == std::errc::io_error");
  rc_test::check(!cur.total_length(), "!cur.total_length()");

  cur.seek_row(rc::SeekFrom::end(0), ec);
  rc_test::check(ec == std::errc::io_error, "ec == std::errc::io_error");
  rc_test::check(!cur.total_rows(), "!cur.total_rows()");

  cur.set_position(15, ec);
  rc_test::check(ec == std::errc::io_error, "ec == std::errc::io_error");
  rc_test::check(cur.position() == 10, "cur.position() == 10");
}

void success_clears_previous_error() {
  rc::CachedRowCursor cur(std::make_unique<FlakySource>(kFixture, 1000), '\n', 1);
  std::error_code ec = std::make_error_code(std::errc::io_error);
  rc_test::check(cur.set_position(4, ec) == 4, "cur.set_position(4, ec) == 4");
  rc_test::check(!ec, "!ec");
}

}

int main() {
  category_basics();
  read_failure_is_passed_through();
  invalid_seek_touches_nothing();
  end_seek_reports_scan_failure();
  success_clears_previous_error();
  return rc_test::finish("cursor_errors");
}
