#include "row_cursor/cursor_error.hpp"

namespace rc {

namespace {

class CursorCategory : public std::error_category {
public:
  const char* name() const noexcept override { return "row_cursor"; }

  std::string message(int ev) const override {
    switch (static_cast<CursorErrc>(ev)) {
      case CursorErrc::invalid_seek: return "invalid seek to a negative position";
    }
    return "unknown row_cursor error";
  }

  // Lets callers test against std::errc::invalid_argument without knowing our enum.
  std::error_condition default_error_condition(int ev) const noexcept override {
    if (static_cast<CursorErrc>(ev) == CursorErrc::invalid_seek)
      return std::make_error_condition(std::errc::invalid_argument);
    return std::error_condition(ev, *this);
  }
};

}

const std::error_category& cursor_category() noexcept {
  static const CursorCategory cat;
  return cat;
}

std::error_code make_error_code(CursorErrc e) noexcept {
  return std::error_code(static_cast<int>(e), cursor_category());
}

}
