#pragma once
#include <string>
#include <system_error>
#include <type_traits>

namespace rc {

// Errors manufactured by the cursor itself; everything else comes from the source.
enum class CursorErrc {
  invalid_seek = 1, // computed byte or row target is negative
};

const std::error_category& cursor_category() noexcept;

std::error_code make_error_code(CursorErrc e) noexcept;

}

namespace std {
template <> struct is_error_code_enum<rc::CursorErrc> : true_type {};
}
