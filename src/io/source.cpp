#include "row_cursor/source.hpp"
#include <algorithm>
#include <cstring>

namespace rc {

std::size_t SequentialSource::read(char* dst, std::size_t len, std::error_code& ec) {
  if (len == 0) return 0;
  std::string_view avail = fill_buf(ec);
  if (ec) return 0;
  std::size_t n = std::min(len, avail.size());
  std::memcpy(dst, avail.data(), n);
  consume(n);
  return n;
}

std::size_t SequentialSource::read_until(char delim, std::string& out, std::error_code& ec) {
  std::size_t total = 0;
  while (true) {
    std::string_view avail = fill_buf(ec);
    if (ec) return total;
    if (avail.empty()) return total; // EOF

    std::size_t hit = avail.find(delim);
    std::size_t take = (hit == std::string_view::npos) ? avail.size() : hit + 1;
    out.append(avail.data(), take);
    consume(take);
    total += take;
    if (hit != std::string_view::npos) return total;
  }
}

}
