#pragma once
#include "row_cursor/cached_row_cursor.hpp"
#include "row_cursor/file_source.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

namespace rc {

// Keeps one cursor per file so its row index survives across requests.
// A cursor has a single owner at a time: lock `mu` for the whole operation.
// Entries are keyed on (size, mtime): a file that changed is reopened, a file
// that disappeared is dropped along with its handle.
class CursorRegistry {
public:
  struct Entry {
    std::mutex mu;
    std::string path;
    std::uint64_t file_size = 0;
    std::filesystem::file_time_type mtime;
    CachedRowCursor cursor;

    Entry(std::string p, std::uint64_t size, std::filesystem::file_time_type mt, CachedRowCursor c)
      : path(std::move(p)), file_size(size), mtime(mt), cursor(std::move(c)) {}
  };

  CursorRegistry(CachedRowCursor::Config cursor_cfg, FileSource::Config source_cfg);

  // Returns the cursor for `path`, opening it on first use or after the file
  // changed. nullptr with `ec` set (errno from stat or open) on failure.
  std::shared_ptr<Entry> acquire(const std::string& path, std::error_code& ec);

  void forget(std::string_view path);
  std::vector<std::string> open_paths() const;

private:
  CachedRowCursor::Config cursor_cfg_;
  FileSource::Config source_cfg_;
  mutable std::mutex mu_;
  std::unordered_map<std::string, std::shared_ptr<Entry>> map_;
};

}
