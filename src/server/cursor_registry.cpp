#include "row_cursor/cursor_registry.hpp"
#include <algorithm>

namespace rc {

CursorRegistry::CursorRegistry(CachedRowCursor::Config cursor_cfg, FileSource::Config source_cfg)
  : cursor_cfg_(cursor_cfg), source_cfg_(source_cfg) {}

std::shared_ptr<CursorRegistry::Entry> CursorRegistry::acquire(const std::string& path,
                                                               std::error_code& ec) {
  ec.clear();
  std::lock_guard<std::mutex> lk(mu_);

  const std::uint64_t size = std::filesystem::file_size(path, ec);
  std::filesystem::file_time_type mtime;
  if (!ec) mtime = std::filesystem::last_write_time(path, ec);
  if (ec) {
    map_.erase(path);
    return nullptr;
  }

  auto it = map_.find(path);
  if (it != map_.end() && it->second->file_size == size && it->second->mtime == mtime)
    return it->second;

  auto src = FileSource::open(path, ec, source_cfg_);
  if (!src) {
    map_.erase(path);
    return nullptr;
  }

  // Requests still holding the old entry finish on the old handle.
  auto entry = std::make_shared<Entry>(path, size, mtime, CachedRowCursor(std::move(src), cursor_cfg_));
  map_[path] = entry;
  return entry;
}

void CursorRegistry::forget(std::string_view path) {
  std::lock_guard<std::mutex> lk(mu_);
  map_.erase(std::string(path));
}

std::vector<std::string> CursorRegistry::open_paths() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<std::string> out;
  out.reserve(map_.size());
  for (const auto& kv : map_) out.push_back(kv.first);
  std::sort(out.begin(), out.end());
  return out;
}

}
