#include "row_cursor/path_utils.hpp"
#include <algorithm>
#include <system_error>

namespace rc {

bool ensure_parent_dirs(const std::filesystem::path& p) {
  std::error_code ec;
  auto parent = p.parent_path();
  if (parent.empty()) return true;
  if (std::filesystem::exists(parent)) return true;
  return std::filesystem::create_directories(parent, ec) || !ec;
}

std::optional<std::filesystem::path> resolve_under(const std::filesystem::path& root,
                                                   std::string_view rel) {
  if (rel.empty() || rel.find("..") != std::string_view::npos) return std::nullopt;
  std::filesystem::path relp{std::string(rel)};
  if (relp.is_absolute()) return std::nullopt;

  std::error_code ec;
  auto base_canon = std::filesystem::weakly_canonical(root, ec);
  if (ec) return std::nullopt;
  auto target_canon = std::filesystem::weakly_canonical(base_canon / relp, ec);
  if (ec) return std::nullopt;

  // Ensure target is inside base
  auto mismatch = std::mismatch(base_canon.begin(), base_canon.end(),
                                target_canon.begin(), target_canon.end());
  if (mismatch.first != base_canon.end()) return std::nullopt;
  return target_canon;
}

std::vector<std::string> list_regular_files(const std::filesystem::path& root) {
  std::vector<std::string> out;
  std::error_code ec;
  if (!std::filesystem::is_directory(root, ec)) return out;
  for (auto& e : std::filesystem::directory_iterator(root, ec)) {
    if (e.is_regular_file(ec)) out.push_back(e.path().filename().string());
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::optional<char> parse_separator(std::string_view s) {
  if (s.size() == 1) return s[0];
  if (s == "\\n") return '\n';
  if (s == "\\t") return '\t';
  if (s == "\\r") return '\r';
  if (s == "\\0") return '\0';
  if (s == "\\\\") return '\\';
  return std::nullopt;
}

}
