#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rc {

// Ensure parent directories exist; returns false on error.
bool ensure_parent_dirs(const std::filesystem::path& p);

// Resolve `rel` against `root`, refusing anything that ends up outside `root`
// ("..", absolute paths, symlinks pointing elsewhere). nullopt when refused.
std::optional<std::filesystem::path> resolve_under(const std::filesystem::path& root,
                                                   std::string_view rel);

// Sorted names of the regular files directly under `root`.
std::vector<std::string> list_regular_files(const std::filesystem::path& root);

// Parse "\n", "\t", "\r", "\0", "\\" or a single byte into a separator.
std::optional<char> parse_separator(std::string_view s);

}
