#pragma once
#include "prism/hash.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace prism {

class Repository; // fwd decl to avoid header cycle

struct IndexEntry {
  std::uint32_t mode;  // regular, executable or symlink
  oid           id;    // blob id (20 bytes)
  std::string   path;  // "dir/file", UTF-8, no leading '/'
};

// Staging area stored as text lines "<octal mode> <hex> <path>" in .prism/index.
class Index {
public:
  explicit Index(std::filesystem::path repo_root);

  // Parse .prism/index if it exists (no throw if missing)
  void load();

  // Overwrite .prism/index with current entries
  void save() const;

  // Record the on-disk content of `relpath` under the working directory as a blob and
  // add/replace its entry. Symlinks are stored by target, executables keep 100755.
  void add_path(std::string_view relpath, const Repository& repo);

  // Remove a path from index (no error if absent)
  void remove_path(std::string_view relpath);

  const std::vector<IndexEntry>& entries() const { return entries_; }
  std::optional<IndexEntry> find(std::string_view relpath) const;

private:
  std::filesystem::path index_path() const;

  std::filesystem::path repo_root_;
  std::vector<IndexEntry> entries_;
};

} // namespace prism
