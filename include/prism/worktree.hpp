#pragma once
#include <cstdint>
#include <map>
#include <string>

namespace prism {

class Repository; // fwd

namespace worktree {

struct FlatEntry {
  std::uint32_t mode; // file, executable, symlink or gitlink
  std::string hex;    // 40-hex object id
};

// path -> entry, sorted by repo-relative path
using PathEntryMap = std::map<std::string, FlatEntry>;

// Recursively flatten a tree object into its non-directory entries.
auto tree_to_map(const Repository& repo, const std::string& tree_hex) -> PathEntryMap;

} // namespace worktree

} // namespace prism
