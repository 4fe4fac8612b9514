#pragma once
#include "prism/config.hpp"
#include "prism/consts.hpp"
#include "prism/hash.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace prism {

struct TreeEntry {
  std::uint32_t mode; // e.g., consts::kModeFile, consts::kModeTree (octal)
  std::string name;   // filename (no '/')
  oid id;             // 20-byte raw SHA-1 of referenced object
};

class Repository {
public:
  explicit Repository(std::filesystem::path root);

  // Core paths
  [[nodiscard]] const std::filesystem::path &root() const { return root_; }
  [[nodiscard]] auto repo_dir() const -> std::filesystem::path { return root_ / consts::kRepoDir; }
  [[nodiscard]] auto objects_dir() const -> std::filesystem::path {
    return repo_dir() / consts::kObjectsDir;
  }
  [[nodiscard]] auto heads_dir() const -> std::filesystem::path {
    return repo_dir() / consts::kRefsDir / consts::kHeadsDir;
  }

  // Create .prism with objects/, refs/heads/, HEAD -> master and the given config.
  // Fails if .prism already exists (to avoid clobber).
  void init(const Config &config = Config{.identity = {.name = "Your Name",
                                                       .email = "you@example.com"}}) const;

  [[nodiscard]] auto is_initialized() const -> bool;

  // Object plumbing
  [[nodiscard]] auto write_blob(std::span<const std::uint8_t> bytes) const -> std::string;
  std::vector<std::uint8_t> read_blob(std::string_view hex_oid) const;

  [[nodiscard]] auto write_tree(const std::vector<TreeEntry> &entries) const -> std::string;
  std::vector<TreeEntry> read_tree(std::string_view hex_oid) const;

  [[nodiscard]] auto write_commit(std::string_view tree_hex,
                                  const std::vector<std::string> &parent_hexes,
                                  std::string_view author_line, std::string_view committer_line,
                                  std::string_view message) const -> std::string;

  struct CommitInfo {
    std::string tree_hex;
    std::vector<std::string> parents; // zero or more parents (40-hex each)
    std::string author;               // full author line after "author "
    std::string committer;            // full committer line
    std::string message;              // raw message (may contain newlines)
  };

  [[nodiscard]] auto read_commit(std::string_view commit_hex) const -> CommitInfo;

  // Build nested trees from the staging index; returns the root tree id.
  [[nodiscard]] auto write_tree_from_index() const -> std::string;

  // Commit the index on top of HEAD and advance the current branch (or detached HEAD).
  [[nodiscard]] auto commit_index(std::string_view message) const -> std::string;

  // Commit HEAD points at, or std::nullopt on an unborn branch.
  [[nodiscard]] auto head_commit() const -> std::optional<std::string>;

private:
  static auto mode_to_ascii_octal(std::uint32_t mode) -> std::string;
  static auto ascii_octal_to_mode(std::string_view str) -> std::uint32_t;

  std::filesystem::path root_;
};

} // namespace prism
