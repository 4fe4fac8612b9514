#pragma once
#include "prism/consts.hpp"

#include <filesystem>
#include <string>

namespace prism {

struct Identity {
  std::string name;
  std::string email;
};

// Knobs for the tree comparison behind diff().
struct DiffOptions {
  unsigned context_lines = consts::kDefaultContextLines;
  unsigned interhunk_lines = consts::kDefaultInterhunkLines;
  // Similarity percentages (0-100); 100 only pairs identical content.
  unsigned rename_threshold = consts::kDefaultRenameThreshold;
  unsigned copy_threshold = consts::kDefaultCopyThreshold;
  bool find_renames = true;
  bool find_copies = true;
};

struct Config {
  Identity identity;
  DiffOptions diff;
};

// Read .prism/config; missing file or keys keep their defaults.
// Throws std::runtime_error on a malformed numeric or boolean value.
Config load_config(const std::filesystem::path& repo_root);

// Overwrite .prism/config with every key
void save_config(const std::filesystem::path& repo_root, const Config& cfg);

} // namespace prism
