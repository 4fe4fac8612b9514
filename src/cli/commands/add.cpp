#include "prism/index.hpp"
#include "prism/repo.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <vector>

namespace fs = std::filesystem;

// Stage one path if it is a regular file or a symlink.
static auto add_one(prism::Index &idx, const prism::Repository &repo, const fs::path &relpath)
    -> bool {
  const fs::path abs = repo.root() / relpath;
  const auto st = fs::symlink_status(abs);
  if (!fs::is_regular_file(st) && !fs::is_symlink(st)) {
    std::cerr << "add: skipping non-regular file: " << relpath << "\n";
    return false;
  }
  const auto rel = relpath.lexically_normal().generic_string();
  idx.add_path(rel, repo);
  std::cout << "added: " << rel << "\n";
  return true;
}

int cmd_add(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "usage: prism add <path> [<path> ...]\n";
    return 2;
  }

  prism::Repository repo{fs::current_path()};
  if (!repo.is_initialized()) {
    std::cerr << "add: not a prism repo (run `prism init`)\n";
    return 1;
  }

  // Collect unique paths while preserving order
  std::vector<fs::path> paths;
  paths.reserve(static_cast<std::size_t>(argc) - 1);
  for (int i = 1; i < argc; ++i) {
    fs::path path = argv[i];
    if (std::ranges::find(paths, path) == paths.end()) {
      paths.push_back(std::move(path));
    }
  }

  prism::Index idx{repo.root()};
  try {
    idx.load();
    bool any = false;
    for (const auto &path : paths) {
      any = add_one(idx, repo, path) || any;
    }
    if (any) {
      idx.save();
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "add: " << e.what() << "\n";
    return 1;
  }
}
