#include "prism/consts.hpp"
#include "prism/hash.hpp"
#include "prism/index.hpp"
#include "prism/repo.hpp"
#include "prism/worktree.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using prism::Index;
using prism::oid;
using prism::Repository;

static void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

int main() {
  // temp repo
  const auto base = fs::temp_directory_path();
  const fs::path root = base / ("prism_idx_tree_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);

  try {
    Repository repo{root};
    repo.init();

    // Working tree files
    write_file(root / "a.txt", "A\n");
    write_file(root / "dir/b.txt", "B\n");
    write_file(root / "dir/with space.txt", "S\n");
    write_file(root / "tool.sh", "#!/bin/sh\n");
    fs::permissions(root / "tool.sh", fs::perms::owner_exec, fs::perm_options::add);
    fs::create_symlink("a.txt", root / "link");

    // Index add
    Index idx{root};
    idx.load();
    for (const char *p : {"dir/b.txt", "a.txt", "dir/with space.txt", "tool.sh", "link"})
      idx.add_path(p, repo);
    idx.save();

    // Reload from disk: sorted, modes preserved, paths with spaces intact
    Index reloaded{root};
    reloaded.load();
    const auto &entries = reloaded.entries();
    if (entries.size() != 5 || entries[0].path != "a.txt" || entries[2].path != "dir/with space.txt") {
      std::cerr << "index reload order\n";
      return 1;
    }
    if (reloaded.find("tool.sh")->mode != prism::consts::kModeExec ||
        reloaded.find("link")->mode != prism::consts::kModeSymlink ||
        reloaded.find("a.txt")->mode != prism::consts::kModeFile) {
      std::cerr << "index modes\n";
      return 1;
    }
    // a symlink is stored as its target
    const auto target = repo.read_blob(prism::to_hex(reloaded.find("link")->id));
    if (std::string(target.begin(), target.end()) != "a.txt") {
      std::cerr << "symlink blob\n";
      return 1;
    }

    // Build tree from index and flatten it back
    const std::string root_tree = repo.write_tree_from_index();
    const auto flat = prism::worktree::tree_to_map(repo, root_tree);
    if (flat.size() != 5 || !flat.contains("dir/b.txt") || !flat.contains("dir/with space.txt")) {
      std::cerr << "flattened tree\n";
      return 1;
    }
    if (flat.at("a.txt").hex != prism::to_hex(reloaded.find("a.txt")->id)) {
      std::cerr << "flattened blob id\n";
      return 1;
    }

    // Root tree has the subtree as a directory entry
    bool have_dir = false;
    oid dir_oid{};
    for (const auto &e : repo.read_tree(root_tree)) {
      if (e.name == "dir" && e.mode == prism::consts::kModeTree) {
        have_dir = true;
        dir_oid = e.id;
      }
    }
    if (!have_dir || repo.read_tree(prism::to_hex(dir_oid)).size() != 2) {
      std::cerr << "dir subtree invalid\n";
      return 1;
    }

    // remove_path drops the entry; removing twice is harmless
    reloaded.remove_path("dir/b.txt");
    reloaded.remove_path("dir/b.txt");
    if (reloaded.find("dir/b.txt") || reloaded.entries().size() != 4) {
      std::cerr << "remove_path\n";
      return 1;
    }

    std::cout << "OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }
  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
