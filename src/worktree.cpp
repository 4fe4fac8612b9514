#include "prism/worktree.hpp"

#include "prism/consts.hpp"
#include "prism/hash.hpp"
#include "prism/repo.hpp"

namespace prism::worktree {

static void tree_to_map_impl(const Repository &repo, const std::string &tree_hex,
                             const std::string &prefix, PathEntryMap &out) {
  for (auto &e : repo.read_tree(tree_hex)) {
    if (e.mode == consts::kModeTree)
      tree_to_map_impl(repo, to_hex(e.id), prefix + e.name + "/", out);
    else
      out[prefix + e.name] = FlatEntry{.mode = e.mode, .hex = to_hex(e.id)};
  }
}

PathEntryMap tree_to_map(const Repository &repo, const std::string &tree_hex) {
  PathEntryMap m;
  tree_to_map_impl(repo, tree_hex, "", m);
  return m;
}

} // namespace prism::worktree
