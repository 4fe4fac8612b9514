#include "prism/hash.hpp"
#include "prism/index.hpp"
#include "prism/refs.hpp"
#include "prism/repo.hpp"
#include "prism/revision.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>

namespace fs = std::filesystem;

static void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("prism_cmt_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);

  try {
    prism::Repository repo{root};
    repo.init(prism::Config{.identity = {.name = "User", .email = "u@example.com"}});

    if (prism::resolve_revision_range(repo)) {
      std::cerr << "unborn branch resolved to a range\n";
      return 1;
    }

    write_file(root / "a.txt", "hello\n");
    prism::Index idx{root};
    idx.load();
    idx.add_path("a.txt", repo);
    idx.save();

    const std::string c1 = repo.commit_index("first\n");

    // The current branch should point at c1
    const auto head = prism::resolve_HEAD(root);
    if (head.refname != std::optional<std::string>("refs/heads/master") || head.commit != c1) {
      std::cerr << "HEAD not on master at c1\n";
      return 1;
    }

    auto r1 = prism::resolve_revision_range(repo);
    if (!r1 || r1->base || r1->head.oid != c1 ||
        r1->head.reference != std::optional<std::string>("master")) {
      std::cerr << "root commit range\n";
      return 1;
    }

    // Second commit has parent=c1
    write_file(root / "b.txt", "B\n");
    idx.load();
    idx.add_path("b.txt", repo);
    idx.save();
    const std::string c2 = repo.commit_index("second line\r\nmore\n");

    if (auto ref2 = prism::read_ref(root, "refs/heads/master"); !ref2 || *ref2 != c2) {
      std::cerr << "ref not updated to c2\n";
      return 1;
    }
    const auto info = repo.read_commit(c2);
    if (info.parents.size() != 1 || info.parents[0] != c1) {
      std::cerr << "c2 parent mismatch\n";
      return 1;
    }

    auto r2 = prism::resolve_revision_range(repo);
    if (!r2 || !r2->base || r2->base->oid != c1 || r2->head.oid != c2) {
      std::cerr << "second commit range\n";
      return 1;
    }
    if (r2->head.summary != std::optional<std::string>("second line") ||
        r2->base->summary != std::optional<std::string>("first")) {
      std::cerr << "summary: " << r2->head.summary.value_or("<none>") << "\n";
      return 1;
    }
    if (!r2->head.committer || r2->head.committer->name != "User" || !r2->head.timestamp ||
        *r2->head.timestamp <= 0) {
      std::cerr << "committer signature\n";
      return 1;
    }
    // the base revision is not what HEAD names
    if (r2->base->reference) {
      std::cerr << "base must not carry a reference\n";
      return 1;
    }

    // Detached HEAD: commits move HEAD itself
    prism::set_HEAD_detached(root, c1);
    const std::string c3 = repo.commit_index("detached\n");
    const auto detached = prism::resolve_HEAD(root);
    if (detached.refname || detached.commit != c3) {
      std::cerr << "detached HEAD not advanced\n";
      return 1;
    }
    auto r3 = prism::resolve_revision_range(repo);
    if (!r3 || r3->head.reference || !r3->base || r3->base->oid != c1) {
      std::cerr << "detached range\n";
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
