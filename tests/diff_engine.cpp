#include "prism/config.hpp"
#include "prism/diff.hpp"
#include "prism/error.hpp"
#include "prism/index.hpp"
#include "prism/repo.hpp"
#include "prism/revision.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;

static void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

static void stage(const prism::Repository &repo, std::string_view rel) {
  prism::Index idx{repo.root()};
  idx.load();
  idx.add_path(rel, repo);
  idx.save();
}

static void unstage(const prism::Repository &repo, std::string_view rel) {
  prism::Index idx{repo.root()};
  idx.load();
  idx.remove_path(rel);
  idx.save();
}

static const prism::DiffFile *find_file(const prism::Diff &d, const std::string &path) {
  for (const auto &f : d.files)
    if (f.path == path)
      return &f;
  return nullptr;
}

static bool fail(const std::string &what) {
  std::cerr << what << "\n";
  return false;
}

static bool run(const fs::path &root) {
  using prism::FileStatus;

  prism::Repository repo{root};
  repo.init(prism::Config{.identity = {.name = "User", .email = "u@example.com"}});

  // no commit yet
  try {
    (void)prism::diff(repo);
    return fail("diff without a head commit did not throw");
  } catch (const prism::Error &e) {
    if (e.code() != prism::ErrorCode::NoHeadRevision)
      return fail("expected NoHeadRevision");
  }

  // initial commit: no base, everything added
  std::string keep;
  for (int i = 1; i <= 10; ++i)
    keep += "k" + std::to_string(i) + "\n";
  write_file(root / "a.txt", "line1\nline2\n");
  write_file(root / "docs/keep.txt", keep);
  write_file(root / "gone.txt", "bye\n");
  write_file(root / "bin.dat", std::string_view("\0\x01\x02", 3));
  for (const char *p : {"a.txt", "docs/keep.txt", "gone.txt", "bin.dat"})
    stage(repo, p);
  const std::string c1 = repo.commit_index("first\n\nbody\n");

  auto d1 = prism::diff(repo);
  if (d1.range.base)
    return fail("initial commit must have no base");
  if (d1.range.head.oid != c1 || d1.range.head.reference != std::optional<std::string>("master"))
    return fail("head revision");
  if (d1.range.head.summary != std::optional<std::string>("first"))
    return fail("summary");
  if (!d1.range.head.author || d1.range.head.author->name != "User" ||
      d1.range.head.author->email != std::optional<std::string>("u@example.com") ||
      !d1.range.head.timestamp)
    return fail("author signature");
  if (d1.files.size() != 4)
    return fail("initial commit file count: " + std::to_string(d1.files.size()));
  for (const auto &f : d1.files)
    if (f.status != FileStatus::Added || f.old_path)
      return fail("initial commit file not Added: " + f.path);
  // files come out in path order
  if (d1.files[0].path != "a.txt" || d1.files[1].path != "bin.dat" ||
      d1.files[2].path != "docs/keep.txt" || d1.files[3].path != "gone.txt")
    return fail("initial commit order");
  if (!d1.files[1].is_binary || !d1.files[1].hunks.empty())
    return fail("binary file in initial commit");
  if (d1.files[0].stats.additions != 2 || d1.files[0].hunks.size() != 1 ||
      d1.files[0].hunks[0].header.base_start != 0 || d1.files[0].hunks[0].header.head_lines != 2)
    return fail("added text file");

  // single-line modification
  write_file(root / "a.txt", "line1\nchanged\n");
  stage(repo, "a.txt");
  (void)repo.commit_index("second\n");
  auto d2 = prism::diff(repo);
  if (!d2.range.base || d2.range.base->oid != c1)
    return fail("base must be the first parent");
  if (d2.files.size() != 1 || d2.files[0].status != FileStatus::Modified ||
      d2.files[0].path != "a.txt")
    return fail("single modification file");
  const auto &mod = d2.files[0];
  if (mod.hunks.size() != 1 || mod.stats.additions != 1 || mod.stats.deletions != 1)
    return fail("single modification stats");
  if (mod.hunks[0].lines.size() != 3 || mod.hunks[0].lines[0].kind != prism::DiffLineKind::Context ||
      mod.hunks[0].lines[0].text != "line1")
    return fail("single modification lines");
  for (const auto &l : mod.hunks[0].lines) {
    if (l.kind == prism::DiffLineKind::Addition && (l.base_line || l.head_line != 2u))
      return fail("addition line numbers");
    if (l.kind == prism::DiffLineKind::Deletion && (l.head_line || l.base_line != 2u))
      return fail("deletion line numbers");
  }

  // pure rename
  fs::rename(root / "docs/keep.txt", root / "docs/moved.txt");
  unstage(repo, "docs/keep.txt");
  stage(repo, "docs/moved.txt");
  const std::string c3 = repo.commit_index("rename\n");
  auto d3 = prism::diff(repo);
  if (d3.files.size() != 1)
    return fail("pure rename file count: " + std::to_string(d3.files.size()));
  if (d3.files[0].status != FileStatus::Renamed || d3.files[0].path != "docs/moved.txt" ||
      d3.files[0].old_path != std::optional<std::string>("docs/keep.txt") ||
      d3.files[0].stats.additions != 0 || d3.files[0].stats.deletions != 0 ||
      !d3.files[0].hunks.empty())
    return fail("pure rename");

  // binary to binary
  write_file(root / "bin.dat", std::string_view("\0\x03", 2));
  stage(repo, "bin.dat");
  (void)repo.commit_index("binary\n");
  auto d4 = prism::diff(repo);
  if (d4.files.size() != 1 || !d4.files[0].is_binary || !d4.files[0].hunks.empty() ||
      d4.files[0].status != FileStatus::Modified)
    return fail("binary change");

  // mixed: modify, add, delete and rename-with-edit in one commit
  write_file(root / "a.txt", "line1\nchanged\nline3\n");
  write_file(root / "fresh.txt", "brand\nnew\n");
  fs::remove(root / "gone.txt");
  std::string edited;
  for (int i = 1; i <= 10; ++i)
    edited += (i == 5 ? "K" : "k") + std::to_string(i) + "\n";
  fs::remove(root / "docs/moved.txt");
  write_file(root / "renamed.txt", edited);
  stage(repo, "a.txt");
  stage(repo, "fresh.txt");
  unstage(repo, "gone.txt");
  unstage(repo, "docs/moved.txt");
  stage(repo, "renamed.txt");
  (void)repo.commit_index("mixed\n");
  auto d5 = prism::diff(repo);
  if (d5.files.size() != 4)
    return fail("mixed file count: " + std::to_string(d5.files.size()));
  const auto *fa = find_file(d5, "a.txt");
  const auto *ff = find_file(d5, "fresh.txt");
  const auto *fg = find_file(d5, "gone.txt");
  const auto *fr = find_file(d5, "renamed.txt");
  if (!fa || fa->status != FileStatus::Modified || fa->stats.additions != 1 ||
      fa->stats.deletions != 0)
    return fail("mixed: modified");
  if (!ff || ff->status != FileStatus::Added || ff->stats.additions != 2)
    return fail("mixed: added");
  if (!fg || fg->status != FileStatus::Deleted || fg->stats.deletions != 1 || fg->old_path)
    return fail("mixed: deleted");
  if (!fr || fr->status != FileStatus::Renamed ||
      fr->old_path != std::optional<std::string>("docs/moved.txt") ||
      fr->stats.additions != 1 || fr->stats.deletions != 1)
    return fail("mixed: renamed with edit");

  // a stricter rename threshold turns the edited rename back into delete + add
  prism::DiffOptions strict;
  strict.rename_threshold = 95;
  auto d5s = prism::diff(repo, strict);
  if (d5s.files.size() != 5 || !find_file(d5s, "docs/moved.txt") ||
      find_file(d5s, "renamed.txt")->status != FileStatus::Added)
    return fail("rename threshold 95");

  // exact copy of an unchanged file
  write_file(root / "dup.txt", "line1\nchanged\nline3\n");
  stage(repo, "dup.txt");
  (void)repo.commit_index("copy\n");
  auto d6 = prism::diff(repo);
  if (d6.files.size() != 1 || d6.files[0].status != FileStatus::Copied ||
      d6.files[0].old_path != std::optional<std::string>("a.txt") ||
      d6.files[0].stats.additions != 0)
    return fail("exact copy");
  prism::DiffOptions no_copies;
  no_copies.find_copies = false;
  auto d6n = prism::diff(repo, no_copies);
  if (d6n.files.size() != 1 || d6n.files[0].status != FileStatus::Added)
    return fail("copies disabled");

  // regular file replaced by a symlink
  fs::remove(root / "fresh.txt");
  fs::create_symlink("a.txt", root / "fresh.txt");
  stage(repo, "fresh.txt");
  (void)repo.commit_index("symlink\n");
  auto d7 = prism::diff(repo);
  if (d7.files.size() != 1 || d7.files[0].status != FileStatus::TypeChange ||
      d7.files[0].path != "fresh.txt")
    return fail("type change");

  // section heading and configurable context
  write_file(root / "code.c", "int compute(int x) {\n  int a = 1;\n  int b = 2;\n"
                              "  int c = 3;\n  int d = 4;\n  return x;\n}\n");
  stage(repo, "code.c");
  (void)repo.commit_index("code\n");
  write_file(root / "code.c", "int compute(int x) {\n  int a = 1;\n  int b = 2;\n"
                              "  int c = 3;\n  int d = 4;\n  return x + a;\n}\n");
  stage(repo, "code.c");
  (void)repo.commit_index("tweak\n");
  prism::DiffOptions narrow;
  narrow.context_lines = 1;
  auto d9 = prism::diff(repo, narrow);
  if (d9.files.size() != 1 || d9.files[0].hunks.size() != 1)
    return fail("section diff shape");
  const auto &h9 = d9.files[0].hunks[0];
  if (h9.header.base_start != 5 || h9.header.base_lines != 3 || h9.header.head_start != 5 ||
      h9.header.head_lines != 3 || h9.lines.size() != 4)
    return fail("context 1 hunk range");
  if (h9.section != std::optional<std::string>("int compute(int x) {"))
    return fail("section heading: " + h9.section.value_or("<none>"));

  // explicit range spanning several commits
  prism::RevisionRange range{.base = prism::revision_from_commit(repo, c1),
                             .head = prism::revision_from_commit(repo, c3)};
  auto dr = prism::diff_for_range(repo, range);
  if (dr.range.head.oid != c3 || dr.files.size() != 2)
    return fail("range diff file count: " + std::to_string(dr.files.size()));
  if (dr.files[0].path != "a.txt" || dr.files[0].status != FileStatus::Modified ||
      dr.files[1].status != FileStatus::Renamed ||
      dr.files[1].old_path != std::optional<std::string>("docs/keep.txt"))
    return fail("range diff content");

  prism::DiffOptions no_renames;
  no_renames.find_renames = false;
  auto drn = prism::diff_for_range(repo, range, no_renames);
  if (drn.files.size() != 3 || !find_file(drn, "docs/keep.txt") ||
      find_file(drn, "docs/keep.txt")->status != FileStatus::Deleted)
    return fail("renames disabled");

  // unknown commit surfaces as a backend error
  prism::RevisionRange bogus{.base = std::nullopt, .head = prism::Revision{.oid = std::string(40, 'f')}};
  try {
    (void)prism::diff_for_range(repo, bogus);
    return fail("unknown commit did not throw");
  } catch (const prism::Error &e) {
    if (e.code() != prism::ErrorCode::Backend)
      return fail("expected a backend error");
  }

  return true;
}

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("prism_diff_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);

  bool ok = false;
  try {
    ok = run(root);
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  if (!ok)
    return 1;
  std::cout << "OK\n";
  return 0;
}
