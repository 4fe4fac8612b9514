#include "prism/diff.hpp"

#include "prism/error.hpp"
#include "prism/repo.hpp"

#include <exception>

namespace prism {

namespace {

std::string tree_of(const Repository &repo, const std::string &commit_hex) {
  return repo.read_commit(commit_hex).tree_hex;
}

std::vector<DiffFile> collect_files(const Repository &repo, const RevisionRange &range,
                                    const DiffOptions &options) {
  std::optional<std::string> base_tree;
  if (range.base)
    base_tree = tree_of(repo, range.base->oid);
  const std::string head_tree = tree_of(repo, range.head.oid);

  ComparisonStream stream(repo, base_tree, head_tree, options);
  DiffBuilder builder;
  while (auto event = stream.next())
    builder.consume(*event);
  return std::move(builder).finish();
}

} // namespace

Diff diff(const Repository &repo, const DiffOptions &options) {
  std::optional<RevisionRange> range;
  try {
    range = resolve_revision_range(repo);
  } catch (const Error &) {
    throw;
  } catch (const std::exception &e) {
    throw Error(ErrorCode::Backend, {}, std::string("resolve revisions: ") + e.what());
  }
  if (!range)
    throw Error(ErrorCode::NoHeadRevision, {}, "repository has no head commit");
  return diff_for_range(repo, *range, options);
}

Diff diff_for_range(const Repository &repo, const RevisionRange &range,
                    const DiffOptions &options) {
  try {
    return Diff{.range = range, .files = collect_files(repo, range, options)};
  } catch (const Error &) {
    throw;
  } catch (const std::exception &e) {
    throw Error(ErrorCode::Backend, {}, std::string("compare trees: ") + e.what());
  }
}

} // namespace prism
