#include "prism/suggestion.hpp"

#include "prism/error.hpp"
#include "prism/line_diff.hpp"
#include "prism/offset_index.hpp"
#include "prism/repo.hpp"
#include "prism/workspace.hpp"

#include <algorithm>
#include <map>

namespace prism {

namespace {

std::string describe(const Position &pos) {
  std::string s = std::to_string(pos.line);
  if (pos.column)
    s += ":" + std::to_string(*pos.column);
  return s;
}

FileChange plan_file(const Workspace &ws, const std::string &path,
                     const std::vector<const TextEdit *> &edits) {
  (void)ws.resolve(path);
  for (const auto *edit : edits)
    if (edit->location.side != DiffSide::Head)
      throw Error(ErrorCode::UnsupportedSide, path,
                  path + ": suggestions can only edit the head side");

  auto current = ws.read_text(path);
  if (!current)
    throw Error(ErrorCode::MissingFile, path, path + ": file does not exist");

  FileChange change{.path = path, .original = std::move(*current), .updated = {},
                    .replacements = {}};
  const OffsetIndex index{change.original, path};

  for (const auto *edit : edits) {
    const auto &range = edit->location.range;
    const std::size_t start = index.offset(range.start);
    const std::size_t end = index.offset(range.end);
    if (start > end)
      throw Error(ErrorCode::InvalidRange, path,
                  path + ": range " + describe(range.start) + ".." + describe(range.end) +
                      " ends before it starts (" + std::to_string(start) + " > " +
                      std::to_string(end) + ")");
    change.replacements.push_back({.start = start, .end = end, .text = edit->replacement});
  }

  std::stable_sort(change.replacements.begin(), change.replacements.end(),
                   [](const Replacement &a, const Replacement &b) { return a.start < b.start; });
  for (std::size_t i = 1; i < change.replacements.size(); ++i) {
    const auto &earlier = change.replacements[i - 1];
    const auto &later = change.replacements[i];
    if (earlier.end > later.start)
      throw Error(ErrorCode::OverlappingEdits, path,
                  path + ": edits overlap at bytes " + std::to_string(later.start) + ".." +
                      std::to_string(earlier.end));
  }

  change.updated = splice(change.original, change.replacements);
  return change;
}

} // namespace

std::string splice(const std::string &original, const std::vector<Replacement> &replacements) {
  std::string out = original;
  // highest offset first so earlier offsets stay valid
  for (auto it = replacements.rbegin(); it != replacements.rend(); ++it)
    out.replace(it->start, it->end - it->start, it->text);
  return out;
}

std::vector<FileChange> plan_changes(const Repository &repo, const Suggestion &suggestion) {
  std::map<std::string, std::vector<const TextEdit *>> by_path;
  for (const auto &edit : suggestion.edits)
    by_path[edit.location.path].push_back(&edit);

  const Workspace ws{repo};
  std::vector<FileChange> changes;
  for (const auto &[path, edits] : by_path) {
    auto change = plan_file(ws, path, edits);
    if (change.updated != change.original)
      changes.push_back(std::move(change));
  }
  return changes;
}

std::vector<ApplyPreview> dry_run(const Repository &repo, const Suggestion &suggestion) {
  std::vector<ApplyPreview> previews;
  for (const auto &change : plan_changes(repo, suggestion))
    previews.push_back({.path = change.path,
                        .patch = linediff::unified_diff(change.original, change.updated,
                                                        change.path)});
  return previews;
}

void apply(const Repository &repo, const Suggestion &suggestion) {
  const auto changes = plan_changes(repo, suggestion);
  const Workspace ws{repo};
  for (const auto &change : changes) {
    ws.write(change.path, change.updated);
    ws.stage(change.path);
  }
}

} // namespace prism
