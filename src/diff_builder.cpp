#include "prism/diff.hpp"

#include "prism/text.hpp"

#include <type_traits>

namespace prism {

std::string_view to_string(FileStatus status) {
  switch (status) {
  case FileStatus::Added:
    return "added";
  case FileStatus::Deleted:
    return "deleted";
  case FileStatus::Modified:
    return "modified";
  case FileStatus::Renamed:
    return "renamed";
  case FileStatus::Copied:
    return "copied";
  case FileStatus::TypeChange:
    return "typechange";
  }
  return "modified";
}

FileStatus classify_status(DeltaKind kind) {
  switch (kind) {
  case DeltaKind::Added:
  case DeltaKind::Untracked:
    return FileStatus::Added;
  case DeltaKind::Deleted:
    return FileStatus::Deleted;
  case DeltaKind::Renamed:
    return FileStatus::Renamed;
  case DeltaKind::Copied:
    return FileStatus::Copied;
  case DeltaKind::TypeChange:
    return FileStatus::TypeChange;
  case DeltaKind::Modified:
  case DeltaKind::Ignored:
  case DeltaKind::Unreadable:
  case DeltaKind::Conflicted:
  case DeltaKind::Unmodified:
    break;
  }
  return FileStatus::Modified;
}

void DiffBuilder::consume(const DiffEvent &event) {
  std::visit(
      [this](const auto &ev) {
        using T = std::decay_t<decltype(ev)>;
        if constexpr (std::is_same_v<T, FileStarted>)
          on_file(ev);
        else if constexpr (std::is_same_v<T, BinaryDetected>)
          on_binary(ev);
        else if constexpr (std::is_same_v<T, HunkStarted>)
          on_hunk(ev);
        else
          on_line(ev);
      },
      event);
}

std::vector<DiffFile> DiffBuilder::finish() && { return std::move(files_); }

DiffFile *DiffBuilder::current() { return files_.empty() ? nullptr : &files_.back(); }

void DiffBuilder::on_file(const FileStarted &ev) {
  const FileStatus status = classify_status(ev.kind);

  DiffFile file{};
  file.status = status;
  if (status == FileStatus::Deleted || !ev.new_path)
    file.path = ev.old_path.value_or(std::string{});
  else
    file.path = *ev.new_path;

  if ((status == FileStatus::Renamed || status == FileStatus::Copied) && ev.old_path &&
      *ev.old_path != file.path)
    file.old_path = ev.old_path;

  file.is_binary = ev.old_binary || ev.new_binary;
  files_.push_back(std::move(file));
}

void DiffBuilder::on_binary(const BinaryDetected &) {
  if (auto *file = current()) {
    file->is_binary = true;
    file->hunks.clear();
    file->stats = {};
  }
}

void DiffBuilder::on_hunk(const HunkStarted &ev) {
  auto *file = current();
  if (!file || file->is_binary)
    return;
  file->hunks.push_back(DiffHunk{.header = {.base_start = ev.old_start,
                                            .base_lines = ev.old_lines,
                                            .head_start = ev.new_start,
                                            .head_lines = ev.new_lines},
                                 .section = text::extract_section(ev.header),
                                 .lines = {}});
}

void DiffBuilder::on_line(const LineEvent &ev) {
  auto *file = current();
  if (!file || file->is_binary || file->hunks.empty())
    return;

  DiffLineKind kind;
  switch (ev.origin) {
  case LineOrigin::Context:
    kind = DiffLineKind::Context;
    break;
  case LineOrigin::Addition:
    kind = DiffLineKind::Addition;
    ++file->stats.additions;
    break;
  case LineOrigin::Deletion:
    kind = DiffLineKind::Deletion;
    ++file->stats.deletions;
    break;
  default:
    return; // end-of-file newline markers and structural lines
  }

  file->hunks.back().lines.push_back(DiffLine{.kind = kind,
                                              .text = text::sanitize_line(ev.content),
                                              .base_line = ev.old_lineno,
                                              .head_line = ev.new_lineno,
                                              .highlights = {}});
}

} // namespace prism
