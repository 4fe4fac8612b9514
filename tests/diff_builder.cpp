#include "prism/comparison.hpp"
#include "prism/diff.hpp"

#include <iostream>
#include <string>
#include <vector>

using prism::BinaryDetected;
using prism::DeltaKind;
using prism::DiffBuilder;
using prism::DiffLineKind;
using prism::FileStarted;
using prism::FileStatus;
using prism::HunkStarted;
using prism::LineEvent;
using prism::LineOrigin;

static LineEvent line(LineOrigin origin, std::string content, std::optional<std::uint32_t> old_no,
                      std::optional<std::uint32_t> new_no) {
  return LineEvent{.origin = origin, .content = std::move(content), .old_lineno = old_no,
                   .new_lineno = new_no};
}

int main() {
  // classifier table
  const std::vector<std::pair<DeltaKind, FileStatus>> table = {
      {DeltaKind::Added, FileStatus::Added},          {DeltaKind::Untracked, FileStatus::Added},
      {DeltaKind::Deleted, FileStatus::Deleted},      {DeltaKind::Modified, FileStatus::Modified},
      {DeltaKind::Ignored, FileStatus::Modified},     {DeltaKind::Unreadable, FileStatus::Modified},
      {DeltaKind::Conflicted, FileStatus::Modified},  {DeltaKind::Unmodified, FileStatus::Modified},
      {DeltaKind::Renamed, FileStatus::Renamed},      {DeltaKind::Copied, FileStatus::Copied},
      {DeltaKind::TypeChange, FileStatus::TypeChange},
  };
  for (const auto &[kind, status] : table) {
    if (prism::classify_status(kind) != status) {
      std::cerr << "classify_status mismatch for kind " << static_cast<int>(kind) << "\n";
      return 1;
    }
  }

  DiffBuilder builder;

  // 1) modified text file with markers and structural lines mixed in
  builder.consume(FileStarted{.kind = DeltaKind::Modified, .old_path = "src/a.c",
                              .new_path = "src/a.c"});
  builder.consume(HunkStarted{.old_start = 1, .old_lines = 2, .new_start = 1, .new_lines = 2,
                              .header = "@@ -1,2 +1,2 @@ int main()\n"});
  builder.consume(line(LineOrigin::Context, "int main()\r\n", 1, 1));
  builder.consume(line(LineOrigin::Deletion, "old\n", 2, std::nullopt));
  builder.consume(line(LineOrigin::Addition, "new\xFF", std::nullopt, 2));
  builder.consume(line(LineOrigin::AddEofnl, "\n\\ No newline at end of file\n", std::nullopt,
                       std::nullopt));
  builder.consume(line(LineOrigin::HunkHeader, "@@\n", std::nullopt, std::nullopt));

  // 2) binary file whose hunk arrives before the binary flag
  builder.consume(FileStarted{.kind = DeltaKind::Modified, .old_path = "img.png",
                              .new_path = "img.png"});
  builder.consume(HunkStarted{.old_start = 1, .old_lines = 1, .new_start = 1, .new_lines = 1,
                              .header = "@@ -1 +1 @@\n"});
  builder.consume(line(LineOrigin::Addition, "junk\n", std::nullopt, 1));
  builder.consume(BinaryDetected{});
  builder.consume(HunkStarted{.old_start = 2, .old_lines = 1, .new_start = 2, .new_lines = 1,
                              .header = "@@ -2 +2 @@\n"});
  builder.consume(line(LineOrigin::Deletion, "more\n", 2, std::nullopt));

  // 3) deleted file: canonical path is the old side
  builder.consume(FileStarted{.kind = DeltaKind::Deleted, .old_path = "gone.txt",
                              .new_path = std::nullopt});

  // 4) rename keeps old_path, a copy onto the same path does not
  builder.consume(FileStarted{.kind = DeltaKind::Renamed, .old_path = "old.txt",
                              .new_path = "new.txt"});
  builder.consume(FileStarted{.kind = DeltaKind::Copied, .old_path = "same.txt",
                              .new_path = "same.txt"});

  // 5) modified file reporting old_path must not carry it
  builder.consume(FileStarted{.kind = DeltaKind::Modified, .old_path = "x.txt",
                              .new_path = "y.txt"});
  // lines without an open hunk are dropped
  builder.consume(line(LineOrigin::Addition, "stray\n", std::nullopt, 1));

  // 6) binary flag from the file header alone
  builder.consume(FileStarted{.kind = DeltaKind::Added, .old_path = std::nullopt,
                              .new_path = "blob.bin", .old_binary = false, .new_binary = true});
  builder.consume(HunkStarted{.old_start = 0, .old_lines = 0, .new_start = 1, .new_lines = 1,
                              .header = "@@ -0,0 +1 @@\n"});

  const auto files = std::move(builder).finish();
  if (files.size() != 7) { std::cerr << "expected 7 files, got " << files.size() << "\n"; return 1; }

  const auto &text = files[0];
  if (text.path != "src/a.c" || text.old_path || text.status != FileStatus::Modified ||
      text.is_binary) {
    std::cerr << "text file metadata\n";
    return 1;
  }
  if (text.hunks.size() != 1 || text.hunks[0].lines.size() != 3) {
    std::cerr << "markers and structural lines must not produce lines\n";
    return 1;
  }
  const auto &hunk = text.hunks[0];
  if (!hunk.section || *hunk.section != "int main()") { std::cerr << "section\n"; return 1; }
  if (hunk.header.base_start != 1 || hunk.header.base_lines != 2 || hunk.header.head_start != 1 ||
      hunk.header.head_lines != 2) {
    std::cerr << "hunk range\n";
    return 1;
  }
  if (hunk.lines[0].kind != DiffLineKind::Context || hunk.lines[0].text != "int main()" ||
      hunk.lines[0].base_line != 1u || hunk.lines[0].head_line != 1u) {
    std::cerr << "context line\n";
    return 1;
  }
  if (hunk.lines[1].kind != DiffLineKind::Deletion || hunk.lines[1].base_line != 2u ||
      hunk.lines[1].head_line) {
    std::cerr << "deletion line\n";
    return 1;
  }
  if (hunk.lines[2].kind != DiffLineKind::Addition || hunk.lines[2].text != "new\xEF\xBF\xBD" ||
      hunk.lines[2].base_line || hunk.lines[2].head_line != 2u ||
      !hunk.lines[2].highlights.empty()) {
    std::cerr << "addition line: [" << hunk.lines[2].text << "]\n";
    return 1;
  }
  if (text.stats.additions != 1 || text.stats.deletions != 1) { std::cerr << "text stats\n"; return 1; }

  const auto &bin = files[1];
  if (!bin.is_binary || !bin.hunks.empty() || bin.stats.additions != 0 || bin.stats.deletions != 0) {
    std::cerr << "binary file kept line detail\n";
    return 1;
  }

  if (files[2].path != "gone.txt" || files[2].status != FileStatus::Deleted || files[2].old_path) {
    std::cerr << "deleted file\n";
    return 1;
  }
  if (files[3].path != "new.txt" || files[3].old_path != std::optional<std::string>("old.txt") ||
      files[3].status != FileStatus::Renamed) {
    std::cerr << "renamed file\n";
    return 1;
  }
  if (files[4].status != FileStatus::Copied || files[4].old_path) {
    std::cerr << "copy onto the same path must not set old_path\n";
    return 1;
  }
  if (files[5].path != "y.txt" || files[5].old_path || !files[5].hunks.empty() ||
      files[5].stats.additions != 0) {
    std::cerr << "modified file with differing paths\n";
    return 1;
  }
  if (!files[6].is_binary || !files[6].hunks.empty() || files[6].status != FileStatus::Added) {
    std::cerr << "binary flag from file header\n";
    return 1;
  }

  const prism::DiffStats sum = text.stats + prism::DiffStats{.additions = 2, .deletions = 0};
  if (sum.additions != 3 || sum.deletions != 1) { std::cerr << "stats addition\n"; return 1; }

  std::cout << "OK\n";
  return 0;
}
