#pragma once
#include "prism/comparison.hpp"
#include "prism/config.hpp"
#include "prism/revision.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace prism {

class Repository; // fwd

enum class FileStatus : std::uint8_t { Added, Deleted, Modified, Renamed, Copied, TypeChange };

enum class DiffLineKind : std::uint8_t { Context, Addition, Deletion };

// Zero-based column span within a line's text, end exclusive.
struct LineHighlight {
  std::uint32_t start_column = 0;
  std::uint32_t end_column = 0;
};

// 1-based starts and line counts of both sides of a hunk.
struct DiffRange {
  std::uint32_t base_start = 0;
  std::uint32_t base_lines = 0;
  std::uint32_t head_start = 0;
  std::uint32_t head_lines = 0;
};

struct DiffLine {
  DiffLineKind kind = DiffLineKind::Context;
  std::string text; // valid UTF-8, no trailing line ending
  std::optional<std::uint32_t> base_line;
  std::optional<std::uint32_t> head_line;
  std::vector<LineHighlight> highlights;
};

struct DiffHunk {
  DiffRange header;
  std::optional<std::string> section;
  std::vector<DiffLine> lines;
};

struct DiffStats {
  std::uint32_t additions = 0;
  std::uint32_t deletions = 0;

  DiffStats &operator+=(const DiffStats &other) {
    additions += other.additions;
    deletions += other.deletions;
    return *this;
  }
};

inline DiffStats operator+(DiffStats lhs, const DiffStats &rhs) { return lhs += rhs; }

struct DiffFile {
  std::string path;
  std::optional<std::string> old_path; // only for renames and copies
  FileStatus status = FileStatus::Modified;
  DiffStats stats;
  bool is_binary = false;
  std::vector<DiffHunk> hunks;
};

struct Diff {
  RevisionRange range;
  std::vector<DiffFile> files;
};

auto to_string(FileStatus status) -> std::string_view;

// Collapse a backend change kind into one of the six file statuses.
auto classify_status(DeltaKind kind) -> FileStatus;

// Folds comparison events into DiffFiles. Events must arrive in stream order:
// file started, then an optional binary flag, hunks and their lines.
class DiffBuilder {
public:
  void consume(const DiffEvent &event);

  // Files accumulated so far, in emission order.
  [[nodiscard]] auto finish() && -> std::vector<DiffFile>;

private:
  void on_file(const FileStarted &ev);
  void on_binary(const BinaryDetected &ev);
  void on_hunk(const HunkStarted &ev);
  void on_line(const LineEvent &ev);

  DiffFile *current();

  std::vector<DiffFile> files_;
};

// Diff HEAD against its first parent (or the empty tree for a root commit).
// Throws Error(NoHeadRevision) without a head commit and Error(Backend) when the
// object store or comparison fails.
[[nodiscard]] auto diff(const Repository &repo, const DiffOptions &options = {}) -> Diff;

// Same as diff() for an explicitly supplied range.
[[nodiscard]] auto diff_for_range(const Repository &repo, const RevisionRange &range,
                                  const DiffOptions &options = {}) -> Diff;

} // namespace prism
