#pragma once
#include "prism/config.hpp"
#include "prism/worktree.hpp"

#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace prism {

class Repository; // fwd

// Change kind as the backend reports it, before status classification.
enum class DeltaKind : std::uint8_t {
  Unmodified,
  Added,
  Deleted,
  Modified,
  Renamed,
  Copied,
  Ignored,
  Untracked,
  TypeChange,
  Unreadable,
  Conflicted,
};

// Origin code of a line event. The three *Eofnl codes follow a line that lacks
// its trailing newline and carry no content of their own.
enum class LineOrigin : char {
  Context = ' ',
  Addition = '+',
  Deletion = '-',
  ContextEofnl = '=',
  AddEofnl = '>',
  DelEofnl = '<',
  FileHeader = 'F',
  HunkHeader = 'H',
  Binary = 'B',
};

struct FileStarted {
  DeltaKind kind = DeltaKind::Modified;
  std::optional<std::string> old_path;
  std::optional<std::string> new_path;
  bool old_binary = false;
  bool new_binary = false;
};

struct BinaryDetected {};

struct HunkStarted {
  std::uint32_t old_start = 0;
  std::uint32_t old_lines = 0;
  std::uint32_t new_start = 0;
  std::uint32_t new_lines = 0;
  std::string header; // raw "@@ -a,b +c,d @@ section\n"
};

struct LineEvent {
  LineOrigin origin = LineOrigin::Context;
  std::string content; // raw bytes, including the newline when present
  std::optional<std::uint32_t> old_lineno;
  std::optional<std::uint32_t> new_lineno;
};

using DiffEvent = std::variant<FileStarted, BinaryDetected, HunkStarted, LineEvent>;

// Tree-to-tree comparison exposed as a pull-based event stream.
//
// Deltas (including rename/copy detection) are computed up front; the events of
// each file are produced lazily as next() drains the previous file's events.
// Errors reading objects surface as std::runtime_error from the constructor or next().
class ComparisonStream {
public:
  // An absent base tree compares against the empty tree.
  ComparisonStream(const Repository& repo, const std::optional<std::string>& base_tree,
                   const std::string& head_tree, DiffOptions options = {});

  // Next event, or std::nullopt once every file has been reported.
  std::optional<DiffEvent> next();

private:
  struct Delta {
    DeltaKind kind;
    std::string old_path;
    std::string new_path;
    std::optional<worktree::FlatEntry> old_entry;
    std::optional<worktree::FlatEntry> new_entry;
  };

  void find_similar();
  const std::vector<std::uint8_t>& blob(const std::string& hex);
  void queue_file_events(const Delta& delta);

  const Repository& repo_;
  DiffOptions options_;
  std::vector<Delta> deltas_;
  std::size_t next_delta_ = 0;
  std::deque<DiffEvent> pending_;
  std::map<std::string, std::vector<std::uint8_t>> blob_cache_;
};

// Similarity percentage of two blobs: 100 only for identical bytes, otherwise the share
// of the larger blob covered by lines the two have in common (0 for binary content).
unsigned similarity_score(const std::vector<std::uint8_t>& a, const std::vector<std::uint8_t>& b);

// A NUL byte within the first 8000 bytes marks content as binary.
bool looks_binary(const std::vector<std::uint8_t>& bytes);

} // namespace prism
