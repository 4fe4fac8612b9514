#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace prism::linediff {

// Split raw text into lines; each line keeps its "\n" except possibly the last.
std::vector<std::string_view> split_lines(std::string_view text);

enum class Op : char { Equal = '=', Delete = '-', Insert = '+' };

// Shortest edit script between two line sequences (linear-space Myers). Change
// groups that could slide over equal lines are then placed by the indentation
// heuristic, so a block gains or loses whole "}" lines at its end. Within a
// run of changes, deletions come before insertions.
std::vector<Op> myers_diff(const std::vector<std::string_view>& a,
                           const std::vector<std::string_view>& b);

struct Edit {
  Op op;
  std::size_t old_index; // 0-based position in `a` (lines of `a` consumed before this edit)
  std::size_t new_index; // 0-based position in `b`
};

// Starts are 1-based; an empty side reports the line before (git convention).
struct Hunk {
  std::uint32_t old_start = 0;
  std::uint32_t old_lines = 0;
  std::uint32_t new_start = 0;
  std::uint32_t new_lines = 0;
  std::vector<Edit> edits;
};

// Group the edit script into hunks with `context` lines around each change; changes
// separated by at most 2*context + interhunk unchanged lines share one hunk.
std::vector<Hunk> make_hunks(const std::vector<std::string_view>& a,
                             const std::vector<std::string_view>& b,
                             unsigned context, unsigned interhunk = 0);

// "@@ -1,2 +1,3 @@" (a length of 1 is omitted)
std::string hunk_header(const Hunk& hunk);

// Unified diff of two texts with `diff --git`/`---`/`+++` headers for `path`.
// Empty when the texts are equal.
std::string unified_diff(std::string_view old_text, std::string_view new_text,
                         std::string_view path, unsigned context = 3);

} // namespace prism::linediff
