#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace prism {

enum class DiffSide : std::uint8_t { Base, Head };

// 1-based line and optional 1-based column (absent = start of line).
struct Position {
  std::uint32_t line = 1;
  std::optional<std::uint32_t> column;
};

// Half-open: `end` is exclusive.
struct Range {
  Position start;
  Position end;
};

struct FileRange {
  std::string path; // repo-relative
  DiffSide side = DiffSide::Head;
  Range range;
};

struct TextEdit {
  FileRange location;
  std::string replacement;
};

struct Suggestion {
  std::optional<std::string> title;
  std::vector<TextEdit> edits;
};

} // namespace prism
