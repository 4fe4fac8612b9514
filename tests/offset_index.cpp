#include "prism/error.hpp"
#include "prism/offset_index.hpp"

#include <functional>
#include <iostream>
#include <optional>
#include <string>

using prism::ErrorCode;
using prism::OffsetIndex;
using prism::Position;

static std::optional<ErrorCode> error_of(const std::function<void()> &fn) {
  try {
    fn();
  } catch (const prism::Error &e) {
    return e.code();
  }
  return std::nullopt;
}

static Position at(std::uint32_t line, std::optional<std::uint32_t> column = std::nullopt) {
  return Position{.line = line, .column = column};
}

int main() {
  // "ab\n" "c\xC3\xA9" "d\n"  -> line 2 holds a two-byte scalar
  const std::string text = "ab\nc\xC3\xA9" "d\n";
  const OffsetIndex idx{text, "f.txt"};

  if (idx.line_count() != 3) { std::cerr << "line_count " << idx.line_count() << "\n"; return 1; }
  if (idx.offset(at(1)) != 0 || idx.offset(at(1, 1)) != 0) { std::cerr << "line 1 start\n"; return 1; }
  if (idx.offset(at(1, 3)) != 2) { std::cerr << "line 1 col 3\n"; return 1; }
  if (idx.offset(at(2)) != 3) { std::cerr << "line 2 start\n"; return 1; }
  // columns count scalar values, not bytes
  if (idx.offset(at(2, 2)) != 4) { std::cerr << "line 2 col 2\n"; return 1; }
  if (idx.offset(at(2, 3)) != 6) { std::cerr << "line 2 col 3 must skip the whole scalar\n"; return 1; }
  if (idx.offset(at(2, 4)) != 7) { std::cerr << "line 2 col 4\n"; return 1; }
  // one past the last scalar of the span (which includes the newline)
  if (idx.offset(at(2, 5)) != 8) { std::cerr << "line 2 end\n"; return 1; }
  if (error_of([&] { (void)idx.offset(at(2, 6)); }) != ErrorCode::ColumnOutOfBounds) {
    std::cerr << "column past line end\n";
    return 1;
  }

  // end of file: line N+1 column 1 is the text length, column 2 is out of bounds
  if (idx.offset(at(3, 1)) != text.size() || idx.offset(at(3)) != text.size()) {
    std::cerr << "line N+1 must map to text length\n";
    return 1;
  }
  if (error_of([&] { (void)idx.offset(at(3, 2)); }) != ErrorCode::ColumnOutOfBounds) {
    std::cerr << "line N+1 column 2\n";
    return 1;
  }
  // one index past the recorded line starts is the virtual line after the final newline
  if (idx.offset(at(4, 1)) != text.size()) { std::cerr << "virtual line after newline\n"; return 1; }
  if (error_of([&] { (void)idx.offset(at(4, 2)); }) != ErrorCode::ColumnOutOfBounds) {
    std::cerr << "virtual line column 2\n";
    return 1;
  }
  if (error_of([&] { (void)idx.offset(at(5, 1)); }) != ErrorCode::LineOutOfBounds) {
    std::cerr << "line past the end\n";
    return 1;
  }
  if (error_of([&] { (void)idx.offset(at(0, 1)); }) != ErrorCode::LineOutOfBounds) {
    std::cerr << "line 0\n";
    return 1;
  }
  if (error_of([&] { (void)idx.offset(at(1, 0)); }) != ErrorCode::ColumnOutOfBounds) {
    std::cerr << "column 0\n";
    return 1;
  }

  // error carries the path it was built with
  try {
    (void)idx.offset(at(9));
    std::cerr << "expected an error\n";
    return 1;
  } catch (const prism::Error &e) {
    if (e.path() != "f.txt") { std::cerr << "error path: " << e.path() << "\n"; return 1; }
  }

  // text without a trailing newline: the last line runs to the end
  const std::string tail = "x\nyz";
  const OffsetIndex tail_idx{tail};
  if (tail_idx.offset(at(2, 3)) != 4) { std::cerr << "last line end\n"; return 1; }
  if (error_of([&] { (void)tail_idx.offset(at(2, 4)); }) != ErrorCode::ColumnOutOfBounds) {
    std::cerr << "past last line end\n";
    return 1;
  }
  if (tail_idx.offset(at(3, 1)) != tail.size()) { std::cerr << "virtual final line\n"; return 1; }

  // empty text has a single empty line
  const OffsetIndex empty_idx{std::string_view{}};
  if (empty_idx.offset(at(1, 1)) != 0 || empty_idx.offset(at(2, 1)) != 0) {
    std::cerr << "empty text\n";
    return 1;
  }

  std::cout << "OK\n";
  return 0;
}
