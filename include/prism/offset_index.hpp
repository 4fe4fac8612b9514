#pragma once
#include "prism/review.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace prism {

// Line-start table over one file's text, mapping Positions to byte offsets that
// always fall on UTF-8 boundaries. The text must outlive the index.
class OffsetIndex {
public:
  // `path` only labels errors.
  OffsetIndex(std::string_view text, std::string path = {});

  // Byte offset of `pos`. Throws Error(LineOutOfBounds / ColumnOutOfBounds).
  [[nodiscard]] auto offset(const Position &pos) const -> std::size_t;

  [[nodiscard]] auto line_count() const -> std::size_t { return starts_.size(); }

private:
  std::string_view text_;
  std::string path_;
  std::vector<std::size_t> starts_;
};

} // namespace prism
