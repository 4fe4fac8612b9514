#include "prism/offset_index.hpp"

#include "prism/error.hpp"
#include "prism/text.hpp"

namespace prism {

OffsetIndex::OffsetIndex(std::string_view text, std::string path)
    : text_(text), path_(std::move(path)) {
  starts_.push_back(0);
  for (std::size_t i = 0; i < text_.size(); ++i)
    if (text_[i] == '\n')
      starts_.push_back(i + 1);
}

std::size_t OffsetIndex::offset(const Position &pos) const {
  if (pos.line == 0)
    throw Error(ErrorCode::LineOutOfBounds, path_, path_ + ": line numbers start at 1");

  const std::size_t idx = pos.line - 1;
  const std::uint32_t column = pos.column.value_or(1);
  if (column == 0)
    throw Error(ErrorCode::ColumnOutOfBounds, path_,
                path_ + ":" + std::to_string(pos.line) + ": column numbers start at 1");

  if (idx > starts_.size())
    throw Error(ErrorCode::LineOutOfBounds, path_,
                path_ + ": line " + std::to_string(pos.line) + " is past the end (" +
                    std::to_string(starts_.size()) + " lines)");

  if (idx == starts_.size()) {
    if (column != 1)
      throw Error(ErrorCode::ColumnOutOfBounds, path_,
                  path_ + ":" + std::to_string(pos.line) + ": only column 1 is valid at end of file");
    return text_.size();
  }

  const std::size_t line_start = starts_[idx];
  const std::size_t line_end = idx + 1 < starts_.size() ? starts_[idx + 1] : text_.size();

  std::size_t at = line_start;
  for (std::uint32_t step = 1; step < column; ++step) {
    if (at >= line_end)
      throw Error(ErrorCode::ColumnOutOfBounds, path_,
                  path_ + ":" + std::to_string(pos.line) + ": column " + std::to_string(column) +
                      " is past the end of the line");
    const std::size_t len = text::sequence_length(text_, at);
    at += len == 0 ? 1 : len;
  }
  return at;
}

} // namespace prism
