#include "prism/error.hpp"

namespace prism {

std::string_view to_string(ErrorCode code) {
  switch (code) {
  case ErrorCode::NoHeadRevision:
    return "no-head-revision";
  case ErrorCode::Backend:
    return "backend";
  case ErrorCode::AbsolutePath:
    return "absolute-path";
  case ErrorCode::PathTraversal:
    return "path-traversal";
  case ErrorCode::MissingFile:
    return "missing-file";
  case ErrorCode::UnsupportedSide:
    return "unsupported-side";
  case ErrorCode::LineOutOfBounds:
    return "line-out-of-bounds";
  case ErrorCode::ColumnOutOfBounds:
    return "column-out-of-bounds";
  case ErrorCode::InvalidRange:
    return "invalid-range";
  case ErrorCode::OverlappingEdits:
    return "overlapping-edits";
  case ErrorCode::Io:
    return "io";
  case ErrorCode::Staging:
    return "staging";
  }
  return "unknown";
}

} // namespace prism
