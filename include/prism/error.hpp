#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace prism {

enum class ErrorCode : std::uint8_t {
  NoHeadRevision,    // repository has no commit to review
  Backend,           // object store / tree comparison failure
  AbsolutePath,      // suggestion path is absolute
  PathTraversal,     // suggestion path contains ".."
  MissingFile,       // suggestion targets a file that does not exist
  UnsupportedSide,   // edit targets the base side
  LineOutOfBounds,
  ColumnOutOfBounds,
  InvalidRange,      // start offset after end offset
  OverlappingEdits,
  Io,                // read/write failure other than "not found"
  Staging,           // path could not be recorded in the index
};

auto to_string(ErrorCode code) -> std::string_view;

// Every failure the diff and suggestion operations report. `path()` is the
// repo-relative file involved, empty when the error is not about one file.
class Error : public std::runtime_error {
public:
  Error(ErrorCode code, std::string path, const std::string &message)
      : std::runtime_error(message), code_(code), path_(std::move(path)) {}

  [[nodiscard]] ErrorCode code() const noexcept { return code_; }
  [[nodiscard]] const std::string &path() const noexcept { return path_; }

private:
  ErrorCode code_;
  std::string path_;
};

} // namespace prism
