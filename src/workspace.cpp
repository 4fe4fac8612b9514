#include "prism/workspace.hpp"

#include "prism/consts.hpp"
#include "prism/error.hpp"
#include "prism/fs.hpp"
#include "prism/index.hpp"
#include "prism/repo.hpp"
#include "prism/text.hpp"

#include <stdexcept>

namespace prism {

std::filesystem::path Workspace::resolve(std::string_view relpath) const {
  const std::filesystem::path rel{std::string(relpath)};
  if (rel.is_absolute() || rel.has_root_name() || rel.has_root_directory())
    throw Error(ErrorCode::AbsolutePath, std::string(relpath),
                "path must be relative to the repository: " + std::string(relpath));
  for (const auto &part : rel)
    if (part == "..")
      throw Error(ErrorCode::PathTraversal, std::string(relpath),
                  "path escapes the repository: " + std::string(relpath));
  const auto normal = rel.lexically_normal();
  if (!normal.empty() && *normal.begin() == std::filesystem::path(consts::kRepoDir))
    throw Error(ErrorCode::PathTraversal, std::string(relpath),
                "path points into repository metadata: " + std::string(relpath));
  return repo_.root() / rel;
}

std::optional<std::string> Workspace::read_text(std::string_view relpath) const {
  const auto abs = resolve(relpath);
  std::optional<std::vector<std::uint8_t>> bytes;
  try {
    bytes = fs::read_file_if_exists(abs);
  } catch (const std::runtime_error &e) {
    throw Error(ErrorCode::Io, std::string(relpath), e.what());
  }
  if (!bytes)
    return std::nullopt;

  std::string content(bytes->begin(), bytes->end());
  if (!text::is_valid_utf8(content))
    throw Error(ErrorCode::Io, std::string(relpath),
                "file is not valid UTF-8: " + std::string(relpath));
  return content;
}

void Workspace::write(std::string_view relpath, std::string_view content) const {
  const auto abs = resolve(relpath);
  std::error_code ec;
  const auto previous = std::filesystem::status(abs, ec);
  try {
    fs::write_file_atomic(abs, fs::as_bytes(content));
  } catch (const std::runtime_error &e) {
    throw Error(ErrorCode::Io, std::string(relpath), e.what());
  }
  // the replacement file starts with default permissions; keep the executable bit
  if (!ec && std::filesystem::is_regular_file(previous)) {
    std::filesystem::permissions(abs, previous.permissions(), ec);
    if (ec)
      throw Error(ErrorCode::Io, std::string(relpath),
                  "restore permissions failed: " + ec.message());
  }
}

void Workspace::stage(std::string_view relpath) const {
  (void)resolve(relpath);
  try {
    Index idx{repo_.root()};
    idx.load();
    idx.add_path(relpath, repo_);
    idx.save();
  } catch (const std::runtime_error &e) {
    throw Error(ErrorCode::Staging, std::string(relpath), e.what());
  }
}

} // namespace prism
