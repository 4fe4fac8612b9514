#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace prism {

class Repository; // fwd

// Working-tree access scoped to one repository root. Every method reports
// failures as prism::Error tagged with the repo-relative path.
class Workspace {
public:
  explicit Workspace(const Repository &repo) : repo_(repo) {}

  // Absolute path of a repo-relative one. Throws AbsolutePath, or PathTraversal
  // for ".." components and paths inside the repository directory, before
  // touching the filesystem.
  [[nodiscard]] auto resolve(std::string_view relpath) const -> std::filesystem::path;

  // Current content, or std::nullopt when the file does not exist.
  // Other read failures and invalid UTF-8 are Io errors.
  [[nodiscard]] auto read_text(std::string_view relpath) const -> std::optional<std::string>;

  // Replace the file atomically. Io on failure.
  void write(std::string_view relpath, std::string_view content) const;

  // Record the on-disk content of `relpath` in the index. Staging on failure.
  void stage(std::string_view relpath) const;

private:
  const Repository &repo_;
};

} // namespace prism
