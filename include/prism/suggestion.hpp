#pragma once
#include "prism/review.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace prism {

class Repository; // fwd

// One validated edit as a byte span of the file's current text.
struct Replacement {
  std::size_t start = 0;
  std::size_t end = 0;
  std::string text;
};

// Planned rewrite of one file. Replacements are sorted by start and disjoint.
struct FileChange {
  std::string path;
  std::string original;
  std::string updated;
  std::vector<Replacement> replacements;
};

struct ApplyPreview {
  std::string path;
  std::string patch; // unified diff of original -> updated
};

// Validate every edit of `suggestion` and compute the new content of each file it
// touches, in ascending path order. Files left unchanged are omitted. Reads only.
[[nodiscard]] auto plan_changes(const Repository &repo, const Suggestion &suggestion)
    -> std::vector<FileChange>;

// Apply `replacements` (sorted, disjoint) to `original`.
[[nodiscard]] auto splice(const std::string &original, const std::vector<Replacement> &replacements)
    -> std::string;

// Unified-diff preview of every file the suggestion would change. Never writes.
[[nodiscard]] auto dry_run(const Repository &repo, const Suggestion &suggestion)
    -> std::vector<ApplyPreview>;

// Write and stage every changed file. All files are validated first; a write or
// staging failure stops at that file and leaves earlier files written.
void apply(const Repository &repo, const Suggestion &suggestion);

} // namespace prism
