#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace prism {

class Repository; // fwd

struct Signature {
  std::string name;
  std::optional<std::string> email;
};

struct Revision {
  std::string oid;                      // 40-hex commit id
  std::optional<std::string> reference; // branch shorthand when HEAD points here
  std::optional<std::string> summary;   // first line of the message
  std::optional<Signature> author;
  std::optional<Signature> committer;
  std::optional<std::int64_t> timestamp; // committer time, seconds since epoch
};

struct RevisionRange {
  std::optional<Revision> base; // first parent of head; absent for a root commit
  Revision head;
};

// Describe a commit. `reference` is attached by the caller.
[[nodiscard]] auto revision_from_commit(const Repository &repo, std::string_view commit_hex)
    -> Revision;

// HEAD and its first parent, or std::nullopt when HEAD has no commit yet.
[[nodiscard]] auto resolve_revision_range(const Repository &repo) -> std::optional<RevisionRange>;

} // namespace prism
