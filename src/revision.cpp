#include "prism/revision.hpp"

#include "prism/refs.hpp"
#include "prism/repo.hpp"
#include "prism/time.hpp"

namespace prism {

namespace {

std::optional<Signature> to_signature(std::string_view line) {
  if (line.empty())
    return std::nullopt;
  auto parsed = timeutil::parse_signature(line);
  return Signature{.name = std::move(parsed.name), .email = std::move(parsed.email)};
}

std::optional<std::string> first_line(const std::string &message) {
  const auto nl = message.find('\n');
  std::string line = message.substr(0, nl);
  if (!line.empty() && line.back() == '\r')
    line.pop_back();
  if (line.empty())
    return std::nullopt;
  return line;
}

} // namespace

Revision revision_from_commit(const Repository &repo, std::string_view commit_hex) {
  const auto info = repo.read_commit(commit_hex);
  Revision rev{.oid = std::string(commit_hex),
               .reference = std::nullopt,
               .summary = first_line(info.message),
               .author = to_signature(info.author),
               .committer = to_signature(info.committer),
               .timestamp = std::nullopt};
  if (!info.committer.empty())
    rev.timestamp = timeutil::parse_signature(info.committer).when;
  return rev;
}

std::optional<RevisionRange> resolve_revision_range(const Repository &repo) {
  const HeadState head = resolve_HEAD(repo.root());
  if (!head.commit)
    return std::nullopt;

  RevisionRange range{.base = std::nullopt, .head = revision_from_commit(repo, *head.commit)};
  if (head.refname)
    range.head.reference = ref_shorthand(*head.refname);

  const auto info = repo.read_commit(*head.commit);
  if (!info.parents.empty())
    range.base = revision_from_commit(repo, info.parents.front());
  return range;
}

} // namespace prism
