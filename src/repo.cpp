#include "prism/repo.hpp"

#include "prism/consts.hpp"
#include "prism/fs.hpp"
#include "prism/index.hpp"
#include "prism/object_store.hpp"
#include "prism/refs.hpp"
#include "prism/time.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace stdfs = std::filesystem;

namespace {
[[nodiscard]] auto split_first(std::string_view path)
    -> std::pair<std::string, std::string> {
  const std::size_t pos = path.find('/');
  if (pos == std::string_view::npos) {
    return {std::string(path), std::string{}};
  }
  return {std::string(path.substr(0, pos)), std::string(path.substr(pos + 1))};
}
} // namespace

namespace prism {

Repository::Repository(stdfs::path root) : root_(std::move(root)) {}

auto Repository::is_initialized() const -> bool { return fs::exists(repo_dir()); }

void Repository::init(const Config& config) const {
  if (is_initialized()) {
    throw std::runtime_error("A prism repository already exists at: " + repo_dir().string());
  }

  std::error_code ec;
  stdfs::create_directories(objects_dir(), ec);
  if (ec) {
    throw std::runtime_error("create objects dir failed: " + ec.message());
  }
  stdfs::create_directories(heads_dir(), ec);
  if (ec) {
    throw std::runtime_error("create refs/heads dir failed: " + ec.message());
  }

  set_HEAD_symbolic(root_, heads_ref(consts::kDefaultBranch));
  save_config(root_, config);
}

// Modes

auto Repository::mode_to_ascii_octal(std::uint32_t mode) -> std::string {
  std::array<char, 16> buf{};
  std::snprintf(buf.data(), buf.size(), "%o", mode);
  return {buf.data()};
}

auto Repository::ascii_octal_to_mode(std::string_view s) -> std::uint32_t {
  std::uint32_t v = 0;
  for (const char c : s) {
    if (c < '0' || c > '7') {
      throw std::runtime_error("tree parse: bad mode " + std::string(s));
    }
    v = static_cast<std::uint32_t>((v << 3U) + static_cast<unsigned>(c - '0'));
  }
  return v;
}

// Blobs

auto Repository::write_blob(std::span<const std::uint8_t> bytes) const -> std::string {
  const ObjectStore store{repo_dir()};
  return store.write(consts::kTypeBlob, bytes);
}

auto Repository::read_blob(std::string_view hex_oid) const -> std::vector<std::uint8_t> {
  const ObjectStore store{repo_dir()};
  return store.read_typed(hex_oid, consts::kTypeBlob);
}

// Trees (binary)

auto Repository::write_tree(const std::vector<TreeEntry>& entries_in) const -> std::string {
  auto entries = entries_in;
  // Directories sort as if their name had a trailing '/'
  const auto sort_key = [](const TreeEntry& e) {
    return e.mode == consts::kModeTree ? e.name + "/" : e.name;
  };
  std::ranges::sort(entries, [&](const TreeEntry& a, const TreeEntry& b) {
    return sort_key(a) < sort_key(b);
  });

  std::string data;
  for (const auto& e : entries) {
    data.append(mode_to_ascii_octal(e.mode));
    data.push_back(consts::kSpace);
    data.append(e.name);
    data.push_back(consts::kNul);
    data.append(reinterpret_cast<const char*>(e.id.data()), consts::kOidRawLen);
  }

  const ObjectStore store{repo_dir()};
  return store.write(consts::kTypeTree, fs::as_bytes(data));
}

auto Repository::read_tree(std::string_view hex_oid) const -> std::vector<TreeEntry> {
  const ObjectStore store{repo_dir()};
  const auto data = store.read_typed(hex_oid, consts::kTypeTree);

  std::vector<TreeEntry> out;
  auto p = data.begin();
  const auto end = data.end();

  while (p < end) {
    const auto q_space = std::find(p, end, static_cast<std::uint8_t>(consts::kSpace));
    if (q_space == end) {
      throw std::runtime_error("tree parse: expected space");
    }
    const std::uint32_t mode = ascii_octal_to_mode(std::string(p, q_space));

    p = q_space + 1;
    const auto q_nul = std::find(p, end, static_cast<std::uint8_t>(consts::kNul));
    if (q_nul == end) {
      throw std::runtime_error("tree parse: expected NUL");
    }
    std::string name(p, q_nul);
    p = q_nul + 1;

    if (static_cast<std::size_t>(end - p) < consts::kOidRawLen) {
      throw std::runtime_error("tree parse: truncated oid");
    }

    TreeEntry e{};
    e.mode = mode;
    e.name = std::move(name);
    std::memcpy(e.id.data(), &(*p), consts::kOidRawLen);
    p += static_cast<std::ptrdiff_t>(consts::kOidRawLen);

    out.push_back(std::move(e));
  }
  return out;
}

// Commits

auto Repository::write_commit(std::string_view tree_hex,
                              const std::vector<std::string>& parent_hexes,
                              std::string_view author_line,
                              std::string_view committer_line,
                              std::string_view message) const -> std::string {
  std::string txt;
  txt.append(consts::kTreePrefix).append(tree_hex).push_back(consts::kLF);
  for (const auto& p : parent_hexes) {
    txt.append(consts::kParentPrefix).append(p).push_back(consts::kLF);
  }
  txt.append(consts::kAuthorPrefix).append(author_line).push_back(consts::kLF);
  txt.append(consts::kCommitterPrefix).append(committer_line).append("\n\n");
  txt.append(message);

  const ObjectStore store{repo_dir()};
  return store.write(consts::kTypeCommit, fs::as_bytes(txt));
}

auto Repository::read_commit(std::string_view commit_hex) const -> CommitInfo {
  const ObjectStore store{repo_dir()};
  const auto data = store.read_typed(commit_hex, consts::kTypeCommit);
  const std::string text(data.begin(), data.end());

  CommitInfo info{};
  std::size_t pos = 0;

  for (;;) {
    const std::size_t nl = text.find('\n', pos);
    const std::string line =
        (nl == std::string::npos) ? text.substr(pos) : text.substr(pos, nl - pos);

    if (line.empty()) {
      if (nl != std::string::npos) {
        info.message = text.substr(nl + 1);
      }
      break;
    }

    if (line.starts_with(consts::kTreePrefix)) {
      info.tree_hex = line.substr(consts::kTreePrefix.size(), consts::kOidHexLen);
    } else if (line.starts_with(consts::kParentPrefix)) {
      info.parents.push_back(line.substr(consts::kParentPrefix.size(), consts::kOidHexLen));
    } else if (line.starts_with(consts::kAuthorPrefix)) {
      info.author = line.substr(consts::kAuthorPrefix.size());
    } else if (line.starts_with(consts::kCommitterPrefix)) {
      info.committer = line.substr(consts::kCommitterPrefix.size());
    }

    if (nl == std::string::npos) break;
    pos = nl + 1;
  }

  if (info.tree_hex.size() != consts::kOidHexLen) {
    throw std::runtime_error("commit " + std::string(commit_hex) + " has no tree");
  }
  return info;
}

auto Repository::write_tree_from_index() const -> std::string {
  Index idx{root_};
  idx.load();

  const auto build = [&](const auto& self, const std::vector<IndexEntry>& group) -> std::string {
    std::map<std::string, std::vector<IndexEntry>> subdirs; // dirname -> child entries
    std::vector<TreeEntry> tree_entries;

    for (const auto& e : group) {
      auto [first, rest] = split_first(e.path);
      if (rest.empty()) {
        tree_entries.push_back(TreeEntry{.mode = e.mode, .name = std::move(first), .id = e.id});
      } else {
        IndexEntry child = e;
        child.path = std::move(rest);
        subdirs[first].push_back(std::move(child));
      }
    }

    for (const auto& [dirname, child_entries] : subdirs) {
      oid subtree_oid{};
      if (!from_hex(self(self, child_entries), subtree_oid)) {
        throw std::runtime_error("bad subtree hex oid");
      }
      tree_entries.push_back(TreeEntry{.mode = consts::kModeTree, .name = dirname, .id = subtree_oid});
    }

    return write_tree(tree_entries);
  };

  return build(build, idx.entries());
}

auto Repository::head_commit() const -> std::optional<std::string> {
  return resolve_HEAD(root_).commit;
}

auto Repository::commit_index(std::string_view message) const -> std::string {
  if (!is_initialized()) {
    throw std::runtime_error("Not a prism repository (missing .prism)");
  }

  const std::string tree_hex = write_tree_from_index();
  const HeadState head = resolve_HEAD(root_);

  std::vector<std::string> parents;
  if (head.commit) {
    parents.push_back(*head.commit);
  }

  const Identity id = load_config(root_).identity;
  const std::time_t now = std::time(nullptr);
  const int tz_min = timeutil::local_utc_offset_minutes(now);
  const std::string sig = timeutil::make_signature(id, now, tz_min);

  const std::string commit_hex = write_commit(tree_hex, parents, sig, sig, message);

  if (head.refname) {
    update_ref(root_, *head.refname, commit_hex);
  } else {
    set_HEAD_detached(root_, commit_hex);
  }
  return commit_hex;
}

} // namespace prism
