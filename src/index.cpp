#include "prism/index.hpp"

#include "prism/consts.hpp"
#include "prism/fs.hpp"
#include "prism/repo.hpp"
#include "prism/util.hpp"

#include <algorithm>
#include <cstdio>
#include <sstream>
#include <stdexcept>

namespace stdfs = std::filesystem;

namespace prism {

Index::Index(stdfs::path repo_root) : repo_root_(std::move(repo_root)) {}

stdfs::path Index::index_path() const {
  return repo_root_ / consts::kRepoDir / consts::kIndexFile;
}

static std::uint32_t parse_octal(std::string_view s) {
  std::uint32_t mode = 0;
  for (const char c : s) {
    if (c < '0' || c > '7') {
      return 0;
    }
    mode = (mode << 3) + static_cast<std::uint32_t>(c - '0');
  }
  return mode;
}

void Index::load() {
  entries_.clear();
  const auto bytes = fs::read_file_if_exists(index_path());
  if (!bytes)
    return;

  std::istringstream iss(std::string(bytes->begin(), bytes->end()));
  std::string line;
  while (std::getline(iss, line)) {
    strutil::rstrip_newlines(line);
    if (line.empty() || line[0] == '#')
      continue;

    // format: "<octal> <hex> <path>"; the path may contain spaces
    const auto sp1 = line.find(' ');
    const auto sp2 = sp1 == std::string::npos ? sp1 : line.find(' ', sp1 + 1);
    if (sp2 == std::string::npos)
      continue; // skip malformed
    const std::uint32_t mode = parse_octal(std::string_view(line).substr(0, sp1));
    const std::string hex = line.substr(sp1 + 1, sp2 - sp1 - 1);
    std::string path = line.substr(sp2 + 1);

    IndexEntry e{};
    if (mode == 0 || path.empty() || !from_hex(hex, e.id))
      continue;
    e.mode = mode;
    e.path = std::move(path);
    entries_.push_back(std::move(e));
  }

  std::ranges::sort(entries_, [](const auto &a, const auto &b) { return a.path < b.path; });
}

void Index::save() const {
  std::ostringstream os;
  for (const auto &e : entries_) {
    char mode_buf[16];
    std::snprintf(mode_buf, sizeof(mode_buf), "%o", e.mode);
    os << mode_buf << ' ' << to_hex(e.id) << ' ' << e.path << '\n';
  }
  fs::write_file_atomic(index_path(), fs::as_bytes(os.str()));
}

void Index::add_path(std::string_view relpath, const Repository &repo) {
  const stdfs::path abs = repo_root_ / stdfs::path(relpath);

  std::error_code ec;
  const auto st = stdfs::symlink_status(abs, ec);
  if (ec) {
    throw std::runtime_error("stat failed: " + abs.string() + ": " + ec.message());
  }

  std::uint32_t mode = consts::kModeFile;
  std::string hex_oid;
  if (stdfs::is_symlink(st)) {
    const std::string target = stdfs::read_symlink(abs).generic_string();
    hex_oid = repo.write_blob(fs::as_bytes(target));
    mode = consts::kModeSymlink;
  } else if (stdfs::is_regular_file(st)) {
    hex_oid = repo.write_blob(fs::read_file(abs));
    if ((st.permissions() & stdfs::perms::owner_exec) != stdfs::perms::none) {
      mode = consts::kModeExec;
    }
  } else {
    throw std::runtime_error("not a regular file or symlink: " + std::string(relpath));
  }

  oid bin{};
  if (!from_hex(hex_oid, bin)) {
    throw std::runtime_error("write_blob produced bad hex oid");
  }

  std::string path(relpath);
  auto it = std::ranges::find_if(entries_, [&](const IndexEntry &e) { return e.path == path; });
  if (it != entries_.end()) {
    it->mode = mode;
    it->id = bin;
  } else {
    entries_.push_back(IndexEntry{.mode = mode, .id = bin, .path = std::move(path)});
    std::ranges::sort(entries_, [](const auto &a, const auto &b) { return a.path < b.path; });
  }
}

void Index::remove_path(std::string_view relpath) {
  std::erase_if(entries_, [&](const IndexEntry &e) { return e.path == relpath; });
}

std::optional<IndexEntry> Index::find(std::string_view relpath) const {
  auto it = std::ranges::find_if(entries_, [&](const IndexEntry &e) { return e.path == relpath; });
  if (it == entries_.end())
    return std::nullopt;
  return *it;
}

} // namespace prism
