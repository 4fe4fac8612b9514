#include "prism/refs.hpp"

#include "prism/consts.hpp"
#include "prism/fs.hpp"
#include "prism/util.hpp"

#include <string>
#include <string_view>

namespace prism {

static std::filesystem::path repo_dir(const std::filesystem::path &root) {
  return root / consts::kRepoDir;
}

static std::filesystem::path head_file(const std::filesystem::path &root) {
  return repo_dir(root) / consts::kHeadFile;
}

static std::filesystem::path ref_path(const std::filesystem::path &root,
                                      const std::string &refname) {
  return repo_dir(root) / refname;
}

static void write_text(const std::filesystem::path &p, const std::string &s) {
  fs::write_file_atomic(p, fs::as_bytes(s));
}

std::string heads_ref(std::string_view branch) {
  return std::string(consts::kHeadsRefPrefix) + std::string(branch);
}

std::string ref_shorthand(std::string_view refname) {
  if (refname.starts_with(consts::kHeadsRefPrefix)) {
    refname.remove_prefix(consts::kHeadsRefPrefix.size());
  }
  return std::string(refname);
}

std::optional<std::string> read_HEAD(const std::filesystem::path &repo_root) {
  auto bytes = fs::read_file_if_exists(head_file(repo_root));
  if (!bytes) {
    return std::nullopt;
  }
  return std::string(bytes->begin(), bytes->end());
}

HeadState resolve_HEAD(const std::filesystem::path &repo_root) {
  HeadState st;
  auto head_txt = read_HEAD(repo_root);
  if (!head_txt) {
    return st;
  }
  std::string s = std::move(*head_txt);
  strutil::rstrip_newlines(s);
  if (s.starts_with(consts::kRefPrefix)) {
    st.refname = s.substr(consts::kRefPrefix.size());
    if (auto tip = read_ref(repo_root, *st.refname); tip && looks_hex40(*tip)) {
      st.commit = std::move(*tip);
    }
  } else if (looks_hex40(s)) {
    st.commit = std::move(s);
  }
  return st;
}

void set_HEAD_symbolic(const std::filesystem::path &repo_root, const std::string &refname) {
  write_text(head_file(repo_root), std::string(consts::kRefPrefix) + refname + "\n");
}

void set_HEAD_detached(const std::filesystem::path &repo_root, std::string_view hex_oid) {
  write_text(head_file(repo_root), std::string(hex_oid) + "\n");
}

std::optional<std::string> read_ref(const std::filesystem::path &repo_root,
                                    const std::string &refname) {
  auto bytes = fs::read_file_if_exists(ref_path(repo_root, refname));
  if (!bytes) {
    return std::nullopt;
  }
  std::string s(bytes->begin(), bytes->end());
  strutil::rstrip_newlines(s);
  return s;
}

void update_ref(const std::filesystem::path &repo_root, const std::string &refname,
                const std::string &hex_oid) {
  write_text(ref_path(repo_root, refname), hex_oid + "\n");
}

} // namespace prism
