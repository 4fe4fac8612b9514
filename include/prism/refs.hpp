#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace prism {

// "refs/heads/<branch>"
std::string heads_ref(std::string_view branch);

// "refs/heads/<branch>" -> "<branch>"; other names are returned unchanged.
std::string ref_shorthand(std::string_view refname);

// Read HEAD file as raw string (e.g., "ref: refs/heads/master\n" or a 40-hex id).
// Returns std::nullopt if HEAD does not exist yet.
std::optional<std::string> read_HEAD(const std::filesystem::path& repo_root);

struct HeadState {
  std::optional<std::string> refname; // set when HEAD is symbolic
  std::optional<std::string> commit;  // 40-hex tip; absent on an unborn branch
};

// Follow HEAD one level. A missing HEAD yields an empty state.
HeadState resolve_HEAD(const std::filesystem::path& repo_root);

// Write symbolic HEAD: "ref: <refname>\n"
void set_HEAD_symbolic(const std::filesystem::path& repo_root, const std::string& refname);

void set_HEAD_detached(const std::filesystem::path& repo_root, std::string_view hex_oid);

// Read a ref file (e.g., "refs/heads/master") -> 40-hex OID (without trailing newline).
std::optional<std::string> read_ref(const std::filesystem::path& repo_root, const std::string& refname);

// Overwrite/create a ref with the given 40-hex OID (adds trailing newline on disk).
void update_ref(const std::filesystem::path& repo_root, const std::string& refname, const std::string& hex_oid);

} // namespace prism
