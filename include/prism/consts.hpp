#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace prism::consts {

// Directory and file names
inline constexpr std::string_view kRepoDir       = ".prism";
inline constexpr std::string_view kObjectsDir    = "objects";
inline constexpr std::string_view kRefsDir       = "refs";
inline constexpr std::string_view kHeadsDir      = "heads";
inline constexpr std::string_view kHeadFile      = "HEAD";
inline constexpr std::string_view kIndexFile     = "index";
inline constexpr std::string_view kConfigFile    = "config";
inline constexpr std::string_view kDefaultBranch = "master";
inline constexpr std::string_view kHeadsRefPrefix = "refs/heads/";

// Object type strings
inline constexpr std::string_view kTypeBlob   = "blob";
inline constexpr std::string_view kTypeTree   = "tree";
inline constexpr std::string_view kTypeCommit = "commit";

// File modes (octal)
inline constexpr std::uint32_t kModeFile    = 0100644; // regular file
inline constexpr std::uint32_t kModeExec    = 0100755; // executable file
inline constexpr std::uint32_t kModeSymlink = 0120000; // symbolic link
inline constexpr std::uint32_t kModeTree    = 0040000; // directory entry in tree
inline constexpr std::uint32_t kModeGitlink = 0160000; // submodule commit
inline constexpr std::uint32_t kModeTypeMask = 0170000;

// ——— Object ID sizes ———
inline constexpr std::size_t kOidRawLen = 20;  // 20 bytes (SHA-1)
inline constexpr std::size_t kOidHexLen = 40;  // 40 hex chars (SHA-1)

// ——— Commit header prefixes (used in parsing/formatting) ———
inline constexpr std::string_view kTreePrefix      = "tree ";
inline constexpr std::string_view kRefPrefix       = "ref: ";
inline constexpr std::string_view kParentPrefix    = "parent ";
inline constexpr std::string_view kAuthorPrefix    = "author ";
inline constexpr std::string_view kCommitterPrefix = "committer ";

// ——— Common characters ———
inline constexpr char kSpace = ' ';
inline constexpr char kNul   = '\0';
inline constexpr char kLF    = '\n';
inline constexpr char kCR    = '\r';

// ——— Diff defaults ———
inline constexpr unsigned kDefaultContextLines   = 3;
inline constexpr unsigned kDefaultInterhunkLines = 0;
inline constexpr unsigned kDefaultRenameThreshold = 50;  // percent
inline constexpr unsigned kDefaultCopyThreshold   = 100; // exact content only
inline constexpr unsigned kRewriteThreshold       = 60;  // below: file counts as rewritten
inline constexpr std::size_t kBinarySniffLen      = 8000;
inline constexpr std::size_t kSectionMaxLen       = 80;
inline constexpr std::string_view kHunkDelimiter  = "@@";

} // namespace prism::consts
