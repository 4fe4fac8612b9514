#include "prism/config.hpp"

#include "prism/fs.hpp"
#include "prism/util.hpp"

#include <charconv>
#include <sstream>
#include <stdexcept>
#include <string_view>

namespace {

constexpr std::string_view kAuthor = "author";
constexpr std::string_view kEmail = "email";
constexpr std::string_view kContext = "context";
constexpr std::string_view kInterhunk = "interhunk";
constexpr std::string_view kRenameThreshold = "rename-threshold";
constexpr std::string_view kCopyThreshold = "copy-threshold";
constexpr std::string_view kFindRenames = "find-renames";
constexpr std::string_view kFindCopies = "find-copies";

unsigned parse_unsigned(std::string_view key, std::string_view value) {
  unsigned out = 0;
  const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
  if (ec != std::errc{} || ptr != value.data() + value.size()) {
    throw std::runtime_error("config: " + std::string(key) + ": not a number: " +
                             std::string(value));
  }
  return out;
}

unsigned parse_percent(std::string_view key, std::string_view value) {
  const unsigned v = parse_unsigned(key, value);
  if (v > 100) {
    throw std::runtime_error("config: " + std::string(key) + ": must be 0-100");
  }
  return v;
}

bool parse_bool(std::string_view key, std::string_view value) {
  if (value == "true" || value == "yes" || value == "1")
    return true;
  if (value == "false" || value == "no" || value == "0")
    return false;
  throw std::runtime_error("config: " + std::string(key) + ": not a boolean: " +
                           std::string(value));
}

} // namespace

namespace prism {

static std::filesystem::path cfg_path(const std::filesystem::path &repo_root) {
  return repo_root / consts::kRepoDir / consts::kConfigFile;
}

Config load_config(const std::filesystem::path &repo_root) {
  Config out{};
  const auto bytes = fs::read_file_if_exists(cfg_path(repo_root));
  if (!bytes)
    return out;

  std::istringstream iss(std::string(bytes->begin(), bytes->end()));
  std::string line;
  while (std::getline(iss, line)) {
    const std::string_view sv = strutil::trim(line);
    if (sv.empty() || sv[0] == '#')
      continue; // allow comments
    const auto colon = sv.find(':');
    if (colon == std::string_view::npos)
      continue;
    const std::string_view key = strutil::trim(sv.substr(0, colon));
    const std::string_view value = strutil::trim(sv.substr(colon + 1));

    if (key == kAuthor) {
      out.identity.name = std::string(value);
    } else if (key == kEmail) {
      out.identity.email = std::string(value);
    } else if (key == kContext) {
      out.diff.context_lines = parse_unsigned(key, value);
    } else if (key == kInterhunk) {
      out.diff.interhunk_lines = parse_unsigned(key, value);
    } else if (key == kRenameThreshold) {
      out.diff.rename_threshold = parse_percent(key, value);
    } else if (key == kCopyThreshold) {
      out.diff.copy_threshold = parse_percent(key, value);
    } else if (key == kFindRenames) {
      out.diff.find_renames = parse_bool(key, value);
    } else if (key == kFindCopies) {
      out.diff.find_copies = parse_bool(key, value);
    }
    // unknown keys are ignored
  }
  return out;
}

void save_config(const std::filesystem::path &repo_root, const Config &cfg) {
  std::ostringstream os;
  os << kAuthor << ": " << cfg.identity.name << '\n'
     << kEmail << ": " << cfg.identity.email << '\n'
     << kContext << ": " << cfg.diff.context_lines << '\n'
     << kInterhunk << ": " << cfg.diff.interhunk_lines << '\n'
     << kRenameThreshold << ": " << cfg.diff.rename_threshold << '\n'
     << kCopyThreshold << ": " << cfg.diff.copy_threshold << '\n'
     << kFindRenames << ": " << (cfg.diff.find_renames ? "true" : "false") << '\n'
     << kFindCopies << ": " << (cfg.diff.find_copies ? "true" : "false") << '\n';
  fs::write_file_atomic(cfg_path(repo_root), fs::as_bytes(os.str()));
}

} // namespace prism
