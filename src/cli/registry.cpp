#include "cli/registry.hpp"

#include <algorithm>
#include <iostream>
#include <map>
#include <sstream>

namespace prism::cli {

struct entry {
  command_fn fn;
  command_group group;
  std::string synopsis;
  std::string help;
};
static std::map<std::string, entry> &table() {
  static std::map<std::string, entry> t;
  return t;
}

void register_command(const std::string &name, command_fn fn, command_group group,
                      const std::string &synopsis, const std::string &help) {
  table()[name] = entry{.fn = fn, .group = group, .synopsis = synopsis, .help = help};
}

command_fn find_command(const std::string &name) {
  const auto it = table().find(name);
  return it == table().end() ? nullptr : it->second.fn;
}

std::string usage_text() {
  std::size_t width = 0;
  for (const auto &[name, e] : table())
    width = std::max(width, name.size() + 1 + e.synopsis.size());

  std::ostringstream os;
  os << "usage: prism <command> [args]\n";
  const auto section = [&](command_group group, const char *title) {
    bool any = false;
    for (const auto &[name, e] : table()) {
      if (e.group != group)
        continue;
      if (!any)
        os << "\n" << title << ":\n";
      any = true;
      std::string head = name;
      if (!e.synopsis.empty())
        head += " " + e.synopsis;
      os << "  " << head << std::string(width - head.size() + 2, ' ') << e.help << "\n";
    }
  };
  section(command_group::review, "review commands");
  section(command_group::repository, "repository commands");
  return os.str();
}

void print_usage() { std::cerr << usage_text(); }

} // namespace prism::cli
