#include "prism/config.hpp"
#include "prism/diff.hpp"
#include "prism/repo.hpp"

#include <charconv>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>

static bool parse_flag_value(std::string_view text, unsigned &out) {
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
  return ec == std::errc{} && ptr == text.data() + text.size();
}

static char line_marker(prism::DiffLineKind kind) {
  switch (kind) {
  case prism::DiffLineKind::Addition:
    return '+';
  case prism::DiffLineKind::Deletion:
    return '-';
  case prism::DiffLineKind::Context:
    break;
  }
  return ' ';
}

static void print_file(const prism::DiffFile &file) {
  std::cout << prism::to_string(file.status) << " ";
  if (file.old_path)
    std::cout << *file.old_path << " -> ";
  std::cout << file.path << " (+" << file.stats.additions << " -" << file.stats.deletions << ")";
  if (file.is_binary)
    std::cout << " [binary]";
  std::cout << "\n";

  for (const auto &hunk : file.hunks) {
    const auto &h = hunk.header;
    std::cout << "@@ -" << h.base_start << "," << h.base_lines << " +" << h.head_start << ","
              << h.head_lines << " @@";
    if (hunk.section)
      std::cout << " " << *hunk.section;
    std::cout << "\n";
    for (const auto &line : hunk.lines)
      std::cout << line_marker(line.kind) << line.text << "\n";
  }
}

int cmd_diff(int argc, char **argv) {
  prism::Repository repo{std::filesystem::current_path()};
  if (!repo.is_initialized()) {
    std::cerr << "diff: not a prism repo (run `prism init`)\n";
    return 1;
  }

  try {
    prism::DiffOptions options = prism::load_config(repo.root()).diff;
    for (int i = 1; i < argc; ++i) {
      const std::string a = argv[i];
      unsigned *target = nullptr;
      if (a == "--context")
        target = &options.context_lines;
      else if (a == "--rename-threshold")
        target = &options.rename_threshold;
      else if (a == "--copy-threshold")
        target = &options.copy_threshold;

      if (!target || i + 1 >= argc || !parse_flag_value(argv[i + 1], *target)) {
        std::cerr << "usage: prism diff [--context N] [--rename-threshold P] "
                     "[--copy-threshold P]\n";
        return 2;
      }
      ++i;
    }

    const prism::Diff result = prism::diff(repo, options);
    if (result.range.base)
      std::cout << "base " << result.range.base->oid << "\n";
    std::cout << "head " << result.range.head.oid;
    if (result.range.head.reference)
      std::cout << " (" << *result.range.head.reference << ")";
    std::cout << "\n";

    prism::DiffStats total;
    for (const auto &file : result.files) {
      print_file(file);
      total += file.stats;
    }
    std::cout << result.files.size() << " file(s) changed, " << total.additions
              << " insertion(s), " << total.deletions << " deletion(s)\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "diff: " << e.what() << "\n";
    return 1;
  }
}
