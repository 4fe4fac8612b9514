#include "prism/error.hpp"
#include "prism/repo.hpp"
#include "prism/review.hpp"
#include "prism/suggestion.hpp"

#include <charconv>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

// "12" or "12:4"
static std::optional<prism::Position> parse_position(std::string_view text) {
  auto parse = [](std::string_view s) -> std::optional<std::uint32_t> {
    std::uint32_t v = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (s.empty() || ec != std::errc{} || ptr != s.data() + s.size())
      return std::nullopt;
    return v;
  };

  const auto colon = text.find(':');
  auto line = parse(text.substr(0, colon));
  if (!line)
    return std::nullopt;
  prism::Position pos{.line = *line, .column = std::nullopt};
  if (colon != std::string_view::npos) {
    pos.column = parse(text.substr(colon + 1));
    if (!pos.column)
      return std::nullopt;
  }
  return pos;
}

static int usage() {
  std::cerr << "usage: prism suggest [--dry-run] [-t <title>] "
               "-e <path> <line[:col]> <line[:col]> <text> [-e ...]\n";
  return 2;
}

int cmd_suggest(int argc, char **argv) {
  bool dry = false;
  prism::Suggestion suggestion;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--dry-run") {
      dry = true;
    } else if ((a == "-t" || a == "--title") && i + 1 < argc) {
      suggestion.title = argv[++i];
    } else if ((a == "-e" || a == "--edit") && i + 4 < argc) {
      const auto start = parse_position(argv[i + 2]);
      const auto end = parse_position(argv[i + 3]);
      if (!start || !end)
        return usage();
      suggestion.edits.push_back(prism::TextEdit{
          .location = {.path = argv[i + 1],
                       .side = prism::DiffSide::Head,
                       .range = {.start = *start, .end = *end}},
          .replacement = argv[i + 4]});
      i += 4;
    } else {
      return usage();
    }
  }
  if (suggestion.edits.empty())
    return usage();

  prism::Repository repo{std::filesystem::current_path()};
  if (!repo.is_initialized()) {
    std::cerr << "suggest: not a prism repo (run `prism init`)\n";
    return 1;
  }

  try {
    if (dry) {
      const auto previews = prism::dry_run(repo, suggestion);
      if (previews.empty())
        std::cout << "(no changes)\n";
      for (const auto &preview : previews)
        std::cout << preview.patch;
      return 0;
    }
    prism::apply(repo, suggestion);
    std::cout << "applied " << suggestion.edits.size() << " edit(s)";
    if (suggestion.title)
      std::cout << ": " << *suggestion.title;
    std::cout << "\n";
    return 0;
  } catch (const prism::Error &e) {
    std::cerr << "suggest: " << prism::to_string(e.code()) << ": " << e.what() << "\n";
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "suggest: " << e.what() << "\n";
    return 1;
  }
}
