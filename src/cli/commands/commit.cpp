#include "prism/repo.hpp"

#include <filesystem>
#include <iostream>
#include <string>

int cmd_commit(int argc, char **argv) {
  // very small parser: prism commit -m "msg"
  std::string message;
  for (int i = 1; i < argc; ++i) {
    if (std::string a = argv[i]; (a == "-m" || a == "--message") && i + 1 < argc) {
      message = argv[++i];
    }
  }
  if (message.empty()) {
    std::cerr << "usage: prism commit -m <message>\n";
    return 2;
  }

  prism::Repository repo{std::filesystem::current_path()};
  if (!repo.is_initialized()) {
    std::cerr << "commit: not a prism repo (run `prism init`)\n";
    return 1;
  }

  try {
    // append newline like Git usually stores
    std::string oid = repo.commit_index(message + "\n");
    std::cout << oid << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "commit: " << e.what() << "\n";
    return 1;
  }
}
