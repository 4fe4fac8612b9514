#include "prism/config.hpp"
#include "prism/repo.hpp"

#include <filesystem>
#include <iostream>

int cmd_init(int /*argc*/, char ** /*argv*/) {
  try {
    const std::filesystem::path root = std::filesystem::current_path();
    const prism::Repository repo{root};
    repo.init();
    std::cout << "Initialized empty prism repository in " << repo.repo_dir() << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "init: " << e.what() << "\n";
    return 1;
  }
}
