#include "rebranch/config.hpp"
#include "rebranch/consts.hpp"
#include "rebranch/repo.hpp"

#include <filesystem>
#include <iostream>
#include <string>

int cmd_init(int argc, char **argv) {
  rebranch::Identity who{.name = "Your Name", .email = "you@example.com"};
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--name" && i + 1 < argc) {
      who.name = argv[++i];
    } else if (a == "--email" && i + 1 < argc) {
      who.email = argv[++i];
    } else {
      std::cerr << "usage: rebranch init [--name <name>] [--email <email>]\n";
      return 2;
    }
  }

  try {
    const std::filesystem::path root = std::filesystem::current_path();
    const rebranch::Repository repo{root};
    repo.init(who);
    std::cout << "Initialized empty " << rebranch::consts::kToolName << " repository in "
              << repo.repo_dir() << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "init: " << e.what() << "\n";
    return 1;
  }
}
