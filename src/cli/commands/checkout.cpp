#include "cli/session.hpp"

#include "rebranch/repo.hpp"

#include <iostream>

int cmd_checkout(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "usage: rebranch checkout <branch>\n";
    return 2;
  }
  const auto repo = rebranch::cli::open_repository("checkout");
  if (!repo) {
    return 1;
  }
  try {
    repo->checkout(argv[1]);
    std::cout << "Switched to branch '" << argv[1] << "'\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "checkout: " << e.what() << "\n";
    return 1;
  }
}
