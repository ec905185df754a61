#include "cli/session.hpp"

#include "rebranch/repo.hpp"
#include "rebranch/util.hpp"

#include <iostream>
#include <string>

int cmd_log(int /*argc*/, char ** /*argv*/) {
  const auto repo = rebranch::cli::open_repository("log");
  if (!repo) {
    return 1;
  }
  try {
    auto commit_hex = repo->head_commit();
    if (!commit_hex) {
      std::cerr << "log: branch has no commits\n";
      return 1;
    }

    // Walk first parents
    std::string hex = *commit_hex;
    while (!hex.empty()) {
      const auto info = repo->read_commit(hex);
      std::cout << "commit " << hex << "\n";
      if (info.parents.size() > 1) {
        std::cout << "Merge: " << rebranch::short_id(info.parents[0]) << " "
                  << rebranch::short_id(info.parents[1]) << "\n";
      }
      if (!info.author.empty())
        std::cout << "Author: " << info.author << "\n";
      if (const auto subject = rebranch::strutil::first_line(info.message); !subject.empty())
        std::cout << "    " << subject << "\n";
      std::cout << "\n";
      hex = info.parents.empty() ? std::string() : info.parents.front();
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "log: " << e.what() << "\n";
    return 1;
  }
}
