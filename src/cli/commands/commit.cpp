#include "cli/session.hpp"

#include "rebranch/consts.hpp"
#include "rebranch/fs.hpp"
#include "rebranch/repo.hpp"
#include "rebranch/util.hpp"

#include <iostream>
#include <string>

int cmd_commit(int argc, char **argv) {
  // very small parser: rebranch commit -m "msg"
  std::string message;
  for (int i = 1; i < argc; ++i) {
    if (std::string a = argv[i]; (a == "-m" || a == "--message") && i + 1 < argc) {
      message = argv[++i];
    }
  }

  const auto repo = rebranch::cli::open_repository("commit");
  if (!repo) {
    return 1;
  }

  try {
    // A stopped cherry-pick reuses the picked commit's message by default
    if (repo->has_marker(rebranch::consts::kCherryPickHead)) {
      std::string picked =
          rebranch::fs::read_text(repo->repo_dir() / rebranch::consts::kCherryPickHead);
      rebranch::strutil::rstrip_newlines(picked);
      std::cout << "Finishing cherry-pick of " << rebranch::short_id(picked) << "\n";
      if (message.empty()) {
        message = repo->read_commit(picked).message;
        rebranch::strutil::rstrip_newlines(message);
      }
    }
    if (message.empty()) {
      std::cerr << "usage: rebranch commit -m <message>\n";
      return 2;
    }
    // append newline like Git usually stores
    const std::string oid = repo->commit_index(message + "\n");
    std::cout << oid << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "commit: " << e.what() << "\n";
    return 1;
  }
}
