#include "cli/registry.hpp"
#include "cli/session.hpp"

#include "rebranch/consts.hpp"

#include <exception>
#include <iostream>

using rebranch::cli::open_session;
using rebranch::cli::report_failure;

// rebranch <base-branch>
int cmd_start(int argc, char **argv) {
  if (argc != 2) {
    std::cerr << "usage: rebranch <base-branch>\n";
    return 2;
  }
  try {
    open_session()->workflow.start(argv[1]);
    return 0;
  } catch (const std::exception &e) {
    return report_failure(e);
  }
}

int cmd_continue(int argc, char ** /*argv*/) {
  if (argc != 1) {
    std::cerr << "usage: rebranch --continue\n";
    return 2;
  }
  try {
    open_session()->workflow.resume();
    return 0;
  } catch (const std::exception &e) {
    return report_failure(e);
  }
}

int cmd_done(int argc, char ** /*argv*/) {
  if (argc != 1) {
    std::cerr << "usage: rebranch --done\n";
    return 2;
  }
  try {
    open_session()->workflow.finish();
    return 0;
  } catch (const std::exception &e) {
    return report_failure(e);
  }
}

int cmd_abort(int argc, char ** /*argv*/) {
  if (argc != 1) {
    std::cerr << "usage: rebranch --abort\n";
    return 2;
  }
  try {
    open_session()->workflow.abort();
    return 0;
  } catch (const std::exception &e) {
    return report_failure(e);
  }
}

int cmd_help(int /*argc*/, char ** /*argv*/) {
  rebranch::cli::print_usage(std::cout);
  return 0;
}

int cmd_version(int /*argc*/, char ** /*argv*/) {
  std::cout << rebranch::consts::kToolName << " version " << rebranch::consts::kVersion << "\n";
  return 0;
}
