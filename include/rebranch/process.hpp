#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace rebranch::process {

struct Result {
  int exit_code = -1; // -1 when the child was killed by a signal
  std::string out;
  std::string err;

  [[nodiscard]] bool ok() const { return exit_code == 0; }
};

// Run argv[0] (looked up in PATH) inside `cwd`, stdin from /dev/null, with
// stdout and stderr captured. A program that cannot be executed exits 127.
// Throws std::runtime_error when the child cannot be created.
Result run(const std::vector<std::string> &argv, const std::filesystem::path &cwd);

} // namespace rebranch::process
