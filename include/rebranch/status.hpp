#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace rebranch {

enum class ChangeKind : std::uint8_t { Added, Modified, Deleted };

struct Change {
  ChangeKind kind;
  std::string path;  // repo-relative
};

struct Status {
  std::vector<Change> staged;         // HEAD vs index
  std::vector<Change> unstaged;       // working vs index
  std::vector<std::string> untracked; // working - index

  // Nothing staged, nothing modified, nothing untracked.
  [[nodiscard]] bool clean() const {
    return staged.empty() && unstaged.empty() && untracked.empty();
  }
};

class Repository; // fwd
auto compute_status(const Repository& repo) -> Status;

} // namespace rebranch
