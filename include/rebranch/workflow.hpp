#pragma once
#include "rebranch/backend.hpp"
#include "rebranch/editor.hpp"
#include "rebranch/record.hpp"

#include <ctime>
#include <filesystem>
#include <functional>
#include <iosfwd>
#include <string>
#include <utility>
#include <string_view>
#include <vector>

namespace rebranch {

// One state transition per call. All continuity between calls lives in the
// RecordStore.
//
//   (none) --start--> picking --conflict--> conflicted --resume--> picking
//   picking --all entries processed--> done --finish--> (none)
//   any stage --abort--> (none)
class Workflow {
public:
  using Clock = std::function<std::time_t()>;

  Workflow(VcsBackend &vcs, const RecordStore &store, Editor &editor, std::ostream &out,
           std::ostream &err);

  // Replace the clock used to name the scratch branch.
  void set_clock(Clock clock) { clock_ = std::move(clock); }

  void start(std::string_view base_branch);
  void resume();
  void finish();
  void abort();

  [[nodiscard]] auto pick_file() const -> std::filesystem::path;

private:
  auto select_commits(const std::vector<CommitEntry> &candidates) -> std::vector<CommitEntry>;
  [[nodiscard]] auto make_temp_branch_name() const -> std::string;
  void apply_plan(OperationRecord &record);

  VcsBackend &vcs_;
  const RecordStore &store_;
  Editor &editor_;
  std::ostream &out_;
  std::ostream &err_;
  Clock clock_;
};

} // namespace rebranch
