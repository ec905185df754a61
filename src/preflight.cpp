#include "rebranch/preflight.hpp"

#include "rebranch/error.hpp"

#include <string>

namespace rebranch::preflight {

namespace {

void require_repository(const VcsBackend &vcs) { vcs.validate_repository(); }

OperationRecord require_record(const RecordStore &store) {
  if (!store.exists()) {
    throw Error(Violation::NotInProgress, "no rebranch operation in progress");
  }
  return store.load();
}

void require_clean(const VcsBackend &vcs, const std::string &hint) {
  if (!vcs.is_working_tree_clean()) {
    throw Error(Violation::DirtyWorkingTree, "working directory is not clean. " + hint);
  }
}

} // namespace

void check_start(const VcsBackend &vcs, const RecordStore &store, std::string_view base_branch) {
  require_repository(vcs);

  if (store.exists()) {
    throw Error(Violation::AlreadyInProgress,
                "rebranch operation already in progress\n"
                "\n"
                "Available actions:\n"
                "  * Continue: rebranch --continue (after resolving conflicts)\n"
                "  * Complete: rebranch --done (if cherry-picking finished)\n"
                "  * Cancel:   rebranch --abort (revert to original state)");
  }

  if (const auto op = vcs.detect_foreign_operation(); op.in_progress) {
    throw Error(Violation::ForeignOperation,
                "cannot start rebranch: " + op.kind + " operation is in progress\n"
                "\n"
                "Complete or abort the ongoing " + op.kind + " first, then retry rebranch");
  }

  require_clean(vcs,
                "Please resolve before rebranching:\n"
                "  * Commit your changes\n"
                "  * Or discard them");

  if (!vcs.branch_exists(base_branch)) {
    throw Error(Violation::BaseBranchMissing,
                "base branch '" + std::string(base_branch) + "' does not exist\n"
                "\n"
                "Check the branch name spelling");
  }

  if (const auto current = vcs.current_branch(); current == base_branch) {
    throw Error(Violation::SameAsBase,
                "current branch '" + current + "' is the same as base branch '" +
                    std::string(base_branch) + "'\n"
                "\n"
                "Switch to the branch you want to rebranch first");
  }
}

OperationRecord check_continue(const VcsBackend &vcs, const RecordStore &store) {
  require_repository(vcs);
  auto record = require_record(store);
  if (record.stage != Stage::Conflicted) {
    throw Error(Violation::NotConflicted,
                "rebranch is not waiting for conflict resolution (current stage: " +
                    std::string(to_string(record.stage)) + ")");
  }
  require_clean(vcs, "Please resolve conflicts and commit the result before continuing");
  return record;
}

OperationRecord check_finish(const VcsBackend &vcs, const RecordStore &store) {
  require_repository(vcs);
  auto record = require_record(store);
  if (record.stage != Stage::Done) {
    throw Error(Violation::NotDone, "rebranch is not ready to finish (current stage: " +
                                        std::string(to_string(record.stage)) +
                                        "). Run rebranch --continue first");
  }
  if (const auto current = vcs.current_branch(); current != record.temp_branch) {
    throw Error(Violation::NotOnTempBranch, "expected to be on temp branch '" +
                                                record.temp_branch + "', but on '" + current +
                                                "'");
  }
  require_clean(vcs, "Please commit any remaining changes before finishing");
  return record;
}

OperationRecord check_abort(const VcsBackend &vcs, const RecordStore &store) {
  require_repository(vcs);
  return require_record(store);
}

} // namespace rebranch::preflight
