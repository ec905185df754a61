#include "rebranch/workflow.hpp"

#include "rebranch/commit_range.hpp"
#include "rebranch/consts.hpp"
#include "rebranch/error.hpp"
#include "rebranch/fs.hpp"
#include "rebranch/preflight.hpp"
#include "rebranch/selection.hpp"
#include "rebranch/util.hpp"

#include <ostream>

namespace rebranch {

Workflow::Workflow(VcsBackend &vcs, const RecordStore &store, Editor &editor, std::ostream &out,
                   std::ostream &err)
    : vcs_(vcs), store_(store), editor_(editor), out_(out), err_(err),
      clock_([] { return std::time(nullptr); }) {}

auto Workflow::pick_file() const -> std::filesystem::path {
  return vcs_.metadata_dir() / consts::kPickFile;
}

void Workflow::start(std::string_view base_branch) {
  preflight::check_start(vcs_, store_, base_branch);

  const std::string source = vcs_.current_branch();
  const auto candidates = commits_unique_to(vcs_, base_branch, source);
  if (candidates.empty()) {
    throw Error(Violation::NothingToRebranch, "no commits to rebranch: '" + source +
                                                  "' has no commits that are not on '" +
                                                  std::string(base_branch) + "'");
  }

  out_ << "Found " << candidates.size() << " commits to rebranch from " << source << " onto "
       << base_branch << "\n";
  for (std::size_t i = 0; i < candidates.size(); ++i) {
    out_ << "  " << i + 1 << ". " << short_id(candidates[i].id) << " " << candidates[i].summary
         << "\n";
  }

  auto plan = select_commits(candidates);
  std::size_t picked = 0;
  for (const auto &e : plan) {
    picked += e.action == Action::Apply ? 1 : 0;
  }
  out_ << "\nSelected " << picked << " commits to apply\n";

  const std::string temp = make_temp_branch_name();
  vcs_.create_branch(temp, base_branch);
  try {
    vcs_.checkout(temp);
  } catch (const Error &) {
    vcs_.delete_branch(temp);
    throw;
  }

  OperationRecord record{.source_branch = source,
                         .base_branch = std::string(base_branch),
                         .temp_branch = temp,
                         .plan = std::move(plan),
                         .cursor = 0,
                         .stage = Stage::Picking};
  store_.save(record);
  apply_plan(record);
}

void Workflow::resume() {
  auto record = preflight::check_continue(vcs_, store_);

  // Resolving by discarding the change leaves the pick marker on a clean tree
  if (vcs_.detect_foreign_operation().kind == consts::kPickOperation) {
    vcs_.cancel_pick();
  }

  // The conflicted entry is taken as resolved by whatever the user committed.
  out_ << "Continuing after " << short_id(record.plan[record.cursor].id) << " "
       << record.plan[record.cursor].summary << "\n";
  record.cursor += 1;
  record.stage = Stage::Picking;
  store_.save(record);
  apply_plan(record);
}

void Workflow::finish() {
  const auto record = preflight::check_finish(vcs_, store_);

  // A previous --done may have stopped between the delete and the rename
  if (vcs_.branch_exists(record.source_branch)) {
    vcs_.delete_branch(record.source_branch);
  }
  vcs_.rename_branch(record.temp_branch, record.source_branch);
  store_.clear();

  out_ << "Successfully rebranched " << record.source_branch << " onto " << record.base_branch
       << "\n";
}

void Workflow::abort() {
  const auto record = preflight::check_abort(vcs_, store_);

  const std::string current = vcs_.current_branch();
  if (current == record.temp_branch) {
    vcs_.cancel_pick();
  }
  if (current != record.source_branch) {
    vcs_.checkout(record.source_branch);
  }

  if (vcs_.branch_exists(record.temp_branch)) {
    try {
      vcs_.delete_branch(record.temp_branch);
    } catch (const Error &e) {
      err_ << "warning: failed to delete temp branch " << record.temp_branch << ": " << e.what()
           << "\n";
    }
  }
  store_.clear();

  out_ << "Rebranch aborted\n";
}

auto Workflow::select_commits(const std::vector<CommitEntry> &candidates)
    -> std::vector<CommitEntry> {
  const auto path = pick_file();
  fs::write_text_atomic(path, selection::render(candidates));

  out_ << "\nEdit the commit list and save to continue...\n";
  out_.flush();

  std::vector<CommitEntry> plan;
  try {
    editor_.launch(path);
    plan = selection::parse(fs::read_text(path), candidates);
  } catch (const std::exception &) {
    (void)fs::remove_file(path);
    throw;
  }
  (void)fs::remove_file(path);
  return plan;
}

auto Workflow::make_temp_branch_name() const -> std::string {
  const std::string stem = std::string(consts::kTempBranchPrefix) + std::to_string(clock_());
  std::string name = stem;
  for (int n = 2; vcs_.branch_exists(name); ++n) {
    name = stem + "-" + std::to_string(n);
  }
  return name;
}

void Workflow::apply_plan(OperationRecord &record) {
  while (record.cursor < record.plan.size()) {
    const auto &entry = record.plan[record.cursor];
    if (entry.action == Action::Apply) {
      if (vcs_.cherry_pick(entry.id) == PickOutcome::Conflict) {
        record.stage = Stage::Conflicted;
        store_.save(record);
        throw Error(ErrorKind::ConflictDetected,
                    "conflict during cherry-pick of " + short_id(entry.id) + " " + entry.summary +
                        "\nResolve the conflicts, commit the result and run: rebranch --continue\n"
                        "Or cancel with: rebranch --abort")
            .for_commit(entry.id);
      }
      out_ << "Applied " << short_id(entry.id) << " " << entry.summary << "\n";
    } else {
      out_ << "Dropped " << short_id(entry.id) << " " << entry.summary << "\n";
    }
    record.cursor += 1;
    store_.save(record);
  }

  record.stage = Stage::Done;
  store_.save(record);
  out_ << "Successfully applied " << record.applied_count() << " commits to "
       << record.temp_branch << "\n";
  out_ << "Review the new branch history and run: rebranch --done\n";
}

} // namespace rebranch
