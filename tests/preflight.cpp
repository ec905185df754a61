#include "rebranch/preflight.hpp"

#include "rebranch/error.hpp"

#include "fake_vcs.hpp"
#include "test_support.hpp"

#include <iostream>
#include <string>

using rebranch::Violation;

// Returns the violation raised by fn, or Violation::None if it passed.
template <typename Fn> static Violation violation_of(Fn &&fn) {
  try {
    fn();
  } catch (const rebranch::Error &e) {
    if (e.kind() != rebranch::ErrorKind::ValidationFailure) {
      std::cerr << "  unexpected " << rebranch::to_string(e.kind()) << ": " << e.what() << "\n";
      return Violation::None;
    }
    return e.violation();
  }
  return Violation::None;
}

int main() {
  const fs::path dir = make_temp_root("preflight");
  try {
    FakeVcs vcs{dir};
    const std::string c0 = vcs.add_commit({}, "c0");
    const std::string f1 = vcs.add_commit({c0}, "f1");
    vcs.branches = {{"master", c0}, {"feature", f1}};
    vcs.current = "feature";
    const rebranch::RecordStore store{dir};

    const auto start = [&](std::string_view base) {
      return violation_of([&] { rebranch::preflight::check_start(vcs, store, base); });
    };

    if (const auto v = start("master"); v != Violation::None) {
      std::cerr << "clean start should pass, got " << rebranch::to_string(v) << "\n";
      return 1;
    }

    vcs.invalid = true;
    if (start("master") != Violation::InvalidRepository) {
      std::cerr << "expected InvalidRepository\n";
      return 1;
    }
    vcs.invalid = false;

    vcs.foreign = rebranch::ForeignOperation{.in_progress = true, .kind = "merge"};
    try {
      rebranch::preflight::check_start(vcs, store, "master");
      std::cerr << "foreign operation should block start\n";
      return 1;
    } catch (const rebranch::Error &e) {
      if (e.violation() != Violation::ForeignOperation || !contains(e.what(), "merge")) {
        std::cerr << "expected ForeignOperation naming merge: " << e.what() << "\n";
        return 1;
      }
    }
    vcs.foreign = {};

    vcs.clean = false;
    if (start("master") != Violation::DirtyWorkingTree) {
      std::cerr << "expected DirtyWorkingTree\n";
      return 1;
    }
    vcs.clean = true;

    if (start("nope") != Violation::BaseBranchMissing) {
      std::cerr << "expected BaseBranchMissing\n";
      return 1;
    }
    vcs.current = "master";
    if (start("master") != Violation::SameAsBase) {
      std::cerr << "expected SameAsBase\n";
      return 1;
    }
    vcs.current = "feature";

    // Nothing in progress: continue, finish and abort refuse
    const auto cont = [&] { (void)rebranch::preflight::check_continue(vcs, store); };
    const auto fin = [&] { (void)rebranch::preflight::check_finish(vcs, store); };
    const auto abrt = [&] { (void)rebranch::preflight::check_abort(vcs, store); };
    if (violation_of(cont) != Violation::NotInProgress ||
        violation_of(fin) != Violation::NotInProgress ||
        violation_of(abrt) != Violation::NotInProgress) {
      std::cerr << "expected NotInProgress without a record\n";
      return 1;
    }

    // A record in progress blocks a new start, even before other checks
    rebranch::OperationRecord rec{
        .source_branch = "feature",
        .base_branch = "master",
        .temp_branch = "rebranch-temp-1",
        .plan = {rebranch::CommitEntry{.id = f1, .summary = "f1", .action = rebranch::Action::Apply}},
        .cursor = 0,
        .stage = rebranch::Stage::Picking};
    store.save(rec);
    vcs.clean = false;
    if (start("master") != Violation::AlreadyInProgress) {
      std::cerr << "expected AlreadyInProgress\n";
      return 1;
    }
    vcs.clean = true;

    // Stage checks
    if (violation_of(cont) != Violation::NotConflicted || violation_of(fin) != Violation::NotDone) {
      std::cerr << "picking stage should refuse continue and finish\n";
      return 1;
    }
    if (violation_of(abrt) != Violation::None) {
      std::cerr << "abort is allowed from any stage\n";
      return 1;
    }

    rec.stage = rebranch::Stage::Conflicted;
    store.save(rec);
    vcs.clean = false;
    if (violation_of(cont) != Violation::DirtyWorkingTree) {
      std::cerr << "continue needs a clean tree\n";
      return 1;
    }
    vcs.clean = true;
    if (violation_of(cont) != Violation::None) {
      std::cerr << "continue should pass once resolved\n";
      return 1;
    }
    if (rebranch::preflight::check_continue(vcs, store).temp_branch != "rebranch-temp-1") {
      std::cerr << "check_continue should return the record\n";
      return 1;
    }

    rec.stage = rebranch::Stage::Done;
    rec.cursor = 1;
    store.save(rec);
    if (violation_of(fin) != Violation::NotOnTempBranch) {
      std::cerr << "finish needs the temp branch checked out\n";
      return 1;
    }
    vcs.branches["rebranch-temp-1"] = f1;
    vcs.current = "rebranch-temp-1";
    if (violation_of(fin) != Violation::None) {
      std::cerr << "finish should pass on the temp branch\n";
      return 1;
    }
    vcs.clean = false;
    if (violation_of(fin) != Violation::DirtyWorkingTree) {
      std::cerr << "finish needs a clean tree\n";
      return 1;
    }

    std::cout << "preflight OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(dir);
    return 1;
  }
  std::error_code ec;
  fs::remove_all(dir, ec);
  return 0;
}
