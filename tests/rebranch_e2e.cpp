#include "rebranch/consts.hpp"
#include "rebranch/error.hpp"
#include "rebranch/index.hpp"
#include "rebranch/record.hpp"
#include "rebranch/repo.hpp"
#include "rebranch/repo_backend.hpp"
#include "rebranch/status.hpp"
#include "rebranch/workflow.hpp"

#include "fake_vcs.hpp"
#include "test_support.hpp"

#include <iostream>
#include <sstream>
#include <string>

struct History {
  std::string c0, m1, f1, f2, f3;
};

// master: c0 -> m1 (edits a.txt line 2)
// feature: c0 -> f1 (adds b.txt) -> f2 (edits a.txt line 2) -> f3 (adds c.txt)
static History build_history(const rebranch::Repository &repo) {
  repo.init(rebranch::Identity{.name = "User", .email = "u@example.com"});
  History h;
  h.c0 = commit_file(repo, "a.txt", "1\n2\n3\n", "c0");
  repo.create_branch("feature", h.c0);
  repo.checkout("feature");
  h.f1 = commit_file(repo, "b.txt", "bee\n", "f1 add b");
  h.f2 = commit_file(repo, "a.txt", "1\nfeature\n3\n", "f2 edit a");
  h.f3 = commit_file(repo, "c.txt", "sea\n", "f3 add c");
  repo.checkout("master");
  h.m1 = commit_file(repo, "a.txt", "1\nmaster\n3\n", "m1 edit a");
  repo.checkout("feature");
  return h;
}

static bool conflict_resolve_finish(const fs::path &root) {
  rebranch::Repository repo{root};
  const History h = build_history(repo);

  rebranch::RepositoryBackend vcs{repo};
  const rebranch::RecordStore store{vcs.metadata_dir()};
  ScriptedEditor editor;
  std::ostringstream out, err;
  rebranch::Workflow wf{vcs, store, editor, out, err};

  try {
    wf.start("master");
    std::cerr << "expected a conflict on f2\n";
    return false;
  } catch (const rebranch::Error &e) {
    if (e.kind() != rebranch::ErrorKind::ConflictDetected || e.commit() != h.f2) {
      std::cerr << "unexpected error: " << e.what() << "\n";
      return false;
    }
  }
  if (!repo.has_marker("CHERRY_PICK_HEAD") || !contains(read_file(root / "a.txt"), "<<<<<<< HEAD")) {
    std::cerr << "work tree should hold the stopped pick\n";
    return false;
  }
  const auto temp = store.load().temp_branch;
  if (repo.current_branch() != temp || store.load().stage != rebranch::Stage::Conflicted) {
    std::cerr << "should be stopped on the temp branch\n";
    return false;
  }

  // Resolve, stage and commit like a user would
  write_file(root / "a.txt", "1\nmaster and feature\n3\n");
  rebranch::Index idx{root};
  idx.load();
  idx.add_path(root, "a.txt", repo, rebranch::consts::kModeFile);
  idx.save();
  (void)repo.commit_index("f2 edit a\n");

  wf.resume();
  if (store.load().stage != rebranch::Stage::Done) {
    std::cerr << "continue should finish the plan\n";
    return false;
  }

  wf.finish();
  if (store.exists() || repo.branch_tip(temp) || repo.current_branch() != "feature") {
    std::cerr << "finish should leave feature checked out and nothing else\n";
    return false;
  }
  const auto tip = repo.head_commit().value();
  if (tip == h.f3 || !repo.is_commit_ancestor(h.m1, tip) || repo.is_commit_ancestor(h.f1, tip)) {
    std::cerr << "feature should be rebuilt on top of master\n";
    return false;
  }
  if (read_file(root / "a.txt") != "1\nmaster and feature\n3\n" || read_file(root / "b.txt") != "bee\n" ||
      read_file(root / "c.txt") != "sea\n") {
    std::cerr << "final work tree is wrong\n";
    return false;
  }
  // Three replayed commits: f1, the resolution of f2, f3
  auto info = repo.read_commit(tip);
  int count = 0;
  std::string cur = tip;
  while (cur != h.m1) {
    info = repo.read_commit(cur);
    cur = info.parents.at(0);
    ++count;
  }
  if (count != 3) {
    std::cerr << "expected 3 commits over master, got " << count << "\n";
    return false;
  }
  return rebranch::compute_status(repo).clean();
}

static bool abort_restores_everything(const fs::path &root) {
  rebranch::Repository repo{root};
  const History h = build_history(repo);

  rebranch::RepositoryBackend vcs{repo};
  const rebranch::RecordStore store{vcs.metadata_dir()};
  ScriptedEditor editor;
  std::ostringstream out, err;
  rebranch::Workflow wf{vcs, store, editor, out, err};

  try {
    wf.start("master");
  } catch (const rebranch::Error &e) {
    if (e.kind() != rebranch::ErrorKind::ConflictDetected) {
      std::cerr << "unexpected error: " << e.what() << "\n";
      return false;
    }
  }
  const auto temp = store.load().temp_branch;

  // Starting again is refused while the first one is open
  try {
    wf.start("master");
    std::cerr << "second start should be refused\n";
    return false;
  } catch (const rebranch::Error &e) {
    if (e.violation() != rebranch::Violation::AlreadyInProgress) {
      std::cerr << "expected AlreadyInProgress: " << e.what() << "\n";
      return false;
    }
  }

  wf.abort();
  if (store.exists() || repo.branch_tip(temp) || repo.has_marker("CHERRY_PICK_HEAD")) {
    std::cerr << "abort should remove record, temp branch and pick marker\n";
    return false;
  }
  if (repo.current_branch() != "feature" || repo.head_commit() != h.f3 ||
      repo.branch_tip("master") != h.m1) {
    std::cerr << "abort should leave branches exactly as before\n";
    return false;
  }
  if (read_file(root / "a.txt") != "1\nfeature\n3\n" || !rebranch::compute_status(repo).clean()) {
    std::cerr << "abort should restore the feature work tree\n";
    return false;
  }
  return true;
}

static bool drop_avoids_conflict(const fs::path &root) {
  rebranch::Repository repo{root};
  const History h = build_history(repo);

  rebranch::RepositoryBackend vcs{repo};
  const rebranch::RecordStore store{vcs.metadata_dir()};
  const std::string f2_line = "pick " + h.f2.substr(0, 7);
  ScriptedEditor editor{[&](const std::string &text) {
    std::string edited = text;
    edited.replace(edited.find(f2_line), 4, "drop");
    return edited;
  }};
  std::ostringstream out, err;
  rebranch::Workflow wf{vcs, store, editor, out, err};

  wf.start("master");
  wf.finish();
  if (repo.current_branch() != "feature" || read_file(root / "a.txt") != "1\nmaster\n3\n" ||
      !fs::exists(root / "b.txt") || !fs::exists(root / "c.txt")) {
    std::cerr << "dropping f2 should keep master's a.txt\n";
    return false;
  }
  if (fs::exists(vcs.metadata_dir() / "REBRANCH_PICK")) {
    std::cerr << "pick file left behind\n";
    return false;
  }

  // Everything is on master now except the replayed commits
  try {
    wf.start("feature");
    std::cerr << "rebranching onto the current branch should fail\n";
    return false;
  } catch (const rebranch::Error &e) {
    if (e.violation() != rebranch::Violation::SameAsBase) {
      std::cerr << "expected SameAsBase: " << e.what() << "\n";
      return false;
    }
  }
  return true;
}

// f2 is the last commit to apply and its conflict is resolved by keeping master's side
static bool discarded_resolution_leaves_no_marker(const fs::path &root) {
  rebranch::Repository repo{root};
  const History h = build_history(repo);

  rebranch::RepositoryBackend vcs{repo};
  const rebranch::RecordStore store{vcs.metadata_dir()};
  const std::string f3_line = "pick " + h.f3.substr(0, 7);
  ScriptedEditor editor{[&](const std::string &text) {
    std::string edited = text;
    edited.replace(edited.find(f3_line), 4, "drop");
    return edited;
  }};
  std::ostringstream out, err;
  rebranch::Workflow wf{vcs, store, editor, out, err};

  try {
    wf.start("master");
    std::cerr << "expected a conflict on f2\n";
    return false;
  } catch (const rebranch::Error &e) {
    if (e.kind() != rebranch::ErrorKind::ConflictDetected) {
      std::cerr << "unexpected error: " << e.what() << "\n";
      return false;
    }
  }

  write_file(root / "a.txt", "1\nmaster\n3\n");
  rebranch::Index idx{root};
  idx.load();
  idx.add_path(root, "a.txt", repo, rebranch::consts::kModeFile);
  idx.save();
  if (!rebranch::compute_status(repo).clean()) {
    std::cerr << "taking master's side should leave a clean tree\n";
    return false;
  }

  wf.resume();
  wf.finish();
  if (repo.has_marker("CHERRY_PICK_HEAD") || vcs.detect_foreign_operation().in_progress) {
    std::cerr << "a discarded pick must not leave its marker behind\n";
    return false;
  }
  if (read_file(root / "a.txt") != "1\nmaster\n3\n" || !fs::exists(root / "b.txt") ||
      fs::exists(root / "c.txt")) {
    std::cerr << "feature should be master plus f1 only\n";
    return false;
  }

  // The next rebranch starts normally
  repo.checkout("master");
  (void)commit_file(repo, "d.txt", "dee\n", "m2 add d");
  repo.checkout("feature");
  wf.start("master");
  if (store.load().stage != rebranch::Stage::Done) {
    std::cerr << "second rebranch should run to done\n";
    return false;
  }
  wf.finish();
  return true;
}

int main() {
  const fs::path root = make_temp_root("e2e");
  bool ok = true;
  try {
    ok = conflict_resolve_finish(root / "conflict") && ok;
    ok = abort_restores_everything(root / "abort") && ok;
    ok = drop_avoids_conflict(root / "drop") && ok;
    ok = discarded_resolution_leaves_no_marker(root / "discard") && ok;
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    ok = false;
  }
  std::error_code ec;
  fs::remove_all(root, ec);
  if (!ok) {
    return 1;
  }
  std::cout << "rebranch end-to-end OK\n";
  return 0;
}
