#include "rebranch/merge.hpp"

#include "rebranch/fs.hpp"
#include "rebranch/repo.hpp"

#include "test_support.hpp"

#include <iostream>
#include <string>

int main() {
  const fs::path root = make_temp_root("merge_trees");
  try {
    rebranch::Repository repo{root};
    repo.init(rebranch::Identity{.name = "User", .email = "u@example.com"});

    const auto blob = [&repo](std::string_view text) {
      return repo.write_blob(rebranch::fs::as_bytes(text));
    };
    const std::string v1 = blob("one\n");
    const std::string v2 = blob("two\n");
    const std::string v3 = blob("three\n");

    // path        base  ours  theirs   expectation
    // same        v1    v1    v1       v1
    // ours_only   v1    v2    v1       v2
    // theirs_only v1    v1    v2       v2
    // both_same   v1    v2    v2       v2
    // added       -     -     v3       v3
    // deleted     v1    v1    -        gone
    // clash       v1    v2    v3       conflict
    // del_mod     v1    -     v2       conflict
    const rebranch::worktree::PathOidMap base{{"same", v1},      {"ours_only", v1},
                                              {"theirs_only", v1}, {"both_same", v1},
                                              {"deleted", v1},     {"clash", v1},
                                              {"del_mod", v1}};
    const rebranch::worktree::PathOidMap ours{{"same", v1},      {"ours_only", v2},
                                              {"theirs_only", v1}, {"both_same", v2},
                                              {"deleted", v1},     {"clash", v2}};
    const rebranch::worktree::PathOidMap theirs{{"same", v1},      {"ours_only", v1},
                                                {"theirs_only", v2}, {"both_same", v2},
                                                {"added", v3},       {"clash", v3},
                                                {"del_mod", v2}};

    const auto res = rebranch::merge::merge_trees(repo, base, ours, theirs, "abc1234 change");
    const rebranch::worktree::PathOidMap want{{"same", v1},      {"ours_only", v2},
                                              {"theirs_only", v2}, {"both_same", v2},
                                              {"added", v3}};
    if (res.merged != want) {
      std::cerr << "merged paths differ:\n";
      for (const auto &[p, h] : res.merged) {
        std::cerr << "  " << p << " " << h << "\n";
      }
      return 1;
    }
    if (res.clean() || res.conflicts.size() != 2 || !res.conflicts.contains("clash") ||
        !res.conflicts.contains("del_mod")) {
      std::cerr << "expected conflicts on clash and del_mod\n";
      return 1;
    }
    if (res.conflicts.at("clash") != "<<<<<<< HEAD\ntwo\n=======\nthree\n>>>>>>> abc1234 change\n") {
      std::cerr << "unexpected clash text:\n" << res.conflicts.at("clash");
      return 1;
    }
    if (res.conflicts.at("del_mod") != "<<<<<<< HEAD\n=======\ntwo\n>>>>>>> abc1234 change\n") {
      std::cerr << "unexpected del_mod text:\n" << res.conflicts.at("del_mod");
      return 1;
    }

    // Only the differing region is wrapped in markers
    {
      const auto text = rebranch::merge::conflict_text("a\nb\nc\nd\n", "a\nx\ny\nd\n", "t");
      if (text != "a\n<<<<<<< HEAD\nb\nc\n=======\nx\ny\n>>>>>>> t\nd\n") {
        std::cerr << "hunk markers wrong:\n" << text;
        return 1;
      }
    }
    {
      // Inserted line at the end; no common suffix
      const auto text = rebranch::merge::conflict_text("a\n", "a\nb\n", "t");
      if (text != "a\n<<<<<<< HEAD\n=======\nb\n>>>>>>> t\n") {
        std::cerr << "insert markers wrong:\n" << text;
        return 1;
      }
    }

    std::cout << "merge trees OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }
  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
