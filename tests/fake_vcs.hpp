#pragma once
#include "rebranch/backend.hpp"
#include "rebranch/editor.hpp"
#include "rebranch/error.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <set>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

// In-memory commit graph standing in for a repository.
class FakeVcs final : public rebranch::VcsBackend {
public:
  explicit FakeVcs(std::filesystem::path metadata_dir) : dir_(std::move(metadata_dir)) {}

  // 40-hex id whose first seven characters are unique per n.
  static std::string make_id(int n) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%07x", n);
    return std::string(buf) + std::string(33, 'a');
  }

  std::string add_commit(std::vector<std::string> parents, std::string summary) {
    const std::string id = make_id(next_id_++);
    commits[id] = rebranch::CommitMeta{.id = id, .parents = std::move(parents),
                                       .summary = std::move(summary)};
    return id;
  }

  // Commit the user's resolution of the stopped pick.
  void resolve_pick() {
    pending = false;
    marker = false;
    branches[current] = add_commit({branches[current]}, "resolved");
  }

  // Throw the stopped pick's changes away by hand; the marker stays.
  void discard_pick() { pending = false; }

  void validate_repository() const override {
    if (invalid) {
      throw rebranch::Error(rebranch::Violation::InvalidRepository, "invalid repository");
    }
  }

  std::string current_branch() const override { return current; }

  bool branch_exists(std::string_view name) const override {
    return branches.contains(std::string(name));
  }

  std::optional<std::string> branch_tip(std::string_view name) const override {
    const auto it = branches.find(std::string(name));
    if (it == branches.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  rebranch::CommitMeta read_commit(std::string_view id) const override {
    const auto it = commits.find(std::string(id));
    if (it == commits.end()) {
      throw rebranch::Error(rebranch::ErrorKind::BackendFailure, "no commit " + std::string(id));
    }
    return it->second;
  }

  bool is_ancestor(std::string_view ancestor, std::string_view descendant) const override {
    std::vector<std::string> stack{std::string(descendant)};
    std::set<std::string> seen;
    while (!stack.empty()) {
      std::string id = stack.back();
      stack.pop_back();
      if (id == ancestor) {
        return true;
      }
      if (!seen.insert(id).second) {
        continue;
      }
      const auto &parents = commits.at(id).parents;
      stack.insert(stack.end(), parents.begin(), parents.end());
    }
    return false;
  }

  void create_branch(std::string_view name, std::string_view at_base) override {
    calls.push_back("create " + std::string(name));
    if (branch_exists(name)) {
      throw rebranch::Error(rebranch::ErrorKind::BackendFailure, "branch exists");
    }
    branches[std::string(name)] = branches.at(std::string(at_base));
  }

  void checkout(std::string_view name) override {
    calls.push_back("checkout " + std::string(name));
    if (fail_checkout || !branch_exists(name)) {
      throw rebranch::Error(rebranch::ErrorKind::BackendFailure, "checkout failed");
    }
    current = std::string(name);
  }

  rebranch::PickOutcome cherry_pick(std::string_view commit_id) override {
    const std::string id(commit_id);
    calls.push_back("pick " + id);
    if (broken.contains(id)) {
      throw rebranch::Error(rebranch::ErrorKind::BackendFailure, "cannot read " + id);
    }
    if (conflicting.contains(id)) {
      pending = true;
      marker = true;
      return rebranch::PickOutcome::Conflict;
    }
    branches[current] = add_commit({branches[current]}, commits.at(id).summary);
    picked.push_back(id);
    return rebranch::PickOutcome::Applied;
  }

  void cancel_pick() override {
    calls.push_back("cancel");
    pending = false;
    marker = false;
  }

  void delete_branch(std::string_view name) override {
    calls.push_back("delete " + std::string(name));
    if (current == name || fail_delete || !branch_exists(name)) {
      throw rebranch::Error(rebranch::ErrorKind::BackendFailure,
                            "cannot delete " + std::string(name));
    }
    branches.erase(std::string(name));
  }

  void rename_branch(std::string_view old_name, std::string_view new_name) override {
    calls.push_back("rename " + std::string(old_name) + " " + std::string(new_name));
    auto node = branches.extract(std::string(old_name));
    node.key() = std::string(new_name);
    branches.insert(std::move(node));
    if (current == old_name) {
      current = std::string(new_name);
    }
  }

  bool is_working_tree_clean() const override { return clean && !pending; }

  rebranch::ForeignOperation detect_foreign_operation() const override {
    if (!foreign.in_progress && marker) {
      return rebranch::ForeignOperation{.in_progress = true, .kind = "cherry-pick"};
    }
    return foreign;
  }

  std::filesystem::path metadata_dir() const override { return dir_; }

  std::map<std::string, rebranch::CommitMeta> commits;
  std::map<std::string, std::string> branches;
  std::string current;
  std::set<std::string> conflicting;
  std::set<std::string> broken; // picks that fail outright
  std::vector<std::string> picked; // original ids applied cleanly, in order
  std::vector<std::string> calls;
  rebranch::ForeignOperation foreign;
  bool invalid = false;
  bool clean = true;
  bool pending = false; // stopped pick with unresolved changes
  bool marker = false;  // stopped pick marker present
  bool fail_checkout = false;
  bool fail_delete = false;

private:
  std::filesystem::path dir_;
  int next_id_ = 1;
};

// Editor that rewrites the listing with a function instead of a human.
class ScriptedEditor final : public rebranch::Editor {
public:
  using Script = std::function<std::string(const std::string &)>;

  explicit ScriptedEditor(Script script = [](const std::string &text) { return text; })
      : script_(std::move(script)) {}

  void launch(const std::filesystem::path &path) override {
    ++launches;
    std::ostringstream ss;
    ss << std::ifstream(path, std::ios::binary).rdbuf();
    seen = ss.str();
    if (fail) {
      throw rebranch::Error(rebranch::ErrorKind::EditorFailure, "editor 'fake' exited with status 1");
    }
    std::ofstream(path, std::ios::binary | std::ios::trunc) << script_(seen);
  }

  std::string seen; // listing as the editor received it
  int launches = 0;
  bool fail = false;

private:
  Script script_;
};
