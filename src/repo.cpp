#include "rebranch/repo.hpp"

#include "rebranch/consts.hpp"
#include "rebranch/fs.hpp"
#include "rebranch/index.hpp"
#include "rebranch/merge.hpp"
#include "rebranch/object_store.hpp"
#include "rebranch/refs.hpp"
#include "rebranch/status.hpp"
#include "rebranch/time.hpp"
#include "rebranch/util.hpp"
#include "rebranch/worktree.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace stdfs = std::filesystem;
namespace rfs   = rebranch::fs;

namespace {
[[nodiscard]] auto split_first(std::string_view path)
    -> std::pair<std::string, std::string> {
  const std::size_t pos = path.find('/');
  if (pos == std::string_view::npos) {
    return {std::string(path), std::string{}};
  }
  return {std::string(path.substr(0, pos)), std::string(path.substr(pos + 1))};
}
} // namespace

namespace rebranch {

Repository::Repository(stdfs::path root) : root_(std::move(root)) {}

auto Repository::discover(const stdfs::path& start) -> std::optional<Repository> {
  std::error_code ec;
  stdfs::path dir = stdfs::absolute(start, ec);
  if (ec) {
    return std::nullopt;
  }
  for (;;) {
    if (rfs::exists(dir / consts::kRepoDir)) {
      return Repository{dir};
    }
    const auto parent = dir.parent_path();
    if (parent == dir) {
      return std::nullopt;
    }
    dir = parent;
  }
}

auto Repository::is_initialized() const -> bool { return rfs::exists(repo_dir()); }

void Repository::require_initialized() const {
  if (!is_initialized()) {
    throw std::runtime_error("not a repository (missing " + repo_dir().string() + ")");
  }
}

void Repository::init(const Identity& identity) const {
  if (is_initialized()) {
    throw std::runtime_error("a repository already exists at: " + repo_dir().string());
  }

  std::error_code ec;
  stdfs::create_directories(objects_dir(), ec);
  if (ec) {
    throw std::runtime_error("create objects dir failed: " + ec.message());
  }
  stdfs::create_directories(heads_dir(), ec);
  if (ec) {
    throw std::runtime_error("create refs/heads dir failed: " + ec.message());
  }

  set_HEAD_symbolic(root_, heads_ref(consts::kDefaultBranch));
  save_identity(root_, identity);
}

// Modes

auto Repository::mode_to_ascii_octal(std::uint32_t mode) -> std::string {
  std::array<char, 16> buf{};
  std::snprintf(buf.data(), buf.size(), "%o", mode);
  return {buf.data()};
}

auto Repository::ascii_octal_to_mode(std::string_view s) -> std::uint32_t {
  std::uint32_t v = 0;
  for (const char c : s) {
    if (c < '0' || c > '7') {
      break;
    }
    v = static_cast<std::uint32_t>((v << 3U) + static_cast<unsigned>(c - '0'));
  }
  return v;
}

// Blobs

auto Repository::write_blob(std::span<const std::uint8_t> bytes) const -> std::string {
  const ObjectStore store{repo_dir()};
  return store.write(consts::kTypeBlob, bytes);
}

auto Repository::read_blob(std::string_view hex_oid) const -> std::vector<std::uint8_t> {
  const ObjectStore store{repo_dir()};
  auto [type, data] = store.read(hex_oid);
  if (type != consts::kTypeBlob) {
    throw std::runtime_error("object " + std::string(hex_oid) + " is not a blob");
  }
  return std::move(data);
}

// Trees (binary)

auto Repository::write_tree(const std::vector<TreeEntry>& entries_in) const -> std::string {
  auto entries = entries_in;
  std::ranges::sort(entries,
                    [](const TreeEntry& a, const TreeEntry& b) { return a.name < b.name; });

  std::string data;
  for (const auto& e : entries) {
    data.append(mode_to_ascii_octal(e.mode));
    data.push_back(consts::kSpace);
    data.append(e.name);
    data.push_back(consts::kNul);
    data.append(reinterpret_cast<const char*>(e.id.data()), consts::kOidRawLen);
  }

  const ObjectStore store{repo_dir()};
  return store.write(consts::kTypeTree, rfs::as_bytes(data));
}

auto Repository::read_tree(std::string_view hex_oid) const -> std::vector<TreeEntry> {
  const ObjectStore store{repo_dir()};
  const auto [type, data] = store.read(hex_oid);
  if (type != consts::kTypeTree) {
    throw std::runtime_error("object " + std::string(hex_oid) + " is not a tree");
  }

  std::vector<TreeEntry> out;
  auto p = data.begin();
  const auto end = data.end();

  while (p < end) {
    const auto q_space = std::find(p, end, static_cast<std::uint8_t>(consts::kSpace));
    if (q_space == end) {
      throw std::runtime_error("tree parse: expected space");
    }
    const std::uint32_t mode = ascii_octal_to_mode(std::string(p, q_space));

    p = q_space + 1;
    const auto q_nul = std::find(p, end, static_cast<std::uint8_t>(consts::kNul));
    if (q_nul == end) {
      throw std::runtime_error("tree parse: expected NUL");
    }
    std::string name(p, q_nul);
    p = q_nul + 1;

    if (static_cast<std::size_t>(end - p) < consts::kOidRawLen) {
      throw std::runtime_error("tree parse: truncated oid");
    }

    TreeEntry e{};
    e.mode = mode;
    e.name = std::move(name);
    std::memcpy(e.id.data(), &(*p), consts::kOidRawLen);
    p += static_cast<std::ptrdiff_t>(consts::kOidRawLen);

    out.push_back(std::move(e));
  }
  return out;
}

// Commits

auto Repository::write_commit(std::string_view tree_hex,
                              const std::vector<std::string>& parent_hexes,
                              std::string_view author_line,
                              std::string_view committer_line,
                              std::string_view message) const -> std::string {
  std::string txt;
  txt.append(consts::kTreePrefix).append(tree_hex).push_back(consts::kLF);
  for (const auto& p : parent_hexes) {
    txt.append(consts::kParentPrefix).append(p).push_back(consts::kLF);
  }
  txt.append(consts::kAuthorPrefix).append(author_line).push_back(consts::kLF);
  txt.append(consts::kCommitterPrefix).append(committer_line).push_back(consts::kLF);
  txt.push_back(consts::kLF);
  txt.append(message);

  const ObjectStore store{repo_dir()};
  return store.write(consts::kTypeCommit, rfs::as_bytes(txt));
}

auto Repository::read_commit(std::string_view commit_hex) const -> CommitInfo {
  const ObjectStore store{repo_dir()};
  const auto obj = store.read(commit_hex);
  if (obj.type != consts::kTypeCommit) {
    throw std::runtime_error("object " + std::string(commit_hex) + " is not a commit");
  }
  const std::string text(obj.data.begin(), obj.data.end());

  CommitInfo info{};
  std::size_t pos = 0;

  for (;;) {
    const std::size_t nl = text.find(consts::kLF, pos);
    const std::string line =
        (nl == std::string::npos) ? text.substr(pos) : text.substr(pos, nl - pos);

    if (line.empty()) {
      if (nl != std::string::npos) {
        info.message = text.substr(nl + 1);
      }
      break;
    }

    if (line.starts_with(consts::kTreePrefix)) {
      info.tree_hex = line.substr(consts::kTreePrefix.size(), consts::kOidHexLen);
    } else if (line.starts_with(consts::kParentPrefix)) {
      info.parents.push_back(line.substr(consts::kParentPrefix.size(), consts::kOidHexLen));
    } else if (line.starts_with(consts::kAuthorPrefix)) {
      info.author = line.substr(consts::kAuthorPrefix.size());
    } else if (line.starts_with(consts::kCommitterPrefix)) {
      info.committer = line.substr(consts::kCommitterPrefix.size());
    }

    if (nl == std::string::npos) {
      break;
    }
    pos = nl + 1;
  }

  if (!looks_hex40(info.tree_hex)) {
    throw std::runtime_error("commit " + std::string(commit_hex) + " has no tree");
  }
  return info;
}

auto Repository::is_commit_ancestor(std::string_view ancestor_hex,
                                    std::string_view descendant_hex) const -> bool {
  if (ancestor_hex == descendant_hex) {
    return true;
  }
  std::vector<std::string> stack{std::string(descendant_hex)};
  std::set<std::string> seen;
  while (!stack.empty()) {
    const auto cur = stack.back();
    stack.pop_back();
    if (!seen.insert(cur).second) {
      continue;
    }
    for (const auto& p : read_commit(cur).parents) {
      if (p == ancestor_hex) {
        return true;
      }
      stack.push_back(p);
    }
  }
  return false;
}

auto Repository::commit_tree_map(std::string_view commit_hex) const
    -> std::map<std::string, std::string> {
  return worktree::tree_to_map(*this, read_commit(commit_hex).tree_hex);
}

auto Repository::write_tree_from_index() const -> std::string {
  Index idx{root_};
  idx.load();

  const auto build = [&](const auto& self, const std::vector<IndexEntry>& group) -> std::string {
    std::map<std::string, std::vector<IndexEntry>> subdirs; // dirname -> child entries
    std::vector<TreeEntry> tree_entries;

    for (const auto& e : group) {
      auto [first, rest] = split_first(e.path);
      if (rest.empty()) {
        tree_entries.push_back(TreeEntry{.mode = e.mode, .name = std::move(first), .id = e.oid});
      } else {
        IndexEntry child = e;
        child.path = std::move(rest);
        subdirs[first].push_back(std::move(child));
      }
    }

    for (const auto& [dirname, child_entries] : subdirs) {
      TreeEntry te{.mode = consts::kModeTree, .name = dirname, .id = {}};
      if (!from_hex(self(self, child_entries), te.id)) {
        throw std::runtime_error("bad subtree hex oid");
      }
      tree_entries.push_back(std::move(te));
    }

    return write_tree(tree_entries);
  };

  return build(build, idx.entries());
}

auto Repository::commit_index(std::string_view message) const -> std::string {
  require_initialized();
  const auto branch_ref = head_symbolic_ref(root_);
  if (!branch_ref) {
    throw std::runtime_error("cannot commit: HEAD is detached");
  }

  const auto pick_head = repo_dir() / consts::kCherryPickHead;
  const bool picking = rfs::exists(pick_head);
  std::string author;
  if (picking) {
    const auto st = compute_status(*this);
    if (!st.unstaged.empty() || !st.untracked.empty()) {
      throw std::runtime_error("cannot commit: cherry-pick in progress, unresolved paths present");
    }
    // Resolved pick keeps the original authorship
    std::string picked = rfs::read_text(pick_head);
    strutil::rstrip_newlines(picked);
    author = read_commit(picked).author;
  }

  const std::string tree_hex = write_tree_from_index();
  std::vector<std::string> parents;
  if (const auto head = head_commit()) {
    parents.push_back(*head);
  }

  const std::string committer = timeutil::signature_now(load_identity(root_));
  const std::string commit_hex =
      write_commit(tree_hex, parents, author.empty() ? committer : author, committer, message);
  update_ref(root_, *branch_ref, commit_hex);

  if (picking) {
    rfs::remove_file(pick_head);
  }
  return commit_hex;
}

// Branches

auto Repository::current_branch() const -> std::optional<std::string> {
  const auto ref = head_symbolic_ref(root_);
  if (!ref || !ref->starts_with(consts::kHeadsRefPrefix)) {
    return std::nullopt;
  }
  return ref->substr(consts::kHeadsRefPrefix.size());
}

auto Repository::head_commit() const -> std::optional<std::string> {
  if (const auto ref = head_symbolic_ref(root_)) {
    const auto tip = read_ref(root_, *ref);
    if (tip && looks_hex40(*tip)) {
      return tip;
    }
    return std::nullopt;
  }
  auto head = read_HEAD(root_);
  if (head && looks_hex40(*head)) {
    return head;
  }
  return std::nullopt;
}

auto Repository::branch_tip(std::string_view branch) const -> std::optional<std::string> {
  if (!is_valid_branch_name(branch)) {
    return std::nullopt;
  }
  auto tip = read_ref(root_, heads_ref(branch));
  if (!tip || !looks_hex40(*tip)) {
    return std::nullopt;
  }
  return tip;
}

void Repository::create_branch(std::string_view branch, std::string_view commit_hex) const {
  require_initialized();
  if (!is_valid_branch_name(branch)) {
    throw std::runtime_error("invalid branch name: " + std::string(branch));
  }
  if (branch_tip(branch)) {
    throw std::runtime_error("branch already exists: " + std::string(branch));
  }
  (void)read_commit(commit_hex); // must name an existing commit
  update_ref(root_, heads_ref(branch), std::string(commit_hex));
}

void Repository::delete_branch(std::string_view branch) const {
  require_initialized();
  if (!branch_tip(branch)) {
    throw std::runtime_error("branch not found: " + std::string(branch));
  }
  if (current_branch() == branch) {
    throw std::runtime_error("cannot delete the checked-out branch: " + std::string(branch));
  }
  (void)delete_ref(root_, heads_ref(branch));
}

void Repository::rename_branch(std::string_view old_name, std::string_view new_name) const {
  require_initialized();
  const auto tip = branch_tip(old_name);
  if (!tip) {
    throw std::runtime_error("branch not found: " + std::string(old_name));
  }
  if (!is_valid_branch_name(new_name)) {
    throw std::runtime_error("invalid branch name: " + std::string(new_name));
  }
  if (branch_tip(new_name)) {
    throw std::runtime_error("branch already exists: " + std::string(new_name));
  }
  const bool checked_out = current_branch() == old_name;
  update_ref(root_, heads_ref(new_name), *tip);
  if (checked_out) {
    set_HEAD_symbolic(root_, heads_ref(new_name));
  }
  (void)delete_ref(root_, heads_ref(old_name));
}

void Repository::checkout(std::string_view branch) const {
  require_initialized();

  // Refuse to clobber unstaged edits (working tree vs index)
  const auto working_map = worktree::build_working_map(root_);
  const auto idx_map     = worktree::index_to_map(root_);
  {
    std::set<std::string> all;
    for (const auto& [p, _] : working_map) all.insert(p);
    for (const auto& [p, _] : idx_map)     all.insert(p);
    for (const auto& p : all) {
      const auto it_w = working_map.find(p);
      const auto it_i = idx_map.find(p);
      const std::string w = (it_w == working_map.end()) ? std::string{} : it_w->second;
      const std::string i = (it_i == idx_map.end())     ? std::string{} : it_i->second;
      if (w != i) {
        throw std::runtime_error("checkout aborted: unstaged changes present in " + p);
      }
    }
  }

  const auto tip = branch_tip(branch);
  if (!tip) {
    throw std::runtime_error("unknown branch: " + std::string(branch));
  }

  const auto snapshot = commit_tree_map(*tip);
  worktree::apply_snapshot(*this, snapshot);
  worktree::write_index_snapshot(*this, snapshot);
  set_HEAD_symbolic(root_, heads_ref(branch));
}

// ------- Cherry-pick -------

auto Repository::cherry_pick(std::string_view commit_hex) const -> PickResult {
  require_initialized();
  const auto branch_ref = head_symbolic_ref(root_);
  const auto head = head_commit();
  if (!branch_ref || !head) {
    throw std::runtime_error("cherry-pick needs a checked-out branch with commits");
  }
  if (has_marker(consts::kCherryPickHead)) {
    // A previous pick whose changes were discarded leaves only the marker
    if (!compute_status(*this).clean()) {
      throw std::runtime_error("a cherry-pick is already in progress");
    }
    (void)rfs::remove_file(repo_dir() / consts::kCherryPickHead);
  }

  const auto pick = read_commit(commit_hex);
  const auto base = pick.parents.empty() ? worktree::PathOidMap{}
                                         : commit_tree_map(pick.parents.front());
  const auto ours = commit_tree_map(*head);
  const auto theirs = worktree::tree_to_map(*this, pick.tree_hex);

  const std::string label = short_id(commit_hex) + " " + strutil::first_line(pick.message);
  auto outcome = merge::merge_trees(*this, base, ours, theirs, label);

  PickResult result;
  if (!outcome.clean()) {
    rfs::write_text_atomic(repo_dir() / consts::kCherryPickHead, std::string(commit_hex) + "\n");
    worktree::apply_snapshot(*this, outcome.merged);
    for (const auto& [path, text] : outcome.conflicts) {
      rfs::write_text_atomic(root_ / path, text);
      result.conflicts.push_back(path);
    }
    // Conflicted paths stay out of the index until the user adds them
    worktree::write_index_snapshot(*this, outcome.merged);
    return result;
  }

  worktree::apply_snapshot(*this, outcome.merged);
  worktree::write_index_snapshot(*this, outcome.merged);
  if (outcome.merged == ours) {
    return result; // already present on this branch
  }

  const std::string tree_hex = write_tree_from_index();
  const std::string committer = timeutil::signature_now(load_identity(root_));
  result.new_commit = write_commit(tree_hex, {*head}, pick.author, committer, pick.message);
  update_ref(root_, *branch_ref, result.new_commit);
  return result;
}

void Repository::reset_hard() const {
  require_initialized();
  worktree::PathOidMap snapshot;
  if (const auto head = head_commit()) {
    snapshot = commit_tree_map(*head);
  }
  worktree::apply_snapshot(*this, snapshot);
  worktree::write_index_snapshot(*this, snapshot);
  (void)rfs::remove_file(repo_dir() / consts::kCherryPickHead);
}

auto Repository::has_marker(std::string_view name) const -> bool {
  return rfs::exists(repo_dir() / name);
}

} // namespace rebranch
