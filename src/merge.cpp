#include "rebranch/merge.hpp"

#include "rebranch/consts.hpp"
#include "rebranch/repo.hpp"

#include <set>

namespace rebranch::merge {

namespace {

std::vector<std::string> split_lines(std::string_view text) {
  std::vector<std::string> out;
  std::string cur;
  for (const char c : text) {
    if (c == '\n') {
      out.push_back(std::move(cur));
      cur.clear();
    } else if (c != '\r') {
      cur.push_back(c);
    }
  }
  if (!cur.empty()) {
    out.push_back(std::move(cur));
  }
  return out;
}

std::string lookup(const worktree::PathOidMap &m, const std::string &path) {
  const auto it = m.find(path);
  return it == m.end() ? std::string{} : it->second;
}

std::string blob_text(const Repository &repo, const std::string &hex) {
  if (hex.empty()) {
    return {};
  }
  const auto bytes = repo.read_blob(hex);
  return {bytes.begin(), bytes.end()};
}

} // namespace

std::string conflict_text(std::string_view ours, std::string_view theirs,
                          std::string_view theirs_label) {
  const auto a = split_lines(ours);
  const auto b = split_lines(theirs);

  // Trim the common prefix and suffix so only the differing region is marked.
  std::size_t prefix = 0;
  while (prefix < a.size() && prefix < b.size() && a[prefix] == b[prefix]) {
    ++prefix;
  }
  std::size_t suffix = 0;
  while (suffix < a.size() - prefix && suffix < b.size() - prefix &&
         a[a.size() - 1 - suffix] == b[b.size() - 1 - suffix]) {
    ++suffix;
  }

  std::string out;
  const auto emit = [&out](const std::string &line) {
    out += line;
    out.push_back(consts::kLF);
  };
  for (std::size_t i = 0; i < prefix; ++i) {
    emit(a[i]);
  }
  out += consts::kMarkerOurs;
  emit("HEAD");
  for (std::size_t i = prefix; i < a.size() - suffix; ++i) {
    emit(a[i]);
  }
  emit(std::string(consts::kMarkerSplit));
  for (std::size_t i = prefix; i < b.size() - suffix; ++i) {
    emit(b[i]);
  }
  out += consts::kMarkerTheirs;
  emit(std::string(theirs_label));
  for (std::size_t i = a.size() - suffix; i < a.size(); ++i) {
    emit(a[i]);
  }
  return out;
}

TreeMergeResult merge_trees(const Repository &repo, const worktree::PathOidMap &base,
                            const worktree::PathOidMap &ours, const worktree::PathOidMap &theirs,
                            std::string_view theirs_label) {
  std::set<std::string> all;
  for (const auto *m : {&base, &ours, &theirs}) {
    for (const auto &[p, _] : *m) {
      all.insert(p);
    }
  }

  TreeMergeResult result;
  for (const auto &path : all) {
    const std::string ob = lookup(base, path);
    const std::string oo = lookup(ours, path);
    const std::string ot = lookup(theirs, path);

    std::string take;
    if (oo == ot || ot == ob) {
      take = oo; // same on both sides, or untouched by theirs
    } else if (oo == ob) {
      take = ot; // only theirs changed it
    } else {
      result.conflicts.emplace(
          path, conflict_text(blob_text(repo, oo), blob_text(repo, ot), theirs_label));
      continue;
    }
    if (!take.empty()) {
      result.merged.emplace(path, std::move(take));
    }
  }
  return result;
}

} // namespace rebranch::merge
