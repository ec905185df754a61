#include "rebranch/worktree.hpp"

#include "rebranch/consts.hpp"
#include "rebranch/fs.hpp"
#include "rebranch/index.hpp"
#include "rebranch/repo.hpp"
#include "rebranch/util.hpp"

#include <filesystem>

namespace rebranch::worktree {

void enumerate_paths(const std::filesystem::path &root, std::set<std::string> &out_paths) {
  for (auto it = std::filesystem::recursive_directory_iterator(root);
       it != std::filesystem::recursive_directory_iterator(); ++it) {
    const auto &p = it->path();
    if (p.filename() == consts::kRepoDir) {
      it.disable_recursion_pending();
      continue;
    }
    if (!it->is_regular_file()) {
      continue;
    }
    out_paths.insert(std::filesystem::relative(p, root).generic_string());
  }
}

PathOidMap build_working_map(const std::filesystem::path &root) {
  PathOidMap m;
  std::set<std::string> paths;
  enumerate_paths(root, paths);
  for (const auto &rel : paths) {
    m[rel] = compute_blob_hex_oid(fs::read_file(root / rel));
  }
  return m;
}

PathOidMap index_to_map(const std::filesystem::path &root) {
  Index idx{root};
  idx.load();
  return idx.as_path_oid_map();
}

static void tree_to_map_impl(const Repository &repo, const std::string &tree_hex,
                             const std::string &prefix, PathOidMap &out) {
  for (const auto &e : repo.read_tree(tree_hex)) {
    if (e.mode == consts::kModeTree) {
      tree_to_map_impl(repo, to_hex(e.id), prefix + e.name + "/", out);
    } else {
      out[prefix + e.name] = to_hex(e.id);
    }
  }
}

PathOidMap tree_to_map(const Repository &repo, const std::string &tree_hex) {
  PathOidMap m;
  tree_to_map_impl(repo, tree_hex, "", m);
  return m;
}

void apply_snapshot(const Repository &repo, const PathOidMap &snapshot) {
  const auto &root = repo.root();
  std::set<std::string> working_paths;
  enumerate_paths(root, working_paths);
  for (const auto &p : working_paths) {
    if (!snapshot.contains(p)) {
      fs::remove_file(root / p);
    }
  }
  const auto current = build_working_map(root);
  for (const auto &[path, hex] : snapshot) {
    if (const auto it = current.find(path); it != current.end() && it->second == hex) {
      continue;
    }
    fs::write_file_atomic(root / path, repo.read_blob(hex));
  }
}

void write_index_snapshot(const Repository &repo, const PathOidMap &snapshot) {
  Index idx{repo.root()};
  idx.assign(snapshot);
  idx.save();
}

} // namespace rebranch::worktree
