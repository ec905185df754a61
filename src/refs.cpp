#include "rebranch/refs.hpp"

#include "rebranch/consts.hpp"
#include "rebranch/fs.hpp"
#include "rebranch/util.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace rebranch {

static std::filesystem::path repo_dir(const std::filesystem::path &root) {
  return root / consts::kRepoDir;
}

static std::filesystem::path head_file(const std::filesystem::path &root) {
  return repo_dir(root) / consts::kHeadFile;
}

static std::filesystem::path ref_path(const std::filesystem::path &root,
                                      const std::string &refname) {
  return repo_dir(root) / refname;
}

std::string heads_ref(std::string_view branch) {
  return std::string(consts::kHeadsRefPrefix) + std::string(branch);
}

bool is_valid_branch_name(std::string_view branch) {
  if (branch.empty() || branch.front() == '-' || branch.front() == '.' ||
      branch.front() == '/' || branch.back() == '/' ||
      branch.find("..") != std::string_view::npos || branch.find("//") != std::string_view::npos) {
    return false;
  }
  return std::ranges::none_of(branch, [](char c) {
    const auto uc = static_cast<unsigned char>(c);
    return std::isspace(uc) != 0 || std::iscntrl(uc) != 0 || c == '\\' ||
           c == '~' || c == '^' || c == ':' || c == '?' || c == '*' || c == '[';
  });
}

std::optional<std::string> read_HEAD(const std::filesystem::path &repo_root) {
  const auto p = head_file(repo_root);
  if (!fs::exists(p)) {
    return std::nullopt;
  }
  std::string s = fs::read_text(p);
  strutil::rstrip_newlines(s);
  return s;
}

std::optional<std::string> head_symbolic_ref(const std::filesystem::path &repo_root) {
  const auto head = read_HEAD(repo_root);
  if (!head || !head->starts_with(consts::kRefPrefix)) {
    return std::nullopt;
  }
  return head->substr(consts::kRefPrefix.size());
}

void set_HEAD_symbolic(const std::filesystem::path &repo_root, const std::string &refname) {
  fs::write_text_atomic(head_file(repo_root), std::string(consts::kRefPrefix) + refname + "\n");
}

std::optional<std::string> read_ref(const std::filesystem::path &repo_root,
                                    const std::string &refname) {
  const auto p = ref_path(repo_root, refname);
  std::error_code ec;
  // "refs/heads/feature" may be the directory of "feature/x"
  if (!std::filesystem::is_regular_file(p, ec)) {
    return std::nullopt;
  }
  std::string s = fs::read_text(p);
  strutil::rstrip_newlines(s);
  return s;
}

void update_ref(const std::filesystem::path &repo_root, const std::string &refname,
                const std::string &hex_oid) {
  fs::write_text_atomic(ref_path(repo_root, refname), hex_oid + "\n");
}

bool delete_ref(const std::filesystem::path &repo_root, const std::string &refname) {
  const auto p = ref_path(repo_root, refname);
  if (!fs::remove_file(p)) {
    return false;
  }

  // Prune directories emptied by removing "a/b" so "a" can become a branch again
  const auto refs_root = repo_dir(repo_root) / consts::kRefsDir;
  std::error_code ec;
  for (auto dir = p.parent_path(); dir != refs_root && dir.parent_path() != dir;
       dir = dir.parent_path()) {
    if (!std::filesystem::is_empty(dir, ec) || ec || dir.filename() == consts::kHeadsDir) {
      break;
    }
    std::filesystem::remove(dir, ec);
    if (ec) {
      break;
    }
  }
  return true;
}

} // namespace rebranch
