#include "rebranch/index.hpp"

#include "rebranch/fs.hpp"
#include "rebranch/hash.hpp"
#include "rebranch/repo.hpp"
#include "rebranch/util.hpp"

#include <algorithm>
#include <cstdio>
#include <sstream>
#include <stdexcept>

namespace rebranch {

namespace {
void sort_by_path(std::vector<IndexEntry> &entries) {
  std::ranges::sort(entries, [](const IndexEntry &a, const IndexEntry &b) { return a.path < b.path; });
}

std::uint32_t parse_octal(std::string_view s) {
  std::uint32_t mode = 0;
  for (const char c : s) {
    if (c < '0' || c > '7') {
      return 0;
    }
    mode = (mode << 3U) + static_cast<std::uint32_t>(c - '0');
  }
  return mode;
}
} // namespace

Index::Index(std::filesystem::path repo_root) : repo_root_(std::move(repo_root)) {}

std::filesystem::path Index::index_path() const {
  return repo_root_ / consts::kRepoDir / consts::kIndexFile;
}

void Index::load() {
  entries_.clear();
  const auto p = index_path();
  if (!fs::exists(p)) {
    return;
  }

  std::istringstream is(fs::read_text(p));
  std::string raw;
  std::size_t lineno = 0;
  while (std::getline(is, raw)) {
    ++lineno;
    const std::string_view line = strutil::trim(raw);
    if (line.empty() || line.front() == consts::kComment) {
      continue;
    }

    // "<octal> <hex> <path>"; the path may contain spaces
    const auto sp1 = line.find(consts::kSpace);
    const auto sp2 = sp1 == std::string_view::npos ? sp1 : line.find(consts::kSpace, sp1 + 1);
    if (sp2 == std::string_view::npos) {
      throw std::runtime_error("index line " + std::to_string(lineno) + " is malformed");
    }
    IndexEntry e{};
    e.mode = parse_octal(line.substr(0, sp1));
    e.path = std::string(strutil::trim(line.substr(sp2 + 1)));
    if (e.mode == 0 || e.path.empty() || !from_hex(line.substr(sp1 + 1, sp2 - sp1 - 1), e.oid)) {
      throw std::runtime_error("index line " + std::to_string(lineno) + " is malformed");
    }
    entries_.push_back(std::move(e));
  }
  sort_by_path(entries_);
}

void Index::save() const {
  std::ostringstream os;
  for (const auto &e : entries_) {
    char mode_buf[16];
    std::snprintf(mode_buf, sizeof(mode_buf), "%o", e.mode);
    os << mode_buf << consts::kSpace << to_hex(e.oid) << consts::kSpace << e.path << consts::kLF;
  }
  fs::write_text_atomic(index_path(), os.str());
}

void Index::add_path(const std::filesystem::path &wd, std::string_view relpath,
                     const Repository &repo, std::uint32_t mode) {
  const auto hex_oid = repo.write_blob(fs::read_file(wd / std::filesystem::path(relpath)));

  oid bin{};
  if (!from_hex(hex_oid, bin)) {
    throw std::runtime_error("write_blob produced bad hex oid");
  }

  std::string path(relpath);
  auto it = std::ranges::find_if(entries_, [&](const IndexEntry &e) { return e.path == path; });
  if (it != entries_.end()) {
    it->mode = mode;
    it->oid = bin;
  } else {
    entries_.push_back(IndexEntry{.mode = mode, .oid = bin, .path = std::move(path)});
    sort_by_path(entries_);
  }
}

bool Index::remove_path(std::string_view relpath) {
  const auto removed = std::erase_if(entries_, [&](const IndexEntry &e) { return e.path == relpath; });
  return removed > 0;
}

void Index::assign(const std::map<std::string, std::string> &snapshot) {
  entries_.clear();
  entries_.reserve(snapshot.size());
  for (const auto &[path, hex] : snapshot) {
    IndexEntry e{.mode = consts::kModeFile, .oid = {}, .path = path};
    if (!from_hex(hex, e.oid)) {
      throw std::runtime_error("bad blob id for " + path);
    }
    entries_.push_back(std::move(e));
  }
}

std::map<std::string, std::string> Index::as_path_oid_map() const {
  std::map<std::string, std::string> m;
  for (const auto &e : entries_) {
    m[e.path] = to_hex(e.oid);
  }
  return m;
}

} // namespace rebranch
