#pragma once
#include "rebranch/consts.hpp"
#include "rebranch/hash.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace rebranch {

class Repository; // fwd decl to avoid header cycle

struct IndexEntry {
  std::uint32_t mode;  // e.g., rebranch::consts::kModeFile
  rebranch::oid oid;   // blob id (20 bytes)
  std::string   path;  // "dir/file", UTF-8, no leading '/'
};

class Index {
public:
  explicit Index(std::filesystem::path repo_root);

  // Parse .rebranch/index if it exists (no throw if missing)
  void load();

  // Overwrite .rebranch/index with current entries
  void save() const;

  // Read file at `wd/relpath`, write blob via repo, add/replace an entry
  void add_path(const std::filesystem::path& wd,
                std::string_view relpath,
                const Repository& repo,
                std::uint32_t mode = consts::kModeFile);

  // Drop the entry for relpath. Returns false if it was not staged.
  bool remove_path(std::string_view relpath);

  // Replace all entries with path -> 40-hex blob pairs (objects must exist)
  void assign(const std::map<std::string, std::string>& snapshot);

  const std::vector<IndexEntry>& entries() const { return entries_; }
  std::map<std::string, std::string> as_path_oid_map() const;

private:
  std::filesystem::path index_path() const;

  std::filesystem::path repo_root_;
  std::vector<IndexEntry> entries_;
};

} // namespace rebranch
