#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace rebranch {

// "refs/heads/<branch>"
std::string heads_ref(std::string_view branch);

// Branch names: no whitespace, no leading '-', no "..", no empty path components.
bool is_valid_branch_name(std::string_view branch);

// Raw HEAD contents with trailing newline stripped ("ref: refs/heads/x" or a 40-hex id).
// std::nullopt if HEAD does not exist.
std::optional<std::string> read_HEAD(const std::filesystem::path& repo_root);

// Target of a symbolic HEAD ("refs/heads/<name>"), std::nullopt when detached or missing.
std::optional<std::string> head_symbolic_ref(const std::filesystem::path& repo_root);

// Write symbolic HEAD: "ref: <refname>\n"
void set_HEAD_symbolic(const std::filesystem::path& repo_root, const std::string& refname);

// Read a ref file (e.g. "refs/heads/master") -> 40-hex id without trailing newline.
std::optional<std::string> read_ref(const std::filesystem::path& repo_root, const std::string& refname);

// Overwrite/create a ref with the given 40-hex id (trailing newline on disk).
void update_ref(const std::filesystem::path& repo_root, const std::string& refname, const std::string& hex_oid);

// Remove a ref file. Returns false if it did not exist.
bool delete_ref(const std::filesystem::path& repo_root, const std::string& refname);

} // namespace rebranch
