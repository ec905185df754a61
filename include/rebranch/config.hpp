#pragma once
#include <filesystem>
#include <map>
#include <string>

namespace rebranch {

struct Identity {
  std::string name;
  std::string email;
};

// Process-wide settings, loaded once in main() and passed down.
struct Settings {
  std::string editor; // command used to edit the selection listing
};

// Parse "key: value" lines of .rebranch/config. Missing file -> empty map.
std::map<std::string, std::string> read_config(const std::filesystem::path& repo_root);

// Read identity from .rebranch/config (empty fields if missing)
Identity load_identity(const std::filesystem::path& repo_root);

// Overwrite the identity keys of .rebranch/config, keeping other keys.
void save_identity(const std::filesystem::path& repo_root, const Identity& id);

// $EDITOR, else "editor:" from the repository config, else vi.
Settings load_settings(const std::filesystem::path& repo_root);

} // namespace rebranch
