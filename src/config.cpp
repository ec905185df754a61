#include "rebranch/config.hpp"

#include "rebranch/consts.hpp"
#include "rebranch/fs.hpp"
#include "rebranch/util.hpp"

#include <cstdlib>
#include <sstream>
#include <string_view>

namespace rebranch {

namespace {

constexpr std::string_view kAuthorKey = "author";
constexpr std::string_view kEmailKey  = "email";
constexpr std::string_view kEditorKey = "editor";

std::filesystem::path cfg_path(const std::filesystem::path &repo_root) {
  return repo_root / consts::kRepoDir / consts::kConfigFile;
}

void write_config(const std::filesystem::path &repo_root,
                  const std::map<std::string, std::string> &values) {
  std::ostringstream os;
  for (const auto &[key, value] : values) {
    os << key << ": " << value << '\n';
  }
  fs::write_text_atomic(cfg_path(repo_root), os.str());
}

} // namespace

std::map<std::string, std::string> read_config(const std::filesystem::path &repo_root) {
  std::map<std::string, std::string> out;
  const auto path = cfg_path(repo_root);
  if (!fs::exists(path)) {
    return out;
  }

  std::istringstream iss(fs::read_text(path));
  std::string line;
  while (std::getline(iss, line)) {
    const std::string_view sv = strutil::trim(line);
    if (sv.empty() || sv.front() == consts::kComment) {
      continue; // allow comments
    }
    const auto colon = sv.find(':');
    if (colon == std::string_view::npos) {
      continue;
    }
    out[std::string(strutil::trim(sv.substr(0, colon)))] =
        std::string(strutil::trim(sv.substr(colon + 1)));
  }
  return out;
}

Identity load_identity(const std::filesystem::path &repo_root) {
  const auto cfg = read_config(repo_root);
  Identity out{};
  if (const auto it = cfg.find(std::string(kAuthorKey)); it != cfg.end()) {
    out.name = it->second;
  }
  if (const auto it = cfg.find(std::string(kEmailKey)); it != cfg.end()) {
    out.email = it->second;
  }
  return out;
}

void save_identity(const std::filesystem::path &repo_root, const Identity &id) {
  auto cfg = read_config(repo_root);
  cfg[std::string(kAuthorKey)] = id.name;
  cfg[std::string(kEmailKey)] = id.email;
  write_config(repo_root, cfg);
}

Settings load_settings(const std::filesystem::path &repo_root) {
  Settings s{.editor = std::string(consts::kDefaultEditor)};
  if (const char *env = std::getenv(std::string(consts::kEditorEnv).c_str());
      env != nullptr && *env != '\0') {
    s.editor = env;
    return s;
  }
  const auto cfg = read_config(repo_root);
  if (const auto it = cfg.find(std::string(kEditorKey)); it != cfg.end() && !it->second.empty()) {
    s.editor = it->second;
  }
  return s;
}

} // namespace rebranch
