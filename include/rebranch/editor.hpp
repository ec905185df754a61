#pragma once
#include <filesystem>
#include <string>
#include <utility>

namespace rebranch {

class Editor {
public:
  virtual ~Editor() = default;

  // Block until the user is done with the file at `path`.
  virtual void launch(const std::filesystem::path &path) = 0;
};

// Runs `<command> <path>` through /bin/sh with the terminal attached.
class SystemEditor final : public Editor {
public:
  explicit SystemEditor(std::string command) : command_(std::move(command)) {}

  void launch(const std::filesystem::path &path) override;

  [[nodiscard]] const std::string &command() const { return command_; }

private:
  std::string command_;
};

} // namespace rebranch
