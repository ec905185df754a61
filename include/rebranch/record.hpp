#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rebranch {

enum class Action : std::uint8_t { Apply, Skip };
enum class Stage : std::uint8_t { Picking, Conflicted, Done };

[[nodiscard]] auto to_string(Action action) -> std::string_view;
[[nodiscard]] auto to_string(Stage stage) -> std::string_view;
[[nodiscard]] auto parse_action(std::string_view token) -> std::optional<Action>;
[[nodiscard]] auto parse_stage(std::string_view token) -> std::optional<Stage>;

struct CommitEntry {
  std::string id;      // full 40-hex id of the original commit
  std::string summary; // first message line, display only
  Action action = Action::Apply;
};

// State of the in-progress rebranch. Exists on disk exactly while an
// operation is running.
struct OperationRecord {
  std::string source_branch;
  std::string base_branch;
  std::string temp_branch;
  std::vector<CommitEntry> plan;
  std::size_t cursor = 0; // next unprocessed entry; plan.size() when complete
  Stage stage = Stage::Picking;

  [[nodiscard]] std::size_t applied_count() const;
};

class RecordStore {
public:
  explicit RecordStore(std::filesystem::path metadata_dir);

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  [[nodiscard]] bool exists() const;

  // Throws CorruptRecord if the file does not match the schema.
  [[nodiscard]] OperationRecord load() const;

  // Synchronous, atomic replace.
  void save(const OperationRecord &record) const;

  // No-op when nothing is stored.
  void clear() const;

private:
  std::filesystem::path path_;
};

// Text form of a record, exposed for tests.
std::string serialize_record(const OperationRecord &record);
OperationRecord parse_record(std::string_view text);

} // namespace rebranch
