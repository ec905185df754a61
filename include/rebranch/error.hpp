#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace rebranch {

enum class ErrorKind : std::uint8_t {
  ValidationFailure, // precondition not met, nothing was mutated
  ReferenceNotFound, // branch or commit does not resolve
  ConflictDetected,  // pick stopped on conflicts; record already persisted
  InvalidAction,     // selection listing: unknown action token
  UnknownCommit,     // selection listing: id matches no candidate
  EmptySelection,    // selection listing: nothing left to replay
  BackendFailure,    // repository operation failed for another reason
  CorruptRecord,     // REBRANCH_STATE does not match the schema
  EditorFailure,     // editor could not be run or exited non-zero
};

// Which preflight guard rejected the command.
enum class Violation : std::uint8_t {
  None,
  InvalidRepository,
  AlreadyInProgress,
  ForeignOperation,
  DirtyWorkingTree,
  BaseBranchMissing,
  SameAsBase,
  NothingToRebranch,
  NotInProgress,
  NotConflicted,
  NotDone,
  NotOnTempBranch,
};

[[nodiscard]] auto to_string(ErrorKind kind) -> std::string_view;
[[nodiscard]] auto to_string(Violation violation) -> std::string_view;

class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string& message)
      : std::runtime_error(message), kind_(kind) {}

  // Validation failure with its guard name.
  Error(Violation violation, const std::string& message)
      : std::runtime_error(message), kind_(ErrorKind::ValidationFailure), violation_(violation) {}

  [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
  [[nodiscard]] Violation violation() const noexcept { return violation_; }

  // 1-based line of the selection listing, 0 when not applicable.
  [[nodiscard]] std::size_t line() const noexcept { return line_; }
  Error& at_line(std::size_t line) {
    line_ = line;
    return *this;
  }

  // Full id of the commit involved (conflicts, unknown commits).
  [[nodiscard]] const std::string& commit() const noexcept { return commit_; }
  Error& for_commit(std::string id) {
    commit_ = std::move(id);
    return *this;
  }

private:
  ErrorKind kind_;
  Violation violation_ = Violation::None;
  std::size_t line_ = 0;
  std::string commit_;
};

} // namespace rebranch
