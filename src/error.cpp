#include "rebranch/error.hpp"

namespace rebranch {

std::string_view to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::ValidationFailure: return "validation failure";
  case ErrorKind::ReferenceNotFound: return "reference not found";
  case ErrorKind::ConflictDetected:  return "conflict detected";
  case ErrorKind::InvalidAction:     return "invalid action";
  case ErrorKind::UnknownCommit:     return "unknown commit";
  case ErrorKind::EmptySelection:    return "empty selection";
  case ErrorKind::BackendFailure:    return "backend failure";
  case ErrorKind::CorruptRecord:     return "corrupt record";
  case ErrorKind::EditorFailure:     return "editor failure";
  }
  return "unknown error";
}

std::string_view to_string(Violation violation) {
  switch (violation) {
  case Violation::None:              return "none";
  case Violation::InvalidRepository: return "invalid repository";
  case Violation::AlreadyInProgress: return "already in progress";
  case Violation::ForeignOperation:  return "foreign operation in progress";
  case Violation::DirtyWorkingTree:  return "dirty working tree";
  case Violation::BaseBranchMissing: return "base branch missing";
  case Violation::SameAsBase:        return "current branch is the base";
  case Violation::NothingToRebranch: return "nothing to rebranch";
  case Violation::NotInProgress:     return "no operation in progress";
  case Violation::NotConflicted:     return "not waiting for conflict resolution";
  case Violation::NotDone:           return "not ready to finish";
  case Violation::NotOnTempBranch:   return "not on the scratch branch";
  }
  return "unknown";
}

} // namespace rebranch
