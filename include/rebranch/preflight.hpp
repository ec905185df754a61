#pragma once
#include "rebranch/backend.hpp"
#include "rebranch/record.hpp"

#include <string_view>

namespace rebranch::preflight {

// Each guard throws Error(Violation, ...) naming the first failing condition.

void check_start(const VcsBackend &vcs, const RecordStore &store, std::string_view base_branch);

[[nodiscard]] auto check_continue(const VcsBackend &vcs, const RecordStore &store)
    -> OperationRecord;

[[nodiscard]] auto check_finish(const VcsBackend &vcs, const RecordStore &store)
    -> OperationRecord;

[[nodiscard]] auto check_abort(const VcsBackend &vcs, const RecordStore &store)
    -> OperationRecord;

} // namespace rebranch::preflight
