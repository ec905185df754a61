#include "rebranch/error.hpp"
#include "rebranch/record.hpp"

#include "fake_vcs.hpp"
#include "test_support.hpp"

#include <iostream>
#include <string>

using rebranch::Action;
using rebranch::CommitEntry;
using rebranch::Error;
using rebranch::ErrorKind;
using rebranch::OperationRecord;
using rebranch::Stage;

static OperationRecord sample() {
  return OperationRecord{
      .source_branch = "feature/login",
      .base_branch = "master",
      .temp_branch = "rebranch-temp-1714412345",
      .plan = {CommitEntry{.id = FakeVcs::make_id(1), .summary = "First: with colon",
                           .action = Action::Apply},
               CommitEntry{.id = FakeVcs::make_id(2), .summary = "", .action = Action::Skip},
               CommitEntry{.id = FakeVcs::make_id(3), .summary = "Third", .action = Action::Apply}},
      .cursor = 1,
      .stage = Stage::Conflicted};
}

static bool is_corrupt(const std::string &text) {
  try {
    (void)rebranch::parse_record(text);
  } catch (const Error &e) {
    return e.kind() == ErrorKind::CorruptRecord;
  }
  return false;
}

static std::string replace_line(std::string text, std::string_view from, std::string_view to) {
  const auto pos = text.find(from);
  if (pos != std::string::npos) {
    text.replace(pos, from.size(), to);
  }
  return text;
}

int main() {
  const fs::path dir = make_temp_root("record");
  try {
    const rebranch::RecordStore store{dir};

    // Nothing stored yet
    if (store.exists()) {
      std::cerr << "fresh store should be empty\n";
      return 1;
    }
    try {
      (void)store.load();
      std::cerr << "load without a record should fail\n";
      return 1;
    } catch (const Error &e) {
      if (e.violation() != rebranch::Violation::NotInProgress) {
        std::cerr << "expected NotInProgress\n";
        return 1;
      }
    }
    store.clear(); // no-op

    // Save then load gives the same record back
    const auto rec = sample();
    store.save(rec);
    if (!store.exists() || store.path().filename() != "REBRANCH_STATE") {
      std::cerr << "record not written to REBRANCH_STATE\n";
      return 1;
    }
    const auto back = store.load();
    if (back.source_branch != rec.source_branch || back.base_branch != rec.base_branch ||
        back.temp_branch != rec.temp_branch || back.cursor != 1 ||
        back.stage != Stage::Conflicted || back.plan.size() != 3) {
      std::cerr << "record fields differ after reload\n";
      return 1;
    }
    if (back.plan[0].summary != "First: with colon" || back.plan[1].action != Action::Skip ||
        !back.plan[1].summary.empty() || back.plan[2].id != rec.plan[2].id) {
      std::cerr << "plan entries differ after reload\n";
      return 1;
    }
    if (back.applied_count() != 2) {
      std::cerr << "applied_count should ignore skips\n";
      return 1;
    }

    // Saving again replaces the record
    auto next = back;
    next.cursor = 3;
    next.stage = Stage::Done;
    store.save(next);
    if (store.load().stage != Stage::Done || store.load().cursor != 3) {
      std::cerr << "second save did not replace the record\n";
      return 1;
    }

    store.clear();
    if (store.exists()) {
      std::cerr << "clear should remove the record\n";
      return 1;
    }

    // Schema violations are reported as CorruptRecord
    const std::string good = rebranch::serialize_record(sample());
    if (is_corrupt(good)) {
      std::cerr << "serialized record should parse\n";
      return 1;
    }
    if (!is_corrupt(replace_line(good, "stage: conflicted", "stage: rebasing"))) {
      std::cerr << "unknown stage accepted\n";
      return 1;
    }
    if (!is_corrupt(replace_line(good, "cursor: 1", "cursor: 4"))) {
      std::cerr << "cursor past the plan accepted\n";
      return 1;
    }
    if (!is_corrupt(replace_line(good, "cursor: 1", "cursor: 3"))) {
      std::cerr << "conflicted record without a pending entry accepted\n";
      return 1;
    }
    if (!is_corrupt(replace_line(good, "cursor: 1", "cursor: -1")) ||
        !is_corrupt(replace_line(good, "version: 1", "version: 9")) ||
        !is_corrupt(replace_line(good, "source: feature/login\n", "")) ||
        !is_corrupt(replace_line(good, "entry: apply", "entry: squash")) ||
        !is_corrupt(good + "base: other\n") || !is_corrupt("garbage\n")) {
      std::cerr << "malformed record accepted\n";
      return 1;
    }

    std::cout << "operation record OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(dir);
    return 1;
  }
  std::error_code ec;
  fs::remove_all(dir, ec);
  return 0;
}
