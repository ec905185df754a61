#include "rebranch/record.hpp"

#include "rebranch/consts.hpp"
#include "rebranch/error.hpp"
#include "rebranch/fs.hpp"
#include "rebranch/util.hpp"

#include <algorithm>
#include <charconv>
#include <map>
#include <sstream>

namespace rebranch {

namespace {

constexpr std::string_view kVersionKey = "version";
constexpr std::string_view kSourceKey  = "source";
constexpr std::string_view kBaseKey    = "base";
constexpr std::string_view kTempKey    = "temp";
constexpr std::string_view kStageKey   = "stage";
constexpr std::string_view kCursorKey  = "cursor";
constexpr std::string_view kEntryKey   = "entry";

[[noreturn]] void corrupt(const std::string &what) {
  throw Error(ErrorKind::CorruptRecord, "rebranch state is corrupt: " + what +
                                            "\nRun 'rebranch --abort' to discard it");
}

std::size_t parse_count(std::string_view text, std::string_view key) {
  std::size_t value = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    corrupt(std::string(key) + " is not a number: '" + std::string(text) + "'");
  }
  return value;
}

// "<action> <40-hex> <summary...>"
CommitEntry parse_entry(std::string_view value) {
  const auto fields = strutil::split_fields(value);
  if (fields.size() < 2) {
    corrupt("malformed entry '" + std::string(value) + "'");
  }
  const auto action = parse_action(fields[0]);
  if (!action) {
    corrupt("unknown action '" + std::string(fields[0]) + "'");
  }
  if (!looks_hex40(fields[1])) {
    corrupt("bad commit id '" + std::string(fields[1]) + "'");
  }
  CommitEntry entry{.id = std::string(fields[1]), .summary = {}, .action = *action};
  const auto id_end = static_cast<std::size_t>(fields[1].data() - value.data()) + fields[1].size();
  entry.summary = std::string(strutil::trim(value.substr(id_end)));
  return entry;
}

} // namespace

std::string_view to_string(Action action) {
  return action == Action::Apply ? "apply" : "skip";
}

std::string_view to_string(Stage stage) {
  switch (stage) {
  case Stage::Picking:    return "picking";
  case Stage::Conflicted: return "conflicted";
  case Stage::Done:       return "done";
  }
  return "unknown";
}

std::optional<Action> parse_action(std::string_view token) {
  if (token == "apply") return Action::Apply;
  if (token == "skip") return Action::Skip;
  return std::nullopt;
}

std::optional<Stage> parse_stage(std::string_view token) {
  for (const Stage s : {Stage::Picking, Stage::Conflicted, Stage::Done}) {
    if (token == to_string(s)) {
      return s;
    }
  }
  return std::nullopt;
}

std::size_t OperationRecord::applied_count() const {
  return static_cast<std::size_t>(std::ranges::count_if(
      plan, [](const CommitEntry &e) { return e.action == Action::Apply; }));
}

std::string serialize_record(const OperationRecord &record) {
  std::ostringstream os;
  os << consts::kComment << " rebranch operation record\n";
  os << kVersionKey << ": " << consts::kRecordVersion << '\n';
  os << kSourceKey << ": " << record.source_branch << '\n';
  os << kBaseKey << ": " << record.base_branch << '\n';
  os << kTempKey << ": " << record.temp_branch << '\n';
  os << kStageKey << ": " << to_string(record.stage) << '\n';
  os << kCursorKey << ": " << record.cursor << '\n';
  for (const auto &e : record.plan) {
    os << kEntryKey << ": " << to_string(e.action) << ' ' << e.id << ' ' << e.summary << '\n';
  }
  return os.str();
}

OperationRecord parse_record(std::string_view text) {
  std::map<std::string, std::string, std::less<>> fields;
  OperationRecord record;

  std::istringstream is{std::string(text)};
  std::string raw;
  while (std::getline(is, raw)) {
    const std::string_view line = strutil::trim(raw);
    if (line.empty() || line.front() == consts::kComment) {
      continue;
    }
    const auto colon = line.find(':');
    if (colon == std::string_view::npos) {
      corrupt("malformed line '" + std::string(line) + "'");
    }
    const std::string_view key = strutil::trim(line.substr(0, colon));
    const std::string_view value = strutil::trim(line.substr(colon + 1));
    if (key == kEntryKey) {
      record.plan.push_back(parse_entry(value));
    } else if (!fields.emplace(std::string(key), std::string(value)).second) {
      corrupt("duplicate key '" + std::string(key) + "'");
    }
  }

  const auto require = [&fields](std::string_view key) -> const std::string & {
    const auto it = fields.find(key);
    if (it == fields.end() || it->second.empty()) {
      corrupt("missing '" + std::string(key) + "'");
    }
    return it->second;
  };

  if (parse_count(require(kVersionKey), kVersionKey) !=
      static_cast<std::size_t>(consts::kRecordVersion)) {
    corrupt("unsupported version " + require(kVersionKey));
  }
  record.source_branch = require(kSourceKey);
  record.base_branch = require(kBaseKey);
  record.temp_branch = require(kTempKey);

  const auto stage = parse_stage(require(kStageKey));
  if (!stage) {
    corrupt("unknown stage '" + require(kStageKey) + "'");
  }
  record.stage = *stage;
  record.cursor = parse_count(require(kCursorKey), kCursorKey);

  if (record.plan.empty()) {
    corrupt("no commits in plan");
  }
  if (record.cursor > record.plan.size()) {
    corrupt("cursor " + std::to_string(record.cursor) + " is past the plan");
  }
  if (record.stage == Stage::Conflicted && record.cursor == record.plan.size()) {
    corrupt("conflicted stage without a pending commit");
  }
  return record;
}

RecordStore::RecordStore(std::filesystem::path metadata_dir)
    : path_(std::move(metadata_dir) / consts::kStateFile) {}

bool RecordStore::exists() const { return fs::exists(path_); }

OperationRecord RecordStore::load() const {
  if (!exists()) {
    throw Error(Violation::NotInProgress, "no rebranch operation in progress");
  }
  return parse_record(fs::read_text(path_));
}

void RecordStore::save(const OperationRecord &record) const {
  fs::write_text_atomic(path_, serialize_record(record));
}

void RecordStore::clear() const { (void)fs::remove_file(path_); }

} // namespace rebranch
