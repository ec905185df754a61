#include "rebranch/selection.hpp"

#include "rebranch/consts.hpp"
#include "rebranch/error.hpp"
#include "rebranch/util.hpp"

#include <algorithm>
#include <optional>
#include <set>
#include <sstream>

namespace rebranch::selection {

namespace {

constexpr std::string_view kHeader =
    "# Interactive rebranch - edit the list of commits to apply\n"
    "# Commands:\n"
    "#  pick, p = apply this commit\n"
    "#  drop, d = skip this commit\n"
    "#\n"
    "# Commits are applied from top to bottom; reorder lines to reorder them.\n"
    "# Removing a line drops the commit. Lines starting with # are ignored.\n";

std::optional<Action> normalize_action(std::string_view token) {
  if (token == "pick" || token == "p") {
    return Action::Apply;
  }
  if (token == "drop" || token == "d") {
    return Action::Skip;
  }
  return std::nullopt;
}

// Shortest abbreviation, never under kShortIdLen, that keeps every listed id apart.
std::size_t abbrev_len(const std::vector<CommitEntry> &commits) {
  std::vector<std::string_view> ids;
  ids.reserve(commits.size());
  for (const auto &c : commits) {
    ids.emplace_back(c.id);
  }
  std::ranges::sort(ids);

  std::size_t len = consts::kShortIdLen;
  for (std::size_t i = 1; i < ids.size(); ++i) {
    const auto split = std::ranges::mismatch(ids[i - 1], ids[i]).in1;
    len = std::max(len, static_cast<std::size_t>(split - ids[i - 1].begin()) + 1);
  }
  return len;
}

} // namespace

std::string render(const std::vector<CommitEntry> &commits) {
  const std::size_t len = abbrev_len(commits);
  std::ostringstream os;
  os << kHeader << consts::kLF;
  for (const auto &c : commits) {
    os << "pick " << c.id.substr(0, len) << consts::kSpace << c.summary << consts::kLF;
  }
  return os.str();
}

std::vector<CommitEntry> parse(std::string_view text, const std::vector<CommitEntry> &original) {
  std::vector<CommitEntry> selected;
  std::set<std::string> seen;

  std::size_t lineno = 0;
  std::size_t pos = 0;
  while (pos <= text.size()) {
    const auto nl = text.find(consts::kLF, pos);
    const auto raw = text.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);
    pos = nl == std::string_view::npos ? text.size() + 1 : nl + 1;
    ++lineno;

    const std::string_view line = strutil::trim(raw);
    if (line.empty() || line.front() == consts::kComment) {
      continue;
    }

    const auto fields = strutil::split_fields(line);
    if (fields.size() < 2) {
      throw Error(ErrorKind::InvalidAction, "invalid line " + std::to_string(lineno) + ": '" +
                                                std::string(line) +
                                                "' (expected '<action> <commit>')")
          .at_line(lineno);
    }

    const auto action = normalize_action(fields[0]);
    if (!action) {
      throw Error(ErrorKind::InvalidAction,
                  "invalid action '" + std::string(fields[0]) + "' on line " +
                      std::to_string(lineno) + " (must be 'pick', 'p', 'drop', or 'd')")
          .at_line(lineno);
    }

    const CommitEntry *match = nullptr;
    for (const auto &c : original) {
      if (fields[1].size() < consts::kMinAbbrevLen || !c.id.starts_with(fields[1])) {
        continue;
      }
      if (match != nullptr) {
        throw Error(ErrorKind::UnknownCommit, "ambiguous commit " + std::string(fields[1]) +
                                                  " on line " + std::to_string(lineno))
            .at_line(lineno);
      }
      match = &c;
    }
    if (match == nullptr) {
      throw Error(ErrorKind::UnknownCommit, "unknown commit " + std::string(fields[1]) +
                                                " on line " + std::to_string(lineno))
          .at_line(lineno);
    }
    if (!seen.insert(match->id).second) {
      throw Error(ErrorKind::UnknownCommit, "commit " + std::string(fields[1]) +
                                                " is listed more than once (line " +
                                                std::to_string(lineno) + ")")
          .at_line(lineno)
          .for_commit(match->id);
    }

    selected.push_back(CommitEntry{.id = match->id, .summary = match->summary, .action = *action});
  }

  if (selected.empty()) {
    throw Error(ErrorKind::EmptySelection,
                "no commits selected (all lines were removed or commented out)");
  }
  return selected;
}

} // namespace rebranch::selection
