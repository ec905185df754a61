#pragma once
#include "rebranch/record.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace rebranch::selection {

// Editable listing: comment header, blank line, "pick <short> <summary>" lines.
// Short ids grow past seven characters when two listed commits share a prefix.
std::string render(const std::vector<CommitEntry> &commits);

// Entries in listing order with the chosen action. Summaries come from
// `original`. A commit may be named by any unambiguous id prefix of four or
// more characters. Throws InvalidAction, UnknownCommit or EmptySelection.
std::vector<CommitEntry> parse(std::string_view text, const std::vector<CommitEntry> &original);

} // namespace rebranch::selection
