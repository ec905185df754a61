#include "rebranch/error.hpp"
#include "rebranch/selection.hpp"

#include "fake_vcs.hpp"

#include <iostream>
#include <string>
#include <vector>

using rebranch::Action;
using rebranch::CommitEntry;
using rebranch::Error;
using rebranch::ErrorKind;

static std::vector<CommitEntry> sample() {
  return {
      CommitEntry{.id = FakeVcs::make_id(0xa1), .summary = "Add parser", .action = Action::Apply},
      CommitEntry{.id = FakeVcs::make_id(0xb2), .summary = "Fix typo", .action = Action::Apply},
      CommitEntry{.id = FakeVcs::make_id(0xc3), .summary = "Add tests", .action = Action::Apply},
  };
}

// Run parse() expecting a failure of `kind`; returns the error's line.
static bool expect_error(std::string_view text, ErrorKind kind, std::size_t *line = nullptr) {
  try {
    (void)rebranch::selection::parse(text, sample());
  } catch (const Error &e) {
    if (line != nullptr) {
      *line = e.line();
    }
    return e.kind() == kind;
  }
  return false;
}

int main() {
  const auto commits = sample();
  const std::string a = commits[0].id.substr(0, 7);
  const std::string b = commits[1].id.substr(0, 7);
  const std::string c = commits[2].id.substr(0, 7);

  try {
    // Rendered listing: header comments, blank line, one pick line per commit
    const std::string listing = rebranch::selection::render(commits);
    if (!listing.starts_with("# ")) {
      std::cerr << "listing should open with comments\n";
      return 1;
    }
    if (listing.find("pick " + a + " Add parser\n") == std::string::npos ||
        listing.find("pick " + c + " Add tests\n") == std::string::npos) {
      std::cerr << "pick lines missing:\n" << listing;
      return 1;
    }
    if (listing.find("\n\npick ") == std::string::npos) {
      std::cerr << "expected blank line between header and picks\n";
      return 1;
    }

    // Unedited listing selects everything in order
    {
      const auto parsed = rebranch::selection::parse(listing, commits);
      if (parsed.size() != 3 || parsed[0].id != commits[0].id || parsed[2].id != commits[2].id) {
        std::cerr << "unedited listing did not round-trip\n";
        return 1;
      }
      for (const auto &e : parsed) {
        if (e.action != Action::Apply) {
          std::cerr << "unedited listing should apply everything\n";
          return 1;
        }
      }
    }

    // Reordering, abbreviations, drops and a removed line
    {
      const std::string edited = "# my notes\n"
                                 "\n"
                                 "d " + b + " whatever the user typed\n"
                                 "  p   " + c + "\n"
                                 "drop " + a + " Add parser\n";
      const auto parsed = rebranch::selection::parse(edited, commits);
      if (parsed.size() != 3) {
        std::cerr << "expected 3 entries, got " << parsed.size() << "\n";
        return 1;
      }
      if (parsed[0].id != commits[1].id || parsed[0].action != Action::Skip ||
          parsed[1].id != commits[2].id || parsed[1].action != Action::Apply ||
          parsed[2].id != commits[0].id || parsed[2].action != Action::Skip) {
        std::cerr << "order or actions wrong after edit\n";
        return 1;
      }
      if (parsed[0].summary != "Fix typo") {
        std::cerr << "summary must come from the original list, got '" << parsed[0].summary
                  << "'\n";
        return 1;
      }
    }

    // Removing a line drops the commit entirely
    {
      const auto parsed = rebranch::selection::parse("pick " + c + " x\n", commits);
      if (parsed.size() != 1 || parsed[0].id != commits[2].id) {
        std::cerr << "removed lines should not be selected\n";
        return 1;
      }
    }

    // Unknown action names the line
    {
      std::size_t line = 0;
      if (!expect_error("# c\n\npick " + a + " x\nsquash " + b + " y\n", ErrorKind::InvalidAction,
                        &line) ||
          line != 4) {
        std::cerr << "expected InvalidAction on line 4, got line " << line << "\n";
        return 1;
      }
      try {
        (void)rebranch::selection::parse("edit " + a + "\n", commits);
      } catch (const Error &e) {
        const std::string msg = e.what();
        if (msg.find("'edit'") == std::string::npos || msg.find("line 1") == std::string::npos) {
          std::cerr << "InvalidAction message should name token and line: " << msg << "\n";
          return 1;
        }
      }
    }

    // A line with a single field is rejected too
    if (!expect_error("pick\n", ErrorKind::InvalidAction)) {
      std::cerr << "expected InvalidAction for a one-field line\n";
      return 1;
    }

    // Unknown and duplicated ids
    if (!expect_error("pick deadbee nope\n", ErrorKind::UnknownCommit)) {
      std::cerr << "expected UnknownCommit\n";
      return 1;
    }
    if (!expect_error("pick " + a + "\npick " + a + "\n", ErrorKind::UnknownCommit)) {
      std::cerr << "expected UnknownCommit for a commit listed twice\n";
      return 1;
    }

    // Nothing left
    if (!expect_error("# everything removed\n\n", ErrorKind::EmptySelection) ||
        !expect_error("", ErrorKind::EmptySelection)) {
      std::cerr << "expected EmptySelection\n";
      return 1;
    }

    // All dropped is still a non-empty selection
    {
      const auto parsed =
          rebranch::selection::parse("drop " + a + "\nd " + b + "\nd " + c + "\n", commits);
      if (parsed.size() != 3) {
        std::cerr << "all-dropped listing should keep its entries\n";
        return 1;
      }
    }

    // Ids sharing seven characters are listed long enough to tell apart
    {
      const std::vector<CommitEntry> twins{
          CommitEntry{.id = "abcdef0" + std::string(33, '1'), .summary = "One", .action = Action::Apply},
          CommitEntry{.id = "abcdef0" + std::string(33, '2'), .summary = "Two", .action = Action::Apply},
      };
      const std::string text = rebranch::selection::render(twins);
      if (text.find("pick abcdef01 One\n") == std::string::npos ||
          text.find("pick abcdef02 Two\n") == std::string::npos) {
        std::cerr << "colliding ids should be widened:\n" << text;
        return 1;
      }
      const auto parsed = rebranch::selection::parse(text, twins);
      if (parsed.size() != 2 || parsed[0].id != twins[0].id || parsed[1].id != twins[1].id) {
        std::cerr << "widened listing should parse back to both commits\n";
        return 1;
      }

      bool ambiguous = false;
      try {
        (void)rebranch::selection::parse("pick abcdef0 One\n", twins);
      } catch (const Error &e) {
        ambiguous = e.kind() == ErrorKind::UnknownCommit;
      }
      if (!ambiguous) {
        std::cerr << "a prefix shared by two commits should be rejected\n";
        return 1;
      }
    }

    // Any unambiguous prefix of four or more characters names a commit
    {
      const auto parsed = rebranch::selection::parse(
          "pick " + commits[2].id + "\npick " + b.substr(0, 6) + "\n", commits);
      if (parsed.size() != 2 || parsed[0].id != commits[2].id || parsed[1].id != commits[1].id) {
        std::cerr << "full and shortened ids should be accepted\n";
        return 1;
      }
      const std::vector<CommitEntry> single{
          CommitEntry{.id = "feed" + std::string(36, '9'), .summary = "Solo", .action = Action::Apply},
      };
      if (rebranch::selection::parse("pick feed\n", single).size() != 1) {
        std::cerr << "a unique four-character id should be accepted\n";
        return 1;
      }
      bool too_short = false;
      try {
        (void)rebranch::selection::parse("pick fee\n", single);
      } catch (const Error &e) {
        too_short = e.kind() == ErrorKind::UnknownCommit;
      }
      if (!too_short) {
        std::cerr << "a three-character id should be rejected\n";
        return 1;
      }
    }

    std::cout << "selection codec OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
