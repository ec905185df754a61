#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace rebranch::consts {

// Directory and file names inside the work tree
inline constexpr std::string_view kRepoDir       = ".rebranch";
inline constexpr std::string_view kObjectsDir    = "objects";
inline constexpr std::string_view kRefsDir       = "refs";
inline constexpr std::string_view kHeadsDir      = "heads";
inline constexpr std::string_view kHeadFile      = "HEAD";
inline constexpr std::string_view kIndexFile     = "index";
inline constexpr std::string_view kConfigFile    = "config";
inline constexpr std::string_view kDefaultBranch = "master";

// In-progress markers. Only CHERRY_PICK_HEAD is ever written by us; the
// others are recognised so a foreign operation blocks a new rebranch.
inline constexpr std::string_view kCherryPickHead = "CHERRY_PICK_HEAD";
inline constexpr std::string_view kMergeHead      = "MERGE_HEAD";
inline constexpr std::string_view kRebaseHead     = "REBASE_HEAD";
inline constexpr std::string_view kRevertHead     = "REVERT_HEAD";

// Kind reported by detect_foreign_operation for a stopped cherry-pick
inline constexpr std::string_view kPickOperation = "cherry-pick";

// Git keeps its repository metadata here; a stopped rebase may leave only a directory
inline constexpr std::string_view kGitDir         = ".git";
inline constexpr std::string_view kRebaseMergeDir = "rebase-merge";
inline constexpr std::string_view kRebaseApplyDir = "rebase-apply";

// ——— Rebranch bookkeeping ———
inline constexpr std::string_view kStateFile        = "REBRANCH_STATE";
inline constexpr std::string_view kPickFile         = "REBRANCH_PICK";
inline constexpr std::string_view kTempBranchPrefix = "rebranch-temp-";
inline constexpr int kRecordVersion = 1;

// ——— Tool ———
inline constexpr std::string_view kToolName      = "rebranch";
inline constexpr std::string_view kVersion       = "1.0.0";
inline constexpr std::string_view kEditorEnv     = "EDITOR";
inline constexpr std::string_view kDefaultEditor = "vi";

// Object type strings
inline constexpr std::string_view kTypeBlob   = "blob";
inline constexpr std::string_view kTypeTree   = "tree";
inline constexpr std::string_view kTypeCommit = "commit";

// File modes (octal)
inline constexpr std::uint32_t kModeFile = 0100644; // regular file
inline constexpr std::uint32_t kModeTree = 0040000; // directory entry in tree

// ——— Object ID sizes ———
inline constexpr std::size_t kOidRawLen  = 20; // 20 bytes (SHA-1)
inline constexpr std::size_t kOidHexLen  = 40; // 40 hex chars (SHA-1)
inline constexpr std::size_t kShortIdLen = 7;  // abbreviation used in listings
inline constexpr std::size_t kMinAbbrevLen = 4; // shortest id prefix accepted back

// ——— Object store fanout ———
inline constexpr std::size_t kFanoutDirHexLen = 2; // "aa/" + "bbbb..." in objects/

// ——— Commit header prefixes ———
inline constexpr std::string_view kTreePrefix      = "tree ";
inline constexpr std::string_view kRefPrefix       = "ref: ";
inline constexpr std::string_view kParentPrefix    = "parent ";
inline constexpr std::string_view kAuthorPrefix    = "author ";
inline constexpr std::string_view kCommitterPrefix = "committer ";
inline constexpr std::string_view kHeadsRefPrefix  = "refs/heads/";

// ——— Conflict markers ———
inline constexpr std::string_view kMarkerOurs   = "<<<<<<< ";
inline constexpr std::string_view kMarkerSplit  = "=======";
inline constexpr std::string_view kMarkerTheirs = ">>>>>>> ";

// ——— Common characters ———
inline constexpr char kSpace   = ' ';
inline constexpr char kNul     = '\0';
inline constexpr char kLF      = '\n';
inline constexpr char kComment = '#';

} // namespace rebranch::consts
