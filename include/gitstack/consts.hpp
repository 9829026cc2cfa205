#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace gitstack::consts {

// Directory and file names (relative to the repository's git dir)
inline constexpr std::string_view kStoreDir   = "gitstack";
inline constexpr std::string_view kObjectsDir = "objects";
inline constexpr std::string_view kDataFile   = "DATA";
inline constexpr std::string_view kConfigFile = "config";

// Rebase state directories written by git
inline constexpr std::string_view kRebaseMergeDir = "rebase-merge";
inline constexpr std::string_view kRebaseApplyDir = "rebase-apply";
inline constexpr std::string_view kRebaseHeadName = "head-name";

inline constexpr std::string_view kHeadsRefPrefix = "refs/heads/";

// Object type strings
inline constexpr std::string_view kTypeBlob   = "blob";
inline constexpr std::string_view kTypeTree   = "tree";
inline constexpr std::string_view kTypeCommit = "commit";

inline constexpr std::uint32_t kModeFile = 0100644;

// Object ID sizes
inline constexpr std::size_t kOidRawLen = 20; // 20 bytes (SHA-1)
inline constexpr std::size_t kOidHexLen = 40; // 40 hex chars (SHA-1)
inline constexpr std::size_t kShortHashLen = 7;

inline constexpr std::size_t kFanoutDirHexLen = 2; // "aa/" + "bbbb..." in objects/

// Store commit header prefixes
inline constexpr std::string_view kTreePrefix   = "tree ";
inline constexpr std::string_view kParentPrefix = "parent ";
inline constexpr std::string_view kDatePrefix   = "date ";

// Store keys
inline constexpr std::string_view kRepoKey          = "repo";
inline constexpr std::string_view kBranchesDir      = "branches";
inline constexpr std::string_view kContinuationsKey = "continuations";

// Common characters
inline constexpr char kSpace = ' ';
inline constexpr char kNul   = '\0';
inline constexpr char kLF    = '\n';

} // namespace gitstack::consts
