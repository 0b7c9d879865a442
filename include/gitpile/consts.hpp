#pragma once
#include <cstddef>
#include <string_view>

namespace gitpile::consts {

// Pile directory layout
inline constexpr std::string_view kSeriesFile   = "series";
inline constexpr std::string_view kConfigFile   = "config";
inline constexpr std::string_view kPatchSuffix  = ".patch";
inline constexpr std::string_view kBaselineKey  = "BASELINE";
inline constexpr std::string_view kFallbackStem = "patch"; // name for subjects git sanitizes away

// Written to the common git dir, shared by every worktree
inline constexpr std::string_view kResultPointer = "PILE_RESULT_HEAD";

// ——— Repository configuration keys (git config) ———
inline constexpr std::string_view kConfigSection     = "pile.";
inline constexpr std::string_view kKeyDir            = "dir";
inline constexpr std::string_view kKeyBranch         = "branch";
inline constexpr std::string_view kKeyTrackingBranch = "tracking-branch";
inline constexpr std::string_view kKeyResultBranch   = "result-branch";
inline constexpr std::string_view kKeyRemoteBranch   = "remote-branch";

inline constexpr std::string_view kDefaultDir            = "pile";
inline constexpr std::string_view kDefaultBranch         = "pile";
inline constexpr std::string_view kDefaultTrackingBranch = "master";
inline constexpr std::string_view kDefaultResultBranch   = "internal";
inline constexpr std::string_view kDefaultFormatDir      = "patches";

// ——— Object ID sizes ———
inline constexpr std::size_t kOidHexLen = 40;  // 40 hex chars (SHA-1)

// ——— Extracted patch naming ———
inline constexpr int kNumberWidth = 4;         // "0001-..."
inline constexpr std::string_view kCoverLetterName = "0000-cover-letter.patch";

// ——— Ref prefixes ———
inline constexpr std::string_view kHeadsPrefix = "refs/heads/";

// ——— Common characters ———
inline constexpr char kLF = '\n';

} // namespace gitpile::consts
