#pragma once
#include "gitpile/backend.hpp"
#include "gitpile/range.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gitpile {

struct FormatPatchOptions {
  std::string pile_branch;               // branch holding the recorded pile
  std::optional<std::string> range;      // "A..B"; default base_branch..HEAD
  std::string base_branch;
  std::filesystem::path output_dir;
  bool force = false;                    // clear *.patch in a non-empty output_dir
};

struct FormatPatchResult {
  std::filesystem::path cover_letter;
  std::vector<std::filesystem::path> patches;  // in series order
};

// Keep the changed patch files of a status listing: deletions and non-patch
// paths are dropped, unknown letters throw UnexpectedDiffStateError.
std::vector<std::string> select_changed_patches(const std::vector<DiffEntry>& entries);

// Order `names` by their position in `series`; names not in it come first
void order_by_series(std::vector<std::string>& names, const std::vector<std::string>& series);

// Regenerate the pile for the range in a workspace of the pile branch and
// write only the patches that differ from the recorded state, renumbered,
// plus a cover letter. Throws NoChangesError if no patch changed.
FormatPatchResult format_patches(const Backend& backend, const FormatPatchOptions& options);

} // namespace gitpile
