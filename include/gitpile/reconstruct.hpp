#pragma once
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>

namespace gitpile {

class Backend; // fwd
class Pile;    // fwd

struct GenBranchOptions {
  std::string base_branch;    // branch the series is applied on top of
  std::string target_branch;  // branch moved to the result
  std::ostream* progress = nullptr;  // receives one line per applied patch when set
};

enum class GenBranchOutcome {
  Updated,  // target branch now points at the result
  Refused,  // target branch is checked out elsewhere; only the result pointer was written
};

struct GenBranchResult {
  GenBranchOutcome outcome = GenBranchOutcome::Updated;
  std::string head;                      // reconstructed commit
  std::string base;                      // commit the series was applied on
  std::optional<std::string> baseline;   // recorded baseline, if any
  bool baseline_drift = false;           // baseline differs from the base branch tip
  std::filesystem::path busy_worktree;   // where the target is checked out when Refused
};

// Rebuild `options.target_branch` by applying the series of `pile` on top of
// the base branch inside a throw-away workspace.
//
// Throws MissingPatchError before anything is applied if a listed file is
// absent, PatchApplyError on the first patch that does not apply. The
// resulting head is always written to the result pointer before the branch
// is touched.
GenBranchResult generate_branch(const Backend& backend, const Pile& pile,
                                const GenBranchOptions& options);

// Last reconstructed head, independent of whether the branch update happened
std::optional<std::string> read_result_pointer(const Backend& backend);

} // namespace gitpile
