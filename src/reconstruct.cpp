#include "gitpile/reconstruct.hpp"

#include "gitpile/backend.hpp"
#include "gitpile/baseline.hpp"
#include "gitpile/consts.hpp"
#include "gitpile/errors.hpp"
#include "gitpile/fs.hpp"
#include "gitpile/pile.hpp"
#include "gitpile/util.hpp"
#include "gitpile/workspace.hpp"

#include <fstream>

namespace stdfs = std::filesystem;

namespace gitpile {

namespace {

stdfs::path result_pointer_path(const Backend &backend) {
  return backend.common_dir() / consts::kResultPointer;
}

// Every file listed in the series must be a readable regular file
void check_series_files(const Pile &pile, const std::vector<std::string> &series) {
  for (const auto &name : series) {
    const auto p = pile.dir() / name;
    std::error_code ec;
    if (!stdfs::is_regular_file(p, ec) || !std::ifstream(p, std::ios::binary))
      throw MissingPatchError(name);
  }
}

} // namespace

GenBranchResult generate_branch(const Backend &backend, const Pile &pile,
                                const GenBranchOptions &options) {
  if (!pile.is_initialized())
    throw ConfigError("no series file in " + pile.dir().string());

  GenBranchResult result;
  result.baseline = read_baseline(pile);
  if (auto tip = backend.resolve(options.base_branch))
    result.base = *tip;
  else
    throw InvalidRangeError(options.base_branch, "base branch is not a commit");
  // History moved since the series was generated: still try, the caller warns
  result.baseline_drift = result.baseline && *result.baseline != result.base;

  const auto series = read_series(pile);
  check_series_files(pile, series);

  {
    Workspace ws{backend, result.base};
    for (std::size_t i = 0; i < series.size(); ++i) {
      if (options.progress)
        *options.progress << "Applying: " << series[i] << "\n";
      std::string detail;
      if (!backend.apply_patch(ws.path(), pile.dir() / series[i], detail))
        throw PatchApplyError(series[i], i + 1, detail);
    }
    result.head = backend.head(ws.path());
    ws.close();
  }

  // Keep the computed head reachable even if the branch cannot be moved
  fs::write_file_atomic(result_pointer_path(backend), result.head + "\n");

  // Advisory only: the branch may get checked out right after this check
  const std::string ref = std::string(consts::kHeadsPrefix) + options.target_branch;
  for (const auto &wt : backend.list_worktrees()) {
    if (wt.branch == ref) {
      result.outcome = GenBranchOutcome::Refused;
      result.busy_worktree = wt.path;
      return result;
    }
  }

  backend.set_ref(options.target_branch, result.head, true);
  result.outcome = GenBranchOutcome::Updated;
  return result;
}

std::optional<std::string> read_result_pointer(const Backend &backend) {
  const auto p = result_pointer_path(backend);
  if (!fs::exists(p))
    return std::nullopt;
  auto s = fs::read_file(p);
  strutil::rstrip_newlines(s);
  return s;
}

} // namespace gitpile
