#include "cli/command.hpp"
#include "gitpile/backend.hpp"
#include "gitpile/config.hpp"
#include "gitpile/pile.hpp"
#include "gitpile/reconstruct.hpp"
#include "gitpile/util.hpp"

#include <filesystem>
#include <iostream>
#include <string>

int cmd_genbranch(int argc, char **argv) {
  std::string branch;
  bool verbose = false;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if ((a == "-b" || a == "--branch") && i + 1 < argc) {
      branch = argv[++i];
    } else if (a == "-v" || a == "--verbose") {
      verbose = true;
    } else {
      return gitpile::cli::kUsageError;
    }
  }

  try {
    const auto backend = gitpile::open_backend(std::filesystem::current_path());
    const auto cfg = gitpile::load_config(*backend);
    for (const auto &key : cfg.ignored_keys)
      std::cerr << "genbranch: warning: ignoring unknown config key " << key << "\n";
    const gitpile::Pile pile{cfg.pile_dir(backend->root())};

    const gitpile::GenBranchOptions options{
        .base_branch = cfg.tracking_branch,
        .target_branch = branch.empty() ? cfg.result_branch : branch,
        .progress = verbose ? &std::cerr : nullptr};
    const auto result = gitpile::generate_branch(*backend, pile, options);

    if (!result.baseline) {
      std::cerr << "genbranch: warning: no baseline recorded in " << pile.config_file().string()
                << "\n";
    } else if (result.baseline_drift) {
      std::cerr << "genbranch: warning: baseline " << gitpile::abbrev(*result.baseline)
                << " differs from " << cfg.tracking_branch << " ("
                << gitpile::abbrev(result.base) << "); the series was applied on the latter\n";
    }

    if (result.outcome == gitpile::GenBranchOutcome::Refused) {
      std::cerr << "genbranch: branch '" << options.target_branch << "' is checked out at "
                << result.busy_worktree.string() << "; not updating it\n";
      std::cerr << "genbranch: result is " << result.head << " (recorded in PILE_RESULT_HEAD)\n";
      return 1;
    }
    std::cout << "Branch '" << options.target_branch << "' now at " << result.head << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "genbranch: " << e.what() << "\n";
    return 1;
  }
}
