#include "cli/command.hpp"
#include "gitpile/backend.hpp"
#include "gitpile/config.hpp"
#include "gitpile/consts.hpp"
#include "gitpile/fs.hpp"
#include "gitpile/pile.hpp"

#include <filesystem>
#include <iostream>
#include <string>

int cmd_init(int argc, char **argv) {
  gitpile::PileConfig cfg{};
  cfg.dir = gitpile::consts::kDefaultDir;
  cfg.branch = gitpile::consts::kDefaultBranch;
  cfg.tracking_branch = gitpile::consts::kDefaultTrackingBranch;
  cfg.result_branch = gitpile::consts::kDefaultResultBranch;

  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    const bool has_value = i + 1 < argc;
    if ((a == "-d" || a == "--dir") && has_value) {
      cfg.dir = argv[++i];
    } else if ((a == "-b" || a == "--branch") && has_value) {
      cfg.branch = argv[++i];
    } else if ((a == "-t" || a == "--tracking-branch") && has_value) {
      cfg.tracking_branch = argv[++i];
    } else if ((a == "-R" || a == "--result-branch") && has_value) {
      cfg.result_branch = argv[++i];
    } else if ((a == "-r" || a == "--remote-branch") && has_value) {
      cfg.remote_branch = argv[++i];
    } else {
      return gitpile::cli::kUsageError;
    }
  }

  try {
    const auto backend = gitpile::open_backend(std::filesystem::current_path());
    if (backend->config_get_all(gitpile::consts::kConfigSection).contains("pile.dir")) {
      std::cerr << "init: pile already initialized (run `git-pile destroy` first)\n";
      return 1;
    }

    const auto pile_dir = cfg.pile_dir(backend->root());
    if (gitpile::fs::exists(pile_dir) && !std::filesystem::is_empty(pile_dir)) {
      std::cerr << "init: " << pile_dir.string() << " already exists and is not empty\n";
      return 1;
    }

    if (!backend->resolve(cfg.branch)) {
      const auto root = backend->create_root_commit(
          {{std::string(gitpile::consts::kSeriesFile), gitpile::format_series({})},
           {std::string(gitpile::consts::kConfigFile), ""}},
          "Initial git-pile configuration");
      backend->set_ref(cfg.branch, root, false);
    }
    backend->worktree_add_branch(pile_dir, cfg.branch);
    gitpile::save_config(*backend, cfg);

    std::cout << "Initialized pile in " << pile_dir.string() << " (branch " << cfg.branch
              << ", tracking " << cfg.tracking_branch << ")\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "init: " << e.what() << "\n";
    return 1;
  }
}
