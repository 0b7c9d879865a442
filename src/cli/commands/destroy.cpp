#include "cli/command.hpp"
#include "gitpile/backend.hpp"
#include "gitpile/config.hpp"

#include <filesystem>
#include <iostream>

int cmd_destroy(int argc, char ** /*argv*/) {
  if (argc > 1) {
    return gitpile::cli::kUsageError;
  }
  try {
    const auto backend = gitpile::open_backend(std::filesystem::current_path());
    const auto cfg = gitpile::load_config(*backend);
    const auto pile_dir = std::filesystem::weakly_canonical(cfg.pile_dir(backend->root()));

    for (const auto &wt : backend->list_worktrees()) {
      if (std::filesystem::weakly_canonical(wt.path) == pile_dir) {
        backend->worktree_remove(wt.path);
        std::cout << "Removed worktree " << pile_dir.string() << "\n";
      }
    }
    if (backend->resolve(cfg.branch)) {
      backend->delete_branch(cfg.branch);
      std::cout << "Deleted branch " << cfg.branch << "\n";
    }
    gitpile::clear_config(*backend);
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "destroy: " << e.what() << "\n";
    return 1;
  }
}
