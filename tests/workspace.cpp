#include "gitpile/workspace.hpp"

#include "test_support.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

static bool registered(const gitpile::Backend &backend, const fs::path &p) {
  const auto target = fs::weakly_canonical(p);
  for (const auto &wt : backend.list_worktrees()) {
    if (fs::weakly_canonical(wt.path) == target)
      return true;
  }
  return false;
}

int main() {
  try {
    testsupport::TestRepo repo{"gitpile_workspace_test_"};
    const auto first = repo.commit_file("a.txt", "first\n", "first");
    (void)repo.commit_file("a.txt", "second\n", "second");

    fs::path seen;
    {
      const gitpile::Workspace ws{repo.backend(), first};
      seen = ws.path();
      if (testsupport::slurp(ws.path() / "a.txt") != "first\n") {
        std::cerr << "workspace not checked out at the requested commit\n";
        return 1;
      }
      if (!registered(repo.backend(), ws.path())) {
        std::cerr << "workspace not registered as a worktree\n";
        return 1;
      }
      if (repo.backend().head(ws.path()) != first) {
        std::cerr << "workspace HEAD mismatch\n";
        return 1;
      }
    }
    if (fs::exists(seen) || fs::exists(seen.parent_path()) || registered(repo.backend(), seen)) {
      std::cerr << "workspace left behind after scope end\n";
      return 1;
    }

    // Eager close unregisters immediately and leaves nothing for the destructor
    {
      gitpile::Workspace ws{repo.backend(), first};
      seen = ws.path();
      ws.close();
      if (fs::exists(seen) || registered(repo.backend(), seen)) {
        std::cerr << "close() did not remove the checkout\n";
        return 1;
      }
      ws.close();
    }
    if (fs::exists(seen.parent_path())) {
      std::cerr << "temporary directory kept after a closed workspace\n";
      return 1;
    }

    // Released on failure too
    try {
      const gitpile::Workspace ws{repo.backend(), first};
      seen = ws.path();
      throw std::runtime_error("boom");
    } catch (const std::runtime_error &) {
    }
    if (fs::exists(seen) || registered(repo.backend(), seen)) {
      std::cerr << "workspace leaked when the scope threw\n";
      return 1;
    }

    // An unknown commit fails without leaving a temp directory registered
    bool threw = false;
    try {
      const gitpile::Workspace ws{repo.backend(), std::string(40, '0')};
    } catch (const std::exception &) {
      threw = true;
    }
    if (!threw || repo.backend().list_worktrees().size() != 1) {
      std::cerr << "bad commit should fail cleanly\n";
      return 1;
    }

    std::cout << "workspace OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
