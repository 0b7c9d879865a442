#include "gitpile/workspace.hpp"

#include "gitpile/backend.hpp"
#include "gitpile/errors.hpp"

namespace gitpile {

Workspace::Workspace(const Backend &backend, std::string_view commit)
    : backend_(backend), tmp_("git-pile-"), path_(tmp_.path() / "checkout") {
  // On failure tmp_ is still released by its own destructor
  backend_.worktree_create(path_, commit);
  open_ = true;
}

void Workspace::close() {
  if (!open_)
    return;
  open_ = false;
  backend_.worktree_remove(path_);
}

Workspace::~Workspace() {
  if (!open_)
    return;
  try {
    backend_.worktree_remove(path_);
  } catch (const BackendError &) {
    // Unwinding from another failure: the directory still goes with tmp_ and
    // `git worktree prune` drops the registration later
  }
}

} // namespace gitpile
