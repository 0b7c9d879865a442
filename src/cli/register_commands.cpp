#include "cli/registry.hpp"

int cmd_init(int argc, char **argv);
int cmd_genpatches(int argc, char **argv);
int cmd_genbranch(int argc, char **argv);
int cmd_format_patch(int argc, char **argv);
int cmd_destroy(int argc, char **argv);

namespace gitpile::cli {

// Listed in the order a new pile goes through them
void register_all_commands() {
  register_command({.name = "init",
                    .args = "[-d DIR] [-b BRANCH] [-t TRACKING_BRANCH] [-R RESULT_BRANCH] "
                            "[-r REMOTE_BRANCH]",
                    .summary = "Create the pile branch, its worktree and the pile.* settings",
                    .fn = ::cmd_init});
  register_command({.name = "genpatches",
                    .args = "[-o DIR] [-f] [BASE..RESULT]",
                    .summary = "Regenerate the pile from a range of commits",
                    .fn = ::cmd_genpatches});
  register_command({.name = "genbranch",
                    .args = "[-b BRANCH] [-v]",
                    .summary = "Rebuild the result branch by applying the pile",
                    .fn = ::cmd_genbranch});
  register_command({.name = "format-patch",
                    .args = "[-o DIR] [-f] [BASE..RESULT]",
                    .summary = "Write the patches that changed since the last pile commit",
                    .fn = ::cmd_format_patch});
  register_command({.name = "destroy",
                    .args = "",
                    .summary = "Remove the pile worktree, branch and configuration",
                    .fn = ::cmd_destroy});
}

} // namespace gitpile::cli
