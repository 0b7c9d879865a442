#include "cli/registry.hpp"

#include <iostream>
#include <string>

namespace {

bool is_help_flag(const std::string &a) { return a == "-h" || a == "--help"; }

int help(int argc, char **argv) {
  if (argc < 3) {
    gitpile::cli::print_usage(std::cout);
    return 0;
  }
  const auto *cmd = gitpile::cli::find_command(argv[2]);
  if (!cmd) {
    std::cerr << "git-pile: no such command '" << argv[2] << "'\n";
    return 1;
  }
  gitpile::cli::print_command_usage(*cmd, std::cout);
  return 0;
}

} // namespace

int main(int argc, char **argv) {
  gitpile::cli::register_all_commands(); // defined in register_commands.cpp

  if (argc < 2) {
    gitpile::cli::print_usage(std::cerr);
    return gitpile::cli::kUsageError;
  }
  const std::string name = argv[1];
  if (name == "help" || is_help_flag(name))
    return help(argc, argv);

  const auto *cmd = gitpile::cli::find_command(name);
  if (!cmd) {
    std::cerr << "git-pile: '" << name << "' is not a git-pile command. See 'git-pile help'.\n";
    return gitpile::cli::kUsageError;
  }
  if (argc > 2 && is_help_flag(argv[2])) {
    gitpile::cli::print_command_usage(*cmd, std::cout);
    return 0;
  }

  // Handlers see argv starting at the subcommand
  const int rc = cmd->fn(argc - 1, argv + 1);
  if (rc == gitpile::cli::kUsageError)
    gitpile::cli::print_command_usage(*cmd, std::cerr);
  return rc;
}
