#pragma once
#include <iosfwd>
#include <string>
#include "cli/command.hpp"

namespace gitpile::cli {

struct CommandInfo {
  std::string name;
  std::string args;    // argument synopsis, without the command name
  std::string summary; // one line for the command list
  command_fn fn = nullptr;
};

// Commands are listed in registration order
void register_command(CommandInfo info);
const CommandInfo *find_command(const std::string &name);

void print_usage(std::ostream &os);
void print_command_usage(const CommandInfo &cmd, std::ostream &os);

// implemented in register_commands.cpp
void register_all_commands();

} // namespace gitpile::cli
