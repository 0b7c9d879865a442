#include "cli/registry.hpp"

#include <algorithm>
#include <iomanip>
#include <ostream>
#include <utility>
#include <vector>

namespace gitpile::cli {

static std::vector<CommandInfo> &table() {
  static std::vector<CommandInfo> t;
  return t;
}

void register_command(CommandInfo info) {
  auto &t = table();
  const auto it = std::ranges::find(t, info.name, &CommandInfo::name);
  if (it != t.end())
    *it = std::move(info);
  else
    t.push_back(std::move(info));
}

const CommandInfo *find_command(const std::string &name) {
  const auto &t = table();
  const auto it = std::ranges::find(t, name, &CommandInfo::name);
  return it == t.end() ? nullptr : &*it;
}

void print_usage(std::ostream &os) {
  std::size_t width = 0;
  for (const auto &cmd : table())
    width = std::max(width, cmd.name.size());

  os << "usage: git-pile <command> [<args>]\n"
     << "       git-pile help <command>\n\n"
     << "Keep a branch and a directory of patch files in sync.\n\n"
     << "commands:\n";
  for (const auto &cmd : table()) {
    os << "   " << std::left << std::setw(static_cast<int>(width)) << cmd.name << "   "
       << cmd.summary << "\n";
  }
}

void print_command_usage(const CommandInfo &cmd, std::ostream &os) {
  os << "usage: git-pile " << cmd.name;
  if (!cmd.args.empty())
    os << " " << cmd.args;
  os << "\n\n    " << cmd.summary << "\n";
}

} // namespace gitpile::cli
