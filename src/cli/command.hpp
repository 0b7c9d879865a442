#pragma once

namespace gitpile::cli {

// Handler for one subcommand; argv[0] is the subcommand name
using command_fn = int (*)(int argc, char **argv);

// Returned by a handler that rejected its arguments; the caller prints the synopsis
inline constexpr int kUsageError = 2;

} // namespace gitpile::cli
