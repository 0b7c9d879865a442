#include "cli/command.hpp"
#include "gitpile/backend.hpp"
#include "gitpile/config.hpp"
#include "gitpile/fs.hpp"
#include "gitpile/generate.hpp"
#include "gitpile/pile.hpp"
#include "gitpile/range.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

int cmd_genpatches(int argc, char **argv) {
  std::optional<std::filesystem::path> output;
  std::optional<std::string> range;
  bool force = false;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if ((a == "-o" || a == "--output-directory") && i + 1 < argc) {
      output = argv[++i];
    } else if (a == "-f" || a == "--force") {
      force = true;
    } else if (!a.starts_with("-") && !range) {
      range = a;
    } else {
      return gitpile::cli::kUsageError;
    }
  }

  try {
    const auto backend = gitpile::open_backend(std::filesystem::current_path());
    const auto cfg = gitpile::load_config(*backend);
    for (const auto &key : cfg.ignored_keys)
      std::cerr << "genpatches: warning: ignoring unknown config key " << key << "\n";
    const auto dest = output ? std::filesystem::absolute(*output) : cfg.pile_dir(backend->root());

    // Refuse to clobber a directory that is not a pile unless asked to
    const gitpile::Pile pile{dest};
    if (!force && gitpile::fs::exists(dest) && !std::filesystem::is_empty(dest) &&
        !pile.is_initialized()) {
      std::cerr << "genpatches: " << dest.string()
                << " is not a pile directory (no series file); use -f to write there anyway\n";
      return 1;
    }

    const auto resolved =
        gitpile::resolve_range(*backend, range, cfg.tracking_branch, cfg.result_branch);
    const auto result = gitpile::generate_patches(*backend, resolved, dest);
    std::cout << dest.string() << "\n";
    std::cerr << "genpatches: wrote " << result.series.size() << " patches\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "genpatches: " << e.what() << "\n";
    return 1;
  }
}
