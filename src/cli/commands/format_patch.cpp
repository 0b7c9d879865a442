#include "cli/command.hpp"
#include "gitpile/backend.hpp"
#include "gitpile/config.hpp"
#include "gitpile/consts.hpp"
#include "gitpile/extract.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

int cmd_format_patch(int argc, char **argv) {
  std::filesystem::path output{gitpile::consts::kDefaultFormatDir};
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
      std::cerr << "format-patch: warning: ignoring unknown config key " << key << "\n";

    const gitpile::FormatPatchOptions options{.pile_branch = cfg.branch,
                                              .range = range,
                                              .base_branch = cfg.tracking_branch,
                                              .output_dir = std::filesystem::absolute(output),
                                              .force = force};
    const auto result = gitpile::format_patches(*backend, options);
    std::cout << result.cover_letter.string() << "\n";
    for (const auto &p : result.patches)
      std::cout << p.string() << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "format-patch: " << e.what() << "\n";
    return 1;
  }
}
