#include "gitpile/baseline.hpp"

#include "test_support.hpp"

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

int main() {
  const fs::path dir = testsupport::unique_temp("gitpile_baseline_test_");
  try {
    fs::create_directories(dir);
    const gitpile::Pile pile{dir};
    if (gitpile::read_baseline(pile)) {
      std::cerr << "baseline present before it was recorded\n";
      return 1;
    }

    const std::string a(40, 'a');
    gitpile::record_baseline(pile, a);
    if (testsupport::slurp(pile.config_file()) != "BASELINE=" + a + "\n") {
      std::cerr << "config file content mismatch\n";
      return 1;
    }
    if (gitpile::read_baseline(pile) != a) {
      std::cerr << "baseline read back mismatch\n";
      return 1;
    }

    const std::string b(40, 'b');
    gitpile::record_baseline(pile, b);
    if (gitpile::read_baseline(pile) != b) {
      std::cerr << "baseline not overwritten\n";
      return 1;
    }

    // Comments, unknown keys and surrounding blanks are tolerated
    testsupport::write_file(pile.config_file(),
                            "# pile config\nOTHER=1\n  BASELINE = " + a + "  \nnoise\n");
    if (gitpile::read_baseline(pile) != a) {
      std::cerr << "baseline not found among other lines\n";
      return 1;
    }

    testsupport::write_file(pile.config_file(), "BASELINE=\n");
    if (gitpile::read_baseline(pile)) {
      std::cerr << "empty BASELINE should read as absent\n";
      return 1;
    }

    std::cout << "baseline OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(dir);
    return 1;
  }
  std::error_code ec;
  fs::remove_all(dir, ec);
  return 0;
}
