#include "gitpile/pile.hpp"

#include "test_support.hpp"

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;
using testsupport::slurp;
using testsupport::write_file;

int main() {
  const fs::path dir = testsupport::unique_temp("gitpile_series_test_");
  try {
    const auto parsed = gitpile::parse_series("# header\n\nfirst.patch\n  second.patch \n"
                                              "# second.patch is next\nthird.patch");
    if (parsed != std::vector<std::string>{"first.patch", "second.patch", "third.patch"}) {
      std::cerr << "parse_series mismatch\n";
      return 1;
    }

    const gitpile::Pile pile{dir};
    if (pile.is_initialized()) {
      std::cerr << "pile initialized before any manifest was written\n";
      return 1;
    }
    if (!gitpile::read_series(pile).empty()) {
      std::cerr << "missing manifest should read as an empty series\n";
      return 1;
    }

    const std::vector<std::string> names{"b.patch", "a.patch", "c.patch"};
    gitpile::write_series(pile, names);
    if (!pile.is_initialized()) {
      std::cerr << "pile not initialized after write_series\n";
      return 1;
    }
    const std::string text = slurp(pile.series_file());
    if (text.empty() || text.front() != '#') {
      std::cerr << "manifest lacks header comment\n";
      return 1;
    }
    if (gitpile::read_series(pile) != names) {
      std::cerr << "manifest order not preserved\n";
      return 1;
    }
    if (fs::exists(dir / "series.tmp")) {
      std::cerr << "temporary manifest left behind\n";
      return 1;
    }

    write_file(dir / "z.patch", "z");
    write_file(dir / "a.patch", "a");
    write_file(dir / "notes.txt", "n");
    fs::create_directories(dir / "sub.patch");
    if (pile.patch_files() != std::vector<std::string>{"a.patch", "z.patch"}) {
      std::cerr << "patch_files should list only regular *.patch files, sorted\n";
      return 1;
    }

    std::cout << "series manifest OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(dir);
    return 1;
  }
  std::error_code ec;
  fs::remove_all(dir, ec);
  return 0;
}
