#pragma once
#include "gitpile/consts.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gitpile {

// A directory holding a series manifest, a baseline record and patch documents.
class Pile {
public:
  explicit Pile(std::filesystem::path dir) : dir_(std::move(dir)) {}

  [[nodiscard]] const std::filesystem::path& dir() const { return dir_; }
  [[nodiscard]] auto series_file() const -> std::filesystem::path {
    return dir_ / consts::kSeriesFile;
  }
  [[nodiscard]] auto config_file() const -> std::filesystem::path {
    return dir_ / consts::kConfigFile;
  }
  // A pile exists once it has a manifest
  [[nodiscard]] auto is_initialized() const -> bool;

  // Patch documents present on disk, sorted by name
  [[nodiscard]] auto patch_files() const -> std::vector<std::string>;

private:
  std::filesystem::path dir_;
};

// Parse manifest text: one filename per line, '#' comments and blank lines skipped
std::vector<std::string> parse_series(std::string_view text);

// Read the manifest of `pile`; a missing manifest is an empty series
std::vector<std::string> read_series(const Pile& pile);

// Manifest text for `names`: a header comment, then one name per line
std::string format_series(const std::vector<std::string>& names);

// Overwrite the manifest with a header comment and `names` in order.
// Goes through a temporary file renamed into place.
void write_series(const Pile& pile, const std::vector<std::string>& names);

} // namespace gitpile
