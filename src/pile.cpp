#include "gitpile/pile.hpp"

#include "gitpile/fs.hpp"
#include "gitpile/util.hpp"

#include <sstream>

namespace gitpile {

auto Pile::is_initialized() const -> bool { return fs::exists(series_file()); }

auto Pile::patch_files() const -> std::vector<std::string> {
  return fs::list_files_with_suffix(dir_, consts::kPatchSuffix);
}

std::vector<std::string> parse_series(std::string_view text) {
  std::vector<std::string> names;
  for (const auto &line : strutil::split_lines(text)) {
    std::string name = strutil::trim(line);
    if (name.empty() || name.front() == '#')
      continue; // allow comments
    names.push_back(std::move(name));
  }
  return names;
}

std::vector<std::string> read_series(const Pile &pile) {
  if (!fs::exists(pile.series_file()))
    return {};
  return parse_series(fs::read_file(pile.series_file()));
}

std::string format_series(const std::vector<std::string> &names) {
  std::ostringstream os;
  os << "# Patch series, one file per line, applied in this order\n";
  for (const auto &n : names)
    os << n << consts::kLF;
  return os.str();
}

void write_series(const Pile &pile, const std::vector<std::string> &names) {
  fs::write_file_atomic(pile.series_file(), format_series(names));
}

} // namespace gitpile
