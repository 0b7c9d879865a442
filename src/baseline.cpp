#include "gitpile/baseline.hpp"

#include "gitpile/consts.hpp"
#include "gitpile/fs.hpp"
#include "gitpile/util.hpp"

#include <string_view>

namespace gitpile {

void record_baseline(const Pile &pile, std::string_view commit) {
  std::string text(consts::kBaselineKey);
  text += '=';
  text += commit;
  text += consts::kLF;
  fs::write_file_atomic(pile.config_file(), text);
}

std::optional<std::string> read_baseline(const Pile &pile) {
  if (!fs::exists(pile.config_file()))
    return std::nullopt;

  std::optional<std::string> baseline;
  for (const auto &line : strutil::split_lines(fs::read_file(pile.config_file()))) {
    std::string_view sv{line};
    if (sv.empty() || sv[0] == '#')
      continue;
    const auto eq = sv.find('=');
    if (eq == std::string_view::npos)
      continue;
    // Keys other than BASELINE are not part of the pile config and are skipped
    if (strutil::trim(sv.substr(0, eq)) != consts::kBaselineKey)
      continue;
    std::string value = strutil::trim(sv.substr(eq + 1));
    if (!value.empty())
      baseline = std::move(value);
  }
  return baseline;
}

} // namespace gitpile
