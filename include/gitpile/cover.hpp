#pragma once
#include "gitpile/config.hpp"

#include <cstddef>
#include <ctime>
#include <string>

namespace gitpile {

struct CoverLetter {
  Identity sender;
  std::time_t date = 0;
  int tz_minutes = 0;        // offset east of UTC used in the Date: header
  std::size_t total = 0;     // number of patches following the cover
  std::string baseline;      // base commit of the series
  std::string changelog;     // raw pile diff
};

// Render `letter` in the layout of `git format-patch --cover-letter`
std::string compose_cover_letter(const CoverLetter& letter);

} // namespace gitpile
