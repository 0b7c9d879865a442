#include "gitpile/cover.hpp"

#include "gitpile/time.hpp"

#include <sstream>

namespace gitpile {

std::string compose_cover_letter(const CoverLetter &letter) {
  std::ostringstream os;
  os << "From 0000000000000000000000000000000000000000 Mon Sep 17 00:00:00 2001\n";
  os << "From: " << letter.sender.name << " <" << letter.sender.email << ">\n";
  os << "Date: " << timeutil::rfc2822_date(letter.date, letter.tz_minutes) << "\n";
  os << "Subject: [PATCH 0/" << letter.total << "] *** SUBJECT HERE ***\n";
  os << "\n";
  os << "*** BLURB HERE ***\n";
  os << "\n";
  os << "---\n";
  os << "Changes in the pile:\n\n";
  os << letter.changelog;
  if (!letter.changelog.empty() && letter.changelog.back() != '\n')
    os << "\n";
  os << "\n";
  os << "base-commit: " << letter.baseline << "\n";
  return os.str();
}

} // namespace gitpile
