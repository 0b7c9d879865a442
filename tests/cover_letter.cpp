#include "gitpile/cover.hpp"
#include "gitpile/time.hpp"

#include <iostream>

int main() {
  using gitpile::timeutil::rfc2822_date;
  using gitpile::timeutil::tz_offset_string;

  if (rfc2822_date(0, 0) != "Thu, 1 Jan 1970 00:00:00 +0000") {
    std::cerr << "epoch date: " << rfc2822_date(0, 0) << "\n";
    return 1;
  }
  if (rfc2822_date(0, 180) != "Thu, 1 Jan 1970 03:00:00 +0300") {
    std::cerr << "offset date: " << rfc2822_date(0, 180) << "\n";
    return 1;
  }
  if (tz_offset_string(-420) != "-0700") {
    std::cerr << "negative offset wrong\n";
    return 1;
  }

  const gitpile::CoverLetter letter{.sender = {.name = "Ann Example", .email = "ann@example.com"},
                                    .date = 1700000000,
                                    .tz_minutes = 0,
                                    .total = 3,
                                    .baseline = std::string(40, 'c'),
                                    .changelog = "diff --git a/series b/series\n+New.patch"};
  const auto text = gitpile::compose_cover_letter(letter);
  const std::string expected =
      "From 0000000000000000000000000000000000000000 Mon Sep 17 00:00:00 2001\n"
      "From: Ann Example <ann@example.com>\n"
      "Date: Tue, 14 Nov 2023 22:13:20 +0000\n"
      "Subject: [PATCH 0/3] *** SUBJECT HERE ***\n"
      "\n"
      "*** BLURB HERE ***\n"
      "\n"
      "---\n"
      "Changes in the pile:\n"
      "\n"
      "diff --git a/series b/series\n"
      "+New.patch\n"
      "\n"
      "base-commit: " + std::string(40, 'c') + "\n";
  if (text != expected) {
    std::cerr << "cover letter mismatch:\n" << text;
    return 1;
  }

  std::cout << "cover letter OK\n";
  return 0;
}
