#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace gitpile {

// Validate 40-char lowercase/uppercase hex
auto looks_hex40(std::string_view str) -> bool;

// First 12 characters of a commit id, for messages
auto abbrev(std::string_view hex) -> std::string;

// String helpers
namespace strutil {
  // Strip trailing CR/LF characters in place
  void rstrip_newlines(std::string& str);

  // Strip surrounding spaces, tabs, CR and LF
  std::string trim(std::string_view sv);

  // Split on '\n'; a trailing newline does not produce an empty last element
  std::vector<std::string> split_lines(std::string_view text);

  bool ends_with(std::string_view str, std::string_view suffix);
}

}
