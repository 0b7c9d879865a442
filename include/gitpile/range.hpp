#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace gitpile {

class Backend; // fwd

struct CommitRange {
  std::string base;    // resolved commit id
  std::string result;  // resolved commit id
};

// Split "A..B" into its two tokens; an empty side means HEAD.
// Throws InvalidRangeError if `spec` is not of that form.
std::pair<std::string, std::string> split_range(std::string_view spec);

// Resolve `spec` ("A..B"), or default_base..default_result when it is absent.
// Both endpoints must name existing commits; InvalidRangeError names the one that does not.
CommitRange resolve_range(const Backend& backend, const std::optional<std::string>& spec,
                          std::string_view default_base, std::string_view default_result);

} // namespace gitpile
