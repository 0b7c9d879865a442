#pragma once
#include "gitpile/range.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace gitpile {

class Backend; // fwd

struct GenerateOptions {
  // Suffixed names tried per colliding patch before giving up; 0 means
  // "number of commits in the range"
  std::size_t naming_retry_limit = 0;
};

struct GenerateResult {
  CommitRange range;
  std::vector<std::string> series;  // patch filenames in application order
};

// Regenerate the pile in `dest` from the commits of `range`.
//
// Every patch is rendered into a private staging directory first; `dest` is
// only touched once all of them rendered and were given unique names. Then
// the old patch files are removed, the new ones copied in, the baseline
// recorded and finally the manifest renamed into place.
GenerateResult generate_patches(const Backend& backend, const CommitRange& range,
                                const std::filesystem::path& dest,
                                const GenerateOptions& options = {});

} // namespace gitpile
