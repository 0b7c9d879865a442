#include "gitpile/naming.hpp"

#include "gitpile/consts.hpp"
#include "gitpile/errors.hpp"

#include <filesystem>
#include <utility>

namespace {

// "<stem><ext>", with ".patch" always treated as the extension
std::pair<std::string, std::string> split_name(std::string_view name) {
  const std::string_view suffix = gitpile::consts::kPatchSuffix;
  if (name.ends_with(suffix))
    return {std::string(name.substr(0, name.size() - suffix.size())), std::string(suffix)};
  const std::filesystem::path p{name};
  return {p.stem().string(), p.extension().string()};
}

} // namespace

namespace gitpile {

std::string NameResolver::claim(std::string_view wanted) {
  auto [stem, ext] = split_name(wanted);
  // Subjects without any filename-safe character render as a bare ".patch"
  if (stem.empty())
    stem = consts::kFallbackStem;

  std::string name = stem + ext;
  if (taken_.insert(name).second)
    return name;

  for (std::size_t i = 1; i <= max_retries_; ++i) {
    std::string candidate = stem + "-" + std::to_string(i) + ext;
    if (taken_.insert(candidate).second)
      return candidate;
  }
  throw PatchNamingExhaustedError("could not find a unique name for '" + name + "' after " +
                                  std::to_string(max_retries_) + " attempts");
}

} // namespace gitpile
