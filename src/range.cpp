#include "gitpile/range.hpp"

#include "gitpile/backend.hpp"
#include "gitpile/errors.hpp"

#include <tuple>

namespace gitpile {

std::pair<std::string, std::string> split_range(std::string_view spec) {
  const auto dots = spec.find("..");
  if (dots == std::string_view::npos)
    throw InvalidRangeError(std::string(spec), "expected BASE..RESULT");
  std::string base(spec.substr(0, dots));
  std::string result(spec.substr(dots + 2));
  if (result.find("..") != std::string::npos || (!result.empty() && result.front() == '.'))
    throw InvalidRangeError(std::string(spec), "expected BASE..RESULT");
  if (base.empty())
    base = "HEAD";
  if (result.empty())
    result = "HEAD";
  return {base, result};
}

CommitRange resolve_range(const Backend &backend, const std::optional<std::string> &spec,
                          std::string_view default_base, std::string_view default_result) {
  std::string base_ref{default_base};
  std::string result_ref{default_result};
  if (spec)
    std::tie(base_ref, result_ref) = split_range(*spec);

  CommitRange range;
  if (auto base = backend.resolve(base_ref))
    range.base = *base;
  else
    throw InvalidRangeError(base_ref, "not a commit");
  if (auto result = backend.resolve(result_ref))
    range.result = *result;
  else
    throw InvalidRangeError(result_ref, "not a commit");
  return range;
}

} // namespace gitpile
