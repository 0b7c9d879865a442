#pragma once
#include <cstddef>
#include <set>
#include <string>
#include <string_view>

namespace gitpile {

// Hands out unique filenames inside one pile directory.
// A name already handed out is retried as "<stem>-1<ext>", "<stem>-2<ext>", ...
// so the same sequence of requests always yields the same names. A bare
// ".patch" (nothing left of the subject) is handed out as "patch.patch".
class NameResolver {
public:
  // `max_retries`: how many suffixed candidates one request may try before
  // PatchNamingExhaustedError
  explicit NameResolver(std::size_t max_retries) : max_retries_(max_retries) {}

  std::string claim(std::string_view wanted);

  [[nodiscard]] bool taken(const std::string& name) const { return taken_.contains(name); }

private:
  std::size_t max_retries_;
  std::set<std::string> taken_;
};

} // namespace gitpile
