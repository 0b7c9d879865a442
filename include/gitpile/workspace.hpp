#pragma once
#include "gitpile/fs.hpp"

#include <filesystem>
#include <string_view>

namespace gitpile {

class Backend; // fwd

// Detached checkout of one commit in a private temporary directory.
// The checkout is unregistered and its directory deleted when the Workspace
// is destroyed, whichever way the enclosing scope is left. close() does the
// same eagerly and reports failures; the destructor can only try.
class Workspace {
public:
  Workspace(const Backend& backend, std::string_view commit);
  ~Workspace();

  Workspace(const Workspace&) = delete;
  Workspace& operator=(const Workspace&) = delete;

  [[nodiscard]] const std::filesystem::path& path() const { return path_; }

  // Unregister the checkout now; throws BackendError if git refuses
  void close();

private:
  const Backend& backend_;
  fs::TempDir tmp_;
  std::filesystem::path path_;
  bool open_ = false;
};

} // namespace gitpile
