#pragma once
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace gitpile {

class Backend; // fwd

struct Identity {
  std::string name;
  std::string email;
};

// Settings of one repository's pile, read once from the pile.* keys.
// Only the keys below are recognized; anything else under pile.* is ignored.
struct PileConfig {
  std::string dir;              // pile.dir, relative to the repository root
  std::string branch;           // pile.branch
  std::string tracking_branch;  // pile.tracking-branch (base branch)
  std::string result_branch;    // pile.result-branch
  std::string remote_branch;    // pile.remote-branch (may be empty)

  std::vector<std::string> ignored_keys;  // unrecognized pile.* keys seen while loading

  // Build from "pile.<key>" -> value pairs. Throws ConfigError when pile.dir or
  // pile.branch is missing or empty; fills defaults for the optional keys.
  static PileConfig from_entries(const std::map<std::string, std::string>& entries);

  // Absolute pile directory for a repository rooted at `repo_root`
  [[nodiscard]] std::filesystem::path pile_dir(const std::filesystem::path& repo_root) const;
};

// Read and validate the pile.* configuration of the backend's repository
PileConfig load_config(const Backend& backend);

// Store every recognized key (remote-branch only when set)
void save_config(const Backend& backend, const PileConfig& config);

// Remove every recognized key
void clear_config(const Backend& backend);

} // namespace gitpile
