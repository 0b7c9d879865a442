#include "gitpile/config.hpp"

#include "gitpile/backend.hpp"
#include "gitpile/consts.hpp"
#include "gitpile/errors.hpp"
#include "gitpile/util.hpp"

#include <string_view>

namespace {

std::string full_key(std::string_view key) {
  return std::string(gitpile::consts::kConfigSection) + std::string(key);
}

} // namespace

namespace gitpile {

PileConfig PileConfig::from_entries(const std::map<std::string, std::string> &entries) {
  PileConfig cfg{};
  cfg.tracking_branch = consts::kDefaultTrackingBranch;
  cfg.result_branch = consts::kDefaultResultBranch;

  for (const auto &[key, raw] : entries) {
    std::string_view sv{key};
    if (!sv.starts_with(consts::kConfigSection)) {
      cfg.ignored_keys.push_back(key);
      continue;
    }
    sv.remove_prefix(consts::kConfigSection.size());
    const std::string value = strutil::trim(raw);

    if (sv == consts::kKeyDir) {
      cfg.dir = value;
    } else if (sv == consts::kKeyBranch) {
      cfg.branch = value;
    } else if (sv == consts::kKeyTrackingBranch) {
      if (!value.empty())
        cfg.tracking_branch = value;
    } else if (sv == consts::kKeyResultBranch) {
      if (!value.empty())
        cfg.result_branch = value;
    } else if (sv == consts::kKeyRemoteBranch) {
      cfg.remote_branch = value;
    } else {
      cfg.ignored_keys.push_back(key);
    }
  }

  if (cfg.dir.empty())
    throw ConfigError("pile is not initialized: " + full_key(consts::kKeyDir) + " is not set");
  if (cfg.branch.empty())
    throw ConfigError("pile is not initialized: " + full_key(consts::kKeyBranch) +
                      " is not set");
  return cfg;
}

std::filesystem::path PileConfig::pile_dir(const std::filesystem::path &repo_root) const {
  std::filesystem::path p{dir};
  return p.is_absolute() ? p : repo_root / p;
}

PileConfig load_config(const Backend &backend) {
  return PileConfig::from_entries(backend.config_get_all(consts::kConfigSection));
}

void save_config(const Backend &backend, const PileConfig &config) {
  backend.config_set(full_key(consts::kKeyDir), config.dir);
  backend.config_set(full_key(consts::kKeyBranch), config.branch);
  backend.config_set(full_key(consts::kKeyTrackingBranch), config.tracking_branch);
  backend.config_set(full_key(consts::kKeyResultBranch), config.result_branch);
  if (!config.remote_branch.empty())
    backend.config_set(full_key(consts::kKeyRemoteBranch), config.remote_branch);
}

void clear_config(const Backend &backend) {
  for (const auto key : {consts::kKeyDir, consts::kKeyBranch, consts::kKeyTrackingBranch,
                         consts::kKeyResultBranch, consts::kKeyRemoteBranch}) {
    backend.config_unset_all(full_key(key));
  }
}

} // namespace gitpile
