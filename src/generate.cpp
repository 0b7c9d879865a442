#include "gitpile/generate.hpp"

#include "gitpile/backend.hpp"
#include "gitpile/baseline.hpp"
#include "gitpile/errors.hpp"
#include "gitpile/fs.hpp"
#include "gitpile/naming.hpp"
#include "gitpile/pile.hpp"
#include "gitpile/util.hpp"

#include <set>

namespace stdfs = std::filesystem;

namespace gitpile {

namespace {

// Swap the rendered series into `dest`. Patches go first, the manifest last,
// so an interrupted replace never lists a file that was not written yet.
void replace_pile(const Pile &pile, const stdfs::path &staged,
                  const std::vector<std::string> &series, std::string_view baseline) {
  stdfs::create_directories(pile.dir());

  std::set<std::string> old_files;
  for (const auto &name : read_series(pile)) {
    if (strutil::ends_with(name, consts::kPatchSuffix))
      old_files.insert(stdfs::path(name).filename().string());
  }
  for (auto &name : pile.patch_files())
    old_files.insert(std::move(name));

  for (const auto &name : old_files)
    stdfs::remove(pile.dir() / name);
  for (const auto &name : series)
    stdfs::copy_file(staged / name, pile.dir() / name, stdfs::copy_options::overwrite_existing);

  record_baseline(pile, baseline);
  write_series(pile, series);
}

} // namespace

GenerateResult generate_patches(const Backend &backend, const CommitRange &range,
                                const stdfs::path &dest, const GenerateOptions &options) {
  const auto commits = backend.list_commits(range.base, range.result);
  if (commits.empty()) {
    throw EmptyRangeError("no commits in range " + abbrev(range.base) + ".." +
                          abbrev(range.result));
  }

  const fs::TempDir staging{"git-pile-staging-"};
  const auto scratch = staging.path() / "render";
  const auto staged = staging.path() / "series";
  stdfs::create_directories(scratch);
  stdfs::create_directories(staged);

  NameResolver names{options.naming_retry_limit ? options.naming_retry_limit : commits.size()};

  GenerateResult result{.range = range, .series = {}};
  result.series.reserve(commits.size());
  for (const auto &commit : commits) {
    const auto rendered = backend.render_patch(commit, scratch, RenderOptions{});
    const auto name = names.claim(rendered.filename().string());
    stdfs::rename(rendered, staged / name);
    result.series.push_back(name);
  }

  replace_pile(Pile{dest}, staged, result.series, range.base);
  return result;
}

} // namespace gitpile
