#include "gitpile/extract.hpp"

#include "gitpile/consts.hpp"
#include "gitpile/cover.hpp"
#include "gitpile/errors.hpp"
#include "gitpile/fs.hpp"
#include "gitpile/generate.hpp"
#include "gitpile/time.hpp"
#include "gitpile/util.hpp"
#include "gitpile/workspace.hpp"

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <map>

namespace stdfs = std::filesystem;

namespace gitpile {

namespace {

std::string numbered_name(std::size_t n, std::string_view name) {
  char prefix[16];
  std::snprintf(prefix, sizeof(prefix), "%0*zu-", consts::kNumberWidth, n);
  return prefix + std::string(name);
}

// "Subject: [PATCH] foo" -> "Subject: [PATCH 2/5] foo", header block only
std::string number_subject(std::string patch, std::size_t n, std::size_t total) {
  constexpr std::string_view kPlain = "Subject: [PATCH] ";
  const auto header_end = patch.find("\n\n");
  std::size_t pos = patch.starts_with(kPlain) ? 0 : patch.find("\nSubject: [PATCH] ");
  if (pos == std::string::npos || (header_end != std::string::npos && pos > header_end))
    return patch;
  if (pos != 0)
    ++pos; // skip the newline
  const std::string numbered =
      "Subject: [PATCH " + std::to_string(n) + "/" + std::to_string(total) + "] ";
  patch.replace(pos, kPlain.size(), numbered);
  return patch;
}

void prepare_output_dir(const stdfs::path &dir, bool force) {
  if (!fs::exists(dir))
    return;
  if (!stdfs::is_directory(dir))
    throw Error("output path is not a directory: " + dir.string());
  if (stdfs::is_empty(dir))
    return;
  if (!force)
    throw Error("output directory is not empty: " + dir.string() + " (use -f to overwrite)");
}

} // namespace

std::vector<std::string> select_changed_patches(const std::vector<DiffEntry> &entries) {
  std::vector<std::string> changed;
  for (const auto &e : entries) {
    switch (e.status) {
    case 'D':
      continue; // implied by the manifest change
    case 'A':
    case 'R':
    case 'C':
    case 'M':
    case 'T':
      break;
    default:
      throw UnexpectedDiffStateError(std::string("unexpected diff status '") + e.status +
                                     "' for " + e.path);
    }
    if (strutil::ends_with(e.path, consts::kPatchSuffix))
      changed.push_back(e.path);
  }
  return changed;
}

void order_by_series(std::vector<std::string> &names, const std::vector<std::string> &series) {
  std::map<std::string, std::size_t> position;
  for (std::size_t i = 0; i < series.size(); ++i)
    position.emplace(series[i], i + 1);
  auto pos = [&](const std::string &n) {
    const auto it = position.find(n);
    return it == position.end() ? std::size_t{0} : it->second;
  };
  std::ranges::stable_sort(names, [&](const std::string &a, const std::string &b) {
    return pos(a) < pos(b);
  });
}

FormatPatchResult format_patches(const Backend &backend, const FormatPatchOptions &options) {
  const auto pile_tip = backend.resolve(options.pile_branch);
  if (!pile_tip)
    throw ConfigError("pile branch does not exist: " + options.pile_branch);
  const auto range = resolve_range(backend, options.range, options.base_branch, "HEAD");
  prepare_output_dir(options.output_dir, options.force);

  FormatPatchResult result;
  Workspace ws{backend, *pile_tip};
  const auto generated = generate_patches(backend, range, ws.path());

  backend.stage_all(ws.path());
  auto changed = select_changed_patches(backend.diff_status(ws.path(), *pile_tip));
  if (changed.empty())
    throw NoChangesError("no patches changed relative to " + options.pile_branch);
  order_by_series(changed, generated.series);

  stdfs::create_directories(options.output_dir);
  for (const auto &stale : fs::list_files_with_suffix(options.output_dir, consts::kPatchSuffix))
    stdfs::remove(options.output_dir / stale);

  const std::size_t total = changed.size();
  for (std::size_t i = 0; i < total; ++i) {
    const auto out = options.output_dir / numbered_name(i + 1, changed[i]);
    fs::write_file_atomic(out, number_subject(fs::read_file(ws.path() / changed[i]), i + 1, total));
    result.patches.push_back(out);
  }

  const std::time_t now = std::time(nullptr);
  const CoverLetter letter{.sender = backend.current_user_identity(),
                           .date = now,
                           .tz_minutes = timeutil::local_utc_offset_minutes(now),
                           .total = total,
                           .baseline = range.base,
                           .changelog = backend.diff_text(ws.path(), *pile_tip)};
  result.cover_letter = options.output_dir / consts::kCoverLetterName;
  fs::write_file_atomic(result.cover_letter, compose_cover_letter(letter));
  ws.close();
  return result;
}

} // namespace gitpile
