#include "gitpile/backend.hpp"

#include "gitpile/errors.hpp"
#include "gitpile/process.hpp"
#include "gitpile/util.hpp"

#include <filesystem>
#include <utility>

namespace stdfs = std::filesystem;

namespace {

std::string describe(const std::vector<std::string> &args) {
  std::string s = "git";
  for (const auto &a : args) {
    s.push_back(' ');
    s.append(a);
  }
  return s;
}

std::string first_line(const std::string &text) {
  const auto nl = text.find('\n');
  return nl == std::string::npos ? text : text.substr(0, nl);
}

// Split NUL-terminated records (git -z output)
std::vector<std::string> split_nul(const std::string &text) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (start < text.size()) {
    auto end = text.find('\0', start);
    if (end == std::string::npos)
      end = text.size();
    out.emplace_back(text.substr(start, end - start));
    start = end + 1;
  }
  return out;
}

} // namespace

namespace gitpile {

GitBackend::GitBackend(stdfs::path root, std::string git)
    : root_(std::move(root)), git_(std::move(git)) {}

std::string GitBackend::git_in(const stdfs::path &dir, std::vector<std::string> args,
                               const std::string &stdin_data) const {
  std::vector<std::string> argv{git_, "-C", dir.string()};
  argv.insert(argv.end(), args.begin(), args.end());
  auto res = run_process(argv, ProcessOptions{.cwd = std::nullopt, .stdin_data = stdin_data});
  if (!res.ok()) {
    throw BackendError(describe(args) + " failed (exit " + std::to_string(res.exit_code) +
                       "): " + strutil::trim(res.err));
  }
  return std::move(res.out);
}

stdfs::path GitBackend::common_dir() const {
  auto out = git({"rev-parse", "--path-format=absolute", "--git-common-dir"});
  strutil::rstrip_newlines(out);
  return stdfs::path(out);
}

std::optional<std::string> GitBackend::resolve(std::string_view ref) const {
  if (ref.empty() || ref.front() == '-')
    return std::nullopt;
  const std::vector<std::string> argv{git_, "-C", root_.string(), "rev-parse", "--verify",
                                      "--quiet", std::string(ref) + "^{commit}"};
  auto res = run_process(argv);
  if (!res.ok())
    return std::nullopt;
  strutil::rstrip_newlines(res.out);
  if (!looks_hex40(res.out))
    return std::nullopt;
  return res.out;
}

std::vector<std::string> GitBackend::list_commits(std::string_view base,
                                                  std::string_view result) const {
  const auto out = git({"rev-list", "--reverse", "--no-merges", std::string(result),
                        "^" + std::string(base), "--"});
  std::vector<std::string> commits;
  for (auto &line : strutil::split_lines(out)) {
    if (!line.empty())
      commits.push_back(line);
  }
  return commits;
}

stdfs::path GitBackend::render_patch(std::string_view commit, const stdfs::path &out_dir,
                                     const RenderOptions &options) const {
  // --no-thread keeps Message-Id headers (which differ on every run) out of the patch
  std::vector<std::string> args{"format-patch", "-1",          "--zero-commit",
                                "--no-thread",  "--no-cover-letter",
                                "-o",           stdfs::absolute(out_dir).string()};
  if (options.suppress_signature)
    args.emplace_back("--no-signature");
  if (options.suppress_numbering)
    args.emplace_back("--no-numbered");
  args.emplace_back(std::string(commit));

  auto out = git(std::move(args));
  strutil::rstrip_newlines(out);
  stdfs::path written = first_line(out);
  if (written.is_relative())
    written = root_ / written;

  if (options.suppress_numbering) {
    // "0001-Subject.patch" -> "Subject.patch"
    const std::string name = written.filename().string();
    const auto dash = name.find('-');
    if (dash != std::string::npos && dash > 0 &&
        name.find_first_not_of("0123456789") == dash) {
      const auto renamed = written.parent_path() / name.substr(dash + 1);
      stdfs::rename(written, renamed);
      written = renamed;
    }
  }
  return written;
}

bool GitBackend::apply_patch(const stdfs::path &dir, const stdfs::path &patch,
                             std::string &detail) const {
  const std::vector<std::string> argv{git_, "-C", dir.string(), "am", "--quiet",
                                      stdfs::absolute(patch).string()};
  auto res = run_process(argv);
  if (res.ok())
    return true;
  detail = strutil::trim(res.err.empty() ? res.out : res.err);
  return false;
}

void GitBackend::stage_all(const stdfs::path &dir) const {
  // --force: the user's ignore rules must not hide generated patches
  (void)git_in(dir, {"add", "--all", "--force", "--", "."});
}

std::vector<DiffEntry> GitBackend::diff_status(const stdfs::path &dir,
                                               std::string_view old_commit) const {
  const auto out = git_in(dir, {"diff", "--cached", "--name-status", "-z", "-M", "--no-ext-diff",
                                std::string(old_commit), "--"});
  const auto fields = split_nul(out);
  std::vector<DiffEntry> entries;
  for (std::size_t i = 0; i < fields.size();) {
    const std::string &status = fields[i++];
    if (status.empty())
      continue;
    const char letter = status.front();
    // Renames and copies list the old path before the new one
    if (letter == 'R' || letter == 'C')
      ++i;
    if (i >= fields.size())
      throw BackendError("truncated diff status output for " + dir.string());
    entries.push_back(DiffEntry{.status = letter, .path = fields[i++]});
  }
  return entries;
}

std::string GitBackend::diff_text(const stdfs::path &dir, std::string_view old_commit) const {
  return git_in(dir, {"diff", "--cached", "-M", "--no-color", "--no-ext-diff",
                      std::string(old_commit), "--"});
}

std::string GitBackend::head(const stdfs::path &dir) const {
  auto out = git_in(dir, {"rev-parse", "--verify", "HEAD"});
  strutil::rstrip_newlines(out);
  return out;
}

void GitBackend::worktree_create(const stdfs::path &path, std::string_view commit) const {
  (void)git({"worktree", "add", "--quiet", "--detach", path.string(), std::string(commit)});
}

void GitBackend::worktree_add_branch(const stdfs::path &path, std::string_view branch) const {
  (void)git({"worktree", "add", "--quiet", path.string(), std::string(branch)});
}

void GitBackend::worktree_remove(const stdfs::path &path) const {
  const std::vector<std::string> argv{git_,     "-C",      root_.string(),
                                      "worktree", "remove", "--force",
                                      path.string()};
  if (run_process(argv).ok())
    return;
  // The directory may already be gone: drop the stale registration instead
  (void)git({"worktree", "prune"});
  const auto target = stdfs::weakly_canonical(path);
  for (const auto &wt : list_worktrees()) {
    if (stdfs::weakly_canonical(wt.path) == target)
      throw BackendError("could not remove worktree " + path.string());
  }
}

std::vector<WorktreeInfo> GitBackend::list_worktrees() const {
  const auto out = git({"worktree", "list", "--porcelain"});
  std::vector<WorktreeInfo> list;
  for (const auto &line : strutil::split_lines(out)) {
    if (line.starts_with("worktree ")) {
      list.push_back(WorktreeInfo{.path = line.substr(9), .branch = {}});
    } else if (line.starts_with("branch ") && !list.empty()) {
      list.back().branch = line.substr(7);
    }
  }
  return list;
}

void GitBackend::set_ref(std::string_view branch, std::string_view commit, bool force) const {
  std::vector<std::string> args{"update-ref", "refs/heads/" + std::string(branch),
                                std::string(commit)};
  if (!force)
    args.emplace_back(""); // must not exist yet
  (void)git(std::move(args));
}

void GitBackend::delete_branch(std::string_view branch) const {
  (void)git({"update-ref", "-d", "refs/heads/" + std::string(branch)});
}

std::string GitBackend::create_root_commit(const std::map<std::string, std::string> &files,
                                           std::string_view message) const {
  std::string listing;
  for (const auto &[name, content] : files) {
    auto blob = git({"hash-object", "-w", "--stdin"}, content);
    strutil::rstrip_newlines(blob);
    listing += "100644 blob " + blob + "\t" + name + "\n";
  }
  auto tree = git({"mktree"}, listing);
  strutil::rstrip_newlines(tree);
  auto commit = git({"commit-tree", tree, "-m", std::string(message)});
  strutil::rstrip_newlines(commit);
  return commit;
}

Identity GitBackend::current_user_identity() const {
  // "Name <email> 1714412345 +0300"
  const auto ident = first_line(git({"var", "GIT_COMMITTER_IDENT"}));
  Identity id{};
  const auto lt = ident.find(" <");
  const auto gt = ident.find('>', lt == std::string::npos ? 0 : lt);
  if (lt == std::string::npos || gt == std::string::npos)
    throw BackendError("unparsable identity: " + ident);
  id.name = ident.substr(0, lt);
  id.email = ident.substr(lt + 2, gt - lt - 2);
  return id;
}

std::map<std::string, std::string> GitBackend::config_get_all(std::string_view prefix) const {
  std::string pattern = "^";
  for (const char c : prefix) {
    if (c == '.')
      pattern += "\\";
    pattern += c;
  }
  const std::vector<std::string> argv{git_, "-C", root_.string(), "config", "-z",
                                      "--get-regexp", pattern};
  auto res = run_process(argv);
  std::map<std::string, std::string> entries;
  if (res.exit_code == 1) // nothing matched
    return entries;
  if (!res.ok())
    throw BackendError("git config --get-regexp failed: " + strutil::trim(res.err));
  // Each record is "key\nvalue" (value absent for valueless booleans)
  for (const auto &record : split_nul(res.out)) {
    if (record.empty())
      continue;
    const auto nl = record.find('\n');
    if (nl == std::string::npos)
      entries[record] = "";
    else
      entries[record.substr(0, nl)] = record.substr(nl + 1);
  }
  return entries;
}

void GitBackend::config_set(std::string_view key, std::string_view value) const {
  (void)git({"config", std::string(key), std::string(value)});
}

void GitBackend::config_unset_all(std::string_view key) const {
  const std::vector<std::string> argv{git_, "-C", root_.string(), "config", "--unset-all",
                                      std::string(key)};
  auto res = run_process(argv);
  if (res.ok() || res.exit_code == 5) // 5: key was not set
    return;
  throw BackendError("git config --unset-all " + std::string(key) +
                     " failed: " + strutil::trim(res.err));
}

std::unique_ptr<Backend> open_backend(const stdfs::path &dir) {
  // The first entry is always the main worktree, also when `dir` is a linked one
  const std::vector<std::string> argv{"git", "-C", dir.string(), "worktree", "list", "--porcelain"};
  auto res = run_process(argv);
  if (!res.ok())
    throw BackendError("not a git repository: " + dir.string());
  const auto lines = strutil::split_lines(res.out);
  if (lines.empty() || !lines.front().starts_with("worktree "))
    throw BackendError("cannot determine the main worktree of " + dir.string());
  return std::make_unique<GitBackend>(stdfs::path(lines.front().substr(9)));
}

} // namespace gitpile
