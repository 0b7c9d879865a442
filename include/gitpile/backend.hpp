#pragma once
#include "gitpile/config.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gitpile {

struct RenderOptions {
  bool suppress_signature = true;  // no "-- \n<version>" trailer
  bool suppress_numbering = true;  // no "[PATCH n/m]" subject, no "NNNN-" filename prefix
};

struct DiffEntry {
  char status;       // first letter of git's status: A, C, D, M, R, T, ...
  std::string path;  // new path (the only path for non rename/copy entries)
};

struct WorktreeInfo {
  std::filesystem::path path;
  std::string branch;  // full ref ("refs/heads/x"), empty when detached
};

// Version-control capability provider consumed by every pile operation.
// Commits are opaque 40-hex ids.
class Backend {
public:
  virtual ~Backend() = default;

  // Main checkout this backend operates on
  [[nodiscard]] virtual const std::filesystem::path& root() const = 0;
  // Directory shared by all worktrees (".git" of the main checkout)
  [[nodiscard]] virtual std::filesystem::path common_dir() const = 0;

  // Commit id for `ref`, or nullopt if it does not name a commit
  [[nodiscard]] virtual std::optional<std::string> resolve(std::string_view ref) const = 0;
  // Commits in (base, result], oldest first
  [[nodiscard]] virtual std::vector<std::string> list_commits(std::string_view base,
                                                              std::string_view result) const = 0;
  // Render `commit` as one patch document in `out_dir`; returns the written file
  virtual std::filesystem::path render_patch(std::string_view commit,
                                             const std::filesystem::path& out_dir,
                                             const RenderOptions& options) const = 0;

  // Mailbox-style application of `patch` on top of the checkout at `dir`.
  // Returns false on conflict or malformed patch, with git's message in `detail`.
  virtual bool apply_patch(const std::filesystem::path& dir,
                           const std::filesystem::path& patch, std::string& detail) const = 0;
  // Stage every change (additions, modifications, deletions) of the checkout at `dir`
  virtual void stage_all(const std::filesystem::path& dir) const = 0;
  // Staged tree of `dir` compared against `old_commit`, with rename detection
  [[nodiscard]] virtual std::vector<DiffEntry> diff_status(const std::filesystem::path& dir,
                                                           std::string_view old_commit) const = 0;
  [[nodiscard]] virtual std::string diff_text(const std::filesystem::path& dir,
                                              std::string_view old_commit) const = 0;
  // HEAD commit of the checkout at `dir`
  [[nodiscard]] virtual std::string head(const std::filesystem::path& dir) const = 0;

  virtual void worktree_create(const std::filesystem::path& path, std::string_view commit) const = 0;
  virtual void worktree_add_branch(const std::filesystem::path& path,
                                   std::string_view branch) const = 0;
  virtual void worktree_remove(const std::filesystem::path& path) const = 0;
  [[nodiscard]] virtual std::vector<WorktreeInfo> list_worktrees() const = 0;

  // Point refs/heads/<branch> at `commit`; without `force` an existing branch is an error
  virtual void set_ref(std::string_view branch, std::string_view commit, bool force) const = 0;
  virtual void delete_branch(std::string_view branch) const = 0;
  // Parentless commit whose tree holds `files` (name -> content); returns its id
  [[nodiscard]] virtual std::string create_root_commit(
      const std::map<std::string, std::string>& files, std::string_view message) const = 0;

  [[nodiscard]] virtual Identity current_user_identity() const = 0;

  // Every "<section>.<key>" in repository config starting with `prefix`, e.g. "pile."
  [[nodiscard]] virtual std::map<std::string, std::string> config_get_all(
      std::string_view prefix) const = 0;
  virtual void config_set(std::string_view key, std::string_view value) const = 0;
  virtual void config_unset_all(std::string_view key) const = 0;
};

// Backend driving the `git` executable with argument vectors.
class GitBackend final : public Backend {
public:
  explicit GitBackend(std::filesystem::path root, std::string git = "git");

  [[nodiscard]] const std::filesystem::path& root() const override { return root_; }
  [[nodiscard]] std::filesystem::path common_dir() const override;

  [[nodiscard]] std::optional<std::string> resolve(std::string_view ref) const override;
  [[nodiscard]] std::vector<std::string> list_commits(std::string_view base,
                                                      std::string_view result) const override;
  std::filesystem::path render_patch(std::string_view commit,
                                     const std::filesystem::path& out_dir,
                                     const RenderOptions& options) const override;

  bool apply_patch(const std::filesystem::path& dir, const std::filesystem::path& patch,
                   std::string& detail) const override;
  void stage_all(const std::filesystem::path& dir) const override;
  [[nodiscard]] std::vector<DiffEntry> diff_status(const std::filesystem::path& dir,
                                                   std::string_view old_commit) const override;
  [[nodiscard]] std::string diff_text(const std::filesystem::path& dir,
                                      std::string_view old_commit) const override;
  [[nodiscard]] std::string head(const std::filesystem::path& dir) const override;

  void worktree_create(const std::filesystem::path& path, std::string_view commit) const override;
  void worktree_add_branch(const std::filesystem::path& path,
                           std::string_view branch) const override;
  void worktree_remove(const std::filesystem::path& path) const override;
  [[nodiscard]] std::vector<WorktreeInfo> list_worktrees() const override;

  void set_ref(std::string_view branch, std::string_view commit, bool force) const override;
  void delete_branch(std::string_view branch) const override;
  [[nodiscard]] std::string create_root_commit(const std::map<std::string, std::string>& files,
                                               std::string_view message) const override;

  [[nodiscard]] Identity current_user_identity() const override;

  [[nodiscard]] std::map<std::string, std::string> config_get_all(
      std::string_view prefix) const override;
  void config_set(std::string_view key, std::string_view value) const override;
  void config_unset_all(std::string_view key) const override;

private:
  // Run git in `dir` and throw BackendError on a non-zero exit
  std::string git_in(const std::filesystem::path& dir, std::vector<std::string> args,
                     const std::string& stdin_data = {}) const;
  std::string git(std::vector<std::string> args, const std::string& stdin_data = {}) const {
    return git_in(root_, std::move(args), stdin_data);
  }

  std::filesystem::path root_;
  std::string git_;
};

// Shorthand used by commands that operate on the current directory
std::unique_ptr<Backend> open_backend(const std::filesystem::path& dir);

} // namespace gitpile
