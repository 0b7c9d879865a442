#include "gitpile/errors.hpp"
#include "gitpile/extract.hpp"
#include "gitpile/generate.hpp"
#include "gitpile/pile.hpp"
#include "gitpile/range.hpp"

#include "test_support.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using testsupport::slurp;

static bool contains(const std::string &hay, const std::string &needle) {
  return hay.find(needle) != std::string::npos;
}

// Subjects git renders to an empty file name, in a repository whose ignore
// rules cover every patch file
static int unnamed_subjects_under_ignore_rules() {
  const fs::path pile_dir = testsupport::unique_temp("gitpile_format_ignored_pile_");
  const fs::path out = testsupport::unique_temp("gitpile_format_ignored_out_");
  const fs::path excludes = testsupport::unique_temp("gitpile_format_excludes_");
  int rc = 0;
  try {
    testsupport::TestRepo repo{"gitpile_format_ignored_test_"};
    testsupport::write_file(excludes, "*.patch\n");
    repo.git({"config", "core.excludesFile", excludes.string()});
    (void)repo.commit_file("README", "base\n", "Initial import");

    const auto root = repo.backend().create_root_commit(
        {{"series", gitpile::format_series({})}, {"config", ""}}, "Initial pile");
    repo.backend().set_ref("pile", root, false);
    repo.backend().worktree_add_branch(pile_dir, "pile");

    repo.git({"checkout", "-q", "-b", "topic"});
    (void)repo.commit_file("a.c", "a\n", "!!!");
    (void)repo.commit_file("b.c", "b v1\n", "???");

    const auto range = gitpile::resolve_range(repo.backend(), std::string("master..topic"), "", "");
    const auto generated = gitpile::generate_patches(repo.backend(), range, pile_dir);
    if (generated.series != std::vector<std::string>{"patch.patch", "patch-1.patch"} ||
        !fs::exists(pile_dir / "patch.patch") || !fs::exists(pile_dir / "patch-1.patch")) {
      throw std::runtime_error("empty subjects not given usable names");
    }
    repo.git_in(pile_dir, {"add", "--all", "--force"});
    repo.git_in(pile_dir, {"commit", "-q", "-m", "Update pile"});

    repo.git({"reset", "-q", "--hard", "HEAD~1"});
    (void)repo.commit_file("b.c", "b v2\n", "???");

    const gitpile::FormatPatchOptions options{.pile_branch = "pile",
                                              .range = std::nullopt,
                                              .base_branch = "master",
                                              .output_dir = out,
                                              .force = false};
    const auto result = gitpile::format_patches(repo.backend(), options);
    if (result.patches.size() != 1 || result.patches[0] != out / "0001-patch-1.patch")
      throw std::runtime_error("expected only the reworked unnamed patch");
    if (!contains(slurp(result.patches[0]), "+b v2"))
      throw std::runtime_error("reworked unnamed patch content wrong");
  } catch (const std::exception &e) {
    std::cerr << "ignore rules / unnamed subjects: " << e.what() << "\n";
    rc = 1;
  }
  std::error_code ec;
  fs::remove_all(pile_dir, ec);
  fs::remove_all(out, ec);
  fs::remove(excludes, ec);
  return rc;
}

int main() {
  const fs::path pile_dir = testsupport::unique_temp("gitpile_format_pile_");
  const fs::path out = testsupport::unique_temp("gitpile_format_out_");
  try {
    testsupport::TestRepo repo{"gitpile_format_test_"};
    const auto base = repo.commit_file("README", "base\n", "Initial import");

    // Empty pile branch checked out in its own worktree
    const auto root = repo.backend().create_root_commit(
        {{"series", gitpile::format_series({})}, {"config", ""}}, "Initial pile");
    repo.backend().set_ref("pile", root, false);
    repo.backend().worktree_add_branch(pile_dir, "pile");

    repo.git({"checkout", "-q", "-b", "topic"});
    (void)repo.commit_file("bug.c", "fixed\n", "Fix bug");
    (void)repo.commit_file("feature.c", "feature v1\n", "Add feature");

    // Record the current state of the series on the pile branch
    const auto range = gitpile::resolve_range(repo.backend(), std::string("master..topic"), "", "");
    (void)gitpile::generate_patches(repo.backend(), range, pile_dir);
    repo.git_in(pile_dir, {"add", "--all"});
    repo.git_in(pile_dir, {"commit", "-q", "-m", "Update pile"});

    const gitpile::FormatPatchOptions options{.pile_branch = "pile",
                                              .range = std::nullopt,
                                              .base_branch = "master",
                                              .output_dir = out,
                                              .force = false};

    // Nothing changed since the recorded state
    bool threw = false;
    try {
      (void)gitpile::format_patches(repo.backend(), options);
    } catch (const gitpile::NoChangesError &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "unchanged series should have nothing to send\n";
      return 1;
    }

    // Rework only "Add feature"
    repo.git({"reset", "-q", "--hard", "HEAD~1"});
    (void)repo.commit_file("feature.c", "feature v2\n", "Add feature");

    const auto result = gitpile::format_patches(repo.backend(), options);
    if (result.patches.size() != 1 || result.patches[0] != out / "0001-Add-feature.patch") {
      std::cerr << "expected exactly the reworked patch\n";
      return 1;
    }
    if (fs::exists(out / "0001-Fix-bug.patch") || fs::exists(out / "0002-Fix-bug.patch")) {
      std::cerr << "unchanged patch was emitted\n";
      return 1;
    }
    const auto patch = slurp(result.patches[0]);
    if (!contains(patch, "Subject: [PATCH 1/1] Add feature") || !contains(patch, "+feature v2")) {
      std::cerr << "emitted patch content wrong\n";
      return 1;
    }

    if (result.cover_letter != out / "0000-cover-letter.patch") {
      std::cerr << "cover letter misnamed\n";
      return 1;
    }
    const auto cover = slurp(result.cover_letter);
    if (!contains(cover, "From: Test User <test@example.com>\n") ||
        !contains(cover, "Subject: [PATCH 0/1] *** SUBJECT HERE ***") ||
        !contains(cover, "base-commit: " + base) || !contains(cover, "Add-feature.patch") ||
        !contains(cover, "\nDate: ")) {
      std::cerr << "cover letter incomplete:\n" << cover;
      return 1;
    }

    // The recorded pile branch is left alone
    if (repo.rev("pile") != repo.git_in(pile_dir, {"rev-parse", "HEAD"}) ||
        repo.backend().list_worktrees().size() != 2) {
      std::cerr << "pile branch or worktrees changed\n";
      return 1;
    }

    // Output directory reuse needs -f
    threw = false;
    try {
      (void)gitpile::format_patches(repo.backend(), options);
    } catch (const gitpile::Error &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "non-empty output directory accepted without force\n";
      return 1;
    }
    auto forced = options;
    forced.force = true;
    if (gitpile::format_patches(repo.backend(), forced).patches.size() != 1) {
      std::cerr << "forced run produced a different set\n";
      return 1;
    }

    if (unnamed_subjects_under_ignore_rules() != 0)
      throw std::runtime_error("ignored or unnamed patches lost");

    std::cout << "format-patch OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(pile_dir);
    fs::remove_all(out);
    return 1;
  }
  std::error_code ec;
  fs::remove_all(pile_dir, ec);
  fs::remove_all(out, ec);
  return 0;
}
