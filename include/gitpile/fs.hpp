#pragma once
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace gitpile::fs {

bool exists(const std::filesystem::path& p);
void ensure_parent_dir(const std::filesystem::path& p);

std::string read_file(const std::filesystem::path& p);
void write_file_atomic(const std::filesystem::path& p, std::string_view data);

// Regular files in `dir` (not recursive) whose name ends with `suffix`, sorted by name.
std::vector<std::string> list_files_with_suffix(const std::filesystem::path& dir,
                                                std::string_view suffix);

// Owns a freshly created, uniquely named directory under the system temp dir.
// The directory and everything in it is removed when the object goes away.
class TempDir {
public:
  explicit TempDir(std::string_view prefix);
  ~TempDir();

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

} // namespace gitpile::fs
