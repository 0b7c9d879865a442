#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gitpile {

struct ProcessResult {
  int exit_code = 0;   // <0: killed by signal -exit_code; 127: could not exec
  std::string out;     // captured stdout
  std::string err;     // captured stderr

  [[nodiscard]] bool ok() const { return exit_code == 0; }
};

struct ProcessOptions {
  std::optional<std::filesystem::path> cwd;  // run in this directory if set
  std::string stdin_data;                    // fed to the child's stdin, then closed
};

// Run argv[0] (looked up in PATH) with the given argument vector and wait for it.
// No shell is involved: every element reaches the child as exactly one argument.
ProcessResult run_process(const std::vector<std::string>& argv,
                          const ProcessOptions& options = {});

} // namespace gitpile
