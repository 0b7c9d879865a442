#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace gitpile {

// Base of every failure raised by the library.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// pile.* configuration is missing or incomplete
class ConfigError : public Error {
public:
  using Error::Error;
};

class InvalidRangeError : public Error {
public:
  InvalidRangeError(std::string token, const std::string &why)
      : Error("invalid range: " + why + ": '" + token + "'"), token_(std::move(token)) {}

  [[nodiscard]] const std::string &token() const { return token_; }

private:
  std::string token_;
};

class EmptyRangeError : public Error {
public:
  using Error::Error;
};

class PatchNamingExhaustedError : public Error {
public:
  using Error::Error;
};

class MissingPatchError : public Error {
public:
  explicit MissingPatchError(std::string file)
      : Error("patch listed in series is missing or unreadable: " + file), file_(std::move(file)) {}

  [[nodiscard]] const std::string &file() const { return file_; }

private:
  std::string file_;
};

class PatchApplyError : public Error {
public:
  PatchApplyError(std::string file, std::size_t position, const std::string &detail)
      : Error("failed to apply patch " + std::to_string(position) + " (" + file + ")" +
              (detail.empty() ? std::string{} : ": " + detail)),
        file_(std::move(file)), position_(position) {}

  [[nodiscard]] const std::string &file() const { return file_; }
  // 1-based position in the series
  [[nodiscard]] std::size_t position() const { return position_; }

private:
  std::string file_;
  std::size_t position_;
};

class UnexpectedDiffStateError : public Error {
public:
  using Error::Error;
};

class NoChangesError : public Error {
public:
  using Error::Error;
};

// A backend (git) invocation failed unexpectedly
class BackendError : public Error {
public:
  using Error::Error;
};

} // namespace gitpile
