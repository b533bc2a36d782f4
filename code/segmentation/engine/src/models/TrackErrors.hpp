#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

// Input track is unusable: too few points, or a fix that cannot be a real
// position. Fatal for the run.
class MalformedTrackError : public std::runtime_error {
public:
  explicit MalformedTrackError(const std::string &what,
                               std::optional<std::size_t> index = std::nullopt,
                               std::optional<double> timestamp = std::nullopt)
      : std::runtime_error(what), index_(index), timestamp_(timestamp) {}

  const std::optional<std::size_t> &index() const noexcept { return index_; }
  const std::optional<double> &timestamp() const noexcept {
    return timestamp_;
  }

private:
  std::optional<std::size_t> index_;
  std::optional<double> timestamp_;
};

// Thresholds or config files are inconsistent. Raised before processing.
class ConfigurationError : public std::runtime_error {
public:
  ConfigurationError(const std::string &key, const std::string &what)
      : std::runtime_error(what), key_(key) {}

  const std::string &key() const noexcept { return key_; }

private:
  std::string key_;
};

// No cycles were detected and the caller asked for at least one.
class EmptyCycleSetError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};
