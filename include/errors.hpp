#pragma once

#include <stdexcept>
#include <string>

// The whole document produced no parseable rows; nothing was committed.
class ExtractionFailure : public std::runtime_error {
public:
  explicit ExtractionFailure(const std::string& what) : std::runtime_error(what) {}
};

// The canonical dataset file is unreadable or violates a record invariant.
class DatasetError : public std::runtime_error {
public:
  explicit DatasetError(const std::string& what) : std::runtime_error(what) {}
};

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Raised before any model invocation when a profile or option is out of range.
class InvalidPlanRequest : public std::runtime_error {
public:
  explicit InvalidPlanRequest(const std::string& what) : std::runtime_error(what) {}
};

// Connection refused, unknown model, HTTP error or unusable response envelope.
class GenerationUnavailable : public std::runtime_error {
public:
  explicit GenerationUnavailable(const std::string& what) : std::runtime_error(what) {}
};

class GenerationTimeout : public std::runtime_error {
public:
  explicit GenerationTimeout(const std::string& what) : std::runtime_error(what) {}
};

// Terminal: every attempt was rejected by the validator.
class GenerationConstraintFailure : public std::runtime_error {
public:
  GenerationConstraintFailure(int attempts, std::string stage, std::string diagnostic)
    : std::runtime_error("meal plan rejected after " + std::to_string(attempts) +
                         " attempt(s) at stage " + stage + ": " + diagnostic),
      attempts_(attempts),
      stage_(std::move(stage)),
      diagnostic_(std::move(diagnostic)) {}

  int attempts() const { return attempts_; }
  const std::string& stage() const { return stage_; }
  const std::string& diagnostic() const { return diagnostic_; }

private:
  int attempts_;
  std::string stage_;
  std::string diagnostic_;
};
