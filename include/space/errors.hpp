#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace space {

// Raised before any subprocess exists: bad input or a forbidden command.
enum class PolicyErrorKind {
  RequiredField,
  InvalidCharacters,
  InvalidPattern,
  NoValidCharacters,
  InvalidId,
  UnauthorizedCommand,
  EmptyAfterSanitization,
};

const char *to_string(PolicyErrorKind kind);

class PolicyError : public std::runtime_error {
public:
  PolicyError(PolicyErrorKind kind, std::string field, std::string offending,
              const std::string &message)
      : std::runtime_error(message), kind_(kind), field_(std::move(field)),
        offending_(std::move(offending)) {}

  PolicyErrorKind kind() const { return kind_; }
  // which input was rejected ("branch name", "command", ...)
  const std::string &field() const { return field_; }
  // the rejected value (executable name, id, argument)
  const std::string &offending() const { return offending_; }

private:
  PolicyErrorKind kind_;
  std::string field_;
  std::string offending_;
};

enum class WorkspaceErrorKind { Config, FileSystem, Git, Dependency, GitHub };

const char *to_string(WorkspaceErrorKind kind);

class WorkspaceError : public std::runtime_error {
public:
  WorkspaceError(WorkspaceErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  WorkspaceErrorKind kind() const { return kind_; }

private:
  WorkspaceErrorKind kind_;
};

} // namespace space
