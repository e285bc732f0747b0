#include <space/errors.hpp>

namespace space {

const char *to_string(PolicyErrorKind kind) {
  switch (kind) {
  case PolicyErrorKind::RequiredField:
    return "RequiredField";
  case PolicyErrorKind::InvalidCharacters:
    return "InvalidCharacters";
  case PolicyErrorKind::InvalidPattern:
    return "InvalidPattern";
  case PolicyErrorKind::NoValidCharacters:
    return "NoValidCharacters";
  case PolicyErrorKind::InvalidId:
    return "InvalidId";
  case PolicyErrorKind::UnauthorizedCommand:
    return "UnauthorizedCommand";
  case PolicyErrorKind::EmptyAfterSanitization:
    return "EmptyAfterSanitization";
  }
  return "Unknown";
}

const char *to_string(WorkspaceErrorKind kind) {
  switch (kind) {
  case WorkspaceErrorKind::Config:
    return "Config";
  case WorkspaceErrorKind::FileSystem:
    return "FileSystem";
  case WorkspaceErrorKind::Git:
    return "Git";
  case WorkspaceErrorKind::Dependency:
    return "Dependency";
  case WorkspaceErrorKind::GitHub:
    return "GitHub";
  }
  return "Unknown";
}

} // namespace space
