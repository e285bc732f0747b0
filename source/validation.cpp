#include <space/errors.hpp>
#include <space/validation.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <iterator>
#include <string_view>

namespace fs = std::filesystem;

namespace space {

static const std::array<std::string_view, 5> kAllowedGitHosts = {
    "github.com", "gitlab.com", "bitbucket.org", "git.sr.ht", "codeberg.org"};

static std::string trim(const std::string &s) {
  auto b = s.find_first_not_of(" \t\r\n\v\f");
  if (b == std::string::npos)
    return {};
  auto e = s.find_last_not_of(" \t\r\n\v\f");
  return s.substr(b, e - b + 1);
}

static bool is_alnum(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

static bool is_name_char(char c) { return is_alnum(c) || c == '-' || c == '_'; }

static bool is_branch_char(char c) {
  return is_name_char(c) || c == '/' || c == '.';
}

static bool is_command_separator(char c) {
  return c == ';' || c == '&' || c == '|' || c == '`' || c == '\n' ||
         c == '\r';
}

bool has_control_characters(const std::string &s) {
  return std::any_of(s.begin(), s.end(), [](char c) {
    auto u = static_cast<unsigned char>(c);
    return u <= 31 || u == 127;
  });
}

std::string validate_branch_name(const std::string &input) {
  const std::string trimmed = trim(input);
  if (trimmed.empty())
    throw PolicyError(PolicyErrorKind::RequiredField, "branch name", "",
                      "Branch name is required");

  // anything chained after a separator is a second command, not a name
  auto cut = std::find_if(trimmed.begin(), trimmed.end(), is_command_separator);

  std::string out;
  out.reserve(trimmed.size());
  std::copy_if(trimmed.begin(), cut, std::back_inserter(out), is_branch_char);

  if (out.empty())
    throw PolicyError(PolicyErrorKind::NoValidCharacters, "branch name",
                      input,
                      fmt::format("Branch name contains no valid characters: {}",
                                  input));

  if (out.front() == '-' || out.front() == '.' ||
      out.find("..") != std::string::npos)
    throw PolicyError(PolicyErrorKind::InvalidPattern, "branch name", out,
                      fmt::format("Branch name matches invalid patterns: {}",
                                  input));

  if (out.size() > kMaxBranchNameLength)
    out.resize(kMaxBranchNameLength);
  return out;
}

std::string validate_workspace_name(const std::string &input) {
  const std::string trimmed = trim(input);
  if (trimmed.empty())
    throw PolicyError(PolicyErrorKind::RequiredField, "workspace name", "",
                      "Workspace name is required");

  std::string out;
  std::copy_if(trimmed.begin(), trimmed.end(), std::back_inserter(out),
               is_name_char);
  if (out.empty())
    throw PolicyError(PolicyErrorKind::NoValidCharacters, "workspace name",
                      input,
                      fmt::format("Workspace name contains no valid characters: {}",
                                  input));

  if (out.size() > kMaxWorkspaceNameLength)
    out.resize(kMaxWorkspaceNameLength);
  return out;
}

std::string validate_project_key(const std::string &input) {
  if (trim(input).empty())
    throw PolicyError(PolicyErrorKind::RequiredField, "project key", "",
                      "Project key is required");

  if (input.size() > kMaxProjectKeyLength ||
      !std::all_of(input.begin(), input.end(), is_name_char))
    throw PolicyError(
        PolicyErrorKind::InvalidCharacters, "project key", input,
        fmt::format("Project key contains invalid characters (allowed: "
                    "A-Z a-z 0-9 - _, at most {} characters): {}",
                    kMaxProjectKeyLength, input));
  return input;
}

static int parse_github_id(const std::string &raw) {
  const std::string s = trim(raw);
  auto invalid = [&raw]() {
    return PolicyError(PolicyErrorKind::InvalidId, "github id", raw,
                       fmt::format("Invalid GitHub ID: {} (expected 1..{})",
                                   raw, kMaxGitHubId));
  };
  if (s.empty() || s.size() > 9 ||
      !std::all_of(s.begin(), s.end(),
                   [](char c) { return std::isdigit(static_cast<unsigned char>(c)); }))
    throw invalid();

  errno = 0;
  long v = std::strtol(s.c_str(), nullptr, 10);
  if (errno != 0 || v <= 0 || v > kMaxGitHubId)
    throw invalid();
  return static_cast<int>(v);
}

std::vector<int> validate_github_ids(const std::vector<std::string> &inputs) {
  std::vector<int> out;
  out.reserve(inputs.size());
  for (const auto &id : inputs)
    out.push_back(parse_github_id(id));
  return out;
}

static bool has_url_scheme(const std::string &s) {
  auto pos = s.find("://");
  if (pos == std::string::npos || pos == 0)
    return false;
  if (!std::isalpha(static_cast<unsigned char>(s[0])))
    return false;
  return std::all_of(s.begin(), s.begin() + static_cast<long>(pos), [](char c) {
    return is_alnum(c) || c == '+' || c == '.' || c == '-';
  });
}

// git@host:org/repo.git
static bool looks_like_scp(const std::string &s) {
  auto at = s.find('@');
  auto colon = s.find(':');
  return at != std::string::npos && colon != std::string::npos && at < colon &&
         s.find('/') > colon;
}

std::string validate_git_url(const std::string &url) {
  const std::string trimmed = trim(url);
  if (trimmed.empty())
    throw PolicyError(PolicyErrorKind::RequiredField, "repository url", "",
                      "Repository URL is required");

  if (trimmed.find("..") != std::string::npos ||
      trimmed.find(';') != std::string::npos || has_control_characters(trimmed))
    throw PolicyError(
        PolicyErrorKind::InvalidPattern, "repository url", trimmed,
        fmt::format("Repository URL contains dangerous path patterns: {}",
                    trimmed));

  if (looks_like_scp(trimmed) && !has_url_scheme(trimmed))
    return trimmed;

  if (!has_url_scheme(trimmed))
    throw PolicyError(PolicyErrorKind::InvalidPattern, "repository url",
                      trimmed,
                      fmt::format("Invalid repository URL format: {}", trimmed));

  const auto sep = trimmed.find("://");
  std::string scheme = trimmed.substr(0, sep);
  std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (scheme != "https" && scheme != "git" && scheme != "ssh")
    throw PolicyError(PolicyErrorKind::InvalidPattern, "repository url",
                      scheme,
                      fmt::format("Unsupported protocol: {}:. Only https:, "
                                  "git:, and ssh: are allowed",
                                  scheme));

  std::string authority = trimmed.substr(sep + 3);
  authority = authority.substr(0, authority.find('/'));
  if (auto at = authority.rfind('@'); at != std::string::npos)
    authority = authority.substr(at + 1);
  std::string host = authority.substr(0, authority.find(':'));
  std::transform(host.begin(), host.end(), host.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (scheme == "https" &&
      std::find(kAllowedGitHosts.begin(), kAllowedGitHosts.end(), host) ==
          kAllowedGitHosts.end())
    throw PolicyError(PolicyErrorKind::InvalidPattern, "repository url", host,
                      fmt::format("Unsupported Git host: {}. Allowed hosts: {}",
                                  host, fmt::join(kAllowedGitHosts, ", ")));
  return trimmed;
}

std::string validate_local_repository_path(const std::string &path) {
  const std::string trimmed = trim(path);
  if (trimmed.empty())
    throw PolicyError(PolicyErrorKind::RequiredField, "repository path", "",
                      "Repository path is required");

  if (trimmed.find("..") != std::string::npos ||
      trimmed.find(';') != std::string::npos ||
      trimmed.find('|') != std::string::npos)
    throw PolicyError(
        PolicyErrorKind::InvalidPattern, "repository path", trimmed,
        fmt::format("Repository path contains dangerous patterns: {}", trimmed));

  if (trimmed.front() != '/')
    throw PolicyError(PolicyErrorKind::InvalidPattern, "repository path",
                      trimmed,
                      fmt::format("Repository path must be absolute: {}",
                                  trimmed));

  if (has_control_characters(trimmed))
    throw PolicyError(
        PolicyErrorKind::InvalidCharacters, "repository path", trimmed,
        fmt::format("Repository path contains control characters: {}", trimmed));
  return trimmed;
}

std::string validate_repository_path(const std::string &input) {
  const std::string trimmed = trim(input);
  if (has_url_scheme(trimmed) || looks_like_scp(trimmed))
    return validate_git_url(trimmed);
  return validate_local_repository_path(trimmed);
}

fs::path validate_path_within(const fs::path &base, const fs::path &target) {
  const fs::path root = fs::absolute(base).lexically_normal();
  const fs::path resolved =
      (target.is_absolute() ? target : root / target).lexically_normal();

  auto rel = resolved.lexically_relative(root);
  if (rel.empty() || *rel.begin() == "..")
    throw PolicyError(PolicyErrorKind::InvalidPattern, "path",
                      target.string(),
                      fmt::format("Path traversal detected: {}", target.string()));
  return resolved;
}

} // namespace space
