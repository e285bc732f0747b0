#include <space/errors.hpp>
#include <space/github.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdlib>

namespace space {

static bool contains(const std::string &hay, const char *needle) {
  return hay.find(needle) != std::string::npos;
}

std::optional<std::string> GitHubCli::parse_account(const std::string &out) {
  const std::string marker = "Logged in to github.com as ";
  auto pos = out.find(marker);
  if (pos == std::string::npos) {
    // newer gh: "Logged in to github.com account <name> (keyring)"
    const std::string alt = "Logged in to github.com account ";
    pos = out.find(alt);
    if (pos == std::string::npos)
      return std::nullopt;
    pos += alt.size();
  } else {
    pos += marker.size();
  }
  auto end = out.find_first_of(" \t\r\n(", pos);
  std::string acct = out.substr(pos, end == std::string::npos ? end : end - pos);
  if (acct.empty())
    return std::nullopt;
  return acct;
}

GitHubStatus GitHubCli::status(bool force_refresh) {
  std::lock_guard<std::mutex> lk(mu_);
  const auto now = std::chrono::steady_clock::now();
  if (!force_refresh && cached_ && now < expires_)
    return *cached_;

  GitHubStatus st;
  ExecOptions vopts;
  vopts.timeout = kVersionTimeout;
  spdlog::debug("[gh] checking GitHub CLI installation");
  auto ver = exec_.gh({"--version"}, vopts);
  if (!ver.ok()) {
    st.error = "GitHub CLI is not installed or not available in PATH";
  } else {
    st.installed = true;
    ExecOptions aopts;
    aopts.timeout = kAuthTimeout;
    auto auth = exec_.gh({"auth", "status"}, aopts);
    if (auth.ok()) {
      st.authenticated = true;
      // gh prints auth status to stderr (older releases) or stdout
      const std::string out = auth.std_err + "\n" + auth.std_out;
      if (contains(out, "github.com"))
        st.hostname = "github.com";
      st.account = parse_account(out);
      spdlog::debug("[gh] authenticated as {}", st.account.value_or("unknown"));
    } else {
      st.error = "GitHub CLI is not authenticated. Run \"gh auth login\" to "
                 "authenticate.";
    }
  }

  cached_ = st;
  expires_ = now + kCacheTtl;
  return st;
}

void GitHubCli::ensure_available() {
  auto st = status();
  if (!st.installed)
    throw WorkspaceError(WorkspaceErrorKind::GitHub,
                         "GitHub CLI is required but not installed. Install it "
                         "from https://cli.github.com/ and run \"gh auth login\"");
  if (!st.authenticated)
    throw WorkspaceError(WorkspaceErrorKind::GitHub,
                         "GitHub CLI is not authenticated. Run \"gh auth login\"");
}

void GitHubCli::validate_issues_exist(const std::vector<int> &ids,
                                      const std::string &org,
                                      const std::string &repo) const {
  if (ids.empty())
    return;
  spdlog::debug("[gh] validating {} issue(s) in {}/{}", ids.size(), org, repo);

  for (int id : ids) {
    auto r = exec_.gh({"api", fmt::format("repos/{}/{}/issues/{}", org, repo, id),
                       "--jq", ".number"});
    if (!r.ok()) {
      const std::string &err = r.std_err;
      if (contains(err, "Not Found") || contains(err, "404"))
        throw WorkspaceError(
            WorkspaceErrorKind::GitHub,
            fmt::format("Issue #{} not found in {}/{}. Verify the issue exists "
                        "and you have access to the repository.",
                        id, org, repo));
      if (contains(err, "Unauthorized") || contains(err, "401"))
        throw WorkspaceError(
            WorkspaceErrorKind::GitHub,
            fmt::format("Access denied to {}/{}. Check your GitHub CLI "
                        "authentication and repository permissions.",
                        org, repo));
      if (r.exit_code == kExitNotFound)
        throw WorkspaceError(WorkspaceErrorKind::GitHub,
                             "GitHub CLI is not installed. Install it from "
                             "https://cli.github.com/");
      throw WorkspaceError(WorkspaceErrorKind::GitHub,
                           fmt::format("Failed to validate issue #{}: {}", id,
                                       err));
    }

    const long got = std::strtol(r.std_out.c_str(), nullptr, 10);
    if (got != id)
      throw WorkspaceError(WorkspaceErrorKind::GitHub,
                           fmt::format("Issue ID mismatch: expected {}, got {}",
                                       id, got));
    spdlog::debug("[gh] issue #{} exists", id);
  }
}

} // namespace space
