#pragma once
#include <space/exec.hpp>

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace space {

struct GitHubStatus {
  bool installed{false};
  bool authenticated{false};
  std::optional<std::string> hostname;
  std::optional<std::string> account;
  std::optional<std::string> error;
};

// Thin wrapper over `gh`. Status is cached for kCacheTtl.
class GitHubCli {
public:
  static constexpr std::chrono::minutes kCacheTtl{5};
  static constexpr std::chrono::milliseconds kVersionTimeout{5000};
  static constexpr std::chrono::milliseconds kAuthTimeout{10000};

  explicit GitHubCli(const SecureExecutor &exec) : exec_(exec) {}

  GitHubStatus status(bool force_refresh = false);
  void ensure_available();

  // Confirms every issue exists in org/repo. Throws WorkspaceError(GitHub).
  void validate_issues_exist(const std::vector<int> &ids, const std::string &org,
                             const std::string &repo) const;

  static std::optional<std::string> parse_account(const std::string &auth_output);

private:
  const SecureExecutor &exec_;
  std::mutex mu_;
  std::optional<GitHubStatus> cached_;
  std::chrono::steady_clock::time_point expires_{};
};

} // namespace space
