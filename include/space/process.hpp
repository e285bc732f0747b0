#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace space {

struct ExecResult {
  std::string std_out;
  std::string std_err;
  int exit_code{0};

  bool ok() const { return exit_code == 0; }
};

// exit codes used when no child exit status exists
constexpr int kExitTimedOut = 124;
constexpr int kExitNotExecutable = 126;
constexpr int kExitNotFound = 127;

struct LaunchRequest {
  std::vector<std::string> argv; // argv[0] is the executable name
  std::optional<std::filesystem::path> cwd;
  std::chrono::milliseconds timeout{0};
  std::vector<std::string> envp; // KEY=VALUE, already merged
  bool use_shell{false};
};

class ProcessLauncher {
public:
  virtual ~ProcessLauncher() = default;
  // Never throws for process failures: they come back as ExecResult.
  virtual ExecResult launch(const LaunchRequest &req) = 0;
};

// fork + execve with captured stdout/stderr, stdin from /dev/null, and a
// poll() deadline. On timeout the child's process group gets SIGTERM, then
// SIGKILL after kKillGrace.
class PosixProcessLauncher : public ProcessLauncher {
public:
  static constexpr std::chrono::milliseconds kKillGrace{2000};

  ExecResult launch(const LaunchRequest &req) override;
};

// Looks up `name` in a colon-separated PATH value. Names containing '/'
// are checked as given.
std::optional<std::filesystem::path> find_in_path(const std::string &name,
                                                  const std::string &path_var);

std::optional<std::string> env_lookup(const std::vector<std::string> &envp,
                                      const std::string &key);

} // namespace space
