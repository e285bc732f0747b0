#pragma once
#include <space/process.hpp>

#include <chrono>
#include <filesystem>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace space {

constexpr std::chrono::milliseconds kDefaultExecTimeout{30000};

// Inherit: parent environment with `env` layered on top (the default, so
// PATH entries set up by version managers stay visible to child tools).
// Replace: the child sees exactly `env`.
enum class EnvMode { Inherit, Replace };

struct ExecOptions {
  std::optional<std::filesystem::path> cwd;
  std::chrono::milliseconds timeout{kDefaultExecTimeout};
  EnvMode env_mode{EnvMode::Inherit};
  std::map<std::string, std::string> env;
};

class AllowList {
public:
  AllowList(std::initializer_list<std::string> names) : names_(names) {}
  explicit AllowList(std::set<std::string> names) : names_(std::move(names)) {}

  // git, gh, sh, node, npm, pnpm, yarn
  static const AllowList &defaults();

  bool contains(const std::string &name) const { return names_.count(name) != 0; }
  const std::set<std::string> &names() const { return names_; }
  std::string describe() const;

private:
  std::set<std::string> names_;
};

bool is_package_manager(const std::string &name);

// The only way this program starts processes. Policy violations (command
// not allow-listed, unsafe argument) throw PolicyError before any spawn;
// everything that happens after the spawn attempt comes back as ExecResult.
// Holds no mutable state, so one instance may serve concurrent callers.
class SecureExecutor {
public:
  SecureExecutor(AllowList allow,
                 std::shared_ptr<ProcessLauncher> launcher =
                     std::make_shared<PosixProcessLauncher>());

  ExecResult run(const std::string &executable,
                 const std::vector<std::string> &args,
                 const ExecOptions &options = {}) const;

  ExecResult git(const std::vector<std::string> &args,
                 const ExecOptions &options = {}) const {
    return run("git", args, options);
  }
  ExecResult gh(const std::vector<std::string> &args,
                const ExecOptions &options = {}) const {
    return run("gh", args, options);
  }

  // `sh -c <command>` for commands that come from the project config
  // (post-init). `sh` must be allow-listed; the command line itself is not
  // sanitized since it may legitimately chain with && or |.
  ExecResult run_shell(const std::string &command,
                       const ExecOptions &options = {}) const;

  const AllowList &allow_list() const { return allow_; }

private:
  ExecResult launch(std::vector<std::string> argv,
                    std::vector<std::string> envp,
                    const ExecOptions &options) const;

  AllowList allow_;
  std::shared_ptr<ProcessLauncher> launcher_;
};

// Environment the child will receive, as KEY=VALUE strings.
std::vector<std::string> build_environment(const ExecOptions &options);

} // namespace space
