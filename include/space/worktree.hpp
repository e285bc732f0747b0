#pragma once
#include <space/config.hpp>
#include <space/exec.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace space {

// "feature/auth" -> "feature-auth-samples"
std::string samples_branch_name(const std::string &branch);
// "feature/auth" -> "feature_auth"
std::string workspace_name_for_branch(const std::string &branch);

class WorktreeManager {
public:
  WorktreeManager(const SecureExecutor &exec, bool dry_run)
      : exec_(exec), dry_run_(dry_run) {}

  // Directory exists and has a .git entry. A missing origin only warns.
  bool validate_repository(const std::filesystem::path &repo) const;

  // Fetches origin and fast-forwards main/master when behind. Never throws
  // for git failures.
  void ensure_freshness(const std::filesystem::path &repo) const;

  std::string default_branch(const std::filesystem::path &repo) const;

  // Creates `path` on a new branch from origin/<base>, falling back to
  // checking out an existing branch (then forcibly). Throws
  // WorkspaceError(Git) when all attempts fail.
  void add_worktree(const std::filesystem::path &repo,
                    const std::filesystem::path &path,
                    const std::string &branch, const std::string &base) const;

  void setup(const ProjectConfig &project, const WorkspacePaths &paths,
             const std::string &branch, bool refresh) const;

  // Removes both worktrees with --force, deletes their local branches and
  // the workspace directory. With `branch` the source repo drops that branch
  // and the samples repo drops samples_branch_name(branch); without it the
  // branch checked out in each worktree is deleted.
  void cleanup(const WorkspacePaths &paths,
               const std::optional<std::string> &branch = std::nullopt) const;

  bool dry_run() const { return dry_run_; }

private:
  void remove_worktree(const std::filesystem::path &repo,
                       const std::filesystem::path &path,
                       std::optional<std::string> branch) const;

  const SecureExecutor &exec_;
  bool dry_run_;
};

class PostInitRunner {
public:
  static constexpr std::chrono::milliseconds kTimeout{3 * 60 * 1000};

  PostInitRunner(const SecureExecutor &exec, bool dry_run)
      : exec_(exec), dry_run_(dry_run) {}

  // Copies the project env file to <destination>/.env.local.
  // Returns false (with a warning) when the file is configured but missing.
  bool copy_env_file(const std::optional<std::filesystem::path> &env_file,
                     const WorkspacePaths &paths) const;

  // Runs the post-init command in the workspace directory. Without a
  // command this is a no-op returning exit code 0.
  ExecResult run(const ProjectConfig &project, const WorkspacePaths &paths) const;

private:
  const SecureExecutor &exec_;
  bool dry_run_;
};

} // namespace space
