#include <space/errors.hpp>
#include <space/validation.hpp>
#include <space/worktree.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <future>

namespace fs = std::filesystem;

namespace space {

static std::string trim_output(std::string s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' '))
    s.pop_back();
  return s;
}

static ExecOptions in_dir(const fs::path &dir) {
  ExecOptions o;
  o.cwd = dir;
  return o;
}

std::string samples_branch_name(const std::string &branch) {
  static const std::string suffix = "-samples";
  std::string s = branch;
  std::replace(s.begin(), s.end(), '/', '-');
  s = validate_branch_name(s);
  // the suffix must survive the length limit
  if (s.size() > kMaxBranchNameLength - suffix.size())
    s.resize(kMaxBranchNameLength - suffix.size());
  return s + suffix;
}

std::string workspace_name_for_branch(const std::string &branch) {
  std::string s = branch;
  std::replace(s.begin(), s.end(), '/', '_');
  return validate_workspace_name(s);
}

bool WorktreeManager::validate_repository(const fs::path &repo) const {
  if (dry_run_) {
    spdlog::info("[worktree] [dry-run] would validate repository {}",
                 repo.string());
    return true;
  }
  std::error_code ec;
  if (!fs::is_directory(repo, ec)) {
    spdlog::error("[worktree] repository directory does not exist: {}",
                  repo.string());
    return false;
  }
  if (!fs::exists(repo / ".git", ec)) {
    spdlog::error("[worktree] not a git repository: {}", repo.string());
    return false;
  }
  auto origin = exec_.git({"remote", "get-url", "origin"}, in_dir(repo));
  if (!origin.ok())
    spdlog::warn("[worktree] {} has no 'origin' remote", repo.string());
  return true;
}

void WorktreeManager::ensure_freshness(const fs::path &repo) const {
  if (dry_run_) {
    spdlog::info("[worktree] [dry-run] would fetch origin in {}", repo.string());
    return;
  }
  auto fetch = exec_.git({"fetch", "origin"}, in_dir(repo));
  if (!fetch.ok()) {
    spdlog::warn("[worktree] could not fetch latest changes for {}: {}",
                 repo.string(), trim_output(fetch.std_err));
    return;
  }

  const std::string branch =
      trim_output(exec_.git({"branch", "--show-current"}, in_dir(repo)).std_out);
  if (branch.empty())
    return;

  auto count = exec_.git(
      {"rev-list", "--count", fmt::format("{0}..origin/{0}", branch)},
      in_dir(repo));
  if (!count.ok()) {
    spdlog::debug("[worktree] could not compare {} with origin/{}",
                  repo.string(), branch);
    return;
  }
  const long behind = std::strtol(trim_output(count.std_out).c_str(), nullptr, 10);
  if (behind <= 0) {
    spdlog::debug("[worktree] {} is up to date", repo.string());
    return;
  }

  spdlog::warn("[worktree] {} is {} commits behind origin/{}", repo.string(),
               behind, branch);
  if (branch != "main" && branch != "master")
    return;
  auto pull = exec_.git({"pull", "origin", branch}, in_dir(repo));
  if (pull.ok())
    spdlog::info("[worktree] updated {} in {}", branch, repo.string());
  else
    spdlog::warn("[worktree] could not update {} in {}: {}", branch,
                 repo.string(), trim_output(pull.std_err));
}

std::string WorktreeManager::default_branch(const fs::path &repo) const {
  if (dry_run_)
    return "main";

  auto head = exec_.git({"symbolic-ref", "refs/remotes/origin/HEAD"}, in_dir(repo));
  if (head.ok()) {
    std::string ref = trim_output(head.std_out);
    const std::string prefix = "refs/remotes/origin/";
    if (ref.rfind(prefix, 0) == 0)
      ref = ref.substr(prefix.size());
    if (!ref.empty())
      return ref;
  }
  for (const char *b : {"main", "master"}) {
    auto r = exec_.git({"show-ref", "--verify", "--quiet",
                        fmt::format("refs/heads/{}", b)},
                       in_dir(repo));
    if (r.ok())
      return b;
  }
  return "main";
}

void WorktreeManager::add_worktree(const fs::path &repo, const fs::path &path,
                                   const std::string &branch,
                                   const std::string &base) const {
  if (dry_run_) {
    spdlog::info("[worktree] [dry-run] would add worktree {} on {} from "
                 "origin/{} in {}",
                 path.string(), branch, base, repo.string());
    return;
  }

  std::error_code ec;
  if (fs::exists(path, ec)) {
    spdlog::info("[worktree] removing stale directory {}", path.string());
    fs::remove_all(path, ec);
    if (ec)
      throw WorkspaceError(WorkspaceErrorKind::FileSystem,
                           fmt::format("cannot remove {}: {}", path.string(),
                                       ec.message()));
  }
  auto prune = exec_.git({"worktree", "prune"}, in_dir(repo));
  if (!prune.ok())
    spdlog::debug("[worktree] prune failed in {}", repo.string());

  const std::string p = path.string();
  const std::vector<std::vector<std::string>> attempts = {
      {"worktree", "add", p, "-b", branch, "origin/" + base},
      {"worktree", "add", p, branch},
      {"worktree", "add", "-f", p, branch},
  };
  ExecResult last;
  for (const auto &args : attempts) {
    last = exec_.git(args, in_dir(repo));
    if (last.ok()) {
      spdlog::info("[worktree] {} -> {}", branch, p);
      return;
    }
  }
  throw WorkspaceError(WorkspaceErrorKind::Git,
                       fmt::format("git worktree add failed for {} ({}): {}", p,
                                   branch, trim_output(last.std_err)));
}

void WorktreeManager::setup(const ProjectConfig &project,
                            const WorkspacePaths &paths,
                            const std::string &branch, bool refresh) const {
  const bool has_samples = paths.destination_repo_path && paths.destination_path;

  if (!validate_repository(paths.source_repo_path) ||
      (has_samples && !validate_repository(*paths.destination_repo_path)))
    throw WorkspaceError(WorkspaceErrorKind::Git,
                         fmt::format("repository validation failed for project "
                                     "'{}', cannot set up worktrees",
                                     project.key));

  if (refresh) {
    auto src = std::async(std::launch::async,
                          [&] { ensure_freshness(paths.source_repo_path); });
    if (has_samples)
      ensure_freshness(*paths.destination_repo_path);
    src.get();
  } else {
    spdlog::debug("[worktree] freshness check disabled");
  }

  add_worktree(paths.source_repo_path, paths.source_path, branch,
               default_branch(paths.source_repo_path));

  if (has_samples) {
    const std::string samples = samples_branch_name(branch);
    add_worktree(*paths.destination_repo_path, *paths.destination_path, samples,
                 default_branch(*paths.destination_repo_path));
  }
}

void WorktreeManager::remove_worktree(const fs::path &repo, const fs::path &path,
                                      std::optional<std::string> branch) const {
  std::error_code ec;
  if (!fs::is_directory(repo, ec))
    return;

  if (fs::exists(path, ec)) {
    if (!branch) {
      const std::string current = trim_output(
          exec_.git({"branch", "--show-current"}, in_dir(path)).std_out);
      if (!current.empty())
        branch = current;
    }
    auto rm = exec_.git({"worktree", "remove", "--force", path.string()},
                        in_dir(repo));
    if (!rm.ok())
      spdlog::warn("[worktree] could not remove worktree {}: {}", path.string(),
                   trim_output(rm.std_err));
  }
  auto prune = exec_.git({"worktree", "prune"}, in_dir(repo));
  if (!prune.ok())
    spdlog::debug("[worktree] prune failed in {}", repo.string());

  if (!branch)
    return;
  auto del = exec_.git({"branch", "-D", *branch}, in_dir(repo));
  if (del.ok())
    spdlog::info("[worktree] deleted branch {} in {}", *branch, repo.string());
  else
    spdlog::debug("[worktree] branch {} not deleted: {}", *branch,
                  trim_output(del.std_err));
}

void WorktreeManager::cleanup(const WorkspacePaths &paths,
                              const std::optional<std::string> &branch) const {
  if (dry_run_) {
    spdlog::info("[worktree] [dry-run] would remove workspace {}",
                 paths.workspace_dir.string());
    return;
  }

  remove_worktree(paths.source_repo_path, paths.source_path, branch);
  if (paths.destination_repo_path && paths.destination_path)
    remove_worktree(*paths.destination_repo_path, *paths.destination_path,
                    branch ? std::optional<std::string>(samples_branch_name(*branch))
                           : std::nullopt);

  std::error_code ec;
  fs::remove_all(paths.workspace_dir, ec);
  if (ec)
    throw WorkspaceError(WorkspaceErrorKind::FileSystem,
                         fmt::format("cannot remove {}: {}",
                                     paths.workspace_dir.string(), ec.message()));
  spdlog::info("[worktree] removed {}", paths.workspace_dir.string());
}

bool PostInitRunner::copy_env_file(const std::optional<fs::path> &env_file,
                                   const WorkspacePaths &paths) const {
  if (!env_file || !paths.destination_path)
    return true;

  const fs::path target = *paths.destination_path / ".env.local";
  if (dry_run_) {
    spdlog::info("[init] [dry-run] would copy {} to {}", env_file->string(),
                 target.string());
    return true;
  }
  std::error_code ec;
  if (!fs::is_regular_file(*env_file, ec)) {
    spdlog::warn("[init] env file not found: {}", env_file->string());
    return false;
  }
  fs::create_directories(target.parent_path(), ec);
  fs::copy_file(*env_file, target, fs::copy_options::overwrite_existing, ec);
  if (ec)
    throw WorkspaceError(WorkspaceErrorKind::FileSystem,
                         fmt::format("cannot copy {} to {}: {}",
                                     env_file->string(), target.string(),
                                     ec.message()));
  spdlog::info("[init] copied {} to {}", env_file->filename().string(),
               target.string());
  return true;
}

ExecResult PostInitRunner::run(const ProjectConfig &project,
                               const WorkspacePaths &paths) const {
  if (!project.post_init || project.post_init->empty())
    return {};

  if (dry_run_) {
    spdlog::info("[init] [dry-run] would run post-init in {}: {}",
                 paths.workspace_dir.string(), *project.post_init);
    return {};
  }

  spdlog::info("[init] running post-init: {}", *project.post_init);
  ExecOptions opts;
  opts.cwd = paths.workspace_dir;
  opts.timeout = kTimeout;
  auto res = exec_.run_shell(*project.post_init, opts);
  if (res.ok())
    spdlog::info("[init] post-init completed");
  else
    spdlog::error("[init] post-init exited with {}", res.exit_code);
  return res;
}

} // namespace space
