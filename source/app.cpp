#include <space/app.hpp>
#include <space/cli.hpp>
#include <space/config.hpp>
#include <space/errors.hpp>
#include <space/exec.hpp>
#include <space/github.hpp>
#include <space/logging.hpp>
#include <space/validation.hpp>
#include <space/worktree.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#ifndef SPACE_VERSION
#define SPACE_VERSION "0.0.0"
#endif
#ifndef SPACE_COMMIT
#define SPACE_COMMIT "unknown"
#endif

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace space {

static void print_help(std::ostream &os) {
  os << R"(space - per-feature development workspaces on git worktrees

Usage:
  space [options] init <project> [github-ids...] <branch>
  space [options] list [project]
  space [options] projects
  space [options] info <project> <workspace>
  space [options] clean <project> <workspace> [--force]
  space [options] doctor
  space help | version

Options:
  -c, --config <path>   configuration file (default: ~/.space-config.yaml)
      --dry-run         log what would happen, change nothing
      --silent          errors only
  -v, --verbose         debug output
      --debug           trace output
      --log-file <path> also log to a rotating file
)";
}

static const char *hint_for(PolicyErrorKind k) {
  switch (k) {
  case PolicyErrorKind::RequiredField:
    return "provide the missing value";
  case PolicyErrorKind::InvalidCharacters:
  case PolicyErrorKind::NoValidCharacters:
    return "use only letters, digits, '-' and '_'";
  case PolicyErrorKind::InvalidPattern:
    return "names may not start with '-' or '.' or contain '..'";
  case PolicyErrorKind::InvalidId:
    return "GitHub ids are positive integers up to 999999";
  case PolicyErrorKind::UnauthorizedCommand:
    return "only git, gh, sh, node and package managers may be run";
  case PolicyErrorKind::EmptyAfterSanitization:
    return "remove shell metacharacters from the argument";
  }
  return "";
}

static const char *hint_for(WorkspaceErrorKind k) {
  switch (k) {
  case WorkspaceErrorKind::Config:
    return "check the configuration file (see `space projects`)";
  case WorkspaceErrorKind::FileSystem:
    return "check permissions on the workspace directory";
  case WorkspaceErrorKind::Git:
    return "check the repository state with `git worktree list`";
  case WorkspaceErrorKind::Dependency:
    return "run `space doctor`";
  case WorkspaceErrorKind::GitHub:
    return "run `gh auth status`";
  }
  return "";
}

int Commands::init(const CmdInit &c) {
  const std::string key = validate_project_key(c.project);
  const std::vector<int> ids = validate_github_ids(c.github_ids);
  const std::string branch = validate_branch_name(c.branch);
  if (branch != c.branch)
    spdlog::warn("[init] branch name sanitized: '{}' -> '{}'", c.branch, branch);

  cfg_.load();
  const ProjectConfig &project = cfg_.validate_project(key);
  const std::string ws = workspace_name_for_branch(branch);
  const WorkspacePaths paths = cfg_.workspace_paths(key, ws);

  spdlog::info("[init] project={} branch={} workspace={}", key, branch, ws);

  if (!ids.empty()) {
    if (g_.dry_run) {
      spdlog::info("[init] [dry-run] would validate {} GitHub issue(s)",
                   ids.size());
    } else if (project.github_org) {
      GitHubCli gh(exec_);
      gh.ensure_available();
      gh.validate_issues_exist(ids, *project.github_org, repo_basename(project.repo));
    } else {
      spdlog::warn("[init] project '{}' has no github_org; skipping issue "
                   "validation",
                   key);
    }
  }

  WorktreeManager wt(exec_, g_.dry_run);
  std::error_code ec;
  if (fs::exists(paths.workspace_dir, ec)) {
    spdlog::info("[init] replacing existing workspace {}",
                 paths.workspace_dir.string());
    wt.cleanup(paths, branch);
  }
  if (!g_.dry_run) {
    fs::create_directories(paths.workspace_dir, ec);
    if (ec)
      throw WorkspaceError(WorkspaceErrorKind::FileSystem,
                           fmt::format("cannot create {}: {}",
                                       paths.workspace_dir.string(), ec.message()));
  }

  try {
    wt.setup(project, paths, branch, cfg_.config().repository.ensure_freshness);
  } catch (const WorkspaceError &e) {
    if (e.kind() != WorkspaceErrorKind::Git)
      throw;
    spdlog::warn("[init] worktree setup failed, continuing with a "
                 "directory-only workspace: {}",
                 e.what());
  }

  PostInitRunner post(exec_, g_.dry_run);
  post.copy_env_file(cfg_.env_file_path(key), paths);
  const ExecResult res = post.run(project, paths);
  if (!res.ok() && !res.std_err.empty())
    std::cerr << res.std_err << (res.std_err.back() == '\n' ? "" : "\n");

  std::cout << fmt::format("workspace ready: {}\n", paths.workspace_dir.string());
  return res.exit_code;
}

int Commands::list(const CmdList &c) {
  cfg_.load();
  std::vector<std::string> keys;
  if (c.project)
    keys.push_back(validate_project_key(*c.project));
  else
    keys = cfg_.list_projects();

  for (const auto &key : keys) {
    const auto &p = cfg_.project(key);
    const auto &g = cfg_.config().global;
    const fs::path base = g.src_dir / g.workspace_base / p.key;
    std::cout << fmt::format("{} ({})\n", p.key, p.name);

    std::vector<std::string> found;
    std::error_code ec;
    for (fs::directory_iterator it(base, ec), end; !ec && it != end;
         it.increment(ec)) {
      if (it->is_directory(ec))
        found.push_back(it->path().filename().string());
    }
    std::sort(found.begin(), found.end());
    if (found.empty())
      std::cout << "  (no workspaces)\n";
    for (const auto &w : found)
      std::cout << fmt::format("  {}  {}\n", w, (base / w).string());
  }
  return 0;
}

int Commands::projects() {
  cfg_.load();
  for (const auto &[key, p] : cfg_.config().projects) {
    std::cout << fmt::format("{:<20} {:<30} {}\n", key, p.name, p.repo);
    if (p.sample_repo)
      std::cout << fmt::format("{:<20} {:<30} {}\n", "", "samples:", *p.sample_repo);
  }
  return 0;
}

int Commands::info(const CmdInfo &c) {
  const std::string key = validate_project_key(c.project);
  const std::string ws = validate_workspace_name(c.workspace);
  cfg_.load();
  const ProjectConfig &p = cfg_.validate_project(key);
  const WorkspacePaths paths = cfg_.workspace_paths(key, ws);

  std::error_code ec;
  if (!fs::exists(paths.workspace_dir, ec))
    throw WorkspaceError(WorkspaceErrorKind::FileSystem,
                         fmt::format("Workspace '{}' not found for project '{}' "
                                     "at {}",
                                     ws, key, paths.workspace_dir.string()));

  auto state = [&](const fs::path &path) {
    return fs::exists(path, ec) ? "ready" : "missing";
  };
  std::cout << fmt::format("project:     {} ({})\n", p.name, key);
  std::cout << fmt::format("workspace:   {}\n", paths.workspace_dir.string());
  std::cout << fmt::format("source:      {} [{}]\n", paths.source_path.string(),
                           state(paths.source_path));
  if (paths.destination_path)
    std::cout << fmt::format("samples:     {} [{}]\n",
                             paths.destination_path->string(),
                             state(*paths.destination_path));
  else
    std::cout << "samples:     n/a\n";
  if (auto env = cfg_.env_file_path(key))
    std::cout << fmt::format("environment: {} [{}]\n", env->string(),
                             fs::exists(*env, ec) ? "available" : "missing");
  return 0;
}

int Commands::clean(const CmdClean &c) {
  const std::string key = validate_project_key(c.project);
  const std::string ws = validate_workspace_name(c.workspace);
  cfg_.load();
  const WorkspacePaths paths = cfg_.workspace_paths(key, ws);

  std::error_code ec;
  if (!fs::exists(paths.workspace_dir, ec)) {
    spdlog::warn("[clean] no workspace at {}", paths.workspace_dir.string());
    return 0;
  }
  if (!c.force && !g_.dry_run) {
    std::cout << fmt::format("would delete {}\nre-run with --force to remove "
                             "it and its worktrees\n",
                             paths.workspace_dir.string());
    return 0;
  }
  WorktreeManager(exec_, g_.dry_run).cleanup(paths);
  return 0;
}

int Commands::doctor() {
  std::vector<std::string> deps{"git", "gh"};
  try {
    deps = cfg_.load().global.dependencies;
    std::cout << fmt::format("config: {}\n", cfg_.path().string());
  } catch (const WorkspaceError &e) {
    std::cout << fmt::format("config: not usable ({})\n", e.what());
  }

  bool ok = true;
  for (const auto &dep : deps) {
    if (!exec_.allow_list().contains(dep)) {
      std::cout << fmt::format("  {:<8} skipped (not an allowed command)\n", dep);
      continue;
    }
    ExecOptions opts;
    opts.timeout = 5000ms;
    auto r = exec_.run(dep, {"--version"}, opts);
    std::string first = r.ok() ? r.std_out.substr(0, r.std_out.find('\n')) : "";
    std::cout << fmt::format("  {:<8} {}\n", dep, r.ok() ? first : "missing");
    ok = ok && r.ok();
  }

  GitHubCli gh(exec_);
  auto st = gh.status();
  if (st.authenticated)
    std::cout << fmt::format("  gh auth  logged in as {}\n",
                             st.account.value_or("unknown"));
  else
    std::cout << fmt::format("  gh auth  {}\n", st.error.value_or("unavailable"));
  return ok ? 0 : 1;
}

int App::run(int argc, char **argv) {
  auto pr = parse_cli(argc, argv);
  setup_logging(LogOptions{pr.globals.verbosity, pr.globals.log_file});

  if (!pr.cmd) {
    spdlog::error("{}", pr.error);
    print_help(std::cerr);
    return 2;
  }

  SecureExecutor exec(AllowList::defaults());
  try {
    return std::visit(
        [&](auto &&c) -> int {
          using T = std::decay_t<decltype(c)>;

          if constexpr (std::is_same_v<T, CmdHelp>) {
            print_help(std::cout);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdVersion>) {
            std::cout << fmt::format("space {} ({})\n", SPACE_VERSION,
                                     SPACE_COMMIT);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdInit>) {
            return Commands(pr.globals, exec).init(c);

          } else if constexpr (std::is_same_v<T, CmdList>) {
            return Commands(pr.globals, exec).list(c);

          } else if constexpr (std::is_same_v<T, CmdProjects>) {
            return Commands(pr.globals, exec).projects();

          } else if constexpr (std::is_same_v<T, CmdInfo>) {
            return Commands(pr.globals, exec).info(c);

          } else if constexpr (std::is_same_v<T, CmdClean>) {
            return Commands(pr.globals, exec).clean(c);

          } else {
            static_assert(std::is_same_v<T, CmdDoctor>);
            return Commands(pr.globals, exec).doctor();
          }
        },
        *pr.cmd);
  } catch (const PolicyError &e) {
    spdlog::error("invalid {} ({}): {}", e.field(), to_string(e.kind()), e.what());
    spdlog::info("hint: {}", hint_for(e.kind()));
    return 1;
  } catch (const WorkspaceError &e) {
    spdlog::error("{} error: {}", to_string(e.kind()), e.what());
    spdlog::info("hint: {}", hint_for(e.kind()));
    return 1;
  } catch (const std::exception &e) {
    spdlog::error("{}", e.what());
    return 1;
  }
}

} // namespace space
