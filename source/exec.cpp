#include <space/errors.hpp>
#include <space/exec.hpp>
#include <space/sanitize.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <iterator>

extern char **environ;

namespace space {

static const char *kPackageManagers[] = {"npm", "pnpm", "yarn"};

const AllowList &AllowList::defaults() {
  static const AllowList list{"git", "gh", "sh", "node", "npm", "pnpm", "yarn"};
  return list;
}

std::string AllowList::describe() const {
  return fmt::format("{}", fmt::join(names_, ", "));
}

bool is_package_manager(const std::string &name) {
  return std::any_of(std::begin(kPackageManagers), std::end(kPackageManagers),
                     [&](const char *pm) { return name == pm; });
}

std::vector<std::string> build_environment(const ExecOptions &options) {
  std::map<std::string, std::string> merged;
  if (options.env_mode == EnvMode::Inherit && environ != nullptr) {
    for (char **e = environ; *e != nullptr; ++e) {
      const char *entry = *e;
      const char *eq = std::strchr(entry, '=');
      if (eq == nullptr)
        continue;
      merged[std::string(entry, eq)] = eq + 1;
    }
  }
  for (const auto &[k, v] : options.env)
    merged[k] = v;

  std::vector<std::string> out;
  out.reserve(merged.size());
  for (const auto &[k, v] : merged)
    out.push_back(k + "=" + v);
  return out;
}

// `show-ref --quiet` and friends probe for something that may not exist
static bool is_probe(const std::vector<std::string> &argv) {
  auto has = [&](const char *s) {
    return std::find(argv.begin(), argv.end(), s) != argv.end();
  };
  return has("show-ref") && (has("--quiet") || has("-q"));
}

static std::string install_hint(const std::string &pm) {
  if (pm == "npm")
    return "npm ships with Node.js: install Node.js (https://nodejs.org) or "
           "activate it with nvm";
  return fmt::format("install it with `npm install -g {}` or enable it with "
                     "`corepack enable`",
                     pm);
}

// Word-level mention of a package manager in a shell command line.
static std::string mentioned_package_manager(const std::string &command) {
  auto is_word = [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
  };
  for (const char *pm : {"pnpm", "yarn", "npm"}) {
    const std::size_t len = std::strlen(pm);
    for (auto pos = command.find(pm); pos != std::string::npos;
         pos = command.find(pm, pos + 1)) {
      bool left = pos == 0 || !is_word(command[pos - 1]);
      bool right = pos + len >= command.size() || !is_word(command[pos + len]);
      if (left && right)
        return pm;
    }
  }
  return {};
}

SecureExecutor::SecureExecutor(AllowList allow,
                               std::shared_ptr<ProcessLauncher> launcher)
    : allow_(std::move(allow)), launcher_(std::move(launcher)) {
  if (!launcher_)
    launcher_ = std::make_shared<PosixProcessLauncher>();
}

ExecResult SecureExecutor::run(const std::string &executable,
                               const std::vector<std::string> &args,
                               const ExecOptions &options) const {
  if (!allow_.contains(executable))
    throw PolicyError(PolicyErrorKind::UnauthorizedCommand, "command",
                      executable,
                      fmt::format("Command '{}' is not allowed (allowed: {})",
                                  executable, allow_.describe()));

  std::vector<std::string> argv;
  argv.reserve(args.size() + 1);
  argv.push_back(executable);
  for (const auto &a : args)
    argv.push_back(sanitize_shell_arg(a));

  auto res = launch(std::move(argv), build_environment(options), options);

  if (res.exit_code == kExitNotFound && is_package_manager(executable))
    res.std_err += fmt::format("\n{} is not installed or not on PATH: {}",
                               executable, install_hint(executable));
  return res;
}

ExecResult SecureExecutor::run_shell(const std::string &command,
                                     const ExecOptions &options) const {
  if (!allow_.contains("sh"))
    throw PolicyError(PolicyErrorKind::UnauthorizedCommand, "command", "sh",
                      fmt::format("Command 'sh' is not allowed (allowed: {})",
                                  allow_.describe()));

  auto envp = build_environment(options);
  const std::string pm = mentioned_package_manager(command);
  if (!pm.empty()) {
    std::string path = env_lookup(envp, "PATH").value_or("");
    if (auto nvm = env_lookup(envp, "NVM_BIN"); nvm && !nvm->empty() &&
                                               (pm == "npm" || pm == "pnpm")) {
      path = path.empty() ? *nvm : *nvm + ":" + path;
      auto it = std::find_if(envp.begin(), envp.end(), [](const std::string &kv) {
        return kv.rfind("PATH=", 0) == 0;
      });
      if (it != envp.end())
        *it = "PATH=" + path;
      else
        envp.push_back("PATH=" + path);
      spdlog::debug("[exec] prepended NVM_BIN {} to PATH", *nvm);
    }
    if (!find_in_path(pm, path)) {
      ExecResult r;
      r.exit_code = kExitNotFound;
      r.std_err = fmt::format(
          "{} is required by '{}' but was not found on PATH: {}", pm, command,
          install_hint(pm));
      spdlog::warn("[exec] {}", r.std_err);
      return r;
    }
  }

  return launch({"sh", "-c", command}, std::move(envp), options);
}

ExecResult SecureExecutor::launch(std::vector<std::string> argv,
                                  std::vector<std::string> envp,
                                  const ExecOptions &options) const {
  LaunchRequest req;
  req.argv = std::move(argv);
  req.cwd = options.cwd;
  req.timeout = options.timeout;
  req.envp = std::move(envp);
  req.use_shell = false;

  const std::string shown = fmt::format("{}", fmt::join(req.argv, " "));
  if (req.cwd)
    spdlog::debug("[exec] {} (cwd={})", shown, req.cwd->string());
  else
    spdlog::debug("[exec] {}", shown);

  ExecResult res = launcher_->launch(req);

  if (!res.ok()) {
    if (is_probe(req.argv))
      spdlog::debug("[exec] {} -> {}", shown, res.exit_code);
    else
      spdlog::warn("[exec] {} -> exit {}: {}", shown, res.exit_code,
                   res.std_err);
  }
  return res;
}

} // namespace space
