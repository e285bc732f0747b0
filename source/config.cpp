#include <space/config.hpp>
#include <space/errors.hpp>
#include <space/validation.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <xxhash.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

namespace space {

static fs::path home_dir() {
  const char *h = std::getenv("HOME");
  return fs::path(h && *h ? h : "/");
}

static std::string expand_home(const std::string &p) {
  if (p == "~")
    return home_dir().string();
  if (p.rfind("~/", 0) == 0)
    return (home_dir() / p.substr(2)).string();
  return p;
}

static std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

static std::optional<std::string> opt_scalar(const YAML::Node &node,
                                             const char *key) {
  const YAML::Node v = node[key];
  if (!v || v.IsNull())
    return std::nullopt;
  if (!v.IsScalar())
    throw WorkspaceError(WorkspaceErrorKind::Config,
                         fmt::format("'{}' must be a string", key));
  return v.as<std::string>();
}

bool is_remote_repo(const std::string &repo) {
  return repo.rfind("http://", 0) == 0 || repo.rfind("https://", 0) == 0 ||
         repo.rfind("git@", 0) == 0 || repo.rfind("ssh://", 0) == 0 ||
         repo.rfind("git://", 0) == 0;
}

std::string repo_basename(const std::string &repo) {
  std::string s = repo;
  while (s.size() > 1 && s.back() == '/')
    s.pop_back();
  auto cut = s.find_last_of("/:");
  if (cut != std::string::npos)
    s = s.substr(cut + 1);
  if (s.size() > 4 && s.compare(s.size() - 4, 4, ".git") == 0)
    s.resize(s.size() - 4);
  return s;
}

void normalize_project_keys(YAML::Node &root) {
  if (!root.IsMap())
    return;
  YAML::Node projects = root["projects"];
  if (!projects || !projects.IsMap())
    return;

  for (auto it = projects.begin(); it != projects.end(); ++it) {
    YAML::Node project = it->second;
    if (!project.IsMap() || !project["post_init"])
      continue;
    const auto key = it->first.as<std::string>();
    if (project["post-init"]) {
      spdlog::debug("[config] {}: both post-init and post_init set, using "
                    "post-init",
                    key);
    } else {
      project["post-init"] = YAML::Clone(project["post_init"]);
      spdlog::debug("[config] {}: renamed post_init to post-init", key);
    }
    project.remove("post_init");
  }
}

static std::string resolve_repo(const std::string &repo, const fs::path &src_dir) {
  if (repo.empty() || is_remote_repo(repo))
    return repo;
  std::string r = expand_home(repo);
  fs::path p(r);
  if (p.is_relative())
    p = src_dir / p;
  std::string out = p.lexically_normal().string();
  while (out.size() > 1 && out.back() == '/')
    out.pop_back();
  return out;
}

static ProjectConfig parse_project(const std::string &key, const YAML::Node &n,
                                   const fs::path &src_dir) {
  if (!n.IsMap())
    throw WorkspaceError(WorkspaceErrorKind::Config,
                         fmt::format("project '{}' must be a mapping", key));
  ProjectConfig p;
  p.key = key;
  p.name = opt_scalar(n, "name").value_or("");
  p.repo = resolve_repo(opt_scalar(n, "repo").value_or(""), src_dir);
  if (auto s = opt_scalar(n, "sample_repo"))
    p.sample_repo = resolve_repo(*s, src_dir);
  p.github_org = opt_scalar(n, "github_org");
  p.sample_app_path = opt_scalar(n, "sample_app_path");
  p.env_file = opt_scalar(n, "env_file");
  p.post_init = opt_scalar(n, "post-init");
  return p;
}

Config parse_config(const std::string &text, const fs::path &source) {
  YAML::Node root;
  try {
    root = YAML::Load(text);
  } catch (const YAML::Exception &e) {
    throw WorkspaceError(WorkspaceErrorKind::Config,
                         fmt::format("Failed to parse {}: {}", source.string(),
                                     e.what()));
  }
  if (root.IsNull())
    root = YAML::Node(YAML::NodeType::Map);
  if (!root.IsMap())
    throw WorkspaceError(WorkspaceErrorKind::Config,
                         fmt::format("{}: top level must be a mapping",
                                     source.string()));

  Config cfg;
  cfg.source = source;
  const fs::path config_dir =
      source.has_parent_path() ? source.parent_path() : fs::current_path();

  try {
    normalize_project_keys(root);

    if (const YAML::Node g = root["global"]; g && g.IsMap()) {
      if (auto s = opt_scalar(g, "src_dir"))
        cfg.global.src_dir = expand_home(*s);
      if (auto s = opt_scalar(g, "workspace_base"))
        cfg.global.workspace_base = *s;
      if (auto s = opt_scalar(g, "env_files_dir")) {
        if (s->rfind("./", 0) == 0)
          cfg.global.env_files_dir = (config_dir / s->substr(2)).lexically_normal();
        else
          cfg.global.env_files_dir = fs::path(expand_home(*s));
      }
      if (auto s = opt_scalar(g, "package_manager"))
        cfg.global.package_manager = *s;
      if (const YAML::Node deps = g["dependencies"]; deps && deps.IsSequence())
        cfg.global.dependencies = deps.as<std::vector<std::string>>();
    }
    if (cfg.global.src_dir.empty())
      cfg.global.src_dir = home_dir() / "src";

    if (const YAML::Node r = root["repository"]; r && r.IsMap()) {
      if (const YAML::Node f = r["ensure_freshness"])
        cfg.repository.ensure_freshness = f.as<bool>();
    }

    if (const YAML::Node projects = root["projects"]; projects) {
      if (!projects.IsMap())
        throw WorkspaceError(WorkspaceErrorKind::Config,
                             "'projects' must be a mapping of key to project");
      for (auto it = projects.begin(); it != projects.end(); ++it) {
        auto key = it->first.as<std::string>();
        cfg.projects.emplace(key, parse_project(key, it->second,
                                                cfg.global.src_dir));
      }
    }
  } catch (const YAML::Exception &e) {
    throw WorkspaceError(WorkspaceErrorKind::Config,
                         fmt::format("Invalid configuration in {}: {}",
                                     source.string(), e.what()));
  }
  return cfg;
}

std::vector<fs::path>
config_search_paths(const std::optional<fs::path> &explicit_path) {
  std::vector<fs::path> out;
  if (explicit_path)
    out.push_back(fs::path(expand_home(explicit_path->string())));
  out.push_back(home_dir() / ".space-config.yaml");
  out.push_back(home_dir() / ".workspace-config.yaml");
  out.push_back(fs::current_path() / "config.yaml");
  return out;
}

static bool cache_disabled() {
  const char *v = std::getenv("SPACE_DISABLE_CACHE");
  return v != nullptr && std::string(v) == "1";
}

ConfigManager::ConfigManager(std::optional<fs::path> explicit_path)
    : explicit_path_(std::move(explicit_path)) {}

const Config &ConfigManager::load() {
  const auto candidates = config_search_paths(explicit_path_);
  std::optional<fs::path> found;
  std::error_code ec;
  if (explicit_path_) {
    if (!fs::is_regular_file(candidates.front(), ec))
      throw WorkspaceError(WorkspaceErrorKind::Config,
                           fmt::format("Configuration file not found: {}",
                                       candidates.front().string()));
    found = candidates.front();
  } else {
    for (const auto &c : candidates) {
      if (fs::is_regular_file(c, ec)) {
        found = c;
        break;
      }
    }
  }
  if (!found) {
    std::vector<std::string> shown;
    std::transform(candidates.begin(), candidates.end(),
                   std::back_inserter(shown),
                   [](const fs::path &p) { return p.string(); });
    throw WorkspaceError(WorkspaceErrorKind::Config,
                         fmt::format("Configuration file not found. Checked: {}",
                                     fmt::join(shown, ", ")));
  }

  std::ifstream in(*found, std::ios::binary);
  if (!in)
    throw WorkspaceError(WorkspaceErrorKind::Config,
                         fmt::format("Cannot read {}", found->string()));
  std::string data((std::istreambuf_iterator<char>(in)),
                   std::istreambuf_iterator<char>());
  const std::uint64_t h = XXH3_64bits(data.data(), data.size());

  if (config_ && !cache_disabled() && *found == path_ && h == hash_) {
    spdlog::debug("[config] {} unchanged ({:016x}), using cached config",
                  found->string(), h);
    return *config_;
  }

  config_ = parse_config(data, *found);
  path_ = *found;
  hash_ = h;
  ++parse_count_;
  spdlog::debug("[config] loaded {} ({} projects)", path_.string(),
                config_->projects.size());
  return *config_;
}

const Config &ConfigManager::config() const {
  if (!config_)
    throw WorkspaceError(WorkspaceErrorKind::Config, "Configuration not loaded");
  return *config_;
}

const ProjectConfig &ConfigManager::project(const std::string &key) const {
  const auto &projects = config().projects;
  auto it = projects.find(key);
  if (it == projects.end())
    throw WorkspaceError(WorkspaceErrorKind::Config,
                         fmt::format("Unknown project '{}'. Available projects: {}",
                                     key, fmt::join(list_projects(), ", ")));
  return it->second;
}

std::optional<ProjectConfig>
ConfigManager::find_project(const std::string &identifier) const {
  const auto &projects = config().projects;
  if (auto it = projects.find(identifier); it != projects.end())
    return it->second;

  const std::string want = lower(identifier);
  for (const auto &[key, p] : projects)
    if (lower(key) == want)
      return p;
  for (const auto &[key, p] : projects)
    if (lower(repo_basename(p.repo)) == want)
      return p;
  return std::nullopt;
}

std::vector<std::string> ConfigManager::list_projects() const {
  std::vector<std::string> keys;
  for (const auto &kv : config().projects)
    keys.push_back(kv.first);
  return keys;
}

const ProjectConfig &ConfigManager::validate_project(const std::string &key) const {
  const ProjectConfig &p = project(key);
  if (p.name.empty() || p.repo.empty())
    throw WorkspaceError(
        WorkspaceErrorKind::Config,
        fmt::format("Project '{}' has incomplete configuration - name and repo "
                    "are required",
                    key));

  if (is_remote_repo(p.repo)) {
    validate_git_url(p.repo);
  } else {
    std::error_code ec;
    if (!fs::exists(p.repo, ec))
      throw WorkspaceError(
          WorkspaceErrorKind::Config,
          fmt::format("Repository does not exist: {}\n"
                      "Clone it there or update projects.{}.repo in {}",
                      p.repo, key, path_.string()));
  }

  if (p.sample_repo && !is_remote_repo(*p.sample_repo)) {
    std::error_code ec;
    if (!fs::exists(*p.sample_repo, ec))
      spdlog::warn("[config] sample repository does not exist: {}",
                   *p.sample_repo);
  }
  return p;
}

fs::path ConfigManager::project_base_dir(const std::string &key) const {
  const ProjectConfig &p = validate_project(key);
  const auto &g = config().global;
  return g.src_dir / g.workspace_base / p.key;
}

WorkspacePaths ConfigManager::workspace_paths(const std::string &key,
                                              const std::string &workspace) const {
  const ProjectConfig &p = validate_project(key);
  WorkspacePaths wp;
  wp.src_dir = config().global.src_dir;
  wp.base_dir = project_base_dir(key);
  wp.workspace_dir = validate_path_within(wp.base_dir, workspace);

  if (is_remote_repo(p.repo))
    wp.source_repo_path = wp.src_dir / repo_basename(p.repo);
  else
    wp.source_repo_path = p.repo;
  wp.source_path = wp.workspace_dir / wp.source_repo_path.filename();

  if (p.sample_repo) {
    if (is_remote_repo(*p.sample_repo)) {
      const auto name = repo_basename(*p.sample_repo);
      wp.destination_repo_path = wp.src_dir / name;
      wp.destination_path = wp.workspace_dir / name;
    } else {
      wp.destination_repo_path = fs::path(*p.sample_repo);
      wp.destination_path =
          wp.workspace_dir / wp.destination_repo_path->filename();
    }
  }
  return wp;
}

std::optional<fs::path> ConfigManager::env_file_path(const std::string &key) const {
  const ProjectConfig &p = project(key);
  if (!p.env_file)
    return std::nullopt;
  const auto &g = config().global;
  const fs::path dir = g.env_files_dir ? *g.env_files_dir
                                       : path_.parent_path() / "env-files";
  return dir / *p.env_file;
}

} // namespace space
