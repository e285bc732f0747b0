#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace YAML {
class Node;
}

namespace space {

struct ProjectConfig {
  std::string key;
  std::string name;
  std::string repo;
  std::optional<std::string> sample_repo;
  std::optional<std::string> github_org;
  std::optional<std::string> sample_app_path;
  std::optional<std::string> env_file;
  std::optional<std::string> post_init; // from `post-init` after normalization
};

struct GlobalConfig {
  std::filesystem::path src_dir;
  std::string workspace_base = "workspaces";
  std::optional<std::filesystem::path> env_files_dir;
  std::string package_manager = "pnpm";
  std::vector<std::string> dependencies{"git", "gh"};
};

struct RepositoryConfig {
  bool ensure_freshness = true;
};

struct Config {
  std::filesystem::path source;
  std::map<std::string, ProjectConfig> projects;
  GlobalConfig global;
  RepositoryConfig repository;
};

struct WorkspacePaths {
  std::filesystem::path src_dir;
  std::filesystem::path base_dir;
  std::filesystem::path workspace_dir;
  std::filesystem::path source_repo_path;
  std::filesystem::path source_path;
  std::optional<std::filesystem::path> destination_repo_path;
  std::optional<std::filesystem::path> destination_path;
};

// Rewrites legacy `post_init` keys of every project to `post-init` in place.
// When both spellings exist the hyphenated one wins and `post_init` is
// dropped.
void normalize_project_keys(YAML::Node &root);

// Parses YAML text (normalizing first) and resolves paths relative to
// `source`'s directory. Throws WorkspaceError(Config) on malformed input.
Config parse_config(const std::string &text, const std::filesystem::path &source);

std::vector<std::filesystem::path>
config_search_paths(const std::optional<std::filesystem::path> &explicit_path);

bool is_remote_repo(const std::string &repo);
std::string repo_basename(const std::string &repo);

class ConfigManager {
public:
  explicit ConfigManager(std::optional<std::filesystem::path> explicit_path = {});

  // Locates, reads and parses the config file. A file whose content hash is
  // unchanged since the previous load is served from the cache.
  const Config &load();
  bool loaded() const { return config_.has_value(); }
  const Config &config() const;
  const std::filesystem::path &path() const { return path_; }
  std::size_t parse_count() const { return parse_count_; }

  const ProjectConfig &project(const std::string &key) const;
  std::optional<ProjectConfig> find_project(const std::string &identifier) const;
  std::vector<std::string> list_projects() const;
  const ProjectConfig &validate_project(const std::string &key) const;

  std::filesystem::path project_base_dir(const std::string &key) const;
  WorkspacePaths workspace_paths(const std::string &key,
                                 const std::string &workspace) const;
  std::optional<std::filesystem::path> env_file_path(const std::string &key) const;

private:
  std::optional<std::filesystem::path> explicit_path_;
  std::filesystem::path path_;
  std::optional<Config> config_;
  std::uint64_t hash_{0};
  std::size_t parse_count_{0};
};

} // namespace space
