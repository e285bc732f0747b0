#include <catch2/catch_all.hpp>
#include <space/config.hpp>
#include <space/errors.hpp>

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace space;
namespace fs = std::filesystem;

static fs::path mkd(const char *name) {
  auto d = fs::temp_directory_path() / (std::string("space_config_") + name);
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

static void write(const fs::path &p, const std::string &text) {
  std::ofstream o(p);
  o << text;
}

TEST_CASE("legacy post_init is renamed") {
  YAML::Node root = YAML::Load(R"(
projects:
  next:
    name: Next
    post_init: npm install
)");
  normalize_project_keys(root);
  REQUIRE(root["projects"]["next"]["post-init"].as<std::string>() == "npm install");
  REQUIRE_FALSE(root["projects"]["next"]["post_init"]);
}

TEST_CASE("hyphenated post-init wins over legacy spelling") {
  YAML::Node root = YAML::Load(R"(
projects:
  next:
    post-init: pnpm i
    post_init: npm install
  java:
    name: Java
)");
  normalize_project_keys(root);
  REQUIRE(root["projects"]["next"]["post-init"].as<std::string>() == "pnpm i");
  REQUIRE_FALSE(root["projects"]["next"]["post_init"]);
  REQUIRE_FALSE(root["projects"]["java"]["post-init"]);
}

TEST_CASE("normalization tolerates unusual trees") {
  YAML::Node scalar = YAML::Load("just text");
  REQUIRE_NOTHROW(normalize_project_keys(scalar));
  YAML::Node no_projects = YAML::Load("global: {src_dir: /x}");
  REQUIRE_NOTHROW(normalize_project_keys(no_projects));
}

TEST_CASE("parse resolves paths") {
  auto dir = mkd("parse");
  auto cfg = parse_config(R"(
projects:
  next:
    name: Next.js
    repo: nextjs-auth0
    sample_repo: https://github.com/auth0-samples/nextjs-quickstart.git
    github_org: auth0
    env_file: next.env
    post_init: pnpm install
  abs:
    name: Absolute
    repo: /opt/repos/abs/
global:
  src_dir: /home/dev/src
  workspace_base: spaces
  env_files_dir: ./env-files
  dependencies: [git]
repository:
  ensure_freshness: false
)",
                          dir / "config.yaml");

  REQUIRE(cfg.projects.size() == 2);
  const auto &next = cfg.projects.at("next");
  REQUIRE(next.key == "next");
  REQUIRE(next.repo == "/home/dev/src/nextjs-auth0");
  REQUIRE(next.sample_repo ==
          std::string("https://github.com/auth0-samples/nextjs-quickstart.git"));
  REQUIRE(next.post_init == std::string("pnpm install"));
  REQUIRE(cfg.projects.at("abs").repo == "/opt/repos/abs");
  REQUIRE(cfg.global.workspace_base == "spaces");
  REQUIRE(cfg.global.env_files_dir == dir / "env-files");
  REQUIRE(cfg.global.dependencies == std::vector<std::string>{"git"});
  REQUIRE_FALSE(cfg.repository.ensure_freshness);
}

TEST_CASE("malformed config is a config error") {
  try {
    parse_config("projects: [unclosed", "bad.yaml");
    FAIL("parsed malformed yaml");
  } catch (const WorkspaceError &e) {
    REQUIRE(e.kind() == WorkspaceErrorKind::Config);
  }
  REQUIRE_THROWS_AS(parse_config("projects:\n  x: 3\n", "bad.yaml"), WorkspaceError);
  REQUIRE_THROWS_AS(parse_config("- a\n- b\n", "bad.yaml"), WorkspaceError);
}

TEST_CASE("non-scalar project key is a config error") {
  try {
    parse_config("projects:\n  ? [a, b]\n  : {post_init: x}\n", "bad.yaml");
    FAIL("accepted a sequence as project key");
  } catch (const WorkspaceError &e) {
    REQUIRE(e.kind() == WorkspaceErrorKind::Config);
    REQUIRE(std::string(e.what()).find("bad.yaml") != std::string::npos);
  }
}

TEST_CASE("repo basename") {
  REQUIRE(repo_basename("https://github.com/auth0/node-auth0.git") == "node-auth0");
  REQUIRE(repo_basename("git@github.com:auth0/java.git") == "java");
  REQUIRE(repo_basename("/home/dev/src/app/") == "app");
  REQUIRE(is_remote_repo("https://x/y"));
  REQUIRE_FALSE(is_remote_repo("/srv/y"));
}

static fs::path manager_fixture(const char *name) {
  auto dir = mkd(name);
  auto src = dir / "src";
  fs::create_directories(src / "sdk" / ".git");
  fs::create_directories(src / "samples" / ".git");
  write(dir / "space.yaml", "projects:\n"
                            "  sdk:\n"
                            "    name: SDK\n"
                            "    repo: sdk\n"
                            "    sample_repo: samples\n"
                            "    env_file: sdk.env\n"
                            "  Remote:\n"
                            "    name: Remote\n"
                            "    repo: https://github.com/auth0/node-auth0.git\n"
                            "  broken:\n"
                            "    name: Broken\n"
                            "    repo: missing\n"
                            "  unnamed:\n"
                            "    repo: sdk\n"
                            "global:\n"
                            "  src_dir: " +
                                (src).string() +
                                "\n"
                                "  env_files_dir: ./env\n");
  return dir;
}

TEST_CASE("manager queries and workspace paths") {
  auto dir = manager_fixture("manager");
  auto src = dir / "src";
  ConfigManager mgr(dir / "space.yaml");
  REQUIRE_FALSE(mgr.loaded());
  mgr.load();
  REQUIRE(mgr.loaded());

  REQUIRE(mgr.list_projects() ==
          std::vector<std::string>{"Remote", "broken", "sdk", "unnamed"});
  REQUIRE(mgr.project("sdk").name == "SDK");
  REQUIRE_THROWS_AS(mgr.project("nope"), WorkspaceError);

  REQUIRE(mgr.find_project("sdk")->key == "sdk");
  REQUIRE(mgr.find_project("remote")->key == "Remote");
  REQUIRE(mgr.find_project("node-auth0")->key == "Remote");
  REQUIRE_FALSE(mgr.find_project("unknown").has_value());

  REQUIRE_NOTHROW(mgr.validate_project("sdk"));
  REQUIRE_NOTHROW(mgr.validate_project("Remote"));
  REQUIRE_THROWS_AS(mgr.validate_project("broken"), WorkspaceError);
  REQUIRE_THROWS_AS(mgr.validate_project("unnamed"), WorkspaceError);

  auto wp = mgr.workspace_paths("sdk", "feature_x");
  REQUIRE(wp.base_dir == src / "workspaces" / "sdk");
  REQUIRE(wp.workspace_dir == src / "workspaces" / "sdk" / "feature_x");
  REQUIRE(wp.source_repo_path == src / "sdk");
  REQUIRE(wp.source_path == wp.workspace_dir / "sdk");
  REQUIRE(wp.destination_repo_path == src / "samples");
  REQUIRE(wp.destination_path == wp.workspace_dir / "samples");

  auto remote = mgr.workspace_paths("Remote", "ws");
  REQUIRE(remote.source_repo_path == src / "node-auth0");
  REQUIRE_FALSE(remote.destination_path.has_value());

  REQUIRE(mgr.env_file_path("sdk") == dir / "env" / "sdk.env");
  REQUIRE_FALSE(mgr.env_file_path("Remote").has_value());
}

TEST_CASE("workspace names cannot escape the project directory") {
  auto dir = manager_fixture("escape");
  ConfigManager mgr(dir / "space.yaml");
  mgr.load();
  REQUIRE_THROWS_AS(mgr.workspace_paths("sdk", "../../etc"), PolicyError);
}

TEST_CASE("unchanged config is served from cache") {
  ::unsetenv("SPACE_DISABLE_CACHE");
  auto dir = manager_fixture("cache");
  ConfigManager mgr(dir / "space.yaml");
  mgr.load();
  mgr.load();
  REQUIRE(mgr.parse_count() == 1);

  std::ofstream(dir / "space.yaml", std::ios::app) << "# touched\n";
  mgr.load();
  REQUIRE(mgr.parse_count() == 2);

  ::setenv("SPACE_DISABLE_CACHE", "1", 1);
  mgr.load();
  REQUIRE(mgr.parse_count() == 3);
  ::unsetenv("SPACE_DISABLE_CACHE");
}

TEST_CASE("missing explicit config is reported") {
  ConfigManager mgr(fs::path("/nonexistent/space.yaml"));
  try {
    mgr.load();
    FAIL("loaded a missing file");
  } catch (const WorkspaceError &e) {
    REQUIRE(e.kind() == WorkspaceErrorKind::Config);
    REQUIRE(std::string(e.what()).find("/nonexistent/space.yaml") !=
            std::string::npos);
  }
  REQUIRE_THROWS_AS(mgr.config(), WorkspaceError);
}

TEST_CASE("search order") {
  auto paths = config_search_paths(fs::path("custom.yaml"));
  REQUIRE(paths.size() == 4);
  REQUIRE(paths[0] == "custom.yaml");
  REQUIRE(paths[1].filename() == ".space-config.yaml");
  REQUIRE(paths[2].filename() == ".workspace-config.yaml");
  REQUIRE(paths[3].filename() == "config.yaml");
}
