#include <catch2/catch_all.hpp>
#include <space/app.hpp>
#include <space/errors.hpp>

#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace space;
namespace fs = std::filesystem;

namespace {

std::string joined(const std::vector<std::string> &argv) {
  std::string key;
  for (const auto &a : argv)
    key += (key.empty() ? "" : " ") + a;
  return key;
}

// Answers by the space-joined argv; anything unscripted succeeds silently.
// Commands starting with one of `failing` exit 128.
struct ScriptedLauncher : ProcessLauncher {
  std::mutex mu;
  std::vector<LaunchRequest> calls;
  std::map<std::string, ExecResult> script;
  std::vector<std::string> failing;

  ExecResult launch(const LaunchRequest &req) override {
    std::lock_guard<std::mutex> lk(mu);
    calls.push_back(req);
    const std::string key = joined(req.argv);
    for (const auto &prefix : failing) {
      if (key.rfind(prefix, 0) == 0) {
        ExecResult r;
        r.exit_code = 128;
        r.std_err = "fatal: " + key;
        return r;
      }
    }
    auto it = script.find(key);
    return it == script.end() ? ExecResult{} : it->second;
  }

  bool ran(const std::string &cmd) {
    std::lock_guard<std::mutex> lk(mu);
    for (const auto &c : calls)
      if (joined(c.argv) == cmd)
        return true;
    return false;
  }
};

ExecResult result(int code, std::string out = "", std::string err = "") {
  ExecResult r;
  r.exit_code = code;
  r.std_out = std::move(out);
  r.std_err = std::move(err);
  return r;
}

// src/sdk and src/samples are repositories, workspaces land under
// src/workspaces/sdk.
struct Fixture {
  fs::path root;
  GlobalOptions globals;
  std::shared_ptr<ScriptedLauncher> launcher = std::make_shared<ScriptedLauncher>();
  SecureExecutor exec{AllowList::defaults(), launcher};

  explicit Fixture(const char *name)
      : root(fs::temp_directory_path() / (std::string("space_app_") + name)) {
    fs::remove_all(root);
    fs::create_directories(root / "src" / "sdk" / ".git");
    fs::create_directories(root / "src" / "samples" / ".git");
    std::ofstream(root / "space.yaml")
        << "global:\n"
        << "  src_dir: " << (root / "src").string() << "\n"
        << "projects:\n"
        << "  sdk:\n"
        << "    name: SDK\n"
        << "    repo: sdk\n"
        << "    sample_repo: samples\n"
        << "    github_org: acme\n"
        << "    post_init: echo done\n";
    globals.config = root / "space.yaml";
    launcher->script["gh auth status"] =
        result(0, "", "Logged in to github.com as octo (keyring)\n");
  }

  fs::path workspace() const {
    return root / "src" / "workspaces" / "sdk" / "feature_x";
  }
};

} // namespace

TEST_CASE("init rejects bad input before touching anything") {
  Fixture f("badid");
  Commands cmds(f.globals, f.exec);

  REQUIRE_THROWS_AS(cmds.init(CmdInit{"sdk", {"abc"}, "feature/x"}), PolicyError);
  REQUIRE_THROWS_AS(cmds.init(CmdInit{"sdk", {"0"}, "feature/x"}), PolicyError);
  REQUIRE_THROWS_AS(cmds.init(CmdInit{"sdk!", {}, "feature/x"}), PolicyError);

  REQUIRE_FALSE(fs::exists(f.root / "src" / "workspaces"));
  REQUIRE(f.launcher->calls.empty());
}

TEST_CASE("init stops when an issue does not exist") {
  Fixture f("noissue");
  f.launcher->script["gh api repos/acme/sdk/issues/7 --jq .number"] =
      result(1, "", "gh: Not Found (HTTP 404)");

  try {
    Commands(f.globals, f.exec).init(CmdInit{"sdk", {"7"}, "feature/x"});
    FAIL("missing issue accepted");
  } catch (const WorkspaceError &e) {
    REQUIRE(e.kind() == WorkspaceErrorKind::GitHub);
    REQUIRE(std::string(e.what()).find("Issue #7 not found") != std::string::npos);
  }
  REQUIRE_FALSE(fs::exists(f.workspace()));
  REQUIRE_FALSE(f.launcher->ran("sh -c echo done"));
}

TEST_CASE("init replaces an existing workspace and returns the post-init code") {
  Fixture f("replace");
  fs::create_directories(f.workspace());
  std::ofstream(f.workspace() / "stale.txt") << "old\n";
  f.launcher->script["gh api repos/acme/sdk/issues/7 --jq .number"] = result(0, "7\n");
  f.launcher->script["sh -c echo done"] = result(2, "", "install failed");

  const int rc = Commands(f.globals, f.exec).init(CmdInit{"sdk", {"7"}, "feature/x"});

  REQUIRE(rc == 2);
  REQUIRE(fs::is_directory(f.workspace()));
  REQUIRE_FALSE(fs::exists(f.workspace() / "stale.txt"));
  REQUIRE(f.launcher->ran("git branch -D feature/x"));
  REQUIRE(f.launcher->ran("git branch -D feature-x-samples"));
  REQUIRE(f.launcher->ran("git worktree add " + (f.workspace() / "sdk").string() +
                          " -b feature/x origin/main"));
  REQUIRE(f.launcher->ran("git worktree add " +
                          (f.workspace() / "samples").string() +
                          " -b feature-x-samples origin/main"));
  REQUIRE(f.launcher->calls.back().cwd == f.workspace());
}

TEST_CASE("init falls back to a plain directory when git fails") {
  Fixture f("gitfail");
  f.launcher->failing.push_back("git worktree add");

  const int rc = Commands(f.globals, f.exec).init(CmdInit{"sdk", {}, "feature/x"});

  REQUIRE(rc == 0);
  REQUIRE(fs::is_directory(f.workspace()));
  REQUIRE(f.launcher->ran("sh -c echo done"));
  REQUIRE_FALSE(f.launcher->ran("gh --version"));
}

TEST_CASE("init in dry-run mode creates nothing") {
  Fixture f("dryrun");
  f.globals.dry_run = true;

  const int rc = Commands(f.globals, f.exec).init(CmdInit{"sdk", {"7"}, "feature/x"});

  REQUIRE(rc == 0);
  REQUIRE_FALSE(fs::exists(f.workspace()));
  REQUIRE(f.launcher->calls.empty());
}

TEST_CASE("info reports an existing workspace and rejects a missing one") {
  Fixture f("info");
  Commands cmds(f.globals, f.exec);

  try {
    cmds.info(CmdInfo{"sdk", "feature_x"});
    FAIL("missing workspace accepted");
  } catch (const WorkspaceError &e) {
    REQUIRE(e.kind() == WorkspaceErrorKind::FileSystem);
  }

  fs::create_directories(f.workspace() / "sdk");
  REQUIRE(cmds.info(CmdInfo{"sdk", "feature_x"}) == 0);
  REQUIRE_THROWS_AS(cmds.info(CmdInfo{"sdk!", "feature_x"}), PolicyError);
}

TEST_CASE("clean without --force keeps the workspace") {
  Fixture f("clean");
  fs::create_directories(f.workspace() / "sdk");
  f.launcher->script["git branch --show-current"] = result(0, "feature/x\n");

  REQUIRE(Commands(f.globals, f.exec).clean(CmdClean{"sdk", "feature_x", false}) == 0);
  REQUIRE(fs::exists(f.workspace()));

  REQUIRE(Commands(f.globals, f.exec).clean(CmdClean{"sdk", "feature_x", true}) == 0);
  REQUIRE_FALSE(fs::exists(f.workspace()));
  REQUIRE(f.launcher->ran("git branch -D feature/x"));
}

TEST_CASE("run maps failures to exit codes") {
  Fixture f("run");
  std::ofstream(f.root / "odd.yaml") << "projects:\n  ? [a, b]\n  : {post_init: x}\n";
  const std::string odd = (f.root / "odd.yaml").string();
  const std::string good = f.globals.config->string();

  auto run = [](std::vector<std::string> args) {
    args.insert(args.begin(), "space");
    std::vector<char *> argv;
    for (auto &a : args)
      argv.push_back(a.data());
    argv.push_back(nullptr);
    return App{}.run(static_cast<int>(args.size()), argv.data());
  };

  REQUIRE(run({"--silent", "-c", odd, "projects"}) == 1);
  REQUIRE(run({"--silent", "-c", good, "info", "sdk"}) == 2);
  REQUIRE(run({"--silent", "-c", good, "info", "sdk", "nope"}) == 1);
  REQUIRE(run({"--silent", "-c", good, "projects"}) == 0);
}
