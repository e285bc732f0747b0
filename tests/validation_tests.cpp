#include <catch2/catch_all.hpp>
#include <space/errors.hpp>
#include <space/validation.hpp>

#include <string>
#include <vector>

using namespace space;
namespace fs = std::filesystem;

static PolicyErrorKind kind_of(void (*fn)()) {
  try {
    fn();
  } catch (const PolicyError &e) {
    return e.kind();
  }
  FAIL("expected PolicyError");
  return PolicyErrorKind::RequiredField;
}

TEST_CASE("branch name keeps conformant input") {
  REQUIRE(validate_branch_name("feature/auth-fix") == "feature/auth-fix");
  REQUIRE(validate_branch_name("release_1.2") == "release_1.2");
  REQUIRE(validate_branch_name("  padded  ") == "padded");
}

TEST_CASE("branch name drops chained commands") {
  REQUIRE(validate_branch_name("feature/auth-fix;rm -rf /") == "feature/auth-fix");
  REQUIRE(validate_branch_name("main && curl evil") == "main");
  REQUIRE(validate_branch_name("dev|cat /etc/passwd") == "dev");
  REQUIRE(validate_branch_name("x`id`") == "x");
  REQUIRE(validate_branch_name("line\nsecond") == "line");
}

TEST_CASE("branch name strips unsafe characters") {
  REQUIRE(validate_branch_name("test<script>") == "testscript");
  REQUIRE(validate_branch_name("my branch") == "mybranch");
  REQUIRE(validate_branch_name("a$(b)") == "ab");
}

TEST_CASE("branch name rejects dangerous patterns") {
  REQUIRE(kind_of([] { validate_branch_name("-delete"); }) ==
          PolicyErrorKind::InvalidPattern);
  REQUIRE(kind_of([] { validate_branch_name(".hidden"); }) ==
          PolicyErrorKind::InvalidPattern);
  REQUIRE(kind_of([] { validate_branch_name("a/../b"); }) ==
          PolicyErrorKind::InvalidPattern);
  REQUIRE(kind_of([] { validate_branch_name("<>"); }) ==
          PolicyErrorKind::NoValidCharacters);
  REQUIRE(kind_of([] { validate_branch_name("   "); }) ==
          PolicyErrorKind::RequiredField);
  REQUIRE(kind_of([] { validate_branch_name(";rm -rf /"); }) ==
          PolicyErrorKind::NoValidCharacters);
}

TEST_CASE("branch name is truncated and idempotent") {
  const std::string long_name(150, 'a');
  auto once = validate_branch_name(long_name);
  REQUIRE(once.size() == kMaxBranchNameLength);
  REQUIRE(validate_branch_name(once) == once);

  auto cleaned = validate_branch_name("feat/x<y>;z");
  REQUIRE(validate_branch_name(cleaned) == cleaned);
}

TEST_CASE("workspace name strips to identifier characters") {
  REQUIRE(validate_workspace_name("my workspace!") == "myworkspace");
  REQUIRE(validate_workspace_name("feature_auth-1") == "feature_auth-1");
  REQUIRE(validate_workspace_name("a/b") == "ab");
  REQUIRE(validate_workspace_name(std::string(80, 'w')).size() ==
          kMaxWorkspaceNameLength);
  REQUIRE(kind_of([] { validate_workspace_name(""); }) ==
          PolicyErrorKind::RequiredField);
  REQUIRE(kind_of([] { validate_workspace_name("!!!"); }) ==
          PolicyErrorKind::NoValidCharacters);
}

TEST_CASE("project key is strict") {
  REQUIRE(validate_project_key("next") == "next");
  REQUIRE(validate_project_key("auth0-java_2") == "auth0-java_2");
  REQUIRE(kind_of([] { validate_project_key(""); }) ==
          PolicyErrorKind::RequiredField);
  REQUIRE(kind_of([] { validate_project_key("../etc"); }) ==
          PolicyErrorKind::InvalidCharacters);
  REQUIRE(kind_of([] { validate_project_key("a b"); }) ==
          PolicyErrorKind::InvalidCharacters);
  REQUIRE(kind_of([] { validate_project_key("abcdefghijklmnopqrstu"); }) ==
          PolicyErrorKind::InvalidCharacters);
  REQUIRE(validate_project_key("abcdefghijklmnopqrst").size() ==
          kMaxProjectKeyLength);
}

TEST_CASE("github ids are positive and bounded") {
  REQUIRE(validate_github_ids({"1", " 42 ", "999999", "42"}) ==
          std::vector<int>{1, 42, 999999, 42});
  REQUIRE(validate_github_ids({}).empty());

  for (const char *bad : {"0", "-1", "9999999", "abc", "", "1.5", "12a"}) {
    try {
      validate_github_ids({"7", bad});
      FAIL("accepted " << bad);
    } catch (const PolicyError &e) {
      REQUIRE(e.kind() == PolicyErrorKind::InvalidId);
      REQUIRE(e.offending() == bad);
    }
  }
}

TEST_CASE("git urls are limited to known schemes and hosts") {
  REQUIRE(validate_git_url("https://github.com/auth0/node-auth0.git") ==
          "https://github.com/auth0/node-auth0.git");
  REQUIRE(validate_git_url("git@github.com:auth0/node-auth0.git") ==
          "git@github.com:auth0/node-auth0.git");
  REQUIRE(validate_git_url("ssh://git@example.org/repo.git") ==
          "ssh://git@example.org/repo.git");

  REQUIRE(kind_of([] { validate_git_url("https://evil.example.com/x.git"); }) ==
          PolicyErrorKind::InvalidPattern);
  REQUIRE(kind_of([] { validate_git_url("file:///etc/passwd"); }) ==
          PolicyErrorKind::InvalidPattern);
  REQUIRE(kind_of([] { validate_git_url("https://github.com/a/../b"); }) ==
          PolicyErrorKind::InvalidPattern);
  REQUIRE(kind_of([] { validate_git_url(""); }) ==
          PolicyErrorKind::RequiredField);
}

TEST_CASE("repository paths must be absolute and clean") {
  REQUIRE(validate_local_repository_path("/home/dev/src/app") ==
          "/home/dev/src/app");
  REQUIRE(kind_of([] { validate_local_repository_path("relative/app"); }) ==
          PolicyErrorKind::InvalidPattern);
  REQUIRE(kind_of([] { validate_local_repository_path("/src/../etc"); }) ==
          PolicyErrorKind::InvalidPattern);
  REQUIRE(kind_of([] { validate_local_repository_path("/src/a|b"); }) ==
          PolicyErrorKind::InvalidPattern);

  REQUIRE(validate_repository_path("https://gitlab.com/x/y.git") ==
          "https://gitlab.com/x/y.git");
  REQUIRE(validate_repository_path("/srv/repo") == "/srv/repo");
}

TEST_CASE("paths stay within their base") {
  const fs::path base = "/tmp/space_base";
  REQUIRE(validate_path_within(base, "ws1") == fs::path("/tmp/space_base/ws1"));
  REQUIRE(validate_path_within(base, "a/./b") ==
          fs::path("/tmp/space_base/a/b"));
  REQUIRE(kind_of([] { validate_path_within("/tmp/space_base", "../other"); }) ==
          PolicyErrorKind::InvalidPattern);
  REQUIRE(kind_of([] { validate_path_within("/tmp/space_base", "/etc"); }) ==
          PolicyErrorKind::InvalidPattern);
}
