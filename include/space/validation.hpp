#pragma once
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace space {

constexpr std::size_t kMaxBranchNameLength = 100;
constexpr std::size_t kMaxWorkspaceNameLength = 50;
constexpr std::size_t kMaxProjectKeyLength = 20;
// Issue/PR numbers above this are treated as typos, not real ids.
constexpr int kMaxGitHubId = 999999;

// All validators throw space::PolicyError on rejection.

// Cuts at the first command separator (; & | ` CR LF), strips everything
// outside [A-Za-z0-9_./-], rejects a leading '-' or '.' and any "..",
// truncates to kMaxBranchNameLength. Idempotent on its own output.
std::string validate_branch_name(const std::string &input);

// Keeps [A-Za-z0-9_-] only, truncates to kMaxWorkspaceNameLength.
std::string validate_workspace_name(const std::string &input);

// Strict: [A-Za-z0-9_-]{1,kMaxProjectKeyLength} or throw. No normalization.
std::string validate_project_key(const std::string &input);

std::vector<int> validate_github_ids(const std::vector<std::string> &inputs);

std::string validate_git_url(const std::string &url);
std::string validate_local_repository_path(const std::string &path);
std::string validate_repository_path(const std::string &input);

// target resolved against base; must stay inside base.
std::filesystem::path validate_path_within(const std::filesystem::path &base,
                                           const std::filesystem::path &target);

bool has_control_characters(const std::string &s);

} // namespace space
