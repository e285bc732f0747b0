#pragma once
#include <space/logging.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace space {

struct GlobalOptions {
  std::optional<std::filesystem::path> config;
  bool dry_run = false;
  Verbosity verbosity = Verbosity::Normal;
  std::optional<std::filesystem::path> log_file;
};

struct CmdInit {
  std::string project;
  std::vector<std::string> github_ids;
  std::string branch;
};
struct CmdList {
  std::optional<std::string> project;
};
struct CmdProjects {};
struct CmdClean {
  std::string project;
  std::string workspace;
  bool force = false;
};
struct CmdInfo {
  std::string project;
  std::string workspace;
};
struct CmdDoctor {};
struct CmdHelp {};
struct CmdVersion {};

using Command = std::variant<CmdInit, CmdList, CmdProjects, CmdClean, CmdInfo,
                             CmdDoctor, CmdHelp, CmdVersion>;

struct ParseResult {
  GlobalOptions globals;
  std::optional<Command> cmd;
  std::string error;
};

ParseResult parse_cli(int argc, char **argv);

} // namespace space
