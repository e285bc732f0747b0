#include <space/cli.hpp>

#include <cctype>
#include <string_view>

namespace space {

static bool has_arg(std::size_t i, std::size_t n) { return i + 1 < n; }

// "-12" is a (bad) issue id for the validator, not an option
static bool is_option(std::string_view a) {
  if (a.size() < 2 || a[0] != '-')
    return false;
  return !std::isdigit(static_cast<unsigned char>(a[1]));
}

ParseResult parse_cli(int argc, char **argv) {
  ParseResult r{};
  std::vector<std::string> pos;
  bool force = false;

  const std::size_t n = argc > 0 ? static_cast<std::size_t>(argc) : 0;
  bool options_done = false;
  for (std::size_t i = 1; i < n; ++i) {
    std::string_view a = argv[i];
    if (options_done || !is_option(a)) {
      pos.emplace_back(a);
      continue;
    }
    if (a == "--") {
      options_done = true;
    } else if (a == "-c" || a == "--config") {
      if (!has_arg(i, n)) {
        r.error = std::string(a) + ": path required";
        return r;
      }
      r.globals.config = std::filesystem::path(argv[++i]);
    } else if (a == "--log-file") {
      if (!has_arg(i, n)) {
        r.error = "--log-file: path required";
        return r;
      }
      r.globals.log_file = std::filesystem::path(argv[++i]);
    } else if (a == "--dry-run") {
      r.globals.dry_run = true;
    } else if (a == "--silent") {
      r.globals.verbosity = Verbosity::Silent;
    } else if (a == "-v" || a == "--verbose") {
      if (r.globals.verbosity != Verbosity::Debug)
        r.globals.verbosity = Verbosity::Verbose;
    } else if (a == "--debug") {
      r.globals.verbosity = Verbosity::Debug;
    } else if (a == "--force" || a == "-f") {
      force = true;
    } else if (a == "--help" || a == "-h") {
      r.cmd = CmdHelp{};
      return r;
    } else if (a == "--version") {
      r.cmd = CmdVersion{};
      return r;
    } else {
      r.error = "unknown option: " + std::string(a);
      return r;
    }
  }

  if (pos.empty()) {
    r.cmd = CmdHelp{};
    return r;
  }

  const std::string cmd = pos.front();
  const std::vector<std::string> args(pos.begin() + 1, pos.end());

  if (force && cmd != "clean") {
    r.error = cmd + ": --force is only valid for clean";
    return r;
  }

  if (cmd == "help") {
    r.cmd = CmdHelp{};
  } else if (cmd == "version") {
    r.cmd = CmdVersion{};
  } else if (cmd == "init") {
    if (args.size() < 2) {
      r.error = "init: <project> [github-ids...] <branch> required";
      return r;
    }
    CmdInit c;
    c.project = args.front();
    c.branch = args.back();
    c.github_ids.assign(args.begin() + 1, args.end() - 1);
    r.cmd = c;
  } else if (cmd == "list") {
    if (args.size() > 1) {
      r.error = "list: at most one project";
      return r;
    }
    CmdList c;
    if (!args.empty())
      c.project = args.front();
    r.cmd = c;
  } else if (cmd == "projects") {
    r.cmd = CmdProjects{};
  } else if (cmd == "clean") {
    if (args.size() != 2) {
      r.error = "clean: <project> <workspace> required";
      return r;
    }
    r.cmd = CmdClean{args[0], args[1], force};
  } else if (cmd == "info") {
    if (args.size() != 2) {
      r.error = "info: <project> <workspace> required";
      return r;
    }
    r.cmd = CmdInfo{args[0], args[1]};
  } else if (cmd == "doctor") {
    r.cmd = CmdDoctor{};
  } else {
    r.error = "unknown command: " + cmd;
  }
  return r;
}

} // namespace space
