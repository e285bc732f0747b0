#pragma once
#include <space/cli.hpp>
#include <space/config.hpp>
#include <space/exec.hpp>

namespace space {

// One method per subcommand. Policy and workspace failures propagate as
// exceptions; the return value is the process exit code.
class Commands {
public:
  Commands(const GlobalOptions &g, const SecureExecutor &exec)
      : g_(g), cfg_(g.config), exec_(exec) {}

  int init(const CmdInit &c);
  int list(const CmdList &c);
  int projects();
  int info(const CmdInfo &c);
  int clean(const CmdClean &c);
  int doctor();

private:
  const GlobalOptions &g_;
  ConfigManager cfg_;
  const SecureExecutor &exec_;
};

class App {
public:
  int run(int argc, char **argv);
};

} // namespace space
