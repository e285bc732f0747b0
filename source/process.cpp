#include <space/process.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <thread>

namespace fs = std::filesystem;
using Clock = std::chrono::steady_clock;
using namespace std::chrono_literals;

namespace space {

namespace {

enum class ChildStage : int { Chdir = 1, Exec = 2 };

struct ChildFailure {
  int stage;
  int err;
};

int make_cloexec_pipe(int pfd[2]) {
#ifdef __linux__
  if (::pipe2(pfd, O_CLOEXEC) == 0)
    return 0;
#endif
  if (::pipe(pfd) != 0)
    return -1;
  ::fcntl(pfd[0], F_SETFD, ::fcntl(pfd[0], F_GETFD) | FD_CLOEXEC);
  ::fcntl(pfd[1], F_SETFD, ::fcntl(pfd[1], F_GETFD) | FD_CLOEXEC);
  return 0;
}

void close_fd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

int decode_status(int st) {
  if (WIFEXITED(st))
    return WEXITSTATUS(st);
  if (WIFSIGNALED(st))
    return 128 + WTERMSIG(st);
  return -1;
}

ExecResult failure(int exit_code, std::string message) {
  ExecResult r;
  r.exit_code = exit_code;
  r.std_err = std::move(message);
  return r;
}

int exit_code_for_errno(int err) {
  return (err == EACCES || err == EPERM || err == ENOEXEC) ? kExitNotExecutable
                                                            : kExitNotFound;
}

// Reaps pid before `deadline`; false if it is still running.
bool wait_until(pid_t pid, Clock::time_point deadline, bool has_deadline,
                int &status) {
  for (;;) {
    pid_t r = ::waitpid(pid, &status, has_deadline ? WNOHANG : 0);
    if (r == pid)
      return true;
    if (r < 0 && errno != EINTR)
      return true; // already reaped elsewhere; nothing left to wait for
    if (has_deadline && Clock::now() >= deadline)
      return false;
    if (has_deadline)
      std::this_thread::sleep_for(10ms);
  }
}

void terminate_group(pid_t pid, std::chrono::milliseconds grace) {
  ::kill(-pid, SIGTERM);
  int st = 0;
  if (wait_until(pid, Clock::now() + grace, true, st))
    return;
  spdlog::debug("[proc] pid={} ignored SIGTERM; sending SIGKILL", pid);
  ::kill(-pid, SIGKILL);
  while (::waitpid(pid, &st, 0) < 0 && errno == EINTR) {
  }
}

} // namespace

std::optional<std::string> env_lookup(const std::vector<std::string> &envp,
                                      const std::string &key) {
  const std::string prefix = key + "=";
  for (const auto &kv : envp) {
    if (kv.rfind(prefix, 0) == 0)
      return kv.substr(prefix.size());
  }
  return std::nullopt;
}

std::optional<fs::path> find_in_path(const std::string &name,
                                     const std::string &path_var) {
  if (name.empty())
    return std::nullopt;
  if (name.find('/') != std::string::npos) {
    if (::access(name.c_str(), X_OK) == 0)
      return fs::path(name);
    return std::nullopt;
  }

  std::size_t start = 0;
  for (;;) {
    auto end = path_var.find(':', start);
    std::string dir = path_var.substr(
        start, end == std::string::npos ? std::string::npos : end - start);
    if (dir.empty())
      dir = ".";
    fs::path cand = fs::path(dir) / name;
    std::error_code ec;
    if (fs::is_regular_file(cand, ec) && ::access(cand.c_str(), X_OK) == 0)
      return cand;
    if (end == std::string::npos)
      break;
    start = end + 1;
  }
  return std::nullopt;
}

ExecResult PosixProcessLauncher::launch(const LaunchRequest &req) {
  if (req.argv.empty())
    return failure(kExitNotFound, "empty argv");
  if (req.use_shell)
    return failure(kExitNotExecutable,
                   "shell interpretation is disabled for this launcher");

  const std::string &name = req.argv.front();
  const std::string path_var =
      env_lookup(req.envp, "PATH").value_or("/usr/local/bin:/usr/bin:/bin");
  auto exe = find_in_path(name, path_var);
  if (!exe)
    return failure(kExitNotFound,
                   fmt::format("failed to launch '{}': executable not found in "
                               "PATH ({})",
                               name, path_var));

  // everything the child touches is built before fork()
  const std::string exe_str = exe->string();
  const std::string cwd_str = req.cwd ? req.cwd->string() : std::string{};
  std::vector<char *> argv;
  argv.reserve(req.argv.size() + 1);
  for (auto &s : req.argv)
    argv.push_back(const_cast<char *>(s.c_str()));
  argv.push_back(nullptr);
  std::vector<char *> envp;
  envp.reserve(req.envp.size() + 1);
  for (auto &s : req.envp)
    envp.push_back(const_cast<char *>(s.c_str()));
  envp.push_back(nullptr);

  int out_pipe[2] = {-1, -1}, err_pipe[2] = {-1, -1}, st_pipe[2] = {-1, -1};
  if (make_cloexec_pipe(out_pipe) != 0 || make_cloexec_pipe(err_pipe) != 0 ||
      make_cloexec_pipe(st_pipe) != 0) {
    int e = errno;
    for (int *p : {out_pipe, err_pipe, st_pipe}) {
      close_fd(p[0]);
      close_fd(p[1]);
    }
    return failure(kExitNotFound,
                   fmt::format("failed to launch '{}': pipe: {}", name,
                               std::strerror(e)));
  }

  pid_t pid = ::fork();
  if (pid < 0) {
    int e = errno;
    for (int *p : {out_pipe, err_pipe, st_pipe}) {
      close_fd(p[0]);
      close_fd(p[1]);
    }
    return failure(kExitNotFound,
                   fmt::format("failed to launch '{}': fork: {}", name,
                               std::strerror(e)));
  }

  if (pid == 0) {
    ::setpgid(0, 0);
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
      ::close(devnull);
    }
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);

    if (!cwd_str.empty() && ::chdir(cwd_str.c_str()) != 0) {
      ChildFailure f{static_cast<int>(ChildStage::Chdir), errno};
      (void)!::write(st_pipe[1], &f, sizeof(f));
      _exit(kExitNotFound);
    }
    ::execve(exe_str.c_str(), argv.data(), envp.data());

    ChildFailure f{static_cast<int>(ChildStage::Exec), errno};
    (void)!::write(st_pipe[1], &f, sizeof(f));
    _exit(kExitNotFound);
  }

  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  close_fd(st_pipe[1]);

  // closed by exec on success, carries ChildFailure otherwise
  ChildFailure cf{};
  ssize_t n;
  do {
    n = ::read(st_pipe[0], &cf, sizeof(cf));
  } while (n < 0 && errno == EINTR);
  close_fd(st_pipe[0]);

  if (n == static_cast<ssize_t>(sizeof(cf))) {
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);
    int st = 0;
    while (::waitpid(pid, &st, 0) < 0 && errno == EINTR) {
    }
    if (cf.stage == static_cast<int>(ChildStage::Chdir))
      return failure(kExitNotFound,
                     fmt::format("failed to launch '{}': cannot enter working "
                                 "directory {}: {}",
                                 name, cwd_str, std::strerror(cf.err)));
    return failure(exit_code_for_errno(cf.err),
                   fmt::format("failed to launch '{}': {}", name,
                               std::strerror(cf.err)));
  }

  spdlog::trace("[proc] spawned {} pid={}", exe_str, pid);

  ExecResult res;
  const bool has_deadline = req.timeout.count() > 0;
  const auto deadline = Clock::now() + req.timeout;
  bool timed_out = false;

  std::array<pollfd, 2> fds{{{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}}};
  std::array<std::string *, 2> sinks{&res.std_out, &res.std_err};
  std::array<char, 4096> buf{};

  while (fds[0].fd >= 0 || fds[1].fd >= 0) {
    int wait_ms = -1;
    if (has_deadline) {
      auto left =
          std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
      if (left.count() <= 0) {
        timed_out = true;
        break;
      }
      wait_ms = static_cast<int>(left.count());
    }

    int rc = ::poll(fds.data(), fds.size(), wait_ms);
    if (rc < 0) {
      if (errno == EINTR)
        continue;
      res.std_err += fmt::format("\npoll: {}", std::strerror(errno));
      break;
    }
    for (std::size_t i = 0; i < fds.size(); ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0)
        continue;
      ssize_t got = ::read(fds[i].fd, buf.data(), buf.size());
      if (got > 0) {
        sinks[i]->append(buf.data(), static_cast<std::size_t>(got));
      } else if (got == 0 || errno != EINTR) {
        close_fd(fds[i].fd);
      }
    }
  }
  close_fd(fds[0].fd);
  close_fd(fds[1].fd);

  int status = 0;
  if (!timed_out && !wait_until(pid, deadline, has_deadline, status))
    timed_out = true;

  if (timed_out) {
    terminate_group(pid, kKillGrace);
    if (!res.std_err.empty() && res.std_err.back() != '\n')
      res.std_err += '\n';
    res.std_err += fmt::format("command '{}' timed out after {} ms", name,
                               req.timeout.count());
    res.exit_code = kExitTimedOut;
    return res;
  }

  res.exit_code = decode_status(status);
  return res;
}

} // namespace space
