#include <gitactivity/process.hpp>

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace gitactivity {

static int safe_pipe(int fds[2]) { return ::pipe2(fds, O_CLOEXEC); }

std::optional<std::string> get_env(const char *name) {
  const char *v = std::getenv(name);
  if (!v)
    return std::nullopt;
  return std::string(v);
}

ExecResult run_command(const std::vector<std::string> &args,
                       const std::filesystem::path &cwd,
                       const EnvOverrides &env) {
  ExecResult res{};
  if (args.empty()) {
    res.err = "empty argv";
    return res;
  }

  int out_pipe[2], err_pipe[2];
  if (safe_pipe(out_pipe) != 0) {
    res.err = std::string("pipe failed: ") + std::strerror(errno);
    return res;
  }
  if (safe_pipe(err_pipe) != 0) {
    res.err = std::string("pipe failed: ") + std::strerror(errno);
    ::close(out_pipe[0]);
    ::close(out_pipe[1]);
    return res;
  }

  // built before fork: the child only touches env, fds and exec
  std::vector<char *> argv_c;
  argv_c.reserve(args.size() + 1);
  for (auto &s : args)
    argv_c.push_back(const_cast<char *>(s.c_str()));
  argv_c.push_back(nullptr);

  pid_t pid = ::fork();
  if (pid == -1) {
    res.err = std::string("fork failed: ") + std::strerror(errno);
    ::close(out_pipe[0]);
    ::close(out_pipe[1]);
    ::close(err_pipe[0]);
    ::close(err_pipe[1]);
    return res;
  }

  if (pid == 0) {
    if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
      const char msg[] = "chdir failed\n";
      (void)!::write(err_pipe[1], msg, sizeof(msg) - 1);
      _exit(127);
    }
    for (auto &[k, v] : env) {
      if (v)
        ::setenv(k.c_str(), v->c_str(), 1);
      else
        ::unsetenv(k.c_str());
    }
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);
    ::close(out_pipe[0]);
    ::close(out_pipe[1]);
    ::close(err_pipe[0]);
    ::close(err_pipe[1]);

    ::execvp(argv_c[0], argv_c.data());
    const char msg[] = "exec failed\n";
    (void)!::write(STDERR_FILENO, msg, sizeof(msg) - 1);
    _exit(127);
  }

  ::close(out_pipe[1]);
  ::close(err_pipe[1]);

  // Drain both pipes together; a chatty stderr must not block stdout.
  std::array<pollfd, 2> fds{{{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}}};
  std::array<std::string *, 2> sinks{&res.out, &res.err};
  std::array<char, 4096> buf{};
  int open_fds = 2;
  while (open_fds > 0) {
    int n = ::poll(fds.data(), fds.size(), -1);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      break;
    }
    for (size_t i = 0; i < fds.size(); ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0)
        continue;
      ssize_t r = ::read(fds[i].fd, buf.data(), buf.size());
      if (r > 0) {
        sinks[i]->append(buf.data(), static_cast<size_t>(r));
      } else if (r == 0 || errno != EINTR) {
        ::close(fds[i].fd);
        fds[i].fd = -1;
        --open_fds;
      }
    }
  }
  for (auto &p : fds)
    if (p.fd >= 0)
      ::close(p.fd);

  int status = 0;
  pid_t w;
  do {
    w = ::waitpid(pid, &status, 0);
  } while (w == -1 && errno == EINTR);
  if (w == -1) {
    res.exit_code = -1;
    return res;
  }
  if (WIFEXITED(status))
    res.exit_code = WEXITSTATUS(status);
  else if (WIFSIGNALED(status))
    res.exit_code = 128 + WTERMSIG(status);
  else
    res.exit_code = -1;

  spdlog::debug("[exec] {} -> rc={}", args[0], res.exit_code);
  return res;
}

} // namespace gitactivity
