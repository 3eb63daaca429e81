#ifndef _WIN32

#include "bivouac/sandbox.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>

namespace bivouac {

namespace {

using Clock = std::chrono::steady_clock;

// Reaping is polled at this interval while the child is alive.
constexpr int kReapIntervalMs = 5;

enum class ChildStage : int { chdir = 1, exec = 2 };

struct ChildFailure {
  int stage;
  int err;
};

bool make_pipe(int fds[2]) {
  if (::pipe(fds) != 0)
    return false;
  ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
  ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
  return true;
}

void close_fd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

void close_pipe(int fds[2]) {
  close_fd(fds[0]);
  close_fd(fds[1]);
}

// Child side only: async-signal-safe calls from here on.
[[noreturn]] void child_fail(int status_fd, ChildStage stage) {
  ChildFailure f{static_cast<int>(stage), errno};
  ssize_t unused = ::write(status_fd, &f, sizeof(f));
  (void)unused;
  ::_exit(127);
}

// A reaped pid may already belong to an unrelated process, so only the
// group is signalled once the child has been waited for.
void signal_group(pid_t pid, int sig, bool reaped) {
  ::kill(-pid, sig);
  if (!reaped)
    ::kill(pid, sig);
}

int ms_until(Clock::time_point t) {
  const auto left =
      std::chrono::duration_cast<std::chrono::milliseconds>(t - Clock::now()).count();
  return left <= 0 ? 0 : static_cast<int>(std::min<long long>(left, 1 << 30));
}

// Reads what is available on fd. Returns false once the stream is closed.
bool drain_once(int fd, std::string& dst) {
  char buf[65536];
  ssize_t n = ::read(fd, buf, sizeof(buf));
  if (n > 0) {
    dst.append(buf, static_cast<std::size_t>(n));
    return true;
  }
  if (n < 0 && (errno == EINTR || errno == EAGAIN))
    return true;
  return false;
}

void drain_nonblocking(int fd, std::string& dst) {
  if (fd < 0)
    return;
  ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL) | O_NONBLOCK);
  char buf[65536];
  while (true) {
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) {
      dst.append(buf, static_cast<std::size_t>(n));
      continue;
    }
    if (n < 0 && errno == EINTR)
      continue;
    break;
  }
}

int decode_status(int status) {
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return -WTERMSIG(status);
  return 0;
}

}  // namespace

std::string timeout_message(std::chrono::milliseconds timeout, const std::string& description) {
  char secs[32];
  std::snprintf(secs, sizeof(secs), "%g", static_cast<double>(timeout.count()) / 1000.0);
  return std::string("Exceeded timeout of ") + secs +
         " seconds when executing local process: " + description;
}

ProcessResult run_process(const ProcessSpec& spec) {
  ProcessResult result;
  if (spec.argv.empty() || spec.argv.front().empty()) {
    result.error_message = "Failed to execute: empty argv";
    return result;
  }
  const std::string& exe = spec.argv.front();

  // Everything the child needs is built before fork(); the child must not
  // allocate.
  std::vector<std::string> argv_store = spec.argv;
  std::vector<char*> argv;
  argv.reserve(argv_store.size() + 1);
  for (auto& s : argv_store)
    argv.push_back(s.data());
  argv.push_back(nullptr);

  std::vector<std::string> env_store;
  env_store.reserve(spec.env.size());
  for (const auto& [k, v] : spec.env)
    env_store.push_back(k + "=" + v);
  std::vector<char*> envp;
  envp.reserve(env_store.size() + 1);
  for (auto& e : env_store)
    envp.push_back(e.data());
  envp.push_back(nullptr);

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int status_pipe[2] = {-1, -1};
  if (!make_pipe(out_pipe) || !make_pipe(err_pipe) || !make_pipe(status_pipe)) {
    result.error_message = "Failed to execute: " + exe + ": pipe: " + std::strerror(errno);
    close_pipe(out_pipe);
    close_pipe(err_pipe);
    close_pipe(status_pipe);
    return result;
  }
  int dev_null = ::open("/dev/null", O_RDONLY | O_CLOEXEC);

  pid_t pid = ::fork();
  if (pid < 0) {
    result.error_message = "Failed to execute: " + exe + ": fork: " + std::strerror(errno);
    close_pipe(out_pipe);
    close_pipe(err_pipe);
    close_pipe(status_pipe);
    close_fd(dev_null);
    return result;
  }

  if (pid == 0) {
    ::setsid();
    if (dev_null >= 0)
      ::dup2(dev_null, STDIN_FILENO);
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);
    // The remaining descriptors are close-on-exec.
    if (!spec.cwd.empty() && ::chdir(spec.cwd.c_str()) != 0)
      child_fail(status_pipe[1], ChildStage::chdir);
    ::execve(exe.c_str(), argv.data(), envp.data());
    child_fail(status_pipe[1], ChildStage::exec);
  }

  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  close_fd(status_pipe[1]);
  close_fd(dev_null);

  // EOF on the status pipe means execve succeeded.
  ChildFailure failure{0, 0};
  ssize_t got;
  do {
    got = ::read(status_pipe[0], &failure, sizeof(failure));
  } while (got < 0 && errno == EINTR);
  close_fd(status_pipe[0]);

  if (got == static_cast<ssize_t>(sizeof(failure))) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);
    result.error_message = "Failed to execute: " + exe + ": ";
    if (failure.stage == static_cast<int>(ChildStage::chdir))
      result.error_message += "cannot change directory to " + spec.cwd + ": ";
    result.error_message += std::strerror(failure.err);
    return result;
  }
  result.spawned = true;

  std::optional<Clock::time_point> deadline;
  if (spec.timeout)
    deadline = Clock::now() + *spec.timeout;
  Clock::time_point kill_deadline{};

  int out_fd = out_pipe[0];
  int err_fd = err_pipe[0];
  int status = 0;
  bool exited = false;
  bool killed = false;

  while (true) {
    if (!exited) {
      pid_t w = ::waitpid(pid, &status, WNOHANG);
      if (w == pid)
        exited = true;
    }
    if (exited && out_fd < 0 && err_fd < 0)
      break;

    const auto now = Clock::now();
    if (!result.timed_out && deadline && now >= *deadline) {
      if (exited) {
        // The process finished in time; descendants still hold its pipes.
        signal_group(pid, SIGKILL, true);
        killed = true;
        break;
      }
      result.timed_out = true;
      signal_group(pid, SIGTERM, false);
      kill_deadline = now + spec.kill_grace;
    }

    int wait_ms = -1;
    if (result.timed_out) {
      if (now >= kill_deadline) {
        signal_group(pid, SIGKILL, exited);
        killed = true;
        break;
      }
      wait_ms = ms_until(kill_deadline);
    } else if (deadline) {
      wait_ms = ms_until(*deadline);
    }
    if (!exited)
      wait_ms = wait_ms < 0 ? kReapIntervalMs : std::min(wait_ms, kReapIntervalMs);

    pollfd fds[2];
    nfds_t nfds = 0;
    if (out_fd >= 0)
      fds[nfds++] = pollfd{out_fd, POLLIN, 0};
    if (err_fd >= 0)
      fds[nfds++] = pollfd{err_fd, POLLIN, 0};

    int rc = ::poll(nfds ? fds : nullptr, nfds, wait_ms);
    if (rc < 0 && errno != EINTR) {
      // Unexpected poll failure: stop capturing, but still reap the child.
      signal_group(pid, SIGKILL, exited);
      killed = true;
      break;
    }
    if (rc <= 0)
      continue;
    for (nfds_t i = 0; i < nfds; ++i) {
      if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0)
        continue;
      const bool is_out = fds[i].fd == out_fd;
      int& fd = is_out ? out_fd : err_fd;
      if (!drain_once(fd, is_out ? result.stdout_text : result.stderr_text))
        close_fd(fd);
    }
  }

  if (killed) {
    if (!exited) {
      while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
      }
      exited = true;
    }
    drain_nonblocking(out_fd, result.stdout_text);
    drain_nonblocking(err_fd, result.stderr_text);
  }
  close_fd(out_fd);
  close_fd(err_fd);

  result.exit_code = decode_status(status);
  if (result.timed_out)
    result.stdout_text = timeout_message(*spec.timeout, spec.description) + "\n" +
                         result.stdout_text;
  return result;
}

}  // namespace bivouac

#endif
