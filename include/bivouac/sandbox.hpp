#pragma once

// bivouac/sandbox.hpp - OS process launch with captured output and timeout.
//
// CHILD SETUP (POSIX):
//   - runs in its own session (setsid), so the process group id equals its
//     pid and a timeout can signal every descendant at once.
//   - stdin is /dev/null; stdout and stderr are pipes read by the parent.
//   - environment is exactly ProcessSpec::env. Nothing is inherited from the
//     host and no default PATH is injected.
//   - argv[0] is passed to execve as is. It is never looked up on a search
//     path, so a bare name resolves relative to cwd.
//
// SPAWN FAILURE:
//   chdir() and execve() errors in the child travel back through a
//   close-on-exec status pipe, so "never started" is reported as
//   spawned == false instead of an exit code the child could also produce.
//
// TIMEOUT:
//   When the timeout elapses the process group and the pid receive SIGTERM.
//   After kill_grace any survivor gets SIGKILL. The exit code follows the
//   usual signal convention (-15 for SIGTERM), and a diagnostic line is
//   prepended to stdout_text.
//
// Holds no state between calls; safe to call concurrently.

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace bivouac {

struct ProcessSpec {
  std::vector<std::string> argv;            // argv[0] is the executable path
  std::map<std::string, std::string> env;
  std::string cwd;                          // empty = inherit the caller's cwd
  std::optional<std::chrono::milliseconds> timeout;
  std::chrono::milliseconds kill_grace{5000};
  std::string description;                  // used in the timeout diagnostic
};

struct ProcessResult {
  // >= 0: exit status. < 0: terminated by signal -exit_code.
  int exit_code{0};
  bool spawned{false};
  bool timed_out{false};
  std::string stdout_text;
  std::string stderr_text;
  std::string error_message;                // set when !spawned
};

ProcessResult run_process(const ProcessSpec& spec);

// Diagnostic prepended to stdout when spec.timeout elapses.
std::string timeout_message(std::chrono::milliseconds timeout, const std::string& description);

}  // namespace bivouac
