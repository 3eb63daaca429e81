#pragma once

// bivouac/runner.hpp - Runs one Process locally, end to end.
//
// PIPELINE (strictly sequential within one run):
//   validate -> WorkDir::create -> prepare_workdir -> run_process
//            -> capture_outputs + stdout/stderr into the store
//            -> discard or preserve the sandbox -> RunResult
//
// A spawn failure skips capture, but the sandbox is still discarded or,
// with RunContext::preserve_sandbox, preserved for inspection. The same
// holds for every other failure after the sandbox exists.
//
// CONCURRENCY:
//   run() hands the whole pipeline to the Executor as a single blocking
//   task. A CommandRunner holds only immutable configuration and
//   thread-safe collaborators, so any number of runs may be in flight.
//   Destroying the runner waits for every queued and running task, so
//   runs whose futures were dropped still finish and clean up.
//
// CANCELLATION:
//   There is none beyond Process::timeout. Dropping the future does not
//   stop the task, and the process runs until it exits or times out.

#include <future>
#include <memory>
#include <string>

#include "bivouac/config.hpp"
#include "bivouac/executor.hpp"
#include "bivouac/named_caches.hpp"
#include "bivouac/tree.hpp"
#include "bivouac/types.hpp"

namespace bivouac {

struct RunContext {
  // Keep the sandbox under RunnerConfig::preserve_root with a __run.sh.
  bool preserve_sandbox{false};
  // Identifier used in the RunEvent. Generated when empty.
  std::string run_id;
};

class CommandRunner {
 public:
  CommandRunner(std::shared_ptr<TreeStore> store, std::shared_ptr<Executor> executor,
                std::shared_ptr<NamedCaches> caches, RunnerConfig config);

  // Builds the local store, executor and cache registry described by
  // config. Returns nullptr with *error set when config is invalid.
  static std::unique_ptr<CommandRunner> from_config(const RunnerConfig& config,
                                                    std::string* error);

  std::future<RunOutcome> run(Process process, RunContext context = {}) const;

  // Runs on the calling thread.
  RunOutcome run_blocking(const Process& process, const RunContext& context = {}) const;

  TreeStore& store() const { return *store_; }
  const NamedCaches& named_caches() const { return *caches_; }
  const RunnerConfig& config() const { return config_; }

 private:
  std::shared_ptr<TreeStore> store_;
  std::shared_ptr<NamedCaches> caches_;
  RunnerConfig config_;
  // Last, so queued runs drain while the members above are still alive.
  std::shared_ptr<Executor> executor_;
};

}  // namespace bivouac
