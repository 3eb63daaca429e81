#include "bivouac/runner.hpp"

#include <chrono>
#include <cstdio>
#include <optional>

#include "bivouac/capture.hpp"
#include "bivouac/cas.hpp"
#include "bivouac/observability.hpp"
#include "bivouac/platform.hpp"
#include "bivouac/sandbox.hpp"
#include "bivouac/workdir.hpp"

namespace bivouac {

CommandRunner::CommandRunner(std::shared_ptr<TreeStore> store, std::shared_ptr<Executor> executor,
                             std::shared_ptr<NamedCaches> caches, RunnerConfig config)
    : store_(std::move(store)),
      caches_(std::move(caches)),
      config_(std::move(config)),
      executor_(std::move(executor)) {}

std::unique_ptr<CommandRunner> CommandRunner::from_config(const RunnerConfig& config,
                                                          std::string* error) {
  if (validate_config(config, error) != ErrorCode::none)
    return nullptr;
  auto backend = std::make_shared<CasStore>(config.store_root.string());
  auto store = std::make_shared<TreeStore>(backend, config.cas_compression);
  auto executor = std::make_shared<Executor>(static_cast<std::size_t>(config.executor_threads));
  auto caches = std::make_shared<NamedCaches>(config.named_caches_root);
  return std::make_unique<CommandRunner>(std::move(store), std::move(executor),
                                         std::move(caches), config);
}

std::future<RunOutcome> CommandRunner::run(Process process, RunContext context) const {
  return executor_->spawn_blocking(
      [this, process = std::move(process), context = std::move(context)] {
        return run_blocking(process, context);
      });
}

RunOutcome CommandRunner::run_blocking(const Process& process, const RunContext& context) const {
  using Clock = std::chrono::steady_clock;
  const auto t0 = Clock::now();

  RunEvent ev;
  ev.run_id = context.run_id.empty() ? next_run_id() : context.run_id;
  ev.description = process.description;

  auto finish = [&](RunOutcome outcome) {
    ev.ok = outcome.ok();
    ev.error_code = to_string(outcome.error_code);
    ev.duration_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - t0).count());
    emit_run_event(ev);
    return outcome;
  };

  std::string err;
  ErrorCode code = validate_process(process, &err);
  if (code != ErrorCode::none)
    return finish(RunOutcome::failure(code, err));

  std::optional<WorkDir> workdir = WorkDir::create(config_.work_root, &err);
  if (!workdir)
    return finish(RunOutcome::failure(ErrorCode::sandbox_setup_failed, err));

  // Failure after the sandbox exists: preserve it when asked, otherwise
  // let the WorkDir remove it. The original error is what the caller sees.
  auto fail = [&](ErrorCode c, const std::string& msg) {
    if (context.preserve_sandbox) {
      ScopeTimer t(ev.finalize_ns);
      std::string why;
      if (preserve_workdir(*workdir, config_.preserve_root, process, &why))
        ev.preserved = true;
      else
        std::fprintf(stderr, "[bivouac:runner] %s: could not preserve sandbox %s: %s\n",
                     ev.run_id.c_str(), workdir->path().c_str(), why.c_str());
    }
    workdir.reset();
    return finish(RunOutcome::failure(c, msg));
  };

  // --- Sandbox Builder ---
  std::optional<std::filesystem::path> cwd;
  {
    ScopeTimer t(ev.setup_ns);
    code = prepare_workdir(workdir->path(), process, *store_, *caches_, &err);
    if (code == ErrorCode::none) {
      cwd = resolve_working_directory(workdir->path(), process.working_directory, &err);
      if (!cwd)
        code = ErrorCode::path_escape;
    }
  }
  if (code != ErrorCode::none)
    return fail(code, err);

  // --- Process Launcher ---
  ProcessSpec spec;
  spec.argv = process.argv;
  spec.env = process.env;
  spec.cwd = cwd->string();
  spec.timeout = process.timeout;
  spec.kill_grace = config_.kill_grace;
  spec.description = process.description;

  ProcessResult proc;
  {
    ScopeTimer t(ev.process_ns);
    proc = run_process(spec);
  }
  if (!proc.spawned)
    return fail(ErrorCode::spawn_failed, proc.error_message);
  ev.exit_code = proc.exit_code;
  ev.timed_out = proc.timed_out;
  ev.bytes_stdout = proc.stdout_text.size();
  ev.bytes_stderr = proc.stderr_text.size();

  // --- Output Capturer ---
  RunResult result;
  result.exit_code = proc.exit_code;
  {
    ScopeTimer t(ev.capture_ns);
    code = capture_outputs(workdir->path(), process.output_files, process.output_directories,
                           *store_, &result.output_directory, &err);
    if (code == ErrorCode::none) {
      auto out = store_->store_file_bytes(proc.stdout_text);
      auto errd = store_->store_file_bytes(proc.stderr_text);
      if (!out || !errd) {
        code = ErrorCode::store_failed;
        err = "cannot store captured stdout/stderr";
      } else {
        result.stdout_digest = *out;
        result.stderr_digest = *errd;
      }
    }
  }
  if (code != ErrorCode::none)
    return fail(code, err);

  // --- Sandbox Finalizer ---
  {
    ScopeTimer t(ev.finalize_ns);
    if (context.preserve_sandbox) {
      if (!preserve_workdir(*workdir, config_.preserve_root, process, &err)) {
        workdir.reset();
        return finish(RunOutcome::failure(ErrorCode::finalize_failed,
                                          "failed to preserve sandbox: " + err));
      }
      ev.preserved = true;
    }
    workdir.reset();
  }

  // --- Result Assembler ---
  auto platform = current_platform();
  if (!platform)
    return finish(RunOutcome::failure(ErrorCode::platform_unknown,
                                      "cannot identify the host platform"));
  result.platform = *platform;
  return finish(RunOutcome::success(std::move(result)));
}

}  // namespace bivouac
