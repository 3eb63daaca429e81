#pragma once

// bivouac/observability.hpp - One structured event per run.
//
// DESIGN:
//   RunEvent is the observable unit. Every CommandRunner run emits exactly
//   one RunEvent, success or failure, which is:
//     - folded into the process-wide EngineStats counters,
//     - passed to the hook, if one is registered, otherwise
//     - appended as one JSON line to $BIVOUAC_EVENT_LOG when it is set.
//   Events carry digests and sizes only, never stdout/stderr content.

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace bivouac {

// ---------------------------------------------------------------------------
// RunEvent
// ---------------------------------------------------------------------------
struct RunEvent {
  std::string run_id;
  std::string description;

  // Phase durations (nanoseconds)
  uint64_t duration_ns{0};     // whole run
  uint64_t setup_ns{0};        // sandbox construction
  uint64_t process_ns{0};      // spawn -> exit
  uint64_t capture_ns{0};      // output walk + store writes
  uint64_t finalize_ns{0};     // discard or preserve

  size_t bytes_stdout{0};
  size_t bytes_stderr{0};

  int exit_code{0};
  bool timed_out{false};
  bool preserved{false};

  bool ok{false};
  std::string error_code;      // to_string(ErrorCode), empty on success
};

std::string run_event_to_json(const RunEvent& ev);

// ---------------------------------------------------------------------------
// LatencyHistogram - power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(uint64_t duration_ns);

  // Approximate percentile in microseconds, p in [0.0, 1.0]. 0.0 when empty.
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  uint64_t sum_us() const { return sum_us_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  alignas(64) std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<uint64_t> count_{0};
  alignas(64) std::atomic<uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// EngineStats - process-wide aggregates. All counters are atomic.
// ---------------------------------------------------------------------------
class EngineStats {
 public:
  void record_run(const RunEvent& ev);
  std::string to_json() const;

  alignas(64) std::atomic<uint64_t> total_runs{0};
  alignas(64) std::atomic<uint64_t> successful_runs{0};
  alignas(64) std::atomic<uint64_t> failed_runs{0};
  alignas(64) std::atomic<uint64_t> timed_out_runs{0};
  alignas(64) std::atomic<uint64_t> spawn_failures{0};
  alignas(64) std::atomic<uint64_t> preserved_sandboxes{0};
  alignas(64) std::atomic<uint64_t> bytes_captured{0};

  LatencyHistogram latency_histogram;
};

EngineStats& global_engine_stats();

// Records ev and forwards it to the hook or the JSONL log.
void emit_run_event(const RunEvent& ev);

using RunEventHook = void (*)(const RunEvent&);
void set_run_event_hook(RunEventHook hook);

// Process-unique identifier for a new run: "run-<pid>-<sequence>".
std::string next_run_id();

// ---------------------------------------------------------------------------
// ScopeTimer - RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t& out_ns;
  explicit ScopeTimer(uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace bivouac
