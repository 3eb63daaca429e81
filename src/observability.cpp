#include "bivouac/observability.hpp"

#include <unistd.h>

#include <bit>
#include <cstdio>
#include <cstdlib>

namespace bivouac {

namespace {

// bit_width(us) is floor(log2(us)) + 1, i.e. the bucket index.
inline size_t bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

void append_escaped(std::string& out, const std::string& s) {
  for (char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
          out += buf;
        } else {
          out += c;
        }
    }
  }
}

std::atomic<RunEventHook> g_event_hook{nullptr};
std::atomic<uint64_t> g_run_seq{0};

}  // namespace

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target && cumulative > 0) {
      // Midpoint of bucket i.
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(160);
  char buf[32];
  out += "{\"count\":";
  out += std::to_string(count());
  out += ",\"mean_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", mean_us());
  out += buf;
  out += ",\"p50_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.50));
  out += buf;
  out += ",\"p95_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.95));
  out += buf;
  out += ",\"p99_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.99));
  out += buf;
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// EngineStats
// ---------------------------------------------------------------------------

void EngineStats::record_run(const RunEvent& ev) {
  total_runs.fetch_add(1, std::memory_order_relaxed);
  if (ev.ok) {
    successful_runs.fetch_add(1, std::memory_order_relaxed);
  } else {
    failed_runs.fetch_add(1, std::memory_order_relaxed);
    if (ev.error_code == "spawn_failed")
      spawn_failures.fetch_add(1, std::memory_order_relaxed);
  }
  if (ev.timed_out)
    timed_out_runs.fetch_add(1, std::memory_order_relaxed);
  if (ev.preserved)
    preserved_sandboxes.fetch_add(1, std::memory_order_relaxed);
  bytes_captured.fetch_add(ev.bytes_stdout + ev.bytes_stderr, std::memory_order_relaxed);
  latency_histogram.record(ev.duration_ns);
}

std::string EngineStats::to_json() const {
  std::string out;
  out.reserve(512);
  out += "{\"total_runs\":";
  out += std::to_string(total_runs.load(std::memory_order_relaxed));
  out += ",\"successful_runs\":";
  out += std::to_string(successful_runs.load(std::memory_order_relaxed));
  out += ",\"failed_runs\":";
  out += std::to_string(failed_runs.load(std::memory_order_relaxed));
  out += ",\"timed_out_runs\":";
  out += std::to_string(timed_out_runs.load(std::memory_order_relaxed));
  out += ",\"spawn_failures\":";
  out += std::to_string(spawn_failures.load(std::memory_order_relaxed));
  out += ",\"preserved_sandboxes\":";
  out += std::to_string(preserved_sandboxes.load(std::memory_order_relaxed));
  out += ",\"bytes_captured\":";
  out += std::to_string(bytes_captured.load(std::memory_order_relaxed));
  out += ",\"latency\":";
  out += latency_histogram.to_json();
  out += '}';
  return out;
}

EngineStats& global_engine_stats() {
  static EngineStats inst;
  return inst;
}

// ---------------------------------------------------------------------------
// Event emission
// ---------------------------------------------------------------------------

std::string run_event_to_json(const RunEvent& ev) {
  std::string line;
  line.reserve(320);
  line += "{\"run_id\":\"";
  append_escaped(line, ev.run_id);
  line += "\",\"description\":\"";
  append_escaped(line, ev.description);
  line += "\",\"ok\":";
  line += ev.ok ? "true" : "false";
  line += ",\"error_code\":\"";
  line += ev.error_code;
  line += "\",\"exit_code\":";
  line += std::to_string(ev.exit_code);
  line += ",\"timed_out\":";
  line += ev.timed_out ? "true" : "false";
  line += ",\"preserved\":";
  line += ev.preserved ? "true" : "false";
  line += ",\"duration_ns\":";
  line += std::to_string(ev.duration_ns);
  line += ",\"setup_ns\":";
  line += std::to_string(ev.setup_ns);
  line += ",\"process_ns\":";
  line += std::to_string(ev.process_ns);
  line += ",\"capture_ns\":";
  line += std::to_string(ev.capture_ns);
  line += ",\"finalize_ns\":";
  line += std::to_string(ev.finalize_ns);
  line += ",\"bytes_stdout\":";
  line += std::to_string(ev.bytes_stdout);
  line += ",\"bytes_stderr\":";
  line += std::to_string(ev.bytes_stderr);
  line += '}';
  return line;
}

void set_run_event_hook(RunEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void emit_run_event(const RunEvent& ev) {
  global_engine_stats().record_run(ev);

  if (RunEventHook hook = g_event_hook.load(std::memory_order_acquire)) {
    hook(ev);
    return;
  }

  const char* log_path = std::getenv("BIVOUAC_EVENT_LOG");
  if (!log_path || !log_path[0]) return;

  const std::string line = run_event_to_json(ev) + "\n";
  // O_APPEND keeps concurrent short writes whole on POSIX.
  if (FILE* f = std::fopen(log_path, "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  } else {
    std::fprintf(stderr, "[bivouac:events] cannot open event log %s\n", log_path);
  }
}

std::string next_run_id() {
  const uint64_t n = g_run_seq.fetch_add(1, std::memory_order_relaxed) + 1;
  return "run-" + std::to_string(static_cast<long>(::getpid())) + "-" + std::to_string(n);
}

}  // namespace bivouac
