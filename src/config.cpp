#include "bivouac/config.hpp"

#include <cerrno>
#include <cstdlib>
#include <system_error>

#include "bivouac/cas.hpp"

namespace fs = std::filesystem;

namespace bivouac {

namespace {

const char* env_value(const char* name) {
  const char* e = std::getenv(name);
  return (e && e[0]) ? e : nullptr;
}

// Whole-string decimal parse; -1 on anything else.
long long parse_count(const char* s) {
  errno = 0;
  char* end = nullptr;
  const long long v = std::strtoll(s, &end, 10);
  if (errno != 0 || end == s || *end != '\0' || v < 0)
    return -1;
  return v;
}

}  // namespace

RunnerConfig RunnerConfig::defaults() {
  std::error_code ec;
  fs::path tmp = fs::temp_directory_path(ec);
  if (ec)
    tmp = "/tmp";
  RunnerConfig c;
  c.work_root = tmp / "bivouac" / "work";
  c.preserve_root = tmp / "bivouac" / "preserved";
  c.named_caches_root = tmp / "bivouac" / "named_caches";
  c.store_root = tmp / "bivouac" / "cas" / "v1";
  return c;
}

RunnerConfig RunnerConfig::from_env() {
  RunnerConfig c = defaults();
  if (const char* e = env_value("BIVOUAC_WORK_ROOT")) c.work_root = e;
  if (const char* e = env_value("BIVOUAC_PRESERVE_ROOT")) c.preserve_root = e;
  if (const char* e = env_value("BIVOUAC_NAMED_CACHES_ROOT")) c.named_caches_root = e;
  if (const char* e = env_value("BIVOUAC_STORE_ROOT")) c.store_root = e;
  if (const char* e = env_value("BIVOUAC_CAS_COMPRESSION")) c.cas_compression = e;
  if (const char* e = env_value("BIVOUAC_EXECUTOR_THREADS")) {
    const long long v = parse_count(e);
    c.executor_threads = (v < 0 || v > 4096) ? -1 : static_cast<int>(v);
  }
  if (const char* e = env_value("BIVOUAC_KILL_GRACE_MS")) {
    c.kill_grace = std::chrono::milliseconds(parse_count(e));
  }
  return c;
}

ErrorCode validate_config(const RunnerConfig& config, std::string* error) {
  auto bad = [error](const std::string& msg) {
    if (error) *error = msg;
    return ErrorCode::config_invalid;
  };
  if (config.work_root.empty()) return bad("work_root must be set");
  if (config.preserve_root.empty()) return bad("preserve_root must be set");
  if (config.named_caches_root.empty()) return bad("named_caches_root must be set");
  if (config.store_root.empty()) return bad("store_root must be set");
  if (config.executor_threads < 0)
    return bad("BIVOUAC_EXECUTOR_THREADS must be an integer in [0, 4096]");
  if (config.kill_grace.count() < 0)
    return bad("BIVOUAC_KILL_GRACE_MS must be a non-negative integer");
  if (config.cas_compression != "off" && config.cas_compression != "zstd")
    return bad("unknown cas_compression: " + config.cas_compression);
  if (config.cas_compression == "zstd" && !cas_zstd_available())
    return bad("cas_compression=zstd requested but zstd support is not compiled in");
  return ErrorCode::none;
}

}  // namespace bivouac
