#pragma once

// bivouac/config.hpp - Process-wide runner configuration.
//
// Read once when a runner is built and never mutated afterwards. Every
// field can be set from the environment:
//
//   BIVOUAC_WORK_ROOT          sandboxes are created here
//   BIVOUAC_PRESERVE_ROOT      preserved sandboxes are moved here
//   BIVOUAC_NAMED_CACHES_ROOT  base directory of the append-only caches
//   BIVOUAC_STORE_ROOT         root of the local blob store
//   BIVOUAC_EXECUTOR_THREADS   worker threads, 0 = hardware concurrency
//   BIVOUAC_CAS_COMPRESSION    "off" or "zstd"
//   BIVOUAC_KILL_GRACE_MS      SIGTERM -> SIGKILL delay after a timeout
//
// Unset or empty variables keep the defaults below. Malformed numbers are
// kept as negative values so validate_config() can report them.

#include <chrono>
#include <filesystem>
#include <string>

#include "bivouac/types.hpp"

namespace bivouac {

struct RunnerConfig {
  std::filesystem::path work_root;
  std::filesystem::path preserve_root;
  std::filesystem::path named_caches_root;
  std::filesystem::path store_root;
  int executor_threads{0};
  std::string cas_compression{"off"};
  std::chrono::milliseconds kill_grace{5000};

  // Defaults under the system temp directory.
  static RunnerConfig defaults();
  static RunnerConfig from_env();
};

// config_invalid with a description in *error, or none.
ErrorCode validate_config(const RunnerConfig& config, std::string* error);

}  // namespace bivouac
