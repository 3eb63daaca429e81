#pragma once

// bivouac/types.hpp - Core data structures for a single local process run.
//
// OWNERSHIP:
//   All types here are value types. A Process is built by the caller, copied
//   into the run, and never mutated by the engine. RunResult is returned by
//   value and owned by the caller.
//
// VALIDATION:
//   RelativePath, CacheName and CacheDest can only be obtained through their
//   create() factories, so any instance held by a Process is already valid.
//   These factories are the only source of validation errors.

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "bivouac/platform.hpp"

namespace bivouac {

enum class ErrorCode {
  none,
  validation_failed,
  path_escape,
  sandbox_setup_failed,
  spawn_failed,
  capture_failed,
  store_failed,
  finalize_failed,
  config_invalid,
  platform_unknown,
};

std::string to_string(ErrorCode code);

// ---------------------------------------------------------------------------
// Digest - content fingerprint of a blob or of an encoded directory.
// ---------------------------------------------------------------------------
struct Digest {
  std::string hash;          // 64-char hex, BLAKE3 with "cas:" domain
  std::uint64_t size_bytes{0};

  bool operator==(const Digest& o) const {
    return hash == o.hash && size_bytes == o.size_bytes;
  }
  bool operator!=(const Digest& o) const { return !(*this == o); }
  bool operator<(const Digest& o) const {
    return hash != o.hash ? hash < o.hash : size_bytes < o.size_bytes;
  }
};

std::string to_string(const Digest& d);

// Digest of the zero-length blob.
Digest empty_file_digest();

// Digest of the canonical encoding of a directory with no entries.
Digest empty_directory_digest();

// ---------------------------------------------------------------------------
// RelativePath - normalized path under the sandbox root.
// ---------------------------------------------------------------------------
// Rejects absolute paths and any ".." segment. "." segments are dropped, so
// "" and "." both denote the sandbox root.
class RelativePath {
 public:
  static std::optional<RelativePath> create(const std::string& raw, std::string* error);

  const std::string& str() const { return value_; }
  std::filesystem::path path() const { return std::filesystem::path(value_); }
  bool is_root() const { return value_.empty(); }

  // Path components, root yields an empty vector.
  std::vector<std::string> components() const;

  bool operator==(const RelativePath& o) const { return value_ == o.value_; }
  bool operator<(const RelativePath& o) const { return value_ < o.value_; }

 private:
  explicit RelativePath(std::string v) : value_(std::move(v)) {}
  std::string value_;
};

// ---------------------------------------------------------------------------
// CacheName / CacheDest - validated names for append-only cache mounts.
// ---------------------------------------------------------------------------
class CacheName {
 public:
  static std::optional<CacheName> create(const std::string& raw, std::string* error);

  const std::string& str() const { return value_; }
  bool operator==(const CacheName& o) const { return value_ == o.value_; }
  bool operator<(const CacheName& o) const { return value_ < o.value_; }

 private:
  explicit CacheName(std::string v) : value_(std::move(v)) {}
  std::string value_;
};

class CacheDest {
 public:
  static std::optional<CacheDest> create(const std::string& raw, std::string* error);

  const RelativePath& relative() const { return path_; }
  const std::string& str() const { return path_.str(); }
  bool operator==(const CacheDest& o) const { return path_ == o.path_; }
  bool operator<(const CacheDest& o) const { return path_ < o.path_; }

 private:
  explicit CacheDest(RelativePath p) : path_(std::move(p)) {}
  RelativePath path_;
};

// Sandbox-relative name under which jdk_home is mounted.
inline constexpr const char* kJdkSymlinkName = ".jdk";

// ---------------------------------------------------------------------------
// Process - immutable description of one process run.
// ---------------------------------------------------------------------------
struct Process {
  std::vector<std::string> argv;              // argv[0] is the executable
  std::map<std::string, std::string> env;     // exact child environment
  std::optional<RelativePath> working_directory;
  Digest input_files{empty_directory_digest()};
  std::set<RelativePath> output_files;
  std::set<RelativePath> output_directories;
  std::optional<std::chrono::milliseconds> timeout;
  std::string description;
  std::optional<std::filesystem::path> jdk_home;
  std::map<CacheName, CacheDest> append_only_caches;
};

// Checks the invariants the newtypes cannot express on their own: argv is
// non-empty and jdk_home, when set, is absolute. Returns the matching
// ErrorCode (none on success) and fills *error with a description.
ErrorCode validate_process(const Process& process, std::string* error);

// ---------------------------------------------------------------------------
// RunResult / RunOutcome
// ---------------------------------------------------------------------------
struct RunResult {
  // >= 0: exit status. < 0: terminated by signal -exit_code.
  int exit_code{0};
  Digest stdout_digest;
  Digest stderr_digest;
  Digest output_directory;
  Platform platform{Platform::linux_x86_64};

  bool operator==(const RunResult& o) const {
    return exit_code == o.exit_code && stdout_digest == o.stdout_digest &&
           stderr_digest == o.stderr_digest &&
           output_directory == o.output_directory && platform == o.platform;
  }
  bool operator!=(const RunResult& o) const { return !(*this == o); }
};

struct RunOutcome {
  std::optional<RunResult> result;
  ErrorCode error_code{ErrorCode::none};
  std::string error_message;

  bool ok() const { return result.has_value(); }

  static RunOutcome success(RunResult r) {
    RunOutcome o;
    o.result = std::move(r);
    return o;
  }
  static RunOutcome failure(ErrorCode code, std::string message) {
    RunOutcome o;
    o.error_code = code;
    o.error_message = std::move(message);
    return o;
  }
};

}  // namespace bivouac
