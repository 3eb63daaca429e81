#pragma once

// bivouac/workdir.hpp - Per-run sandbox directory: build, discard, preserve.
//
// LIFECYCLE:
//   WorkDir::create()   unique "process-executionXXXXXX" under the work root
//   prepare_workdir()   inputs, output parents, cache and jdk symlinks
//   ... process runs, outputs are captured ...
//   ~WorkDir()          removes the tree (discard), unless
//   preserve_workdir()  moved it under the preservation root first.
//
// A WorkDir is owned by exactly one run. The directory is removed on every
// exit path, including early error returns, because the destructor does it.

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "bivouac/named_caches.hpp"
#include "bivouac/tree.hpp"
#include "bivouac/types.hpp"

namespace bivouac {

class WorkDir {
 public:
  // Creates root if missing, then a fresh uniquely named directory below it.
  static std::optional<WorkDir> create(const std::filesystem::path& root, std::string* error);

  ~WorkDir();
  WorkDir(WorkDir&& other) noexcept;
  WorkDir& operator=(WorkDir&& other) noexcept;
  WorkDir(const WorkDir&) = delete;
  WorkDir& operator=(const WorkDir&) = delete;

  const std::filesystem::path& path() const { return path_; }

  // Stops owning the directory; the destructor will leave it in place.
  std::filesystem::path release();

 private:
  explicit WorkDir(std::filesystem::path p) : path_(std::move(p)) {}
  void remove();

  std::filesystem::path path_;
  bool owned_{true};
};

// Populates a fresh sandbox for process, in order: materializes
// input_files, pre-creates the parent directory of every declared output,
// mounts append_only_caches and mounts jdk_home at kJdkSymlinkName.
// Returns ErrorCode::none or sandbox_setup_failed with *error filled in.
ErrorCode prepare_workdir(const std::filesystem::path& sandbox, const Process& process,
                          const TreeStore& store, const NamedCaches& caches,
                          std::string* error);

// Absolute cwd for the process. Symlinks are resolved, and a directory that
// ends up outside the sandbox is rejected.
std::optional<std::filesystem::path> resolve_working_directory(
    const std::filesystem::path& sandbox, const std::optional<RelativePath>& wd,
    std::string* error);

// ---------------------------------------------------------------------------
// Preservation
// ---------------------------------------------------------------------------

// Name of the reproduction script written into a preserved sandbox.
inline constexpr const char* kRunScriptName = "__run.sh";

// Single-quotes s for a POSIX shell. Embedded quotes become '\''.
std::string shell_quote(const std::string& s);

// Bash script that re-runs argv with env from inside cwd.
std::string render_run_script(const std::vector<std::string>& argv,
                              const std::map<std::string, std::string>& env,
                              const std::filesystem::path& cwd);

// Moves the sandbox owned by workdir to a new unique directory under
// preserve_root and writes an executable kRunScriptName into it, returning
// the preserved path. When the move crossed filesystems the sandbox was
// copied, and workdir keeps owning the original so that destroying it
// removes the source.
std::optional<std::filesystem::path> preserve_workdir(WorkDir& workdir,
                                                      const std::filesystem::path& preserve_root,
                                                      const Process& process,
                                                      std::string* error);

}  // namespace bivouac
