#pragma once

// bivouac/capture.hpp - Re-digests declared outputs after a run.
//
// RULES:
//   - Declared paths that do not exist are omitted, never an error.
//   - A declared output file is captured when it is a regular file, or a
//     symlink to one (the target's bytes are stored).
//   - A declared output directory is walked recursively. Empty
//     subdirectories are recorded. Symlinks to directories inside it are not
//     followed. A declared output directory that turns out to be a regular
//     file is captured as that file.
//   - A file declared on its own and again reached through a declared
//     directory appears once in the tree.
//   - Paths are relative to the sandbox root, not to the working directory.

#include <filesystem>
#include <set>
#include <string>

#include "bivouac/tree.hpp"
#include "bivouac/types.hpp"

namespace bivouac {

// Stores every captured file, records the merged tree bottom-up and writes
// its root digest to *root (the empty-directory digest when nothing was
// found). Returns capture_failed on unreadable outputs and store_failed
// when the store rejects a write.
ErrorCode capture_outputs(const std::filesystem::path& sandbox,
                          const std::set<RelativePath>& output_files,
                          const std::set<RelativePath>& output_directories,
                          TreeStore& store, Digest* root, std::string* error);

}  // namespace bivouac
