#pragma once

// bivouac/named_caches.hpp - Persistent, append-only cache directories.
//
// A CacheName maps to <base>/<name>. Directories are created on first use
// and never deleted or moved by the engine; reclamation is an external
// policy. Concurrent callers may race to create the same directory, and
// "already exists" counts as success. No locking is provided for the
// contents: processes sharing a cache coordinate among themselves.

#include <filesystem>
#include <optional>
#include <string>

#include "bivouac/types.hpp"

namespace bivouac {

class NamedCaches {
 public:
  explicit NamedCaches(std::filesystem::path base);

  const std::filesystem::path& base() const { return base_; }

  // Returns the persistent directory for name, creating it if absent.
  std::optional<std::filesystem::path> path_for(const CacheName& name,
                                                std::string* error) const;

 private:
  std::filesystem::path base_;
};

}  // namespace bivouac
