#pragma once

// bivouac/cas.hpp - Content-addressable blob storage.
//
// DESIGN INVARIANTS (must hold for every backend):
//   1. Key = cas_content_hash(original_bytes). Content-addressed, never
//      location-addressed.
//   2. Writes are atomic: tmp file + rename on the same filesystem.
//   3. Reads verify integrity: the stored blob hash and the content key are
//      both checked before data is returned.
//   4. Fail-closed: an integrity failure yields nullopt, never corrupt data.
//   5. put() of content already present returns the same key without
//      rewriting the object.
//
// Encoded directories (bivouac/tree.hpp) are stored as ordinary blobs, so a
// single backend holds both file contents and Merkle tree nodes.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace bivouac {

struct CasObjectInfo {
  std::string digest;
  std::string encoding{"identity"};
  std::size_t original_size{0};
  std::size_t stored_size{0};
  std::string stored_blob_hash;
  std::uint64_t created_at_unix_ts{0};
};

// ---------------------------------------------------------------------------
// ICASBackend - storage backend interface
// ---------------------------------------------------------------------------
// Thread-safety: implementations must be safe for concurrent calls from
// many runs at once.
class ICASBackend {
 public:
  virtual ~ICASBackend() = default;

  // Stores data and returns its key, "" on failure.
  // compression: "off" (identity) or "zstd" (when built with BIVOUAC_WITH_ZSTD).
  virtual std::string put(const std::string& data,
                          const std::string& compression = "off") = 0;

  // Returns the original bytes, or nullopt when missing or corrupt.
  virtual std::optional<std::string> get(const std::string& digest) const = 0;

  virtual bool contains(const std::string& digest) const = 0;

  virtual std::optional<CasObjectInfo> info(const std::string& digest) const = 0;

  // Human-readable backend identifier for diagnostics.
  virtual std::string backend_id() const = 0;
};

// ---------------------------------------------------------------------------
// CasStore - local filesystem backend
// ---------------------------------------------------------------------------
// Objects are sharded by the first two hex byte pairs of their key:
//   <root>/objects/AB/CD/<64-char-digest>
//   <root>/objects/AB/CD/<64-char-digest>.meta
class CasStore : public ICASBackend {
 public:
  explicit CasStore(std::string root = ".bivouac/cas/v1");

  std::string put(const std::string& data,
                  const std::string& compression = "off") override;
  std::optional<std::string> get(const std::string& digest) const override;
  bool contains(const std::string& digest) const override;
  std::optional<CasObjectInfo> info(const std::string& digest) const override;
  std::string backend_id() const override { return "local_fs"; }

  const std::string& root() const { return root_; }

  // Path of the object file for digest. Exposed for corruption tests.
  std::string object_path(const std::string& digest) const;

 private:
  std::string meta_path(const std::string& digest) const;

  std::string root_;
};

// Whether d is a well-formed 64-char lowercase hex key.
bool valid_digest(const std::string& d);

// Whether zstd compression was compiled in.
bool cas_zstd_available();

}  // namespace bivouac
