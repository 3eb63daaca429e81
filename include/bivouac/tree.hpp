#pragma once

// bivouac/tree.hpp - Merkle directory trees on top of the blob store.
//
// ENCODING (TREE_FORMAT_VERSION = 1):
//   A Directory is encoded as text, entries sorted by name, files first:
//     "bivouac-tree 1\n"
//     "f <len>:<name> <hash> <size> <x|->\n"     one per file
//     "d <len>:<name> <hash> <size>\n"           one per subdirectory
//   Names are length-prefixed so any byte except '/' and NUL may appear.
//   The encoding is stored as an ordinary blob; its store key is the
//   directory digest. Since a subdirectory line carries the child's digest,
//   the root digest commits to the entire tree.
//
// Symlinks are not representable; trees contain files and directories only.

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "bivouac/cas.hpp"
#include "bivouac/types.hpp"

namespace bivouac {

inline constexpr std::uint32_t kTreeFormatVersion = 1;

struct FileNode {
  Digest digest;
  bool is_executable{false};

  bool operator==(const FileNode& o) const {
    return digest == o.digest && is_executable == o.is_executable;
  }
};

struct Directory {
  std::map<std::string, FileNode> files;
  std::map<std::string, Digest> directories;

  bool empty() const { return files.empty() && directories.empty(); }
};

std::string encode_directory(const Directory& dir);

// Strict decode: rejects unknown headers, unsorted or duplicate names, names
// containing '/', "." or "..", and names present both as file and directory.
std::optional<Directory> decode_directory(const std::string& encoded, std::string* error);

// Whether name is usable as a single directory entry.
bool valid_entry_name(const std::string& name);

// ---------------------------------------------------------------------------
// TreeStore - file and directory digests over an ICASBackend.
// ---------------------------------------------------------------------------
class TreeStore {
 public:
  explicit TreeStore(std::shared_ptr<ICASBackend> backend,
                     std::string compression = "off");

  std::optional<Digest> store_file_bytes(const std::string& bytes);

  // Stores a file from disk. The content is only read into memory when the
  // store does not already hold it.
  std::optional<Digest> store_file_from_path(const std::filesystem::path& path,
                                             std::string* error);

  // Returns nullopt when the blob is missing, corrupt, or of another size.
  std::optional<std::string> load_file_bytes(const Digest& digest) const;

  std::optional<Digest> record_directory(const Directory& dir);
  std::optional<Directory> load_directory(const Digest& digest, std::string* error) const;

  // Writes the tree rooted at digest into dest, which must exist. Files get
  // mode 0755 when executable and 0644 otherwise.
  bool materialize_directory(const Digest& digest, const std::filesystem::path& dest,
                             std::string* error) const;

  ICASBackend& backend() { return *backend_; }

 private:
  std::shared_ptr<ICASBackend> backend_;
  std::string compression_;
};

// ---------------------------------------------------------------------------
// TreeBuilder - in-memory tree assembled from individual paths.
// ---------------------------------------------------------------------------
// Insertion is idempotent: adding the same file twice, or a directory that
// already exists (implicitly or explicitly), leaves a single entry.
class TreeBuilder {
 public:
  TreeBuilder();
  ~TreeBuilder();
  TreeBuilder(TreeBuilder&&) noexcept;
  TreeBuilder& operator=(TreeBuilder&&) noexcept;

  bool add_file(const RelativePath& path, const FileNode& node, std::string* error);
  bool add_directory(const RelativePath& path, std::string* error);

  bool empty() const;

  // Records every directory bottom-up and returns the root digest.
  std::optional<Digest> record(TreeStore& store, std::string* error) const;

 private:
  struct Node;
  std::unique_ptr<Node> root_;
};

}  // namespace bivouac
