#include "bivouac/tree.hpp"

#include <sys/stat.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <system_error>

#include "bivouac/hash.hpp"

namespace fs = std::filesystem;

namespace bivouac {

namespace {

const std::string kHeader = "bivouac-tree " + std::to_string(kTreeFormatVersion) + "\n";

void append_name(std::string& out, const std::string& name) {
  out += std::to_string(name.size());
  out += ':';
  out += name;
}

void append_digest(std::string& out, const Digest& d) {
  out += d.hash;
  out += ' ';
  out += std::to_string(d.size_bytes);
}

// Cursor over an encoded directory. Every reader returns false on malformed
// input and leaves the error text in err.
struct Reader {
  const std::string& s;
  std::size_t i{0};
  std::string err;

  bool fail(const std::string& what) {
    err = what + " at offset " + std::to_string(i);
    return false;
  }

  bool expect(char c) {
    if (i >= s.size() || s[i] != c) return fail(std::string("expected '") + c + "'");
    ++i;
    return true;
  }

  bool read_u64(std::uint64_t& out) {
    const std::size_t start = i;
    out = 0;
    while (i < s.size() && s[i] >= '0' && s[i] <= '9') {
      if (i - start >= 19) return fail("number too long");
      out = out * 10 + static_cast<std::uint64_t>(s[i] - '0');
      ++i;
    }
    if (i == start) return fail("expected number");
    return true;
  }

  bool read_name(std::string& out) {
    std::uint64_t len = 0;
    if (!read_u64(len) || !expect(':')) return false;
    if (len > s.size() - i) return fail("name runs past end");
    out = s.substr(i, static_cast<std::size_t>(len));
    i += static_cast<std::size_t>(len);
    if (!valid_entry_name(out)) return fail("invalid entry name");
    return true;
  }

  bool read_digest(Digest& out) {
    if (s.size() - i < 64) return fail("truncated digest");
    out.hash = s.substr(i, 64);
    if (!valid_digest(out.hash)) return fail("malformed digest");
    i += 64;
    return expect(' ') && read_u64(out.size_bytes);
  }
};

bool write_file(const fs::path& target, const std::string& bytes, bool executable,
                std::string* error) {
  {
    std::ofstream ofs(target, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      if (error) *error = "cannot create " + target.string() + ": " + std::strerror(errno);
      return false;
    }
    ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!ofs) {
      if (error) *error = "cannot write " + target.string();
      return false;
    }
  }
  const mode_t mode = executable ? 0755 : 0644;
  if (::chmod(target.c_str(), mode) != 0) {
    if (error) *error = "cannot chmod " + target.string() + ": " + std::strerror(errno);
    return false;
  }
  return true;
}

}  // namespace

bool valid_entry_name(const std::string& name) {
  if (name.empty() || name == "." || name == "..") return false;
  return name.find('/') == std::string::npos && name.find('\0') == std::string::npos;
}

std::string encode_directory(const Directory& dir) {
  std::string out = kHeader;
  for (const auto& [name, node] : dir.files) {
    out += "f ";
    append_name(out, name);
    out += ' ';
    append_digest(out, node.digest);
    out += node.is_executable ? " x\n" : " -\n";
  }
  for (const auto& [name, digest] : dir.directories) {
    out += "d ";
    append_name(out, name);
    out += ' ';
    append_digest(out, digest);
    out += '\n';
  }
  return out;
}

std::optional<Directory> decode_directory(const std::string& encoded, std::string* error) {
  if (encoded.compare(0, kHeader.size(), kHeader) != 0) {
    if (error) *error = "unknown tree header";
    return std::nullopt;
  }
  Reader r{encoded, kHeader.size(), {}};
  Directory dir;
  std::string last_file;
  std::string last_dir;
  bool in_dirs = false;

  while (r.i < encoded.size()) {
    const char kind = encoded[r.i++];
    std::string name;
    Digest digest;
    bool ok = r.expect(' ') && r.read_name(name) && r.expect(' ') && r.read_digest(digest);
    if (ok && kind == 'f') {
      if (in_dirs) {
        ok = r.fail("file entry after directory entries");
      } else if (!last_file.empty() && name <= last_file) {
        ok = r.fail("file entries out of order");
      } else if (encoded.compare(r.i, 2, " x") == 0) {
        r.i += 2;
        dir.files[name] = FileNode{digest, true};
        last_file = name;
      } else if (encoded.compare(r.i, 2, " -") == 0) {
        r.i += 2;
        dir.files[name] = FileNode{digest, false};
        last_file = name;
      } else {
        ok = r.fail("bad executable flag");
      }
    } else if (ok && kind == 'd') {
      in_dirs = true;
      if (!last_dir.empty() && name <= last_dir) {
        ok = r.fail("directory entries out of order");
      } else if (dir.files.count(name) != 0) {
        ok = r.fail("name is both a file and a directory");
      } else {
        dir.directories[name] = digest;
        last_dir = name;
      }
    } else if (ok) {
      ok = r.fail("unknown entry kind");
    }
    if (!ok || !r.expect('\n')) {
      if (error) *error = r.err;
      return std::nullopt;
    }
  }
  return dir;
}

TreeStore::TreeStore(std::shared_ptr<ICASBackend> backend, std::string compression)
    : backend_(std::move(backend)), compression_(std::move(compression)) {}

std::optional<Digest> TreeStore::store_file_bytes(const std::string& bytes) {
  const std::string hash = backend_->put(bytes, compression_);
  if (hash.empty()) return std::nullopt;
  return Digest{hash, bytes.size()};
}

std::optional<Digest> TreeStore::store_file_from_path(const fs::path& path,
                                                      std::string* error) {
  std::uint64_t size = 0;
  const std::string hash = cas_file_hash(path.string(), &size);
  if (hash.empty()) {
    if (error) *error = "cannot read " + path.string();
    return std::nullopt;
  }
  if (backend_->contains(hash)) return Digest{hash, size};

  std::ifstream ifs(path, std::ios::binary);
  std::string data((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  if (!ifs && !ifs.eof()) {
    if (error) *error = "cannot read " + path.string();
    return std::nullopt;
  }
  auto digest = store_file_bytes(data);
  if (!digest) {
    if (error) *error = "store rejected contents of " + path.string();
    return std::nullopt;
  }
  return digest;
}

std::optional<std::string> TreeStore::load_file_bytes(const Digest& digest) const {
  auto data = backend_->get(digest.hash);
  if (!data || data->size() != digest.size_bytes) return std::nullopt;
  return data;
}

std::optional<Digest> TreeStore::record_directory(const Directory& dir) {
  return store_file_bytes(encode_directory(dir));
}

std::optional<Directory> TreeStore::load_directory(const Digest& digest,
                                                   std::string* error) const {
  if (digest == empty_directory_digest()) return Directory{};
  auto encoded = load_file_bytes(digest);
  if (!encoded) {
    if (error) *error = "directory " + to_string(digest) + " not found in store";
    return std::nullopt;
  }
  std::string decode_error;
  auto dir = decode_directory(*encoded, &decode_error);
  if (!dir && error) *error = "directory " + to_string(digest) + " is malformed: " + decode_error;
  return dir;
}

bool TreeStore::materialize_directory(const Digest& digest, const fs::path& dest,
                                      std::string* error) const {
  auto dir = load_directory(digest, error);
  if (!dir) return false;

  for (const auto& [name, node] : dir->files) {
    auto bytes = load_file_bytes(node.digest);
    if (!bytes) {
      if (error) *error = "file " + to_string(node.digest) + " for " + (dest / name).string() +
                          " not found in store";
      return false;
    }
    if (!write_file(dest / name, *bytes, node.is_executable, error)) return false;
  }
  for (const auto& [name, child] : dir->directories) {
    std::error_code ec;
    fs::create_directory(dest / name, ec);
    if (ec) {
      if (error) *error = "cannot create " + (dest / name).string() + ": " + ec.message();
      return false;
    }
    if (!materialize_directory(child, dest / name, error)) return false;
  }
  return true;
}

// ---------------------------------------------------------------------------
// TreeBuilder
// ---------------------------------------------------------------------------

struct TreeBuilder::Node {
  std::map<std::string, std::unique_ptr<Node>> dirs;
  std::map<std::string, FileNode> files;
};

namespace {

// Depth-first post-order so that every child digest exists before its parent
// is encoded.
template <typename NodeT>
std::optional<Digest> record_node(const NodeT& node, TreeStore& store, std::string* error) {
  Directory dir;
  dir.files = node.files;
  for (const auto& [name, child] : node.dirs) {
    auto d = record_node(*child, store, error);
    if (!d) return std::nullopt;
    dir.directories[name] = *d;
  }
  auto digest = store.record_directory(dir);
  if (!digest && error) *error = "store rejected directory node";
  return digest;
}

}  // namespace

TreeBuilder::TreeBuilder() : root_(std::make_unique<Node>()) {}
TreeBuilder::~TreeBuilder() = default;
TreeBuilder::TreeBuilder(TreeBuilder&&) noexcept = default;
TreeBuilder& TreeBuilder::operator=(TreeBuilder&&) noexcept = default;

bool TreeBuilder::add_file(const RelativePath& path, const FileNode& node, std::string* error) {
  const auto parts = path.components();
  if (parts.empty()) {
    if (error) *error = "cannot add the root as a file";
    return false;
  }
  Node* cur = root_.get();
  for (std::size_t i = 0; i + 1 < parts.size(); ++i) {
    if (cur->files.count(parts[i]) != 0) {
      if (error) *error = "path component is a file: " + path.str();
      return false;
    }
    auto& slot = cur->dirs[parts[i]];
    if (!slot) slot = std::make_unique<Node>();
    cur = slot.get();
  }
  if (cur->dirs.count(parts.back()) != 0) {
    if (error) *error = "path is already a directory: " + path.str();
    return false;
  }
  cur->files[parts.back()] = node;
  return true;
}

bool TreeBuilder::add_directory(const RelativePath& path, std::string* error) {
  Node* cur = root_.get();
  for (const auto& part : path.components()) {
    if (cur->files.count(part) != 0) {
      if (error) *error = "path component is a file: " + path.str();
      return false;
    }
    auto& slot = cur->dirs[part];
    if (!slot) slot = std::make_unique<Node>();
    cur = slot.get();
  }
  return true;
}

bool TreeBuilder::empty() const {
  return root_->dirs.empty() && root_->files.empty();
}

std::optional<Digest> TreeBuilder::record(TreeStore& store, std::string* error) const {
  return record_node(*root_, store, error);
}

}  // namespace bivouac
