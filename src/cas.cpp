#include "bivouac/cas.hpp"

// Meta sidecars are one-line JSON documents. They are written after the
// blob, so a blob without a sidecar is an interrupted put and is rewritten
// by the next put() of the same content.

#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <stdexcept>
#include <string_view>
#include <system_error>

#if defined(BIVOUAC_WITH_ZSTD)
#include <zstd.h>
#endif

#include "bivouac/hash.hpp"

namespace fs = std::filesystem;

namespace bivouac {

namespace {
#if defined(BIVOUAC_WITH_ZSTD)
std::string compress_zstd(const std::string& data) {
  std::string out;
  out.resize(ZSTD_compressBound(data.size()));
  size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), 3);
  if (ZSTD_isError(n))
    return {};
  out.resize(n);
  return out;
}

std::optional<std::string> decompress_zstd(const std::string& data,
                                           std::size_t original_size) {
  std::string out;
  out.resize(original_size);
  size_t n = ZSTD_decompress(out.data(), out.size(), data.data(), data.size());
  if (ZSTD_isError(n))
    return std::nullopt;
  out.resize(n);
  return out;
}
#endif

// Unique temporary name so that concurrent writers of the same object never
// share a tmp file.
std::string make_tmp_name(const fs::path& dir) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dist;
  return (dir / (".tmp_" + std::to_string(dist(rng)))).string();
}

bool atomic_write(const fs::path& target, const std::string& data) {
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec)
    return false;
  const std::string tmp = make_tmp_name(target.parent_path());
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs)
      return false;
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!ofs) {
      std::remove(tmp.c_str());
      return false;
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    std::remove(tmp.c_str());
    return false;
  }
  return true;
}

std::optional<std::string> read_all(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs)
    return std::nullopt;
  std::string data((std::istreambuf_iterator<char>(ifs)),
                   std::istreambuf_iterator<char>());
  if (ifs.bad())
    return std::nullopt;
  return data;
}

std::string meta_field(const std::string& line, std::string_view key) {
  const std::string quoted = "\"" + std::string(key) + "\"";
  auto p = line.find(quoted);
  if (p == std::string::npos)
    return {};
  auto start = line.find(':', p + quoted.size());
  if (start == std::string::npos || start + 1 >= line.size())
    return {};
  if (line[start + 1] == '"') {
    auto end = line.find('"', start + 2);
    if (end == std::string::npos)
      return {};
    return line.substr(start + 2, end - start - 2);
  }
  auto end = line.find_first_of(",}", start + 1);
  return line.substr(start + 1, end - start - 1);
}

std::string meta_to_json(const CasObjectInfo& info) {
  return "{\"digest\":\"" + info.digest + "\",\"encoding\":\"" + info.encoding +
         "\",\"original_size\":" + std::to_string(info.original_size) +
         ",\"stored_size\":" + std::to_string(info.stored_size) +
         ",\"stored_blob_hash\":\"" + info.stored_blob_hash +
         "\",\"created_at\":" + std::to_string(info.created_at_unix_ts) + "}";
}

} // namespace

bool valid_digest(const std::string& d) {
  if (d.size() != 64)
    return false;
  for (char c : d) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')))
      return false;
  }
  return true;
}

bool cas_zstd_available() {
#if defined(BIVOUAC_WITH_ZSTD)
  return true;
#else
  return false;
#endif
}

CasStore::CasStore(std::string root) : root_(std::move(root)) {
  std::error_code ec;
  fs::create_directories(fs::path(root_) / "objects", ec);
}

std::string CasStore::object_path(const std::string& digest) const {
  return (fs::path(root_) / "objects" / digest.substr(0, 2) /
          digest.substr(2, 2) / digest)
      .string();
}

std::string CasStore::meta_path(const std::string& digest) const {
  return object_path(digest) + ".meta";
}

std::string CasStore::put(const std::string& data, const std::string& compression) {
  const std::string digest = cas_content_hash(data);
  if (!valid_digest(digest))
    return {};

  // Dedup: an existing object is only trusted after a verified read.
  std::error_code ec;
  if (fs::exists(object_path(digest), ec) && fs::exists(meta_path(digest), ec)) {
    auto existing = get(digest);
    if (existing.has_value() && *existing == data)
      return digest;
    // Corrupt or interrupted object: fall through and rewrite it.
  }

  std::string stored = data;
  std::string encoding = "identity";
#if defined(BIVOUAC_WITH_ZSTD)
  if (compression == "zstd") {
    auto c = compress_zstd(data);
    if (!c.empty()) {
      stored = std::move(c);
      encoding = "zstd";
    }
  }
#else
  (void)compression;
#endif

  if (!atomic_write(object_path(digest), stored))
    return {};

  CasObjectInfo info;
  info.digest = digest;
  info.encoding = encoding;
  info.original_size = data.size();
  info.stored_size = stored.size();
  info.stored_blob_hash = blake3_hex(stored);
  info.created_at_unix_ts = static_cast<uint64_t>(std::time(nullptr));

  if (!atomic_write(meta_path(digest), meta_to_json(info))) {
    fs::remove(object_path(digest), ec);
    return {};
  }
  return digest;
}

std::optional<CasObjectInfo> CasStore::info(const std::string& digest) const {
  if (!valid_digest(digest))
    return std::nullopt;
  auto line = read_all(meta_path(digest));
  if (!line)
    return std::nullopt;

  CasObjectInfo inf;
  inf.digest = meta_field(*line, "digest");
  inf.encoding = meta_field(*line, "encoding");
  inf.stored_blob_hash = meta_field(*line, "stored_blob_hash");
  try {
    inf.original_size = std::stoull(meta_field(*line, "original_size"));
    inf.stored_size = std::stoull(meta_field(*line, "stored_size"));
    inf.created_at_unix_ts = std::stoull(meta_field(*line, "created_at"));
  } catch (const std::exception&) {
    return std::nullopt;
  }
  if (inf.digest != digest)
    return std::nullopt;
  return inf;
}

std::optional<std::string> CasStore::get(const std::string& digest) const {
  if (!valid_digest(digest))
    return std::nullopt;
  auto data = read_all(object_path(digest));
  if (!data)
    return std::nullopt;

  auto meta = info(digest);
  if (!meta)
    return std::nullopt;

  // Stored blob hash is plain BLAKE3 over the bytes on disk.
  if (blake3_hex(*data) != meta->stored_blob_hash)
    return std::nullopt;

  if (meta->encoding == "zstd") {
#if defined(BIVOUAC_WITH_ZSTD)
    auto plain = decompress_zstd(*data, meta->original_size);
    if (!plain)
      return std::nullopt;
    data = std::move(plain);
#else
    return std::nullopt;
#endif
  } else if (meta->encoding != "identity") {
    return std::nullopt;
  }

  if (cas_content_hash(*data) != digest)
    return std::nullopt;
  return data;
}

bool CasStore::contains(const std::string& digest) const {
  if (!valid_digest(digest))
    return false;
  std::error_code ec;
  return fs::exists(object_path(digest), ec) && fs::exists(meta_path(digest), ec);
}

} // namespace bivouac
