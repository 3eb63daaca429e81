#include "bivouac/hash.hpp"

// Domain separation: the domain string is fed to the hasher before the
// payload. "cas:" is part of the store layout contract; changing it
// invalidates every stored object and every recorded tree.

#include <array>
#include <cstdint>
#include <fstream>

extern "C" {
#include <blake3.h>
}

namespace bivouac {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";
constexpr std::string_view kCasDomain = "cas:";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

std::string finalize_hex(blake3_hasher& hasher) {
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

}  // namespace

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  return finalize_hex(hasher);
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  return finalize_hex(hasher);
}

std::string cas_content_hash(std::string_view raw_bytes) {
  return hash_domain(kCasDomain, raw_bytes);
}

std::string cas_file_hash(const std::string& path, std::uint64_t* size_bytes) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return {};
  }

  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, kCasDomain.data(), kCasDomain.size());

  // 64 KB chunks: incremental BLAKE3 equals single-shot BLAKE3.
  constexpr std::size_t buffer_size = 65536;
  std::array<char, buffer_size> buffer;
  std::uint64_t total = 0;
  while (file) {
    file.read(buffer.data(), buffer.size());
    const std::streamsize count = file.gcount();
    if (count > 0) {
      blake3_hasher_update(&hasher, buffer.data(), static_cast<std::size_t>(count));
      total += static_cast<std::uint64_t>(count);
    }
  }
  if (file.bad()) {
    return {};
  }
  if (size_bytes) *size_bytes = total;
  return finalize_hex(hasher);
}

std::string blake3_library_version() {
  const char* v = blake3_version();
  return v ? v : "unknown";
}

}  // namespace bivouac
