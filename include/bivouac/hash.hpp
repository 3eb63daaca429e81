#pragma once

// bivouac/hash.hpp - BLAKE3 hashing primitives.
//
// BLAKE3 is the only hash primitive. Content keys in the store are
// domain-separated with the "cas:" prefix so that a blob digest can never
// collide with a digest computed for another purpose over the same bytes.

#include <cstdint>
#include <string>
#include <string_view>

namespace bivouac {

// Plain BLAKE3-256 of payload, 64 lowercase hex chars.
std::string blake3_hex(std::string_view payload);

// BLAKE3 over domain || payload.
std::string hash_domain(std::string_view domain, std::string_view payload);

// Content key of a blob in the store.
std::string cas_content_hash(std::string_view raw_bytes);

// Stream-hash a file with the "cas:" domain prefix. Equal to
// cas_content_hash(read_file(path)) without loading the file into memory.
// Returns "" when the file cannot be opened or read. Sets *size_bytes to the
// number of bytes hashed when non-null.
std::string cas_file_hash(const std::string& path, std::uint64_t* size_bytes = nullptr);

// Version string reported by the linked BLAKE3 library.
std::string blake3_library_version();

}  // namespace bivouac
