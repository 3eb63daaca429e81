#include "bivouac/types.hpp"

#include "bivouac/hash.hpp"
#include "bivouac/tree.hpp"

namespace bivouac {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::validation_failed: return "validation_failed";
    case ErrorCode::path_escape: return "path_escape";
    case ErrorCode::sandbox_setup_failed: return "sandbox_setup_failed";
    case ErrorCode::spawn_failed: return "spawn_failed";
    case ErrorCode::capture_failed: return "capture_failed";
    case ErrorCode::store_failed: return "store_failed";
    case ErrorCode::finalize_failed: return "finalize_failed";
    case ErrorCode::config_invalid: return "config_invalid";
    case ErrorCode::platform_unknown: return "platform_unknown";
  }
  return "";
}

std::string to_string(const Digest& d) {
  return d.hash + "/" + std::to_string(d.size_bytes);
}

Digest empty_file_digest() {
  return Digest{cas_content_hash(""), 0};
}

Digest empty_directory_digest() {
  static const Digest digest = [] {
    const std::string encoded = encode_directory(Directory{});
    return Digest{cas_content_hash(encoded), encoded.size()};
  }();
  return digest;
}

std::optional<RelativePath> RelativePath::create(const std::string& raw,
                                                 std::string* error) {
  if (raw.find('\0') != std::string::npos) {
    if (error) *error = "path contains a NUL byte";
    return std::nullopt;
  }
  if (!raw.empty() && raw.front() == '/') {
    if (error) *error = "absolute path not allowed: " + raw;
    return std::nullopt;
  }

  std::string normalized;
  std::size_t start = 0;
  while (start <= raw.size()) {
    std::size_t end = raw.find('/', start);
    if (end == std::string::npos) end = raw.size();
    const std::string segment = raw.substr(start, end - start);
    if (segment == "..") {
      if (error) *error = "path escapes the sandbox root: " + raw;
      return std::nullopt;
    }
    if (!segment.empty() && segment != ".") {
      if (!normalized.empty()) normalized += '/';
      normalized += segment;
    }
    start = end + 1;
  }
  return RelativePath(std::move(normalized));
}

std::vector<std::string> RelativePath::components() const {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (start < value_.size()) {
    std::size_t end = value_.find('/', start);
    if (end == std::string::npos) end = value_.size();
    out.push_back(value_.substr(start, end - start));
    start = end + 1;
  }
  return out;
}

std::optional<CacheName> CacheName::create(const std::string& raw, std::string* error) {
  if (raw.empty()) {
    if (error) *error = "cache name must not be empty";
    return std::nullopt;
  }
  if (raw.find_first_of(std::string("/\\\0", 3)) != std::string::npos) {
    if (error) *error = "cache name must not contain path separators: " + raw;
    return std::nullopt;
  }
  if (raw == "." || raw == "..") {
    if (error) *error = "cache name must not be a relative path marker: " + raw;
    return std::nullopt;
  }
  return CacheName(raw);
}

std::optional<CacheDest> CacheDest::create(const std::string& raw, std::string* error) {
  std::string path_error;
  auto rel = RelativePath::create(raw, &path_error);
  if (!rel) {
    if (error) *error = "invalid cache destination: " + path_error;
    return std::nullopt;
  }
  if (rel->is_root()) {
    if (error) *error = "cache destination must name a path below the sandbox root";
    return std::nullopt;
  }
  return CacheDest(std::move(*rel));
}

ErrorCode validate_process(const Process& process, std::string* error) {
  if (process.argv.empty() || process.argv.front().empty()) {
    if (error) *error = "process argv must name an executable";
    return ErrorCode::validation_failed;
  }
  if (process.jdk_home && !process.jdk_home->is_absolute()) {
    if (error) *error = "jdk_home must be an absolute path: " + process.jdk_home->string();
    return ErrorCode::validation_failed;
  }
  if (process.timeout && process.timeout->count() <= 0) {
    if (error) *error = "timeout must be positive";
    return ErrorCode::validation_failed;
  }
  for (const auto& [name, dest] : process.append_only_caches) {
    if (dest.str() == kJdkSymlinkName && process.jdk_home) {
      if (error) *error = "cache " + name.str() + " collides with the jdk mount";
      return ErrorCode::validation_failed;
    }
  }
  return ErrorCode::none;
}

}  // namespace bivouac
