#include "bivouac/named_caches.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace bivouac {

NamedCaches::NamedCaches(fs::path base) : base_(std::move(base)) {}

std::optional<fs::path> NamedCaches::path_for(const CacheName& name,
                                              std::string* error) const {
  const fs::path dir = base_ / name.str();
  std::error_code ec;
  // create_directories returns false without an error when another run
  // created the directory first.
  fs::create_directories(dir, ec);
  if (ec || !fs::is_directory(dir, ec)) {
    if (error) {
      *error = "cannot create named cache " + name.str() + " at " + dir.string() +
               (ec ? ": " + ec.message() : ": not a directory");
    }
    return std::nullopt;
  }
  return dir;
}

}  // namespace bivouac
