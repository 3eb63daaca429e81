#pragma once

// bivouac/platform.hpp - Identification of the executing host.

#include <optional>
#include <string>

namespace bivouac {

enum class Platform {
  linux_x86_64,
  linux_arm64,
  macos_x86_64,
  macos_arm64,
};

std::string to_string(Platform platform);

// Parses the to_string() form. Returns nullopt for unknown names.
std::optional<Platform> platform_from_string(const std::string& name);

// Platform of the running host, from uname(2). Returns nullopt on an
// unsupported OS/architecture combination.
std::optional<Platform> current_platform();

}  // namespace bivouac
