#include "bivouac/platform.hpp"

#include <sys/utsname.h>

#include <cstring>

namespace bivouac {

std::string to_string(Platform platform) {
  switch (platform) {
    case Platform::linux_x86_64: return "linux_x86_64";
    case Platform::linux_arm64: return "linux_arm64";
    case Platform::macos_x86_64: return "macos_x86_64";
    case Platform::macos_arm64: return "macos_arm64";
  }
  return "";
}

std::optional<Platform> platform_from_string(const std::string& name) {
  if (name == "linux_x86_64") return Platform::linux_x86_64;
  if (name == "linux_arm64") return Platform::linux_arm64;
  if (name == "macos_x86_64") return Platform::macos_x86_64;
  if (name == "macos_arm64") return Platform::macos_arm64;
  return std::nullopt;
}

std::optional<Platform> current_platform() {
  struct utsname uts;
  if (::uname(&uts) != 0) return std::nullopt;

  const bool x86_64 = std::strcmp(uts.machine, "x86_64") == 0 ||
                      std::strcmp(uts.machine, "amd64") == 0;
  const bool arm64 = std::strcmp(uts.machine, "aarch64") == 0 ||
                     std::strcmp(uts.machine, "arm64") == 0;

  if (std::strcmp(uts.sysname, "Linux") == 0) {
    if (x86_64) return Platform::linux_x86_64;
    if (arm64) return Platform::linux_arm64;
  } else if (std::strcmp(uts.sysname, "Darwin") == 0) {
    if (x86_64) return Platform::macos_x86_64;
    if (arm64) return Platform::macos_arm64;
  }
  return std::nullopt;
}

}  // namespace bivouac
