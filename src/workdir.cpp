#include "bivouac/workdir.hpp"

#include <stdlib.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace bivouac {

namespace {

constexpr const char* kDirTemplate = "process-executionXXXXXX";

// mkdtemp under root, creating root first.
std::optional<fs::path> make_unique_dir(const fs::path& root, std::string* error) {
  std::error_code ec;
  fs::create_directories(root, ec);
  if (ec) {
    if (error) *error = "cannot create " + root.string() + ": " + ec.message();
    return std::nullopt;
  }
  std::string tmpl = (root / kDirTemplate).string();
  std::vector<char> buf(tmpl.begin(), tmpl.end());
  buf.push_back('\0');
  if (::mkdtemp(buf.data()) == nullptr) {
    if (error) *error = "cannot create a unique directory under " + root.string() + ": " +
                        std::strerror(errno);
    return std::nullopt;
  }
  return fs::path(buf.data());
}

bool starts_with_dir(const std::string& s, const std::string& base) {
  return s == base || (s.size() > base.size() && s.compare(0, base.size(), base) == 0 &&
                       s[base.size()] == '/');
}

bool ensure_parent(const fs::path& sandbox, const RelativePath& rel, std::string* error) {
  const fs::path parent = (sandbox / rel.path()).parent_path();
  std::error_code ec;
  fs::create_directories(parent, ec);
  if (ec) {
    if (error) *error = "cannot create parent directory for " + rel.str() + ": " + ec.message();
    return false;
  }
  return true;
}

bool make_symlink(const fs::path& target, const fs::path& link, std::string* error) {
  std::error_code ec;
  fs::create_directory_symlink(target, link, ec);
  if (ec) {
    if (error) *error = "cannot symlink " + link.string() + " -> " + target.string() + ": " +
                        ec.message();
    return false;
  }
  return true;
}

// Moves src to the existing, empty directory dest. Falls back to a
// recursive copy when the two live on different filesystems, in which case
// *copied is set and src is left for the caller to remove.
bool move_tree(const fs::path& src, const fs::path& dest, bool* copied, std::string* error) {
  *copied = false;
  std::error_code ec;
  fs::rename(src, dest, ec);
  if (!ec)
    return true;
  if (ec != std::errc::cross_device_link) {
    if (error) *error = "cannot move " + src.string() + " to " + dest.string() + ": " + ec.message();
    return false;
  }
  ec.clear();
  fs::copy(src, dest, fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
  if (ec) {
    if (error) *error = "cannot copy " + src.string() + " to " + dest.string() + ": " + ec.message();
    return false;
  }
  *copied = true;
  return true;
}

}  // namespace

// ---------------------------------------------------------------------------
// WorkDir
// ---------------------------------------------------------------------------

std::optional<WorkDir> WorkDir::create(const fs::path& root, std::string* error) {
  auto dir = make_unique_dir(root, error);
  if (!dir)
    return std::nullopt;
  return WorkDir(std::move(*dir));
}

WorkDir::~WorkDir() { remove(); }

WorkDir::WorkDir(WorkDir&& other) noexcept
    : path_(std::move(other.path_)), owned_(other.owned_) {
  other.owned_ = false;
}

WorkDir& WorkDir::operator=(WorkDir&& other) noexcept {
  if (this != &other) {
    remove();
    path_ = std::move(other.path_);
    owned_ = other.owned_;
    other.owned_ = false;
  }
  return *this;
}

fs::path WorkDir::release() {
  owned_ = false;
  return path_;
}

void WorkDir::remove() {
  if (!owned_ || path_.empty())
    return;
  owned_ = false;
  // remove_all does not follow symlinks, so cache mounts and the jdk
  // mount are unlinked without touching their targets.
  std::error_code ec;
  fs::remove_all(path_, ec);
  if (ec)
    std::fprintf(stderr, "[bivouac:workdir] failed to remove sandbox %s: %s\n", path_.c_str(),
                 ec.message().c_str());
}

// ---------------------------------------------------------------------------
// Sandbox construction
// ---------------------------------------------------------------------------

ErrorCode prepare_workdir(const fs::path& sandbox, const Process& process,
                          const TreeStore& store, const NamedCaches& caches,
                          std::string* error) {
  std::string why;
  if (!store.materialize_directory(process.input_files, sandbox, &why)) {
    if (error) *error = "failed to materialize input files: " + why;
    return ErrorCode::sandbox_setup_failed;
  }

  // Some tools write into a subdirectory without creating it first.
  for (const auto& out : process.output_files) {
    if (!ensure_parent(sandbox, out, error))
      return ErrorCode::sandbox_setup_failed;
  }
  for (const auto& out : process.output_directories) {
    if (!out.is_root() && !ensure_parent(sandbox, out, error))
      return ErrorCode::sandbox_setup_failed;
  }

  for (const auto& [name, dest] : process.append_only_caches) {
    auto target = caches.path_for(name, &why);
    if (!target) {
      if (error) *error = why;
      return ErrorCode::sandbox_setup_failed;
    }
    if (!ensure_parent(sandbox, dest.relative(), error) ||
        !make_symlink(*target, sandbox / dest.relative().path(), error))
      return ErrorCode::sandbox_setup_failed;
  }

  if (process.jdk_home) {
    if (!make_symlink(*process.jdk_home, sandbox / kJdkSymlinkName, error))
      return ErrorCode::sandbox_setup_failed;
  }
  return ErrorCode::none;
}

std::optional<fs::path> resolve_working_directory(const fs::path& sandbox,
                                                  const std::optional<RelativePath>& wd,
                                                  std::string* error) {
  std::error_code ec;
  const fs::path base = fs::weakly_canonical(sandbox, ec);
  if (ec) {
    if (error) *error = "cannot resolve sandbox " + sandbox.string() + ": " + ec.message();
    return std::nullopt;
  }
  if (!wd || wd->is_root())
    return base;
  const fs::path in = fs::weakly_canonical(base / wd->path(), ec);
  if (ec) {
    if (error) *error = "cannot resolve working directory " + wd->str() + ": " + ec.message();
    return std::nullopt;
  }
  if (!starts_with_dir(in.string(), base.string())) {
    if (error) *error = "working directory " + wd->str() + " resolves outside the sandbox";
    return std::nullopt;
  }
  return in;
}

// ---------------------------------------------------------------------------
// Preservation
// ---------------------------------------------------------------------------

std::string shell_quote(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 2);
  out += '\'';
  for (char c : s) {
    if (c == '\'')
      out += "'\\''";
    else
      out += c;
  }
  out += '\'';
  return out;
}

std::string render_run_script(const std::vector<std::string>& argv,
                              const std::map<std::string, std::string>& env,
                              const fs::path& cwd) {
  std::string script = "#!/bin/bash\n";
  script += "# Re-runs the process this sandbox was preserved from.\n";
  for (const auto& [k, v] : env)
    script += "export " + shell_quote(k + "=" + v) + "\n";
  script += "\ncd " + shell_quote(cwd.string()) + "\n\n";
  for (std::size_t i = 0; i < argv.size(); ++i) {
    if (i) script += ' ';
    script += shell_quote(argv[i]);
  }
  script += "\n";
  return script;
}

std::optional<fs::path> preserve_workdir(WorkDir& workdir, const fs::path& preserve_root,
                                         const Process& process, std::string* error) {
  auto dest = make_unique_dir(preserve_root, error);
  if (!dest)
    return std::nullopt;
  bool copied = false;
  if (!move_tree(workdir.path(), *dest, &copied, error)) {
    std::error_code ec;
    fs::remove_all(*dest, ec);
    return std::nullopt;
  }
  // A renamed sandbox is gone from the work root. A copied one is still
  // owned by workdir, whose destructor removes the source.
  if (!copied)
    workdir.release();

  fs::path cwd = *dest;
  if (process.working_directory)
    cwd /= process.working_directory->path();
  const fs::path script_path = *dest / kRunScriptName;
  {
    std::ofstream ofs(script_path, std::ios::binary | std::ios::trunc);
    ofs << render_run_script(process.argv, process.env, cwd);
    if (!ofs) {
      if (error) *error = "cannot write " + script_path.string();
      return std::nullopt;
    }
  }
  std::error_code ec;
  fs::permissions(script_path, fs::perms::owner_all | fs::perms::group_read |
                                   fs::perms::group_exec | fs::perms::others_read |
                                   fs::perms::others_exec,
                  ec);
  if (ec) {
    if (error) *error = "cannot make " + script_path.string() + " executable: " + ec.message();
    return std::nullopt;
  }
  return dest;
}

}  // namespace bivouac
