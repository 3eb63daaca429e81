#include "bivouac/capture.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace bivouac {

namespace {

struct Capture {
  const fs::path& sandbox;
  TreeStore& store;
  TreeBuilder builder;
  ErrorCode code{ErrorCode::none};
  std::string error;

  bool fail(ErrorCode c, std::string msg) {
    code = c;
    error = std::move(msg);
    return false;
  }

  bool add_file(const RelativePath& rel, const fs::path& abs, const fs::file_status& st) {
    std::string why;
    auto digest = store.store_file_from_path(abs, &why);
    if (!digest)
      return fail(ErrorCode::capture_failed, "cannot capture output " + rel.str() + ": " + why);
    const bool exec = (st.permissions() & fs::perms::owner_exec) != fs::perms::none;
    if (!builder.add_file(rel, FileNode{*digest, exec}, &why))
      return fail(ErrorCode::capture_failed, why);
    return true;
  }

  bool walk(const RelativePath& rel, const fs::path& abs) {
    std::string why;
    if (!builder.add_directory(rel, &why))
      return fail(ErrorCode::capture_failed, why);

    std::error_code ec;
    for (fs::directory_iterator it(abs, ec), end; !ec && it != end; it.increment(ec)) {
      const fs::path child_abs = it->path();
      const std::string name = child_abs.filename().string();
      auto child = RelativePath::create(rel.is_root() ? name : rel.str() + "/" + name, &why);
      if (!child)
        return fail(ErrorCode::capture_failed, why);

      std::error_code sec;
      const fs::file_status link_st = fs::symlink_status(child_abs, sec);
      if (sec)
        return fail(ErrorCode::capture_failed,
                    "cannot stat " + child->str() + ": " + sec.message());
      if (fs::is_symlink(link_st)) {
        const fs::file_status target_st = fs::status(child_abs, sec);
        if (!sec && fs::is_regular_file(target_st) && !add_file(*child, child_abs, target_st))
          return false;
        continue;
      }
      if (fs::is_directory(link_st)) {
        if (!walk(*child, child_abs))
          return false;
      } else if (fs::is_regular_file(link_st)) {
        if (!add_file(*child, child_abs, link_st))
          return false;
      }
    }
    if (ec)
      return fail(ErrorCode::capture_failed,
                  "cannot list output directory " + rel.str() + ": " + ec.message());
    return true;
  }
};

}  // namespace

ErrorCode capture_outputs(const fs::path& sandbox, const std::set<RelativePath>& output_files,
                          const std::set<RelativePath>& output_directories, TreeStore& store,
                          Digest* root, std::string* error) {
  Capture cap{sandbox, store, TreeBuilder{}};

  for (const auto& rel : output_files) {
    const fs::path abs = sandbox / rel.path();
    std::error_code ec;
    const fs::file_status st = fs::status(abs, ec);
    if (ec || !fs::is_regular_file(st))
      continue;
    if (!cap.add_file(rel, abs, st))
      break;
  }

  if (cap.code == ErrorCode::none) {
    for (const auto& rel : output_directories) {
      const fs::path abs = sandbox / rel.path();
      std::error_code ec;
      const fs::file_status st = fs::status(abs, ec);
      if (ec)
        continue;
      bool ok = true;
      if (fs::is_directory(st))
        ok = cap.walk(rel, abs);
      else if (fs::is_regular_file(st))
        ok = cap.add_file(rel, abs, st);
      if (!ok)
        break;
    }
  }

  if (cap.code != ErrorCode::none) {
    if (error) *error = cap.error;
    return cap.code;
  }

  std::string why;
  auto digest = cap.builder.record(store, &why);
  if (!digest) {
    if (error) *error = "cannot record output tree: " + why;
    return ErrorCode::store_failed;
  }
  if (root) *root = *digest;
  return ErrorCode::none;
}

}  // namespace bivouac
