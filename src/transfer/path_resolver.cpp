#include "path_resolver.hpp"
#include <system_error>

namespace haul {

namespace fs = std::filesystem;

static fs::path normalized_dir(const fs::path &p) {
  fs::path out = fs::absolute(p).lexically_normal();
  if (!out.has_filename() && out.has_relative_path())
    out = out.parent_path();
  return out;
}

PathResolver::PathResolver(fs::path root, fs::path cwd)
    : root_(normalized_dir(root)), cwd_(normalized_dir(cwd)) {}

Status PathResolver::resolve(const std::string &filename, fs::path &out) const {
  fs::path candidate = (root_ / fs::path(filename)).lexically_normal();
  fs::path abs = (cwd_ / candidate.lexically_relative(root_)).lexically_normal();
  fs::path rel = abs.lexically_relative(cwd_);

  bool escapes = rel.empty() || rel == "." || rel.is_absolute() ||
                 *rel.begin() == "..";
  if (escapes)
    return Status::failure(ErrorKind::SuspiciousPath,
                           "Suspicious path detected: " + filename);
  out = abs;
  return Status::success();
}

Status PathResolver::prepare(const std::string &filename, fs::path &out) const {
  Status st = resolve(filename, out);
  if (!st.ok())
    return st;
  std::error_code ec;
  fs::create_directories(out.parent_path(), ec);
  if (ec)
    return Status::failure(ErrorKind::Io, "unable to create " +
                                              out.parent_path().string() +
                                              ": " + ec.message());
  return Status::success();
}

} // namespace haul
