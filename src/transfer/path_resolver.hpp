#pragma once
#include <filesystem>
#include <string>
#include "errors.hpp"

namespace haul {

// Maps a peer-supplied filename, expressed against the remote bundle root,
// onto the local working directory. Anything that would land outside the
// working directory is rejected.
class PathResolver {
public:
    PathResolver(std::filesystem::path root, std::filesystem::path cwd);

    // Computes the destination without touching the filesystem.
    Status resolve(const std::string& filename, std::filesystem::path& out) const;
    // resolve() plus creation of missing parent directories.
    Status prepare(const std::string& filename, std::filesystem::path& out) const;

    const std::filesystem::path& root() const { return root_; }
    const std::filesystem::path& cwd() const { return cwd_; }
private:
    std::filesystem::path root_;
    std::filesystem::path cwd_;
};

} // namespace haul
