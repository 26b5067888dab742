#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include "errors.hpp"

namespace haul {

// Owning POSIX descriptor. Move-only; closes on destruction if still open.
class FileHandle {
public:
    FileHandle() = default;
    explicit FileHandle(int fd) : fd_(fd) {}
    FileHandle(FileHandle&& other) noexcept
        : fd_(other.release()), path_(std::move(other.path_)) {}
    FileHandle& operator=(FileHandle&& other) noexcept;
    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;
    ~FileHandle();

    static Status open(const std::string& path, int flags, uint32_t mode, FileHandle& out);

    bool is_open() const { return fd_ >= 0; }
    int fd() const { return fd_; }
    int release() { int fd = fd_; fd_ = -1; return fd; }

    // Writes at the current file position, retrying short writes.
    Status write_all(const uint8_t* data, size_t len);
    // Writes at an explicit offset without moving the file position.
    Status write_at(const uint8_t* data, size_t len, uint64_t offset);
    Status set_times(double atime_ms, double mtime_ms);
    Status close();
private:
    int fd_{-1};
    std::string path_;
};

} // namespace haul
