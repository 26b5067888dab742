#pragma once
#include <cstdint>
#include <string>
#include "errors.hpp"
#include "file_handle.hpp"
#include "message.hpp"

namespace haul {

// Streams one named file straight to disk. The writer owns the handle from
// begin until finish; chunks are written at the handle's own position.
class StreamWriter {
public:
    StreamWriter(std::string token, uint64_t size, FileHandle handle, FileStat stat);

    Status on_data(const uint8_t* data, size_t len);
    // Restores the peer's timestamps and closes the handle.
    Status finish();

    const std::string& token() const { return token_; }
    uint64_t size() const { return size_; }
    uint64_t received() const { return received_; }
    bool finished() const { return !handle_.is_open(); }
private:
    std::string token_;
    uint64_t size_;
    uint64_t received_{0};
    FileHandle handle_;
    FileStat stat_;
};

} // namespace haul
