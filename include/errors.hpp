#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace haul {

enum class ErrorKind : uint8_t {
    None = 0,
    SuspiciousPath,
    SequenceViolation,
    UnknownSession,
    DestinationExists,
    ChildBypassFailed,
    SessionDetached,
    Io,
    Protocol,
    Remote,
    Config
};

const char* error_kind_name(ErrorKind kind);

struct Error : public std::runtime_error {
    ErrorKind kind;
    Error(ErrorKind k, const std::string& msg) : std::runtime_error(msg), kind(k) {}
};

// Result of a single protocol handler. Failures are recorded, not thrown, so
// the owner of the router decides whether the run continues.
struct Status {
    ErrorKind kind{ErrorKind::None};
    std::string message;

    bool ok() const { return kind == ErrorKind::None; }
    static Status success() { return Status{}; }
    static Status failure(ErrorKind k, std::string msg) { return Status{k, std::move(msg)}; }
};

} // namespace haul
