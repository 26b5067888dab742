#include "errors.hpp"

namespace haul {

const char *error_kind_name(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "none";
  case ErrorKind::SuspiciousPath:
    return "suspicious path";
  case ErrorKind::SequenceViolation:
    return "sequence violation";
  case ErrorKind::UnknownSession:
    return "unknown session";
  case ErrorKind::DestinationExists:
    return "destination exists";
  case ErrorKind::ChildBypassFailed:
    return "child bypass failed";
  case ErrorKind::SessionDetached:
    return "session detached";
  case ErrorKind::Io:
    return "i/o error";
  case ErrorKind::Protocol:
    return "protocol error";
  case ErrorKind::Remote:
    return "remote error";
  case ErrorKind::Config:
    return "configuration error";
  }
  return "unknown";
}

} // namespace haul
