#include "remote.hpp"

namespace haul {

DetachReason parse_detach_reason(const std::string &s) {
  if (s == "application-requested")
    return DetachReason::ApplicationRequested;
  if (s == "process-replaced")
    return DetachReason::ProcessReplaced;
  if (s == "process-terminated")
    return DetachReason::ProcessTerminated;
  if (s == "server-terminated" || s == "connection-terminated")
    return DetachReason::ServerTerminated;
  if (s == "device-lost")
    return DetachReason::DeviceLost;
  return DetachReason::Unknown;
}

const char *detach_reason_name(DetachReason reason) {
  switch (reason) {
  case DetachReason::ApplicationRequested:
    return "application-requested";
  case DetachReason::ProcessReplaced:
    return "process-replaced";
  case DetachReason::ProcessTerminated:
    return "process-terminated";
  case DetachReason::ServerTerminated:
    return "server-terminated";
  case DetachReason::DeviceLost:
    return "device-lost";
  case DetachReason::Unknown:
    break;
  }
  return "unknown";
}

} // namespace haul
