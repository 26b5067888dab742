#include "message.hpp"
#include <limits>

namespace haul {

using nlohmann::json;

namespace {

Status bad(const std::string &what) {
  return Status::failure(ErrorKind::Protocol, "malformed message: " + what);
}

Status read_event(const json &p, TransferEvent &out) {
  auto it = p.find("event");
  if (it == p.end() || !it->is_string())
    return bad("missing event");
  const auto &ev = it->get_ref<const std::string &>();
  if (ev == "begin")
    out = TransferEvent::Begin;
  else if (ev == "data")
    out = TransferEvent::Data;
  else if (ev == "end")
    out = TransferEvent::End;
  else
    return bad("unexpected event " + ev);
  return Status::success();
}

Status read_string(const json &p, const char *key, std::string &out) {
  auto it = p.find(key);
  if (it == p.end() || !it->is_string())
    return bad(std::string("missing ") + key);
  out = it->get<std::string>();
  return Status::success();
}

uint64_t read_uint(const json &p, const char *key) {
  auto it = p.find(key);
  if (it == p.end() || !it->is_number())
    return 0;
  if (it->is_number_float()) {
    double v = it->get<double>();
    if (!(v > 0))
      return 0;
    // 2^64 is exactly representable; anything at or above it saturates.
    if (v >= 18446744073709551616.0)
      return std::numeric_limits<uint64_t>::max();
    return static_cast<uint64_t>(v);
  }
  if (it->is_number_integer() && it->get<int64_t>() < 0)
    return 0;
  return it->get<uint64_t>();
}

double read_double(const json &p, const char *key) {
  auto it = p.find(key);
  if (it == p.end() || !it->is_number())
    return 0;
  return it->get<double>();
}

Status parse_memcpy(const json &p, SendPayload &out) {
  MemcpyMessage m;
  Status st = read_event(p, m.event);
  if (!st.ok())
    return st;
  st = read_string(p, "session", m.session);
  if (!st.ok())
    return st;
  m.size = read_uint(p, "size");
  m.index = read_uint(p, "index");
  out = std::move(m);
  return Status::success();
}

Status parse_patch(const json &p, SendPayload &out) {
  PatchMessage m;
  Status st = read_string(p, "filename", m.filename);
  if (!st.ok())
    return st;
  m.offset = read_uint(p, "offset");
  auto blob = p.find("blob");
  if (blob != p.end() && blob->is_string() &&
      !blob->get_ref<const std::string &>().empty())
    m.blob = blob->get<std::string>();
  m.size = read_uint(p, "size");
  if (!m.blob && m.size == 0)
    return bad("patch needs either blob or size");
  out = std::move(m);
  return Status::success();
}

Status parse_download(const json &p, SendPayload &out) {
  DownloadMessage m;
  Status st = read_event(p, m.event);
  if (!st.ok())
    return st;
  st = read_string(p, "session", m.session);
  if (!st.ok())
    return st;
  auto fn = p.find("filename");
  if (fn != p.end() && fn->is_string())
    m.filename = fn->get<std::string>();
  auto stat = p.find("stat");
  if (stat != p.end() && stat->is_object()) {
    FileStat s;
    if (stat->contains("mode"))
      s.mode = (uint32_t)read_uint(*stat, "mode");
    s.size = read_uint(*stat, "size");
    s.atime_ms = read_double(*stat, "atimeMs");
    s.mtime_ms = read_double(*stat, "mtimeMs");
    m.stat = s;
  }
  if (m.event == TransferEvent::Begin) {
    if (m.filename.empty())
      return bad("download begin without filename");
    if (!m.stat)
      return bad("download begin without stat");
  }
  out = std::move(m);
  return Status::success();
}

} // namespace

Status parse_envelope(const json &j, Envelope &out) {
  out.raw = j;
  if (!j.is_object())
    return bad("envelope is not an object");
  auto type = j.find("type");
  out.type_name = (type != j.end() && type->is_string())
                      ? type->get<std::string>()
                      : std::string();
  if (out.type_name == "send")
    out.type = EnvelopeType::Send;
  else if (out.type_name == "error")
    out.type = EnvelopeType::Error;
  else
    out.type = EnvelopeType::Other;

  if (out.type != EnvelopeType::Send)
    return Status::success();

  auto payload = j.find("payload");
  if (payload == j.end() || !payload->is_object()) {
    out.payload = UnknownSubject{};
    return Status::success();
  }
  auto subject = payload->find("subject");
  std::string name = (subject != payload->end() && subject->is_string())
                         ? subject->get<std::string>()
                         : std::string();
  if (name == "memcpy")
    return parse_memcpy(*payload, out.payload);
  if (name == "patch")
    return parse_patch(*payload, out.payload);
  if (name == "download")
    return parse_download(*payload, out.payload);
  out.payload = UnknownSubject{name};
  return Status::success();
}

json make_ack() { return json{{"type", "ack"}}; }

} // namespace haul
