#include "transfer_router.hpp"
#include "logging.hpp"
#include <fcntl.h>

namespace haul {

namespace fs = std::filesystem;

struct TransferRouter::Visitor {
  TransferRouter &router;
  std::vector<uint8_t> &data;

  Status operator()(const MemcpyMessage &m) {
    return router.on_memcpy(m, std::move(data));
  }
  Status operator()(const PatchMessage &m) { return router.on_patch(m); }
  Status operator()(const DownloadMessage &m) {
    return router.on_download(m, data);
  }
  Status operator()(const UnknownSubject &m) {
    Logger::instance().log(LogLevel::DEBUG, "ignoring subject '%s'",
                           m.subject.c_str());
    return Status::success();
  }
};

TransferRouter::TransferRouter(PathResolver paths, Script &script,
                               Session &session)
    : paths_(std::move(paths)), script_(script), session_(session) {}

void TransferRouter::connect() {
  script_.on_message(
      [this](const nlohmann::json &message, std::vector<uint8_t> data) {
        (void)dispatch(message, std::move(data));
      });
}

Status TransferRouter::dispatch(const nlohmann::json &message,
                                std::vector<uint8_t> data) {
  if (!failure_.ok())
    return failure_;

  Envelope env;
  Status st = parse_envelope(message, env);
  if (!st.ok()) {
    fail(st);
    return st;
  }

  switch (env.type) {
  case EnvelopeType::Send:
    st = std::visit(Visitor{*this, data}, env.payload);
    if (!st.ok())
      fail(st);
    return st;
  case EnvelopeType::Error: {
    std::string desc = env.raw.value("description", std::string("agent error"));
    Logger::instance().log(LogLevel::ERROR, "agent error: %s", desc.c_str());
    if (env.raw.contains("stack") && env.raw["stack"].is_string())
      Logger::instance().log(LogLevel::ERROR, "%s",
                             env.raw["stack"].get<std::string>().c_str());
    st = Status::failure(ErrorKind::SessionDetached, "agent error: " + desc);
    fail(st);
    return st;
  }
  case EnvelopeType::Other:
    Logger::instance().log(LogLevel::WARN, "UNKNOWN %s %s (%zu bytes)",
                           env.type_name.c_str(), env.raw.dump().c_str(),
                           data.size());
    return Status::success();
  }
  return Status::success();
}

Status TransferRouter::on_memcpy(const MemcpyMessage &m,
                                 std::vector<uint8_t> &&data) {
  switch (m.event) {
  case TransferEvent::Begin:
    Logger::instance().log(LogLevel::INFO, "fetching decrypted data");
    blobs_[m.session] = std::make_unique<ChunkAssembler>(m.session, m.size);
    ack();
    return Status::success();
  case TransferEvent::Data: {
    auto it = blobs_.find(m.session);
    if (it == blobs_.end())
      return Status::failure(ErrorKind::UnknownSession,
                             "invalid session id " + m.session);
    Status st = it->second->feed(m.index, std::move(data));
    if (!st.ok())
      return st;
    ack();
    return Status::success();
  }
  case TransferEvent::End:
    // consumed later by a patch referencing this token
    return Status::success();
  }
  return Status::success();
}

Status TransferRouter::on_patch(const PatchMessage &m) {
  fs::path output;
  Status st = paths_.prepare(m.filename, output);
  if (!st.ok())
    return st;

  std::vector<uint8_t> buf;
  if (m.blob) {
    auto it = blobs_.find(*m.blob);
    if (it == blobs_.end())
      return Status::failure(ErrorKind::UnknownSession,
                             "invalid session id " + *m.blob);
    buf = it->second->finish();
    blobs_.erase(it);
  } else {
    buf.assign(m.size, 0);
  }

  FileHandle fh;
  st = FileHandle::open(output.string(), O_WRONLY | O_CREAT, 0644, fh);
  if (!st.ok())
    return st;
  st = fh.write_at(buf.data(), buf.size(), m.offset);
  if (!st.ok())
    return st;
  return fh.close();
}

Status TransferRouter::on_download(const DownloadMessage &m,
                                   const std::vector<uint8_t> &data) {
  switch (m.event) {
  case TransferEvent::Begin: {
    Logger::instance().log(LogLevel::INFO, "download %s",
                           fs::path(m.filename).filename().string().c_str());
    fs::path output;
    Status st = paths_.prepare(m.filename, output);
    if (!st.ok())
      return st;
    FileHandle fh;
    st = FileHandle::open(output.string(), O_WRONLY | O_CREAT | O_TRUNC,
                          m.stat->mode & 07777, fh);
    if (!st.ok())
      return st;
    st = fh.set_times(m.stat->atime_ms, m.stat->mtime_ms);
    if (!st.ok())
      return st;
    files_[m.session] = std::make_unique<StreamWriter>(
        m.session, m.stat->size, std::move(fh), *m.stat);
    ack();
    return Status::success();
  }
  case TransferEvent::Data: {
    auto it = files_.find(m.session);
    if (it == files_.end())
      return Status::failure(ErrorKind::UnknownSession,
                             "invalid file id " + m.session);
    Status st = it->second->on_data(data.data(), data.size());
    if (!st.ok())
      return st;
    ack();
    return Status::success();
  }
  case TransferEvent::End: {
    auto it = files_.find(m.session);
    if (it == files_.end())
      return Status::failure(ErrorKind::UnknownSession,
                             "invalid file id " + m.session);
    Status st = it->second->finish();
    files_.erase(it);
    return st;
  }
  }
  return Status::success();
}

void TransferRouter::ack() {
  script_.post(make_ack());
  acks_++;
}

void TransferRouter::fail(const Status &st) {
  if (!failure_.ok())
    return;
  failure_ = st;
  Logger::instance().log(LogLevel::ERROR, "%s: %s", error_kind_name(st.kind),
                         st.message.c_str());
  try {
    session_.detach();
  } catch (const Error &e) {
    Logger::instance().log(LogLevel::WARN, "detach after failure: %s",
                           e.what());
  }
}

} // namespace haul
