#include "stream_writer.hpp"
#include "logging.hpp"
#include "util.hpp"

namespace haul {

StreamWriter::StreamWriter(std::string token, uint64_t size, FileHandle handle,
                           FileStat stat)
    : token_(std::move(token)), size_(size), handle_(std::move(handle)),
      stat_(stat) {}

Status StreamWriter::on_data(const uint8_t *data, size_t len) {
  if (!handle_.is_open())
    return Status::failure(ErrorKind::UnknownSession,
                           "file " + token_ + " already finished");
  received_ += len;
  if (Logger::instance().enabled(LogLevel::DEBUG))
    Logger::instance().log(LogLevel::DEBUG, "file %s %s/%s", token_.c_str(),
                           format_mib(received_).c_str(),
                           format_mib(size_).c_str());
  return handle_.write_all(data, len);
}

Status StreamWriter::finish() {
  if (!handle_.is_open())
    return Status::success();
  // writes since begin have bumped mtime
  Status st = handle_.set_times(stat_.atime_ms, stat_.mtime_ms);
  Status closed = handle_.close();
  return st.ok() ? closed : st;
}

} // namespace haul
