#include "chunk_assembler.hpp"
#include "logging.hpp"
#include "util.hpp"

namespace haul {

ChunkAssembler::ChunkAssembler(std::string token, uint64_t size)
    : token_(std::move(token)), size_(size) {}

Status ChunkAssembler::feed(uint64_t index, std::vector<uint8_t> &&data) {
  if (index != index_ + 1)
    return Status::failure(ErrorKind::SequenceViolation,
                           "invalid index " + std::to_string(index) +
                               ", expected " + std::to_string(index_ + 1));
  received_ += data.size();
  storage_.push_back(std::move(data));
  index_++;
  if (Logger::instance().enabled(LogLevel::DEBUG))
    Logger::instance().log(LogLevel::DEBUG, "blob %s %s/%s", token_.c_str(),
                           format_mib(received_).c_str(),
                           format_mib(size_).c_str());
  return Status::success();
}

std::vector<uint8_t> ChunkAssembler::finish() {
  size_t total = 0;
  for (const auto &chunk : storage_)
    total += chunk.size();
  std::vector<uint8_t> out;
  out.reserve(total);
  for (const auto &chunk : storage_)
    out.insert(out.end(), chunk.begin(), chunk.end());
  storage_.clear();
  storage_.shrink_to_fit();
  return out;
}

} // namespace haul
