#include "protocol.hpp"
#include "logging.hpp"
#include <array>
#include <cstring>

namespace haul {

uint32_t crc32(const uint8_t *data, size_t len) {
  static std::array<uint32_t, 256> table{};
  static bool inited = false;
  if (!inited) {
    for (uint32_t i = 0; i < 256; i++) {
      uint32_t c = i;
      for (int j = 0; j < 8; j++)
        c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
      table[i] = c;
    }
    inited = true;
  }
  uint32_t c = ~0u;
  for (size_t i = 0; i < len; i++)
    c = table[(c ^ data[i]) & 0xFF] ^ (c >> 8);
  return ~c;
}

Frame make_frame(FrameKind kind, uint32_t request_id, uint32_t channel,
                 std::string json, std::vector<uint8_t> data) {
  Frame f;
  f.hdr.magic = kMagic;
  f.hdr.version = kVersion;
  f.hdr.kind = static_cast<uint8_t>(kind);
  f.hdr.reserved = 0;
  f.hdr.request_id = request_id;
  f.hdr.channel = channel;
  f.hdr.json_len = (uint32_t)json.size();
  f.hdr.data_len = (uint32_t)data.size();
  f.hdr.header_crc32 =
      crc32((const uint8_t *)&f.hdr, sizeof(FrameHeader) - sizeof(uint32_t));
  f.json = std::move(json);
  f.data = std::move(data);
  return f;
}

std::vector<uint8_t> encode_frame(const Frame &f) {
  std::vector<uint8_t> buf(sizeof(FrameHeader) + f.json.size() + f.data.size());
  std::memcpy(buf.data(), &f.hdr, sizeof(FrameHeader));
  if (!f.json.empty())
    std::memcpy(buf.data() + sizeof(FrameHeader), f.json.data(), f.json.size());
  if (!f.data.empty())
    std::memcpy(buf.data() + sizeof(FrameHeader) + f.json.size(),
                f.data.data(), f.data.size());
  return buf;
}

void FrameDecoder::feed(const uint8_t *data, size_t len) {
  inbuf_.insert(inbuf_.end(), data, data + len);
}

bool FrameDecoder::next(Frame &out) {
  while (inbuf_.size() - off_ >= sizeof(FrameHeader)) {
    FrameHeader hdr;
    std::memcpy(&hdr, inbuf_.data() + off_, sizeof(hdr));
    if (hdr.magic != kMagic || hdr.version != kVersion ||
        hdr.header_crc32 != crc32((const uint8_t *)&hdr,
                                  sizeof(hdr) - sizeof(uint32_t)) ||
        hdr.json_len > kMaxSectionLen || hdr.data_len > kMaxSectionLen) {
      off_ += 1;
      skipped_ += 1;
      unreported_ += 1;
      continue;
    }
    size_t need = sizeof(FrameHeader) + hdr.json_len + hdr.data_len;
    if (inbuf_.size() - off_ < need)
      break;
    const uint8_t *body = inbuf_.data() + off_ + sizeof(FrameHeader);
    out.hdr = hdr;
    out.json.assign((const char *)body, hdr.json_len);
    out.data.assign(body + hdr.json_len, body + hdr.json_len + hdr.data_len);
    off_ += need;
    compact();
    return true;
  }
  compact();
  return false;
}

void FrameDecoder::compact() {
  if (off_ == 0)
    return;
  if (unreported_ > 0) {
    Logger::instance().log(LogLevel::WARN, "frame decoder skipped %zu bytes",
                           unreported_);
    unreported_ = 0;
  }
  inbuf_.erase(inbuf_.begin(), inbuf_.begin() + off_);
  off_ = 0;
}

} // namespace haul
