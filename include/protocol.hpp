#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace haul {

constexpr uint32_t kMagic = 0x4C554148; // 'HAUL'
constexpr uint8_t  kVersion = 1;
constexpr uint32_t kMaxSectionLen = 64u * 1024 * 1024;

enum class FrameKind : uint8_t {
    Request  = 1,
    Reply    = 2,
    Message  = 3,
    Post     = 4,
    Detached = 5
};

#pragma pack(push, 1)
struct FrameHeader {
    uint32_t magic;
    uint8_t  version;
    uint8_t  kind;
    uint16_t reserved;
    uint32_t request_id;
    uint32_t channel;
    uint32_t json_len;
    uint32_t data_len;
    uint32_t header_crc32;
};
#pragma pack(pop)
static_assert(sizeof(FrameHeader) == 28, "FrameHeader must be 28 bytes");

struct Frame {
    FrameHeader hdr{};
    std::string json;
    std::vector<uint8_t> data;
};

uint32_t crc32(const uint8_t* data, size_t len);

Frame make_frame(FrameKind kind, uint32_t request_id, uint32_t channel,
                 std::string json, std::vector<uint8_t> data = {});
std::vector<uint8_t> encode_frame(const Frame& f);

// Incremental parser for a byte stream of frames. Garbage and frames with a
// bad header checksum are skipped one byte at a time.
class FrameDecoder {
public:
    void feed(const uint8_t* data, size_t len);
    bool next(Frame& out);
    size_t skipped() const { return skipped_; }
    size_t buffered() const { return inbuf_.size() - off_; }
private:
    std::vector<uint8_t> inbuf_;
    size_t off_{0};
    size_t skipped_{0};
    size_t unreported_{0};
    void compact();
};

} // namespace haul
