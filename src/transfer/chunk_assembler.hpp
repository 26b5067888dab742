#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "errors.hpp"

namespace haul {

// In-memory accumulator for one anonymous blob. Chunks must arrive with
// strictly increasing indices starting at 1; the buffer is only handed out
// once, when a patch consumes the blob.
class ChunkAssembler {
public:
    ChunkAssembler(std::string token, uint64_t size);

    Status feed(uint64_t index, std::vector<uint8_t>&& data);
    std::vector<uint8_t> finish();

    const std::string& token() const { return token_; }
    uint64_t size() const { return size_; }
    uint64_t received() const { return received_; }
    uint64_t index() const { return index_; }
    size_t chunk_count() const { return storage_.size(); }
private:
    std::string token_;
    uint64_t size_;
    uint64_t received_{0};
    uint64_t index_{0};
    std::vector<std::vector<uint8_t>> storage_;
};

} // namespace haul
