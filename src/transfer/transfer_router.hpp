#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "chunk_assembler.hpp"
#include "errors.hpp"
#include "message.hpp"
#include "path_resolver.hpp"
#include "remote.hpp"
#include "stream_writer.hpp"

namespace haul {

// Interprets the transfer traffic of one remote session. Blobs and files are
// keyed by the peer's session token; every accepted begin/data is acked so the
// peer can send its next chunk.
class TransferRouter {
public:
    TransferRouter(PathResolver paths, Script& script, Session& session);
    TransferRouter(const TransferRouter&) = delete;
    TransferRouter& operator=(const TransferRouter&) = delete;

    // Subscribes to the script's message stream.
    void connect();
    Status dispatch(const nlohmann::json& message, std::vector<uint8_t> data);

    // First fatal error seen on this session, if any.
    const Status& failure() const { return failure_; }
    size_t open_blobs() const { return blobs_.size(); }
    size_t open_files() const { return files_.size(); }
    uint64_t acks_sent() const { return acks_; }

private:
    struct Visitor;

    Status on_memcpy(const MemcpyMessage& m, std::vector<uint8_t>&& data);
    Status on_patch(const PatchMessage& m);
    Status on_download(const DownloadMessage& m, const std::vector<uint8_t>& data);
    void ack();
    void fail(const Status& st);

    PathResolver paths_;
    Script& script_;
    Session& session_;
    std::unordered_map<std::string, std::unique_ptr<ChunkAssembler>> blobs_;
    std::unordered_map<std::string, std::unique_ptr<StreamWriter>> files_;
    Status failure_;
    uint64_t acks_{0};
};

} // namespace haul
