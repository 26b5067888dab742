#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "errors.hpp"

namespace haul {

enum class EnvelopeType { Send, Error, Other };

enum class TransferEvent { Begin, Data, End };

struct MemcpyMessage {
    TransferEvent event{TransferEvent::Begin};
    std::string session;
    uint64_t size{0};
    uint64_t index{0};
};

struct PatchMessage {
    uint64_t offset{0};
    std::optional<std::string> blob;
    uint64_t size{0};
    std::string filename;
};

struct FileStat {
    uint32_t mode{0644};
    uint64_t size{0};
    double atime_ms{0};
    double mtime_ms{0};
};

struct DownloadMessage {
    TransferEvent event{TransferEvent::Begin};
    std::string session;
    std::optional<FileStat> stat;
    std::string filename;
};

// A subject this host does not handle. Kept so it can be logged and dropped.
struct UnknownSubject {
    std::string subject;
};

using SendPayload = std::variant<MemcpyMessage, PatchMessage, DownloadMessage, UnknownSubject>;

struct Envelope {
    EnvelopeType type{EnvelopeType::Other};
    std::string type_name;
    SendPayload payload{UnknownSubject{}};
    nlohmann::json raw;
};

// Decodes {type, payload} as posted by the agent. Only "send" envelopes have
// their payload interpreted; subject-specific fields are validated here.
Status parse_envelope(const nlohmann::json& j, Envelope& out);

nlohmann::json make_ack();

} // namespace haul
