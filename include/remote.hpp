#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace haul {

// Interfaces onto the instrumentation engine. The device side attaches to
// processes and runs the agent; this host only sees sessions and scripts.

class Script {
public:
    using MessageHandler = std::function<void(const nlohmann::json& message, std::vector<uint8_t> data)>;

    virtual ~Script() = default;
    virtual void load() = 0;
    virtual void unload() = 0;
    // Invokes an RPC export of the agent and waits for its result.
    virtual nlohmann::json call(const std::string& name, const nlohmann::json& args = nlohmann::json::array()) = 0;
    // Fire-and-forget message to the agent.
    virtual void post(const nlohmann::json& message) = 0;
    virtual void on_message(MessageHandler handler) = 0;
};

enum class DetachReason {
    ApplicationRequested,
    ProcessReplaced,
    ProcessTerminated,
    ServerTerminated,
    DeviceLost,
    Unknown
};

DetachReason parse_detach_reason(const std::string& s);
const char* detach_reason_name(DetachReason reason);

class Session {
public:
    using DetachHandler = std::function<void(DetachReason reason, const nlohmann::json& crash)>;

    virtual ~Session() = default;
    virtual uint32_t pid() const = 0;
    virtual std::unique_ptr<Script> create_script(const std::string& source) = 0;
    // Idempotent.
    virtual void detach() = 0;
    virtual bool is_detached() const = 0;
    virtual void on_detached(DetachHandler handler) = 0;
};

struct Application {
    std::string identifier;
    std::string name;
    uint32_t pid{0};
};

class Device {
public:
    virtual ~Device() = default;
    virtual std::vector<Application> enumerate_applications() = 0;
    // Spawns the app, or attaches to it if already running.
    virtual std::unique_ptr<Session> run(const std::string& app) = 0;
    virtual std::unique_ptr<Session> attach(uint32_t pid) = 0;
    virtual std::unique_ptr<Session> attach(const std::string& name) = 0;
    virtual void kill(uint32_t pid) = 0;
};

} // namespace haul
