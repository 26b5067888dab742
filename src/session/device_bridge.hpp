#pragma once
#include <asio.hpp>
#include <deque>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <nlohmann/json.hpp>
#include "protocol.hpp"
#include "remote.hpp"

namespace haul {

struct BridgeConfig {
    std::string bridge_host{"127.0.0.1"};
    uint16_t bridge_port{27042};
    // Device selection forwarded to the bridge; empty uuid and host means USB.
    std::string uuid;
    std::string remote_host;
};

class BridgeSession;
class BridgeScript;

// Client side of the device bridge. One TCP connection carries RPC requests,
// their replies, and every script's message stream. Calls block the caller,
// which pumps the io_context until the matching reply arrives; inbound
// messages are delivered from that same loop.
class DeviceBridge : public Device {
public:
    using tcp = asio::ip::tcp;
    DeviceBridge(asio::io_context& io, const BridgeConfig& cfg);
    ~DeviceBridge() override;

    void connect();

    std::vector<Application> enumerate_applications() override;
    std::unique_ptr<Session> run(const std::string& app) override;
    std::unique_ptr<Session> attach(uint32_t pid) override;
    std::unique_ptr<Session> attach(const std::string& name) override;
    void kill(uint32_t pid) override;

    // Replies received but not yet claimed by a waiting request.
    size_t pending_replies() const { return replies_.size(); }

private:
    friend class BridgeSession;
    friend class BridgeScript;

    nlohmann::json request(const std::string& op, nlohmann::json args,
                           const BridgeSession* owner = nullptr);
    void post(uint32_t script_id, const nlohmann::json& message);
    std::unique_ptr<Session> make_session(const nlohmann::json& reply);

    void do_read();
    void do_write();
    void send_frame(Frame&& f);
    void handle_frame(Frame&& f);
    void pump();
    void drain_events();

    asio::io_context& io_;
    BridgeConfig cfg_;
    tcp::socket sock_;
    bool connected_{false};
    std::string conn_error_;
    std::vector<uint8_t> read_buf_;
    FrameDecoder decoder_;
    std::deque<std::vector<uint8_t>> write_q_;
    uint32_t next_request_id_{1};
    std::unordered_map<uint32_t, nlohmann::json> replies_;
    // Requests whose caller gave up waiting; their replies are dropped.
    std::unordered_set<uint32_t> abandoned_;
    std::deque<Frame> events_;
    std::unordered_map<uint32_t, BridgeSession*> sessions_;
    std::unordered_map<uint32_t, BridgeScript*> scripts_;
};

class BridgeSession : public Session {
public:
    BridgeSession(DeviceBridge& bridge, uint32_t id, uint32_t pid);
    ~BridgeSession() override;

    uint32_t pid() const override { return pid_; }
    std::unique_ptr<Script> create_script(const std::string& source) override;
    void detach() override;
    bool is_detached() const override { return detached_; }
    void on_detached(DetachHandler handler) override;

    uint32_t id() const { return id_; }
    void handle_detached(DetachReason reason, const nlohmann::json& crash);
private:
    DeviceBridge& bridge_;
    uint32_t id_;
    uint32_t pid_;
    bool detached_{false};
    std::vector<DetachHandler> handlers_;
};

class BridgeScript : public Script {
public:
    BridgeScript(DeviceBridge& bridge, const BridgeSession& session, uint32_t id);
    ~BridgeScript() override;

    void load() override;
    void unload() override;
    nlohmann::json call(const std::string& name, const nlohmann::json& args) override;
    void post(const nlohmann::json& message) override;
    void on_message(MessageHandler handler) override;

    void deliver(const nlohmann::json& message, std::vector<uint8_t> data);
private:
    DeviceBridge& bridge_;
    const BridgeSession& session_;
    uint32_t id_;
    MessageHandler handler_;
};

} // namespace haul
