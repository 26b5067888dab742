#include "device_bridge.hpp"
#include "errors.hpp"
#include "logging.hpp"

namespace haul {

using nlohmann::json;

DeviceBridge::DeviceBridge(asio::io_context &io, const BridgeConfig &cfg)
    : io_(io), cfg_(cfg), sock_(io), read_buf_(64 * 1024) {}

DeviceBridge::~DeviceBridge() {
  std::error_code ec;
  sock_.close(ec);
}

void DeviceBridge::connect() {
  tcp::resolver res(io_);
  std::error_code ec;
  auto results =
      res.resolve(cfg_.bridge_host, std::to_string(cfg_.bridge_port), ec);
  if (!ec)
    asio::connect(sock_, results, ec);
  if (ec)
    throw Error(ErrorKind::Io, "unable to reach device bridge at " +
                                   cfg_.bridge_host + ":" +
                                   std::to_string(cfg_.bridge_port) + ": " +
                                   ec.message());
  connected_ = true;
  Logger::instance().log(LogLevel::INFO, "bridge connected");
  do_read();

  json args = json::object();
  if (!cfg_.uuid.empty())
    args["uuid"] = cfg_.uuid;
  else if (!cfg_.remote_host.empty())
    args["host"] = cfg_.remote_host;
  else
    args["usb"] = true;
  json dev = request("device", args);
  std::string name =
      dev.is_object() ? dev.value("name", std::string("?")) : std::string("?");
  Logger::instance().log(LogLevel::INFO, "device: %s", name.c_str());
}

void DeviceBridge::do_read() {
  sock_.async_read_some(
      asio::buffer(read_buf_), [this](std::error_code ec, std::size_t n) {
        if (ec) {
          Logger::instance().log(LogLevel::WARN, "bridge read error: %s",
                                 ec.message().c_str());
          conn_error_ = ec.message();
          connected_ = false;
          std::error_code ec2;
          sock_.close(ec2);
          return;
        }
        decoder_.feed(read_buf_.data(), n);
        Frame f;
        while (decoder_.next(f))
          handle_frame(std::move(f));
        do_read();
      });
}

void DeviceBridge::do_write() {
  if (write_q_.empty() || !connected_)
    return;
  auto &front = write_q_.front();
  asio::async_write(
      sock_, asio::buffer(front), [this](std::error_code ec, std::size_t) {
        if (ec) {
          Logger::instance().log(LogLevel::WARN, "bridge write error: %s",
                                 ec.message().c_str());
          conn_error_ = ec.message();
          connected_ = false;
          std::error_code ec2;
          sock_.close(ec2);
          return;
        }
        write_q_.pop_front();
        if (!write_q_.empty())
          do_write();
      });
}

void DeviceBridge::send_frame(Frame &&f) {
  if (!connected_)
    throw Error(ErrorKind::Io, "device bridge disconnected: " + conn_error_);
  write_q_.emplace_back(encode_frame(f));
  if (write_q_.size() == 1)
    do_write();
}

void DeviceBridge::handle_frame(Frame &&f) {
  switch (static_cast<FrameKind>(f.hdr.kind)) {
  case FrameKind::Reply: {
    json reply = json::parse(f.json, nullptr, false);
    if (reply.is_discarded()) {
      reply = json{{"ok", false}, {"error", "malformed reply"}};
    }
    uint32_t id = f.hdr.request_id;
    if (abandoned_.erase(id)) {
      Logger::instance().log(LogLevel::DEBUG, "late reply %u dropped", id);
      return;
    }
    replies_[id] = std::move(reply);
    return;
  }
  case FrameKind::Message:
  case FrameKind::Detached:
    events_.push_back(std::move(f));
    return;
  default:
    Logger::instance().log(LogLevel::WARN, "unexpected frame kind %u",
                           (unsigned)f.hdr.kind);
    return;
  }
}

// Runs one asio handler, then delivers queued events outside of it so that
// message handlers are free to issue further requests.
void DeviceBridge::pump() {
  if (io_.stopped())
    io_.restart();
  io_.run_one();
  drain_events();
}

void DeviceBridge::drain_events() {
  while (!events_.empty()) {
    Frame f = std::move(events_.front());
    events_.pop_front();
    uint32_t channel = f.hdr.channel;
    json body = json::parse(f.json, nullptr, false);
    if (body.is_discarded()) {
      Logger::instance().log(LogLevel::WARN,
                             "dropping malformed event on channel %u", channel);
      continue;
    }
    if (static_cast<FrameKind>(f.hdr.kind) == FrameKind::Detached) {
      auto it = sessions_.find(channel);
      if (it == sessions_.end())
        continue;
      std::string reason = body.value("reason", std::string());
      json crash = body.contains("crash") ? body["crash"] : json();
      it->second->handle_detached(parse_detach_reason(reason), crash);
      continue;
    }
    auto it = scripts_.find(channel);
    if (it == scripts_.end()) {
      Logger::instance().log(LogLevel::DEBUG,
                             "message for unknown script %u dropped", channel);
      continue;
    }
    it->second->deliver(body, std::move(f.data));
  }
}

json DeviceBridge::request(const std::string &op, json args,
                           const BridgeSession *owner) {
  uint32_t id = next_request_id_++;
  json body{{"op", op}, {"args", std::move(args)}};
  send_frame(make_frame(FrameKind::Request, id, 0, body.dump()));

  auto it = replies_.find(id);
  while (it == replies_.end()) {
    if (!connected_)
      throw Error(ErrorKind::Io,
                  "device bridge disconnected during " + op + ": " +
                      conn_error_);
    if (owner && owner->is_detached()) {
      abandoned_.insert(id);
      throw Error(ErrorKind::SessionDetached,
                  "session detached during " + op);
    }
    pump();
    it = replies_.find(id);
  }
  json reply = std::move(it->second);
  replies_.erase(it);
  if (!reply.value("ok", false))
    throw Error(ErrorKind::Remote,
                op + " failed: " +
                    reply.value("error", std::string("unknown error")));
  return reply.contains("result") ? reply["result"] : json();
}

void DeviceBridge::post(uint32_t script_id, const json &message) {
  send_frame(make_frame(FrameKind::Post, 0, script_id, message.dump()));
}

std::vector<Application> DeviceBridge::enumerate_applications() {
  json list = request("enumerate_applications", json::object());
  std::vector<Application> apps;
  if (!list.is_array())
    return apps;
  for (const auto &item : list) {
    Application app;
    app.identifier = item.value("identifier", std::string());
    app.name = item.value("name", std::string());
    app.pid = item.value("pid", 0u);
    apps.push_back(std::move(app));
  }
  return apps;
}

std::unique_ptr<Session> DeviceBridge::make_session(const json &reply) {
  if (!reply.is_object() || !reply.contains("session"))
    throw Error(ErrorKind::Protocol, "bridge returned no session");
  uint32_t id = reply["session"].get<uint32_t>();
  uint32_t pid = reply.value("pid", 0u);
  return std::make_unique<BridgeSession>(*this, id, pid);
}

std::unique_ptr<Session> DeviceBridge::run(const std::string &app) {
  return make_session(request("run", json{{"app", app}}));
}

std::unique_ptr<Session> DeviceBridge::attach(uint32_t pid) {
  return make_session(request("attach", json{{"target", pid}}));
}

std::unique_ptr<Session> DeviceBridge::attach(const std::string &name) {
  return make_session(request("attach", json{{"target", name}}));
}

void DeviceBridge::kill(uint32_t pid) {
  request("kill", json{{"pid", pid}});
}

BridgeSession::BridgeSession(DeviceBridge &bridge, uint32_t id, uint32_t pid)
    : bridge_(bridge), id_(id), pid_(pid) {
  bridge_.sessions_[id_] = this;
}

BridgeSession::~BridgeSession() { bridge_.sessions_.erase(id_); }

std::unique_ptr<Script> BridgeSession::create_script(const std::string &source) {
  json reply = bridge_.request(
      "create_script", json{{"session", id_}, {"source", source}}, this);
  if (!reply.is_object() || !reply.contains("script"))
    throw Error(ErrorKind::Protocol, "bridge returned no script");
  return std::make_unique<BridgeScript>(bridge_, *this,
                                        reply["script"].get<uint32_t>());
}

void BridgeSession::detach() {
  if (detached_)
    return;
  detached_ = true;
  bridge_.request("detach", json{{"session", id_}});
}

void BridgeSession::on_detached(DetachHandler handler) {
  handlers_.push_back(std::move(handler));
}

void BridgeSession::handle_detached(DetachReason reason, const json &crash) {
  detached_ = true;
  for (auto &h : handlers_)
    h(reason, crash);
}

BridgeScript::BridgeScript(DeviceBridge &bridge, const BridgeSession &session,
                           uint32_t id)
    : bridge_(bridge), session_(session), id_(id) {
  bridge_.scripts_[id_] = this;
}

BridgeScript::~BridgeScript() { bridge_.scripts_.erase(id_); }

void BridgeScript::load() {
  bridge_.request("load", json{{"script", id_}}, &session_);
}

void BridgeScript::unload() {
  bridge_.request("unload", json{{"script", id_}}, &session_);
}

json BridgeScript::call(const std::string &name, const json &args) {
  return bridge_.request(
      "call", json{{"script", id_}, {"name", name}, {"args", args}}, &session_);
}

void BridgeScript::post(const json &message) { bridge_.post(id_, message); }

void BridgeScript::on_message(MessageHandler handler) {
  handler_ = std::move(handler);
}

void BridgeScript::deliver(const json &message, std::vector<uint8_t> data) {
  if (handler_)
    handler_(message, std::move(data));
}

} // namespace haul
