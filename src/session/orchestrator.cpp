#include "orchestrator.hpp"
#include "logging.hpp"
#include <system_error>

namespace haul {

namespace fs = std::filesystem;
using nlohmann::json;

const char *dump_state_name(DumpState state) {
  switch (state) {
  case DumpState::Idle:
    return "idle";
  case DumpState::MainAttached:
    return "main-attached";
  case DumpState::MainPrepared:
    return "main-prepared";
  case DumpState::MainDumping:
    return "main-dumping";
  case DumpState::ValidationBypassed:
    return "validation-bypassed";
  case DumpState::ChildEnumerated:
    return "child-enumerated";
  case DumpState::ChildDumping:
    return "child-dumping";
  case DumpState::Cleanup:
    return "cleanup";
  case DumpState::Done:
    return "done";
  case DumpState::Aborted:
    return "aborted";
  }
  return "?";
}

SessionOrchestrator::SessionOrchestrator(Device &device, DumpConfig cfg)
    : device_(device), cfg_(std::move(cfg)) {}

SessionOrchestrator::~SessionOrchestrator() = default;

DetachSeverity detach_severity(DetachReason reason) {
  switch (reason) {
  case DetachReason::ApplicationRequested:
    return DetachSeverity::Silent;
  case DetachReason::ServerTerminated:
    return DetachSeverity::ReasonOnly;
  default:
    return DetachSeverity::WithCrashReport;
  }
}

size_t SessionOrchestrator::log_detached(const std::string &label,
                                         DetachReason reason,
                                         const json &crash) {
  DetachSeverity severity = detach_severity(reason);
  if (severity == DetachSeverity::Silent)
    return 0;

  auto &log = Logger::instance();
  log.log(LogLevel::ERROR, "FATAL ERROR: session detached (%s)", label.c_str());
  log.log(LogLevel::ERROR, "reason: %s", detach_reason_name(reason));
  size_t lines = 2;
  if (severity == DetachSeverity::ReasonOnly)
    return lines;

  if (!crash.is_object())
    return lines;
  for (auto it = crash.begin(); it != crash.end(); ++it) {
    std::string val = it.value().is_string() ? it.value().get<std::string>()
                                             : it.value().dump();
    log.log(LogLevel::ERROR, "%s: %s", it.key().c_str(), val.c_str());
    lines++;
  }
  return lines;
}

void SessionOrchestrator::transition(DumpState next) {
  Logger::instance().log(LogLevel::DEBUG, "state %s -> %s",
                         dump_state_name(state_), dump_state_name(next));
  state_ = next;
}

fs::path SessionOrchestrator::check_destination() const {
  std::error_code ec;
  fs::create_directories(cfg_.output, ec);
  if (ec)
    throw Error(ErrorKind::Io,
                "unable to create " + cfg_.output + ": " + ec.message());

  fs::path parent = fs::path(cfg_.output) / cfg_.app / "Payload";
  if (fs::is_directory(parent, ec) && !cfg_.override_existing)
    throw Error(ErrorKind::DestinationExists,
                "Destination " + parent.string() +
                    " already exists. Try --override");
  return parent;
}

void SessionOrchestrator::open_script(Endpoint &ep,
                                      std::unique_ptr<Session> session,
                                      const std::string &label) {
  ep.label = label;
  ep.session = std::move(session);
  ep.session->on_detached([label](DetachReason reason, const json &crash) {
    log_detached(label, reason, crash);
  });
  ep.script = ep.session->create_script(cfg_.agent_source);
  ep.script->load();
}

void SessionOrchestrator::attach_router(Endpoint &ep) {
  ep.router = std::make_unique<TransferRouter>(PathResolver(root_, cwd_),
                                               *ep.script, *ep.session);
  ep.router->connect();
}

// Runs an agent export and surfaces any transfer failure the router recorded
// while the export was streaming.
void SessionOrchestrator::call_checked(Endpoint &ep, const std::string &name,
                                       const json &args) {
  try {
    ep.script->call(name, args);
  } catch (const Error &) {
    if (ep.router && !ep.router->failure().ok())
      throw Error(ep.router->failure().kind, ep.router->failure().message);
    throw;
  }
  if (ep.router && !ep.router->failure().ok())
    throw Error(ep.router->failure().kind, ep.router->failure().message);
}

fs::path SessionOrchestrator::run() {
  auto &log = Logger::instance();
  fs::path parent;
  try {
    parent = check_destination();

    open_script(main_, device_.run(cfg_.app), "main");
    transition(DumpState::MainAttached);

    json base = main_.script->call("base");
    if (!base.is_string())
      throw Error(ErrorKind::Protocol, "agent returned no bundle root");
    root_ = fs::path(base.get<std::string>()).lexically_normal();
    if (!root_.has_filename())
      root_ = root_.parent_path();
    cwd_ = parent / root_.filename();
    std::error_code ec;
    fs::create_directories(cwd_, ec);
    if (ec)
      throw Error(ErrorKind::Io,
                  "unable to create " + cwd_.string() + ": " + ec.message());
    log.log(LogLevel::INFO, "app root: %s", root_.string().c_str());

    attach_router(main_);

    log.log(LogLevel::INFO, "dump main app");
    call_checked(main_, "prepare", json::array({cfg_.cmod_source}));
    transition(DumpState::MainPrepared);
    transition(DumpState::MainDumping);
    call_checked(main_, "dump");

    log.log(LogLevel::INFO, "patch PluginKit validation");
    open_script(bypass_, device_.attach(cfg_.bypass_service), "bypass");
    bypass_.script->call("skipPkdValidationFor",
                         json::array({main_.session->pid()}));
    transition(DumpState::ValidationBypassed);
  } catch (const std::exception &) {
    transition(DumpState::Aborted);
    teardown(bypass_);
    teardown(main_);
    throw;
  }

  dump_children();

  // The artifacts are complete; a dead main process must not keep the
  // validation hook installed.
  transition(DumpState::Cleanup);
  teardown(main_);
  teardown(bypass_);
  transition(DumpState::Done);

  log.log(LogLevel::INFO, "Congrats!");
  log.log(LogLevel::INFO, "open %s", parent.string().c_str());
  return parent;
}

void SessionOrchestrator::dump_children() {
  auto &log = Logger::instance();
  log.log(LogLevel::INFO, "dump extensions");

  std::vector<uint32_t> pids;
  try {
    json list = main_.script->call("launchAll");
    if (list.is_array())
      for (const auto &pid : list)
        pids.push_back(pid.get<uint32_t>());
  } catch (const std::exception &e) {
    log.log(LogLevel::WARN, "unable to dump plugins: %s", e.what());
    return;
  }
  transition(DumpState::ChildEnumerated);

  for (uint32_t pid : pids) {
    transition(DumpState::ChildDumping);
    ChildOutcome outcome;
    outcome.pid = pid;
    try {
      dump_child(pid);
      outcome.dumped = true;
    } catch (const Error &e) {
      outcome.error = e.kind;
      outcome.message = e.what();
    } catch (const std::exception &e) {
      outcome.error = ErrorKind::Remote;
      outcome.message = e.what();
    }
    if (!outcome.dumped)
      log.log(LogLevel::WARN, "unable to dump plugin %u: %s", pid,
              outcome.message.c_str());
    children_.push_back(std::move(outcome));
  }
}

void SessionOrchestrator::dump_child(uint32_t pid) {
  json rc = bypass_.script->call("jetsam", json::array({pid}));
  if (!rc.is_number_integer() || rc.get<int64_t>() != 0)
    throw Error(ErrorKind::ChildBypassFailed,
                "unable to unchain " + std::to_string(pid));

  Endpoint child;
  try {
    open_script(child, device_.attach(pid), "plugin " + std::to_string(pid));
    attach_router(child);
    call_checked(child, "prepare", json::array({cfg_.cmod_source}));
    call_checked(child, "dump");
    close(child);
    device_.kill(pid);
  } catch (const std::exception &) {
    teardown(child);
    try {
      device_.kill(pid);
    } catch (const std::exception &e) {
      Logger::instance().log(LogLevel::WARN, "unable to kill %u: %s", pid,
                             e.what());
    }
    throw;
  }
}

void SessionOrchestrator::close(Endpoint &ep) {
  if (ep.script)
    ep.script->unload();
  if (ep.session)
    ep.session->detach();
}

// Best effort release of whatever part of an endpoint got set up.
void SessionOrchestrator::teardown(Endpoint &ep) {
  if (!ep.session)
    return;
  if (ep.script && !ep.session->is_detached()) {
    try {
      ep.script->unload();
    } catch (const std::exception &e) {
      Logger::instance().log(LogLevel::WARN, "unload %s: %s", ep.label.c_str(),
                             e.what());
    }
  }
  try {
    ep.session->detach();
  } catch (const std::exception &e) {
    Logger::instance().log(LogLevel::WARN, "detach %s: %s", ep.label.c_str(),
                           e.what());
  }
}

} // namespace haul
