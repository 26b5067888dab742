#include "orchestrator.hpp"
#include "fake_device.hpp"
#include "test_util.hpp"

#include <filesystem>
#include <iostream>
#include <string>

using haul::DumpConfig;
using haul::DumpState;
using haul::Error;
using haul::ErrorKind;
using haul::SessionOrchestrator;
using haul_test::Bytes;
using haul_test::FakeDevice;
using haul_test::FakeScript;
using haul_test::ReadFile;
using nlohmann::json;

namespace {

const std::string kRoot = "/private/var/containers/Bundle/Application/ABCD/Demo.app";

void send_file(FakeScript& s, const std::string& token, const std::string& rel,
               const std::string& body) {
  json begin{{"subject", "download"}, {"event", "begin"}, {"session", token},
             {"filename", kRoot + "/" + rel},
             {"stat", {{"mode", 0644}, {"size", body.size()}, {"atimeMs", 0}, {"mtimeMs", 0}}}};
  s.emit(begin);
  s.emit(json{{"subject", "download"}, {"event", "data"}, {"session", token}}, Bytes(body));
  s.emit(json{{"subject", "download"}, {"event", "end"}, {"session", token}});
}

void send_blob(FakeScript& s, const std::string& token, const std::string& rel,
               uint64_t offset, const std::string& body) {
  s.emit(json{{"subject", "memcpy"}, {"event", "begin"}, {"session", token},
              {"size", body.size()}});
  s.emit(json{{"subject", "memcpy"}, {"event", "data"}, {"session", token}, {"index", 1}},
         Bytes(body));
  s.emit(json{{"subject", "memcpy"}, {"event", "end"}, {"session", token}});
  s.emit(json{{"subject", "patch"}, {"offset", offset}, {"blob", token},
              {"filename", kRoot + "/" + rel}});
}

FakeDevice make_device(bool corrupt_main) {
  FakeDevice dev;
  dev.pids["com.example.demo"] = 500;
  dev.by_name["com.example.demo"] = [corrupt_main](const std::string& name, const json&,
                                                  FakeScript& s) -> json {
    if (name == "base")
      return kRoot;
    if (name == "dump") {
      send_file(s, "f1", "Demo", "ENCRYPTEDxxxx");
      send_blob(s, "b1", "Demo", 9, "DEC");
      if (corrupt_main)
        s.emit(json{{"subject", "memcpy"}, {"event", "data"}, {"session", "ghost"},
                    {"index", 1}},
               Bytes("?"));
      return json();
    }
    if (name == "launchAll")
      return json::array({101, 102});
    return json();
  };
  dev.by_name["pkd"] = [](const std::string& name, const json& args, FakeScript&) -> json {
    if (name == "jetsam")
      return args.at(0).get<uint32_t>() == 101 ? 0 : 1;
    return json();
  };
  dev.by_pid[101] = [](const std::string& name, const json&, FakeScript& s) -> json {
    if (name == "dump")
      send_file(s, "p1", "PlugIns/Share.appex/Share", "plugin-bytes");
    return json();
  };
  dev.by_pid[102] = [](const std::string&, const json&, FakeScript&) -> json { return json(); };
  return dev;
}

DumpConfig make_config(const std::filesystem::path& out) {
  DumpConfig cfg;
  cfg.app = "com.example.demo";
  cfg.output = out.string();
  cfg.agent_source = "/* agent */";
  cfg.cmod_source = "int x;";
  return cfg;
}

int test_full_run(const std::filesystem::path& out) {
  FakeDevice dev = make_device(false);
  SessionOrchestrator orch(dev, make_config(out));
  auto parent = orch.run();

  HAUL_EXPECT(orch.state() == DumpState::Done);
  HAUL_EXPECT(parent == out / "com.example.demo" / "Payload");
  auto app = parent / "Demo.app";
  HAUL_EXPECT(orch.working_dir() == app);
  HAUL_EXPECT(ReadFile(app / "Demo") == Bytes("ENCRYPTEDDECx"));
  HAUL_EXPECT(ReadFile(app / "PlugIns/Share.appex/Share") == Bytes("plugin-bytes"));

  // main: prepare, dump, launchAll in order; bypass scoped to the main pid.
  auto primary = dev.records.at("com.example.demo");
  HAUL_EXPECT((primary->calls == std::vector<std::string>{"base", "prepare", "dump", "launchAll"}));
  HAUL_EXPECT(primary->loaded && primary->unloaded && primary->detached);
  HAUL_EXPECT(primary->acks() == 4);

  auto pkd = dev.records.at("pkd");
  HAUL_EXPECT((pkd->calls ==
               std::vector<std::string>{"skipPkdValidationFor", "jetsam", "jetsam"}));
  HAUL_EXPECT(pkd->unloaded && pkd->detached);

  HAUL_EXPECT(orch.children().size() == 2);
  HAUL_EXPECT(orch.children()[0].pid == 101 && orch.children()[0].dumped);
  HAUL_EXPECT(orch.children()[1].pid == 102 && !orch.children()[1].dumped);
  HAUL_EXPECT(orch.children()[1].error == ErrorKind::ChildBypassFailed);

  auto child = dev.records.at("101");
  HAUL_EXPECT(child->unloaded && child->detached);
  HAUL_EXPECT(child->acks() == 2);
  HAUL_EXPECT(dev.records.count("102") == 0);
  HAUL_EXPECT((dev.killed == std::vector<uint32_t>{101}));
  HAUL_EXPECT((dev.attached ==
               std::vector<std::string>{"com.example.demo", "pkd", "101"}));
  return 0;
}

int test_destination_exists(const std::filesystem::path& out) {
  // out already holds the previous run's Payload directory.
  FakeDevice dev = make_device(false);
  SessionOrchestrator orch(dev, make_config(out));
  bool threw = false;
  try {
    orch.run();
  } catch (const Error& e) {
    threw = e.kind == ErrorKind::DestinationExists;
  }
  HAUL_EXPECT(threw);
  HAUL_EXPECT(orch.state() == DumpState::Aborted);
  HAUL_EXPECT(dev.attached.empty());

  DumpConfig cfg = make_config(out);
  cfg.override_existing = true;
  FakeDevice dev2 = make_device(false);
  SessionOrchestrator again(dev2, cfg);
  again.run();
  HAUL_EXPECT(again.state() == DumpState::Done);
  return 0;
}

int test_protocol_failure_aborts(const std::filesystem::path& out) {
  FakeDevice dev = make_device(true);
  SessionOrchestrator orch(dev, make_config(out));
  bool threw = false;
  try {
    orch.run();
  } catch (const Error& e) {
    threw = e.kind == ErrorKind::UnknownSession;
  }
  HAUL_EXPECT(threw);
  HAUL_EXPECT(orch.state() == DumpState::Aborted);
  auto primary = dev.records.at("com.example.demo");
  HAUL_EXPECT(primary->detached);
  HAUL_EXPECT(dev.records.count("pkd") == 0);
  HAUL_EXPECT(orch.children().empty());
  return 0;
}

int test_launch_failure_is_not_fatal(const std::filesystem::path& out) {
  FakeDevice dev = make_device(false);
  auto inner = dev.by_name["com.example.demo"];
  dev.by_name["com.example.demo"] = [inner](const std::string& name, const json& args,
                                            FakeScript& s) -> json {
    if (name == "launchAll")
      throw Error(ErrorKind::Remote, "launchAll: no extensions host");
    return inner(name, args, s);
  };
  SessionOrchestrator orch(dev, make_config(out));
  orch.run();
  HAUL_EXPECT(orch.state() == DumpState::Done);
  HAUL_EXPECT(orch.children().empty());
  HAUL_EXPECT(dev.records.at("pkd")->detached);
  return 0;
}

int test_cleanup_after_main_died(const std::filesystem::path& out) {
  FakeDevice dev = make_device(false);
  auto inner = dev.by_name["com.example.demo"];
  dev.by_name["com.example.demo"] = [inner](const std::string& name, const json& args,
                                            FakeScript& s) -> json {
    if (name == "launchAll") {
      // The app went away while its extensions were being started.
      s.rec->detached = true;
      return json::array();
    }
    return inner(name, args, s);
  };
  SessionOrchestrator orch(dev, make_config(out));
  auto parent = orch.run();

  HAUL_EXPECT(orch.state() == DumpState::Done);
  HAUL_EXPECT(ReadFile(parent / "Demo.app" / "Demo") == Bytes("ENCRYPTEDDECx"));
  auto primary = dev.records.at("com.example.demo");
  HAUL_EXPECT(!primary->unloaded);
  auto pkd = dev.records.at("pkd");
  HAUL_EXPECT(pkd->unloaded && pkd->detached);
  return 0;
}

int test_child_failures_continue(const std::filesystem::path& out) {
  FakeDevice dev = make_device(false);
  auto inner = dev.by_name["com.example.demo"];
  dev.by_name["com.example.demo"] = [inner](const std::string& name, const json& args,
                                            FakeScript& s) -> json {
    if (name == "launchAll")
      return json::array({101, 102, 103});
    return inner(name, args, s);
  };
  dev.by_name["pkd"] = [](const std::string&, const json&, FakeScript&) -> json { return 0; };
  dev.by_pid[101] = [](const std::string& name, const json&, FakeScript&) -> json {
    if (name == "prepare")
      throw Error(ErrorKind::Remote, "prepare: dlopen failed");
    return json();
  };
  dev.by_pid[102] = [](const std::string& name, const json&, FakeScript& s) -> json {
    if (name == "dump")
      s.emit(json{{"subject", "memcpy"}, {"event", "data"}, {"session", "ghost"}, {"index", 1}},
             Bytes("?"));
    return json();
  };
  dev.by_pid[103] = [](const std::string& name, const json&, FakeScript& s) -> json {
    if (name == "dump")
      send_file(s, "p3", "PlugIns/Widget.appex/Widget", "widget-bytes");
    return json();
  };

  SessionOrchestrator orch(dev, make_config(out));
  auto parent = orch.run();

  HAUL_EXPECT(orch.state() == DumpState::Done);
  HAUL_EXPECT(orch.children().size() == 3);
  HAUL_EXPECT(!orch.children()[0].dumped);
  HAUL_EXPECT(orch.children()[0].error == ErrorKind::Remote);
  HAUL_EXPECT(!orch.children()[1].dumped);
  HAUL_EXPECT(orch.children()[1].error == ErrorKind::UnknownSession);
  HAUL_EXPECT(orch.children()[2].dumped);

  auto first = dev.records.at("101");
  HAUL_EXPECT(first->unloaded && first->detached);
  HAUL_EXPECT((first->calls == std::vector<std::string>{"prepare"}));
  auto second = dev.records.at("102");
  HAUL_EXPECT(second->detached && !second->unloaded);
  HAUL_EXPECT(second->detach_calls >= 1);
  auto third = dev.records.at("103");
  HAUL_EXPECT(third->unloaded && third->detached);

  HAUL_EXPECT((dev.killed == std::vector<uint32_t>{101, 102, 103}));
  HAUL_EXPECT(ReadFile(parent / "Demo.app" / "PlugIns/Widget.appex/Widget") ==
              Bytes("widget-bytes"));
  return 0;
}

int test_detach_reporting() {
  using haul::DetachReason;
  using haul::DetachSeverity;
  HAUL_EXPECT(haul::detach_severity(DetachReason::ApplicationRequested) == DetachSeverity::Silent);
  HAUL_EXPECT(haul::detach_severity(DetachReason::ServerTerminated) == DetachSeverity::ReasonOnly);
  HAUL_EXPECT(haul::detach_severity(DetachReason::ProcessTerminated) ==
              DetachSeverity::WithCrashReport);
  HAUL_EXPECT(haul::detach_severity(DetachReason::DeviceLost) == DetachSeverity::WithCrashReport);

  json crash{{"summary", "EXC_BAD_ACCESS"}, {"pid", 7}};
  HAUL_EXPECT(SessionOrchestrator::log_detached("t", DetachReason::ApplicationRequested, crash) == 0);
  HAUL_EXPECT(SessionOrchestrator::log_detached("t", DetachReason::ServerTerminated, crash) == 2);
  HAUL_EXPECT(SessionOrchestrator::log_detached("t", DetachReason::ProcessTerminated, crash) == 4);
  HAUL_EXPECT(SessionOrchestrator::log_detached("t", DetachReason::DeviceLost, json()) == 2);
  return 0;
}

}  // namespace

int main() {
  haul_test::TempDir dir("haul_orchestrator_");

  if (int rc = test_full_run(dir.path() / "a"))
    return rc;
  if (int rc = test_destination_exists(dir.path() / "a"))
    return rc;
  if (int rc = test_protocol_failure_aborts(dir.path() / "b"))
    return rc;
  if (int rc = test_launch_failure_is_not_fatal(dir.path() / "c"))
    return rc;

  if (int rc = test_cleanup_after_main_died(dir.path() / "d"))
    return rc;
  if (int rc = test_child_failures_continue(dir.path() / "e"))
    return rc;
  if (int rc = test_detach_reporting())
    return rc;

  std::cout << "orchestrator ok\n";
  return 0;
}
