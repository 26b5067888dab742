#include "device_bridge.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "orchestrator.hpp"
#include "util.hpp"
#include <asio.hpp>
#include <algorithm>
#include <cstdio>
#include <iostream>
#include <vector>

using namespace haul;

static void usage() {
  std::cerr
      << "usage: haul [options] [bundle id or name]\n"
         "  -l, --list              list apps\n"
         "  -u, --uuid <uuid>       uuid of USB device\n"
         "  -H, --host <host>       hostname of a network device\n"
         "  -o, --output <output>   output directory (default: dump)\n"
         "  -f, --override          override existing\n"
         "      --bridge <h:p>      device bridge (default: 127.0.0.1:27042)\n"
         "      --agent <path>      agent script (default: agent/agent.js)\n"
         "      --cmod <path>       C module source (default: agent/source.c)\n"
         "  -v, --verbose           log transfer progress\n";
}

static void print_apps(const std::vector<Application> &apps) {
  size_t w_id = 10, w_name = 4;
  for (const auto &a : apps) {
    w_id = std::max(w_id, a.identifier.size());
    w_name = std::max(w_name, a.name.size());
  }
  std::printf("%-*s  %-*s  %s\n", (int)w_id, "identifier", (int)w_name, "name",
              "pid");
  for (const auto &a : apps) {
    std::printf("%-*s  %-*s  %s\n", (int)w_id, a.identifier.c_str(),
                (int)w_name, a.name.c_str(),
                a.pid ? std::to_string(a.pid).c_str() : "-");
  }
}

static int run(int argc, char **argv) {
  std::string bridge = "127.0.0.1:27042";
  std::string agent_path = "agent/agent.js";
  std::string cmod_path = "agent/source.c";
  bool list = false;
  BridgeConfig bcfg;
  DumpConfig dcfg;
  std::vector<std::string> args;

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](int &i) -> std::string {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      throw Error(ErrorKind::Config, "missing value for " + a);
    };
    if (a == "-l" || a == "--list")
      list = true;
    else if (a == "-u" || a == "--uuid")
      bcfg.uuid = next(i);
    else if (a == "-H" || a == "--host")
      bcfg.remote_host = next(i);
    else if (a == "-o" || a == "--output")
      dcfg.output = next(i);
    else if (a == "-f" || a == "--override")
      dcfg.override_existing = true;
    else if (a == "--bridge")
      bridge = next(i);
    else if (a == "--agent")
      agent_path = next(i);
    else if (a == "--cmod")
      cmod_path = next(i);
    else if (a == "-v" || a == "--verbose")
      Logger::instance().set_level(LogLevel::DEBUG);
    else if (a == "--help") {
      usage();
      return 0;
    } else if (!a.empty() && a[0] == '-')
      throw Error(ErrorKind::Config, "unknown option " + a);
    else
      args.push_back(a);
  }

  if (!bcfg.uuid.empty() && !bcfg.remote_host.empty())
    throw Error(ErrorKind::Config, "Use either uuid or host");
  if (args.size() > 1)
    throw Error(ErrorKind::Config,
                "For stability, only decrypt one app at a time");
  if (list && !args.empty())
    throw Error(ErrorKind::Config, "Invalid command");
  if (!list && args.empty()) {
    usage();
    return 1;
  }
  if (!parse_host_port(bridge, bcfg.bridge_host, bcfg.bridge_port))
    throw Error(ErrorKind::Config, "bad bridge address " + bridge);

  asio::io_context io;
  DeviceBridge device(io, bcfg);
  device.connect();

  if (list) {
    print_apps(device.enumerate_applications());
    return 0;
  }

  dcfg.app = args[0];
  dcfg.agent_source = read_text_file(agent_path);
  dcfg.cmod_source = read_text_file(cmod_path);

  SessionOrchestrator orchestrator(device, dcfg);
  orchestrator.run();

  std::cout
      << "\nFor now, this tool only fetches decrypted executable binaries "
         "without other resources.\n"
         "To make a full reinstallable *.ipa, you need to manually fetch "
         "those files (e.g. via SSH).\n";
  return 0;
}

int main(int argc, char **argv) {
  try {
    return run(argc, argv);
  } catch (const Error &e) {
    Logger::instance().log(LogLevel::ERROR, "FATAL ERROR (%s): %s",
                           error_kind_name(e.kind), e.what());
  } catch (const std::exception &e) {
    Logger::instance().log(LogLevel::ERROR, "FATAL ERROR: %s", e.what());
  }
  return 1;
}
