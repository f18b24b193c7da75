// Repository: LiveWatch
// Component: livewatchd
// Purpose: Daemon entry point: loads settings and the channel store, runs
//          the monitor engine and serves MonitorControl over gRPC.
// Copyright (c) 2026 LiveWatch

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <grpcpp/grpcpp.h>

#include "control/monitor_service.h"
#include "io/GrpcStreamRecorder.hpp"
#include "io/GrpcStreamResolver.hpp"
#include "livewatch/config/MonitorConfig.hpp"
#include "livewatch/io/LoggingNotifier.hpp"
#include "livewatch/io/StatvfsDiskSpaceGuard.hpp"
#include "livewatch/persist/ChannelStore.hpp"
#include "livewatch/runtime/MonitorEngine.hpp"
#include "livewatch/util/Logger.hpp"
#include "time/SystemTimeSource.hpp"

namespace {

using livewatch::util::LogError;
using livewatch::util::LogInfo;
using livewatch::util::Logger;

std::atomic<bool> g_stop_requested{false};

void HandleSignal(int) {
  g_stop_requested.store(true);
}

struct CliArgs {
  std::string config_path;
  std::string store_path;
  std::string listen_address;
  std::string resolver_address;
  std::string recorder_address;
  std::string log_level;
  bool no_startup_check = false;
  bool help = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Adaptive live-stream monitor daemon.\n"
            << "\n"
            << "  --config PATH        Settings file (key=value lines)\n"
            << "  --store PATH         Channel store file (default: channels.pb)\n"
            << "  --listen ADDR        MonitorControl listen address (default: 127.0.0.1:50071)\n"
            << "  --resolver ADDR      StreamResolver service address (required)\n"
            << "  --recorder ADDR      StreamRecorder service address (required)\n"
            << "  --no-startup-check   Wait one heartbeat before the first cycle\n"
            << "  --log-level LEVEL    debug, info, warn or error (default: info,\n"
            << "                       or LIVEWATCH_LOG_LEVEL)\n"
            << "  --help, -h           Show this help\n"
            << "\n"
            << "Command-line values override the settings file.\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      args.help = true;
      return args;
    } else if (arg == "--config" && i + 1 < argc) {
      args.config_path = argv[++i];
    } else if (arg == "--store" && i + 1 < argc) {
      args.store_path = argv[++i];
    } else if (arg == "--listen" && i + 1 < argc) {
      args.listen_address = argv[++i];
    } else if (arg == "--resolver" && i + 1 < argc) {
      args.resolver_address = argv[++i];
    } else if (arg == "--recorder" && i + 1 < argc) {
      args.recorder_address = argv[++i];
    } else if (arg == "--log-level" && i + 1 < argc) {
      args.log_level = argv[++i];
    } else if (arg == "--no-startup-check") {
      args.no_startup_check = true;
    } else {
      args.error = "Unknown or incomplete argument: " + arg;
      return args;
    }
  }
  return args;
}

livewatch::config::MonitorConfig BuildConfig(const CliArgs& args) {
  livewatch::config::MonitorConfig config;
  if (!args.config_path.empty()) config.LoadFile(args.config_path);
  if (!args.store_path.empty()) config.store_path = args.store_path;
  if (!args.listen_address.empty()) config.listen_address = args.listen_address;
  if (!args.resolver_address.empty()) config.resolver_address = args.resolver_address;
  if (!args.recorder_address.empty()) config.recorder_address = args.recorder_address;
  if (args.no_startup_check) config.check_on_startup = false;
  config.Validate();
  if (config.resolver_address.empty() || config.recorder_address.empty()) {
    throw std::invalid_argument("resolver and recorder addresses are required");
  }
  return config;
}

}  // namespace

int main(int argc, char* argv[]) {
  const CliArgs args = ParseArgs(argc, argv);
  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }
  if (!args.error.empty()) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 2;
  }

  livewatch::config::MonitorConfig config;
  try {
    if (!args.log_level.empty()) {
      Logger::SetThreshold(livewatch::util::ParseLogLevel(args.log_level));
    }
    config = BuildConfig(args);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 2;
  }

  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  livewatch::runtime::EngineDependencies deps;
  deps.resolver = std::make_shared<livewatch::io::GrpcStreamResolver>(config.resolver_address);
  deps.recorder = std::make_shared<livewatch::io::GrpcStreamRecorder>(config.recorder_address);
  deps.notifier = std::make_shared<livewatch::io::LoggingNotifier>();
  deps.disk_guard = std::make_shared<livewatch::io::StatvfsDiskSpaceGuard>();
  deps.store = std::make_shared<livewatch::persist::ChannelStore>(config.store_path);
  deps.time_source = std::make_shared<livewatch::SystemTimeSource>();
  deps.wait = std::make_shared<livewatch::runtime::RealtimeWaitStrategy>();

  std::shared_ptr<livewatch::runtime::MonitorEngine> engine;
  try {
    engine = std::make_shared<livewatch::runtime::MonitorEngine>(config, deps);
    engine->LoadChannels();
  } catch (const std::exception& e) {
    LogError("livewatchd", "STARTUP_FAILED").Field("error", e.what());
    return 1;
  }

  livewatch::control::MonitorControlImpl service(engine);
  grpc::ServerBuilder builder;
  builder.AddListeningPort(config.listen_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server = builder.BuildAndStart();
  if (!server) {
    LogError("livewatchd", "LISTEN_FAILED").Field("address", config.listen_address);
    engine->Stop();
    return 1;
  }
  LogInfo("livewatchd", "LISTENING").Field("address", config.listen_address);

  engine->Start();

  while (!g_stop_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  LogInfo("livewatchd", "SHUTDOWN_REQUESTED");
  service.Shutdown();
  server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(2));
  engine->Stop();
  LogInfo("livewatchd", "EXITED");
  return 0;
}
