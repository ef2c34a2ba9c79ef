// Repository: Whipcast
// Component: whipcastd Entry Point
// Purpose: Loads the publish configuration, wires the session controller to
//          its production collaborators and serves PublishControl over gRPC.
// Copyright (c) 2025 Whipcast

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

#include <grpcpp/grpcpp.h>
#include <rtc/rtc.hpp>

#include "service/PublishControlService.hpp"
#include "whipcast/api/DaydreamApiClient.hpp"
#include "whipcast/capture/FFmpegCaptureDevices.hpp"
#include "whipcast/runtime/EventLoop.hpp"
#include "whipcast/runtime/IoWorker.hpp"
#include "whipcast/session/DeviceProfile.hpp"
#include "whipcast/session/PublishConfig.hpp"
#include "whipcast/session/PublishSessionController.hpp"
#include "whipcast/util/Logger.hpp"
#include "whipcast/whip/HttpWhipTransport.hpp"
#include "whipcast/whip/RtcPeerConnection.hpp"

namespace {

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

// =============================================================================
// CLI Arguments
// =============================================================================
struct CliArgs {
  std::string config_path;
  std::string bind_address = "127.0.0.1";
  int port = 50061;
  std::string api_base_url;  // empty keeps the config value

  // Device profile
  bool touch = false;
  std::string user_agent;
  bool always_on = false;

  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Publishes a composited camera/media feed to a realtime diffusion\n"
            << "pipeline over WHIP and exposes the PublishControl gRPC API.\n"
            << "\n"
            << "OPTIONS:\n"
            << "  --config PATH        JSON publish configuration (default: built-in)\n"
            << "  --bind ADDRESS       gRPC listen address (default: 127.0.0.1)\n"
            << "  --port N             gRPC listen port (default: 50061)\n"
            << "  --api-base URL       Override the session API base URL\n"
            << "\n"
            << "DEVICE PROFILE:\n"
            << "  --touch              Report a touch-capable device\n"
            << "  --user-agent STRING  User agent used for mobile detection\n"
            << "  --always-on          Keep publishing while hidden\n"
            << "\n"
            << "  --help               Show this help message\n"
            << "\n"
            << "ENVIRONMENT:\n"
            << "  WHIPCAST_API_KEY     Bearer token for the session API (required)\n"
            << "  WHIPCAST_DEBUG       Enable debug logging\n"
            << "\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--config" && i + 1 < argc) {
      args.config_path = argv[++i];
    } else if (arg == "--bind" && i + 1 < argc) {
      args.bind_address = argv[++i];
    } else if (arg == "--port" && i + 1 < argc) {
      try {
        args.port = std::stoi(argv[++i]);
      } catch (const std::exception&) {
        args.error = "Invalid port: " + std::string(argv[i]);
        return args;
      }
    } else if (arg == "--api-base" && i + 1 < argc) {
      args.api_base_url = argv[++i];
    } else if (arg == "--touch") {
      args.touch = true;
    } else if (arg == "--user-agent" && i + 1 < argc) {
      args.user_agent = argv[++i];
    } else if (arg == "--always-on") {
      args.always_on = true;
    } else {
      args.error = "Unknown or incomplete argument: " + arg;
      return args;
    }
  }

  if (args.port <= 0 || args.port > 65535) {
    args.error = "Port out of range: " + std::to_string(args.port);
    return args;
  }

  args.valid = true;
  return args;
}

bool LoadConfig(const std::string& path, whipcast::session::PublishConfig& out,
                std::string& error) {
  if (path.empty()) return true;
  std::ifstream file(path);
  if (!file) {
    error = "Cannot open config file: " + path;
    return false;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  try {
    out = whipcast::session::ParsePublishConfig(buffer.str());
  } catch (const std::exception& e) {
    error = path + ": " + e.what();
    return false;
  }
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace whipcast;

  CliArgs args = ParseArgs(argc, argv);
  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 1;
  }

  session::PublishConfig config;
  std::string error;
  if (!LoadConfig(args.config_path, config, error)) {
    util::Logger::Error("[whipcastd] " + error);
    return 1;
  }
  if (!args.api_base_url.empty()) config.api_base_url = args.api_base_url;
  error = config.Validate();
  if (!error.empty()) {
    util::Logger::Error("[whipcastd] Invalid configuration: " + error);
    return 1;
  }

  const char* api_key = std::getenv("WHIPCAST_API_KEY");
  if (api_key == nullptr || *api_key == '\0') {
    util::Logger::Error("[whipcastd] WHIPCAST_API_KEY is not set");
    return 1;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  rtc::InitLogger(util::Logger::DebugEnabled() ? rtc::LogLevel::Debug
                                               : rtc::LogLevel::Warning);

  session::DeviceProfile profile;
  profile.has_touch = args.touch;
  profile.user_agent = args.user_agent;
  profile.always_on = args.always_on;

  runtime::EventLoop loop;
  runtime::IoWorker api_worker("http-api");
  runtime::IoWorker whip_worker("whip");

  capture::FFmpegCaptureDevices devices(config.devices);

  api::ApiConfig api_config;
  api_config.base_url = config.api_base_url;
  api_config.api_key = api_key;
  api::DaydreamApiClient api_client(api_worker, loop, api_config);

  whip::HttpWhipTransportConfig whip_config;
  whip_config.playback_url_header = config.playback_url_header;
  whip::HttpWhipTransport whip_transport(whip_worker, loop, whip_config);

  whip::RtcPeerConnectionFactory peer_factory(loop);

  session::PublishSessionController controller(loop, api_client, peer_factory, whip_transport,
                                               devices, config, profile);
  // Registers the controller callbacks; must precede loop.Start().
  service::PublishControlImpl service(loop, controller, devices);

  api_worker.Start();
  whip_worker.Start();
  loop.Start();

  const std::string server_address = args.bind_address + ":" + std::to_string(args.port);
  grpc::ServerBuilder builder;
  builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
  if (!server) {
    util::Logger::Error("[whipcastd] Failed to listen on " + server_address);
    loop.Stop();
    whip_worker.Stop();
    api_worker.Stop();
    return 1;
  }

  std::ostringstream banner;
  banner << "[whipcastd] PublishControl listening on " << server_address
         << " (pipeline=" << config.pipeline_id << ", size=" << config.compositor.size
         << ", fps=" << config.fps << ")";
  util::Logger::Info(banner.str());

  while (!g_termination_requested.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  util::Logger::Info("[whipcastd] Shutting down");
  service.Shutdown();
  server->Shutdown();
  if (!loop.RunSync([&controller]() { controller.Stop(); })) {
    util::Logger::Warn("[whipcastd] Event loop stopped before session teardown");
  }
  loop.Stop();
  whip_worker.Stop();
  api_worker.Stop();
  return 0;
}
