/* @file main.cpp
 * @brief poegate CLI - drives PoE switches from a JSON inventory/config file
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

// poegate headers
#include "core/ConfigLoader.hpp"
#include "core/ControllerRegistry.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Inventory.hpp"
#include "core/KeepAliveCoordinator.hpp"
#include "core/Logger.hpp"
#include "core/Settings.hpp"
#include "core/SwitchClientFactory.hpp"
#include "core/ToggleOrchestrator.hpp"
#include "io/BeastHttpTransport.hpp"

#include <nlohmann/json.hpp>

using namespace poegate;

namespace {

  void usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " --config <file.json> <command> [args]\n"
              << "commands:\n"
              << "  status <switchId>                         list port power states\n"
              << "  test <switchId>                           probe the login page\n"
              << "  toggle <deviceId> on|off                  one device\n"
              << "  bulk on|off [--parallel] [--delay <ms>] <deviceId>...\n"
              << "  clear-sessions                            log out of every switch\n"
              << "  keepalive-demo                            enable, countdown off, force off\n";
  }

  bool parseOnOff(const std::string& s, bool& out) {
    if (s == "on") {
      out = true;
      return true;
    }
    if (s == "off") {
      out = false;
      return true;
    }
    return false;
  }

  struct App {
    std::shared_ptr<core::Logger> logger;
    std::shared_ptr<core::ErrorMonitor> errorMonitor;
    std::shared_ptr<core::Inventory> inventory;
    std::shared_ptr<core::ControllerRegistry> registry;
    std::shared_ptr<core::ToggleOrchestrator> orchestrator;
    core::Settings settings;
  };

  App buildApp(const std::string& configPath) {
    App app;
    const auto root = core::ConfigLoader(configPath).load();
    app.settings = core::Settings::fromJson(root);

    app.logger = std::make_shared<core::Logger>();
    app.logger->addSink([](const core::LogEvent& ev) {
      std::cerr << '[' << ev.source << "] " << core::toString(ev.level) << ": " << ev.message
                << '\n';
    });
    app.logger->startNewRun(app.settings.logFile);

    app.errorMonitor = std::make_shared<core::ErrorMonitor>();
    app.errorMonitor->registerEscalation([logger = app.logger](const std::string& msg) {
      logger->error("Escalation", msg);
    });

    app.inventory = std::make_shared<core::Inventory>();
    app.inventory->load(root);

    auto transport = std::make_shared<io::BeastHttpTransport>();
    app.registry = std::make_shared<core::ControllerRegistry>(
        core::SwitchClientFactory::withBuiltins(transport, app.logger,
                                                app.settings.sessionTiming()),
        app.logger);
    app.orchestrator =
        std::make_shared<core::ToggleOrchestrator>(app.registry, app.inventory, app.logger);
    return app;
  }

  std::shared_ptr<core::SwitchClient> clientFor(App& app, const std::string& switchId) {
    auto sw = app.inventory->findSwitch(switchId);
    if (!sw)
      throw std::runtime_error("unknown switch: " + switchId);
    return app.registry->getOrCreate(sw->switchType, { sw->ipAddress, sw->password });
  }

  int runStatus(App& app, const std::vector<std::string>& args) {
    if (args.size() != 1)
      return 2;
    for (const auto& s : clientFor(app, args[0])->getPortStatuses())
      std::cout << "port " << s.port << ": " << (s.enabled ? "on" : "off") << '\n';
    return 0;
  }

  int runTest(App& app, const std::vector<std::string>& args) {
    if (args.size() != 1)
      return 2;
    const bool ok = clientFor(app, args[0])->testConnection();
    std::cout << args[0] << ": " << (ok ? "reachable" : "unreachable") << '\n';
    return ok ? 0 : 1;
  }

  int runToggle(App& app, const std::vector<std::string>& args) {
    bool enabled = false;
    if (args.size() != 2 || !parseOnOff(args[1], enabled))
      return 2;
    app.orchestrator->toggleSingle(args[0], enabled);
    std::cout << args[0] << ": " << args[1] << '\n';
    return 0;
  }

  int runBulk(App& app, const std::vector<std::string>& args) {
    bool enabled = false;
    if (args.empty() || !parseOnOff(args[0], enabled))
      return 2;

    auto mode = app.settings.parallelMode ? core::ExecutionMode::Parallel
                                          : core::ExecutionMode::Sequential;
    auto delay = app.settings.toggleDelay;
    std::vector<core::DeviceToggle> devices;
    for (std::size_t i = 1; i < args.size(); ++i) {
      if (args[i] == "--parallel") {
        mode = core::ExecutionMode::Parallel;
      } else if (args[i] == "--delay" && i + 1 < args.size()) {
        delay = std::chrono::milliseconds{ std::stol(args[++i]) };
      } else {
        devices.push_back({ args[i], enabled });
      }
    }
    if (devices.empty())
      return 2;

    int failed = 0;
    for (const auto& r : app.orchestrator->toggleBulk(devices, mode, delay)) {
      std::cout << r.deviceId << ": " << (r.success ? "ok" : "FAILED");
      if (r.error)
        std::cout << " (" << *r.error << ')';
      std::cout << '\n';
      failed += r.success ? 0 : 1;
    }
    return failed == 0 ? 0 : 1;
  }

  int runKeepAliveDemo(App& app) {
    core::KeepAliveCoordinator coordinator(app.orchestrator, app.inventory, app.errorMonitor,
                                           app.logger, app.settings.keepAliveOptions());
    coordinator.registerTickCallback([](std::uint32_t remaining) {
      std::cout << "\rOFF in " << core::formatCountdown(remaining) << "   " << std::flush;
    });

    coordinator.enable();
    coordinator.enable(); // coalesced: timer reset only
    coordinator.disable();
    while (coordinator.countdownRemaining())
      std::this_thread::sleep_for(std::chrono::milliseconds{ 100 });
    std::cout << '\n';

    coordinator.disable(true);
    app.orchestrator->clearAllSessions();
    return 0;
  }

} // namespace

int main(int argc, char** argv) {
  std::string configPath;
  std::vector<std::string> rest;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc)
      configPath = argv[++i];
    else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
      usage(argv[0]);
      return 0;
    } else
      rest.emplace_back(argv[i]);
  }
  if (configPath.empty() || rest.empty()) {
    usage(argv[0]);
    return 2;
  }

  const std::string command = rest.front();
  const std::vector<std::string> args(rest.begin() + 1, rest.end());

  try {
    App app = buildApp(configPath);
    int rc = 2;
    if (command == "status")
      rc = runStatus(app, args);
    else if (command == "test")
      rc = runTest(app, args);
    else if (command == "toggle")
      rc = runToggle(app, args);
    else if (command == "bulk")
      rc = runBulk(app, args);
    else if (command == "clear-sessions") {
      app.orchestrator->clearAllSessions();
      rc = 0;
    } else if (command == "keepalive-demo")
      rc = runKeepAliveDemo(app);

    if (rc == 2)
      usage(argv[0]);
    app.logger->finishRun();
    return rc;
  } catch (const std::exception& e) {
    std::cerr << "poegate: " << e.what() << '\n';
    return 1;
  }
}
