#pragma once
/** @file  ToggleOrchestrator.hpp
 *  @brief Device-level toggles: resolve, group per switch, dispatch, collect.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace poegate {
  namespace core {

    class ControllerRegistry;
    class DeviceDirectory;
    class Logger;
    struct DeviceTarget;

    enum class ExecutionMode { Parallel, Sequential };

    inline const char* toString(ExecutionMode m) {
      return m == ExecutionMode::Parallel ? "parallel" : "sequential";
    }

    struct DeviceToggle {
      std::string deviceId;
      bool enabled{ false };
    };

    struct DeviceToggleResult {
      std::string deviceId;
      bool success{ false };
      std::optional<std::string> error{};
    };

    /**
 * @class ToggleOrchestrator
 * @brief Turns `{deviceId, enabled}` lists into per-switch client calls.
 *
 *  * Switch groups run concurrently and independently of each other.
 *  * A failing group only fails its own devices.
 *  * No persistence: callers record new device state from the results.
 */
    class ToggleOrchestrator {
    public:
      ToggleOrchestrator(std::shared_ptr<ControllerRegistry> registry,
                         std::shared_ptr<const DeviceDirectory> directory,
                         std::shared_ptr<Logger> logger = nullptr);
      virtual ~ToggleOrchestrator() = default;

      /** @throws UnknownDeviceError, InvalidPortError, or the client's PoeError. */
      virtual void toggleSingle(const std::string& deviceId, bool enabled);

      /// Unknown devices are skipped; every other device gets exactly one result.
      virtual std::vector<DeviceToggleResult>
      toggleBulk(const std::vector<DeviceToggle>& devices, ExecutionMode mode,
                 std::chrono::milliseconds interDelay = std::chrono::milliseconds{ 0 });

      /// Best-effort logout of every cached switch session.
      virtual void clearAllSessions();

    private:
      struct Slot {
        std::string deviceId;
        int portNumber{ 0 };
        bool enabled{ false };
      };
      struct Group;

      std::vector<DeviceToggleResult> runGroup(const Group& group, ExecutionMode mode,
                                               std::chrono::milliseconds interDelay);

      std::shared_ptr<ControllerRegistry> registry_;
      std::shared_ptr<const DeviceDirectory> directory_;
      std::shared_ptr<Logger> logger_;
    };

  } // namespace core
} // namespace poegate
