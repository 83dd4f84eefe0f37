#pragma once
/** @file  DeviceDirectory.hpp
 *  @brief Read-only view of the device inventory the control core consumes.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "protocols/PortCommand.hpp"

namespace poegate {
  namespace core {

    enum class DeviceMode { Auto, AlwaysOn, AlwaysOff };

    inline const char* toString(DeviceMode m) {
      switch (m) {
      case DeviceMode::Auto:
        return "auto";
      case DeviceMode::AlwaysOn:
        return "always_on";
      case DeviceMode::AlwaysOff:
        return "always_off";
      default:
        return "unknown";
      }
    }

    /** PoE device as the inventory knows it. */
    struct DeviceLinkage {
      std::string deviceId;
      std::string name;
      std::string switchId;
      int portNumber{ 0 };
      DeviceMode mode{ DeviceMode::Auto };
      std::set<std::string> linkedPagingDeviceIds{};
    };

    /** Everything needed to reach the port a device hangs off. */
    struct DeviceTarget {
      std::string switchId;
      std::string switchType;
      protocols::SwitchCredentials credentials;
      int portNumber{ 0 };
    };

    /**
 * @class DeviceDirectory
 * @brief Inventory seam: device -> switch/port resolution, linkages, active pagers.
 *
 *  * Implementations must be safe to call from several threads.
 */
    class DeviceDirectory {
    public:
      virtual ~DeviceDirectory() = default;

      /// std::nullopt when the device or its switch is unknown.
      virtual std::optional<DeviceTarget>
      resolveDeviceSwitchPort(const std::string& deviceId) const = 0;

      virtual std::vector<DeviceLinkage> linkages() const = 0;

      /// Currently selected devices that are paging sources.
      virtual std::vector<std::string> activePagingDeviceIds() const = 0;
    };

  } // namespace core
} // namespace poegate
