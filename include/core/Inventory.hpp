#pragma once
/** @file  Inventory.hpp
 *  @brief Thread-safe in-memory DeviceDirectory, optionally seeded from JSON.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <map>
#include <mutex>
#include <set>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "core/DeviceDirectory.hpp"

namespace poegate {
  namespace core {

    struct SwitchRecord {
      std::string switchId;
      std::string switchType;
      std::string ipAddress;
      std::string password;
    };

    /**
 * @class Inventory
 * @brief Lock-protected switch/device tables plus the active paging set.
 *
 *  * R/W from multiple threads (config reload vs. coordinator reads).
 *  * `load()` replaces everything; the setters patch single records.
 */
    class Inventory : public DeviceDirectory {
    public:
      Inventory() = default;
      ~Inventory() override = default;

      /// Replace all tables from `{switches:[], devices:[], activePagingDevices:[]}`.
      /// Throws `std::runtime_error` on malformed entries.
      void load(const nlohmann::json& root);

      void upsertSwitch(const SwitchRecord& sw);
      void upsertDevice(const DeviceLinkage& device);
      bool removeDevice(const std::string& deviceId);
      bool setDeviceMode(const std::string& deviceId, DeviceMode mode);
      void setActivePagingDevices(std::set<std::string> ids);

      //---DeviceDirectory---------------------------------------------
      std::optional<DeviceTarget>
      resolveDeviceSwitchPort(const std::string& deviceId) const override;
      std::vector<DeviceLinkage> linkages() const override;
      std::vector<std::string> activePagingDeviceIds() const override;

      std::optional<SwitchRecord> findSwitch(const std::string& switchId) const;

    private:
      mutable std::mutex mtx_;
      std::map<std::string, SwitchRecord> switches_;
      std::map<std::string, DeviceLinkage> devices_;
      std::set<std::string> activePaging_;
    };

    /// "auto" | "always_on" | "always_off"; throws std::runtime_error otherwise.
    DeviceMode parseDeviceMode(const std::string& text);

  } // namespace core
} // namespace poegate
