/* @file Inventory.cpp
 * @brief JSON-seeded device/switch tables for the CLI and tests
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <stdexcept>

#include <nlohmann/json.hpp>

#include "core/Inventory.hpp"

using namespace poegate::core;
using nlohmann::json;

namespace {

  std::string requireString(const json& obj, const char* key, const char* what) {
    if (!obj.contains(key) || !obj.at(key).is_string())
      throw std::runtime_error(std::string("[Inventory] ") + what + " is missing string field '" +
                               key + "'");
    return obj.at(key).get<std::string>();
  }

} // namespace

DeviceMode poegate::core::parseDeviceMode(const std::string& text) {
  if (text == "auto")
    return DeviceMode::Auto;
  if (text == "always_on")
    return DeviceMode::AlwaysOn;
  if (text == "always_off")
    return DeviceMode::AlwaysOff;
  throw std::runtime_error("[Inventory] unknown device mode: " + text);
}

void Inventory::load(const json& root) {
  std::map<std::string, SwitchRecord> switches;
  std::map<std::string, DeviceLinkage> devices;
  std::set<std::string> paging;

  for (const auto& s : root.value("switches", json::array())) {
    SwitchRecord rec;
    rec.switchId = requireString(s, "id", "switch");
    rec.switchType = s.value("type", std::string("netgear_gs308ep"));
    rec.ipAddress = requireString(s, "ipAddress", "switch");
    rec.password = s.value("password", std::string());
    switches[rec.switchId] = std::move(rec);
  }

  for (const auto& d : root.value("devices", json::array())) {
    DeviceLinkage dev;
    dev.deviceId = requireString(d, "id", "device");
    dev.name = d.value("name", dev.deviceId);
    dev.switchId = requireString(d, "switchId", "device");
    if (!d.contains("portNumber") || !d.at("portNumber").is_number_integer())
      throw std::runtime_error("[Inventory] device " + dev.deviceId + " has no integer portNumber");
    dev.portNumber = d.at("portNumber").get<int>();
    dev.mode = parseDeviceMode(d.value("mode", std::string("auto")));
    for (const auto& id : d.value("linkedPagingDeviceIds", json::array()))
      dev.linkedPagingDeviceIds.insert(id.get<std::string>());
    devices[dev.deviceId] = std::move(dev);
  }

  for (const auto& id : root.value("activePagingDevices", json::array()))
    paging.insert(id.get<std::string>());

  std::lock_guard<std::mutex> lock(mtx_);
  switches_ = std::move(switches);
  devices_ = std::move(devices);
  activePaging_ = std::move(paging);
}

void Inventory::upsertSwitch(const SwitchRecord& sw) {
  std::lock_guard<std::mutex> lock(mtx_);
  switches_[sw.switchId] = sw;
}

void Inventory::upsertDevice(const DeviceLinkage& device) {
  std::lock_guard<std::mutex> lock(mtx_);
  devices_[device.deviceId] = device;
}

bool Inventory::removeDevice(const std::string& deviceId) {
  std::lock_guard<std::mutex> lock(mtx_);
  return devices_.erase(deviceId) != 0;
}

bool Inventory::setDeviceMode(const std::string& deviceId, DeviceMode mode) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = devices_.find(deviceId);
  if (it == devices_.end())
    return false;
  it->second.mode = mode;
  return true;
}

void Inventory::setActivePagingDevices(std::set<std::string> ids) {
  std::lock_guard<std::mutex> lock(mtx_);
  activePaging_ = std::move(ids);
}

std::optional<DeviceTarget> Inventory::resolveDeviceSwitchPort(const std::string& deviceId) const {
  std::lock_guard<std::mutex> lock(mtx_);
  auto dev = devices_.find(deviceId);
  if (dev == devices_.end())
    return std::nullopt;
  auto sw = switches_.find(dev->second.switchId);
  if (sw == switches_.end())
    return std::nullopt;
  return DeviceTarget{ sw->second.switchId,
                       sw->second.switchType,
                       { sw->second.ipAddress, sw->second.password },
                       dev->second.portNumber };
}

std::vector<DeviceLinkage> Inventory::linkages() const {
  std::lock_guard<std::mutex> lock(mtx_);
  std::vector<DeviceLinkage> out;
  out.reserve(devices_.size());
  for (const auto& [_, dev] : devices_)
    out.push_back(dev);
  return out;
}

std::vector<std::string> Inventory::activePagingDeviceIds() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return { activePaging_.begin(), activePaging_.end() };
}

std::optional<SwitchRecord> Inventory::findSwitch(const std::string& switchId) const {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = switches_.find(switchId);
  if (it == switches_.end())
    return std::nullopt;
  return it->second;
}
