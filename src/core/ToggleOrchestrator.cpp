/* @file ToggleOrchestrator.cpp
 * @brief groups device toggles by switch and fans them out, one thread per switch
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <future>
#include <stdexcept>
#include <unordered_map>

// poegate headers
#include "core/ControllerRegistry.hpp"
#include "core/DeviceDirectory.hpp"
#include "core/Logger.hpp"
#include "core/SwitchClient.hpp"
#include "core/ToggleOrchestrator.hpp"
#include "protocols/PoeErrors.hpp"

using namespace poegate::core;
using poegate::protocols::PortCommand;

namespace {
  constexpr const char* kSource = "PoE Bulk";
}

struct ToggleOrchestrator::Group {
  DeviceTarget target;
  std::vector<Slot> slots;
};

ToggleOrchestrator::ToggleOrchestrator(std::shared_ptr<ControllerRegistry> registry,
                                       std::shared_ptr<const DeviceDirectory> directory,
                                       std::shared_ptr<Logger> logger)
    : registry_(std::move(registry)), directory_(std::move(directory)), logger_(std::move(logger)) {
  if (!registry_ || !directory_)
    throw std::invalid_argument("[ToggleOrchestrator] registry and directory are required");
}

void ToggleOrchestrator::toggleSingle(const std::string& deviceId, bool enabled) {
  auto target = directory_->resolveDeviceSwitchPort(deviceId);
  if (!target)
    throw protocols::UnknownDeviceError(deviceId);
  if (!protocols::isValidPort(target->portNumber))
    throw protocols::InvalidPortError(target->portNumber);

  auto client = registry_->getOrCreate(target->switchType, target->credentials);
  client->togglePort(target->portNumber, enabled);
  logTo(logger_, LogLevel::Info, "PoE",
        std::string(enabled ? "ON" : "OFF") + " port " + std::to_string(target->portNumber) +
            " (" + deviceId + ")");
}

std::vector<DeviceToggleResult>
ToggleOrchestrator::toggleBulk(const std::vector<DeviceToggle>& devices, ExecutionMode mode,
                               std::chrono::milliseconds interDelay) {
  std::vector<DeviceToggleResult> results;
  std::vector<Group> groups;
  std::unordered_map<std::string, std::size_t> groupIndex;

  for (const auto& dev : devices) {
    auto target = directory_->resolveDeviceSwitchPort(dev.deviceId);
    if (!target) {
      logTo(logger_, LogLevel::Debug, kSource, "Skipping unknown device " + dev.deviceId);
      continue;
    }
    if (!protocols::isValidPort(target->portNumber)) {
      results.push_back(DeviceToggleResult{
          dev.deviceId, false, protocols::InvalidPortError(target->portNumber).what() });
      continue;
    }

    auto [it, inserted] = groupIndex.try_emplace(target->switchId, groups.size());
    if (inserted)
      groups.push_back(Group{ *target, {} });
    groups[it->second].slots.push_back(Slot{ dev.deviceId, target->portNumber, dev.enabled });
  }

  std::vector<std::future<std::vector<DeviceToggleResult>>> pending;
  pending.reserve(groups.size());
  for (const auto& group : groups) {
    logTo(logger_, LogLevel::Info, kSource,
          std::string(toString(mode)) + " mode: toggling " + std::to_string(group.slots.size()) +
              " ports on " + group.target.switchId);
    pending.push_back(std::async(std::launch::async, [this, &group, mode, interDelay] {
      return runGroup(group, mode, interDelay);
    }));
  }

  for (auto& f : pending) {
    auto part = f.get(); // runGroup reports failures as results, never throws
    results.insert(results.end(), part.begin(), part.end());
  }
  return results;
}

std::vector<DeviceToggleResult> ToggleOrchestrator::runGroup(const Group& group,
                                                             ExecutionMode mode,
                                                             std::chrono::milliseconds interDelay) {
  std::vector<DeviceToggleResult> out;
  out.reserve(group.slots.size());

  auto failAll = [&](std::size_t from, const std::string& msg) {
    for (std::size_t i = from; i < group.slots.size(); ++i)
      out.push_back(DeviceToggleResult{ group.slots[i].deviceId, false, msg });
  };

  std::vector<PortCommand> commands;
  commands.reserve(group.slots.size());
  for (const auto& slot : group.slots)
    commands.push_back(PortCommand{ slot.portNumber, slot.enabled });

  std::shared_ptr<SwitchClient> client;
  try {
    client = registry_->getOrCreate(group.target.switchType, group.target.credentials);
  } catch (const std::exception& e) {
    logTo(logger_, LogLevel::Error, kSource, group.target.switchId + ": " + e.what());
    failAll(0, e.what());
    return out;
  }

  if (mode == ExecutionMode::Parallel) {
    try {
      const auto portResults = client->togglePortsParallel(commands);
      for (std::size_t i = 0; i < group.slots.size(); ++i) {
        const auto& slot = group.slots[i];
        const auto& r = portResults.at(i);
        if (r.success)
          logTo(logger_, LogLevel::Info, kSource,
                std::string(slot.enabled ? "ON" : "OFF") + " port " +
                    std::to_string(slot.portNumber) + " (" + slot.deviceId + ")");
        else
          logTo(logger_, LogLevel::Error, kSource,
                "Failed port " + std::to_string(slot.portNumber) + ": " +
                    r.errorMessage.value_or("unknown error"));
        out.push_back(DeviceToggleResult{ slot.deviceId, r.success, r.errorMessage });
      }
    } catch (const std::exception& e) {
      // login failed: nothing in this group was attempted
      logTo(logger_, LogLevel::Error, kSource, group.target.switchId + ": " + e.what());
      failAll(0, e.what());
    }
    return out;
  }

  std::size_t applied = 0;
  try {
    client->togglePortsBatch(commands, interDelay, [&](const PortCommand& cmd) {
      const auto& slot = group.slots[applied];
      logTo(logger_, LogLevel::Info, kSource,
            std::string(cmd.desiredEnabled ? "ON" : "OFF") + " port " +
                std::to_string(cmd.portNumber) + " (" + slot.deviceId + ")");
      out.push_back(DeviceToggleResult{ slot.deviceId, true, std::nullopt });
      ++applied;
    });
  } catch (const std::exception& e) {
    const std::string msg = e.what();
    logTo(logger_, LogLevel::Error, kSource,
          group.target.switchId + ": batch stopped after " + std::to_string(applied) + "/" +
              std::to_string(group.slots.size()) + " ports: " + msg);
    if (applied < group.slots.size()) {
      out.push_back(DeviceToggleResult{ group.slots[applied].deviceId, false, msg });
      failAll(applied + 1, "aborted: " + msg);
    }
  }
  return out;
}

void ToggleOrchestrator::clearAllSessions() { registry_->clearAll(); }
