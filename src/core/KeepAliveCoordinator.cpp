/* @file KeepAliveCoordinator.cpp
 * @brief keep-alive FSM: immediate on, countdown off, forced off, eligibility filter
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cstdio>
#include <stdexcept>

// poegate headers
#include "core/ErrorMonitor.hpp"
#include "core/KeepAliveCoordinator.hpp"
#include "core/Logger.hpp"

using namespace poegate::core;

namespace {

  constexpr const char* kSource = "PoE";

  std::string joinNames(const std::vector<DeviceLinkage>& devices) {
    std::string out;
    for (const auto& d : devices) {
      if (!out.empty())
        out += ", ";
      out += d.name.empty() ? d.deviceId : d.name;
    }
    return out;
  }

} // namespace

std::string poegate::core::formatCountdown(std::uint32_t seconds) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%u:%02u", seconds / 60, seconds % 60);
  return buf;
}

KeepAliveCoordinator::KeepAliveCoordinator(std::shared_ptr<ToggleOrchestrator> orchestrator,
                                           std::shared_ptr<const DeviceDirectory> directory,
                                           std::shared_ptr<ErrorMonitor> errorMonitor,
                                           std::shared_ptr<Logger> logger, KeepAliveOptions options)
    : orchestrator_(std::move(orchestrator)), directory_(std::move(directory)),
      errorMonitor_(std::move(errorMonitor)), logger_(std::move(logger)), options_(options),
      timer_(options.tick) {
  if (!orchestrator_ || !directory_)
    throw std::invalid_argument("[KeepAliveCoordinator] orchestrator and directory are required");
}

KeepAliveCoordinator::~KeepAliveCoordinator() { timer_.cancel(); }

void KeepAliveCoordinator::enable() {
  std::vector<DeviceLinkage> targets;
  ExecutionMode mode{ ExecutionMode::Sequential };
  std::chrono::milliseconds delay{ 0 };
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (options_.simulation) {
      logTo(logger_, LogLevel::Info, kSource, "SIMULATION: simulated enabling PoE devices");
      return;
    }
    if (!hasAutoCandidates())
      return;

    cancelCountdown();

    if (currentState_ == State::ON) {
      // repeated detections only keep the lights on; no hardware traffic
      logTo(logger_, LogLevel::Info, kSource, "PoE: already ON - timer reset");
      return;
    }
    transitionTo(State::ON);
    targets = eligibleDevices(false);
    mode = options_.mode;
    delay = options_.interDelay;
  }

  if (targets.empty()) {
    logTo(logger_, LogLevel::Debug, kSource, "PoE: ON - no device linked to an active pager");
    return;
  }
  sendToggle(true, targets, mode, delay, "ON");
}

void KeepAliveCoordinator::disable(bool force) {
  if (force) {
    std::vector<DeviceLinkage> targets;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (options_.simulation) {
        logTo(logger_, LogLevel::Info, kSource, "SIMULATION: simulated force-disabling PoE devices");
        return;
      }
      cancelCountdown();
      transitionTo(State::OFF);
      targets = eligibleDevices(true);
    }
    if (targets.empty())
      return;
    sendToggle(false, targets, ExecutionMode::Sequential, std::chrono::milliseconds{ 0 },
               "FORCE OFF");
    return;
  }

  std::uint64_t seq = 0;
  std::uint32_t ticks = 0;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (options_.simulation) {
      logTo(logger_, LogLevel::Info, kSource, "SIMULATION: simulated disabling PoE devices");
      return;
    }
    if (!hasAutoCandidates())
      return;

    cancelCountdown();
    seq = countdownSeq_;
    const auto ms = options_.keepAlive.count();
    ticks = static_cast<std::uint32_t>(ms <= 0 ? 0 : (ms + 999) / 1000);
    remaining_ = ticks;
  }

  logTo(logger_, LogLevel::Info, kSource, "PoE: will turn OFF in " + formatCountdown(ticks));
  // start() joins the superseded worker, which may be waiting on mtx_, so it
  // runs unlocked and the sequence is checked again afterwards
  for (;;) {
    timer_.start(
        ticks, [this, seq](std::uint32_t remaining) { onCountdownTick(seq, remaining); },
        [this, seq] { onCountdownElapsed(seq); });

    std::lock_guard<std::mutex> lock(mtx_);
    if (seq == countdownSeq_)
      return;
    if (!remaining_) {
      // enable() or a forced disable cancelled the countdown meanwhile
      timer_.cancel();
      return;
    }
    // a concurrent disable() took a newer sequence and our start may have
    // replaced its timer: restart under that sequence
    seq = countdownSeq_;
    ticks = *remaining_;
  }
}

void KeepAliveCoordinator::onCountdownTick(std::uint64_t seq, std::uint32_t remaining) {
  TickCallback cb;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (seq != countdownSeq_)
      return;
    remaining_ = remaining;
    cb = tickCb_;
  }
  logTo(logger_, LogLevel::Debug, kSource, "Lights OFF in " + formatCountdown(remaining) + "...");
  if (cb)
    cb(remaining);
}

void KeepAliveCoordinator::onCountdownElapsed(std::uint64_t seq) {
  std::vector<DeviceLinkage> targets;
  ExecutionMode mode{ ExecutionMode::Sequential };
  std::chrono::milliseconds delay{ 0 };
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (seq != countdownSeq_)
      return; // enable() got there first
    remaining_.reset();
    if (currentState_ != State::ON)
      return;
    // recorded OFF even if the toggle below fails: hardware state is best-effort
    transitionTo(State::OFF);
    targets = eligibleDevices(false);
    mode = options_.mode;
    delay = options_.interDelay;
  }

  logTo(logger_, LogLevel::Info, kSource, "Turning lights OFF now");
  if (!targets.empty())
    sendToggle(false, targets, mode, delay, "OFF");
}

void KeepAliveCoordinator::sendToggle(bool enable, const std::vector<DeviceLinkage>& targets,
                                      ExecutionMode mode, std::chrono::milliseconds interDelay,
                                      const std::string& label) {
  logTo(logger_, LogLevel::Info, kSource, "PoE: " + label + " - " + joinNames(targets));

  std::vector<DeviceToggle> toggles;
  toggles.reserve(targets.size());
  for (const auto& d : targets)
    toggles.push_back(DeviceToggle{ d.deviceId, enable });

  try {
    const auto results = orchestrator_->toggleBulk(toggles, mode, interDelay);
    std::size_t failed = 0;
    for (const auto& r : results) {
      if (r.success)
        continue;
      ++failed;
      report("PoE device " + r.deviceId + " failed: " + r.error.value_or("unknown error"));
    }
    if (failed > 0)
      logTo(logger_, LogLevel::Warning, kSource,
            "PoE: " + std::to_string(failed) + " device(s) failed");
  } catch (const std::exception& e) {
    logTo(logger_, LogLevel::Warning, kSource, std::string("PoE error: ") + e.what());
    report(std::string("PoE ") + label + " error: " + e.what());
  }
}

void KeepAliveCoordinator::report(const std::string& message) {
  if (errorMonitor_)
    errorMonitor_->notifyFailure(message);
}

// -------------------------------------------------------------------
// Eligibility. Gate: some auto device is not excluded. Target set: auto,
// not excluded (unless forced), linked to at least one active pager.
// Both are called with mtx_ held.
// -------------------------------------------------------------------
bool KeepAliveCoordinator::hasAutoCandidates() const {
  const auto devices = directory_->linkages();
  return std::any_of(devices.begin(), devices.end(), [this](const DeviceLinkage& d) {
    return d.mode == DeviceMode::Auto && excluded_.count(d.deviceId) == 0;
  });
}

std::vector<DeviceLinkage> KeepAliveCoordinator::eligibleDevices(bool ignoreExclusions) const {
  const auto activeList = directory_->activePagingDeviceIds();
  const std::set<std::string> active(activeList.begin(), activeList.end());

  std::vector<DeviceLinkage> out;
  for (auto& d : directory_->linkages()) {
    if (d.mode != DeviceMode::Auto)
      continue;
    if (!ignoreExclusions && excluded_.count(d.deviceId) != 0)
      continue;
    const bool linked =
        std::any_of(d.linkedPagingDeviceIds.begin(), d.linkedPagingDeviceIds.end(),
                    [&](const std::string& id) { return active.count(id) != 0; });
    if (linked)
      out.push_back(std::move(d));
  }
  return out;
}

void KeepAliveCoordinator::cancelCountdown() {
  ++countdownSeq_;
  remaining_.reset();
  timer_.cancel();
}

void KeepAliveCoordinator::transitionTo(State next) {
  if (currentState_ == next)
    return;
  logTo(logger_, LogLevel::Debug, kSource,
        std::string("keep-alive ") + (currentState_ == State::ON ? "ON" : "OFF") + " -> " +
            (next == State::ON ? "ON" : "OFF"));
  currentState_ = next;
}

void KeepAliveCoordinator::setExcluded(const std::string& deviceId, bool excluded) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (excluded)
    excluded_.insert(deviceId);
  else
    excluded_.erase(deviceId);
}

void KeepAliveCoordinator::toggleExcluded(const std::string& deviceId) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!excluded_.erase(deviceId))
    excluded_.insert(deviceId);
}

void KeepAliveCoordinator::setAllExcluded(bool excluded) {
  std::lock_guard<std::mutex> lock(mtx_);
  excluded_.clear();
  if (!excluded)
    return;
  for (const auto& d : directory_->linkages())
    if (d.mode == DeviceMode::Auto)
      excluded_.insert(d.deviceId);
}

bool KeepAliveCoordinator::isExcluded(const std::string& deviceId) const {
  std::lock_guard<std::mutex> lock(mtx_);
  return excluded_.count(deviceId) != 0;
}

std::set<std::string> KeepAliveCoordinator::excludedDevices() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return excluded_;
}

void KeepAliveCoordinator::setKeepAliveDuration(std::chrono::milliseconds duration) {
  std::lock_guard<std::mutex> lock(mtx_);
  options_.keepAlive = duration;
}

void KeepAliveCoordinator::setExecutionMode(ExecutionMode mode,
                                            std::chrono::milliseconds interDelay) {
  std::lock_guard<std::mutex> lock(mtx_);
  options_.mode = mode;
  options_.interDelay = interDelay;
}

void KeepAliveCoordinator::setSimulation(bool on) {
  std::lock_guard<std::mutex> lock(mtx_);
  options_.simulation = on;
}

void KeepAliveCoordinator::registerTickCallback(TickCallback cb) {
  std::lock_guard<std::mutex> lock(mtx_);
  tickCb_ = std::move(cb);
}

bool KeepAliveCoordinator::isOn() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return currentState_ == State::ON;
}

std::optional<std::uint32_t> KeepAliveCoordinator::countdownRemaining() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return remaining_;
}
