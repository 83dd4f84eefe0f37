#pragma once

/** @file  KeepAliveCoordinator.hpp
 *  @brief Decides when PoE devices go on/off around paging activity.
 *
 *  © 2025 Milo Medical — licensed under MIT.
 */

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "core/CountdownTimer.hpp"
#include "core/DeviceDirectory.hpp"
#include "core/ToggleOrchestrator.hpp"

namespace poegate {
  namespace core {

    class ErrorMonitor;
    class Logger;

    struct KeepAliveOptions {
      std::chrono::milliseconds keepAlive{ 240000 }; ///< disable() -> actual power off
      ExecutionMode mode{ ExecutionMode::Sequential };
      std::chrono::milliseconds interDelay{ 0 };
      bool simulation{ false };                       ///< log only, never touch hardware
      std::chrono::milliseconds tick{ 1000 };         ///< countdown granularity
    };

    /**
 * @class KeepAliveCoordinator
 * @brief OFF/ON state machine with a pending-off countdown in between.
 *
 *  * Repeated enable() while ON never re-sends hardware commands.
 *  * disable() arms the countdown; enable() in the meantime cancels it.
 *  * disable(true) skips the countdown and the operator exclusions.
 *  * Toggle failures are logged and reported, never thrown.
 */
    class KeepAliveCoordinator {

    public:
      using TickCallback = std::function<void(std::uint32_t remainingSeconds)>;

      KeepAliveCoordinator(std::shared_ptr<ToggleOrchestrator> orchestrator,
                           std::shared_ptr<const DeviceDirectory> directory,
                           std::shared_ptr<ErrorMonitor> errorMonitor = nullptr,
                           std::shared_ptr<Logger> logger = nullptr, KeepAliveOptions options = {});
      ~KeepAliveCoordinator(); ///< cancels any pending countdown

      // ---- public API ----
      void enable();                    ///< audio/paging detected
      void disable(bool force = false); ///< audio gone (countdown) or stop/emergency (force)

      void setExcluded(const std::string& deviceId, bool excluded);
      void toggleExcluded(const std::string& deviceId);
      void setAllExcluded(bool excluded);
      bool isExcluded(const std::string& deviceId) const;
      std::set<std::string> excludedDevices() const;

      void setKeepAliveDuration(std::chrono::milliseconds duration);
      void setExecutionMode(ExecutionMode mode, std::chrono::milliseconds interDelay);
      void setSimulation(bool on);

      /// Receives remaining seconds once per tick while a countdown is pending.
      void registerTickCallback(TickCallback cb);

      bool isOn() const;
      std::optional<std::uint32_t> countdownRemaining() const;

      KeepAliveCoordinator(const KeepAliveCoordinator&) = delete;
      KeepAliveCoordinator& operator=(const KeepAliveCoordinator&) = delete;

    private:
      enum class State { OFF, ON };

      void transitionTo(State next);
      bool hasAutoCandidates() const;
      std::vector<DeviceLinkage> eligibleDevices(bool ignoreExclusions) const;
      void cancelCountdown();

      void onCountdownTick(std::uint64_t seq, std::uint32_t remaining);
      void onCountdownElapsed(std::uint64_t seq);

      void sendToggle(bool enable, const std::vector<DeviceLinkage>& targets, ExecutionMode mode,
                      std::chrono::milliseconds interDelay, const std::string& label);
      void report(const std::string& message);

      std::shared_ptr<ToggleOrchestrator> orchestrator_;
      std::shared_ptr<const DeviceDirectory> directory_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::shared_ptr<Logger> logger_;

      mutable std::mutex mtx_;
      State currentState_{ State::OFF };
      std::set<std::string> excluded_;
      std::optional<std::uint32_t> remaining_;
      std::uint64_t countdownSeq_{ 0 }; ///< identifies the live countdown
      KeepAliveOptions options_;
      TickCallback tickCb_{};

      CountdownTimer timer_; ///< last member: joined before the rest is torn down
    };

    /// "m:ss"
    std::string formatCountdown(std::uint32_t seconds);

  } // namespace core
} // namespace poegate
