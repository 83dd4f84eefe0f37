#pragma once
/** @file  SwitchClient.hpp
 *  @brief Abstract per-switch session client (one instance per physical switch).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <functional>
#include <string>
#include <vector>

// poegate headers
#include "protocols/PortCommand.hpp"

namespace poegate::core {

  /**
 * @class SwitchClient
 * @brief Common polymorphic interface every supported switch family implements.
 *
 *  * All calls block the caller; any number of threads may call concurrently.
 *  * Serialized operations (`togglePort`, `togglePortsBatch`, `getPortStatuses`)
 *    share one FIFO per switch; `togglePortsParallel` bypasses it.
 *  * Failures are thrown as `protocols::PoeError` subclasses.
 */
  class SwitchClient {
  public:
    /// Invoked after each command of a batch has been applied on the switch.
    using AppliedFn = std::function<void(const protocols::PortCommand&)>;

    virtual ~SwitchClient() = default;

    /// Cached token, or a fresh one (concurrent callers share one login).
    virtual std::string login() = 0;

    /// One port, retried once after a session reset.
    virtual void togglePort(int port, bool enabled) = 0;

    /// Single queue slot, single login, optional pause between commands.
    virtual void togglePortsBatch(const std::vector<protocols::PortCommand>& commands,
                                  std::chrono::milliseconds interCommandDelay,
                                  const AppliedFn& onApplied) = 0;

    /// Concurrent exchanges; one result per command, in request order.
    virtual std::vector<protocols::ToggleResult>
    togglePortsParallel(const std::vector<protocols::PortCommand>& commands) = 0;

    virtual std::vector<protocols::PortStatus> getPortStatuses() = 0;

    virtual void updateCredentials(const protocols::SwitchCredentials& creds) = 0;
    virtual protocols::SwitchCredentials credentials() const = 0;

    /// Best-effort logout, then forget the session. Idempotent.
    virtual void clearSession() = 0;

    /// Unauthenticated reachability probe; never throws.
    virtual bool testConnection() = 0;

    //---convenience-----------------------------------------
    void enablePort(int port) { togglePort(port, true); }
    void disablePort(int port) { togglePort(port, false); }

    /** @throws ProtocolError if the status page doesn't list \p port. */
    bool getPortStatus(int port);
  };

} // namespace poegate::core
