#pragma once
/** @file  GS308EPClient.hpp
 *  @brief Session client for the Netgear GS308EP web management interface.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// poegate headers
#include "core/Logger.hpp"
#include "core/SerialQueue.hpp"
#include "core/SwitchClient.hpp"
#include "io/HttpTransport.hpp"

namespace poegate {
  namespace core {

    /// Network pacing knobs; tests shrink them to zero.
    struct SessionTiming {
      std::chrono::milliseconds requestTimeout{ 10000 };
      std::chrono::milliseconds logoutTimeout{ 3000 };
      std::chrono::milliseconds loginPacing{ 500 };   ///< between nonce fetch and login POST
      std::chrono::milliseconds retryBackoff{ 1000 }; ///< after a failed toggle, before the retry
    };

    /**
 * @class GS308EPClient
 * @brief Owns one switch's session: cached SID cookie, single-flight login,
 *        per-switch FIFO and the retry-once policy.
 *
 *  * The embedded web server copes with one session sequence at a time, so
 *    every state-changing call goes through `queue_`.
 *  * Session state is only touched under `mtx_`; the queue only orders work.
 */
    class GS308EPClient : public SwitchClient {
    public:
      static constexpr const char* kType = "netgear_gs308ep";

      GS308EPClient(protocols::SwitchCredentials creds,
                    std::shared_ptr<io::HttpTransport> transport,
                    std::shared_ptr<Logger> logger = nullptr, SessionTiming timing = {});
      ~GS308EPClient() override = default;

      //---SwitchClient---------------------------------------------------
      std::string login() override;
      void togglePort(int port, bool enabled) override;
      void togglePortsBatch(const std::vector<protocols::PortCommand>& commands,
                            std::chrono::milliseconds interCommandDelay,
                            const AppliedFn& onApplied) override;
      std::vector<protocols::ToggleResult>
      togglePortsParallel(const std::vector<protocols::PortCommand>& commands) override;
      std::vector<protocols::PortStatus> getPortStatuses() override;
      void updateCredentials(const protocols::SwitchCredentials& creds) override;
      protocols::SwitchCredentials credentials() const override;
      void clearSession() override;
      bool testConnection() override;

      bool hasSession() const;

      //---non-copyable-----------------------------------------
      GS308EPClient(const GS308EPClient&) = delete;
      GS308EPClient& operator=(const GS308EPClient&) = delete;

    private:
      struct LoginPage {
        std::string nonce;
        std::string initialSid; ///< "" if the page set no cookie
      };

      LoginPage fetchLoginPage(const std::string& host);
      std::string performLogin(const protocols::SwitchCredentials& creds);
      std::string fetchHashToken(const std::string& host, const std::string& sid);
      void applyCommand(const std::string& host, const std::string& sid,
                        const protocols::PortCommand& cmd);
      void doTogglePort(const protocols::PortCommand& cmd);

      /// Drop the cached session; logs out first (awaited, errors ignored).
      void invalidateSession();
      void logout(const std::string& host, const std::string& sid);

      io::HttpResponse exchange(const std::string& host, const io::HttpRequest& req,
                                std::chrono::milliseconds timeout);
      void log(LogLevel level, const std::string& msg) const;

      mutable std::mutex mtx_;
      protocols::SwitchCredentials creds_;
      std::optional<std::string> cachedSid_;
      std::shared_future<std::string> loginInFlight_; ///< valid() while a login runs
      std::uint64_t sessionEpoch_{ 0 };               ///< bumped whenever the cache is dropped

      SerialQueue queue_;
      std::shared_ptr<io::HttpTransport> transport_;
      std::shared_ptr<Logger> logger_;
      SessionTiming timing_;
    };

  } // namespace core
} // namespace poegate
