#pragma once
/** @file  ControllerRegistry.hpp
 *  @brief Process-scoped cache of switch clients, one per (type, IP).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "core/SwitchClientFactory.hpp"
#include "protocols/PortCommand.hpp"

namespace poegate {
  namespace core {

    class Logger;
    class SwitchClient;

    /**
 * @class ControllerRegistry
 * @brief Sole owner of every switch session; everyone else borrows per call.
 *
 *  * Constructed explicitly and injected, so each test gets its own.
 *  * Re-requesting a known switch pushes the (maybe changed) credentials into it.
 */
    class ControllerRegistry {
    public:
      explicit ControllerRegistry(SwitchClientFactory factory,
                                  std::shared_ptr<Logger> logger = nullptr);
      ~ControllerRegistry() = default;

      /// Cached client for (\p switchType, creds.ipAddress), created on first use.
      std::shared_ptr<SwitchClient> getOrCreate(const std::string& switchType,
                                                const protocols::SwitchCredentials& creds);

      /// clearSession() on every client concurrently; failures are logged only.
      void clearAll();

      std::size_t size() const;

      ControllerRegistry(const ControllerRegistry&) = delete;
      ControllerRegistry& operator=(const ControllerRegistry&) = delete;

    private:
      static std::string keyFor(const std::string& type, const std::string& ip) {
        return type + ":" + ip;
      }

      mutable std::mutex mtx_;
      SwitchClientFactory factory_;
      std::unordered_map<std::string, std::shared_ptr<SwitchClient>> clients_;
      std::shared_ptr<Logger> logger_;
    };

  } // namespace core
} // namespace poegate
