#pragma once
/** @file  Settings.hpp
 *  @brief Typed view of the "poe" section of the config file.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "core/GS308EPClient.hpp"
#include "core/KeepAliveCoordinator.hpp"

namespace poegate {
  namespace core {

    /**
 * @struct Settings
 * @brief Every tunable with its default; missing keys keep the default.
 */
    struct Settings {
      std::chrono::milliseconds keepAlive{ 240000 }; ///< 4 minutes
      bool parallelMode{ false };                    ///< false = sequential (safe)
      std::chrono::milliseconds toggleDelay{ 0 };
      bool simulation{ false };
      std::chrono::milliseconds requestTimeout{ 10000 };
      std::chrono::milliseconds logoutTimeout{ 3000 };
      std::chrono::milliseconds loginPacing{ 500 };
      std::chrono::milliseconds retryBackoff{ 1000 };
      std::chrono::milliseconds tick{ 1000 };
      std::string logFile{}; ///< empty = no CSV run log

      /// Reads `root["poe"]`; throws `std::runtime_error` on wrong types or negative values.
      static Settings fromJson(const nlohmann::json& root);

      SessionTiming sessionTiming() const;
      KeepAliveOptions keepAliveOptions() const;
    };

  } // namespace core
} // namespace poegate
