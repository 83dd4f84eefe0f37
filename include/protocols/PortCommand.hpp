#pragma once
/** @file  PortCommand.hpp
 *  @brief Value types exchanged with a switch session client.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <optional>
#include <string>

namespace poegate {
  namespace protocols {

    inline constexpr int kMinPort = 1;
    inline constexpr int kMaxPort = 8;

    inline bool isValidPort(int port) { return port >= kMinPort && port <= kMaxPort; }

    struct SwitchCredentials {
      std::string ipAddress;
      std::string password;

      bool operator==(const SwitchCredentials&) const = default;
    };

    struct PortCommand {
      int portNumber{ 0 }; ///< physical port, 1-based
      bool desiredEnabled{ false };
    };

    struct ToggleResult {
      int portNumber{ 0 };
      bool success{ false };
      std::optional<std::string> errorMessage{};
    };

    struct PortStatus {
      int port{ 0 };
      bool enabled{ false };

      bool operator==(const PortStatus&) const = default;
    };

  } // namespace protocols
} // namespace poegate
