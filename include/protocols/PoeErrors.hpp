#pragma once
/** @file  PoeErrors.hpp
 *  @brief Exception taxonomy for switch control failures.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>

namespace poegate {
  namespace protocols {

    /**
 * @class PoeError
 * @brief Common base so callers can catch every switch-control failure at once.
 *
 *  * `what()` carries the human-readable message surfaced in results.
 */
    class PoeError : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
    };

    /// Login page, cookie, hash token or status page did not look as expected.
    class ProtocolError : public PoeError {
    public:
      using PoeError::PoeError;
    };

    /// Non-200 login response, or a 200 without a session cookie.
    class AuthError : public PoeError {
    public:
      using PoeError::PoeError;
    };

    /// Connect/read/write failure or an exchange that hit its timeout.
    class NetworkError : public PoeError {
    public:
      NetworkError(const std::string& what, bool timedOut = false)
          : PoeError(what), timedOut_{ timedOut } {}

      bool timedOut() const noexcept { return timedOut_; }

    private:
      bool timedOut_{ false };
    };

    class InvalidPortError : public PoeError {
    public:
      explicit InvalidPortError(int port)
          : PoeError("Invalid port number: " + std::to_string(port) + ". Must be 1-8."),
            port_{ port } {}

      int port() const noexcept { return port_; }

    private:
      int port_;
    };

    class UnsupportedSwitchTypeError : public PoeError {
    public:
      explicit UnsupportedSwitchTypeError(const std::string& type)
          : PoeError("Unsupported PoE switch type: " + type) {}
    };

    /// The toggle POST itself came back non-200.
    class ToggleError : public PoeError {
    public:
      using PoeError::PoeError;
    };

    /// Device id unknown to the inventory.
    class UnknownDeviceError : public PoeError {
    public:
      explicit UnknownDeviceError(const std::string& deviceId)
          : PoeError("Unknown PoE device: " + deviceId) {}
    };

  } // namespace protocols
} // namespace poegate
