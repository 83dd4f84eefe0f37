#pragma once
/** @file  GS308EPCodec.hpp
 *  @brief Request builders and page scrapers for the Netgear GS308EP web UI.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <string>
#include <vector>

// poegate headers
#include "io/HttpTransport.hpp"
#include "protocols/PortCommand.hpp"

namespace poegate {
  namespace protocols {
    namespace gs308ep {

      inline constexpr unsigned short kHttpPort = 80;
      inline constexpr const char* kLoginPath = "/login.cgi";
      inline constexpr const char* kLogoutPath = "/logout.cgi";
      inline constexpr const char* kPortConfigPath = "/PoEPortConfig.cgi";

      //---login obfuscation------------------------------------------------
      /// Interleaves \p password and \p nonce one char at a time, password first.
      std::string merge(const std::string& password, const std::string& nonce);

      /// Lower-case hex MD5 of \p data.
      std::string md5Hex(const std::string& data);

      /// `password=<md5(merge(password, nonce))>` form body.
      std::string buildLoginRequest(const std::string& nonce, const std::string& password);

      //---request builders (pure)-----------------------------------------
      io::HttpRequest loginPageRequest();
      io::HttpRequest loginPostRequest(const std::string& ipAddress, const std::string& nonce,
                                       const std::string& password,
                                       const std::string& initialSid);
      io::HttpRequest configPageRequest(const std::string& sessionToken);
      io::HttpRequest togglePostRequest(const std::string& sessionToken, const std::string& hash,
                                        const PortCommand& cmd);
      io::HttpRequest logoutRequest(const std::string& sessionToken);

      /// URL-encoded PoEPortConfig form; portID on the wire is zero-based.
      std::string buildToggleForm(const std::string& hash, const PortCommand& cmd);

      /// Throws InvalidPortError outside [1,8].
      void validatePort(int port);

      //---response scrapers------------------------------------------------
      /** @throws ProtocolError if the hidden `rand` input is missing. */
      std::string extractNonce(const std::string& loginPageHtml);

      /** Returns `SID=<value>` ready for a Cookie header.
       *  @throws ProtocolError if no SID cookie was set. */
      std::string extractSessionToken(const std::vector<std::string>& setCookieHeaders);

      /// Same as extractSessionToken but returns "" instead of throwing.
      std::string findSessionToken(const std::vector<std::string>& setCookieHeaders);

      /** @throws ProtocolError if the hidden `hash` input is missing. */
      std::string extractHashToken(const std::string& configPageHtml);

      /// Port list items in ascending port order; incomplete items are skipped.
      std::vector<PortStatus> parsePortStatuses(const std::string& configPageHtml);

    } // namespace gs308ep
  } // namespace protocols
} // namespace poegate
