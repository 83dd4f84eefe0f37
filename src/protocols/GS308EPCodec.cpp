/* @file GS308EPCodec.cpp
 * @brief GS308EP login obfuscation, form encoding and HTML scraping - no I/O in here.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <memory>
#include <regex>
#include <stdexcept>

// OpenSSL headers
#include <openssl/evp.h>

// poegate headers
#include "protocols/GS308EPCodec.hpp"
#include "protocols/PoeErrors.hpp"

namespace poegate::protocols::gs308ep {

  namespace {

    using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

    // application/x-www-form-urlencoded, same unreserved set browsers use
    std::string formEncode(const std::string& in) {
      std::string out;
      out.reserve(in.size());
      for (unsigned char c : in) {
        if (std::isalnum(c) || c == '*' || c == '-' || c == '.' || c == '_') {
          out += static_cast<char>(c);
        } else if (c == ' ') {
          out += '+';
        } else {
          char buf[4];
          std::snprintf(buf, sizeof(buf), "%%%02X", c);
          out += buf;
        }
      }
      return out;
    }

    std::string joinCookies(const std::vector<std::string>& headers) {
      std::string joined;
      for (const auto& h : headers) {
        if (!joined.empty())
          joined += ';';
        joined += h;
      }
      return joined;
    }

    // value="N" of the first tag containing `marker` inside [from, to); npos when absent
    std::size_t findQuotedNumber(const std::string& html, const std::string& marker,
                                 std::size_t from, std::size_t to, int& value) {
      auto at = html.find(marker, from);
      if (at == std::string::npos || at >= to)
        return std::string::npos;
      auto tagEnd = html.find('>', at);
      auto v = html.find("value=\"", at);
      if (v == std::string::npos || v >= to || (tagEnd != std::string::npos && v > tagEnd))
        return std::string::npos;
      v += 7;
      auto close = html.find('"', v);
      if (close == std::string::npos || close == v || close >= to || close - v > 4)
        return std::string::npos;
      const std::string digits = html.substr(v, close - v);
      if (!std::all_of(digits.begin(), digits.end(),
                       [](unsigned char c) { return std::isdigit(c); }))
        return std::string::npos;
      value = std::stoi(digits);
      return close;
    }

  } // namespace

  std::string merge(const std::string& password, const std::string& nonce) {
    std::string out;
    out.reserve(password.size() + nonce.size());
    for (std::size_t i = 0; i < std::max(password.size(), nonce.size()); ++i) {
      if (i < password.size())
        out += password[i];
      if (i < nonce.size())
        out += nonce[i];
    }
    return out;
  }

  std::string md5Hex(const std::string& data) {
    MdCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;

    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1)
      throw std::runtime_error("[GS308EPCodec] MD5 digest failed");

    static constexpr char kHex[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
      hex += kHex[digest[i] >> 4];
      hex += kHex[digest[i] & 0x0F];
    }
    return hex;
  }

  std::string buildLoginRequest(const std::string& nonce, const std::string& password) {
    return "password=" + md5Hex(merge(password, nonce));
  }

  io::HttpRequest loginPageRequest() { return io::HttpRequest{ "GET", kLoginPath, {}, {} }; }

  io::HttpRequest loginPostRequest(const std::string& ipAddress, const std::string& nonce,
                                   const std::string& password, const std::string& initialSid) {
    io::HttpRequest req{ "POST", kLoginPath, {}, buildLoginRequest(nonce, password) };
    req.headers = {
      { "Content-Type", "application/x-www-form-urlencoded" },
      { "Origin", "http://" + ipAddress },
      { "Referer", "http://" + ipAddress + kLoginPath },
    };
    // the switch expects the cookie it handed out with the login page
    if (!initialSid.empty())
      req.headers.emplace_back("Cookie", initialSid);
    return req;
  }

  io::HttpRequest configPageRequest(const std::string& sessionToken) {
    return io::HttpRequest{ "GET", kPortConfigPath, { { "Cookie", sessionToken } }, {} };
  }

  io::HttpRequest togglePostRequest(const std::string& sessionToken, const std::string& hash,
                                    const PortCommand& cmd) {
    return io::HttpRequest{ "POST",
                            kPortConfigPath,
                            { { "Content-Type", "application/x-www-form-urlencoded" },
                              { "Cookie", sessionToken },
                              { "X-Requested-With", "XMLHttpRequest" } },
                            buildToggleForm(hash, cmd) };
  }

  io::HttpRequest logoutRequest(const std::string& sessionToken) {
    return io::HttpRequest{ "GET", kLogoutPath, { { "Cookie", sessionToken } }, {} };
  }

  std::string buildToggleForm(const std::string& hash, const PortCommand& cmd) {
    validatePort(cmd.portNumber);
    std::string form = "hash=" + formEncode(hash);
    form += "&ACTION=Apply";
    form += "&portID=" + std::to_string(cmd.portNumber - 1);
    form += std::string("&ADMIN_MODE=") + (cmd.desiredEnabled ? "1" : "0");
    form += "&PORT_PRIO=0&POW_MOD=3&POW_LIMT_TYP=2&POW_LIMT=30.0&DETEC_TYP=2&DISCONNECT_TYP=2";
    return form;
  }

  void validatePort(int port) {
    if (!isValidPort(port))
      throw InvalidPortError(port);
  }

  std::string extractNonce(const std::string& loginPageHtml) {
    static const std::regex kRand{ R"(id='rand'\s+value='([^']+)')" };
    std::smatch m;
    if (!std::regex_search(loginPageHtml, m, kRand))
      throw ProtocolError("Rand value not found in login page");
    return m[1].str();
  }

  std::string findSessionToken(const std::vector<std::string>& setCookieHeaders) {
    static const std::regex kSid{ R"(SID=([^;]+))" };
    const std::string joined = joinCookies(setCookieHeaders);
    std::smatch m;
    if (!std::regex_search(joined, m, kSid))
      return {};
    return "SID=" + m[1].str();
  }

  std::string extractSessionToken(const std::vector<std::string>& setCookieHeaders) {
    if (setCookieHeaders.empty())
      throw ProtocolError("No cookies received from login");
    auto sid = findSessionToken(setCookieHeaders);
    if (sid.empty())
      throw ProtocolError("SID cookie not found");
    return sid;
  }

  std::string extractHashToken(const std::string& configPageHtml) {
    static const std::regex kHash{ R"re(name='hash'[^>]*value="([^"]+)")re" };
    std::smatch m;
    if (!std::regex_search(configPageHtml, m, kHash))
      throw ProtocolError("Hash token not found in HTML");
    return m[1].str();
  }

  std::vector<PortStatus> parsePortStatuses(const std::string& configPageHtml) {
    static const std::string kItem = "<li class=\"poe_port_list_item";
    std::vector<PortStatus> statuses;

    auto item = configPageHtml.find(kItem);
    while (item != std::string::npos) {
      auto next = configPageHtml.find(kItem, item + kItem.size());
      const auto end = next == std::string::npos ? configPageHtml.size() : next;

      int port = 0;
      int power = 0;
      auto after = findQuotedNumber(configPageHtml, "class=\"port\"", item, end, port);
      if (after != std::string::npos &&
          findQuotedNumber(configPageHtml, "class=\"hidPortPwr\"", after, end, power) !=
              std::string::npos) {
        statuses.push_back(PortStatus{ port, power == 1 });
      }
      item = next;
    }

    std::stable_sort(statuses.begin(), statuses.end(),
                     [](const PortStatus& a, const PortStatus& b) { return a.port < b.port; });
    return statuses;
  }

} // namespace poegate::protocols::gs308ep
