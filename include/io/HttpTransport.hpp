#pragma once
/** @file  HttpTransport.hpp
 *  @brief Blocking HTTP/1.1 request/response seam used by the switch clients.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace poegate {
  namespace io {

    using HeaderList = std::vector<std::pair<std::string, std::string>>;

    struct HttpRequest {
      std::string method{ "GET" };
      std::string path{ "/" };
      HeaderList headers{};
      std::string body{};
    };

    struct HttpResponse {
      int status{ 0 };
      HeaderList headers{};
      std::string body{};

      /// Every value of header \p name (case-insensitive), in arrival order.
      std::vector<std::string> headerValues(const std::string& name) const {
        std::vector<std::string> out;
        for (const auto& [key, value] : headers) {
          if (std::equal(key.begin(), key.end(), name.begin(), name.end(),
                         [](char a, char b) {
                           return std::tolower(static_cast<unsigned char>(a)) ==
                                  std::tolower(static_cast<unsigned char>(b));
                         }))
            out.push_back(value);
        }
        return out;
      }
    };

    /**
 * @class HttpTransport
 * @brief One request, one response, one fresh connection.
 *
 *  * Implementations throw `protocols::NetworkError` on connect/IO failure or
 *    when \p timeout expires; any HTTP status is a normal return.
 *  * Must be callable from several threads at once (parallel toggles).
 */
    class HttpTransport {
    public:
      virtual ~HttpTransport() = default;

      virtual HttpResponse send(const std::string& host, unsigned short port,
                                const HttpRequest& request, std::chrono::milliseconds timeout) = 0;
    };

  } // namespace io
} // namespace poegate
